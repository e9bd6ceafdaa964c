#include <cursetool/io/url.hpp>

#include <map>

#include <boost/algorithm/string.hpp>

namespace cursetool {

static bool
is_alphanumeric(unsigned char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
           || (c >= '0' && c <= '9');
}

static void
append_escape(string& out, unsigned char c)
{
    static char const hex_digits[] = "0123456789ABCDEF";
    out += '%';
    out += hex_digits[c >> 4];
    out += hex_digits[c & 0xf];
}

static int
hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

string
form_urlencode(string const& text)
{
    string encoded;
    encoded.reserve(text.size());
    for (unsigned char c : text)
    {
        if (is_alphanumeric(c) || c == '*' || c == '-' || c == '.'
            || c == '_')
        {
            encoded += char(c);
        }
        else if (c == ' ')
        {
            encoded += '+';
        }
        else
        {
            append_escape(encoded, c);
        }
    }
    return encoded;
}

string
encode_path_segment(string const& text)
{
    string encoded;
    encoded.reserve(text.size());
    for (unsigned char c : text)
    {
        if (is_alphanumeric(c) || c == '-' || c == '.' || c == '_'
            || c == '~')
        {
            encoded += char(c);
        }
        else
        {
            append_escape(encoded, c);
        }
    }
    return encoded;
}

string
percent_decode(string const& text)
{
    string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i != text.size(); ++i)
    {
        if (text[i] == '%' && i + 2 < text.size())
        {
            int high = hex_value(text[i + 1]);
            int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0)
            {
                decoded += char((high << 4) | low);
                i += 2;
                continue;
            }
        }
        decoded += text[i];
    }
    return decoded;
}

url_parts
parse_url(string const& url)
{
    auto scheme_end = url.find("://");
    if (scheme_end == string::npos || scheme_end == 0)
        CURSETOOL_THROW(invalid_url() << url_info(url));

    url_parts parts;
    parts.scheme = boost::algorithm::to_lower_copy(url.substr(0, scheme_end));

    auto host_start = scheme_end + 3;
    auto host_end = url.find_first_of("/?#", host_start);
    if (host_end == string::npos)
        host_end = url.size();
    if (host_end == host_start)
        CURSETOOL_THROW(invalid_url() << url_info(url));
    parts.host = boost::algorithm::to_lower_copy(
        url.substr(host_start, host_end - host_start));

    // Fragments are never sent to the server, so they're dropped.
    auto rest = url.substr(host_end);
    auto fragment_start = rest.find('#');
    if (fragment_start != string::npos)
        rest.erase(fragment_start);

    auto query_start = rest.find('?');
    if (query_start != string::npos)
    {
        parts.query = rest.substr(query_start + 1);
        rest.erase(query_start);
    }
    parts.path = rest.empty() ? string("/") : rest;
    return parts;
}

string
to_string(url_parts const& parts)
{
    string url = parts.scheme + "://" + parts.host + parts.path;
    if (parts.query)
        url += "?" + *parts.query;
    return url;
}

string
resolve_request_url(string const& base, http_query const& query)
{
    auto parts = parse_url(base);
    if (!query.empty())
    {
        string serialized
            = parts.query && !parts.query->empty() ? *parts.query + "&" : "";
        bool first = true;
        for (auto const& [name, value] : query)
        {
            if (!first)
                serialized += '&';
            serialized += form_urlencode(name) + "=" + form_urlencode(value);
            first = false;
        }
        parts.query = serialized;
    }
    return to_string(parts);
}

string
normalize_host_alias(string const& url)
{
    static std::map<string, string> const canonical_hosts
        = {{"edge.forgecdn.net", "media.forgecdn.net"}};

    auto parts = parse_url(url);
    auto canonical = canonical_hosts.find(parts.host);
    if (canonical != canonical_hosts.end())
        parts.host = canonical->second;
    return to_string(parts);
}

string
fix_download_url(string const& url)
{
    auto parts = parse_url(normalize_host_alias(url));
    auto last_slash = parts.path.rfind('/');
    auto directory = parts.path.substr(0, last_slash + 1);
    auto filename = parts.path.substr(last_slash + 1);
    parts.path = directory + encode_path_segment(percent_decode(filename));
    return to_string(parts);
}

string
get_last_path_segment(string const& url)
{
    auto path = parse_url(url).path;
    return path.substr(path.rfind('/') + 1);
}

} // namespace cursetool
