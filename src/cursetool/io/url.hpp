#ifndef CURSETOOL_IO_URL_HPP
#define CURSETOOL_IO_URL_HPP

#include <vector>

#include <cursetool/core.h>

// This file provides the URL manipulation needed to turn logical requests
// into the exact URLs that are sent over the network (and used as cache
// keys).

namespace cursetool {

// Query parameters are an ordered list of name/value pairs. Order is
// preserved in the serialized URL.
typedef std::vector<std::pair<string, string>> http_query;

// Percent-encode :text as application/x-www-form-urlencoded data.
// Alphanumerics and '*', '-', '.', '_' are kept, spaces become '+', and
// everything else becomes an uppercase %XX escape.
string
form_urlencode(string const& text);

// Percent-encode :text for use as a single URL path segment.
// Only unreserved characters (alphanumerics and '-', '.', '_', '~') are kept.
// In particular, '+' is encoded.
string
encode_path_segment(string const& text);

// Decode %XX escapes in :text. Malformed escapes are left as they are.
string
percent_decode(string const& text);

// The components of an absolute URL.
struct url_parts
{
    // e.g., "https"
    string scheme;
    // e.g., "media.forgecdn.net" (including any port)
    string host;
    // always starts with '/'
    string path;
    // everything after the '?' (if there was one)
    optional<string> query;
};

// Split an absolute URL into its components. The scheme and host are
// lowercased and an empty path becomes "/".
url_parts
parse_url(string const& url);

// If parse_url is given something that isn't an absolute URL, this is thrown.
CURSETOOL_DEFINE_EXCEPTION(invalid_url)
CURSETOOL_DEFINE_ERROR_INFO(string, url)

// Reassemble a URL from its components.
string
to_string(url_parts const& parts);

// Resolve the URL that's actually requested when :base is requested with
// the given query parameters. The result is normalized so that logically
// equivalent requests produce identical strings.
string
resolve_request_url(string const& base, http_query const& query = {});

// Rewrite known CDN host aliases to their canonical hosts.
// (edge.forgecdn.net rejects direct requests in some deployments, but serves
// the same files as media.forgecdn.net.)
string
normalize_host_alias(string const& url);

// Download URLs reported by the catalog aren't reliably encoded. This
// canonicalizes one by normalizing its host and by decoding and re-encoding
// its final path segment (the filename).
string
fix_download_url(string const& url);

// Get the final segment of a URL's path (in its encoded form).
string
get_last_path_segment(string const& url);

} // namespace cursetool

#endif
