#include <cursetool/io/http_requests.hpp>

#include <ostream>

#include <boost/algorithm/string.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <curl/curl.h>

#include <cursetool/core/logging.hpp>
#include <cursetool/utilities/errors.h>

namespace cursetool {

bool
operator==(http_request const& a, http_request const& b)
{
    return a.method == b.method && a.url == b.url && a.headers == b.headers;
}

static char const*
get_method_name(http_request_method method)
{
    switch (method)
    {
        case http_request_method::GET:
        default:
            return "GET";
    }
}

std::ostream&
operator<<(std::ostream& stream, http_request const& request)
{
    stream << get_method_name(request.method) << " " << request.url;
    for (auto const& [name, value] : request.headers)
        stream << "\n  " << name << ": " << value;
    return stream;
}

http_request
make_get_request(
    string const& url, http_header_list headers, http_query const& query)
{
    return http_request{
        http_request_method::GET,
        resolve_request_url(url, query),
        std::move(headers)};
}

http_request
redact_request(http_request request)
{
    for (auto& [name, value] : request.headers)
    {
        if (boost::algorithm::iequals(name, "x-api-key")
            || boost::algorithm::iequals(name, "Authorization"))
        {
            value = "[redacted]";
        }
    }
    return request;
}

bool
operator==(http_response const& a, http_response const& b)
{
    return a.status_code == b.status_code && a.headers == b.headers
           && a.body == b.body;
}

std::ostream&
operator<<(std::ostream& stream, http_response const& response)
{
    stream << "status " << response.status_code;
    for (auto const& [name, value] : response.headers)
        stream << "\n  " << name << ": " << value;
    // Bodies can be arbitrarily large (and binary), so only show the start.
    size_t const max_shown = 256;
    stream << "\n" << response.body.substr(0, max_shown);
    if (response.body.size() > max_shown)
        stream << "... (" << response.body.size() << " bytes)";
    return stream;
}

http_response
make_http_200_response(string body, http_header_list headers)
{
    return make_http_response(200, std::move(headers), std::move(body));
}

http_response
make_http_response(int status_code, http_header_list headers, string body)
{
    http_response response;
    response.status_code = status_code;
    for (auto& [name, value] : headers)
        response.headers[boost::algorithm::to_lower_copy(name)] = value;
    response.body = std::move(body);
    return response;
}

optional<string>
get_content_type(http_response const& response)
{
    auto header = response.headers.find("content-type");
    if (header == response.headers.end())
        return none;
    auto media_type = header->second.substr(0, header->second.find(';'));
    boost::algorithm::trim(media_type);
    boost::algorithm::to_lower(media_type);
    return some(media_type);
}

http_request_system::http_request_system()
{
    if (curl_global_init(CURL_GLOBAL_ALL))
    {
        CURSETOOL_THROW(http_request_system_error());
    }
}
http_request_system::~http_request_system()
{
    curl_global_cleanup();
}

struct http_connection_impl
{
    CURL* curl = nullptr;
};

static void
reset_curl_connection(http_connection_impl& connection)
{
    CURL* curl = connection.curl;
    curl_easy_reset(curl);

    // Allow requests to be redirected. (Download URLs are often redirected to
    // mirrors.)
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    // Tell CURL to accept and decode compressed responses.
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 1L);

    // Enable SSL verification.
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, "cursetool");
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);

    // Multiple threads each own a connection, so signals can't be used for
    // timeouts.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

http_connection::http_connection(http_request_system&)
    : impl_(new http_connection_impl)
{
    CURL* curl = curl_easy_init();
    if (!curl)
    {
        CURSETOOL_THROW(http_request_system_error());
    }
    impl_->curl = curl;
}
http_connection::~http_connection()
{
    if (impl_)
        curl_easy_cleanup(impl_->curl);
}

http_connection::http_connection(http_connection&&) = default;
http_connection&
http_connection::operator=(http_connection&&)
    = default;

static size_t
record_http_body(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto& body = *reinterpret_cast<string*>(userdata);
    size_t n_bytes = size * nmemb;
    body.append(ptr, n_bytes);
    return n_bytes;
}

// CURL delivers response headers one line at a time. When a request is
// redirected, the headers of every response in the chain are delivered, so
// each status line starts a fresh header list and the final response's
// headers are the ones that remain.
static size_t
record_http_header(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto& headers = *reinterpret_cast<http_header_list*>(userdata);
    size_t n_bytes = size * nmemb;
    string line(ptr, n_bytes);
    if (boost::algorithm::starts_with(line, "HTTP/"))
    {
        headers.clear();
    }
    else
    {
        auto index = line.find(':');
        if (index != string::npos)
        {
            headers[boost::algorithm::to_lower_copy(
                boost::algorithm::trim_copy(line.substr(0, index)))]
                = boost::algorithm::trim_copy(line.substr(index + 1));
        }
    }
    return n_bytes;
}

struct scoped_curl_slist
{
    ~scoped_curl_slist()
    {
        curl_slist_free_all(list);
    }
    curl_slist* list = nullptr;
};

http_response
http_connection::perform_request(http_request const& request)
{
    CURSETOOL_LOG_CALL(<< CURSETOOL_LOG_ARG(redact_request(request)))

    CURL* curl = impl_->curl;
    reset_curl_connection(*impl_);

    // Set the headers for the request.
    scoped_curl_slist curl_headers;
    for (auto const& header : request.headers)
    {
        auto header_string = header.first + ": " + header.second;
        curl_headers.list
            = curl_slist_append(curl_headers.list, header_string.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers.list);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    // Set up for receiving the response.
    http_response response;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, record_http_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, record_http_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    // Perform the request.
    CURLcode result = curl_easy_perform(curl);

    // Check for low-level CURL errors.
    if (result != CURLE_OK)
    {
        string message = curl_easy_strerror(result);
        if (error_buffer[0] != '\0')
            message += string(": ") + error_buffer;
        CURSETOOL_THROW(
            http_request_failure()
            << attempted_http_request_info(redact_request(request))
            << internal_error_message_info(message));
    }

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    response.status_code = boost::numeric_cast<int>(status_code);

    // Check the status code.
    if (status_code < 200 || status_code > 299)
    {
        CURSETOOL_THROW(
            bad_http_status_code()
            << attempted_http_request_info(redact_request(request))
            << http_response_info(response));
    }

    return response;
}

} // namespace cursetool
