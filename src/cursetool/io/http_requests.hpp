#ifndef CURSETOOL_IO_HTTP_REQUESTS_HPP
#define CURSETOOL_IO_HTTP_REQUESTS_HPP

#include <iosfwd>
#include <map>
#include <memory>

#include <cursetool/io/url.hpp>

// This file defines a low-level facility for doing HTTP requests.

namespace cursetool {

// HTTP headers are specified as a mapping from field names to values.
// Response header names are always lowercase.
typedef std::map<string, string> http_header_list;

// supported HTTP request methods
enum class http_request_method
{
    GET
};

struct http_request
{
    http_request_method method;
    // the full URL (including any query string) exactly as it's sent
    string url;
    http_header_list headers;
};

bool
operator==(http_request const& a, http_request const& b);

std::ostream&
operator<<(std::ostream& stream, http_request const& request);

// Construct a GET request (in a convenient way).
// The query parameters are serialized into the URL, which is normalized, so
// the request's URL is the one that actually gets sent.
http_request
make_get_request(
    string const& url, http_header_list headers, http_query const& query = {});

// Redact an HTTP request (i.e., hide its credentials).
http_request
redact_request(http_request request);

struct http_response
{
    int status_code;
    http_header_list headers;
    string body;
};

bool
operator==(http_response const& a, http_response const& b);

std::ostream&
operator<<(std::ostream& stream, http_response const& response);

// Make a successful (200) HTTP response with the given body.
http_response
make_http_200_response(string body, http_header_list headers = {});

// Make an arbitrary HTTP response.
http_response
make_http_response(int status_code, http_header_list headers, string body);

// Get the media type of a response (e.g., "application/json"), without any
// parameters and in lowercase. This is none if the server didn't specify it.
optional<string>
get_content_type(http_response const& response);

// This exception indicates a general failure in the HTTP request
// system (e.g., a failure to initialize).
CURSETOOL_DEFINE_EXCEPTION(http_request_system_error)

// This exception indicates that a failure occurred in the processing
// of a HTTP request that precluded getting a response from the server
// (e.g., the server couldn't be reached).
CURSETOOL_DEFINE_EXCEPTION(http_request_failure)
// This exception also provides internal_error_message_info.
CURSETOOL_DEFINE_ERROR_INFO(http_request, attempted_http_request)

// This exception indicates that an HTTP request was resolved but
// resulted in a status code outside the 2xx range. The full response
// is included.
CURSETOOL_DEFINE_EXCEPTION(bad_http_status_code)
// This exception also provides attempted_http_request_info.
CURSETOOL_DEFINE_ERROR_INFO(http_response, http_response)

// http_request_system provides global initialization and shutdown of the HTTP
// request system. Exactly one of these objects must be instantiated by the
// application, and its scope must dominate the scope of all http_connection
// objects.

struct http_request_system : noncopyable
{
    http_request_system();
    ~http_request_system();
};

// http_connection provides a network connection over which HTTP requests can
// be made.

struct http_connection_interface
{
    virtual ~http_connection_interface()
    {
    }

    // Perform an HTTP request and return the response.
    virtual http_response
    perform_request(http_request const& request) = 0;
};

struct http_connection_impl;

struct http_connection : http_connection_interface
{
    http_connection(http_request_system& system);
    ~http_connection();

    http_connection(http_connection&&);
    http_connection&
    operator=(http_connection&&);

    http_response
    perform_request(http_request const& request) override;

 private:
    std::unique_ptr<http_connection_impl> impl_;
};

} // namespace cursetool

#endif
