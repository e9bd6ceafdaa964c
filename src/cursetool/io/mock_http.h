#ifndef CURSETOOL_IO_MOCK_HTTP_H
#define CURSETOOL_IO_MOCK_HTTP_H

#include <chrono>
#include <mutex>
#include <vector>

#include <cursetool/io/http_requests.hpp>

namespace cursetool {

struct mock_http_exchange
{
    http_request request;
    http_response response;
};

typedef std::vector<mock_http_exchange> mock_http_script;

// A mock HTTP session is scripted with the exchanges that are expected to
// happen. Each scripted exchange can be consumed exactly once. A session may
// be shared by connections on multiple threads.
struct mock_http_session
{
    mock_http_session()
    {
    }

    mock_http_session(mock_http_script script)
    {
        set_script(std::move(script));
    }

    // Set the script of expected exchanges for this mock HTTP session.
    void
    set_script(mock_http_script script);

    // Add an exchange to the end of the script.
    void
    add_exchange(http_request request, http_response response);

    // Have all exchanges in the script been executed?
    bool
    is_complete() const;

    // Has the script been executed in order so far?
    bool
    is_in_order() const;

    // How many requests have been performed through this session (including
    // unrecognized ones)?
    int
    request_count() const;

    // Make every request take (at least) the given amount of time, so that
    // requests from different threads have a chance to overlap.
    void
    set_response_delay(std::chrono::milliseconds delay);

    // What's the largest number of requests that have been in flight at the
    // same time?
    int
    max_concurrent_requests() const;

 private:
    friend struct mock_http_connection;

    mutable std::mutex mutex_;

    mock_http_script script_;

    // Has the script been executed in order so far?
    bool in_order_ = true;

    int request_count_ = 0;

    std::chrono::milliseconds response_delay_{0};
    int in_flight_ = 0;
    int max_in_flight_ = 0;
};

// If a mock connection receives a request that isn't in the script, it
// throws this.
CURSETOOL_DEFINE_EXCEPTION(unrecognized_mock_request)
// This exception also provides attempted_http_request_info.

struct mock_http_connection : http_connection_interface
{
    mock_http_connection(mock_http_session& session) : session_(session)
    {
    }

    http_response
    perform_request(http_request const& request) override;

 private:
    mock_http_session& session_;
};

} // namespace cursetool

#endif
