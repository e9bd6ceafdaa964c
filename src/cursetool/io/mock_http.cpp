#include <cursetool/io/mock_http.h>

#include <algorithm>
#include <thread>

namespace cursetool {

void
mock_http_session::set_script(mock_http_script script)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    script_ = std::move(script);
    in_order_ = true;
}

void
mock_http_session::add_exchange(http_request request, http_response response)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    script_.push_back({std::move(request), std::move(response)});
}

bool
mock_http_session::is_complete() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return script_.empty();
}

bool
mock_http_session::is_in_order() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return in_order_;
}

int
mock_http_session::request_count() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return request_count_;
}

void
mock_http_session::set_response_delay(std::chrono::milliseconds delay)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    response_delay_ = delay;
}

int
mock_http_session::max_concurrent_requests() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return max_in_flight_;
}

namespace {

// Tracks a request as being in flight for as long as it's alive.
struct scoped_in_flight_request
{
    scoped_in_flight_request(std::mutex& mutex, int& in_flight, int& max)
        : mutex_(mutex), in_flight_(in_flight)
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        ++in_flight_;
        max = std::max(max, in_flight_);
    }
    ~scoped_in_flight_request()
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        --in_flight_;
    }

 private:
    std::mutex& mutex_;
    int& in_flight_;
};

} // namespace

http_response
mock_http_connection::perform_request(http_request const& request)
{
    scoped_in_flight_request in_flight(
        session_.mutex_, session_.in_flight_, session_.max_in_flight_);

    std::chrono::milliseconds delay;
    {
        std::scoped_lock<std::mutex> lock(session_.mutex_);
        delay = session_.response_delay_;
    }
    if (delay.count() > 0)
        std::this_thread::sleep_for(delay);

    std::scoped_lock<std::mutex> lock(session_.mutex_);
    ++session_.request_count_;
    auto exchange
        = std::ranges::find_if(session_.script_, [&](auto const& exchange) {
              return exchange.request == request;
          });
    if (exchange == session_.script_.end())
    {
        CURSETOOL_THROW(
            unrecognized_mock_request()
            << attempted_http_request_info(redact_request(request)));
    }
    if (exchange != session_.script_.begin())
        session_.in_order_ = false;
    http_response response = exchange->response;
    session_.script_.erase(exchange);

    // Mirror the behavior of real connections.
    if (response.status_code < 200 || response.status_code > 299)
    {
        CURSETOOL_THROW(
            bad_http_status_code()
            << attempted_http_request_info(redact_request(request))
            << http_response_info(response));
    }
    return response;
}

} // namespace cursetool
