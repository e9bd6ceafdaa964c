#ifndef CURSETOOL_SERVICE_CORE_H
#define CURSETOOL_SERVICE_CORE_H

#include <functional>
#include <memory>

#include <cppcoro/task.hpp>

#include <cursetool/io/http_requests.hpp>
#include <cursetool/service/internals.h>
#include <cursetool/service/types.hpp>

namespace cursetool {

namespace detail {

struct service_core_internals;

}

struct service_core
{
    service_core()
    {
    }
    service_core(service_config const& config)
    {
        reset(config);
    }
    ~service_core();

    void
    reset();
    void
    reset(service_config const& config);

    detail::service_core_internals&
    internals()
    {
        return *impl_;
    }

 private:
    std::unique_ptr<detail::service_core_internals> impl_;
};

http_connection_interface&
http_connection_for_thread(service_core& core);

// Perform an HTTP request against the origin. The request waits its turn at
// the service's HTTP gate, so at most one of these is ever in flight.
http_response
perform_gated_request(service_core& core, http_request const& request);

// Get the value for :key from the response cache if it's fresh according to
// :ttl. Otherwise, compute it with :compute and record it.
string
response_cached(
    service_core& core,
    string const& key,
    std::chrono::seconds ttl,
    response_computer const& compute);

// A response_processor turns a successful response into the value that's
// cached for its request. It may reject the response by throwing, in which
// case nothing is cached.
typedef std::function<string(http_request const&, http_response)>
    response_processor;

// Get the value for :request, going to the network (via the gate) only if the
// cache doesn't have a fresh copy. The request's URL is used as the cache key.
// If :process is omitted, the value is the response body.
string
cached_http_request(
    service_core& core,
    http_request const& request,
    std::chrono::seconds ttl = default_ttl,
    response_processor const& process = nullptr);

// Run :task on one of the service's worker threads.
template<class Value>
cppcoro::task<Value>
on_worker_pool(service_core& core, cppcoro::task<Value> task)
{
    co_await core.internals().worker_pool.schedule();
    co_return co_await std::move(task);
}

// Initialize a service for unit testing purposes.
// The response cache lives in memory.
void
init_test_service(service_core& core);

// Set up HTTP mocking for a service.
// This returns the mock_http_session that's been associated with the service.
mock_http_session&
enable_http_mocking(service_core& core);

} // namespace cursetool

#endif
