#include <cursetool/service/core.h>

#include <thread>

#include <boost/numeric/conversion/cast.hpp>

#include <spdlog/spdlog.h>

#include <cursetool/service/internals.h>

namespace cursetool {

void
service_core::reset()
{
    impl_.reset();
}

void
service_core::reset(service_config const& config)
{
    impl_.reset(new detail::service_core_internals{
        .cache = response_cache(
            config.response_cache ? *config.response_cache
                                  : response_cache_config()),
        .worker_pool = cppcoro::static_thread_pool(
            config.worker_count
                ? boost::numeric_cast<std::uint32_t>(*config.worker_count)
                : std::thread::hardware_concurrency())});
}

service_core::~service_core()
{
}

http_connection_interface&
http_connection_for_thread(service_core& core)
{
    if (core.internals().mock_http)
    {
        // Tests may swap sessions, so the thread's mock connection follows
        // whichever session is current.
        thread_local std::unique_ptr<mock_http_connection> the_connection;
        thread_local mock_http_session* the_session = nullptr;
        if (!the_connection || the_session != core.internals().mock_http.get())
        {
            the_session = core.internals().mock_http.get();
            the_connection
                = std::make_unique<mock_http_connection>(*the_session);
        }
        return *the_connection;
    }
    else
    {
        static http_request_system the_system;
        thread_local http_connection the_connection(the_system);
        return the_connection;
    }
}

http_response
perform_gated_request(service_core& core, http_request const& request)
{
    std::scoped_lock<std::mutex> gate(core.internals().http_gate);
    spdlog::get("cursetool")->debug("fetching {}", request.url);
    return http_connection_for_thread(core).perform_request(request);
}

string
response_cached(
    service_core& core,
    string const& key,
    std::chrono::seconds ttl,
    response_computer const& compute)
{
    return core.internals().cache.get_or_put(key, ttl, compute);
}

string
cached_http_request(
    service_core& core,
    http_request const& request,
    std::chrono::seconds ttl,
    response_processor const& process)
{
    return response_cached(core, request.url, ttl, [&] {
        auto response = perform_gated_request(core, request);
        if (process)
            return process(request, std::move(response));
        return std::move(response.body);
    });
}

void
init_test_service(service_core& core)
{
    response_cache_config cache_config;
    cache_config.in_memory = true;
    core.reset(service_config{
        .response_cache = cache_config, .worker_count = integer(2)});
}

mock_http_session&
enable_http_mocking(service_core& core)
{
    core.internals().mock_http = std::make_unique<mock_http_session>();
    return *core.internals().mock_http;
}

} // namespace cursetool
