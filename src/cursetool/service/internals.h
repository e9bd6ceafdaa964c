#ifndef CURSETOOL_SERVICE_INTERNALS_H
#define CURSETOOL_SERVICE_INTERNALS_H

#include <mutex>

#include <cppcoro/static_thread_pool.hpp>

#include <cursetool/caching/response_cache.hpp>
#include <cursetool/io/mock_http.h>

namespace cursetool {

namespace detail {

struct service_core_internals
{
    cursetool::response_cache cache;

    cppcoro::static_thread_pool worker_pool;

    // Only one request may be sent to the origin at a time. This is held for
    // the duration of each network call (and nothing else).
    std::mutex http_gate;

    std::unique_ptr<mock_http_session> mock_http;
};

} // namespace detail

} // namespace cursetool

#endif
