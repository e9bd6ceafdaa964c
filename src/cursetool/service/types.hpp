#ifndef CURSETOOL_SERVICE_TYPES_HPP
#define CURSETOOL_SERVICE_TYPES_HPP

#include <cursetool/caching/response_cache.hpp>

namespace cursetool {

struct service_config
{
    // config for the persistent response cache
    optional<response_cache_config> response_cache;

    // how many concurrent threads to use for resolving mods -
    // The default is one thread for each processor core.
    optional<integer> worker_count;
};

} // namespace cursetool

#endif
