#include <cursetool/core/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cursetool {

spdlog::level::level_enum
to_spdlog_level(log_verbosity verbosity)
{
    switch (verbosity)
    {
        case log_verbosity::QUIET:
            return spdlog::level::warn;
        case log_verbosity::NORMAL:
        default:
            return spdlog::level::info;
        case log_verbosity::VERBOSE:
            return spdlog::level::debug;
    }
}

void
initialize_logging(log_verbosity verbosity)
{
    auto logger = spdlog::get("cursetool");
    if (!logger)
    {
        logger = spdlog::stdout_color_mt("cursetool");
        logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    }
    logger->set_level(to_spdlog_level(verbosity));
}

} // namespace cursetool
