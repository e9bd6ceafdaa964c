#ifndef CURSETOOL_CORE_LOGGING_HPP
#define CURSETOOL_CORE_LOGGING_HPP

#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace cursetool {

// Everything logs through a single spdlog logger named "cursetool", which
// writes to stdout. Progress goes out at info level, per-request detail at
// debug level.

enum class log_verbosity
{
    // warnings and errors only
    QUIET,
    // progress messages
    NORMAL,
    // everything, including each catalog request
    VERBOSE
};

spdlog::level::level_enum
to_spdlog_level(log_verbosity verbosity);

// Create the shared logger if it doesn't already exist and set its level.
void
initialize_logging(log_verbosity verbosity);

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n  " << arg.name << ": " << arg.value;
    return stream;
}

} // namespace detail

// Log entry into the current function (at debug level), along with the
// arguments given as a chain of CURSETOOL_LOG_ARGs. The arguments are only
// formatted if the message will actually be logged.
#define CURSETOOL_LOG_CALL(args)                                              \
    {                                                                         \
        auto logger = spdlog::get("cursetool");                               \
        if (logger && logger->should_log(spdlog::level::debug))               \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

#define CURSETOOL_LOG_ARG(arg)                                                \
    cursetool::detail::arg_logger<                                            \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace cursetool

#endif
