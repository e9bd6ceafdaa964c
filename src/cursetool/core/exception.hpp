#ifndef CURSETOOL_CORE_EXCEPTION_HPP
#define CURSETOOL_CORE_EXCEPTION_HPP

#include <utility>

#include <cursetool/core/type_definitions.hpp>

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

namespace cursetool {

// All cursetool errors are Boost.Exception types. Code that detects an error
// throws it with CURSETOOL_THROW, and code further up the stack attaches
// whatever context it knows about (the mod, the request, the file) as error
// info on the way out. what() reports all of it.

#define CURSETOOL_DEFINE_EXCEPTION(id)                                        \
    struct id : virtual boost::exception, virtual std::exception              \
    {                                                                         \
        char const*                                                           \
        what() const noexcept                                                 \
        {                                                                     \
            return boost::diagnostic_information_what(*this);                 \
        }                                                                     \
    };

#define CURSETOOL_DEFINE_ERROR_INFO(T, id)                                    \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

CURSETOOL_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

// Throw :x with the current stack trace attached.
#define CURSETOOL_THROW(x)                                                    \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << cursetool::stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

// get_required_error_info is like get_error_info, but the info must be
// present. If it isn't, missing_error_info is thrown (carrying the
// diagnostics of the original exception).
CURSETOOL_DEFINE_EXCEPTION(missing_error_info)
CURSETOOL_DEFINE_ERROR_INFO(string, error_info_id)
CURSETOOL_DEFINE_ERROR_INFO(string, wrapped_exception_diagnostics)
template<class ErrorInfo, class Exception>
typename ErrorInfo::error_info::value_type const&
get_required_error_info(Exception const& e)
{
    typename ErrorInfo::error_info::value_type const* info
        = get_error_info<ErrorInfo>(e);
    if (!info)
    {
        CURSETOOL_THROW(
            missing_error_info()
            << error_info_id_info(typeid(ErrorInfo).name())
            << wrapped_exception_diagnostics_info(
                   boost::diagnostic_information(e)));
    }
    return *info;
}

// Invoke :operation and return its result. If it throws, :info is attached
// to the exception on its way out, unless an inner operation already attached
// a more specific value of the same kind.
template<class ErrorInfo, class Operation>
auto
with_error_info(ErrorInfo const& info, Operation&& operation)
{
    try
    {
        return std::forward<Operation>(operation)();
    }
    catch (boost::exception& e)
    {
        if (!get_error_info<ErrorInfo>(e))
            e << info;
        throw;
    }
}

} // namespace cursetool

#endif
