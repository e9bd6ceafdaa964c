#ifndef CURSETOOL_UTILITIES_ERRORS_H
#define CURSETOOL_UTILITIES_ERRORS_H

#include <cursetool/core/exception.hpp>

namespace cursetool {

// Error info shared across modules.

// If a library that provides its own error messages fails internally, this
// conveys that message.
CURSETOOL_DEFINE_ERROR_INFO(string, internal_error_message)

// This exception indicates that some text (a manifest, a server response, a
// field value) couldn't be parsed in the expected format.
CURSETOOL_DEFINE_EXCEPTION(parsing_error)
// the name of the format (e.g., "JSON", "mod side")
CURSETOOL_DEFINE_ERROR_INFO(string, expected_format)
CURSETOOL_DEFINE_ERROR_INFO(string, parsed_text)
// the parser's own description of the problem
CURSETOOL_DEFINE_ERROR_INFO(string, parsing_error)

} // namespace cursetool

#endif
