#ifndef CURSETOOL_UTILITIES_ENVIRONMENT_H
#define CURSETOOL_UTILITIES_ENVIRONMENT_H

#include <cursetool/core.h>

namespace cursetool {

// Settings that come from the environment (the API key, the XDG directories)
// are read through these.

// Get the value of an environment variable.
string
get_environment_variable(string const& name);
// If the variable isn't set (or is empty), the following exception is thrown.
CURSETOOL_DEFINE_EXCEPTION(missing_environment_variable)
CURSETOOL_DEFINE_ERROR_INFO(string, variable_name)

// Get the value of an environment variable that may legitimately be absent.
// Empty values count as absent.
optional<string>
get_optional_environment_variable(string const& name);

// Set an environment variable. Setting it to none (or an empty string)
// removes it.
void
set_environment_variable(string const& name, optional<string> const& value);

// scoped_environment_variable overrides a variable for its own lifetime and
// then puts back whatever value was there before.
struct scoped_environment_variable : noncopyable
{
    scoped_environment_variable(string name, optional<string> const& value);
    ~scoped_environment_variable();

 private:
    string name_;
    optional<string> original_;
};

} // namespace cursetool

#endif
