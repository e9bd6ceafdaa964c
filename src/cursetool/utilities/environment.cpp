#include <cursetool/utilities/environment.h>

#include <cstdlib>

namespace cursetool {

string
get_environment_variable(string const& name)
{
    auto value = get_optional_environment_variable(name);
    if (!value)
    {
        CURSETOOL_THROW(
            missing_environment_variable() << variable_name_info(name));
    }
    return std::move(*value);
}

optional<string>
get_optional_environment_variable(string const& name)
{
    char const* value = std::getenv(name.c_str());
    if (!value || *value == '\0')
        return none;
    return string(value);
}

void
set_environment_variable(string const& name, optional<string> const& value)
{
    if (value && !value->empty())
        ::setenv(name.c_str(), value->c_str(), 1);
    else
        ::unsetenv(name.c_str());
}

scoped_environment_variable::scoped_environment_variable(
    string name, optional<string> const& value)
    : name_(std::move(name)),
      original_(get_optional_environment_variable(name_))
{
    set_environment_variable(name_, value);
}

scoped_environment_variable::~scoped_environment_variable()
{
    set_environment_variable(name_, original_);
}

} // namespace cursetool
