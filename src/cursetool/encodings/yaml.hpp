#ifndef CURSETOOL_ENCODINGS_YAML_HPP
#define CURSETOOL_ENCODINGS_YAML_HPP

#include <yaml-cpp/yaml.h>

#include <cursetool/utilities/errors.h>

// YAML - conversion to and from YAML strings

namespace cursetool {

// Parse some YAML text into a YAML node.
// If the text isn't valid YAML, this throws a parsing_error.
YAML::Node
parse_yaml_value(string const& text);

// Write a node to a string in (block-style) YAML format.
string
value_to_yaml(YAML::Node const& node);

// This exception indicates that a YAML document didn't have the structure
// that was expected of it.
CURSETOOL_DEFINE_EXCEPTION(yaml_structure_error)
CURSETOOL_DEFINE_ERROR_INFO(string, yaml_field_name)
// This exception also provides internal_error_message_info.

// Get an optional field from a YAML map and convert it to a T.
// If the field is present but can't be converted (or :node isn't a map),
// this throws a yaml_structure_error.
template<class T>
optional<T>
get_optional_yaml_field(YAML::Node const& node, char const* name)
{
    if (!node.IsMap())
    {
        CURSETOOL_THROW(
            yaml_structure_error()
            << yaml_field_name_info(name)
            << internal_error_message_info("expected a map"));
    }
    auto field = node[name];
    if (!field || field.IsNull())
        return none;
    try
    {
        return some(field.template as<T>());
    }
    catch (YAML::Exception& e)
    {
        CURSETOOL_THROW(
            yaml_structure_error() << yaml_field_name_info(name)
                                   << internal_error_message_info(e.what()));
    }
}

// Same as above, but the field is required.
template<class T>
T
get_yaml_field(YAML::Node const& node, char const* name)
{
    auto value = get_optional_yaml_field<T>(node, name);
    if (!value)
    {
        CURSETOOL_THROW(
            yaml_structure_error() << yaml_field_name_info(name)
                                   << internal_error_message_info(
                                          "missing required field"));
    }
    return std::move(*value);
}

} // namespace cursetool

#endif
