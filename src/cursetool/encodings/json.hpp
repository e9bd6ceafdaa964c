#ifndef CURSETOOL_ENCODINGS_JSON_HPP
#define CURSETOOL_ENCODINGS_JSON_HPP

#include <nlohmann/json.hpp>

#include <cursetool/utilities/errors.h>

// JSON - conversion to and from JSON strings

namespace cursetool {

using nlohmann::json;

// Parse some JSON text into a JSON value.
// If the text isn't valid JSON, this throws a parsing_error.
json
parse_json_value(char const* text, size_t length);

// Same as above, but accepts a string.
inline json
parse_json_value(string const& text)
{
    return parse_json_value(text.c_str(), text.length());
}

// Write a value to a string in JSON format.
string
value_to_json(json const& v);

// This exception indicates that a JSON value didn't have the structure that
// was expected of it.
CURSETOOL_DEFINE_EXCEPTION(json_structure_error)
CURSETOOL_DEFINE_ERROR_INFO(string, json_field_name)
// This exception also provides internal_error_message_info.

// Get a required field from a JSON object and convert it to a T.
// If the field is missing (or :object isn't an object), or if the field can't
// be converted, this throws a json_structure_error.
template<class T>
T
get_json_field(json const& object, char const* name)
{
    if (!object.is_object() || !object.contains(name))
    {
        CURSETOOL_THROW(
            json_structure_error() << json_field_name_info(name)
                                   << internal_error_message_info(
                                          "missing required field"));
    }
    try
    {
        return object.at(name).get<T>();
    }
    catch (json::exception& e)
    {
        CURSETOOL_THROW(
            json_structure_error() << json_field_name_info(name)
                                   << internal_error_message_info(e.what()));
    }
}

// Same as above, but returns none if the field is missing or null.
template<class T>
optional<T>
get_optional_json_field(json const& object, char const* name)
{
    if (!object.is_object() || !object.contains(name)
        || object.at(name).is_null())
    {
        return none;
    }
    return some(get_json_field<T>(object, name));
}

// Convert a whole JSON value to a T (via nlohmann's from_json mechanism),
// translating conversion errors into json_structure_error.
template<class T>
T
from_json_value(json const& value)
{
    try
    {
        return value.get<T>();
    }
    catch (json::exception& e)
    {
        CURSETOOL_THROW(
            json_structure_error() << internal_error_message_info(e.what()));
    }
}

} // namespace cursetool

#endif
