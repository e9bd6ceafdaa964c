#include <cursetool/encodings/json.hpp>

#include <algorithm>

#include <cursetool/utilities/errors.h>

namespace cursetool {

json
parse_json_value(char const* text, size_t length)
{
    try
    {
        return json::parse(text, text + length);
    }
    catch (json::parse_error& e)
    {
        // Only include the start of the text, since it could be huge.
        size_t const max_shown = 256;
        CURSETOOL_THROW(
            parsing_error()
            << expected_format_info("JSON")
            << parsed_text_info(string(text, std::min(length, max_shown)))
            << parsing_error_info(e.what()));
    }
}

string
value_to_json(json const& v)
{
    return v.dump();
}

} // namespace cursetool
