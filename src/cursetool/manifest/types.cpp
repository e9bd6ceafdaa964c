#include <cursetool/manifest/types.hpp>

namespace cursetool {

string
side_name(mod_side side)
{
    switch (side)
    {
        case mod_side::CLIENT:
            return "client";
        case mod_side::SERVER:
            return "server";
        case mod_side::BOTH:
        default:
            return "both";
    }
}

mod_side
parse_side(string const& name)
{
    if (name == "client")
        return mod_side::CLIENT;
    if (name == "server")
        return mod_side::SERVER;
    if (name == "both")
        return mod_side::BOTH;
    CURSETOOL_THROW(
        parsing_error() << expected_format_info("mod side")
                        << parsed_text_info(name));
}

} // namespace cursetool
