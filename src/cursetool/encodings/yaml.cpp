#include <cursetool/encodings/yaml.hpp>

namespace cursetool {

YAML::Node
parse_yaml_value(string const& text)
{
    try
    {
        return YAML::Load(text);
    }
    catch (YAML::Exception& e)
    {
        CURSETOOL_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsed_text_info(text.substr(0, 256))
                            << parsing_error_info(e.what()));
    }
}

string
value_to_yaml(YAML::Node const& node)
{
    YAML::Emitter emitter;
    emitter.SetIndent(2);
    emitter.SetSeqFormat(YAML::Block);
    emitter.SetMapFormat(YAML::Block);
    emitter << node;
    if (!emitter.good())
    {
        CURSETOOL_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsing_error_info(emitter.GetLastError()));
    }
    return string(emitter.c_str()) + "\n";
}

} // namespace cursetool
