#include <cursetool/encodings/yaml.hpp>

#include <cursetool/utilities/testing.h>

using namespace cursetool;

TEST_CASE("YAML parsing", "[encodings][yaml]")
{
    auto node = parse_yaml_value(R"(
version: 1.12.2
mods:
  - name: jei
    required: false
)");
    REQUIRE(node["version"].as<string>() == "1.12.2");
    REQUIRE(node["mods"].IsSequence());
    REQUIRE(node["mods"][0]["name"].as<string>() == "jei");
    REQUIRE(node["mods"][0]["required"].as<bool>() == false);
}

TEST_CASE("malformed YAML", "[encodings][yaml]")
{
    try
    {
        parse_yaml_value("mods: [unterminated");
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "YAML");
    }
}

TEST_CASE("YAML writing", "[encodings][yaml]")
{
    YAML::Node node(YAML::NodeType::Map);
    node["version"] = "1.12.2";
    node["imports"] = YAML::Node(YAML::NodeType::Sequence);
    YAML::Node mod(YAML::NodeType::Map);
    mod["name"] = "jei";
    node["mods"].push_back(mod);

    auto text = value_to_yaml(node);
    REQUIRE(text.find("version: 1.12.2\n") == 0);
    REQUIRE(text.find("imports: []\n") != string::npos);
    REQUIRE(text.find("- name: jei\n") != string::npos);

    // What's written can be read back.
    auto parsed = parse_yaml_value(text);
    REQUIRE(parsed["mods"][0]["name"].as<string>() == "jei");
}

TEST_CASE("YAML field access", "[encodings][yaml]")
{
    auto node = parse_yaml_value("name: jei\nid: 12\nside: ~\n");

    REQUIRE(get_yaml_field<string>(node, "name") == "jei");
    REQUIRE(get_yaml_field<int>(node, "id") == 12);
    REQUIRE(get_optional_yaml_field<string>(node, "side") == none);
    REQUIRE(get_optional_yaml_field<string>(node, "missing") == none);

    try
    {
        get_yaml_field<string>(node, "missing");
        FAIL("no exception thrown");
    }
    catch (yaml_structure_error& e)
    {
        REQUIRE(get_required_error_info<yaml_field_name_info>(e) == "missing");
    }
    REQUIRE_THROWS_AS(get_yaml_field<int>(node, "name"), yaml_structure_error);
    REQUIRE_THROWS_AS(
        get_yaml_field<int>(parse_yaml_value("- 1\n- 2\n"), "id"),
        yaml_structure_error);
}
