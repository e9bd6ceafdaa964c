#include <cursetool/manifest/yaml.h>

#include <cursetool/fs/file_io.h>
#include <cursetool/utilities/testing.h>

using namespace cursetool;

TEST_CASE("YAML manifest parsing", "[manifest][yaml]")
{
    auto manifest = parse_yaml_manifest(parse_yaml_value(R"(
version: 1.12.2
imports:
  - base.yaml
mods:
  - name: jei
    files:
      - id: 2803400
  - name: journeymap
    side: client
    required: false
    default: false
    files:
      - maturity: beta
        filePageUrl: https://example.com/journeymap/files
  - name: custom
    files:
      - name: custom.jar
        src: https://example.com/custom.jar
        md5: d41d8cd98f00b204e9800998ecf8427e
  - name: bare
)"));

    REQUIRE(manifest.version == "1.12.2");
    REQUIRE(manifest.imports == std::vector<string>{"base.yaml"});
    REQUIRE(manifest.mods.size() == 4);

    auto const& jei = manifest.mods[0];
    REQUIRE(jei.name == "jei");
    REQUIRE(jei.side == none);
    REQUIRE(jei.files);
    REQUIRE(jei.files->at(0).id == some(file_id(2803400)));

    auto const& journeymap = manifest.mods[1];
    REQUIRE(journeymap.side == some(mod_side::CLIENT));
    REQUIRE(journeymap.required == some(false));
    REQUIRE(journeymap.default_ == some(false));
    REQUIRE(journeymap.files->at(0).maturity == some(file_maturity::BETA));
    REQUIRE(
        journeymap.files->at(0).file_page_url
        == some(string("https://example.com/journeymap/files")));

    auto const& custom = manifest.mods[2];
    REQUIRE(
        custom.files->at(0).src == some(string("https://example.com/custom.jar")));
    REQUIRE(custom.files->at(0).name == some(string("custom.jar")));
    REQUIRE(custom.files->at(0).md5);

    REQUIRE(manifest.mods[3].files == none);
}

TEST_CASE("malformed YAML manifests", "[manifest][yaml]")
{
    // missing version
    REQUIRE_THROWS_AS(
        parse_yaml_manifest(parse_yaml_value("mods: []\n")),
        yaml_structure_error);
    // unnamed mod
    REQUIRE_THROWS_AS(
        parse_yaml_manifest(
            parse_yaml_value("version: 1.12.2\nmods:\n  - side: client\n")),
        yaml_structure_error);
    // invalid side
    REQUIRE_THROWS_AS(
        parse_yaml_manifest(parse_yaml_value(
            "version: 1.12.2\nmods:\n  - name: a\n    side: left\n")),
        parsing_error);
    // files isn't a list
    REQUIRE_THROWS_AS(
        parse_yaml_manifest(parse_yaml_value(
            "version: 1.12.2\nmods:\n  - name: a\n    files: 12\n")),
        yaml_structure_error);
}

TEST_CASE("YAML manifest writing", "[manifest][yaml]")
{
    yaml_manifest manifest;
    manifest.version = "1.12.2";
    yaml_mod mod;
    mod.name = "hunger-overhaul";
    mod.required = false;
    yaml_mod_file file;
    file.id = 2916041;
    mod.files = std::vector<yaml_mod_file>{file};
    manifest.mods.push_back(mod);

    auto text = write_yaml_manifest(manifest);
    // Unset fields are left out entirely.
    REQUIRE(text.find("side") == string::npos);
    REQUIRE(text.find("default") == string::npos);
    REQUIRE(text.find("src") == string::npos);

    auto parsed = parse_yaml_manifest(parse_yaml_value(text));
    REQUIRE(parsed.version == "1.12.2");
    REQUIRE(parsed.imports.empty());
    REQUIRE(parsed.mods.size() == 1);
    REQUIRE(parsed.mods[0].name == "hunger-overhaul");
    REQUIRE(parsed.mods[0].required == some(false));
    REQUIRE(parsed.mods[0].files->size() == 1);
    REQUIRE(parsed.mods[0].files->at(0).id == some(file_id(2916041)));
}

TEST_CASE("YAML manifest imports", "[manifest][yaml]")
{
    auto dir = make_test_directory("yaml_imports");
    reset_directory(dir / "shared");
    dump_string_to_file(
        dir / "shared" / "base.yaml",
        "version: 1.12.2\n"
        "imports: []\n"
        "mods:\n"
        "  - name: jei\n"
        "    side: both\n"
        "  - name: journeymap\n");
    dump_string_to_file(
        dir / "pack.yaml",
        "version: 1.12.2\n"
        "imports:\n"
        "  - shared/base.yaml\n"
        "mods:\n"
        "  - name: jei\n"
        "    side: client\n"
        "  - name: biomes-o-plenty\n");

    auto manifest = load_yaml_manifest(dir / "pack.yaml");
    REQUIRE(manifest.version == "1.12.2");
    REQUIRE(manifest.imports.empty());
    REQUIRE(manifest.mods.size() == 3);
    // sorted by name
    REQUIRE(manifest.mods[0].name == "biomes-o-plenty");
    REQUIRE(manifest.mods[1].name == "jei");
    REQUIRE(manifest.mods[2].name == "journeymap");
    // The importing manifest's entry wins.
    REQUIRE(manifest.mods[1].side == some(mod_side::CLIENT));
}

TEST_CASE("YAML manifest import cycles", "[manifest][yaml]")
{
    auto dir = make_test_directory("yaml_import_cycles");
    dump_string_to_file(
        dir / "a.yaml", "version: 1.12.2\nimports: [b.yaml]\nmods: []\n");
    dump_string_to_file(
        dir / "b.yaml", "version: 1.12.2\nimports: [a.yaml]\nmods: []\n");

    REQUIRE_THROWS_AS(
        load_yaml_manifest(dir / "a.yaml"), manifest_import_cycle);
}
