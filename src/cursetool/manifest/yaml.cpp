#include <cursetool/manifest/yaml.h>

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

#include <cursetool/fs/file_io.h>

namespace cursetool {

static yaml_mod_file
parse_yaml_mod_file(YAML::Node const& node)
{
    yaml_mod_file file;
    file.name = get_optional_yaml_field<string>(node, "name");
    file.id = get_optional_yaml_field<file_id>(node, "id");
    auto maturity = get_optional_yaml_field<string>(node, "maturity");
    if (maturity)
        file.maturity = parse_maturity(*maturity);
    file.file_page_url = get_optional_yaml_field<string>(node, "filePageUrl");
    file.src = get_optional_yaml_field<string>(node, "src");
    file.md5 = get_optional_yaml_field<string>(node, "md5");
    return file;
}

static yaml_mod
parse_yaml_mod(YAML::Node const& node)
{
    yaml_mod mod;
    mod.name = get_yaml_field<string>(node, "name");
    auto side = get_optional_yaml_field<string>(node, "side");
    if (side)
        mod.side = parse_side(*side);
    mod.required = get_optional_yaml_field<bool>(node, "required");
    mod.default_ = get_optional_yaml_field<bool>(node, "default");
    auto files = node["files"];
    if (files && !files.IsNull())
    {
        if (!files.IsSequence())
        {
            CURSETOOL_THROW(
                yaml_structure_error()
                << yaml_field_name_info("files")
                << internal_error_message_info("expected a list"));
        }
        std::vector<yaml_mod_file> parsed;
        for (auto const& file : files)
            parsed.push_back(parse_yaml_mod_file(file));
        mod.files = std::move(parsed);
    }
    return mod;
}

yaml_manifest
parse_yaml_manifest(YAML::Node const& node)
{
    yaml_manifest manifest;
    manifest.version = get_yaml_field<string>(node, "version");
    manifest.imports
        = get_optional_yaml_field<std::vector<string>>(node, "imports")
              .value_or(std::vector<string>());
    auto mods = node["mods"];
    if (mods && !mods.IsNull())
    {
        if (!mods.IsSequence())
        {
            CURSETOOL_THROW(
                yaml_structure_error()
                << yaml_field_name_info("mods")
                << internal_error_message_info("expected a list"));
        }
        for (auto const& mod : mods)
            manifest.mods.push_back(parse_yaml_mod(mod));
    }
    return manifest;
}

static YAML::Node
yaml_mod_file_to_node(yaml_mod_file const& file)
{
    YAML::Node node(YAML::NodeType::Map);
    if (file.name)
        node["name"] = *file.name;
    if (file.id)
        node["id"] = *file.id;
    if (file.maturity)
        node["maturity"] = maturity_name(*file.maturity);
    if (file.file_page_url)
        node["filePageUrl"] = *file.file_page_url;
    if (file.src)
        node["src"] = *file.src;
    if (file.md5)
        node["md5"] = *file.md5;
    return node;
}

static YAML::Node
yaml_mod_to_node(yaml_mod const& mod)
{
    YAML::Node node(YAML::NodeType::Map);
    node["name"] = mod.name;
    if (mod.side)
        node["side"] = side_name(*mod.side);
    if (mod.required)
        node["required"] = *mod.required;
    if (mod.default_)
        node["default"] = *mod.default_;
    if (mod.files)
    {
        YAML::Node files(YAML::NodeType::Sequence);
        for (auto const& file : *mod.files)
            files.push_back(yaml_mod_file_to_node(file));
        node["files"] = files;
    }
    return node;
}

YAML::Node
yaml_manifest_to_node(yaml_manifest const& manifest)
{
    YAML::Node node(YAML::NodeType::Map);
    node["version"] = manifest.version;
    YAML::Node imports(YAML::NodeType::Sequence);
    for (auto const& path : manifest.imports)
        imports.push_back(path);
    node["imports"] = imports;
    YAML::Node mods(YAML::NodeType::Sequence);
    for (auto const& mod : manifest.mods)
        mods.push_back(yaml_mod_to_node(mod));
    node["mods"] = mods;
    return node;
}

string
write_yaml_manifest(yaml_manifest const& manifest)
{
    return value_to_yaml(yaml_manifest_to_node(manifest));
}

yaml_manifest
read_yaml_manifest(file_path const& path)
{
    return parse_yaml_manifest(parse_yaml_value(read_file_contents(path)));
}

// Merge the mods of the manifest at :path (and its imports) into :mods.
// :active_paths holds the manifests that are currently being merged.
// This returns the manifest's game version.
static string
merge_yaml_manifest(
    std::map<string, yaml_mod>& mods,
    std::set<file_path>& active_paths,
    file_path const& path)
{
    auto canonical = std::filesystem::weakly_canonical(path);
    if (active_paths.count(canonical))
        CURSETOOL_THROW(manifest_import_cycle() << import_path_info(path));
    active_paths.insert(canonical);

    auto manifest = read_yaml_manifest(path);
    for (auto const& import : manifest.imports)
    {
        spdlog::get("cursetool")
            ->debug("importing {} from {}", import, path.string());
        merge_yaml_manifest(
            mods, active_paths, path.parent_path() / file_path(import));
    }
    for (auto& mod : manifest.mods)
        mods.insert_or_assign(mod.name, std::move(mod));

    active_paths.erase(canonical);
    return manifest.version;
}

yaml_manifest
load_yaml_manifest(file_path const& path)
{
    std::map<string, yaml_mod> mods;
    std::set<file_path> active_paths;
    yaml_manifest merged;
    merged.version = merge_yaml_manifest(mods, active_paths, path);
    for (auto& [name, mod] : mods)
        merged.mods.push_back(std::move(mod));
    return merged;
}

} // namespace cursetool
