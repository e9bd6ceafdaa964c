#include <cursetool/manifest/curse.h>

#include <cursetool/fs/file_io.h>

namespace cursetool {

static curse_manifest_file
parse_curse_manifest_file(json const& j)
{
    curse_manifest_file file;
    file.project = get_json_field<project_id>(j, "projectID");
    file.file = get_json_field<file_id>(j, "fileID");
    file.required = get_optional_json_field<bool>(j, "required").value_or(true);
    return file;
}

curse_manifest
parse_curse_manifest(json const& j)
{
    curse_manifest manifest;
    manifest.minecraft_version = get_json_field<string>(
        get_json_field<json>(j, "minecraft"), "version");
    auto const files = get_json_field<json>(j, "files");
    if (!files.is_array())
    {
        CURSETOOL_THROW(
            json_structure_error()
            << json_field_name_info("files")
            << internal_error_message_info("expected an array"));
    }
    for (auto const& file : files)
        manifest.files.push_back(parse_curse_manifest_file(file));
    return manifest;
}

curse_manifest
read_curse_manifest(file_path const& path)
{
    return parse_curse_manifest(parse_json_value(read_file_contents(path)));
}

} // namespace cursetool
