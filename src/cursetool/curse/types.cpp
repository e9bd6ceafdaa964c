#include <cursetool/curse/types.hpp>

#include <fmt/format.h>

#include <cursetool/io/url.hpp>

namespace cursetool {

void
from_json(json const& j, addon_info& x)
{
    x.id = get_json_field<project_id>(j, "id");
    x.name = get_json_field<string>(j, "name");
    x.slug = get_json_field<string>(j, "slug");
    auto const links = get_json_field<json>(j, "links");
    x.website_url = get_json_field<string>(links, "websiteUrl");
}

string
maturity_name(file_maturity maturity)
{
    switch (maturity)
    {
        case file_maturity::RELEASE:
        default:
            return "release";
        case file_maturity::BETA:
            return "beta";
        case file_maturity::ALPHA:
            return "alpha";
    }
}

file_maturity
parse_maturity(string const& name)
{
    if (name == "release")
        return file_maturity::RELEASE;
    if (name == "beta")
        return file_maturity::BETA;
    if (name == "alpha")
        return file_maturity::ALPHA;
    CURSETOOL_THROW(
        parsing_error() << expected_format_info("file maturity")
                        << parsed_text_info(name));
}

static file_maturity
maturity_from_release_type(integer release_type)
{
    switch (release_type)
    {
        case 1:
            return file_maturity::RELEASE;
        case 2:
            return file_maturity::BETA;
        case 3:
            return file_maturity::ALPHA;
        default:
            CURSETOOL_THROW(
                json_structure_error()
                << json_field_name_info("releaseType")
                << internal_error_message_info(
                       fmt::format("unknown release type {}", release_type)));
    }
}

void
from_json(json const& j, mod_file& x)
{
    x.id = get_json_field<file_id>(j, "id");
    x.mod_id = get_json_field<project_id>(j, "modId");
    x.display_name = get_json_field<string>(j, "displayName");
    x.file_name = get_json_field<string>(j, "fileName");
    x.maturity
        = maturity_from_release_type(get_json_field<integer>(j, "releaseType"));
    x.file_date = get_json_field<string>(j, "fileDate");
    x.file_length = get_json_field<integer>(j, "fileLength");
    x.download_url = get_optional_json_field<string>(j, "downloadUrl");
    x.game_versions = get_optional_json_field<std::vector<string>>(
                          j, "gameVersions")
                          .value_or(std::vector<string>());
}

string
get_download_url(mod_file const& file)
{
    if (file.download_url)
        return fix_download_url(*file.download_url);
    return fix_download_url(fmt::format(
        "https://edge.forgecdn.net/files/{}/{}/{}",
        file.id / 1000,
        file.id % 1000,
        file.file_name));
}

void
from_json(json const& j, mod_file_info& x)
{
    x.md5 = get_json_field<string>(j, "md5");
    x.sha256 = get_json_field<string>(j, "sha256");
    x.size = get_json_field<integer>(j, "size");
    x.download_url = get_json_field<string>(j, "download_url");
}

void
to_json(json& j, mod_file_info const& x)
{
    j = json{
        {"md5", x.md5},
        {"sha256", x.sha256},
        {"size", x.size},
        {"download_url", x.download_url}};
}

} // namespace cursetool
