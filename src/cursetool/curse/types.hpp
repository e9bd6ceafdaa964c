#ifndef CURSETOOL_CURSE_TYPES_HPP
#define CURSETOOL_CURSE_TYPES_HPP

#include <cursetool/encodings/json.hpp>

namespace cursetool {

// the game ID that the catalog uses for Minecraft
inline constexpr integer minecraft_game_id = 432;

// the catalog class ID for Minecraft mods (as opposed to modpacks, worlds,
// etc.)
inline constexpr integer minecraft_mods_class_id = 6;

// the public endpoint of the catalog API
inline char const* const default_curse_api_url = "https://api.curseforge.com";

// everything needed to talk to the catalog API
struct curse_session
{
    string api_url = default_curse_api_url;
    string api_key;
    integer game_id = minecraft_game_id;
};

struct addon_info
{
    project_id id = 0;
    string name;
    string slug;
    // the project's page on the catalog website
    string website_url;
};

void
from_json(json const& j, addon_info& x);

// how mature (stable) a published file is
enum class file_maturity
{
    RELEASE = 1,
    BETA = 2,
    ALPHA = 3
};

// Get the YAML/CLI name of a maturity level ("release", "beta" or "alpha").
string
maturity_name(file_maturity maturity);

// Parse the name of a maturity level.
// This throws a parsing_error if :name isn't a valid level.
file_maturity
parse_maturity(string const& name);

struct mod_file
{
    file_id id = 0;
    project_id mod_id = 0;
    string display_name;
    string file_name;
    file_maturity maturity = file_maturity::RELEASE;
    // ISO 8601 timestamp of when the file was published
    string file_date;
    integer file_length = 0;
    // This is omitted by the API for projects that disable third-party
    // distribution.
    optional<string> download_url;
    std::vector<string> game_versions;
};

void
from_json(json const& j, mod_file& x);

// Get the URL from which a file can be downloaded. (If the API omitted it,
// this falls back to the CDN's conventional layout.) The result is always
// passed through fix_download_url().
string
get_download_url(mod_file const& file);

// the information that can only be obtained by downloading a file
struct mod_file_info
{
    string md5;
    string sha256;
    integer size = 0;
    string download_url;
};

void
from_json(json const& j, mod_file_info& x);
void
to_json(json& j, mod_file_info const& x);

} // namespace cursetool

#endif
