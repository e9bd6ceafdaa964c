#ifndef CURSETOOL_CONFIG_HPP
#define CURSETOOL_CONFIG_HPP

#include <cursetool/curse/types.hpp>
#include <cursetool/fs/types.hpp>
#include <cursetool/service/types.hpp>

namespace cursetool {

struct tool_config : service_config
{
    // the base URL of the catalog API (defaults to the public one)
    optional<string> api_url;
    // the key for the catalog API - The CURSE_API_KEY environment variable
    // takes precedence over this.
    optional<string> api_key;
    // the catalog's ID for the game (defaults to Minecraft)
    optional<integer> game_id;
};

// Read a config from its JSON form. All fields are optional:
// {
//   "api_url": "https://api.curseforge.com",
//   "api_key": "...",
//   "cache_directory": "/var/cache/cursetool",
//   "worker_count": 4,
//   "game_id": 432
// }
tool_config
parse_tool_config(json const& j);

// Load the config file at :path if one is given. Otherwise, look for
// config.json in the config search path, and fall back to the defaults if
// there isn't one.
tool_config
load_tool_config(optional<file_path> const& path);

// This exception indicates that no catalog API key could be found.
CURSETOOL_DEFINE_EXCEPTION(missing_api_key)

// Get the catalog API key. It's taken from (in order of preference) the
// CURSE_API_KEY environment variable, the config, or a file named api_key in
// the config search path.
string
resolve_api_key(tool_config const& config);

// Make a catalog session from the config.
curse_session
make_curse_session(tool_config const& config);

} // namespace cursetool

#endif
