#include <cursetool/config.hpp>

#include <boost/algorithm/string/trim.hpp>

#include <spdlog/spdlog.h>

#include <cursetool/fs/app_dirs.hpp>
#include <cursetool/fs/file_io.h>
#include <cursetool/utilities/environment.h>

namespace cursetool {

tool_config
parse_tool_config(json const& j)
{
    tool_config config;
    config.api_url = get_optional_json_field<string>(j, "api_url");
    config.api_key = get_optional_json_field<string>(j, "api_key");
    config.game_id = get_optional_json_field<integer>(j, "game_id");
    config.worker_count = get_optional_json_field<integer>(j, "worker_count");
    auto cache_directory
        = get_optional_json_field<string>(j, "cache_directory");
    if (cache_directory)
    {
        response_cache_config cache_config;
        cache_config.directory = cache_directory;
        config.response_cache = cache_config;
    }
    return config;
}

tool_config
load_tool_config(optional<file_path> const& path)
{
    auto config_path
        = path ? path
               : search_in_path(
                   get_config_search_path("cursetool"), "config.json");
    if (!config_path)
        return tool_config();
    spdlog::get("cursetool")->info("reading config {}", config_path->string());
    return parse_tool_config(
        parse_json_value(read_file_contents(*config_path)));
}

string
resolve_api_key(tool_config const& config)
{
    auto from_environment = get_optional_environment_variable("CURSE_API_KEY");
    if (from_environment)
        return *from_environment;
    if (config.api_key)
        return *config.api_key;
    auto key_file
        = search_in_path(get_config_search_path("cursetool"), "api_key");
    if (key_file)
        return boost::algorithm::trim_copy(read_file_contents(*key_file));
    CURSETOOL_THROW(missing_api_key());
}

curse_session
make_curse_session(tool_config const& config)
{
    curse_session session;
    if (config.api_url)
        session.api_url = *config.api_url;
    session.api_key = resolve_api_key(config);
    if (config.game_id)
        session.game_id = *config.game_id;
    return session;
}

} // namespace cursetool
