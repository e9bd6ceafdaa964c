#include <cursetool/curse/api.h>

#include <regex>

#include <boost/lexical_cast.hpp>

#include <fmt/format.h>

#include <spdlog/spdlog.h>

#include <cursetool/core/logging.hpp>
#include <cursetool/encodings/digests.hpp>

namespace cursetool {

namespace {

template<class Operation>
auto
with_fetch_context(string const& context, Operation&& operation)
{
    return with_error_info(
        fetch_context_info(context), std::forward<Operation>(operation));
}

http_header_list
make_api_headers(curse_session const& session)
{
    return {{"x-api-key", session.api_key}, {"Accept", "application/json"}};
}

bool
is_markup_type(string const& media_type)
{
    return media_type.find("html") != string::npos
           || media_type.find("xml") != string::npos;
}

// Markup responses are error pages (or the like) rather than the data that
// was asked for. Catching them here keeps them out of the cache.
void
check_not_markup(http_request const& request, http_response const& response)
{
    auto media_type = get_content_type(response);
    if (media_type && is_markup_type(*media_type))
    {
        CURSETOOL_THROW(
            unexpected_content_type()
            << content_type_info(*media_type)
            << attempted_http_request_info(redact_request(request)));
    }
}

string
checked_body(http_request const& request, http_response response)
{
    check_not_markup(request, response);
    return std::move(response.body);
}

json
fetch_json(service_core& service, http_request const& request)
{
    return parse_json_value(
        cached_http_request(service, request, default_ttl, checked_body));
}

string
make_api_url(curse_session const& session, string const& path)
{
    return session.api_url + "/v1" + path;
}

} // namespace

addon_info
request_addon_info(
    service_core& service, curse_session const& session, project_id id)
{
    CURSETOOL_LOG_CALL(<< CURSETOOL_LOG_ARG(id))
    return with_fetch_context(
        fmt::format("fetching addon info for project id {}", id), [&] {
            auto request = make_get_request(
                make_api_url(session, fmt::format("/mods/{}", id)),
                make_api_headers(session));
            return from_json_value<addon_info>(get_json_field<json>(
                fetch_json(service, request), "data"));
        });
}

std::vector<mod_file>
request_mod_files(
    service_core& service,
    curse_session const& session,
    project_id id,
    optional<string> const& game_version)
{
    CURSETOOL_LOG_CALL(<< CURSETOOL_LOG_ARG(id))
    return with_fetch_context(
        fmt::format("fetching files for project id {}", id), [&] {
            std::vector<mod_file> files;
            integer index = 0;
            while (true)
            {
                http_query query;
                if (game_version)
                    query.emplace_back("gameVersion", *game_version);
                query.emplace_back("index", boost::lexical_cast<string>(index));
                query.emplace_back(
                    "pageSize", boost::lexical_cast<string>(mod_files_page_size));
                auto request = make_get_request(
                    make_api_url(session, fmt::format("/mods/{}/files", id)),
                    make_api_headers(session),
                    query);

                auto page = fetch_json(service, request);
                auto pagination
                    = get_optional_json_field<json>(page, "pagination");
                if (!pagination)
                {
                    CURSETOOL_THROW(
                        missing_pagination_info()
                        << page_url_info(request.url));
                }
                auto result_count
                    = get_json_field<integer>(*pagination, "resultCount");
                if (result_count == 0)
                    break;

                for (auto const& file : get_json_field<json>(page, "data"))
                    files.push_back(from_json_value<mod_file>(file));

                index += result_count;
                auto total_count
                    = get_optional_json_field<integer>(*pagination, "totalCount");
                if (total_count && index >= *total_count)
                    break;
            }
            return files;
        });
}

mod_file
request_mod_file(
    service_core& service,
    curse_session const& session,
    project_id project,
    file_id file)
{
    CURSETOOL_LOG_CALL(<< CURSETOOL_LOG_ARG(project) << CURSETOOL_LOG_ARG(file))
    return with_fetch_context(
        fmt::format("fetching file {} of project id {}", file, project), [&] {
            auto request = make_get_request(
                make_api_url(
                    session, fmt::format("/mods/{}/files/{}", project, file)),
                make_api_headers(session));
            return from_json_value<mod_file>(get_json_field<json>(
                fetch_json(service, request), "data"));
        });
}

addon_info
search_addon_by_slug(
    service_core& service, curse_session const& session, string const& slug)
{
    CURSETOOL_LOG_CALL(<< CURSETOOL_LOG_ARG(slug))
    return with_fetch_context(
        fmt::format("searching for project with slug {}", slug), [&] {
            auto request = make_get_request(
                make_api_url(session, "/mods/search"),
                make_api_headers(session),
                {{"gameId", boost::lexical_cast<string>(session.game_id)},
                 {"classId", boost::lexical_cast<string>(minecraft_mods_class_id)},
                 {"slug", slug}});
            auto results
                = get_json_field<json>(fetch_json(service, request), "data");
            // The search is fuzzy, so only an exact match counts.
            for (auto const& result : results)
            {
                auto info = from_json_value<addon_info>(result);
                if (info.slug == slug)
                    return info;
            }
            CURSETOOL_THROW(slug_not_found() << slug_info(slug));
        });
}

mod_file_info
request_mod_file_info(service_core& service, string const& download_url)
{
    CURSETOOL_LOG_CALL(<< CURSETOOL_LOG_ARG(download_url))
    auto url = fix_download_url(download_url);
    return with_fetch_context(fmt::format("downloading {}", url), [&] {
        auto payload = cached_http_request(
            service,
            make_get_request(url, {}),
            infinite_ttl,
            [&](http_request const& request, http_response response) {
                auto body = checked_body(request, std::move(response));
                spdlog::get("cursetool")
                    ->info("downloaded {} ({} bytes)", url, body.size());
                mod_file_info info;
                info.md5 = md5_hex_digest(body);
                info.sha256 = sha256_hex_digest(body);
                info.size = integer(body.size());
                info.download_url = url;
                return value_to_json(json(info));
            });
        return from_json_value<mod_file_info>(parse_json_value(payload));
    });
}

string
get_slug_from_webpage_url(string const& url)
{
    static std::regex const slug_pattern(".*/([^/]+)/?$");
    std::smatch match;
    if (!std::regex_match(url, match, slug_pattern))
    {
        CURSETOOL_THROW(
            parsing_error() << expected_format_info("project webpage URL")
                            << parsed_text_info(url));
    }
    return match[1].str();
}

} // namespace cursetool
