#ifndef CURSETOOL_CURSE_API_H
#define CURSETOOL_CURSE_API_H

#include <cursetool/curse/types.hpp>
#include <cursetool/service/core.h>

// This file provides the operations for querying the mod catalog. Every
// operation goes through the service's response cache, so repeated queries
// within the TTL don't touch the network.

namespace cursetool {

// Any failure within one of these operations is labelled with the logical
// operation that was being performed (e.g., "fetching files for project id
// 224476").
CURSETOOL_DEFINE_ERROR_INFO(string, fetch_context)

// This exception indicates that the server responded with a document of the
// wrong kind (e.g., an HTML error page where JSON or a binary file was
// expected).
CURSETOOL_DEFINE_EXCEPTION(unexpected_content_type)
CURSETOOL_DEFINE_ERROR_INFO(string, content_type)
// This exception also provides attempted_http_request_info.

// This exception indicates that a page of a paginated listing didn't say
// where it was in the listing.
CURSETOOL_DEFINE_EXCEPTION(missing_pagination_info)
CURSETOOL_DEFINE_ERROR_INFO(string, page_url)

// This exception indicates that no project in the catalog has the given slug.
CURSETOOL_DEFINE_EXCEPTION(slug_not_found)
CURSETOOL_DEFINE_ERROR_INFO(string, slug)

// the number of files requested per page when listing a project's files
inline constexpr integer mod_files_page_size = 50;

// Get the catalog's information about a project.
addon_info
request_addon_info(
    service_core& service, curse_session const& session, project_id id);

// Get all the files published for a project. If :game_version is given,
// only files for that version of the game are listed.
std::vector<mod_file>
request_mod_files(
    service_core& service,
    curse_session const& session,
    project_id id,
    optional<string> const& game_version = none);

// Get a single file of a project.
mod_file
request_mod_file(
    service_core& service,
    curse_session const& session,
    project_id project,
    file_id file);

// Find the project with the given slug.
addon_info
search_addon_by_slug(
    service_core& service, curse_session const& session, string const& slug);

// Download a file and compute its hashes and size.
// The URL is fixed (via fix_download_url()) before it's used. Since published
// files don't change, the result is cached indefinitely.
mod_file_info
request_mod_file_info(service_core& service, string const& download_url);

// Get a project's slug from its webpage URL (i.e., the last path segment).
// This throws a parsing_error if the URL doesn't have one.
string
get_slug_from_webpage_url(string const& url);

} // namespace cursetool

#endif
