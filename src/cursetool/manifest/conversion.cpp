#include <cursetool/manifest/conversion.h>

#include <algorithm>
#include <exception>
#include <tuple>

#include <boost/algorithm/string/case_conv.hpp>

#include <fmt/format.h>

#include <cppcoro/sync_wait.hpp>
#include <cppcoro/task.hpp>
#include <cppcoro/when_all.hpp>

#include <spdlog/spdlog.h>

#include <cursetool/core/logging.hpp>
#include <cursetool/fs/file_io.h>
#include <cursetool/manifest/curse.h>
#include <cursetool/manifest/nix.h>
#include <cursetool/manifest/yaml.h>

namespace cursetool {

namespace {

template<class Result>
struct resolution
{
    optional<Result> value;
    std::exception_ptr error;
};

template<class Result, class Item, class Resolve>
cppcoro::task<resolution<Result>>
resolve_item(Item const& item, Resolve const& resolve)
{
    resolution<Result> result;
    try
    {
        result.value = resolve(item);
    }
    catch (std::exception& e)
    {
        spdlog::get("cursetool")->error("{}", e.what());
        result.error = std::current_exception();
    }
    co_return result;
}

// Resolve each of :items with :resolve, running them all in parallel on the
// service's worker pool. Failures are handled according to :options.
template<class Result, class Item, class Resolve>
std::vector<Result>
resolve_all(
    service_core& service,
    std::vector<Item> const& items,
    Resolve const& resolve,
    conversion_options const& options)
{
    std::vector<cppcoro::task<resolution<Result>>> tasks;
    tasks.reserve(items.size());
    for (auto const& item : items)
    {
        tasks.push_back(
            on_worker_pool(service, resolve_item<Result>(item, resolve)));
    }
    auto resolutions = cppcoro::sync_wait(cppcoro::when_all(std::move(tasks)));

    std::vector<Result> results;
    std::exception_ptr first_error;
    size_t failure_count = 0;
    for (auto& resolution : resolutions)
    {
        if (resolution.value)
        {
            results.push_back(std::move(*resolution.value));
        }
        else
        {
            ++failure_count;
            if (!first_error)
                first_error = resolution.error;
        }
    }
    if (failure_count != 0)
    {
        if (!options.skip_failures)
            std::rethrow_exception(first_error);
        spdlog::get("cursetool")
            ->warn("skipped {} mod(s) that couldn't be resolved", failure_count);
    }
    return results;
}

} // namespace

yaml_mod
generate_yaml_mod_entry(
    service_core& service,
    curse_session const& session,
    curse_manifest_file const& file)
{
    spdlog::get("cursetool")
        ->debug(
            "fetching data for file {} in project {}",
            file.file,
            file.project);
    auto addon = request_addon_info(service, session, file.project);
    yaml_mod mod;
    mod.name = get_slug_from_webpage_url(addon.website_url);
    if (!file.required)
        mod.required = false;
    yaml_mod_file mod_file;
    mod_file.id = file.file;
    mod.files = std::vector<yaml_mod_file>{mod_file};
    return mod;
}

yaml_manifest
generate_yaml_from_curse(
    service_core& service,
    curse_session const& session,
    curse_manifest const& manifest,
    conversion_options const& options)
{
    yaml_manifest yaml;
    yaml.version = manifest.minecraft_version;
    yaml.mods = resolve_all<yaml_mod>(
        service,
        manifest.files,
        [&](curse_manifest_file const& file) {
            return generate_yaml_mod_entry(service, session, file);
        },
        options);
    std::ranges::sort(yaml.mods, {}, &yaml_mod::name);
    return yaml;
}

mod_file
select_newest_file(
    std::vector<mod_file> const& files,
    string const& game_version,
    file_maturity least_mature)
{
    mod_file const* newest = nullptr;
    for (auto const& file : files)
    {
        if (static_cast<int>(file.maturity) > static_cast<int>(least_mature))
            continue;
        // The listing may not say which versions a file is for, in which case
        // the listing's own filtering has to be trusted.
        if (!file.game_versions.empty()
            && std::ranges::find(file.game_versions, game_version)
                   == file.game_versions.end())
        {
            continue;
        }
        // ISO 8601 timestamps sort chronologically as strings.
        if (!newest
            || std::tie(file.file_date, file.id)
                   > std::tie(newest->file_date, newest->id))
        {
            newest = &file;
        }
    }
    if (!newest)
    {
        CURSETOOL_THROW(
            no_matching_file() << game_version_info(game_version));
    }
    return *newest;
}

static void
check_md5(yaml_mod_file const& spec, mod_file_info const& info)
{
    if (spec.md5 && boost::algorithm::to_lower_copy(*spec.md5) != info.md5)
    {
        CURSETOOL_THROW(
            md5_mismatch() << expected_md5_info(*spec.md5)
                           << actual_md5_info(info.md5)
                           << url_info(info.download_url));
    }
}

static nix_mod_entry
resolve_direct_entry(
    service_core& service, yaml_mod const& mod, yaml_mod_file const& spec)
{
    auto info = request_mod_file_info(service, *spec.src);
    check_md5(spec, info);
    nix_mod_entry entry;
    entry.title = mod.name;
    entry.file = spec.id;
    entry.filename = spec.name
                         ? *spec.name
                         : percent_decode(
                             get_last_path_segment(info.download_url));
    entry.page = spec.file_page_url;
    entry.src = info.download_url;
    entry.md5 = info.md5;
    entry.sha256 = info.sha256;
    entry.size = info.size;
    return entry;
}

static nix_mod_entry
resolve_catalog_entry(
    service_core& service,
    curse_session const& session,
    yaml_mod const& mod,
    yaml_mod_file const& spec,
    string const& game_version)
{
    auto addon = search_addon_by_slug(service, session, mod.name);
    mod_file file;
    if (spec.id)
    {
        file = request_mod_file(service, session, addon.id, *spec.id);
    }
    else
    {
        try
        {
            file = select_newest_file(
                request_mod_files(service, session, addon.id, game_version),
                game_version,
                spec.maturity ? *spec.maturity : file_maturity::RELEASE);
        }
        catch (no_matching_file& e)
        {
            e << slug_info(mod.name);
            throw;
        }
    }
    auto info = request_mod_file_info(service, get_download_url(file));
    check_md5(spec, info);

    nix_mod_entry entry;
    entry.title = addon.name;
    entry.id = addon.id;
    entry.file = file.id;
    entry.filename = file.file_name;
    entry.page = spec.file_page_url
                     ? *spec.file_page_url
                     : fmt::format("{}/files/{}", addon.website_url, file.id);
    entry.src = info.download_url;
    entry.md5 = info.md5;
    entry.sha256 = info.sha256;
    entry.size = info.size;
    return entry;
}

nix_mod_entry
resolve_nix_entry(
    service_core& service,
    curse_session const& session,
    yaml_mod const& mod,
    string const& game_version)
{
    CURSETOOL_LOG_CALL(<< CURSETOOL_LOG_ARG(mod.name))
    try
    {
        // A mod resolves to a single file. Without a file specification, it
        // gets the newest release for the game version.
        yaml_mod_file spec;
        if (mod.files && !mod.files->empty())
        {
            spec = mod.files->front();
            if (mod.files->size() > 1)
            {
                spdlog::get("cursetool")
                    ->warn(
                        "{} lists {} files; only the first is used",
                        mod.name,
                        mod.files->size());
            }
        }

        auto entry
            = spec.src ? resolve_direct_entry(service, mod, spec)
                       : resolve_catalog_entry(
                           service, session, mod, spec, game_version);
        entry.name = mod.name;
        entry.side = mod.side ? *mod.side : mod_side::BOTH;
        entry.required = mod.required ? *mod.required : true;
        entry.default_ = mod.default_ ? *mod.default_ : true;
        return entry;
    }
    catch (boost::exception& e)
    {
        e << mod_name_info(mod.name);
        throw;
    }
}

std::vector<nix_mod_entry>
generate_nix_from_yaml(
    service_core& service,
    curse_session const& session,
    yaml_manifest const& manifest,
    conversion_options const& options)
{
    return resolve_all<nix_mod_entry>(
        service,
        manifest.mods,
        [&](yaml_mod const& mod) {
            return resolve_nix_entry(service, session, mod, manifest.version);
        },
        options);
}

void
convert_curse_to_yaml(
    service_core& service,
    curse_session const& session,
    file_path const& curse_manifest_path,
    file_path const& yaml_manifest_path,
    conversion_options const& options)
{
    auto logger = spdlog::get("cursetool");
    logger->info("reading manifest...");
    auto manifest = read_curse_manifest(curse_manifest_path);
    logger->info("found {} mods in Curse manifest", manifest.files.size());
    auto yaml = generate_yaml_from_curse(service, session, manifest, options);
    logger->info("writing manifest...");
    dump_string_to_file(yaml_manifest_path, write_yaml_manifest(yaml));
    logger->info("successfully wrote {}", yaml_manifest_path.string());
}

void
convert_yaml_to_nix(
    service_core& service,
    curse_session const& session,
    file_path const& yaml_manifest_path,
    file_path const& nix_manifest_path,
    conversion_options const& options)
{
    auto logger = spdlog::get("cursetool");
    logger->info("reading manifest...");
    auto manifest = load_yaml_manifest(yaml_manifest_path);
    logger->info("found {} mods in YAML manifest", manifest.mods.size());
    auto entries = generate_nix_from_yaml(service, session, manifest, options);
    logger->info("writing manifest...");
    dump_string_to_file(nix_manifest_path, write_nix_manifest(entries));
    logger->info("successfully wrote {}", nix_manifest_path.string());
}

} // namespace cursetool
