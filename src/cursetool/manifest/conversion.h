#ifndef CURSETOOL_MANIFEST_CONVERSION_H
#define CURSETOOL_MANIFEST_CONVERSION_H

#include <cursetool/curse/api.h>
#include <cursetool/fs/types.hpp>
#include <cursetool/manifest/types.hpp>

namespace cursetool {

struct conversion_options
{
    // If this is set, mods that can't be resolved are left out of the output
    // (with an error logged). Otherwise, the first failure aborts the
    // conversion.
    bool skip_failures = false;
};

// This is attached to any failure to resolve a mod.
CURSETOOL_DEFINE_ERROR_INFO(string, mod_name)

// This exception indicates that none of a project's files are suitable for
// the requested game version and maturity.
CURSETOOL_DEFINE_EXCEPTION(no_matching_file)
CURSETOOL_DEFINE_ERROR_INFO(string, game_version)
// This exception also provides slug_info.

// This exception indicates that a downloaded file didn't have the MD5 hash
// that its manifest said it should.
CURSETOOL_DEFINE_EXCEPTION(md5_mismatch)
CURSETOOL_DEFINE_ERROR_INFO(string, expected_md5)
CURSETOOL_DEFINE_ERROR_INFO(string, actual_md5)

// CURSE -> YAML

// Generate the YAML entry for a single file of a Curse manifest. The entry
// is named after the project's slug and pins the file ID.
yaml_mod
generate_yaml_mod_entry(
    service_core& service,
    curse_session const& session,
    curse_manifest_file const& file);

// Generate a YAML manifest from a Curse manifest. Mods are resolved in
// parallel and the result is sorted by name.
yaml_manifest
generate_yaml_from_curse(
    service_core& service,
    curse_session const& session,
    curse_manifest const& manifest,
    conversion_options const& options = conversion_options());

// YAML -> NIX

// Pick the newest of :files that's for :game_version and is at least as
// mature as :least_mature.
mod_file
select_newest_file(
    std::vector<mod_file> const& files,
    string const& game_version,
    file_maturity least_mature);

// Fully resolve one mod of a YAML manifest.
nix_mod_entry
resolve_nix_entry(
    service_core& service,
    curse_session const& session,
    yaml_mod const& mod,
    string const& game_version);

// Resolve all the mods in a YAML manifest (in parallel). Entries are in the
// same order as the manifest's mods.
std::vector<nix_mod_entry>
generate_nix_from_yaml(
    service_core& service,
    curse_session const& session,
    yaml_manifest const& manifest,
    conversion_options const& options = conversion_options());

// FILE-LEVEL CONVERSIONS

void
convert_curse_to_yaml(
    service_core& service,
    curse_session const& session,
    file_path const& curse_manifest_path,
    file_path const& yaml_manifest_path,
    conversion_options const& options = conversion_options());

// Imports in the YAML manifest are processed before conversion.
void
convert_yaml_to_nix(
    service_core& service,
    curse_session const& session,
    file_path const& yaml_manifest_path,
    file_path const& nix_manifest_path,
    conversion_options const& options = conversion_options());

} // namespace cursetool

#endif
