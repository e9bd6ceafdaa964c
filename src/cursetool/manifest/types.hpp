#ifndef CURSETOOL_MANIFEST_TYPES_HPP
#define CURSETOOL_MANIFEST_TYPES_HPP

#include <cursetool/curse/types.hpp>

namespace cursetool {

// CURSE MANIFESTS - the manifest.json that the catalog's launcher exports

struct curse_manifest_file
{
    project_id project = 0;
    file_id file = 0;
    bool required = true;
};

struct curse_manifest
{
    // the version of Minecraft that the pack is for
    string minecraft_version;
    std::vector<curse_manifest_file> files;
};

// YAML MANIFESTS - the human-editable intermediate form

// which side(s) of the game a mod is installed on
enum class mod_side
{
    CLIENT,
    SERVER,
    BOTH
};

string
side_name(mod_side side);

// This throws a parsing_error if :name isn't "client", "server" or "both".
mod_side
parse_side(string const& name);

// A file specification within a YAML manifest.
// Omitted fields are filled in from the catalog when the manifest is
// resolved.
struct yaml_mod_file
{
    optional<string> name;
    optional<file_id> id;
    // the least mature release that's acceptable (when picking a file)
    optional<file_maturity> maturity;
    optional<string> file_page_url;
    // If this is given, the file is downloaded directly from here rather
    // than being looked up in the catalog.
    optional<string> src;
    // If this is given, the downloaded file must match it.
    optional<string> md5;
};

struct yaml_mod
{
    // the mod's slug in the catalog
    string name;
    optional<mod_side> side;
    optional<bool> required;
    optional<bool> default_;
    optional<std::vector<yaml_mod_file>> files;
};

struct yaml_manifest
{
    string version;
    // other manifests (relative to this one) whose mods are included
    std::vector<string> imports;
    std::vector<yaml_mod> mods;
};

// NIX MANIFESTS - the fully resolved form

struct nix_mod_entry
{
    string title;
    string name;
    // These are omitted for files that come directly from a URL.
    optional<project_id> id;
    optional<file_id> file;
    mod_side side = mod_side::BOTH;
    bool required = true;
    bool default_ = true;
    string filename;
    optional<string> page;
    string src;
    string md5;
    string sha256;
    integer size = 0;
};

} // namespace cursetool

#endif
