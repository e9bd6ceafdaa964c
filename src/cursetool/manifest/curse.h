#ifndef CURSETOOL_MANIFEST_CURSE_H
#define CURSETOOL_MANIFEST_CURSE_H

#include <cursetool/fs/types.hpp>
#include <cursetool/manifest/types.hpp>

namespace cursetool {

// Read a Curse manifest from its JSON form. Fields other than the game
// version and the file list are ignored.
curse_manifest
parse_curse_manifest(json const& j);

curse_manifest
read_curse_manifest(file_path const& path);

} // namespace cursetool

#endif
