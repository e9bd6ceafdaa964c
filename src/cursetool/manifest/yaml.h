#ifndef CURSETOOL_MANIFEST_YAML_H
#define CURSETOOL_MANIFEST_YAML_H

#include <cursetool/encodings/yaml.hpp>
#include <cursetool/fs/types.hpp>
#include <cursetool/manifest/types.hpp>

namespace cursetool {

yaml_manifest
parse_yaml_manifest(YAML::Node const& node);

YAML::Node
yaml_manifest_to_node(yaml_manifest const& manifest);

// Write a manifest in its YAML form. Fields that aren't set are omitted.
string
write_yaml_manifest(yaml_manifest const& manifest);

// Read a manifest file exactly as it's written (i.e., without processing its
// imports).
yaml_manifest
read_yaml_manifest(file_path const& path);

// This exception indicates that a manifest (directly or indirectly) imports
// itself.
CURSETOOL_DEFINE_EXCEPTION(manifest_import_cycle)
CURSETOOL_DEFINE_ERROR_INFO(file_path, import_path)

// Read a manifest file and merge in the mods from all the manifests that it
// imports (recursively). Import paths are relative to the importing file.
// When two manifests list a mod with the same name, the importing manifest's
// entry wins. The result has no imports and its mods are sorted by name.
yaml_manifest
load_yaml_manifest(file_path const& path);

} // namespace cursetool

#endif
