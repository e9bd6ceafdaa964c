#ifndef CURSETOOL_MANIFEST_NIX_H
#define CURSETOOL_MANIFEST_NIX_H

#include <cursetool/manifest/types.hpp>

namespace cursetool {

// Quote a string as a Nix string literal.
string
nix_string_literal(string const& text);

// Write a Nix manifest: an attribute set with one attribute per mod (named
// after the mod), in the order given.
string
write_nix_manifest(std::vector<nix_mod_entry> const& entries);

} // namespace cursetool

#endif
