#ifndef CURSETOOL_FS_APP_DIRS_HPP
#define CURSETOOL_FS_APP_DIRS_HPP

#include <vector>

#include <cursetool/fs/types.hpp>

// This file provides utilities for resolving directory locations according to
// the XDG Base Directory conventions.

namespace cursetool {

// Get the directory that should be used to store user-specific configuration
// files. If the directory doesn't already exist, it is created.
file_path
get_user_config_dir(string const& app_name);

// Get the full path of directories that should be searched for configuration
// files. (This may include system-wide configuration directories that are
// read-only to the user.)
//
// Since this is for read-only purposes, directories are only returned if they
// already exist (specifically for this app).
//
std::vector<file_path>
get_config_search_path(string const& app_name);

// Get the directory that should be used for user-specific caching.
// If the directory doesn't already exist, it is created.
file_path
get_user_cache_dir(string const& app_name);

// Given a search path and a relative path to a configuration file (or
// directory) that the application wants to read, this will scan the search
// path and return the full path to the first place it's found.
optional<file_path>
search_in_path(
    std::vector<file_path> const& search_path, file_path const& item);

} // namespace cursetool

#endif
