#ifndef CURSETOOL_FS_UTILITIES_H
#define CURSETOOL_FS_UTILITIES_H

#include <cursetool/fs/types.hpp>

namespace cursetool {

// Remove everything inside :dir and make sure it exists as an empty directory.
void
reset_directory(file_path const& dir);

// Create :dir (and any missing parents) if it doesn't already exist.
void
create_directory_if_needed(file_path const& dir);

// If the above can't create the directory, this exception is thrown.
CURSETOOL_DEFINE_EXCEPTION(directory_creation_failure)
CURSETOOL_DEFINE_ERROR_INFO(file_path, directory_path)

} // namespace cursetool

#endif
