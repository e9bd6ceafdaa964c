#ifndef CURSETOOL_FS_TYPES_HPP
#define CURSETOOL_FS_TYPES_HPP

#include <filesystem>

#include <cursetool/core.h>

namespace cursetool {

// (file_path is slightly incorrect because the path could also refer to a
// directory, but it's a lot easier to read.)
typedef std::filesystem::path file_path;

} // namespace cursetool

#endif
