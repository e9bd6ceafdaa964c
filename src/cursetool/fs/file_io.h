#ifndef CURSETOOL_FS_FILE_IO_H
#define CURSETOOL_FS_FILE_IO_H

#include <cursetool/fs/types.hpp>

namespace cursetool {

// This exception indicates that a file couldn't be opened (or, for output
// files, moved into place).
CURSETOOL_DEFINE_EXCEPTION(open_file_error)
CURSETOOL_DEFINE_ERROR_INFO(file_path, file_path)
// This exception also provides internal_error_message_info.

// Get the contents of a file as a string.
string
read_file_contents(file_path const& path);

// Write a string to a file, replacing anything that might have been in it.
// The contents are written to a temporary file next to :path which is then
// renamed over it, so readers never see a partially written file.
void
dump_string_to_file(file_path const& path, string const& contents);

} // namespace cursetool

#endif
