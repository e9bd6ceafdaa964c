#include <cursetool/fs/utilities.h>

#include <system_error>

#include <cursetool/utilities/errors.h>

namespace cursetool {

void
reset_directory(file_path const& dir)
{
    if (exists(dir))
        remove_all(dir);
    create_directory_if_needed(dir);
}

void
create_directory_if_needed(file_path const& dir)
{
    std::error_code error;
    std::filesystem::create_directories(dir, error);
    if (error)
    {
        CURSETOOL_THROW(
            directory_creation_failure()
            << directory_path_info(dir)
            << internal_error_message_info(error.message()));
    }
}

} // namespace cursetool
