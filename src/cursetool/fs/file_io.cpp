#include <cursetool/fs/file_io.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include <cursetool/utilities/errors.h>

namespace cursetool {

template<class Stream>
static void
open_stream(Stream& file, file_path const& path, std::ios::openmode mode)
{
    file.open(path.c_str(), mode);
    if (!file)
    {
        CURSETOOL_THROW(
            open_file_error() << file_path_info(path)
                              << internal_error_message_info(
                                     std::strerror(errno)));
    }
    file.exceptions(std::ios::failbit | std::ios::badbit);
}

string
read_file_contents(file_path const& path)
{
    std::ifstream in;
    open_stream(in, path, std::ios::in | std::ios::binary);
    string contents;
    in.seekg(0, std::ios::end);
    contents.resize(static_cast<size_t>(in.tellg()));
    in.seekg(0, std::ios::beg);
    if (!contents.empty())
        in.read(&contents[0], static_cast<std::streamsize>(contents.size()));
    return contents;
}

void
dump_string_to_file(file_path const& path, string const& contents)
{
    auto temporary = path;
    temporary += ".tmp";
    {
        std::ofstream output;
        open_stream(
            output,
            temporary,
            std::ios::out | std::ios::trunc | std::ios::binary);
        output << contents;
    }
    std::error_code error;
    std::filesystem::rename(temporary, path, error);
    if (error)
    {
        std::filesystem::remove(temporary, error);
        CURSETOOL_THROW(
            open_file_error() << file_path_info(path)
                              << internal_error_message_info(
                                     "unable to move the written file into "
                                     "place"));
    }
}

} // namespace cursetool
