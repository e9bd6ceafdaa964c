#ifndef CURSETOOL_UTILITIES_TESTING_H
#define CURSETOOL_UTILITIES_TESTING_H

#include <catch2/catch.hpp>

#include <cursetool/fs/utilities.h>

namespace cursetool {

// Get a fresh (empty) directory for a test case to work in. It's located
// under the current directory and named after :name.
inline file_path
make_test_directory(string const& name)
{
    auto dir = std::filesystem::current_path() / "test_dirs" / name;
    create_directory_if_needed(dir.parent_path());
    reset_directory(dir);
    return dir;
}

} // namespace cursetool

namespace Catch {

// Catch would otherwise try to stream optionals directly, which Boost
// forbids.
template<class T>
struct StringMaker<boost::optional<T>>
{
    static std::string
    convert(boost::optional<T> const& value)
    {
        return value ? Catch::Detail::stringify(*value) : "none";
    }
};

} // namespace Catch

#endif
