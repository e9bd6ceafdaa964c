#ifndef CURSETOOL_CORE_TYPE_DEFINITIONS_HPP
#define CURSETOOL_CORE_TYPE_DEFINITIONS_HPP

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <boost/optional.hpp>

namespace cursetool {

using std::string;

using boost::none;
using boost::noncopyable;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

// Numeric IDs used by the catalog for projects (addons) and their files.
typedef uint32_t project_id;
typedef uint32_t file_id;

} // namespace cursetool

#endif
