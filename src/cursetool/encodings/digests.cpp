#include <cursetool/encodings/digests.hpp>

#include <boost/uuid/detail/md5.hpp>

#include <fmt/format.h>

#include <picosha2.h>

namespace cursetool {

string
md5_hex_digest(string const& data)
{
    boost::uuids::detail::md5 hasher;
    hasher.process_bytes(data.data(), data.size());
    boost::uuids::detail::md5::digest_type digest;
    hasher.get_digest(digest);
    // The digest holds the hash as a sequence of bytes, regardless of how
    // digest_type declares them.
    auto const* bytes = reinterpret_cast<unsigned char const*>(&digest);
    string hex;
    for (size_t i = 0; i != sizeof(digest); ++i)
        hex += fmt::format("{:02x}", bytes[i]);
    return hex;
}

string
sha256_hex_digest(string const& data)
{
    return picosha2::hash256_hex_string(data);
}

} // namespace cursetool
