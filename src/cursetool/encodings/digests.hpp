#ifndef CURSETOOL_ENCODINGS_DIGESTS_HPP
#define CURSETOOL_ENCODINGS_DIGESTS_HPP

#include <cursetool/core.h>

// Content digests, as lowercase hexadecimal strings.

namespace cursetool {

string
md5_hex_digest(string const& data);

string
sha256_hex_digest(string const& data);

} // namespace cursetool

#endif
