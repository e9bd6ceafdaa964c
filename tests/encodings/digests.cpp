#include <cursetool/encodings/digests.hpp>

#include <cursetool/utilities/testing.h>

using namespace cursetool;

TEST_CASE("MD5 digests", "[encodings][digests]")
{
    REQUIRE(md5_hex_digest("") == "d41d8cd98f00b204e9800998ecf8427e");
    REQUIRE(
        md5_hex_digest("The quick brown fox jumps over the lazy dog")
        == "9e107d9d372bb6826bd81d3542a419d6");
}

TEST_CASE("SHA-256 digests", "[encodings][digests]")
{
    REQUIRE(
        sha256_hex_digest("")
        == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(
        sha256_hex_digest("abc")
        == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
