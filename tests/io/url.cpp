#include <cursetool/io/url.hpp>

#include <cursetool/utilities/testing.h>

using namespace cursetool;

TEST_CASE("form URL encoding", "[io][url]")
{
    REQUIRE(form_urlencode("abcXYZ019") == "abcXYZ019");
    REQUIRE(form_urlencode("*-._") == "*-._");
    REQUIRE(form_urlencode("a b") == "a+b");
    REQUIRE(form_urlencode("1.12.2/forge") == "1.12.2%2Fforge");
    REQUIRE(form_urlencode("a+b&c=d") == "a%2Bb%26c%3Dd");
    REQUIRE(form_urlencode("~") == "%7E");
    REQUIRE(form_urlencode("\xc3\xa9") == "%C3%A9");
}

TEST_CASE("percent decoding", "[io][url]")
{
    REQUIRE(percent_decode("a%20b") == "a b");
    REQUIRE(percent_decode("%2b%2B") == "++");
    // Incomplete or invalid escapes are left alone.
    REQUIRE(percent_decode("100%") == "100%");
    REQUIRE(percent_decode("%zz") == "%zz");
    REQUIRE(percent_decode("%4") == "%4");
}

TEST_CASE("URL parsing", "[io][url]")
{
    auto parts = parse_url("HTTPS://API.Example.com/v1/mods?index=0#top");
    REQUIRE(parts.scheme == "https");
    REQUIRE(parts.host == "api.example.com");
    REQUIRE(parts.path == "/v1/mods");
    REQUIRE(parts.query == some(string("index=0")));
    REQUIRE(to_string(parts) == "https://api.example.com/v1/mods?index=0");

    auto bare = parse_url("https://example.com");
    REQUIRE(bare.path == "/");
    REQUIRE(bare.query == none);

    REQUIRE_THROWS_AS(parse_url("example.com/path"), invalid_url);
    REQUIRE_THROWS_AS(parse_url("https:///path"), invalid_url);
}

TEST_CASE("request URL resolution", "[io][url]")
{
    REQUIRE(
        resolve_request_url(
            "https://api.curseforge.com/v1/mods/search",
            {{"gameId", "432"}, {"slug", "hunger overhaul"}})
        == "https://api.curseforge.com/v1/mods/search"
           "?gameId=432&slug=hunger+overhaul");

    // Parameters are appended to any existing query in the order given.
    REQUIRE(
        resolve_request_url("https://Example.com/a?x=1", {{"y", "2"}})
        == "https://example.com/a?x=1&y=2");

    // Equivalent requests resolve to identical strings.
    REQUIRE(
        resolve_request_url("HTTPS://EXAMPLE.COM", {})
        == resolve_request_url("https://example.com/", {}));
}

TEST_CASE("host alias normalization", "[io][url]")
{
    REQUIRE(
        normalize_host_alias("https://edge.forgecdn.net/files/2/3/a.jar")
        == "https://media.forgecdn.net/files/2/3/a.jar");
    REQUIRE(
        normalize_host_alias("https://media.forgecdn.net/files/2/3/a.jar")
        == "https://media.forgecdn.net/files/2/3/a.jar");
    REQUIRE(
        normalize_host_alias("https://example.com/files/a.jar")
        == "https://example.com/files/a.jar");
}

TEST_CASE("download URL fixing", "[io][url]")
{
    // Filenames are re-encoded, including '+'.
    REQUIRE(
        fix_download_url(
            "https://edge.forgecdn.net/files/2916/41/Hunger Overhaul+1.jar")
        == "https://media.forgecdn.net/files/2916/41/"
           "Hunger%20Overhaul%2B1.jar");

    // Already-encoded names come out the same way.
    REQUIRE(
        fix_download_url(
            "https://media.forgecdn.net/files/2916/41/Hunger%20Overhaul%2b1.jar")
        == "https://media.forgecdn.net/files/2916/41/"
           "Hunger%20Overhaul%2B1.jar");

    // Fixing is idempotent.
    auto fixed = fix_download_url(
        "https://edge.forgecdn.net/files/1/2/jei_1.12.2-4.16.1.301.jar");
    REQUIRE(fix_download_url(fixed) == fixed);
}

TEST_CASE("last path segment", "[io][url]")
{
    REQUIRE(
        get_last_path_segment("https://example.com/files/1/2/a%20b.jar?x=1")
        == "a%20b.jar");
    REQUIRE(get_last_path_segment("https://example.com") == "");
}
