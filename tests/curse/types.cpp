#include <cursetool/curse/types.hpp>

#include <cursetool/utilities/testing.h>

using namespace cursetool;

TEST_CASE("mod file parsing", "[curse][types]")
{
    auto file = from_json_value<mod_file>(parse_json_value(R"(
        {
            "id": 2916041,
            "modId": 224476,
            "displayName": "Hunger Overhaul 1.12.2",
            "fileName": "HungerOverhaul-1.12.2.jar",
            "releaseType": 2,
            "fileDate": "2020-04-05T10:11:12.5Z",
            "fileLength": 123456,
            "downloadUrl": null,
            "gameVersions": ["1.12.2", "Forge"],
            "hashes": [{"value": "abc", "algo": 2}]
        }
    )"));
    REQUIRE(file.id == 2916041);
    REQUIRE(file.mod_id == 224476);
    REQUIRE(file.maturity == file_maturity::BETA);
    REQUIRE(file.file_length == 123456);
    REQUIRE(file.download_url == none);
    REQUIRE(file.game_versions == std::vector<string>{"1.12.2", "Forge"});

    // Without a download URL, the CDN's layout is used.
    REQUIRE(
        get_download_url(file)
        == "https://media.forgecdn.net/files/2916/41/"
           "HungerOverhaul-1.12.2.jar");

    file.download_url
        = "https://edge.forgecdn.net/files/2916/41/Hunger Overhaul.jar";
    REQUIRE(
        get_download_url(file)
        == "https://media.forgecdn.net/files/2916/41/Hunger%20Overhaul.jar");
}

TEST_CASE("malformed mod files", "[curse][types]")
{
    REQUIRE_THROWS_AS(
        from_json_value<mod_file>(parse_json_value(R"({"id": 1})")),
        json_structure_error);

    try
    {
        from_json_value<mod_file>(parse_json_value(R"(
            {
                "id": 1,
                "modId": 2,
                "displayName": "x",
                "fileName": "x.jar",
                "releaseType": 7,
                "fileDate": "2020-01-01T00:00:00Z",
                "fileLength": 1
            }
        )"));
        FAIL("no exception thrown");
    }
    catch (json_structure_error& e)
    {
        REQUIRE(
            get_required_error_info<json_field_name_info>(e) == "releaseType");
    }
}

TEST_CASE("maturity names", "[curse][types]")
{
    for (auto maturity :
         {file_maturity::RELEASE, file_maturity::BETA, file_maturity::ALPHA})
    {
        REQUIRE(parse_maturity(maturity_name(maturity)) == maturity);
    }
    REQUIRE(maturity_name(file_maturity::BETA) == "beta");
    REQUIRE_THROWS_AS(parse_maturity("stable"), parsing_error);
}

TEST_CASE("mod file info serialization", "[curse][types]")
{
    mod_file_info info;
    info.md5 = "d41d8cd98f00b204e9800998ecf8427e";
    info.sha256
        = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
    info.size = 0;
    info.download_url = "https://media.forgecdn.net/files/1/2/a.jar";

    auto j = parse_json_value(value_to_json(json(info)));
    REQUIRE(j["md5"] == info.md5);
    REQUIRE(j["size"] == 0);

    auto parsed = from_json_value<mod_file_info>(j);
    REQUIRE(parsed.sha256 == info.sha256);
    REQUIRE(parsed.download_url == info.download_url);
}
