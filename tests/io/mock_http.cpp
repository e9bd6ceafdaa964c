#include <cursetool/io/mock_http.h>

#include <thread>

#include <cursetool/utilities/testing.h>

using namespace cursetool;

TEST_CASE("mock GET request", "[io][mock_http]")
{
    mock_http_session session;
    session.set_script(
        {{make_get_request(
              "https://api.example.com/v1/mods/1", http_header_list()),
          make_http_200_response(R"({"data": {"id": 1}})")},
         {make_get_request(
              "https://api.example.com/v1/mods/2", http_header_list()),
          make_http_200_response(R"({"data": {"id": 2}})")},
         {make_get_request(
              "https://api.example.com/v1/mods/3", http_header_list()),
          make_http_200_response(R"({"data": {"id": 3}})")}});

    REQUIRE(!session.is_complete());
    REQUIRE(session.is_in_order());

    mock_http_connection conn(session);

    REQUIRE(
        conn.perform_request(make_get_request(
            "https://api.example.com/v1/mods/1", http_header_list()))
        == make_http_200_response(R"({"data": {"id": 1}})"));
    REQUIRE(!session.is_complete());
    REQUIRE(session.is_in_order());

    REQUIRE(
        conn.perform_request(make_get_request(
            "https://api.example.com/v1/mods/3", http_header_list()))
        == make_http_200_response(R"({"data": {"id": 3}})"));
    REQUIRE(!session.is_complete());
    REQUIRE(!session.is_in_order());

    REQUIRE(
        conn.perform_request(make_get_request(
            "https://api.example.com/v1/mods/2", http_header_list()))
        == make_http_200_response(R"({"data": {"id": 2}})"));
    REQUIRE(session.is_complete());
    REQUIRE(!session.is_in_order());

    REQUIRE(session.request_count() == 3);
}

TEST_CASE("unrecognized mock request", "[io][mock_http]")
{
    mock_http_session session;
    mock_http_connection conn(session);

    auto request = make_get_request(
        "https://api.example.com/v1/mods/1", {{"x-api-key", "secret"}});
    try
    {
        conn.perform_request(request);
        FAIL("no exception thrown");
    }
    catch (unrecognized_mock_request& e)
    {
        // Credentials don't leak into error reports.
        auto const& attempted
            = get_required_error_info<attempted_http_request_info>(e);
        REQUIRE(attempted.url == request.url);
        REQUIRE(attempted.headers.at("x-api-key") == "[redacted]");
    }
    REQUIRE(session.request_count() == 1);
}

TEST_CASE("mock error responses", "[io][mock_http]")
{
    auto request
        = make_get_request("https://api.example.com/v1/mods/9", {});
    mock_http_session session(
        {{request, make_http_response(404, {}, "not found")}});
    mock_http_connection conn(session);

    try
    {
        conn.perform_request(request);
        FAIL("no exception thrown");
    }
    catch (bad_http_status_code& e)
    {
        REQUIRE(
            get_required_error_info<http_response_info>(e).status_code == 404);
    }
    REQUIRE(session.is_complete());
}

TEST_CASE("mock request concurrency tracking", "[io][mock_http]")
{
    mock_http_session session;
    for (int i = 0; i != 4; ++i)
    {
        session.add_exchange(
            make_get_request(
                "https://api.example.com/" + std::to_string(i), {}),
            make_http_200_response("ok"));
    }
    session.set_response_delay(std::chrono::milliseconds(50));

    std::vector<std::thread> threads;
    for (int i = 0; i != 4; ++i)
    {
        threads.emplace_back([&session, i] {
            mock_http_connection conn(session);
            conn.perform_request(make_get_request(
                "https://api.example.com/" + std::to_string(i), {}));
        });
    }
    for (auto& thread : threads)
        thread.join();

    REQUIRE(session.is_complete());
    REQUIRE(session.request_count() == 4);
    // Nothing serializes these requests, so they overlap.
    REQUIRE(session.max_concurrent_requests() > 1);
}
