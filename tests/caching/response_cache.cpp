#include <cursetool/caching/response_cache.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

#include <cursetool/utilities/testing.h>

using namespace cursetool;

namespace {

response_cache_config
in_memory_config()
{
    response_cache_config config;
    config.in_memory = true;
    return config;
}

} // namespace

TEST_CASE("response cache initialization", "[caching][response_cache]")
{
    response_cache cache;
    REQUIRE(!cache.is_initialized());

    cache.reset(in_memory_config());
    REQUIRE(cache.is_initialized());
    REQUIRE(cache.database_file() == none);
    REQUIRE(cache.entry_count() == 0);

    cache.reset();
    REQUIRE(!cache.is_initialized());
}

TEST_CASE("response cache miss then hit", "[caching][response_cache]")
{
    response_cache cache(in_memory_config());

    int compute_count = 0;
    auto compute = [&] {
        ++compute_count;
        return string("payload");
    };

    REQUIRE(cache.get_or_put("k", default_ttl, compute) == "payload");
    REQUIRE(compute_count == 1);
    REQUIRE(cache.get_or_put("k", default_ttl, compute) == "payload");
    REQUIRE(compute_count == 1);
    REQUIRE(cache.entry_count() == 1);
}

TEST_CASE("response cache freshness", "[caching][response_cache]")
{
    response_cache cache(in_memory_config());
    auto now = get_cache_time_now();

    // An entry from 10 seconds ago is fresh with a 60-second TTL.
    cache.insert("k", "v", now - 10);
    bool computed = false;
    auto result
        = cache.get_or_put("k", std::chrono::seconds(60), [&] {
              computed = true;
              return string("new");
          });
    REQUIRE(result == "v");
    REQUIRE(!computed);
}

TEST_CASE("response cache staleness", "[caching][response_cache]")
{
    response_cache cache(in_memory_config());
    auto now = get_cache_time_now();

    // An entry from 120 seconds ago is stale with a 60-second TTL.
    cache.insert("k", "v", now - 120);
    int compute_count = 0;
    auto result
        = cache.get_or_put("k", std::chrono::seconds(60), [&] {
              ++compute_count;
              return string("new");
          });
    REQUIRE(result == "new");
    REQUIRE(compute_count == 1);

    // The recomputed value replaced the old one and got a new timestamp.
    auto entry = cache.find("k");
    REQUIRE(entry);
    REQUIRE(entry->payload == "new");
    REQUIRE(entry->fetched_at >= now);
    REQUIRE(cache.entry_count() == 1);

    // The same entry can still be fresh for a reader with a longer TTL.
    cache.insert("old", "v", now - 120);
    REQUIRE(
        cache.get_or_put("old", std::chrono::seconds(3600), [] {
            return string("unused");
        })
        == "v");
}

TEST_CASE("response cache TTL boundary", "[caching][response_cache]")
{
    response_cache cache(in_memory_config());
    auto now = get_cache_time_now();

    // An entry that's exactly as old as the TTL is already stale.
    cache.insert("k", "old", now - 60);
    int compute_count = 0;
    auto result
        = cache.get_or_put("k", std::chrono::seconds(60), [&] {
              ++compute_count;
              return string("new");
          });
    REQUIRE(result == "new");
    REQUIRE(compute_count == 1);
}

TEST_CASE("response cache upserts", "[caching][response_cache]")
{
    response_cache cache(in_memory_config());

    cache.insert("k", "a", 100);
    cache.insert("k", "a", 100);
    REQUIRE(cache.entry_count() == 1);

    cache.insert("k", "b", 200);
    REQUIRE(cache.entry_count() == 1);
    auto entry = cache.find("k");
    REQUIRE(entry);
    REQUIRE(entry->key == "k");
    REQUIRE(entry->payload == "b");
    REQUIRE(entry->fetched_at == 200);

    REQUIRE(cache.find("missing") == none);
}

TEST_CASE("response cache compute failures", "[caching][response_cache]")
{
    response_cache cache(in_memory_config());

    // A failing computation doesn't create an entry.
    REQUIRE_THROWS_AS(
        cache.get_or_put(
            "k",
            default_ttl,
            []() -> string { throw std::runtime_error("offline"); }),
        std::runtime_error);
    REQUIRE(cache.find("k") == none);
    REQUIRE(cache.entry_count() == 0);

    // So the next reader computes it again.
    int compute_count = 0;
    REQUIRE(
        cache.get_or_put(
            "k",
            default_ttl,
            [&] {
                ++compute_count;
                return string("ok");
            })
        == "ok");
    REQUIRE(compute_count == 1);
    REQUIRE(cache.find("k")->payload == "ok");

    // And it doesn't disturb an existing (stale) entry.
    cache.insert("stale", "old", 0);
    REQUIRE_THROWS_AS(
        cache.get_or_put(
            "stale",
            default_ttl,
            []() -> string { throw std::runtime_error("offline"); }),
        std::runtime_error);
    auto entry = cache.find("stale");
    REQUIRE(entry);
    REQUIRE(entry->payload == "old");
    REQUIRE(entry->fetched_at == 0);
}

TEST_CASE("response cache persistence", "[caching][response_cache]")
{
    auto dir = make_test_directory("response_cache_persistence");

    response_cache_config config;
    config.directory = dir.string();
    {
        response_cache cache(config);
        REQUIRE(cache.database_file() == some(dir / "cache.db"));
        cache.get_or_put("https://example.com/a", default_ttl, [] {
            return string("body");
        });
    }
    REQUIRE(exists(dir / "cache.db"));
    {
        response_cache cache(config);
        REQUIRE(cache.entry_count() == 1);
        REQUIRE(
            cache.get_or_put(
                "https://example.com/a",
                default_ttl,
                []() -> string { throw std::runtime_error("not cached"); })
            == "body");
    }
}

TEST_CASE("response cache open failure", "[caching][response_cache]")
{
    auto dir = make_test_directory("response_cache_open_failure");
    // Occupy the database's path with a directory.
    create_directory_if_needed(dir / "cache.db");

    response_cache_config config;
    config.directory = dir.string();
    response_cache cache;
    try
    {
        cache.reset(config);
        FAIL("no exception thrown");
    }
    catch (response_cache_failure& e)
    {
        REQUIRE(
            get_required_error_info<response_cache_path_info>(e)
            == dir / "cache.db");
    }
    REQUIRE(!cache.is_initialized());
}

TEST_CASE("response cache coalesces concurrent misses", "[caching][response_cache]")
{
    response_cache cache(in_memory_config());

    std::atomic<int> compute_count = 0;
    auto compute = [&] {
        ++compute_count;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return string("shared");
    };

    std::vector<std::thread> threads;
    std::vector<string> results(8);
    for (size_t i = 0; i != results.size(); ++i)
    {
        threads.emplace_back([&, i] {
            results[i] = cache.get_or_put("k", default_ttl, compute);
        });
    }
    for (auto& thread : threads)
        thread.join();

    REQUIRE(compute_count == 1);
    for (auto const& result : results)
        REQUIRE(result == "shared");
}

TEST_CASE("response cache keys don't block each other", "[caching][response_cache]")
{
    response_cache cache(in_memory_config());

    // While one key is being computed, another key can be looked up.
    std::atomic<bool> release = false;
    std::atomic<bool> started = false;
    std::thread slow([&] {
        cache.get_or_put("slow", default_ttl, [&] {
            started = true;
            while (!release)
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            return string("slow");
        });
    });
    while (!started)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    REQUIRE(
        cache.get_or_put("fast", default_ttl, [] { return string("fast"); })
        == "fast");

    release = true;
    slow.join();
    REQUIRE(cache.entry_count() == 2);
}
