#ifndef CURSETOOL_CACHING_RESPONSE_CACHE_HPP
#define CURSETOOL_CACHING_RESPONSE_CACHE_HPP

#include <chrono>
#include <functional>
#include <memory>

#include <cursetool/fs/types.hpp>

namespace cursetool {

// A response cache stores the results of remote queries on the local hard
// drive to avoid redownloading them.

// The cache is a single SQLite database file with one row per request key.
// Each row records when its value was fetched. Entries are never removed;
// instead, staleness is evaluated whenever an entry is read, against a
// time-to-live supplied by the reader. (So the same key may be considered
// fresh by one caller and stale by another.)

// The cache is internally protected by a mutex, so it can be used concurrently
// from multiple threads. It assumes that no other process writes to the same
// database file.

struct response_cache_config
{
    // the directory where cache.db is stored - If this is omitted, the
    // cursetool directory within the user's cache directory is used.
    optional<string> directory;

    // If this is set, the database lives entirely in memory and nothing is
    // written to disk. (This is mostly useful for testing.)
    bool in_memory = false;
};

struct response_cache_entry
{
    // the request key (usually a full URL)
    string key;

    // the cached value
    string payload;

    // when the value was computed (in whole seconds since the Unix epoch)
    integer fetched_at;
};

// This exception indicates a failure in the operation of the response cache.
CURSETOOL_DEFINE_EXCEPTION(response_cache_failure)
// This provides the path to the database file (if any).
CURSETOOL_DEFINE_ERROR_INFO(file_path, response_cache_path)
// This exception also provides internal_error_message_info.

// A response_computer is invoked to produce the value for a key when the cache
// doesn't have a fresh one. Failures are reported by throwing.
typedef std::function<string()> response_computer;

// Common time-to-live values.
// Metadata and listings may change, so they're refetched daily.
inline constexpr std::chrono::seconds default_ttl = std::chrono::hours(24);
// Published file contents are assumed to never change.
inline constexpr std::chrono::seconds infinite_ttl
    = std::chrono::hours(24 * 365);

// Get the current time in the representation used by the cache.
integer
get_cache_time_now();

struct response_cache_impl;

struct response_cache : noncopyable
{
    // The default constructor creates an invalid cache that must be
    // initialized via reset().
    response_cache();

    // Create a cache that's initialized with the given config.
    response_cache(response_cache_config const& config);

    ~response_cache();

    // Reset the cache with a new config.
    // After a successful call to this, the cache is considered initialized.
    void
    reset(response_cache_config const& config);

    // Reset the cache to an uninitialized state.
    void
    reset();

    // Is the cache initialized?
    bool
    is_initialized() const
    {
        return impl_ ? true : false;
    }

    // The rest of this interface should only be used if is_initialized()
    // returns true.

    // Get the value associated with :key if it was fetched less than :ttl
    // ago. Otherwise, invoke :compute, store its result (timestamped with the
    // time at which it completed) and return it.
    //
    // If :compute throws, nothing is stored and the exception propagates
    // unchanged.
    //
    // :compute is never invoked while the database is locked, so a slow
    // computation doesn't block lookups of other keys. Concurrent calls for
    // the same key are coalesced: while one caller is computing, others
    // wait for it and then see its result.
    //
    string
    get_or_put(
        string const& key,
        std::chrono::seconds ttl,
        response_computer const& compute);

    // Look up the entry for :key, regardless of its age.
    optional<response_cache_entry>
    find(string const& key);

    // Store a value for :key with an explicit fetch time, replacing any
    // existing entry.
    void
    insert(string const& key, string const& payload, integer fetched_at);

    // Get the number of entries in the cache.
    integer
    entry_count();

    // Get the path to the database file. This is none for in-memory caches.
    optional<file_path>
    database_file() const;

 private:
    std::unique_ptr<response_cache_impl> impl_;
};

} // namespace cursetool

#endif
