#include <cursetool/caching/response_cache.hpp>

#include <map>
#include <mutex>

#include <boost/numeric/conversion/cast.hpp>

#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <cursetool/fs/app_dirs.hpp>
#include <cursetool/fs/utilities.h>
#include <cursetool/utilities/errors.h>

namespace cursetool {

namespace {

// Callers that are currently working on a particular key hold that key's
// lock. The lock is discarded when the last interested caller is done.
struct key_lock
{
    std::mutex mutex;
    int users = 0;
};

} // namespace

struct response_cache_impl
{
    optional<file_path> file;

    sqlite3* db = nullptr;

    // prepared statements
    sqlite3_stmt* fresh_entry_query = nullptr;
    sqlite3_stmt* entry_query = nullptr;
    sqlite3_stmt* upsert_statement = nullptr;
    sqlite3_stmt* entry_count_query = nullptr;

    // protects all access to the database
    std::mutex mutex;

    // protects key_locks
    std::mutex key_locks_mutex;
    std::map<string, std::shared_ptr<key_lock>> key_locks;
};

integer
get_cache_time_now()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// SQLITE UTILITIES

static void
throw_cache_failure(response_cache_impl const& cache, string const& message)
{
    auto failure = response_cache_failure()
                   << internal_error_message_info(message);
    if (cache.file)
        failure << response_cache_path_info(*cache.file);
    CURSETOOL_THROW(failure);
}

static string
copy_and_free_message(char* msg)
{
    if (msg)
    {
        string s = msg;
        sqlite3_free(msg);
        return s;
    }
    else
        return "";
}

static void
execute_sql(response_cache_impl const& cache, string const& sql)
{
    char* msg = nullptr;
    int code = sqlite3_exec(cache.db, sql.c_str(), nullptr, nullptr, &msg);
    string error = copy_and_free_message(msg);
    if (code != SQLITE_OK)
    {
        throw_cache_failure(
            cache,
            "error executing SQL query in cache.db\n"
            "SQL query: "
                + sql + "\nerror: " + error);
    }
}

// Check a return code from SQLite.
static void
check_sqlite_code(response_cache_impl const& cache, int code)
{
    if (code != SQLITE_OK)
        throw_cache_failure(cache, string("SQLite error: ") + sqlite3_errstr(code));
}

// Create a prepared statement.
// This checks to make sure that the creation was successful, so the returned
// pointer is always valid.
static sqlite3_stmt*
prepare_statement(response_cache_impl const& cache, string const& sql)
{
    sqlite3_stmt* statement = nullptr;
    auto code = sqlite3_prepare_v2(
        cache.db,
        sql.c_str(),
        boost::numeric_cast<int>(sql.length()),
        &statement,
        nullptr);
    if (code != SQLITE_OK)
    {
        throw_cache_failure(
            cache,
            "error preparing SQL query\n"
            "SQL query: "
                + sql + "\nerror: " + sqlite3_errmsg(cache.db));
    }
    return statement;
}

static void
bind_int64(
    response_cache_impl const& cache,
    sqlite3_stmt* statement,
    int parameter_index,
    int64_t value)
{
    check_sqlite_code(
        cache, sqlite3_bind_int64(statement, parameter_index, value));
}

// The string must outlive the execution of the statement.
static void
bind_string(
    response_cache_impl const& cache,
    sqlite3_stmt* statement,
    int parameter_index,
    string const& value)
{
    check_sqlite_code(
        cache,
        sqlite3_bind_text64(
            statement,
            parameter_index,
            value.c_str(),
            value.size(),
            SQLITE_STATIC,
            SQLITE_UTF8));
}

// Prepared statements are shared, so they have to be returned to their
// initial state no matter how their execution ends.
struct scoped_statement_reset
{
    ~scoped_statement_reset()
    {
        sqlite3_reset(statement);
        sqlite3_clear_bindings(statement);
    }
    sqlite3_stmt* statement;
};

struct sqlite_row
{
    sqlite3_stmt* statement;
};

static int64_t
read_int64(sqlite_row& row, int column_index)
{
    return sqlite3_column_int64(row.statement, column_index);
}

static string
read_string(
    response_cache_impl const& cache, sqlite_row& row, int column_index)
{
    auto text = sqlite3_column_text(row.statement, column_index);
    if (!text)
    {
        if (sqlite3_errcode(cache.db) == SQLITE_NOMEM)
            throw_cache_failure(cache, "out of memory reading cache entry");
        throw_cache_failure(cache, "cache entry contains a NULL value");
    }
    return string(
        reinterpret_cast<char const*>(text),
        boost::numeric_cast<size_t>(
            sqlite3_column_bytes(row.statement, column_index)));
}

// Execute a prepared statement (with variables already bound to it) and check
// that it finished successfully.
// This should only be used for statements that don't return results.
static void
execute_prepared_statement(
    response_cache_impl const& cache, sqlite3_stmt* statement)
{
    scoped_statement_reset reset{statement};
    auto code = sqlite3_step(statement);
    if (code != SQLITE_DONE)
    {
        throw_cache_failure(
            cache,
            string("SQL query failed\nerror: ") + sqlite3_errmsg(cache.db));
    }
}

// Execute a prepared statement (with variables already bound to it), pass all
// the rows from the result set into the supplied callback, and check that the
// query finishes successfully.
struct expected_column_count
{
    int value;
};
template<class RowHandler>
static void
execute_prepared_query(
    response_cache_impl const& cache,
    sqlite3_stmt* statement,
    expected_column_count expected_columns,
    RowHandler const& row_handler)
{
    scoped_statement_reset reset{statement};
    int code;
    while ((code = sqlite3_step(statement)) == SQLITE_ROW)
    {
        if (sqlite3_column_count(statement) != expected_columns.value)
            throw_cache_failure(cache, "SQL query result column count incorrect");
        sqlite_row row{statement};
        row_handler(row);
    }
    if (code != SQLITE_DONE)
    {
        throw_cache_failure(
            cache,
            string("SQL query failed\nerror: ") + sqlite3_errmsg(cache.db));
    }
}

// QUERIES

// Get the entry for :key if it was fetched after :cutoff.
static optional<string>
look_up_fresh(
    response_cache_impl const& cache, string const& key, integer cutoff)
{
    optional<string> payload;
    bind_string(cache, cache.fresh_entry_query, 1, key);
    bind_int64(cache, cache.fresh_entry_query, 2, cutoff);
    execute_prepared_query(
        cache,
        cache.fresh_entry_query,
        expected_column_count{1},
        [&](sqlite_row& row) { payload = read_string(cache, row, 0); });
    return payload;
}

static optional<response_cache_entry>
look_up(response_cache_impl const& cache, string const& key)
{
    optional<response_cache_entry> entry;
    bind_string(cache, cache.entry_query, 1, key);
    execute_prepared_query(
        cache,
        cache.entry_query,
        expected_column_count{2},
        [&](sqlite_row& row) {
            entry = response_cache_entry{
                key, read_string(cache, row, 0), read_int64(row, 1)};
        });
    return entry;
}

static void
upsert(
    response_cache_impl const& cache,
    string const& key,
    string const& payload,
    integer fetched_at)
{
    bind_string(cache, cache.upsert_statement, 1, key);
    bind_string(cache, cache.upsert_statement, 2, payload);
    bind_int64(cache, cache.upsert_statement, 3, fetched_at);
    execute_prepared_statement(cache, cache.upsert_statement);
}

static integer
get_entry_count(response_cache_impl const& cache)
{
    integer count = 0;
    execute_prepared_query(
        cache,
        cache.entry_count_query,
        expected_column_count{1},
        [&](sqlite_row& row) { count = read_int64(row, 0); });
    return count;
}

// KEY LOCKS

struct scoped_key_lock : noncopyable
{
    scoped_key_lock(response_cache_impl& cache, string const& key)
        : cache_(cache), key_(key)
    {
        {
            std::scoped_lock<std::mutex> lock(cache_.key_locks_mutex);
            auto& slot = cache_.key_locks[key_];
            if (!slot)
                slot = std::make_shared<key_lock>();
            ++slot->users;
            lock_ = slot;
        }
        lock_->mutex.lock();
    }

    ~scoped_key_lock()
    {
        lock_->mutex.unlock();
        std::scoped_lock<std::mutex> lock(cache_.key_locks_mutex);
        if (--lock_->users == 0)
            cache_.key_locks.erase(key_);
    }

 private:
    response_cache_impl& cache_;
    string key_;
    std::shared_ptr<key_lock> lock_;
};

// SETUP

static void
shut_down(response_cache_impl& cache)
{
    if (cache.db)
    {
        sqlite3_finalize(cache.fresh_entry_query);
        sqlite3_finalize(cache.entry_query);
        sqlite3_finalize(cache.upsert_statement);
        sqlite3_finalize(cache.entry_count_query);
        cache.fresh_entry_query = nullptr;
        cache.entry_query = nullptr;
        cache.upsert_statement = nullptr;
        cache.entry_count_query = nullptr;
        sqlite3_close(cache.db);
        cache.db = nullptr;
    }
}

static void
open_db(response_cache_impl& cache)
{
    string location = cache.file ? cache.file->string() : ":memory:";
    int code = sqlite3_open_v2(
        location.c_str(),
        &cache.db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
        nullptr);
    if (code != SQLITE_OK)
    {
        // Even on failure, SQLite usually allocates a handle that has to be
        // released.
        string error = cache.db ? sqlite3_errmsg(cache.db)
                                : sqlite3_errstr(code);
        sqlite3_close(cache.db);
        cache.db = nullptr;
        throw_cache_failure(cache, "failed to open cache.db: " + error);
    }
}

static void
initialize(response_cache_impl& cache, response_cache_config const& config)
{
    if (config.in_memory)
    {
        cache.file = none;
    }
    else
    {
        file_path dir = config.directory
                            ? file_path(*config.directory)
                            : get_user_cache_dir("cursetool");
        create_directory_if_needed(dir);
        cache.file = dir / "cache.db";
    }

    spdlog::get("cursetool")->info(
        "using response cache {}",
        cache.file ? cache.file->string() : string(":memory:"));

    open_db(cache);

    execute_sql(
        cache,
        "create table if not exists curse_queries("
        " url text primary key,"
        " result text not null,"
        " downloaded integer not null);");

    // Set various performance tuning flags.
    execute_sql(cache, "pragma synchronous = off;");
    execute_sql(cache, "pragma locking_mode = exclusive;");
    execute_sql(cache, "pragma journal_mode = memory;");

    // Initialize our prepared statements.
    cache.fresh_entry_query = prepare_statement(
        cache,
        "select result from curse_queries"
        " where url = ?1 and downloaded > ?2;");
    cache.entry_query = prepare_statement(
        cache, "select result, downloaded from curse_queries where url = ?1;");
    cache.upsert_statement = prepare_statement(
        cache,
        "insert or replace into curse_queries(url, result, downloaded)"
        " values(?1, ?2, ?3);");
    cache.entry_count_query
        = prepare_statement(cache, "select count(*) from curse_queries;");
}

// API

response_cache::response_cache()
{
}

response_cache::response_cache(response_cache_config const& config)
{
    this->reset(config);
}

response_cache::~response_cache()
{
    if (this->impl_)
        shut_down(*this->impl_);
}

void
response_cache::reset(response_cache_config const& config)
{
    this->reset();
    std::unique_ptr<response_cache_impl> impl(new response_cache_impl);
    try
    {
        initialize(*impl, config);
    }
    catch (...)
    {
        // Release whatever was opened before the failure and leave the cache
        // uninitialized.
        shut_down(*impl);
        throw;
    }
    this->impl_ = std::move(impl);
}

void
response_cache::reset()
{
    if (this->impl_)
        shut_down(*impl_);
    impl_.reset();
}

string
response_cache::get_or_put(
    string const& key,
    std::chrono::seconds ttl,
    response_computer const& compute)
{
    auto& cache = *this->impl_;

    scoped_key_lock key_lock(cache, key);

    {
        std::scoped_lock<std::mutex> lock(cache.mutex);
        // We accept previously fetched data that's no older than the TTL.
        auto cutoff = get_cache_time_now() - ttl.count();
        auto cached = look_up_fresh(cache, key, cutoff);
        if (cached)
        {
            spdlog::get("cursetool")->debug("cache hit on {}", key);
            return std::move(*cached);
        }
    }

    spdlog::get("cursetool")->debug("cache miss on {}", key);
    auto payload = compute();
    auto fetched_at = get_cache_time_now();

    {
        std::scoped_lock<std::mutex> lock(cache.mutex);
        upsert(cache, key, payload, fetched_at);
    }

    return payload;
}

optional<response_cache_entry>
response_cache::find(string const& key)
{
    auto& cache = *this->impl_;
    std::scoped_lock<std::mutex> lock(cache.mutex);
    return look_up(cache, key);
}

void
response_cache::insert(
    string const& key, string const& payload, integer fetched_at)
{
    auto& cache = *this->impl_;
    std::scoped_lock<std::mutex> lock(cache.mutex);
    upsert(cache, key, payload, fetched_at);
}

integer
response_cache::entry_count()
{
    auto& cache = *this->impl_;
    std::scoped_lock<std::mutex> lock(cache.mutex);
    return get_entry_count(cache);
}

optional<file_path>
response_cache::database_file() const
{
    return this->impl_->file;
}

} // namespace cursetool
