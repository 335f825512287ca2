#include "wx_gateway/account_store.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <sqlite3.h>

#include "wx_gateway/errors.hpp"

namespace wx_gateway {

namespace {
constexpr char k_create_accounts_sql[] =
    "CREATE TABLE IF NOT EXISTS accounts ("
    "  token TEXT PRIMARY KEY,"
    "  plan TEXT NOT NULL,"
    "  quota INTEGER,"
    "  active INTEGER NOT NULL DEFAULT 1"
    ");";

constexpr char k_create_usage_sql[] =
    "CREATE TABLE IF NOT EXISTS usage ("
    "  token TEXT NOT NULL,"
    "  window_start INTEGER NOT NULL,"
    "  count INTEGER NOT NULL,"
    "  PRIMARY KEY (token, window_start)"
    ");";

constexpr char k_select_account_sql[] = "SELECT plan, quota, active FROM accounts WHERE token = ?1;";

constexpr char k_upsert_account_sql[] =
    "INSERT INTO accounts (token, plan, quota, active) VALUES (?1, ?2, ?3, ?4) "
    "ON CONFLICT(token) DO UPDATE SET plan = excluded.plan, quota = excluded.quota, active = excluded.active;";

constexpr char k_increment_usage_sql[] =
    "INSERT INTO usage (token, window_start, count) VALUES (?1, ?2, 1) "
    "ON CONFLICT(token, window_start) DO UPDATE SET count = count + 1;";

constexpr char k_sum_usage_sql[] =
    "SELECT COALESCE(SUM(count), 0), MIN(window_start) FROM usage WHERE token = ?1 AND window_start >= ?2;";

constexpr char k_prune_usage_sql[] = "DELETE FROM usage WHERE token = ?1 AND window_start < ?2;";

constexpr char k_select_usage_sql[] = "SELECT count FROM usage WHERE token = ?1 AND window_start = ?2;";

constexpr char k_count_buckets_sql[] = "SELECT COUNT(*) FROM usage WHERE token = ?1;";

constexpr int k_busy_timeout_ms{5000};

std::int64_t to_epoch_ms(TimePoint time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

TimePoint from_epoch_ms(std::int64_t epoch_ms) {
    return TimePoint{std::chrono::duration_cast<WallClock::duration>(std::chrono::milliseconds{epoch_ms})};
}

/** @brief Owns a prepared statement for the duration of one query. */
class Statement final {
  public:
    Statement(sqlite3* database, const char* sql) {
        if (sqlite3_prepare_v2(database, sql, -1, &statement_, nullptr) != SQLITE_OK) {
            throw ServiceError(ErrorKind::ServiceUnavailable,
                               std::string("Account store prepare failed: ") + sqlite3_errmsg(database));
        }
    }
    ~Statement() {
        sqlite3_finalize(statement_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] sqlite3_stmt* get() const noexcept {
        return statement_;
    }

  private:
    sqlite3_stmt* statement_{nullptr};
};

void bind_text(sqlite3_stmt* statement, int index, const std::string& value) {
    sqlite3_bind_text(statement, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

/** @brief Run @p statement to completion; throws ServiceUnavailable on failure. */
void step_done(sqlite3* database, const Statement& statement, const char* action) {
    if (sqlite3_step(statement.get()) != SQLITE_DONE) {
        throw ServiceError(ErrorKind::ServiceUnavailable,
                           std::string("Account store ") + action + " failed: " + sqlite3_errmsg(database));
    }
}
}  // namespace

void InMemoryAccountStore::put_account(Account account) {
    std::scoped_lock lock(mutex_);
    const std::string token = account.token;
    map_accounts_[token] = std::move(account);
}

std::optional<Account> InMemoryAccountStore::load_account(const std::string& token) {
    std::scoped_lock lock(mutex_);
    const auto iterator_account = map_accounts_.find(token);
    if (iterator_account == map_accounts_.end()) {
        return std::nullopt;
    }
    return iterator_account->second;
}

UsageResult InMemoryAccountStore::increment_usage(const std::string& token, const UsageIncrement& increment) {
    std::scoped_lock lock(mutex_);
    std::map<TimePoint, std::int64_t>& map_buckets = map_usage_[token];
    if (increment.prune) {
        map_buckets.erase(map_buckets.begin(), map_buckets.lower_bound(increment.horizon));
    }

    UsageResult result{};
    result.oldest_bucket = increment.bucket_start;
    for (auto iterator_bucket = map_buckets.lower_bound(increment.horizon); iterator_bucket != map_buckets.end();
         ++iterator_bucket) {
        if (result.count == 0) {
            result.oldest_bucket = iterator_bucket->first;
        }
        result.count += iterator_bucket->second;
    }
    if (increment.limit.has_value() && result.count >= increment.limit.value()) {
        return result;
    }
    ++map_buckets[increment.bucket_start];
    ++result.count;
    result.oldest_bucket = std::min(result.oldest_bucket, increment.bucket_start);
    result.admitted = true;
    return result;
}

std::optional<std::int64_t> InMemoryAccountStore::usage_count(const std::string& token, TimePoint bucket_start) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_usage = map_usage_.find(token);
    if (iterator_usage == map_usage_.end()) {
        return std::nullopt;
    }
    const auto iterator_bucket = iterator_usage->second.find(bucket_start);
    if (iterator_bucket == iterator_usage->second.end()) {
        return std::nullopt;
    }
    return iterator_bucket->second;
}

std::size_t InMemoryAccountStore::bucket_count(const std::string& token) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_usage = map_usage_.find(token);
    return iterator_usage == map_usage_.end() ? 0 : iterator_usage->second.size();
}

SqliteAccountStore::SqliteAccountStore(const std::filesystem::path& path_database)
    : logger_(get_logger()) {
    if (sqlite3_open(path_database.string().c_str(), &database_) != SQLITE_OK) {
        const std::string message = database_ != nullptr ? sqlite3_errmsg(database_) : "out of memory";
        sqlite3_close(database_);
        database_ = nullptr;
        throw std::runtime_error("Unable to open account database at " + path_database.string() + ": " + message);
    }
    sqlite3_busy_timeout(database_, k_busy_timeout_ms);
    try {
        execute(k_create_accounts_sql);
        execute(k_create_usage_sql);
    } catch (const std::exception&) {
        sqlite3_close(database_);
        database_ = nullptr;
        throw;
    }
    logger_->info("Opened account database {}", path_database.string());
}

SqliteAccountStore::~SqliteAccountStore() {
    sqlite3_close(database_);
}

void SqliteAccountStore::put_account(const Account& account) {
    std::scoped_lock lock(mutex_);
    Statement statement(database_, k_upsert_account_sql);
    bind_text(statement.get(), 1, account.token);
    bind_text(statement.get(), 2, account.plan);
    if (account.limit.has_value()) {
        sqlite3_bind_int64(statement.get(), 3, static_cast<sqlite3_int64>(account.limit.value()));
    } else {
        sqlite3_bind_null(statement.get(), 3);
    }
    sqlite3_bind_int(statement.get(), 4, account.active ? 1 : 0);
    if (sqlite3_step(statement.get()) != SQLITE_DONE) {
        throw ServiceError(ErrorKind::ServiceUnavailable,
                           std::string("Account store write failed: ") + sqlite3_errmsg(database_));
    }
}

std::optional<Account> SqliteAccountStore::load_account(const std::string& token) {
    std::scoped_lock lock(mutex_);
    Statement statement(database_, k_select_account_sql);
    bind_text(statement.get(), 1, token);

    const int result = sqlite3_step(statement.get());
    if (result == SQLITE_DONE) {
        return std::nullopt;
    }
    if (result != SQLITE_ROW) {
        throw ServiceError(ErrorKind::ServiceUnavailable,
                           std::string("Account store read failed: ") + sqlite3_errmsg(database_));
    }

    Account account{};
    account.token = token;
    const unsigned char* raw_plan = sqlite3_column_text(statement.get(), 0);
    account.plan = raw_plan != nullptr ? reinterpret_cast<const char*>(raw_plan) : "";
    if (sqlite3_column_type(statement.get(), 1) != SQLITE_NULL) {
        account.limit = static_cast<std::int64_t>(sqlite3_column_int64(statement.get(), 1));
    }
    account.active = sqlite3_column_int(statement.get(), 2) != 0;
    return account;
}

UsageResult SqliteAccountStore::increment_usage(const std::string& token, const UsageIncrement& increment) {
    std::scoped_lock lock(mutex_);
    execute("BEGIN IMMEDIATE;");
    try {
        const UsageResult result = increment_in_transaction(token, increment);
        execute("COMMIT;");
        return result;
    } catch (const std::exception&) {
        if (sqlite3_exec(database_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            logger_->error(R"({{"component":"account_store","action":"rollback","error":"{}"}})", sqlite3_errmsg(database_));
        }
        throw;
    }
}

UsageResult SqliteAccountStore::increment_in_transaction(const std::string& token, const UsageIncrement& increment) {
    const auto horizon_ms = static_cast<sqlite3_int64>(to_epoch_ms(increment.horizon));
    if (increment.prune) {
        Statement prune(database_, k_prune_usage_sql);
        bind_text(prune.get(), 1, token);
        sqlite3_bind_int64(prune.get(), 2, horizon_ms);
        step_done(database_, prune, "usage prune");
    }

    UsageResult result{};
    result.oldest_bucket = increment.bucket_start;
    {
        Statement sum(database_, k_sum_usage_sql);
        bind_text(sum.get(), 1, token);
        sqlite3_bind_int64(sum.get(), 2, horizon_ms);
        if (sqlite3_step(sum.get()) != SQLITE_ROW) {
            throw ServiceError(ErrorKind::ServiceUnavailable,
                               std::string("Account usage read failed: ") + sqlite3_errmsg(database_));
        }
        result.count = static_cast<std::int64_t>(sqlite3_column_int64(sum.get(), 0));
        if (sqlite3_column_type(sum.get(), 1) != SQLITE_NULL) {
            result.oldest_bucket = from_epoch_ms(static_cast<std::int64_t>(sqlite3_column_int64(sum.get(), 1)));
        }
    }
    if (increment.limit.has_value() && result.count >= increment.limit.value()) {
        return result;
    }

    Statement update(database_, k_increment_usage_sql);
    bind_text(update.get(), 1, token);
    sqlite3_bind_int64(update.get(), 2, static_cast<sqlite3_int64>(to_epoch_ms(increment.bucket_start)));
    step_done(database_, update, "usage write");
    ++result.count;
    result.oldest_bucket = std::min(result.oldest_bucket, increment.bucket_start);
    result.admitted = true;
    return result;
}

std::optional<std::int64_t> SqliteAccountStore::usage_count(const std::string& token, TimePoint bucket_start) {
    std::scoped_lock lock(mutex_);
    Statement statement(database_, k_select_usage_sql);
    bind_text(statement.get(), 1, token);
    sqlite3_bind_int64(statement.get(), 2, static_cast<sqlite3_int64>(to_epoch_ms(bucket_start)));
    if (sqlite3_step(statement.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(statement.get(), 0));
}

std::size_t SqliteAccountStore::bucket_count(const std::string& token) {
    std::scoped_lock lock(mutex_);
    Statement statement(database_, k_count_buckets_sql);
    bind_text(statement.get(), 1, token);
    if (sqlite3_step(statement.get()) != SQLITE_ROW) {
        throw ServiceError(ErrorKind::ServiceUnavailable,
                           std::string("Account usage read failed: ") + sqlite3_errmsg(database_));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(statement.get(), 0));
}

void SqliteAccountStore::execute(const char* sql) {
    char* raw_error = nullptr;
    if (sqlite3_exec(database_, sql, nullptr, nullptr, &raw_error) != SQLITE_OK) {
        const std::string message = raw_error != nullptr ? raw_error : "unknown error";
        sqlite3_free(raw_error);
        throw ServiceError(ErrorKind::ServiceUnavailable, "Account database statement failed: " + message);
    }
}

}  // namespace wx_gateway
