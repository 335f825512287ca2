// === Account Store ===========================================================
//
// Boundary to persistent account storage. The quota ledger reads plan data
// through load_account() and counts requests through increment_usage(). The
// store owns the counters, so every worker process sharing one store enforces
// one limit. Two adapters ship with the gateway: an in-memory map for tests
// and static deployments, and a SQLite-backed store.

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "wx_gateway/logging.hpp"
#include "wx_gateway/types.hpp"

struct sqlite3;

namespace wx_gateway {

/** @brief Client account as seen by the quota ledger. */
struct Account final {
    std::string token{};                 /**< Bearer token identifying the account. */
    std::string plan{};                  /**< Plan name, e.g. "free", "pro". */
    std::optional<std::int64_t> limit{}; /**< Requests per window; std::nullopt means unlimited. */
    bool active{true};                   /**< Inactive accounts are rejected as unauthorized. */
};

/** @brief Request count within one enforcement window. */
struct QuotaWindow final {
    TimePoint window_start{};
    std::int64_t count{};
};

/**
 * @brief One counted request.
 *
 * Usage is stored in fixed buckets. The count compared against @c limit is
 * the sum of every bucket of the token starting at or after @c horizon. A
 * fixed window uses a single bucket with @c horizon equal to its start.
 */
struct UsageIncrement final {
    TimePoint bucket_start{};            /**< Bucket the request is added to. */
    TimePoint horizon{};                 /**< Oldest bucket start still counted. */
    std::optional<std::int64_t> limit{}; /**< No increment once the count reaches it; std::nullopt = unlimited. */
    bool prune{false};                   /**< Delete the token's buckets older than @c horizon. */
};

/** @brief Result of an atomic check-and-increment. */
struct UsageResult final {
    bool admitted{};            /**< False when the limit was already reached; nothing was counted. */
    std::int64_t count{};       /**< Count within the horizon after the call. */
    TimePoint oldest_bucket{};  /**< Start of the oldest counted bucket, or bucket_start when none. */
};

/** @brief Persistent account storage consumed by the quota ledger. */
class AccountStore {
  public:
    virtual ~AccountStore() = default;

    /** @brief Account for @p token, or std::nullopt when unknown. */
    [[nodiscard]] virtual std::optional<Account> load_account(const std::string& token) = 0;

    /**
     * @brief Atomically compare the counted usage of @p token with the limit
     *        and add one request to the bucket when it is below.
     *
     * Must be atomic against every other caller of the same store, including
     * other processes for a shared database.
     */
    [[nodiscard]] virtual UsageResult increment_usage(const std::string& token, const UsageIncrement& increment) = 0;
};

/** @brief Thread-safe in-memory account store. */
class InMemoryAccountStore final : public AccountStore {
  public:
    void put_account(Account account);

    [[nodiscard]] std::optional<Account> load_account(const std::string& token) override;
    [[nodiscard]] UsageResult increment_usage(const std::string& token, const UsageIncrement& increment) override;

    /** @brief Stored count of @p token in the bucket starting at @p bucket_start. */
    [[nodiscard]] std::optional<std::int64_t> usage_count(const std::string& token, TimePoint bucket_start) const;
    /** @brief Number of stored buckets of @p token. */
    [[nodiscard]] std::size_t bucket_count(const std::string& token) const;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Account> map_accounts_;
    std::unordered_map<std::string, std::map<TimePoint, std::int64_t>> map_usage_;
};

/**
 * @brief Account store backed by a SQLite database.
 *
 * Tables are created on open when missing:
 * `accounts(token PRIMARY KEY, plan, quota NULL = unlimited, active)` and
 * `usage(token, window_start, count, PRIMARY KEY(token, window_start))`,
 * one row per token and usage bucket, `window_start` in epoch milliseconds.
 */
class SqliteAccountStore final : public AccountStore {
  public:
    explicit SqliteAccountStore(const std::filesystem::path& path_database);
    ~SqliteAccountStore() override;

    SqliteAccountStore(const SqliteAccountStore&) = delete;
    SqliteAccountStore& operator=(const SqliteAccountStore&) = delete;

    /** @brief Insert or replace an account record. */
    void put_account(const Account& account);

    [[nodiscard]] std::optional<Account> load_account(const std::string& token) override;
    /** @brief Runs inside a `BEGIN IMMEDIATE` transaction so processes sharing the file serialize. */
    [[nodiscard]] UsageResult increment_usage(const std::string& token, const UsageIncrement& increment) override;

    /** @brief Stored count of @p token in the bucket starting at @p bucket_start. */
    [[nodiscard]] std::optional<std::int64_t> usage_count(const std::string& token, TimePoint bucket_start);
    /** @brief Number of stored buckets of @p token. */
    [[nodiscard]] std::size_t bucket_count(const std::string& token);

  private:
    void execute(const char* sql);
    UsageResult increment_in_transaction(const std::string& token, const UsageIncrement& increment);

    std::mutex mutex_;
    sqlite3* database_{nullptr};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wx_gateway
