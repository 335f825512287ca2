// === Quota Ledger ============================================================
//
// Admits or rejects a request for an account before any cache or fetch work.
// The AccountStore holds the counters and performs the check-and-increment
// atomically, so worker processes sharing a store share one limit. The ledger
// caches account records per token and serializes requests of one account
// under that account's lock; its map lock is held only to find or create the
// account slot. Unknown tokens never get a slot: they are remembered in a
// bounded set for the account refresh interval.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "wx_gateway/account_store.hpp"
#include "wx_gateway/clock.hpp"
#include "wx_gateway/errors.hpp"
#include "wx_gateway/logging.hpp"

namespace wx_gateway {

/** @brief Window accounting scheme. */
enum class QuotaPolicy {
    FixedWindow,   /**< Count resets at epoch-aligned window boundaries. */
    SlidingWindow  /**< Count covers admissions within the trailing window. */
};

/** @brief Tunables for quota enforcement. */
struct QuotaConfig final {
    QuotaPolicy policy{QuotaPolicy::FixedWindow};
    Duration window{Duration{3600.0}};           /**< Enforcement window length. */
    bool allow_anonymous{false};                 /**< Admit token-less requests against a shared bucket. */
    std::int64_t anonymous_limit{100};           /**< Shared anonymous limit per window. */
    Duration account_refresh{Duration{60.0}};    /**< How long a loaded account record is reused. */
};

/** @brief Outcome of an admission check. */
struct Decision final {
    bool admitted{};                      /**< True when the request may proceed. */
    std::optional<ErrorKind> reason{};    /**< Unauthorized or RateLimited when rejected. */
    std::string message{};                /**< Client-facing explanation for rejections. */
    std::string plan{};                   /**< Plan the request was counted against. */
    std::optional<std::int64_t> limit{};  /**< Window limit, std::nullopt when unlimited. */
    std::int64_t remaining{};             /**< Allowance left in the window after this request. */
    TimePoint reset_at{};                 /**< When the oldest counted request leaves the window. */
};

[[nodiscard]] std::optional<QuotaPolicy> parse_quota_policy(std::string_view text);

/** @brief Per-account request counters backed by an AccountStore. */
class QuotaLedger final {
  public:
    QuotaLedger(QuotaConfig config, std::shared_ptr<AccountStore> account_store, ClockPtr clock);

    /**
     * @brief Admit and count the request, or reject it.
     *
     * An empty token is counted against the anonymous bucket when anonymous
     * access is enabled and rejected as Unauthorized otherwise.
     *
     * @throws ServiceError ServiceUnavailable when the account store fails;
     *         nothing is admitted then.
     */
    [[nodiscard]] Decision check_and_increment(std::string_view token);

    /** @brief Window of the last decision for @p token. */
    [[nodiscard]] std::optional<QuotaWindow> window_for(std::string_view token) const;

    /**
     * @brief Drop account slots idle for more than two windows and expired
     *        unknown-token entries; returns the number of slots removed.
     */
    std::size_t purge_idle();

    /** @brief Number of account slots held. */
    [[nodiscard]] std::size_t size() const;
    /** @brief Number of remembered unknown tokens. */
    [[nodiscard]] std::size_t unknown_token_count() const;

    [[nodiscard]] const QuotaConfig& config() const noexcept;

  private:
    struct AccountSlot final {
        std::mutex mutex;
        std::optional<Account> account{};
        TimePoint account_loaded_at{};
        QuotaWindow window{};
        TimePoint last_seen{};
    };

    [[nodiscard]] std::shared_ptr<AccountSlot> find_slot(const std::string& key) const;
    std::shared_ptr<AccountSlot> insert_slot(const std::string& key, Account account, TimePoint now);
    void erase_slot(const std::string& key, const std::shared_ptr<AccountSlot>& slot);
    [[nodiscard]] bool recently_unknown(const std::string& token, TimePoint now) const;
    void remember_unknown(const std::string& token, TimePoint now);
    void refresh_account(AccountSlot& slot, const std::string& token, TimePoint now);
    [[nodiscard]] std::optional<Account> load_account(const std::string& token);
    [[nodiscard]] UsageResult increment_usage(const std::string& key, const UsageIncrement& increment);
    /** @brief Bucket, horizon, and pruning for a request counted at @p now. */
    [[nodiscard]] UsageIncrement make_increment(const Account& account, TimePoint now) const;

    QuotaConfig config_;
    std::shared_ptr<AccountStore> account_store_;
    ClockPtr clock_;
    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<AccountSlot>> map_slots_;
    std::unordered_map<std::string, TimePoint> map_unknown_tokens_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wx_gateway
