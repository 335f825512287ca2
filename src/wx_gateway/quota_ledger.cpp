#include "wx_gateway/quota_ledger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/format.h>

namespace wx_gateway {

namespace {
constexpr char k_anonymous_plan[] = "anonymous";
constexpr std::int64_t k_sliding_buckets{60};    /**< Usage buckets per sliding window. */
constexpr std::size_t k_max_unknown_tokens{1024}; /**< Cap on remembered unknown tokens. */

WallClock::duration to_clock_duration(Duration duration) {
    return std::chrono::duration_cast<WallClock::duration>(duration);
}

/** @brief Start of the epoch-aligned fixed window containing @p now. */
TimePoint fixed_window_start(TimePoint now, WallClock::duration window) {
    const auto since_epoch = now.time_since_epoch();
    return TimePoint{since_epoch - since_epoch % window};
}

Decision reject(ErrorKind reason, std::string message) {
    Decision decision{};
    decision.reason = reason;
    decision.message = std::move(message);
    return decision;
}
}  // namespace

std::optional<QuotaPolicy> parse_quota_policy(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "fixed") {
        return QuotaPolicy::FixedWindow;
    }
    if (lowered == "sliding") {
        return QuotaPolicy::SlidingWindow;
    }
    return std::nullopt;
}

QuotaLedger::QuotaLedger(QuotaConfig config, std::shared_ptr<AccountStore> account_store, ClockPtr clock)
    : config_(config),
      account_store_(std::move(account_store)),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (account_store_ == nullptr || clock_ == nullptr) {
        throw std::invalid_argument("QuotaLedger requires an account store and a clock");
    }
    if (to_clock_duration(config_.window).count() <= 0) {
        throw std::invalid_argument("QuotaLedger window must be positive");
    }
}

Decision QuotaLedger::check_and_increment(std::string_view token) {
    const TimePoint now = clock_->now();
    const bool anonymous = token.empty();

    if (anonymous && !config_.allow_anonymous) {
        return reject(ErrorKind::Unauthorized, "A token is required to access this resource");
    }

    const std::string key{token};
    std::shared_ptr<AccountSlot> slot = find_slot(key);
    if (slot == nullptr) {
        if (anonymous) {
            slot = insert_slot(key, Account{k_anonymous_plan, k_anonymous_plan, config_.anonymous_limit, true}, now);
        } else {
            if (recently_unknown(key, now)) {
                return reject(ErrorKind::Unauthorized, "Token is not recognized");
            }
            std::optional<Account> account = load_account(key);
            if (!account.has_value()) {
                remember_unknown(key, now);
                return reject(ErrorKind::Unauthorized, "Token is not recognized");
            }
            slot = insert_slot(key, std::move(account.value()), now);
        }
    }

    Decision decision{};
    bool account_removed = false;
    {
        std::scoped_lock lock(slot->mutex);
        slot->last_seen = now;
        if (!anonymous) {
            refresh_account(*slot, key, now);
        }

        if (!slot->account.has_value()) {
            account_removed = true;
            decision = reject(ErrorKind::Unauthorized, "Token is not recognized");
        } else if (!slot->account->active) {
            decision = reject(ErrorKind::Unauthorized, "Token is inactive");
        } else {
            const Account& account = slot->account.value();
            const UsageIncrement increment = make_increment(account, now);
            const UsageResult usage = increment_usage(key, increment);
            const TimePoint window_start = config_.policy == QuotaPolicy::FixedWindow ? increment.bucket_start
                                                                                       : increment.horizon;
            slot->window = QuotaWindow{window_start, usage.count};

            decision.admitted = usage.admitted;
            decision.plan = account.plan;
            decision.limit = account.limit;
            decision.reset_at = config_.policy == QuotaPolicy::FixedWindow
                ? increment.bucket_start + to_clock_duration(config_.window)
                : usage.oldest_bucket + to_clock_duration(config_.window);
            if (account.limit.has_value()) {
                decision.remaining = std::max<std::int64_t>(0, account.limit.value() - usage.count);
            }
            if (!usage.admitted) {
                decision.reason = ErrorKind::RateLimited;
                decision.message = fmt::format("Request limit of {} reached for plan {}",
                                               account.limit.value_or(0),
                                               account.plan);
                logger_->debug(R"({{"component":"quota_ledger","plan":"{}","action":"reject","count":{}}})",
                               account.plan,
                               usage.count);
            }
        }
    }

    if (account_removed) {
        erase_slot(key, slot);
        remember_unknown(key, now);
    }
    return decision;
}

std::optional<QuotaWindow> QuotaLedger::window_for(std::string_view token) const {
    const std::shared_ptr<AccountSlot> slot = find_slot(std::string{token});
    if (slot == nullptr) {
        return std::nullopt;
    }
    std::scoped_lock lock(slot->mutex);
    return slot->window;
}

std::size_t QuotaLedger::purge_idle() {
    const TimePoint now = clock_->now();
    const TimePoint horizon = now - 2 * to_clock_duration(config_.window);
    std::size_t removed_count = 0;
    std::scoped_lock lock(map_mutex_);
    for (auto iterator_slot = map_slots_.begin(); iterator_slot != map_slots_.end();) {
        const std::shared_ptr<AccountSlot>& slot = iterator_slot->second;
        // A slot referenced outside the map is in use by a request.
        bool idle = slot.use_count() == 1;
        if (idle) {
            std::scoped_lock slot_lock(slot->mutex);
            idle = slot->last_seen < horizon;
        }
        if (idle) {
            iterator_slot = map_slots_.erase(iterator_slot);
            ++removed_count;
        } else {
            ++iterator_slot;
        }
    }
    const WallClock::duration unknown_ttl = to_clock_duration(config_.account_refresh);
    for (auto iterator_unknown = map_unknown_tokens_.begin(); iterator_unknown != map_unknown_tokens_.end();) {
        if (now - iterator_unknown->second >= unknown_ttl) {
            iterator_unknown = map_unknown_tokens_.erase(iterator_unknown);
        } else {
            ++iterator_unknown;
        }
    }
    if (removed_count > 0) {
        logger_->debug("Quota ledger purged {} idle account slots", removed_count);
    }
    return removed_count;
}

std::size_t QuotaLedger::size() const {
    std::scoped_lock lock(map_mutex_);
    return map_slots_.size();
}

std::size_t QuotaLedger::unknown_token_count() const {
    std::scoped_lock lock(map_mutex_);
    return map_unknown_tokens_.size();
}

const QuotaConfig& QuotaLedger::config() const noexcept {
    return config_;
}

std::shared_ptr<QuotaLedger::AccountSlot> QuotaLedger::find_slot(const std::string& key) const {
    std::scoped_lock lock(map_mutex_);
    const auto iterator_slot = map_slots_.find(key);
    return iterator_slot == map_slots_.end() ? nullptr : iterator_slot->second;
}

std::shared_ptr<QuotaLedger::AccountSlot> QuotaLedger::insert_slot(const std::string& key, Account account, TimePoint now) {
    std::scoped_lock lock(map_mutex_);
    std::shared_ptr<AccountSlot>& slot = map_slots_[key];
    if (slot == nullptr) {
        slot = std::make_shared<AccountSlot>();
        slot->account = std::move(account);
        slot->account_loaded_at = now;
    }
    map_unknown_tokens_.erase(key);
    return slot;
}

void QuotaLedger::erase_slot(const std::string& key, const std::shared_ptr<AccountSlot>& slot) {
    std::scoped_lock lock(map_mutex_);
    const auto iterator_slot = map_slots_.find(key);
    if (iterator_slot != map_slots_.end() && iterator_slot->second == slot) {
        map_slots_.erase(iterator_slot);
    }
}

bool QuotaLedger::recently_unknown(const std::string& token, TimePoint now) const {
    std::scoped_lock lock(map_mutex_);
    const auto iterator_unknown = map_unknown_tokens_.find(token);
    return iterator_unknown != map_unknown_tokens_.end()
        && now - iterator_unknown->second < to_clock_duration(config_.account_refresh);
}

void QuotaLedger::remember_unknown(const std::string& token, TimePoint now) {
    std::scoped_lock lock(map_mutex_);
    if (map_unknown_tokens_.size() >= k_max_unknown_tokens && map_unknown_tokens_.count(token) == 0) {
        const WallClock::duration unknown_ttl = to_clock_duration(config_.account_refresh);
        for (auto iterator_unknown = map_unknown_tokens_.begin(); iterator_unknown != map_unknown_tokens_.end();) {
            if (now - iterator_unknown->second >= unknown_ttl) {
                iterator_unknown = map_unknown_tokens_.erase(iterator_unknown);
            } else {
                ++iterator_unknown;
            }
        }
        if (map_unknown_tokens_.size() >= k_max_unknown_tokens) {
            map_unknown_tokens_.clear();
        }
    }
    map_unknown_tokens_[token] = now;
}

void QuotaLedger::refresh_account(AccountSlot& slot, const std::string& token, TimePoint now) {
    if (now - slot.account_loaded_at < to_clock_duration(config_.account_refresh)) {
        return;
    }
    slot.account = load_account(token);
    slot.account_loaded_at = now;
}

std::optional<Account> QuotaLedger::load_account(const std::string& token) {
    try {
        return account_store_->load_account(token);
    } catch (const ServiceError&) {
        throw;
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"quota_ledger","action":"load_account","error":"{}"}})", exc.what());
        throw ServiceError(ErrorKind::ServiceUnavailable, "Account store is unavailable");
    }
}

UsageResult QuotaLedger::increment_usage(const std::string& key, const UsageIncrement& increment) {
    try {
        return account_store_->increment_usage(key, increment);
    } catch (const ServiceError& error) {
        logger_->error(R"({{"component":"quota_ledger","action":"increment_usage","error":"{}"}})", error.what());
        throw;
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"quota_ledger","action":"increment_usage","error":"{}"}})", exc.what());
        throw ServiceError(ErrorKind::ServiceUnavailable, "Account store is unavailable");
    }
}

UsageIncrement QuotaLedger::make_increment(const Account& account, TimePoint now) const {
    const WallClock::duration window = to_clock_duration(config_.window);
    UsageIncrement increment{};
    increment.limit = account.limit;
    if (config_.policy == QuotaPolicy::FixedWindow) {
        increment.bucket_start = fixed_window_start(now, window);
        increment.horizon = increment.bucket_start;
        return increment;
    }
    const WallClock::duration bucket = std::max(window / k_sliding_buckets, WallClock::duration{1});
    increment.bucket_start = fixed_window_start(now, bucket);
    increment.horizon = increment.bucket_start - window + bucket;
    increment.prune = true;
    return increment;
}

}  // namespace wx_gateway
