// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the gateway runtime.
//
// Responsibilities
// - Enforce defaults and sane bounds for cache, quota, refresh, and upstream
//   knobs.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.
//
// Note: This file avoids reading from disk; callers are expected to populate
// the process environment ahead of time (systemd unit, container env, or a
// shell-sourced `.env`).

#include "wx_gateway/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <string_view>

#include "wx_gateway/logging.hpp"

namespace wx_gateway {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr int k_default_http_port{8080};
constexpr double k_default_station_refresh_s{86400.0};
constexpr double k_default_cache_ttl_s{120.0};
constexpr double k_default_cache_sweep_s{300.0};
constexpr double k_default_cache_wait_s{30.0};
constexpr double k_default_quota_window_s{3600.0};
constexpr int k_default_anonymous_limit{100};
constexpr double k_default_account_refresh_s{60.0};
constexpr double k_default_upstream_timeout_s{10.0};

std::string parse_string(const char* name, std::string_view fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

/** @brief Parse a double; values below @p minimum fall back. */
double parse_double(const char* name, double fallback, double minimum) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!(parsed_value >= minimum)) {
            get_logger()->warn("{}={} is out of range; using fallback {}", name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} from environment; using fallback {}", name, fallback);
        return fallback;
    }
}

double parse_positive(const char* name, double fallback) {
    const double parsed_value = parse_double(name, fallback, 0.0);
    return parsed_value <= 0.0 ? fallback : parsed_value;
}

double parse_non_negative(const char* name, double fallback) {
    return parse_double(name, fallback, 0.0);
}

int parse_int(const char* name, int fallback, int maximum = std::numeric_limits<int>::max()) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value <= 0 || parsed_value > maximum) {
            get_logger()->warn("{}={} is out of range; using fallback {}", name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer {} from environment; using fallback {}", name, fallback);
        return fallback;
    }
}

bool parse_bool(const char* name, bool fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return fallback;
    }
    std::string lowered{raw_value};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    get_logger()->warn("Failed to parse boolean {} from environment; using fallback {}", name, fallback);
    return fallback;
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("WX_GATEWAY_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    config.log_level = parse_string("WX_GATEWAY_LOG_LEVEL", "info");
    set_log_level(config.log_level);
    logger->info("Loading configuration from environment");

    config.http_port = static_cast<std::uint16_t>(
        parse_int("WX_GATEWAY_HTTP_PORT", k_default_http_port, std::numeric_limits<std::uint16_t>::max())
    );
    config.station_file = parse_string("WX_GATEWAY_STATION_FILE", "data/stations.csv");
    config.station_refresh_interval = Duration{parse_positive("WX_GATEWAY_STATION_REFRESH_S", k_default_station_refresh_s)};
    config.cache_sweep_interval = Duration{parse_non_negative("WX_GATEWAY_CACHE_SWEEP_S", k_default_cache_sweep_s)};
    config.account_database = parse_string("WX_GATEWAY_ACCOUNT_DB", "accounts.db");

    config.cache.ttl = Duration{parse_positive("WX_GATEWAY_CACHE_TTL_S", k_default_cache_ttl_s)};
    config.cache.wait_timeout = Duration{parse_non_negative("WX_GATEWAY_CACHE_WAIT_S", k_default_cache_wait_s)};

    config.quota = load_quota();

    config.upstream.base_url = parse_string("WX_GATEWAY_UPSTREAM_URL", CurlSourceConfig{}.base_url);
    while (!config.upstream.base_url.empty() && config.upstream.base_url.back() == '/') {
        config.upstream.base_url.pop_back();
    }
    config.upstream.timeout = Duration{parse_positive("WX_GATEWAY_UPSTREAM_TIMEOUT_S", k_default_upstream_timeout_s)};

    logger->info("Configuration loaded: port={} stations={} cache_ttl_s={} quota_policy={} quota_window_s={} anonymous={}",
                 config.http_port,
                 config.station_file,
                 config.cache.ttl.count(),
                 config.quota.policy == QuotaPolicy::SlidingWindow ? "sliding" : "fixed",
                 config.quota.window.count(),
                 config.quota.allow_anonymous);

    return config;
}

QuotaConfig ConfigurationLoader::load_quota() {
    QuotaConfig quota{};
    const std::string policy_name = parse_string("WX_GATEWAY_QUOTA_POLICY", "fixed");
    const auto policy = parse_quota_policy(policy_name);
    if (!policy.has_value()) {
        get_logger()->warn("Unknown quota policy {}; using fixed", policy_name);
    }
    quota.policy = policy.value_or(QuotaPolicy::FixedWindow);
    quota.window = Duration{parse_positive("WX_GATEWAY_QUOTA_WINDOW_S", k_default_quota_window_s)};
    quota.allow_anonymous = parse_bool("WX_GATEWAY_ALLOW_ANONYMOUS", false);
    quota.anonymous_limit = parse_int("WX_GATEWAY_ANONYMOUS_LIMIT", k_default_anonymous_limit);
    quota.account_refresh = Duration{parse_positive("WX_GATEWAY_ACCOUNT_REFRESH_S", k_default_account_refresh_s)};
    return quota;
}

}  // namespace wx_gateway
