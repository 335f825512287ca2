// === Configuration ===========================================================
//
// Strongly-typed settings for every gateway component. ConfigurationLoader
// translates WX_GATEWAY_* environment variables into these structures so
// downstream modules never touch `std::getenv` directly.

#pragma once

#include <cstdint>
#include <string>

#include "wx_gateway/curl_report_source.hpp"
#include "wx_gateway/quota_ledger.hpp"
#include "wx_gateway/report_cache.hpp"
#include "wx_gateway/types.hpp"

namespace wx_gateway {

/**
 * @brief Immutable bundle of runtime knobs for the gateway.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};                            /**< Destination directory for structured logs. */
    std::string log_level{"info"};                          /**< spdlog level name. */
    std::uint16_t http_port{8080};                          /**< Listening port of the HTTP server. */
    std::string station_file{"data/stations.csv"};          /**< CSV station list read by CsvStationSource. */
    Duration station_refresh_interval{Duration{86400.0}};   /**< Period of the station index reload. */
    Duration cache_sweep_interval{Duration{300.0}};         /**< Period of the expired-entry sweep; zero disables it. */
    std::string account_database{"accounts.db"};            /**< SQLite account database path. */
    ReportCacheConfig cache{};                              /**< TTL and waiter timeout. */
    QuotaConfig quota{};                                    /**< Window policy and anonymous access. */
    CurlSourceConfig upstream{};                            /**< Report source endpoint and timeout. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Initialize logging from WX_GATEWAY_LOG_DIR, then read every other setting. */
    static Configuration load();

  private:
    static QuotaConfig load_quota();
};

}  // namespace wx_gateway
