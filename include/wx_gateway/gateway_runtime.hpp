// === Gateway Runtime =========================================================
//
// Wires configuration, station index, account store, quota ledger, report
// cache, upstream fetcher, dispatcher, and router together, and runs the
// background station refresh and cache sweep loops.

#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "wx_gateway/account_store.hpp"
#include "wx_gateway/clock.hpp"
#include "wx_gateway/configuration.hpp"
#include "wx_gateway/http_router.hpp"
#include "wx_gateway/quota_ledger.hpp"
#include "wx_gateway/report_cache.hpp"
#include "wx_gateway/request_dispatcher.hpp"
#include "wx_gateway/station_index.hpp"
#include "wx_gateway/station_source.hpp"
#include "wx_gateway/upstream_fetcher.hpp"

namespace wx_gateway {

/** @brief Replaceable collaborators; production adapters come from make_default_components(). */
struct GatewayComponents final {
    std::shared_ptr<StationSource> station_source{};
    std::shared_ptr<AccountStore> account_store{};
    std::shared_ptr<ReportSource> report_source{};
    std::shared_ptr<ReportParser> report_parser{};
    ClockPtr clock{};
};

/** @brief CSV stations, SQLite accounts, libcurl source, basic parser, system clock. */
[[nodiscard]] GatewayComponents make_default_components(const Configuration& configuration);

/** @brief Owns every gateway component and the background maintenance threads. */
class GatewayRuntime final {
  public:
    GatewayRuntime(Configuration configuration, GatewayComponents components);
    ~GatewayRuntime();

    GatewayRuntime(const GatewayRuntime&) = delete;
    GatewayRuntime& operator=(const GatewayRuntime&) = delete;

    /** @brief Load the station index; throws when no stations can be loaded. */
    void initialize();
    /** @brief Start the refresh and sweep loops. */
    void run();
    /** @brief Stop and join the background loops. */
    void shutdown();

    /** @brief Reload the station index from the source; keeps the old snapshot on failure. */
    void refresh_stations();
    /** @brief Reclaim expired cache entries and idle quota slots. */
    void sweep();

    [[nodiscard]] HttpRouter& router() noexcept;
    [[nodiscard]] RequestDispatcher& dispatcher() noexcept;
    [[nodiscard]] StationIndex& station_index() noexcept;
    [[nodiscard]] ReportCache& report_cache() noexcept;
    [[nodiscard]] QuotaLedger& quota_ledger() noexcept;
    [[nodiscard]] const Configuration& configuration() const noexcept;

  private:
    /** @brief Periodic station index reload. */
    void refresh_loop();
    /**
     * @brief Periodic cache and ledger cleanup. With the cache sweep disabled
     *        only the ledger is purged, once per quota window.
     */
    void sweep_loop();
    [[nodiscard]] bool cache_sweep_enabled() const noexcept;
    /** @brief Sleep for @p interval in short slices; returns false once shutdown was requested. */
    bool wait_for(Duration interval) const;

    Configuration configuration_;
    GatewayComponents components_;
    StationIndex station_index_;
    QuotaLedger quota_ledger_;
    ReportCache report_cache_;
    std::shared_ptr<UpstreamFetcher> fetcher_;
    RequestDispatcher dispatcher_;
    HttpRouter router_;
    std::atomic<bool> flag_running_{false};
    std::thread refresh_thread_;
    std::thread sweep_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wx_gateway
