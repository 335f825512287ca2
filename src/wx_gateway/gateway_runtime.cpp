#include "wx_gateway/gateway_runtime.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "wx_gateway/basic_report_parser.hpp"
#include "wx_gateway/curl_report_source.hpp"
#include "wx_gateway/logging.hpp"

namespace wx_gateway {

namespace {
constexpr std::chrono::milliseconds k_poll_slice{200}; /**< Longest a loop sleeps before re-checking shutdown. */

/** @brief Fail fast on missing collaborators before any member is built from them. */
GatewayComponents require_components(GatewayComponents components) {
    if (components.station_source == nullptr || components.account_store == nullptr
        || components.report_source == nullptr || components.report_parser == nullptr || components.clock == nullptr) {
        throw std::invalid_argument("GatewayRuntime requires every component to be provided");
    }
    return components;
}
}  // namespace

GatewayComponents make_default_components(const Configuration& configuration) {
    GatewayComponents components{};
    components.station_source = std::make_shared<CsvStationSource>(configuration.station_file);
    components.account_store = std::make_shared<SqliteAccountStore>(configuration.account_database);
    components.report_source = std::make_shared<CurlReportSource>(configuration.upstream);
    components.report_parser = std::make_shared<BasicReportParser>();
    components.clock = std::make_shared<SystemClock>();
    return components;
}

GatewayRuntime::GatewayRuntime(Configuration configuration, GatewayComponents components)
    : configuration_(std::move(configuration)),
      components_(require_components(std::move(components))),
      station_index_(),
      quota_ledger_(configuration_.quota, components_.account_store, components_.clock),
      report_cache_(configuration_.cache, components_.clock),
      fetcher_(std::make_shared<UpstreamFetcher>(components_.report_source, components_.report_parser, components_.clock)),
      dispatcher_(station_index_, quota_ledger_, report_cache_, fetcher_, components_.report_parser, components_.clock),
      router_(dispatcher_, components_.clock),
      logger_(get_logger()) {}

GatewayRuntime::~GatewayRuntime() {
    shutdown();
}

/**
 * @brief Load the initial station snapshot. The gateway cannot serve without one.
 */
void GatewayRuntime::initialize() {
    logger_->info("Initializing gateway runtime");
    station_index_.reload(*components_.station_source);
    logger_->info("Station index ready with {} stations", station_index_.size());
}

void GatewayRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting gateway maintenance loops");
    refresh_thread_ = std::thread(&GatewayRuntime::refresh_loop, this);
    if (!cache_sweep_enabled()) {
        logger_->info("Cache sweep disabled, purging idle quota slots every {} s", configuration_.quota.window.count());
    }
    sweep_thread_ = std::thread(&GatewayRuntime::sweep_loop, this);
}

void GatewayRuntime::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down gateway runtime");
    if (refresh_thread_.joinable()) {
        refresh_thread_.join();
    }
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
}

void GatewayRuntime::refresh_stations() {
    station_index_.reload(*components_.station_source);
}

void GatewayRuntime::sweep() {
    const std::size_t removed_entries = report_cache_.purge_expired();
    const std::size_t removed_slots = quota_ledger_.purge_idle();
    logger_->debug(R"({{"component":"gateway_runtime","action":"sweep","cache_removed":{},"quota_removed":{},"cache_size":{}}})",
                   removed_entries, removed_slots, report_cache_.size());
}

HttpRouter& GatewayRuntime::router() noexcept {
    return router_;
}

RequestDispatcher& GatewayRuntime::dispatcher() noexcept {
    return dispatcher_;
}

StationIndex& GatewayRuntime::station_index() noexcept {
    return station_index_;
}

ReportCache& GatewayRuntime::report_cache() noexcept {
    return report_cache_;
}

QuotaLedger& GatewayRuntime::quota_ledger() noexcept {
    return quota_ledger_;
}

const Configuration& GatewayRuntime::configuration() const noexcept {
    return configuration_;
}

void GatewayRuntime::refresh_loop() {
    while (wait_for(configuration_.station_refresh_interval)) {
        try {
            refresh_stations();
        } catch (const std::exception& exc) {
            logger_->error("Station refresh failed, keeping previous snapshot: {}", exc.what());
        }
    }
}

void GatewayRuntime::sweep_loop() {
    const bool sweep_cache = cache_sweep_enabled();
    const Duration interval = sweep_cache ? configuration_.cache_sweep_interval : configuration_.quota.window;
    while (wait_for(interval)) {
        try {
            if (sweep_cache) {
                sweep();
            } else {
                const std::size_t removed_slots = quota_ledger_.purge_idle();
                logger_->debug(R"({{"component":"gateway_runtime","action":"purge_quota","quota_removed":{}}})",
                               removed_slots);
            }
        } catch (const std::exception& exc) {
            logger_->error("Maintenance sweep failed: {}", exc.what());
        }
    }
}

bool GatewayRuntime::cache_sweep_enabled() const noexcept {
    return configuration_.cache_sweep_interval.count() > 0.0;
}

bool GatewayRuntime::wait_for(Duration interval) const {
    const auto deadline = std::chrono::steady_clock::now()
        + std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval);
    while (flag_running_.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, k_poll_slice));
    }
    return false;
}

}  // namespace wx_gateway
