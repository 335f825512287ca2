// === Request Dispatcher ======================================================
//
// Orchestrates one inbound request end to end:
//
//   Received -> Validated -> Resolved -> Admitted
//            -> (CacheHit | Fetching -> Fetched | FetchFailed) -> Responded
//
// Validation, resolution, and quota failures short-circuit to Rejected before
// the cache or the fetcher is touched. The dispatcher never throws; every
// outcome is a DispatchResult carrying a status code and a JSON document.

#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "wx_gateway/clock.hpp"
#include "wx_gateway/logging.hpp"
#include "wx_gateway/quota_ledger.hpp"
#include "wx_gateway/report_cache.hpp"
#include "wx_gateway/station_index.hpp"
#include "wx_gateway/upstream_fetcher.hpp"

namespace wx_gateway {

constexpr std::size_t k_max_multi_stations{10};

/** @brief Lifecycle of a single request. */
enum class RequestState {
    Received,
    Validated,
    Resolved,
    Admitted,
    CacheHit,
    Fetching,
    Fetched,
    FetchFailed,
    Responded,
    Rejected
};

[[nodiscard]] std::string_view to_string(RequestState state) noexcept;

/** @brief Report lookup as received from the client, before validation. */
struct ReportRequest final {
    std::string report_type{};  /**< "metar" or "taf". */
    std::string location{};     /**< Station code or "lat,lon". */
    std::string options{};      /**< Comma-separated option names. */
    std::string token{};        /**< Bearer token, empty when absent. */
};

/** @brief Nearest-station search as received from the client. */
struct NearRequest final {
    std::string coordinate{};   /**< "lat,lon". */
    std::string count{};        /**< Number of stations, default 10. */
    std::string max_distance{}; /**< Arc degrees, default 10. */
    std::string reporting{};    /**< "true"/"false", default true. */
    std::string token{};
};

/** @brief Reports for several stations at once, as received from the client. */
struct MultiRequest final {
    std::string report_type{};  /**< "metar" or "taf". */
    std::string stations{};     /**< Comma-separated station codes. */
    std::string options{};
    std::string token{};
};

/** @brief Free-text station search as received from the client. */
struct SearchRequest final {
    std::string text{};         /**< 3 to 200 characters. */
    std::string count{};        /**< Number of stations, default 10. */
    std::string reporting{};    /**< "true"/"false", default true. */
    std::string token{};
};

/** @brief Client-supplied raw report to parse without touching the cache. */
struct ParseRequest final {
    std::string report_type{};
    std::string report{};
    std::string options{};
    std::string token{};
};

/** @brief Outcome of a dispatched request. */
struct DispatchResult final {
    int status{200};
    nlohmann::json body{};
    RequestState state{RequestState::Received};     /**< Terminal state: Responded or Rejected. */
    RequestState last_stage{RequestState::Received}; /**< Furthest non-terminal state reached. */
    std::optional<ErrorKind> error{};
    std::optional<CacheOutcome> cache_outcome{};
    std::optional<Decision> quota{};                 /**< Set once the ledger was consulted. */
};

/** @brief Parsed client location: a station code or a coordinate. */
using Location = std::variant<std::string, GeodeticCoordinate>;

/** @brief Split "lat,lon" or return the trimmed code; throws InvalidInput on malformed input. */
[[nodiscard]] Location parse_location(std::string_view text);

/**
 * @brief Split a comma-separated station list into uppercase codes.
 *
 * @throws ServiceError InvalidInput (param "stations") for an empty list, a
 *         malformed code, or more than @ref k_max_multi_stations codes.
 */
[[nodiscard]] std::vector<std::string> parse_station_list(std::string_view text);

/** @brief Parse a comma-separated option list; throws InvalidInput on unknown names. */
[[nodiscard]] OptionSet parse_options(std::string_view text);

/** @brief Wires station index, ledger, cache, and fetcher into the request lifecycle. */
class RequestDispatcher final {
  public:
    RequestDispatcher(StationIndex& station_index,
                      QuotaLedger& quota_ledger,
                      ReportCache& report_cache,
                      std::shared_ptr<ReportFetcher> fetcher,
                      std::shared_ptr<ReportParser> parser,
                      ClockPtr clock);

    [[nodiscard]] DispatchResult dispatch_report(const ReportRequest& request);
    [[nodiscard]] DispatchResult station_info(std::string_view code, std::string_view token);
    [[nodiscard]] DispatchResult near(const NearRequest& request);
    [[nodiscard]] DispatchResult parse_given(const ParseRequest& request);
    /**
     * @brief Reports for up to ten stations behind one quota admission.
     *
     * Each station goes through the cache concurrently. The body maps each
     * identifier to its report; stations whose fetch failed are left out.
     */
    [[nodiscard]] DispatchResult dispatch_multi(const MultiRequest& request);
    /** @brief Station records for up to ten codes, keyed by identifier. */
    [[nodiscard]] DispatchResult multi_station_info(std::string_view codes, std::string_view token);
    [[nodiscard]] DispatchResult search_stations(const SearchRequest& request);

  private:
    /** @brief Cache lookup for one resolved station, fetching on a miss. */
    [[nodiscard]] CacheLookup lookup_report(const Station& station, ReportType report_type, const OptionSet& options);
    /** @brief Resolve every code; any unknown code rejects the whole list. */
    [[nodiscard]] std::vector<Station> resolve_station_list(const std::vector<std::string>& list_codes) const;
    /** @brief Consult the ledger and record the decision; throws the rejection reason. */
    void admit(std::string_view token, DispatchResult& result);
    [[nodiscard]] nlohmann::json make_meta(std::optional<TimePoint> cache_timestamp) const;
    /** @brief Fill @p result with an error body; Rejected before admission, Responded after. */
    static void fail(DispatchResult& result, ErrorKind kind, const std::string& message, const std::string& param = {});
    void fail_internal(DispatchResult& result, std::string_view operation, const std::exception& error) const;
    void log_result(std::string_view operation, const DispatchResult& result) const;

    StationIndex& station_index_;
    QuotaLedger& quota_ledger_;
    ReportCache& report_cache_;
    std::shared_ptr<ReportFetcher> fetcher_;
    std::shared_ptr<ReportParser> parser_;
    ClockPtr clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wx_gateway
