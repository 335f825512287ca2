#pragma once

#include <string>

#include "wx_gateway/logging.hpp"
#include "wx_gateway/upstream_fetcher.hpp"

namespace wx_gateway {

/** @brief Settings for the NOAA Aviation Weather Center data API client. */
struct CurlSourceConfig final {
    std::string base_url{"https://aviationweather.gov/api/data"}; /**< Endpoint root without trailing slash. */
    Duration timeout{Duration{10.0}};                            /**< Whole-transfer timeout. */
};

/**
 * @brief ReportSource fetching `{base_url}/{metar|taf}?ids={ICAO}&format=raw` with libcurl.
 */
class CurlReportSource final : public ReportSource {
  public:
    explicit CurlReportSource(CurlSourceConfig config);

    [[nodiscard]] std::string fetch_raw(const Station& station, ReportType report_type) override;

    /** @brief URL requested for @p station and @p report_type. */
    [[nodiscard]] std::string url_for(const Station& station, ReportType report_type) const;

  private:
    CurlSourceConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief First report in a raw AWC response: the first line for METAR, the
 *        first blank-line-delimited block for TAF, trimmed.
 */
[[nodiscard]] std::string extract_first_report(const std::string& body, ReportType report_type);

}  // namespace wx_gateway
