// === Upstream Fetcher ========================================================
//
// Adapter boundary to the report source and the external parsing engine. The
// cache only ever sees ReportFetcher; UpstreamFetcher composes a raw-text
// ReportSource with a ReportParser and classifies their failures.

#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "wx_gateway/clock.hpp"
#include "wx_gateway/logging.hpp"
#include "wx_gateway/report.hpp"
#include "wx_gateway/station.hpp"

namespace wx_gateway {

/** @brief Retrieves raw report text for a station. */
class ReportSource {
  public:
    virtual ~ReportSource() = default;

    /**
     * @brief Latest raw report for @p station, or an empty string when none is published.
     *
     * @throws ServiceError ServiceUnavailable when the source cannot be reached.
     */
    [[nodiscard]] virtual std::string fetch_raw(const Station& station, ReportType report_type) = 0;
};

/** @brief External parsing engine. */
class ReportParser {
  public:
    virtual ~ReportParser() = default;

    /**
     * @brief Parse @p raw into the opaque report document.
     *
     * @throws ServiceError UpstreamParseError when the engine rejects the report.
     */
    [[nodiscard]] virtual nlohmann::json parse(const std::string& raw,
                                               const Station& station,
                                               ReportType report_type,
                                               const OptionSet& options) = 0;
};

/** @brief Produces a fresh parsed report for a station; called only on cache misses. */
class ReportFetcher {
  public:
    virtual ~ReportFetcher() = default;

    [[nodiscard]] virtual ReportPtr fetch(const Station& station, ReportType report_type, const OptionSet& options) = 0;
};

/** @brief ReportFetcher that pulls raw text from a source and runs the parser on it. */
class UpstreamFetcher final : public ReportFetcher {
  public:
    UpstreamFetcher(std::shared_ptr<ReportSource> source, std::shared_ptr<ReportParser> parser, ClockPtr clock);

    /**
     * @throws ServiceError NotFound when the source has no current report,
     *         ServiceUnavailable on source failure, UpstreamParseError on parse failure.
     */
    [[nodiscard]] ReportPtr fetch(const Station& station, ReportType report_type, const OptionSet& options) override;

  private:
    [[nodiscard]] nlohmann::json run_parser(const std::string& raw,
                                            const Station& station,
                                            ReportType report_type,
                                            const OptionSet& options);

    std::shared_ptr<ReportSource> source_;
    std::shared_ptr<ReportParser> parser_;
    ClockPtr clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wx_gateway
