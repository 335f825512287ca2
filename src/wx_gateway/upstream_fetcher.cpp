#include "wx_gateway/upstream_fetcher.hpp"

#include <chrono>
#include <stdexcept>

#include <fmt/format.h>

#include "wx_gateway/errors.hpp"

namespace wx_gateway {

UpstreamFetcher::UpstreamFetcher(std::shared_ptr<ReportSource> source, std::shared_ptr<ReportParser> parser, ClockPtr clock)
    : source_(std::move(source)),
      parser_(std::move(parser)),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (source_ == nullptr || parser_ == nullptr || clock_ == nullptr) {
        throw std::invalid_argument("UpstreamFetcher requires a source, a parser, and a clock");
    }
}

ReportPtr UpstreamFetcher::fetch(const Station& station, ReportType report_type, const OptionSet& options) {
    const auto started_at = std::chrono::steady_clock::now();
    const std::string raw = source_->fetch_raw(station, report_type);
    if (raw.empty()) {
        throw ServiceError(
            ErrorKind::NotFound,
            fmt::format("No current {} report was found for {}", to_string(report_type), station.identifier),
            "station"
        );
    }

    auto report = std::make_shared<Report>();
    report->station = station;
    report->report_type = report_type;
    report->options = options;
    report->payload = run_parser(raw, station, report_type, options);
    report->fetched_at = clock_->now();

    const Duration elapsed = std::chrono::steady_clock::now() - started_at;
    logger_->info(R"({{"component":"upstream_fetcher","station":"{}","type":"{}","elapsed_s":{:.3f}}})",
                  station.identifier,
                  to_string(report_type),
                  elapsed.count());
    return report;
}

nlohmann::json UpstreamFetcher::run_parser(const std::string& raw,
                                           const Station& station,
                                           ReportType report_type,
                                           const OptionSet& options) {
    try {
        return parser_->parse(raw, station, report_type, options);
    } catch (const ServiceError&) {
        throw;
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"upstream_fetcher","state":"parse","station":"{}","error":"{}"}})",
                       station.identifier,
                       exc.what());
        throw ServiceError(
            ErrorKind::UpstreamParseError,
            fmt::format("Could not parse {} report for {}", to_string(report_type), station.identifier)
        );
    }
}

}  // namespace wx_gateway
