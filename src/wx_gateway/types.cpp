#include "wx_gateway/types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

#include <fmt/format.h>

namespace wx_gateway {

namespace {
std::string lowercase(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}
}  // namespace

std::string_view to_string(ReportType report_type) noexcept {
    switch (report_type) {
        case ReportType::Metar:
            return "metar";
        case ReportType::Taf:
            return "taf";
    }
    return "unknown";
}

std::string_view to_string(OutputOption option) noexcept {
    switch (option) {
        case OutputOption::Info:
            return "info";
        case OutputOption::Translate:
            return "translate";
        case OutputOption::Summary:
            return "summary";
        case OutputOption::Speech:
            return "speech";
    }
    return "unknown";
}

std::string_view to_string(ResponseFormat format) noexcept {
    switch (format) {
        case ResponseFormat::Json:
            return "json";
        case ResponseFormat::Xml:
            return "xml";
    }
    return "unknown";
}

std::optional<ReportType> parse_report_type(std::string_view text) {
    const std::string lowered = lowercase(text);
    if (lowered == "metar") {
        return ReportType::Metar;
    }
    if (lowered == "taf") {
        return ReportType::Taf;
    }
    return std::nullopt;
}

std::optional<OutputOption> parse_output_option(std::string_view text) {
    const std::string lowered = lowercase(text);
    for (const OutputOption option : {OutputOption::Info, OutputOption::Translate, OutputOption::Summary, OutputOption::Speech}) {
        if (lowered == to_string(option)) {
            return option;
        }
    }
    return std::nullopt;
}

std::optional<ResponseFormat> parse_response_format(std::string_view text) {
    const std::string lowered = lowercase(text);
    if (lowered == "json") {
        return ResponseFormat::Json;
    }
    if (lowered == "xml") {
        return ResponseFormat::Xml;
    }
    return std::nullopt;
}

std::string join_options(const OptionSet& options) {
    std::string joined;
    for (const OutputOption option : options) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += to_string(option);
    }
    return joined;
}

std::string format_iso8601(TimePoint time_point) {
    const std::time_t seconds = WallClock::to_time_t(time_point);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
        utc.tm_year + 1900,
        utc.tm_mon + 1,
        utc.tm_mday,
        utc.tm_hour,
        utc.tm_min,
        utc.tm_sec
    );
}

}  // namespace wx_gateway
