// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the gateway (time primitives, geodetic coordinates, report types, options).

#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace wx_gateway {

/**
 * @brief Alias for the wall clock used for cache and quota timestamps.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps captured from the wall clock.
 */
using TimePoint = std::chrono::time_point<WallClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Weather report products served by the gateway.
 */
enum class ReportType {
    Metar,  /**< Routine or special surface observation. */
    Taf     /**< Terminal aerodrome forecast. */
};

/**
 * @brief Output-selection flags that change the rendered payload.
 */
enum class OutputOption {
    Info,       /**< Attach station metadata. */
    Translate,  /**< Attach element translations from the parsing engine. */
    Summary,    /**< Attach a condensed summary from the parsing engine. */
    Speech      /**< Attach spoken text from the parsing engine. */
};

/**
 * @brief Ordered, duplicate-free option set; the canonical cache dimension.
 */
using OptionSet = std::set<OutputOption>;

/**
 * @brief Response encodings supported by the renderer.
 */
enum class ResponseFormat {
    Json,
    Xml
};

[[nodiscard]] std::string_view to_string(ReportType report_type) noexcept;
[[nodiscard]] std::string_view to_string(OutputOption option) noexcept;
[[nodiscard]] std::string_view to_string(ResponseFormat format) noexcept;

/** @brief Case-insensitive parse of "metar"/"taf". */
[[nodiscard]] std::optional<ReportType> parse_report_type(std::string_view text);
/** @brief Case-insensitive parse of a single option name. */
[[nodiscard]] std::optional<OutputOption> parse_output_option(std::string_view text);
/** @brief Case-insensitive parse of "json"/"xml". */
[[nodiscard]] std::optional<ResponseFormat> parse_response_format(std::string_view text);

/** @brief Render an option set as a comma-separated list in canonical order. */
[[nodiscard]] std::string join_options(const OptionSet& options);

/** @brief Format a timestamp as an ISO-8601 UTC string with second precision. */
[[nodiscard]] std::string format_iso8601(TimePoint time_point);

}  // namespace wx_gateway
