// === Station Source ==========================================================
//
// Boundary to the geocoding data that seeds the station index. The index only
// ever consumes a bulk list; CsvStationSource reads that list from a local
// file exported from the station database.

#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "wx_gateway/logging.hpp"
#include "wx_gateway/station.hpp"

namespace wx_gateway {

/** @brief Bulk provider of station metadata. */
class StationSource {
  public:
    virtual ~StationSource() = default;

    /** @brief Return every known station; throws on source failure. */
    [[nodiscard]] virtual std::vector<Station> list_all_stations() = 0;
};

/**
 * @brief Reads `icao,name,country,latitude,longitude,elevation_m,reporting`
 *        records from a CSV file.
 *
 * A header line starting with `icao` and lines starting with `#` are skipped.
 * Malformed records are skipped with a warning rather than failing the load.
 * Fields may be double-quoted to embed commas.
 */
class CsvStationSource final : public StationSource {
  public:
    explicit CsvStationSource(std::filesystem::path path_csv);

    [[nodiscard]] std::vector<Station> list_all_stations() override;

  private:
    std::filesystem::path path_csv_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Parse one CSV record; std::nullopt when the record is malformed. */
[[nodiscard]] std::optional<Station> parse_station_record(const std::string& line);

}  // namespace wx_gateway
