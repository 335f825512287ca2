#include <filesystem>
#include <fstream>
#include <string>

#include <catch2/catch.hpp>

#include "test_support.hpp"
#include "wx_gateway/station_source.hpp"

using namespace wx_gateway;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    wx_gateway::test::ensure_logger_initialized();
    return true;
}();

std::filesystem::path write_csv(const std::string& file_name, const std::string& contents) {
    const auto path_csv = std::filesystem::temp_directory_path() / file_name;
    std::ofstream stream(path_csv, std::ios::trunc);
    stream << contents;
    return path_csv;
}
}  // namespace

TEST_CASE("parse_station_record reads a full record") {
    const auto station = parse_station_record(R"(kjfk,"John F Kennedy International Airport, NY",US,40.6398,-73.7789,4,1)");
    REQUIRE(station.has_value());
    REQUIRE(station->identifier == "KJFK");
    REQUIRE(station->name == "John F Kennedy International Airport, NY");
    REQUIRE(station->country == "US");
    REQUIRE(station->location.latitude_deg == Approx(40.6398));
    REQUIRE(station->location.longitude_deg == Approx(-73.7789));
    REQUIRE(station->elevation_m.has_value());
    REQUIRE(station->elevation_m.value() == Approx(4.0));
    REQUIRE(station->reporting);
}

TEST_CASE("parse_station_record applies defaults for optional fields") {
    const auto station = parse_station_record("EGLL,London Heathrow,GB,51.4706,-0.4619");
    REQUIRE(station.has_value());
    REQUIRE_FALSE(station->elevation_m.has_value());
    REQUIRE(station->reporting);

    const auto silent = parse_station_record("KNYC,Central Park,US,40.7789,-73.9692,47,0");
    REQUIRE(silent.has_value());
    REQUIRE_FALSE(silent->reporting);
}

TEST_CASE("parse_station_record rejects malformed records") {
    REQUIRE_FALSE(parse_station_record("KJFK,too,few").has_value());
    REQUIRE_FALSE(parse_station_record("JFK,Kennedy,US,40.6,-73.7").has_value());
    REQUIRE_FALSE(parse_station_record("K-FK,Kennedy,US,40.6,-73.7").has_value());
    REQUIRE_FALSE(parse_station_record("KJFK,Kennedy,US,north,-73.7").has_value());
    REQUIRE_FALSE(parse_station_record("KJFK,Kennedy,US,95.0,-73.7").has_value());
    REQUIRE_FALSE(parse_station_record("KJFK,Kennedy,US,40.6,-181.0").has_value());
}

TEST_CASE("CsvStationSource skips headers, comments, and bad lines") {
    const auto path_csv = write_csv(
        "wx_gateway_stations_test.csv",
        "icao,name,country,latitude,longitude,elevation_m,reporting\n"
        "# comment\n"
        "KJFK,Kennedy,US,40.6398,-73.7789,4,1\n"
        "\n"
        "BROKEN LINE\n"
        "KLGA,La Guardia,US,40.7772,-73.8726,6,yes\r\n"
    );

    CsvStationSource source{path_csv};
    const std::vector<Station> stations = source.list_all_stations();
    REQUIRE(stations.size() == 2);
    REQUIRE(stations[0].identifier == "KJFK");
    REQUIRE(stations[1].identifier == "KLGA");
    REQUIRE(stations[1].reporting);

    std::filesystem::remove(path_csv);
}

TEST_CASE("CsvStationSource reports a missing file as ServiceUnavailable") {
    CsvStationSource source{std::filesystem::temp_directory_path() / "wx_gateway_missing_stations.csv"};
    try {
        (void)source.list_all_stations();
        FAIL("expected a ServiceError");
    } catch (const ServiceError& error) {
        REQUIRE(error.kind() == ErrorKind::ServiceUnavailable);
    }
}
