#include "wx_gateway/station_source.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

#include "wx_gateway/errors.hpp"

namespace wx_gateway {

namespace {
constexpr std::size_t k_min_field_count{5};

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;
    for (std::size_t index = 0; index < line.size(); ++index) {
        const char ch = line[index];
        if (ch == '"') {
            if (in_quotes && index + 1 < line.size() && line[index + 1] == '"') {
                current += '"';
                ++index;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (ch == ',' && !in_quotes) {
            fields.push_back(std::move(current));
            current.clear();
        } else if (ch != '\r') {
            current += ch;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::string trim(const std::string& text) {
    const auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char ch) { return std::isspace(ch); });
    const auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    return first < last ? std::string(first, last) : std::string{};
}

std::string uppercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return text;
}

bool parse_flag(const std::string& text, bool fallback) {
    const std::string upper = uppercase(text);
    if (upper.empty()) {
        return fallback;
    }
    return upper == "1" || upper == "TRUE" || upper == "YES" || upper == "Y";
}
}  // namespace

std::optional<Station> parse_station_record(const std::string& line) {
    const std::vector<std::string> fields = split_csv(line);
    if (fields.size() < k_min_field_count) {
        return std::nullopt;
    }

    Station station{};
    station.identifier = uppercase(trim(fields[0]));
    if (station.identifier.size() != 4
        || !std::all_of(station.identifier.begin(), station.identifier.end(), [](unsigned char ch) { return std::isalnum(ch); })) {
        return std::nullopt;
    }
    station.name = trim(fields[1]);
    station.country = trim(fields[2]);

    try {
        station.location.latitude_deg = std::stod(trim(fields[3]));
        station.location.longitude_deg = std::stod(trim(fields[4]));
        validate_coordinate(station.location.latitude_deg, station.location.longitude_deg);
        if (fields.size() > 5 && !trim(fields[5]).empty()) {
            station.elevation_m = std::stod(trim(fields[5]));
        }
    } catch (const std::logic_error&) {
        return std::nullopt;
    } catch (const ServiceError&) {
        return std::nullopt;
    }

    station.reporting = fields.size() > 6 ? parse_flag(trim(fields[6]), true) : true;
    return station;
}

CsvStationSource::CsvStationSource(std::filesystem::path path_csv)
    : path_csv_(std::move(path_csv)),
      logger_(get_logger()) {}

std::vector<Station> CsvStationSource::list_all_stations() {
    std::ifstream stream(path_csv_);
    if (!stream.is_open()) {
        throw ServiceError(ErrorKind::ServiceUnavailable, "Unable to open station file " + path_csv_.string());
    }

    std::vector<Station> stations;
    std::size_t skipped_count = 0;
    std::size_t line_number = 0;
    std::string line;
    while (std::getline(stream, line)) {
        ++line_number;
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        if (line_number == 1 && uppercase(trimmed.substr(0, 4)) == "ICAO") {
            continue;
        }
        std::optional<Station> optional_station = parse_station_record(trimmed);
        if (!optional_station.has_value()) {
            ++skipped_count;
            logger_->warn(R"({{"component":"station_source","file":"{}","line":{},"action":"skip_malformed"}})",
                          path_csv_.string(),
                          line_number);
            continue;
        }
        stations.push_back(std::move(optional_station.value()));
    }

    logger_->info("Read {} stations from {} ({} skipped)", stations.size(), path_csv_.string(), skipped_count);
    return stations;
}

}  // namespace wx_gateway
