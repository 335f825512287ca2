#include "wx_gateway/station_index.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>

#include "wx_gateway/errors.hpp"

namespace wx_gateway {

namespace {
std::string normalize_code(std::string_view code) {
    std::string normalized;
    normalized.reserve(code.size());
    for (const char ch : code) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            continue;
        }
        normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return normalized;
}

std::string to_upper(std::string_view text) {
    std::string upper;
    upper.reserve(text.size());
    for (const char ch : text) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return upper;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> list_words;
    std::string word;
    for (const char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) || ch == ',') {
            if (!word.empty()) {
                list_words.push_back(std::move(word));
                word.clear();
            }
            continue;
        }
        word += ch;
    }
    if (!word.empty()) {
        list_words.push_back(std::move(word));
    }
    return list_words;
}

/** @brief Lower is better; std::nullopt when some word is missing. */
std::optional<int> match_rank(const Station& station, const std::string& query, const std::vector<std::string>& list_words) {
    const std::string name = to_upper(station.name);
    if (station.identifier == query) {
        return 0;
    }
    if (station.identifier.rfind(query, 0) == 0) {
        return 1;
    }
    const std::string haystack = station.identifier + " " + name + " " + to_upper(station.country);
    for (const std::string& word : list_words) {
        if (haystack.find(word) == std::string::npos) {
            return std::nullopt;
        }
    }
    return name.find(query) != std::string::npos ? 2 : 3;
}

bool closer(const StationDistance& lhs, const StationDistance& rhs) {
    if (lhs.distance_deg != rhs.distance_deg) {
        return lhs.distance_deg < rhs.distance_deg;
    }
    return lhs.station.identifier < rhs.station.identifier;
}
}  // namespace

StationIndex::StationIndex()
    : logger_(get_logger()) {}

Station StationIndex::resolve_by_code(std::string_view code) const {
    const std::string normalized = normalize_code(code);
    const StationSnapshotPtr active = require_snapshot();
    const auto iterator_station = active->map_by_code.find(normalized);
    if (iterator_station == active->map_by_code.end()) {
        throw ServiceError(ErrorKind::NotFound, fmt::format("{} is not a known station", normalized), "station");
    }
    return active->stations[iterator_station->second];
}

Station StationIndex::resolve_by_coordinate(double latitude_deg, double longitude_deg) const {
    validate_coordinate(latitude_deg, longitude_deg);
    const StationSnapshotPtr active = require_snapshot();

    const GeodeticCoordinate target{latitude_deg, longitude_deg};
    const bool reporting_only = active->reporting_count > 0;
    const Station* best_station = nullptr;
    double best_distance = 0.0;
    // Stations are sorted by identifier, so a strict comparison keeps the
    // smallest identifier among equidistant candidates.
    for (const Station& station : active->stations) {
        if (reporting_only && !station.reporting) {
            continue;
        }
        const double distance = great_circle_deg(target, station.location);
        if (best_station == nullptr || distance < best_distance) {
            best_station = &station;
            best_distance = distance;
        }
    }
    if (best_station == nullptr) {
        throw ServiceError(ErrorKind::ServiceUnavailable, "Station index is empty");
    }
    return *best_station;
}

std::vector<StationDistance> StationIndex::nearest(double latitude_deg,
                                                   double longitude_deg,
                                                   std::size_t count,
                                                   double max_distance_deg,
                                                   bool reporting_only) const {
    validate_coordinate(latitude_deg, longitude_deg);
    const StationSnapshotPtr active = require_snapshot();

    const GeodeticCoordinate target{latitude_deg, longitude_deg};
    std::vector<StationDistance> candidates;
    for (const Station& station : active->stations) {
        if (reporting_only && !station.reporting) {
            continue;
        }
        const double distance_deg = great_circle_deg(target, station.location);
        if (distance_deg > max_distance_deg) {
            continue;
        }
        candidates.push_back(StationDistance{station, distance_deg, great_circle_km(target, station.location)});
    }

    const std::size_t keep = std::min(count, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(keep), candidates.end(), closer);
    candidates.resize(keep);
    return candidates;
}

std::vector<Station> StationIndex::search(std::string_view text, std::size_t count, bool reporting_only) const {
    const StationSnapshotPtr active = require_snapshot();
    const std::string query = to_upper(text);
    const std::vector<std::string> list_words = split_words(query);
    if (list_words.empty()) {
        return {};
    }

    std::vector<std::pair<int, const Station*>> list_matches;
    for (const Station& station : active->stations) {
        if (reporting_only && !station.reporting) {
            continue;
        }
        const std::optional<int> rank = match_rank(station, query, list_words);
        if (rank.has_value()) {
            list_matches.emplace_back(rank.value(), &station);
        }
    }
    // Stations are already sorted by identifier.
    std::stable_sort(list_matches.begin(), list_matches.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });

    std::vector<Station> list_stations;
    const std::size_t keep = std::min(count, list_matches.size());
    list_stations.reserve(keep);
    for (std::size_t index = 0; index < keep; ++index) {
        list_stations.push_back(*list_matches[index].second);
    }
    return list_stations;
}

void StationIndex::replace(std::vector<Station> stations, TimePoint loaded_at) {
    auto fresh = std::make_shared<StationSnapshot>();
    fresh->loaded_at = loaded_at;

    for (Station& station : stations) {
        station.identifier = normalize_code(station.identifier);
    }
    // Stable so the first occurrence of a duplicate identifier wins.
    std::stable_sort(stations.begin(), stations.end(), [](const Station& lhs, const Station& rhs) {
        return lhs.identifier < rhs.identifier;
    });
    fresh->stations.reserve(stations.size());
    std::size_t duplicate_count = 0;
    for (Station& station : stations) {
        if (fresh->map_by_code.count(station.identifier) > 0) {
            ++duplicate_count;
            logger_->warn("Duplicate station {} ignored during index load", station.identifier);
            continue;
        }
        if (station.reporting) {
            ++fresh->reporting_count;
        }
        fresh->map_by_code.emplace(station.identifier, fresh->stations.size());
        fresh->stations.push_back(std::move(station));
    }

    const std::size_t station_count = fresh->stations.size();
    const std::size_t reporting_count = fresh->reporting_count;
    {
        std::scoped_lock lock(mutex_);
        snapshot_ = std::move(fresh);
    }
    logger_->info(R"({{"component":"station_index","stations":{},"reporting":{},"duplicates":{}}})",
                  station_count,
                  reporting_count,
                  duplicate_count);
}

void StationIndex::reload(StationSource& source) {
    std::vector<Station> stations = source.list_all_stations();
    if (stations.empty()) {
        throw ServiceError(ErrorKind::ServiceUnavailable, "Station source returned no stations");
    }
    replace(std::move(stations));
}

bool StationIndex::loaded() const {
    return snapshot() != nullptr;
}

std::size_t StationIndex::size() const {
    const StationSnapshotPtr active = snapshot();
    return active == nullptr ? 0 : active->stations.size();
}

std::optional<TimePoint> StationIndex::loaded_at() const {
    const StationSnapshotPtr active = snapshot();
    if (active == nullptr) {
        return std::nullopt;
    }
    return active->loaded_at;
}

StationSnapshotPtr StationIndex::require_snapshot() const {
    StationSnapshotPtr active = snapshot();
    if (active == nullptr || active->stations.empty()) {
        throw ServiceError(ErrorKind::ServiceUnavailable, "Station index has not been loaded");
    }
    return active;
}

StationSnapshotPtr StationIndex::snapshot() const {
    std::scoped_lock lock(mutex_);
    return snapshot_;
}

}  // namespace wx_gateway
