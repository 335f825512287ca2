#include "wx_gateway/request_dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>
#include <stdexcept>

#include <fmt/format.h>

#include "wx_gateway/response_renderer.hpp"

namespace wx_gateway {

namespace {
constexpr std::size_t k_code_length{4};
constexpr std::size_t k_min_raw_length{4};
constexpr int k_default_result_count{10};
constexpr int k_max_result_count{200};
constexpr double k_default_near_distance_deg{10.0};
constexpr double k_max_near_distance_deg{360.0};
constexpr std::size_t k_min_search_length{3};
constexpr std::size_t k_max_search_length{200};

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1)};
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return text;
}

bool is_station_code(const std::string& text) {
    return text.size() == k_code_length
        && std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isalnum(ch); });
}

/** @brief Parse a whole-string double; std::nullopt if any character is left over. */
std::optional<double> parse_double(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<int> parse_int(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

ReportType require_report_type(std::string_view text) {
    const auto report_type = parse_report_type(trim(text));
    if (!report_type.has_value()) {
        throw ServiceError(ErrorKind::InvalidInput, fmt::format("'{}' is not a valid report type", text), "report_type");
    }
    return report_type.value();
}

GeodeticCoordinate require_coordinate(std::string_view text) {
    const auto location = parse_location(text);
    if (!std::holds_alternative<GeodeticCoordinate>(location)) {
        throw ServiceError(ErrorKind::InvalidInput, fmt::format("'{}' is not a lat,lon pair", text), "coord");
    }
    return std::get<GeodeticCoordinate>(location);
}

int parse_count(const std::string& text) {
    if (trim(text).empty()) {
        return k_default_result_count;
    }
    const auto parsed = parse_int(trim(text));
    if (!parsed.has_value() || parsed.value() < 1 || parsed.value() > k_max_result_count) {
        throw ServiceError(ErrorKind::InvalidInput,
                           fmt::format("n must be an integer between 1 and {}", k_max_result_count), "n");
    }
    return parsed.value();
}

bool parse_reporting_flag(const std::string& text) {
    const std::string reporting = to_upper(trim(text));
    if (reporting == "FALSE" || reporting == "0" || reporting == "NO") {
        return false;
    }
    if (!reporting.empty() && reporting != "TRUE" && reporting != "1" && reporting != "YES") {
        throw ServiceError(ErrorKind::InvalidInput, "reporting must be true or false", "reporting");
    }
    return true;
}

/** @brief Station identifier inside a raw report: first word, or second after a METAR/TAF prefix. */
std::string station_in_report(const std::string& raw) {
    std::string_view rest{raw};
    std::string words[2];
    for (std::string& word : words) {
        const auto begin = rest.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(begin);
        const auto end = rest.find_first_of(" \t\r\n");
        word = std::string{rest.substr(0, end)};
        rest.remove_prefix(end == std::string_view::npos ? rest.size() : end);
    }
    const std::string first = to_upper(words[0]);
    if (first == "METAR" || first == "SPECI" || first == "TAF") {
        return to_upper(words[1]);
    }
    return first;
}
}  // namespace

std::string_view to_string(RequestState state) noexcept {
    switch (state) {
        case RequestState::Received:
            return "received";
        case RequestState::Validated:
            return "validated";
        case RequestState::Resolved:
            return "resolved";
        case RequestState::Admitted:
            return "admitted";
        case RequestState::CacheHit:
            return "cache_hit";
        case RequestState::Fetching:
            return "fetching";
        case RequestState::Fetched:
            return "fetched";
        case RequestState::FetchFailed:
            return "fetch_failed";
        case RequestState::Responded:
            return "responded";
        case RequestState::Rejected:
            return "rejected";
    }
    return "unknown";
}

Location parse_location(std::string_view text) {
    const std::string trimmed = trim(text);
    const auto comma = trimmed.find(',');
    if (comma == std::string::npos) {
        const std::string code = to_upper(trimmed);
        if (!is_station_code(code)) {
            throw ServiceError(ErrorKind::InvalidInput,
                               fmt::format("'{}' is not a valid station identifier", trimmed), "station");
        }
        return code;
    }

    const auto latitude = parse_double(trim(std::string_view{trimmed}.substr(0, comma)));
    const auto longitude = parse_double(trim(std::string_view{trimmed}.substr(comma + 1)));
    if (!latitude.has_value() || !longitude.has_value()) {
        throw ServiceError(ErrorKind::InvalidInput, fmt::format("'{}' is not a valid coordinate", trimmed), "coord");
    }
    validate_coordinate(latitude.value(), longitude.value());
    return GeodeticCoordinate{latitude.value(), longitude.value()};
}

std::vector<std::string> parse_station_list(std::string_view text) {
    std::vector<std::string> list_codes;
    std::string_view rest = text;
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        const std::string code = to_upper(trim(rest.substr(0, comma)));
        rest.remove_prefix(comma == std::string_view::npos ? rest.size() : comma + 1);
        if (code.empty()) {
            continue;
        }
        if (!is_station_code(code)) {
            throw ServiceError(ErrorKind::InvalidInput,
                               fmt::format("'{}' is not a valid station identifier", code), "stations");
        }
        if (std::find(list_codes.begin(), list_codes.end(), code) == list_codes.end()) {
            list_codes.push_back(code);
        }
    }
    if (list_codes.empty()) {
        throw ServiceError(ErrorKind::InvalidInput, "At least one station is required", "stations");
    }
    if (list_codes.size() > k_max_multi_stations) {
        throw ServiceError(ErrorKind::InvalidInput,
                           fmt::format("Multi requests are limited to {} stations or less", k_max_multi_stations),
                           "stations");
    }
    return list_codes;
}

OptionSet parse_options(std::string_view text) {
    OptionSet options{};
    std::string_view rest = text;
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        const std::string name = trim(rest.substr(0, comma));
        rest.remove_prefix(comma == std::string_view::npos ? rest.size() : comma + 1);
        if (name.empty()) {
            continue;
        }
        const auto option = parse_output_option(name);
        if (!option.has_value()) {
            throw ServiceError(ErrorKind::InvalidInput, fmt::format("'{}' is not a valid option", name), "options");
        }
        options.insert(option.value());
    }
    return options;
}

RequestDispatcher::RequestDispatcher(StationIndex& station_index,
                                     QuotaLedger& quota_ledger,
                                     ReportCache& report_cache,
                                     std::shared_ptr<ReportFetcher> fetcher,
                                     std::shared_ptr<ReportParser> parser,
                                     ClockPtr clock)
    : station_index_(station_index),
      quota_ledger_(quota_ledger),
      report_cache_(report_cache),
      fetcher_(std::move(fetcher)),
      parser_(std::move(parser)),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (fetcher_ == nullptr || parser_ == nullptr || clock_ == nullptr) {
        throw std::invalid_argument("RequestDispatcher requires a fetcher, a parser, and a clock");
    }
}

DispatchResult RequestDispatcher::dispatch_report(const ReportRequest& request) {
    DispatchResult result{};
    try {
        const ReportType report_type = require_report_type(request.report_type);
        const Location location = parse_location(request.location);
        const OptionSet options = parse_options(request.options);
        result.last_stage = RequestState::Validated;

        const Station station = std::holds_alternative<std::string>(location)
            ? station_index_.resolve_by_code(std::get<std::string>(location))
            : station_index_.resolve_by_coordinate(std::get<GeodeticCoordinate>(location).latitude_deg,
                                                   std::get<GeodeticCoordinate>(location).longitude_deg);
        result.last_stage = RequestState::Resolved;

        admit(request.token, result);

        if (!station.reporting) {
            throw ServiceError(ErrorKind::NotFound,
                               fmt::format("{} does not publish reports", station.identifier), "station");
        }

        result.last_stage = RequestState::Fetching;
        CacheLookup lookup{};
        try {
            lookup = lookup_report(station, report_type, options);
        } catch (const std::exception&) {
            result.last_stage = RequestState::FetchFailed;
            throw;
        }
        result.cache_outcome = lookup.outcome;
        result.last_stage = lookup.outcome == CacheOutcome::Hit ? RequestState::CacheHit : RequestState::Fetched;

        nlohmann::json body{};
        body["meta"] = make_meta(lookup.report->fetched_at);
        if (lookup.report->payload.is_object()) {
            body.update(lookup.report->payload);
        } else {
            body["data"] = lookup.report->payload;
        }
        if (options.count(OutputOption::Info) > 0) {
            body["info"] = station_to_json(station);
        }
        result.status = 200;
        result.body = std::move(body);
        result.state = RequestState::Responded;
    } catch (const ServiceError& error) {
        fail(result, error.kind(), error.what(), error.param());
    } catch (const std::exception& error) {
        fail_internal(result, "report", error);
    }
    log_result("report", result);
    return result;
}

DispatchResult RequestDispatcher::station_info(std::string_view code, std::string_view token) {
    DispatchResult result{};
    try {
        const Location location = parse_location(code);
        if (!std::holds_alternative<std::string>(location)) {
            throw ServiceError(ErrorKind::InvalidInput, fmt::format("'{}' is not a valid station identifier", code), "station");
        }
        result.last_stage = RequestState::Validated;

        const Station station = station_index_.resolve_by_code(std::get<std::string>(location));
        result.last_stage = RequestState::Resolved;

        admit(token, result);

        nlohmann::json body = station_to_json(station);
        body["meta"] = make_meta(std::nullopt);
        result.status = 200;
        result.body = std::move(body);
        result.state = RequestState::Responded;
    } catch (const ServiceError& error) {
        fail(result, error.kind(), error.what(), error.param());
    } catch (const std::exception& error) {
        fail_internal(result, "station", error);
    }
    log_result("station", result);
    return result;
}

DispatchResult RequestDispatcher::near(const NearRequest& request) {
    DispatchResult result{};
    try {
        const GeodeticCoordinate coordinate = require_coordinate(request.coordinate);

        const int count = parse_count(request.count);

        double max_distance_deg = k_default_near_distance_deg;
        if (!trim(request.max_distance).empty()) {
            const auto parsed = parse_double(trim(request.max_distance));
            if (!parsed.has_value() || !(parsed.value() >= 0.0 && parsed.value() <= k_max_near_distance_deg)) {
                throw ServiceError(ErrorKind::InvalidInput,
                                   fmt::format("maxdist must be between 0 and {}", k_max_near_distance_deg), "maxdist");
            }
            max_distance_deg = parsed.value();
        }

        const bool reporting_only = parse_reporting_flag(request.reporting);
        result.last_stage = RequestState::Validated;

        const std::vector<StationDistance> list_nearest = station_index_.nearest(
            coordinate.latitude_deg, coordinate.longitude_deg, static_cast<std::size_t>(count), max_distance_deg, reporting_only
        );
        result.last_stage = RequestState::Resolved;

        admit(request.token, result);

        nlohmann::json stations = nlohmann::json::array();
        for (const StationDistance& entry : list_nearest) {
            stations.push_back(nlohmann::json{
                {"station", station_to_json(entry.station)},
                {"distance_deg", entry.distance_deg},
                {"distance_km", entry.distance_km},
            });
        }
        nlohmann::json body{};
        body["meta"] = make_meta(std::nullopt);
        body["stations"] = std::move(stations);
        result.status = 200;
        result.body = std::move(body);
        result.state = RequestState::Responded;
    } catch (const ServiceError& error) {
        fail(result, error.kind(), error.what(), error.param());
    } catch (const std::exception& error) {
        fail_internal(result, "near", error);
    }
    log_result("near", result);
    return result;
}

DispatchResult RequestDispatcher::parse_given(const ParseRequest& request) {
    DispatchResult result{};
    try {
        const ReportType report_type = require_report_type(request.report_type);
        const std::string raw = trim(request.report);
        if (raw.size() < k_min_raw_length) {
            throw ServiceError(ErrorKind::InvalidInput, "Report text is too short", "report");
        }
        if (raw.find_first_of("{[") != std::string::npos) {
            throw ServiceError(ErrorKind::InvalidInput, "Report text must be plain text", "report");
        }
        const OptionSet options = parse_options(request.options);
        const std::string code = station_in_report(raw);
        if (!is_station_code(code)) {
            throw ServiceError(ErrorKind::InvalidInput,
                               fmt::format("'{}' is not a valid station identifier", code), "report");
        }
        result.last_stage = RequestState::Validated;

        const Station station = station_index_.resolve_by_code(code);
        result.last_stage = RequestState::Resolved;

        admit(request.token, result);

        nlohmann::json payload{};
        try {
            payload = parser_->parse(raw, station, report_type, options);
        } catch (const ServiceError&) {
            throw;
        } catch (const std::exception& error) {
            throw ServiceError(ErrorKind::UpstreamParseError,
                               fmt::format("Could not parse the {} report: {}", to_string(report_type), error.what()));
        }

        nlohmann::json body{};
        body["meta"] = make_meta(std::nullopt);
        if (payload.is_object()) {
            body.update(payload);
        } else {
            body["data"] = std::move(payload);
        }
        if (options.count(OutputOption::Info) > 0) {
            body["info"] = station_to_json(station);
        }
        result.status = 200;
        result.body = std::move(body);
        result.state = RequestState::Responded;
    } catch (const ServiceError& error) {
        fail(result, error.kind(), error.what(), error.param());
    } catch (const std::exception& error) {
        fail_internal(result, "parse", error);
    }
    log_result("parse", result);
    return result;
}

DispatchResult RequestDispatcher::dispatch_multi(const MultiRequest& request) {
    DispatchResult result{};
    try {
        const ReportType report_type = require_report_type(request.report_type);
        const std::vector<std::string> list_codes = parse_station_list(request.stations);
        const OptionSet options = parse_options(request.options);
        result.last_stage = RequestState::Validated;

        const std::vector<Station> list_stations = resolve_station_list(list_codes);
        result.last_stage = RequestState::Resolved;

        admit(request.token, result);

        result.last_stage = RequestState::Fetching;
        std::vector<std::future<CacheLookup>> list_lookups;
        list_lookups.reserve(list_stations.size());
        for (const Station& station : list_stations) {
            if (!station.reporting) {
                list_lookups.emplace_back();
                continue;
            }
            list_lookups.push_back(std::async(std::launch::async, [this, &station, report_type, &options]() {
                return lookup_report(station, report_type, options);
            }));
        }

        nlohmann::json reports = nlohmann::json::object();
        std::size_t hit_count = 0;
        for (std::size_t index = 0; index < list_stations.size(); ++index) {
            const Station& station = list_stations[index];
            if (!list_lookups[index].valid()) {
                logger_->debug(R"({{"component":"dispatcher","operation":"multi","station":"{}","skipped":"not reporting"}})",
                               station.identifier);
                continue;
            }
            try {
                const CacheLookup lookup = list_lookups[index].get();
                hit_count += lookup.outcome == CacheOutcome::Hit ? 1 : 0;
                nlohmann::json payload{};
                payload["meta"] = make_meta(lookup.report->fetched_at);
                if (lookup.report->payload.is_object()) {
                    payload.update(lookup.report->payload);
                } else {
                    payload["data"] = lookup.report->payload;
                }
                if (options.count(OutputOption::Info) > 0) {
                    payload["info"] = station_to_json(station);
                }
                reports[station.identifier] = std::move(payload);
            } catch (const std::exception& error) {
                logger_->warn(R"({{"component":"dispatcher","operation":"multi","station":"{}","error":"{}"}})",
                              station.identifier, error.what());
            }
        }
        if (reports.empty()) {
            result.last_stage = RequestState::FetchFailed;
        } else {
            result.last_stage = hit_count == reports.size() ? RequestState::CacheHit : RequestState::Fetched;
        }

        nlohmann::json body{};
        body["meta"] = make_meta(std::nullopt);
        body["reports"] = std::move(reports);
        result.status = 200;
        result.body = std::move(body);
        result.state = RequestState::Responded;
    } catch (const ServiceError& error) {
        fail(result, error.kind(), error.what(), error.param());
    } catch (const std::exception& error) {
        fail_internal(result, "multi", error);
    }
    log_result("multi", result);
    return result;
}

DispatchResult RequestDispatcher::multi_station_info(std::string_view codes, std::string_view token) {
    DispatchResult result{};
    try {
        const std::vector<std::string> list_codes = parse_station_list(codes);
        result.last_stage = RequestState::Validated;

        const std::vector<Station> list_stations = resolve_station_list(list_codes);
        result.last_stage = RequestState::Resolved;

        admit(token, result);

        nlohmann::json stations = nlohmann::json::object();
        for (const Station& station : list_stations) {
            stations[station.identifier] = station_to_json(station);
        }
        nlohmann::json body{};
        body["meta"] = make_meta(std::nullopt);
        body["stations"] = std::move(stations);
        result.status = 200;
        result.body = std::move(body);
        result.state = RequestState::Responded;
    } catch (const ServiceError& error) {
        fail(result, error.kind(), error.what(), error.param());
    } catch (const std::exception& error) {
        fail_internal(result, "multi_station", error);
    }
    log_result("multi_station", result);
    return result;
}

DispatchResult RequestDispatcher::search_stations(const SearchRequest& request) {
    DispatchResult result{};
    try {
        const std::string text = trim(request.text);
        if (text.size() < k_min_search_length || text.size() > k_max_search_length) {
            throw ServiceError(ErrorKind::InvalidInput,
                               fmt::format("text must be between {} and {} characters", k_min_search_length, k_max_search_length),
                               "text");
        }
        const int count = parse_count(request.count);
        const bool reporting_only = parse_reporting_flag(request.reporting);
        result.last_stage = RequestState::Validated;

        const std::vector<Station> list_matches =
            station_index_.search(text, static_cast<std::size_t>(count), reporting_only);
        result.last_stage = RequestState::Resolved;

        admit(request.token, result);

        nlohmann::json stations = nlohmann::json::array();
        for (const Station& station : list_matches) {
            stations.push_back(station_to_json(station));
        }
        nlohmann::json body{};
        body["meta"] = make_meta(std::nullopt);
        body["stations"] = std::move(stations);
        result.status = 200;
        result.body = std::move(body);
        result.state = RequestState::Responded;
    } catch (const ServiceError& error) {
        fail(result, error.kind(), error.what(), error.param());
    } catch (const std::exception& error) {
        fail_internal(result, "search", error);
    }
    log_result("search", result);
    return result;
}

CacheLookup RequestDispatcher::lookup_report(const Station& station, ReportType report_type, const OptionSet& options) {
    return report_cache_.get_or_fetch(make_cache_key(station, report_type, options), [&]() {
        return fetcher_->fetch(station, report_type, options);
    });
}

std::vector<Station> RequestDispatcher::resolve_station_list(const std::vector<std::string>& list_codes) const {
    std::vector<Station> list_stations;
    list_stations.reserve(list_codes.size());
    for (const std::string& code : list_codes) {
        try {
            list_stations.push_back(station_index_.resolve_by_code(code));
        } catch (const ServiceError& error) {
            if (error.kind() != ErrorKind::NotFound) {
                throw;
            }
            throw ServiceError(ErrorKind::InvalidInput, fmt::format("{} is not a known station", code), "stations");
        }
    }
    return list_stations;
}

void RequestDispatcher::admit(std::string_view token, DispatchResult& result) {
    Decision decision = quota_ledger_.check_and_increment(token);
    result.quota = decision;
    if (!decision.admitted) {
        throw ServiceError(decision.reason.value_or(ErrorKind::Unauthorized), decision.message);
    }
    result.last_stage = RequestState::Admitted;
}

nlohmann::json RequestDispatcher::make_meta(std::optional<TimePoint> cache_timestamp) const {
    nlohmann::json meta{};
    meta["timestamp"] = format_iso8601(clock_->now());
    meta["cache_timestamp"] = cache_timestamp.has_value()
        ? nlohmann::json(format_iso8601(cache_timestamp.value()))
        : nlohmann::json(nullptr);
    const auto stations_updated = station_index_.loaded_at();
    meta["stations_updated"] = stations_updated.has_value()
        ? nlohmann::json(format_iso8601(stations_updated.value()))
        : nlohmann::json(nullptr);
    return meta;
}

void RequestDispatcher::fail(DispatchResult& result, ErrorKind kind, const std::string& message, const std::string& param) {
    result.status = http_status_for(kind);
    result.error = kind;
    result.body = error_body(kind, message, param);
    result.state = result.last_stage >= RequestState::Admitted ? RequestState::Responded : RequestState::Rejected;
}

void RequestDispatcher::fail_internal(DispatchResult& result, std::string_view operation, const std::exception& error) const {
    logger_->error(R"({{"component":"dispatcher","operation":"{}","stage":"{}","error":"{}"}})",
                   operation, to_string(result.last_stage), error.what());
    fail(result, ErrorKind::InternalError, "An unexpected error occurred");
}

void RequestDispatcher::log_result(std::string_view operation, const DispatchResult& result) const {
    logger_->debug(R"({{"component":"dispatcher","operation":"{}","state":"{}","stage":"{}","status":{}}})",
                   operation, to_string(result.state), to_string(result.last_stage), result.status);
}

}  // namespace wx_gateway
