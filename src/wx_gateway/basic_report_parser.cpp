#include "wx_gateway/basic_report_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "wx_gateway/errors.hpp"

namespace wx_gateway {

namespace {
constexpr std::array<std::string_view, 5> k_prefix_tokens{"METAR", "SPECI", "TAF", "AMD", "COR"};
constexpr std::array<std::string_view, 4> k_change_groups{"FM", "TEMPO", "BECMG", "PROB"};

std::vector<std::string> tokenize(const std::string& raw) {
    std::istringstream stream(raw);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool is_prefix_token(const std::string& token) {
    return std::find(k_prefix_tokens.begin(), k_prefix_tokens.end(), token) != k_prefix_tokens.end();
}

bool starts_change_group(const std::string& token) {
    return std::any_of(k_change_groups.begin(), k_change_groups.end(), [&token](std::string_view group) {
        return token.rfind(group, 0) == 0;
    });
}

/** @brief Decode a DDHHMMZ issue-time group; null when the token is not one. */
nlohmann::json decode_time(const std::string& token) {
    if (token.size() != 7 || token.back() != 'Z'
        || !std::all_of(token.begin(), token.end() - 1, [](unsigned char ch) { return std::isdigit(ch); })) {
        return nullptr;
    }
    nlohmann::json time{};
    time["repr"] = token;
    time["day"] = std::stoi(token.substr(0, 2));
    time["hour"] = std::stoi(token.substr(2, 2));
    time["minute"] = std::stoi(token.substr(4, 2));
    return time;
}

std::string join(const std::vector<std::string>& tokens, std::size_t begin, std::size_t end) {
    std::string joined;
    for (std::size_t index = begin; index < end; ++index) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += tokens[index];
    }
    return joined;
}
}  // namespace

nlohmann::json BasicReportParser::parse(const std::string& raw,
                                        const Station& station,
                                        ReportType report_type,
                                        const OptionSet& options) {
    const std::vector<std::string> tokens = tokenize(raw);
    std::size_t cursor = 0;
    while (cursor < tokens.size() && is_prefix_token(tokens[cursor])) {
        ++cursor;
    }
    if (cursor >= tokens.size()) {
        throw ServiceError(ErrorKind::UpstreamParseError, "Report is empty");
    }
    if (tokens[cursor] != station.identifier) {
        throw ServiceError(
            ErrorKind::UpstreamParseError,
            fmt::format("Report station {} does not match {}", tokens[cursor], station.identifier)
        );
    }
    const std::size_t body_begin = cursor;

    const auto iterator_remarks = std::find(tokens.begin() + static_cast<std::ptrdiff_t>(body_begin), tokens.end(), "RMK");
    const auto remarks_index = static_cast<std::size_t>(iterator_remarks - tokens.begin());

    nlohmann::json document{};
    document["raw"] = raw;
    document["sanitized"] = join(tokens, body_begin, tokens.size());
    document["station"] = station.identifier;
    document["time"] = body_begin + 1 < tokens.size() ? decode_time(tokens[body_begin + 1]) : nlohmann::json(nullptr);
    document["remarks"] = remarks_index < tokens.size() ? join(tokens, remarks_index + 1, tokens.size()) : std::string{};

    if (report_type == ReportType::Taf) {
        nlohmann::json forecast = nlohmann::json::array();
        std::size_t period_begin = std::min(body_begin + 2, remarks_index);
        for (std::size_t index = period_begin + 1; index <= remarks_index; ++index) {
            if (index == remarks_index || starts_change_group(tokens[index])) {
                forecast.push_back(nlohmann::json{{"sanitized", join(tokens, period_begin, index)}});
                period_begin = index;
            }
        }
        document["forecast"] = std::move(forecast);
    }

    for (const OutputOption option : {OutputOption::Translate, OutputOption::Summary, OutputOption::Speech}) {
        if (options.count(option) > 0) {
            document[std::string{to_string(option)}] = nullptr;
        }
    }
    return document;
}

}  // namespace wx_gateway
