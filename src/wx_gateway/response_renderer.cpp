#include "wx_gateway/response_renderer.hpp"

#include <cctype>

namespace wx_gateway {

namespace {
constexpr char k_xml_root[] = "response";

std::string escape_xml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (const char ch : text) {
        switch (ch) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&apos;";
                break;
            default:
                escaped += ch;
        }
    }
    return escaped;
}

/** @brief Keys become element names; characters XML forbids are replaced. */
std::string element_name(const std::string& key) {
    std::string name;
    for (const char ch : key) {
        const auto uch = static_cast<unsigned char>(ch);
        name += (std::isalnum(uch) || ch == '_' || ch == '-' || ch == '.') ? ch : '_';
    }
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name.front())) || name.front() == '_')) {
        name.insert(name.begin(), '_');
    }
    return name;
}

void append_xml(std::string& out, const std::string& name, const nlohmann::json& value) {
    if (value.is_null()) {
        out += "<" + name + "/>";
        return;
    }
    out += "<" + name + ">";
    if (value.is_object()) {
        for (const auto& item : value.items()) {
            append_xml(out, element_name(item.key()), item.value());
        }
    } else if (value.is_array()) {
        for (const nlohmann::json& child : value) {
            append_xml(out, "item", child);
        }
    } else if (value.is_string()) {
        out += escape_xml(value.get<std::string>());
    } else {
        out += escape_xml(value.dump());
    }
    out += "</" + name + ">";
}
}  // namespace

nlohmann::json station_to_json(const Station& station) {
    nlohmann::json document{};
    document["icao"] = station.identifier;
    document["name"] = station.name;
    document["country"] = station.country;
    document["latitude"] = station.location.latitude_deg;
    document["longitude"] = station.location.longitude_deg;
    document["elevation_m"] = station.elevation_m.has_value() ? nlohmann::json(station.elevation_m.value()) : nlohmann::json(nullptr);
    document["reporting"] = station.reporting;
    return document;
}

nlohmann::json error_body(ErrorKind kind, const std::string& message, const std::string& param) {
    nlohmann::json document{};
    document["error"] = message;
    document["kind"] = std::string{to_string(kind)};
    if (!param.empty()) {
        document["param"] = param;
    }
    return document;
}

std::string render_body(const nlohmann::json& document, ResponseFormat format) {
    if (format == ResponseFormat::Xml) {
        std::string out = R"(<?xml version="1.0" encoding="UTF-8"?>)";
        append_xml(out, k_xml_root, document);
        return out;
    }
    return document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string content_type_for(ResponseFormat format) {
    return format == ResponseFormat::Xml ? "application/xml" : "application/json";
}

}  // namespace wx_gateway
