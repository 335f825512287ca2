#include "wx_gateway/http_router.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>

#include <fmt/format.h>

#include "wx_gateway/response_renderer.hpp"

namespace wx_gateway {

namespace {
constexpr char k_allowed_methods[] = "GET, POST, OPTIONS";
constexpr char k_allowed_headers[] = "Authorization, Content-Type, Accept";

enum class Endpoint {
    Report,
    Station,
    Near,
    Parse,
    MultiReport,
    MultiStation,
    Search
};

struct RouteMatch final {
    Endpoint endpoint{Endpoint::Report};
    std::string method{"GET"};
    std::string report_type{};
    std::string argument{};
};

std::string to_lower(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

std::string percent_decode(std::string_view text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t index = 0; index < text.size(); ++index) {
        if (text[index] == '%' && index + 2 < text.size()) {
            const int high = hex_value(text[index + 1]);
            const int low = hex_value(text[index + 2]);
            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>(high * 16 + low);
                index += 2;
                continue;
            }
        }
        decoded += text[index];
    }
    return decoded;
}

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> list_segments;
    while (!path.empty()) {
        const auto slash = path.find('/');
        const std::string_view segment = path.substr(0, slash);
        if (!segment.empty()) {
            list_segments.push_back(percent_decode(segment));
        }
        path.remove_prefix(slash == std::string_view::npos ? path.size() : slash + 1);
    }
    return list_segments;
}

std::optional<RouteMatch> match_route(const std::vector<std::string>& list_segments) {
    if (list_segments.size() < 3 || list_segments[0] != "api") {
        return std::nullopt;
    }
    const std::string resource = to_lower(list_segments[1]);
    if (resource == "station") {
        if (list_segments.size() == 3) {
            return RouteMatch{Endpoint::Station, "GET", {}, list_segments[2]};
        }
        if (list_segments.size() == 4 && to_lower(list_segments[2]) == "near") {
            return RouteMatch{Endpoint::Near, "GET", {}, list_segments[3]};
        }
        return std::nullopt;
    }
    if (resource == "multi") {
        if (list_segments.size() != 4) {
            return std::nullopt;
        }
        const std::string target = to_lower(list_segments[2]);
        if (target == "station") {
            return RouteMatch{Endpoint::MultiStation, "GET", {}, list_segments[3]};
        }
        if (parse_report_type(target).has_value()) {
            return RouteMatch{Endpoint::MultiReport, "GET", target, list_segments[3]};
        }
        return std::nullopt;
    }
    if (resource == "search") {
        if (list_segments.size() == 3 && to_lower(list_segments[2]) == "station") {
            return RouteMatch{Endpoint::Search, "GET", {}, {}};
        }
        return std::nullopt;
    }
    if (resource == "parse") {
        if (list_segments.size() == 3 && parse_report_type(list_segments[2]).has_value()) {
            return RouteMatch{Endpoint::Parse, "POST", list_segments[2], {}};
        }
        return std::nullopt;
    }
    if (!parse_report_type(resource).has_value()) {
        return std::nullopt;
    }
    if (list_segments.size() == 3) {
        return RouteMatch{Endpoint::Report, "GET", resource, list_segments[2]};
    }
    if (list_segments.size() == 4 && to_lower(list_segments[2]) == "coord") {
        return RouteMatch{Endpoint::Report, "GET", resource, list_segments[3]};
    }
    return std::nullopt;
}

std::string query_value(const HttpRequest& request, const std::string& name) {
    const auto iterator = request.query.find(name);
    return iterator == request.query.end() ? std::string{} : iterator->second;
}
}  // namespace

std::optional<std::string> find_header(const HttpRequest& request, std::string_view name) {
    const std::string wanted = to_lower(name);
    for (const auto& [key, value] : request.headers) {
        if (to_lower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

std::string extract_token(const HttpRequest& request) {
    const auto authorization = find_header(request, "Authorization");
    if (authorization.has_value()) {
        const std::string& header = authorization.value();
        const auto space = header.find(' ');
        if (space != std::string::npos) {
            const std::string scheme = to_lower(std::string_view{header}.substr(0, space));
            if (scheme == "bearer" || scheme == "token") {
                const auto begin = header.find_first_not_of(' ', space);
                if (begin != std::string::npos) {
                    const auto end = header.find_last_not_of(" \t\r\n");
                    return header.substr(begin, end - begin + 1);
                }
            }
        }
    }
    return query_value(request, "token");
}

HttpRouter::HttpRouter(RequestDispatcher& dispatcher, ClockPtr clock)
    : dispatcher_(dispatcher),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (clock_ == nullptr) {
        throw std::invalid_argument("HttpRouter requires a clock");
    }
}

HttpResponse HttpRouter::handle(const HttpRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    HttpResponse response{};
    try {
        ResponseFormat format = ResponseFormat::Json;
        bool format_valid = true;
        const auto iterator_format = request.query.find("format");
        if (iterator_format != request.query.end()) {
            const auto parsed = parse_response_format(iterator_format->second);
            format_valid = parsed.has_value();
            format = parsed.value_or(ResponseFormat::Json);
        } else {
            const auto accept = find_header(request, "Accept");
            if (accept.has_value() && to_lower(accept.value()).find("application/xml") != std::string::npos) {
                format = ResponseFormat::Xml;
            }
        }

        if (!format_valid) {
            response = render_error(400, ErrorKind::InvalidInput,
                                    fmt::format("'{}' is not a supported format", iterator_format->second),
                                    "format", ResponseFormat::Json);
        } else {
            response = route(request, split_path(request.path), format);
        }
    } catch (const std::exception& error) {
        logger_->error(R"({{"component":"http_router","path":"{}","error":"{}"}})", request.path, error.what());
        response = HttpResponse{};
        response.status = 500;
        response.body = render_body(error_body(ErrorKind::InternalError, "An unexpected error occurred"),
                                    ResponseFormat::Json);
    }
    response.headers["Access-Control-Allow-Origin"] = "*";

    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
    logger_->info(R"({{"component":"http_router","method":"{}","path":"{}","status":{},"elapsed_ms":{:.1f}}})",
                  request.method, request.path, response.status, elapsed.count());
    return response;
}

HttpResponse HttpRouter::route(const HttpRequest& request,
                               const std::vector<std::string>& list_segments,
                               ResponseFormat format) {
    const std::optional<RouteMatch> match = match_route(list_segments);
    if (!match.has_value()) {
        return render_error(404, ErrorKind::NotFound, fmt::format("No route for {}", request.path), {}, format);
    }

    const std::string& method = request.method;
    if (method == "OPTIONS") {
        HttpResponse response{};
        response.status = 204;
        response.content_type.clear();
        response.headers["Access-Control-Allow-Methods"] = k_allowed_methods;
        response.headers["Access-Control-Allow-Headers"] = k_allowed_headers;
        response.headers["Access-Control-Max-Age"] = "86400";
        return response;
    }
    if (method != match->method) {
        HttpResponse response = render_error(
            405, ErrorKind::InvalidInput, fmt::format("Method {} is not allowed on {}", method, request.path), {}, format
        );
        response.headers["Allow"] = fmt::format("{}, OPTIONS", match->method);
        return response;
    }

    const std::string token = extract_token(request);
    switch (match->endpoint) {
        case Endpoint::Report:
            return render(dispatcher_.dispatch_report(
                              ReportRequest{match->report_type, match->argument, query_value(request, "options"), token}),
                          format);
        case Endpoint::Station:
            return render(dispatcher_.station_info(match->argument, token), format);
        case Endpoint::Near:
            return render(dispatcher_.near(NearRequest{match->argument,
                                                       query_value(request, "n"),
                                                       query_value(request, "maxdist"),
                                                       query_value(request, "reporting"),
                                                       token}),
                          format);
        case Endpoint::Parse:
            return render(dispatcher_.parse_given(
                              ParseRequest{match->report_type, request.body, query_value(request, "options"), token}),
                          format);
        case Endpoint::MultiReport:
            return render(dispatcher_.dispatch_multi(
                              MultiRequest{match->report_type, match->argument, query_value(request, "options"), token}),
                          format);
        case Endpoint::MultiStation:
            return render(dispatcher_.multi_station_info(match->argument, token), format);
        case Endpoint::Search:
            return render(dispatcher_.search_stations(SearchRequest{query_value(request, "text"),
                                                                    query_value(request, "n"),
                                                                    query_value(request, "reporting"),
                                                                    token}),
                          format);
    }
    return render_error(404, ErrorKind::NotFound, fmt::format("No route for {}", request.path), {}, format);
}

HttpResponse HttpRouter::render(const DispatchResult& result, ResponseFormat format) const {
    HttpResponse response{};
    response.status = result.status;
    response.content_type = content_type_for(format);
    response.body = render_body(result.body, format);

    if (result.quota.has_value() && result.quota->limit.has_value()) {
        const Decision& decision = result.quota.value();
        const auto reset_epoch = std::chrono::duration_cast<std::chrono::seconds>(
            decision.reset_at.time_since_epoch()
        );
        response.headers["X-RateLimit-Limit"] = std::to_string(decision.limit.value());
        response.headers["X-RateLimit-Remaining"] = std::to_string(std::max<std::int64_t>(decision.remaining, 0));
        response.headers["X-RateLimit-Reset"] = std::to_string(reset_epoch.count());
        if (result.error == ErrorKind::RateLimited) {
            const Duration until_reset = decision.reset_at - clock_->now();
            const auto retry_after = static_cast<long long>(std::ceil(std::max(until_reset.count(), 0.0)));
            response.headers["Retry-After"] = std::to_string(retry_after);
        }
    }
    return response;
}

HttpResponse HttpRouter::render_error(int status, ErrorKind kind, const std::string& message,
                                      const std::string& param, ResponseFormat format) const {
    HttpResponse response{};
    response.status = status;
    response.content_type = content_type_for(format);
    response.body = render_body(error_body(kind, message, param), format);
    return response;
}

}  // namespace wx_gateway
