#include "wx_gateway/curl_report_source.hpp"

#include <cctype>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/format.h>

#include "wx_gateway/errors.hpp"
#include "wx_gateway/version.hpp"

namespace wx_gateway {

namespace {
std::once_flag curl_once_flag;

void ensure_curl_initialized() {
    std::call_once(curl_once_flag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

std::size_t append_body(char* data, std::size_t size, std::size_t count, void* user_data) {
    auto* body = static_cast<std::string*>(user_data);
    body->append(data, size * count);
    return size * count;
}

std::string trim(const std::string& text) {
    std::size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    std::size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    return text.substr(first, last - first);
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
}  // namespace

std::string extract_first_report(const std::string& body, ReportType report_type) {
    std::istringstream stream(body);
    std::string line;
    std::string report;
    while (std::getline(stream, line)) {
        const std::string trimmed = trim(line);
        if (trimmed.empty()) {
            if (!report.empty()) {
                break;
            }
            continue;
        }
        if (report_type == ReportType::Metar) {
            return trimmed;
        }
        if (!report.empty()) {
            report += '\n';
        }
        report += trimmed;
    }
    return report;
}

CurlReportSource::CurlReportSource(CurlSourceConfig config)
    : config_(std::move(config)),
      logger_(get_logger()) {
    ensure_curl_initialized();
}

std::string CurlReportSource::url_for(const Station& station, ReportType report_type) const {
    return fmt::format("{}/{}?ids={}&format=raw", config_.base_url, to_string(report_type), station.identifier);
}

std::string CurlReportSource::fetch_raw(const Station& station, ReportType report_type) {
    CurlHandle handle(curl_easy_init(), &curl_easy_cleanup);
    if (handle == nullptr) {
        throw ServiceError(ErrorKind::ServiceUnavailable, "Unable to create HTTP client handle");
    }

    const std::string url = url_for(station, report_type);
    const std::string user_agent = fmt::format("wx_gateway/{}", k_version);
    const auto timeout_ms = static_cast<long>(config_.timeout.count() * 1000.0);
    char error_buffer[CURL_ERROR_SIZE] = {0};
    std::string body;

    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &append_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());

    const CURLcode result = curl_easy_perform(handle.get());
    if (result != CURLE_OK) {
        const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(result);
        logger_->error(R"({{"component":"curl_source","url":"{}","error":"{}"}})", url, detail);
        throw ServiceError(ErrorKind::ServiceUnavailable, "Unable to fetch report from aviationweather.gov: " + detail);
    }

    long http_status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &http_status);
    if (http_status == 204) {
        return {};
    }
    if (http_status < 200 || http_status >= 300) {
        logger_->error(R"({{"component":"curl_source","url":"{}","status":{}}})", url, http_status);
        throw ServiceError(ErrorKind::ServiceUnavailable, fmt::format("aviationweather.gov returned status {}", http_status));
    }
    return extract_first_report(body, report_type);
}

}  // namespace wx_gateway
