#include "wx_gateway/report.hpp"

#include <functional>

#include <fmt/format.h>

namespace wx_gateway {

std::string CacheKey::to_string() const {
    return fmt::format("{}:{}:{}", wx_gateway::to_string(report_type), station_id, join_options(options));
}

std::size_t CacheKeyHash::operator()(const CacheKey& key) const noexcept {
    std::size_t seed = std::hash<std::string>{}(key.station_id);
    const auto combine = [&seed](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    combine(static_cast<std::size_t>(key.report_type));
    for (const OutputOption option : key.options) {
        combine(static_cast<std::size_t>(option) + 1);
    }
    return seed;
}

CacheKey make_cache_key(const Station& station, ReportType report_type, const OptionSet& options) {
    return CacheKey{station.identifier, report_type, options};
}

}  // namespace wx_gateway
