// === Basic Report Parser =====================================================
//
// Minimal stand-in for the external parsing engine. It validates that the raw
// text belongs to the requested station and splits out the elements every
// consumer needs (station, issue time, remarks, TAF forecast periods). Content
// semantics such as translations, summaries, and speech are left null.

#pragma once

#include "wx_gateway/upstream_fetcher.hpp"

namespace wx_gateway {

class BasicReportParser final : public ReportParser {
  public:
    [[nodiscard]] nlohmann::json parse(const std::string& raw,
                                       const Station& station,
                                       ReportType report_type,
                                       const OptionSet& options) override;
};

}  // namespace wx_gateway
