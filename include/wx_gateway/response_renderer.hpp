#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "wx_gateway/errors.hpp"
#include "wx_gateway/station.hpp"
#include "wx_gateway/types.hpp"

namespace wx_gateway {

/** @brief Station metadata as exposed to clients. */
[[nodiscard]] nlohmann::json station_to_json(const Station& station);

/** @brief Structured error body: {"error", "kind", optional "param"}. */
[[nodiscard]] nlohmann::json error_body(ErrorKind kind, const std::string& message, const std::string& param = {});

/** @brief Serialize @p document in the requested encoding. */
[[nodiscard]] std::string render_body(const nlohmann::json& document, ResponseFormat format);

/** @brief MIME type matching render_body's output. */
[[nodiscard]] std::string content_type_for(ResponseFormat format);

}  // namespace wx_gateway
