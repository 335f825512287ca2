// === Service Errors ==========================================================
//
// Error taxonomy shared by every component. Failures travel as ServiceError
// exceptions tagged with an ErrorKind; the HTTP router maps the kind to a
// status code and the structured error body.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace wx_gateway {

/** @brief Classification of every failure surfaced to clients. */
enum class ErrorKind {
    InvalidInput,        /**< Malformed identifier, coordinate, or parameter. */
    NotFound,            /**< Unknown station or station without reports. */
    Unauthorized,        /**< Missing, unknown, or inactive token. */
    RateLimited,         /**< Account quota exhausted for the current window. */
    ServiceUnavailable,  /**< Index not loaded, upstream unreachable, or wait timed out. */
    UpstreamParseError,  /**< Parsing engine rejected the raw report. */
    InternalError        /**< Anything unexpected. */
};

/** @brief Exception carrying an ErrorKind and optional offending parameter. */
class ServiceError final : public std::runtime_error {
  public:
    ServiceError(ErrorKind kind, const std::string& message, std::string param = {});

    [[nodiscard]] ErrorKind kind() const noexcept;
    /** @brief Name of the request parameter at fault, empty if not applicable. */
    [[nodiscard]] const std::string& param() const noexcept;

  private:
    ErrorKind kind_;
    std::string str_param_;
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/** @brief HTTP status code used for responses carrying @p kind. */
[[nodiscard]] int http_status_for(ErrorKind kind) noexcept;

}  // namespace wx_gateway
