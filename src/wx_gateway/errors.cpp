#include "wx_gateway/errors.hpp"

namespace wx_gateway {

ServiceError::ServiceError(ErrorKind kind, const std::string& message, std::string param)
    : std::runtime_error(message),
      kind_(kind),
      str_param_(std::move(param)) {}

ErrorKind ServiceError::kind() const noexcept {
    return kind_;
}

const std::string& ServiceError::param() const noexcept {
    return str_param_;
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput:
            return "InvalidInput";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::Unauthorized:
            return "Unauthorized";
        case ErrorKind::RateLimited:
            return "RateLimited";
        case ErrorKind::ServiceUnavailable:
            return "ServiceUnavailable";
        case ErrorKind::UpstreamParseError:
            return "UpstreamParseError";
        case ErrorKind::InternalError:
            return "InternalError";
    }
    return "InternalError";
}

int http_status_for(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput:
            return 400;
        case ErrorKind::NotFound:
            return 404;
        case ErrorKind::Unauthorized:
            return 401;
        case ErrorKind::RateLimited:
            return 429;
        case ErrorKind::ServiceUnavailable:
        case ErrorKind::UpstreamParseError:
            return 503;
        case ErrorKind::InternalError:
            return 500;
    }
    return 500;
}

}  // namespace wx_gateway
