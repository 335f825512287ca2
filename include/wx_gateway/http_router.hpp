// === HTTP Router =============================================================
//
// Maps a transport-neutral HttpRequest onto the dispatcher and renders the
// outcome as an HttpResponse. The router knows nothing about sockets so the
// whole HTTP surface can be exercised directly from tests.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wx_gateway/clock.hpp"
#include "wx_gateway/logging.hpp"
#include "wx_gateway/request_dispatcher.hpp"
#include "wx_gateway/types.hpp"

namespace wx_gateway {

/** @brief Inbound request as collected by the HTTP server. */
struct HttpRequest final {
    std::string method{"GET"};
    std::string path{"/"};                        /**< Path without the query string; may be percent-encoded. */
    std::map<std::string, std::string> query{};   /**< Decoded query parameters. */
    std::map<std::string, std::string> headers{}; /**< Header names are matched case-insensitively. */
    std::string body{};
};

/** @brief Outbound response handed back to the HTTP server. */
struct HttpResponse final {
    int status{200};
    std::string content_type{"application/json"};
    std::string body{};
    std::map<std::string, std::string> headers{};
};

/** @brief Case-insensitive header lookup. */
[[nodiscard]] std::optional<std::string> find_header(const HttpRequest& request, std::string_view name);

/** @brief Token from "Authorization: Bearer|Token <t>", else the "token" query parameter. */
[[nodiscard]] std::string extract_token(const HttpRequest& request);

class HttpRouter final {
  public:
    HttpRouter(RequestDispatcher& dispatcher, ClockPtr clock);

    /** @brief Route @p request; never throws. */
    [[nodiscard]] HttpResponse handle(const HttpRequest& request);

  private:
    [[nodiscard]] HttpResponse route(const HttpRequest& request,
                                     const std::vector<std::string>& list_segments,
                                     ResponseFormat format);
    [[nodiscard]] HttpResponse render(const DispatchResult& result, ResponseFormat format) const;
    [[nodiscard]] HttpResponse render_error(int status, ErrorKind kind, const std::string& message,
                                            const std::string& param, ResponseFormat format) const;

    RequestDispatcher& dispatcher_;
    ClockPtr clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wx_gateway
