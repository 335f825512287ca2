#include "http_server.hpp"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace wx_gateway {

namespace {
constexpr std::size_t k_max_body_bytes{64 * 1024};
constexpr unsigned int k_connection_timeout_s{30};

/** @brief Per-connection state carried across the access-handler calls of one request. */
struct ConnectionState final {
    std::string body{};
    bool body_too_large{false};
};
}  // namespace

HttpServer::HttpServer(HttpRouter& router, std::uint16_t port)
    : router_(router),
      port_(port),
      daemon_(nullptr, &MHD_stop_daemon),
      logger_(get_logger()) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (daemon_ != nullptr) {
        return;
    }
    MHD_Daemon* daemon = MHD_start_daemon(
        MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_ERROR_LOG,
        port_,
        nullptr,
        nullptr,
        &HttpServer::handle_connection,
        this,
        MHD_OPTION_NOTIFY_COMPLETED,
        &HttpServer::request_completed,
        nullptr,
        MHD_OPTION_CONNECTION_TIMEOUT,
        k_connection_timeout_s,
        MHD_OPTION_END
    );
    if (daemon == nullptr) {
        throw std::runtime_error(fmt::format("Unable to start HTTP server on port {}", port_));
    }
    daemon_.reset(daemon);
    logger_->info("HTTP server listening on port {}", port_);
}

void HttpServer::stop() {
    if (daemon_ == nullptr) {
        return;
    }
    daemon_.reset();
    logger_->info("HTTP server stopped");
}

MHD_Result HttpServer::handle_connection(void* cls,
                                         MHD_Connection* connection,
                                         const char* url,
                                         const char* method,
                                         const char*,
                                         const char* upload_data,
                                         std::size_t* upload_data_size,
                                         void** con_cls) {
    auto* server = static_cast<HttpServer*>(cls);
    if (*con_cls == nullptr) {
        // Ownership passes to libmicrohttpd until request_completed.
        *con_cls = std::make_unique<ConnectionState>().release();
        return MHD_YES;
    }
    auto* state = static_cast<ConnectionState*>(*con_cls);
    if (*upload_data_size != 0) {
        if (state->body.size() + *upload_data_size > k_max_body_bytes) {
            state->body_too_large = true;
        } else {
            state->body.append(upload_data, *upload_data_size);
        }
        *upload_data_size = 0;
        return MHD_YES;
    }

    try {
        if (state->body_too_large) {
            HttpResponse response{};
            response.status = 413;
            response.body = R"({"error":"Request body is too large","kind":"InvalidInput"})";
            response.headers["Access-Control-Allow-Origin"] = "*";
            return server->respond(connection, response);
        }

        HttpRequest request{};
        request.method = method;
        request.path = url;
        request.body = std::move(state->body);
        MHD_get_connection_values(connection, MHD_HEADER_KIND, &HttpServer::collect_value, &request.headers);
        MHD_get_connection_values(connection, MHD_GET_ARGUMENT_KIND, &HttpServer::collect_value, &request.query);

        return server->respond(connection, server->router_.handle(request));
    } catch (const std::exception& exc) {
        server->logger_->error(R"({{"component":"http_server","path":"{}","error":"{}"}})", url, exc.what());
        return MHD_NO;
    }
}

void HttpServer::request_completed(void*, MHD_Connection*, void** con_cls, MHD_RequestTerminationCode) {
    const std::unique_ptr<ConnectionState> state{static_cast<ConnectionState*>(*con_cls)};
    *con_cls = nullptr;
}

MHD_Result HttpServer::collect_value(void* cls, MHD_ValueKind, const char* key, const char* value) {
    auto* map_values = static_cast<std::map<std::string, std::string>*>(cls);
    if (key != nullptr) {
        (*map_values)[key] = value == nullptr ? std::string{} : std::string{value};
    }
    return MHD_YES;
}

MHD_Result HttpServer::respond(MHD_Connection* connection, const HttpResponse& response) const {
    MHD_Response* mhd_response = MHD_create_response_from_buffer(
        response.body.size(),
        const_cast<char*>(response.body.data()),
        MHD_RESPMEM_MUST_COPY
    );
    if (mhd_response == nullptr) {
        logger_->error("Unable to allocate HTTP response");
        return MHD_NO;
    }
    if (!response.content_type.empty()) {
        MHD_add_response_header(mhd_response, MHD_HTTP_HEADER_CONTENT_TYPE, response.content_type.c_str());
    }
    for (const auto& [name, value] : response.headers) {
        MHD_add_response_header(mhd_response, name.c_str(), value.c_str());
    }
    const MHD_Result result = MHD_queue_response(connection, static_cast<unsigned int>(response.status), mhd_response);
    MHD_destroy_response(mhd_response);
    return result;
}

}  // namespace wx_gateway
