// === HTTP Server =============================================================
//
// libmicrohttpd front end. Each connection runs on its own thread; the server
// only collects the request and hands it to the HttpRouter.

#pragma once

#include <cstdint>
#include <memory>

#include <microhttpd.h>

#include "wx_gateway/http_router.hpp"
#include "wx_gateway/logging.hpp"

namespace wx_gateway {

class HttpServer final {
  public:
    HttpServer(HttpRouter& router, std::uint16_t port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /** @brief Start listening; throws std::runtime_error when the port cannot be bound. */
    void start();
    void stop();

  private:
    static MHD_Result handle_connection(void* cls,
                                        MHD_Connection* connection,
                                        const char* url,
                                        const char* method,
                                        const char* version,
                                        const char* upload_data,
                                        std::size_t* upload_data_size,
                                        void** con_cls);
    static void request_completed(void* cls,
                                  MHD_Connection* connection,
                                  void** con_cls,
                                  MHD_RequestTerminationCode termination_code);
    static MHD_Result collect_value(void* cls, MHD_ValueKind kind, const char* key, const char* value);

    MHD_Result respond(MHD_Connection* connection, const HttpResponse& response) const;

    HttpRouter& router_;
    std::uint16_t port_;
    std::unique_ptr<MHD_Daemon, decltype(&MHD_stop_daemon)> daemon_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wx_gateway
