#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "http_server.hpp"
#include "wx_gateway/configuration.hpp"
#include "wx_gateway/gateway_runtime.hpp"
#include "wx_gateway/logging.hpp"
#include "wx_gateway/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace wx_gateway;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        get_logger()->info("wx_gateway {} starting", k_version);

        GatewayComponents components = make_default_components(configuration);
        GatewayRuntime runtime{configuration, std::move(components)};
        runtime.initialize();
        runtime.run();

        HttpServer server{runtime.router(), configuration.http_port};
        server.start();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        server.stop();
        runtime.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
