#include <chrono>
#include <memory>
#include <thread>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "test_support.hpp"
#include "wx_gateway/basic_report_parser.hpp"
#include "wx_gateway/gateway_runtime.hpp"

using namespace wx_gateway;
using wx_gateway::test::ManualClock;
using wx_gateway::test::ScriptedReportSource;
using wx_gateway::test::VectorStationSource;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    wx_gateway::test::ensure_logger_initialized();
    return true;
}();

struct RuntimeHarness final {
    RuntimeHarness()
        : clock(std::make_shared<ManualClock>()),
          stations(std::make_shared<VectorStationSource>(wx_gateway::test::new_york_stations())),
          accounts(std::make_shared<InMemoryAccountStore>()),
          reports(std::make_shared<ScriptedReportSource>()) {
        accounts->put_account(Account{"abc", "free", 100, true});
        reports->map_reports["KJFK"] = "KJFK 121651Z 31008KT 10SM FEW250 02/M12 A3012 RMK AO2";
    }

    GatewayComponents components() const {
        GatewayComponents bundle{};
        bundle.station_source = stations;
        bundle.account_store = accounts;
        bundle.report_source = reports;
        bundle.report_parser = std::make_shared<BasicReportParser>();
        bundle.clock = clock;
        return bundle;
    }

    static Configuration configuration() {
        Configuration config{};
        config.cache.ttl = Duration{120.0};
        config.cache_sweep_interval = Duration{0.0};
        return config;
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<VectorStationSource> stations;
    std::shared_ptr<InMemoryAccountStore> accounts;
    std::shared_ptr<ScriptedReportSource> reports;
};

HttpRequest get(const std::string& path) {
    HttpRequest request{};
    request.path = path;
    request.headers = {{"Authorization", "Bearer abc"}};
    return request;
}
}  // namespace

TEST_CASE("GatewayRuntime serves reports end to end after initialization") {
    RuntimeHarness harness{};
    GatewayRuntime runtime{RuntimeHarness::configuration(), harness.components()};

    REQUIRE(runtime.router().handle(get("/api/metar/KJFK")).status == 503);

    runtime.initialize();
    REQUIRE(runtime.station_index().size() == 5);

    const HttpResponse first = runtime.router().handle(get("/api/metar/KJFK"));
    REQUIRE(first.status == 200);
    const nlohmann::json body = nlohmann::json::parse(first.body);
    REQUIRE(body["station"] == "KJFK");
    REQUIRE(body["remarks"] == "AO2");
    REQUIRE(body["meta"]["cache_timestamp"].is_string());

    REQUIRE(runtime.router().handle(get("/api/metar/KJFK")).status == 200);
    REQUIRE(harness.reports->call_count.load() == 1);

    REQUIRE(runtime.router().handle(get("/api/metar/KLGA")).status == 404);
}

TEST_CASE("GatewayRuntime sweep drops expired reports") {
    RuntimeHarness harness{};
    GatewayRuntime runtime{RuntimeHarness::configuration(), harness.components()};
    runtime.initialize();

    REQUIRE(runtime.router().handle(get("/api/metar/KJFK")).status == 200);
    REQUIRE(runtime.report_cache().size() == 1);

    harness.clock->advance(Duration{121.0});
    runtime.sweep();
    REQUIRE(runtime.report_cache().size() == 0);
}

TEST_CASE("GatewayRuntime keeps the previous station snapshot when a refresh fails") {
    RuntimeHarness harness{};
    GatewayRuntime runtime{RuntimeHarness::configuration(), harness.components()};
    runtime.initialize();

    harness.stations->unavailable = true;
    REQUIRE_THROWS_AS(runtime.refresh_stations(), ServiceError);
    REQUIRE(runtime.station_index().size() == 5);

    harness.stations->unavailable = false;
    harness.stations->set_stations({wx_gateway::test::make_station("EGLL", 51.4706, -0.4619)});
    runtime.refresh_stations();
    REQUIRE(runtime.station_index().size() == 1);
    REQUIRE(runtime.router().handle(get("/api/station/KJFK")).status == 404);
}

TEST_CASE("GatewayRuntime starts and stops its maintenance loops") {
    RuntimeHarness harness{};
    Configuration config = RuntimeHarness::configuration();
    config.cache_sweep_interval = Duration{0.05};
    GatewayRuntime runtime{config, harness.components()};
    runtime.initialize();

    runtime.run();
    runtime.run();
    runtime.shutdown();
    runtime.shutdown();
    REQUIRE(runtime.station_index().loaded());
}

TEST_CASE("GatewayRuntime purges idle quota slots when the cache sweep is disabled") {
    RuntimeHarness harness{};
    Configuration config = RuntimeHarness::configuration();
    config.quota.window = Duration{0.05};
    GatewayRuntime runtime{config, harness.components()};
    runtime.initialize();

    REQUIRE(runtime.router().handle(get("/api/metar/KJFK")).status == 200);
    REQUIRE(runtime.quota_ledger().size() == 1);

    harness.clock->advance(Duration{1.0});
    runtime.run();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
    while (runtime.quota_ledger().size() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    runtime.shutdown();

    REQUIRE(runtime.quota_ledger().size() == 0);
    REQUIRE(runtime.report_cache().size() == 1);
}

TEST_CASE("GatewayRuntime rejects missing components") {
    RuntimeHarness harness{};
    GatewayComponents incomplete = harness.components();
    incomplete.report_parser.reset();
    REQUIRE_THROWS_AS(GatewayRuntime(RuntimeHarness::configuration(), incomplete), std::invalid_argument);
}
