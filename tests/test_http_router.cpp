#include <memory>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "test_support.hpp"
#include "wx_gateway/basic_report_parser.hpp"
#include "wx_gateway/http_router.hpp"

using namespace wx_gateway;
using wx_gateway::test::CountingFetcher;
using wx_gateway::test::ManualClock;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    wx_gateway::test::ensure_logger_initialized();
    return true;
}();

struct RouterHarness final {
    RouterHarness()
        : clock(std::make_shared<ManualClock>()),
          store(std::make_shared<InMemoryAccountStore>()),
          ledger(QuotaConfig{}, store, clock),
          cache(ReportCacheConfig{}, clock),
          fetcher(std::make_shared<CountingFetcher>(clock)),
          dispatcher(index, ledger, cache, fetcher, std::make_shared<BasicReportParser>(), clock),
          router(dispatcher, clock) {
        index.replace(wx_gateway::test::new_york_stations(), clock->now());
        store->put_account(Account{"abc", "free", 100, true});
        store->put_account(Account{"tiny", "free", 1, true});
    }

    HttpResponse get(const std::string& path, std::map<std::string, std::string> query = {},
                     std::map<std::string, std::string> headers = {{"Authorization", "Bearer abc"}}) {
        HttpRequest request{};
        request.method = "GET";
        request.path = path;
        request.query = std::move(query);
        request.headers = std::move(headers);
        return router.handle(request);
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<InMemoryAccountStore> store;
    StationIndex index;
    QuotaLedger ledger;
    ReportCache cache;
    std::shared_ptr<CountingFetcher> fetcher;
    RequestDispatcher dispatcher;
    HttpRouter router;
};
}  // namespace

TEST_CASE("HttpRouter serves report routes") {
    RouterHarness harness{};

    SECTION("station code") {
        const HttpResponse response = harness.get("/api/metar/KJFK");
        REQUIRE(response.status == 200);
        REQUIRE(response.content_type == "application/json");
        REQUIRE(response.headers.at("Access-Control-Allow-Origin") == "*");
        REQUIRE(response.headers.at("X-RateLimit-Limit") == "100");
        REQUIRE(response.headers.at("X-RateLimit-Remaining") == "99");
        REQUIRE(nlohmann::json::parse(response.body)["raw"] == "KJFK scripted");
    }

    SECTION("coordinate forms share one fetch") {
        REQUIRE(harness.get("/api/metar/coord/40.6413,-73.7781").status == 200);
        REQUIRE(harness.get("/api/metar/40.6413,-73.7781").status == 200);
        REQUIRE(harness.get("/api/metar/40.6413%2C-73.7781").status == 200);
        REQUIRE(harness.fetcher->call_count.load() == 1);
    }

    SECTION("options come from the query string") {
        const HttpResponse response = harness.get("/api/taf/KLGA", {{"options", "info"}});
        REQUIRE(nlohmann::json::parse(response.body)["info"]["icao"] == "KLGA");
    }
}

TEST_CASE("HttpRouter reads the token from headers or the query") {
    RouterHarness harness{};

    REQUIRE(harness.get("/api/metar/KJFK", {}, {{"authorization", "Token abc"}}).status == 200);
    REQUIRE(harness.get("/api/metar/KJFK", {{"token", "abc"}}, {}).status == 200);
    REQUIRE(harness.get("/api/metar/KJFK", {}, {}).status == 401);
    REQUIRE(harness.get("/api/metar/KJFK", {}, {{"Authorization", "Basic abc"}}).status == 401);

    HttpRequest request{};
    request.headers = {{"AUTHORIZATION", "Bearer  spaced  "}};
    REQUIRE(extract_token(request) == "spaced");
}

TEST_CASE("HttpRouter negotiates the response format") {
    RouterHarness harness{};

    const HttpResponse by_query = harness.get("/api/station/KJFK", {{"format", "xml"}});
    REQUIRE(by_query.status == 200);
    REQUIRE(by_query.content_type == "application/xml");
    REQUIRE(by_query.body.find("<response>") != std::string::npos);
    REQUIRE(by_query.body.find("<icao>KJFK</icao>") != std::string::npos);

    const HttpResponse by_accept = harness.get("/api/station/KJFK", {},
                                               {{"Authorization", "Bearer abc"}, {"Accept", "application/xml"}});
    REQUIRE(by_accept.content_type == "application/xml");

    const HttpResponse invalid = harness.get("/api/station/KJFK", {{"format", "yaml"}});
    REQUIRE(invalid.status == 400);
    REQUIRE(invalid.content_type == "application/json");
    REQUIRE(nlohmann::json::parse(invalid.body)["param"] == "format");
}

TEST_CASE("HttpRouter maps errors onto status codes") {
    RouterHarness harness{};

    REQUIRE(harness.get("/api/metar/200,0").status == 400);
    REQUIRE(harness.get("/api/metar/KXYZ").status == 404);
    REQUIRE(harness.get("/api/pirep/KJFK").status == 404);
    REQUIRE(harness.get("/nothing/here").status == 404);

    REQUIRE(harness.get("/api/metar/KJFK", {}, {{"Authorization", "Bearer tiny"}}).status == 200);
    const HttpResponse limited = harness.get("/api/metar/KJFK", {}, {{"Authorization", "Bearer tiny"}});
    REQUIRE(limited.status == 429);
    REQUIRE(limited.headers.at("X-RateLimit-Remaining") == "0");
    REQUIRE(limited.headers.count("Retry-After") == 1);
    REQUIRE(nlohmann::json::parse(limited.body)["kind"] == "RateLimited");
}

TEST_CASE("HttpRouter handles methods and CORS preflight") {
    RouterHarness harness{};

    HttpRequest preflight{};
    preflight.method = "OPTIONS";
    preflight.path = "/api/metar/KJFK";
    const HttpResponse options_response = harness.router.handle(preflight);
    REQUIRE(options_response.status == 204);
    REQUIRE(options_response.body.empty());
    REQUIRE(options_response.headers.at("Access-Control-Allow-Origin") == "*");
    REQUIRE(options_response.headers.count("Access-Control-Allow-Methods") == 1);

    HttpRequest wrong_method{};
    wrong_method.method = "DELETE";
    wrong_method.path = "/api/metar/KJFK";
    const HttpResponse not_allowed = harness.router.handle(wrong_method);
    REQUIRE(not_allowed.status == 405);
    REQUIRE(not_allowed.headers.at("Allow") == "GET, OPTIONS");

    HttpRequest parse_request{};
    parse_request.method = "POST";
    parse_request.path = "/api/parse/metar";
    parse_request.headers = {{"Authorization", "Bearer abc"}};
    parse_request.body = "KJFK 121651Z 31008KT 10SM FEW250 02/M12 A3012";
    const HttpResponse parsed = harness.router.handle(parse_request);
    REQUIRE(parsed.status == 200);
    REQUIRE(nlohmann::json::parse(parsed.body)["station"] == "KJFK");

    parse_request.method = "GET";
    REQUIRE(harness.router.handle(parse_request).status == 405);
}

TEST_CASE("HttpRouter serves station search") {
    RouterHarness harness{};

    const HttpResponse response = harness.get("/api/station/near/40.6413,-73.7781", {{"n", "3"}, {"maxdist", "2"}});
    REQUIRE(response.status == 200);
    const nlohmann::json body = nlohmann::json::parse(response.body);
    REQUIRE(body["stations"].size() == 3);
    REQUIRE(body["stations"][0]["station"]["icao"] == "KJFK");

    REQUIRE(harness.get("/api/station/near/40.6413,-73.7781", {{"n", "x"}}).status == 400);
}

TEST_CASE("HttpRouter serves multi-station and text search routes") {
    RouterHarness harness{};

    const HttpResponse reports = harness.get("/api/multi/metar/KJFK,KLGA");
    REQUIRE(reports.status == 200);
    const nlohmann::json report_body = nlohmann::json::parse(reports.body);
    REQUIRE(report_body["reports"]["KJFK"]["raw"] == "KJFK scripted");
    REQUIRE(report_body["reports"]["KLGA"]["raw"] == "KLGA scripted");

    const HttpResponse encoded = harness.get("/api/multi/taf/KJFK%2CKEWR");
    REQUIRE(encoded.status == 200);
    REQUIRE(nlohmann::json::parse(encoded.body)["reports"].size() == 2);

    const HttpResponse stations = harness.get("/api/multi/station/KJFK,KTEB");
    REQUIRE(stations.status == 200);
    REQUIRE(nlohmann::json::parse(stations.body)["stations"]["KTEB"]["icao"] == "KTEB");

    const HttpResponse search = harness.get("/api/search/station", {{"text", "kteb"}, {"n", "5"}});
    REQUIRE(search.status == 200);
    REQUIRE(nlohmann::json::parse(search.body)["stations"][0]["icao"] == "KTEB");

    REQUIRE(harness.get("/api/search/station").status == 400);
    REQUIRE(harness.get("/api/multi/pirep/KJFK").status == 404);
    REQUIRE(harness.get("/api/multi/metar").status == 404);
}
