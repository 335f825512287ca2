#include <memory>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "test_support.hpp"
#include "wx_gateway/basic_report_parser.hpp"
#include "wx_gateway/request_dispatcher.hpp"

using namespace wx_gateway;
using wx_gateway::test::CountingFetcher;
using wx_gateway::test::ManualClock;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    wx_gateway::test::ensure_logger_initialized();
    return true;
}();

struct DispatcherHarness final {
    DispatcherHarness()
        : clock(std::make_shared<ManualClock>()),
          store(std::make_shared<InMemoryAccountStore>()),
          ledger(QuotaConfig{}, store, clock),
          cache(ReportCacheConfig{Duration{120.0}, Duration{5.0}, 16}, clock),
          fetcher(std::make_shared<CountingFetcher>(clock)),
          dispatcher(index, ledger, cache, fetcher, std::make_shared<BasicReportParser>(), clock) {
        index.replace(wx_gateway::test::new_york_stations(), clock->now());
        store->put_account(Account{"abc", "free", 100, true});
        store->put_account(Account{"tiny", "free", 1, true});
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<InMemoryAccountStore> store;
    StationIndex index;
    QuotaLedger ledger;
    ReportCache cache;
    std::shared_ptr<CountingFetcher> fetcher;
    RequestDispatcher dispatcher;
};
}  // namespace

TEST_CASE("RequestDispatcher serves KJFK from cache within the TTL") {
    DispatcherHarness harness{};
    const ReportRequest request{"metar", "KJFK", "", "abc"};

    const DispatchResult first = harness.dispatcher.dispatch_report(request);
    REQUIRE(first.status == 200);
    REQUIRE(first.state == RequestState::Responded);
    REQUIRE(first.last_stage == RequestState::Fetched);
    REQUIRE(first.cache_outcome == CacheOutcome::Fetched);
    REQUIRE(first.quota->remaining == 99);
    REQUIRE(first.body["raw"] == "KJFK scripted");
    REQUIRE(first.body["meta"]["cache_timestamp"].is_string());
    REQUIRE(first.body["meta"]["stations_updated"].is_string());
    REQUIRE_FALSE(first.body.contains("info"));
    REQUIRE(harness.fetcher->call_count.load() == 1);

    harness.clock->advance(Duration{5.0});
    const DispatchResult second = harness.dispatcher.dispatch_report(request);
    REQUIRE(second.status == 200);
    REQUIRE(second.last_stage == RequestState::CacheHit);
    REQUIRE(second.quota->remaining == 98);
    REQUIRE(second.body["meta"]["cache_timestamp"] == first.body["meta"]["cache_timestamp"]);
    REQUIRE(harness.fetcher->call_count.load() == 1);

    harness.clock->advance(Duration{125.0});
    const DispatchResult third = harness.dispatcher.dispatch_report(request);
    REQUIRE(third.status == 200);
    REQUIRE(third.last_stage == RequestState::Fetched);
    REQUIRE(third.quota->remaining == 97);
    REQUIRE(harness.fetcher->call_count.load() == 2);
}

TEST_CASE("RequestDispatcher shares the cache entry between coordinate and code requests") {
    DispatcherHarness harness{};

    const DispatchResult by_coordinate = harness.dispatcher.dispatch_report(ReportRequest{"metar", "40.6413,-73.7781", "", "abc"});
    REQUIRE(by_coordinate.status == 200);
    REQUIRE(by_coordinate.cache_outcome == CacheOutcome::Fetched);

    const DispatchResult by_code = harness.dispatcher.dispatch_report(ReportRequest{"METAR", "kjfk", "", "abc"});
    REQUIRE(by_code.status == 200);
    REQUIRE(by_code.cache_outcome == CacheOutcome::Hit);
    REQUIRE(harness.fetcher->call_count.load() == 1);
}

TEST_CASE("RequestDispatcher normalizes options into one cache key") {
    DispatcherHarness harness{};

    const DispatchResult first = harness.dispatcher.dispatch_report(ReportRequest{"metar", "KJFK", "summary,info", "abc"});
    REQUIRE(first.status == 200);
    REQUIRE(first.body["info"]["icao"] == "KJFK");

    const DispatchResult second = harness.dispatcher.dispatch_report(ReportRequest{"metar", "KJFK", " info,,summary,info ", "abc"});
    REQUIRE(second.cache_outcome == CacheOutcome::Hit);
    REQUIRE(harness.fetcher->call_count.load() == 1);
}

TEST_CASE("RequestDispatcher rejects invalid input without touching quota or cache") {
    DispatcherHarness harness{};

    SECTION("out-of-range coordinate") {
        const DispatchResult result = harness.dispatcher.dispatch_report(ReportRequest{"metar", "200,0", "", "abc"});
        REQUIRE(result.status == 400);
        REQUIRE(result.error == ErrorKind::InvalidInput);
        REQUIRE(result.body["param"] == "coord");
    }

    SECTION("malformed identifier") {
        const DispatchResult result = harness.dispatcher.dispatch_report(ReportRequest{"metar", "JFK!", "", "abc"});
        REQUIRE(result.status == 400);
        REQUIRE(result.body["param"] == "station");
    }

    SECTION("unknown option") {
        const DispatchResult result = harness.dispatcher.dispatch_report(ReportRequest{"metar", "KJFK", "info,poetry", "abc"});
        REQUIRE(result.status == 400);
        REQUIRE(result.body["param"] == "options");
    }

    SECTION("unknown report type") {
        const DispatchResult result = harness.dispatcher.dispatch_report(ReportRequest{"pirep", "KJFK", "", "abc"});
        REQUIRE(result.status == 400);
        REQUIRE(result.body["param"] == "report_type");
    }

    SECTION("unknown station") {
        const DispatchResult result = harness.dispatcher.dispatch_report(ReportRequest{"metar", "KXYZ", "", "abc"});
        REQUIRE(result.status == 404);
        REQUIRE(result.error == ErrorKind::NotFound);
    }

    REQUIRE_FALSE(harness.ledger.window_for("abc").has_value());
    REQUIRE(harness.fetcher->call_count.load() == 0);
}

TEST_CASE("RequestDispatcher short-circuits on quota rejection") {
    DispatcherHarness harness{};

    const DispatchResult unauthorized = harness.dispatcher.dispatch_report(ReportRequest{"metar", "KJFK", "", ""});
    REQUIRE(unauthorized.status == 401);
    REQUIRE(unauthorized.state == RequestState::Rejected);
    REQUIRE(unauthorized.body["kind"] == "Unauthorized");

    REQUIRE(harness.dispatcher.dispatch_report(ReportRequest{"metar", "KJFK", "", "tiny"}).status == 200);
    const DispatchResult limited = harness.dispatcher.dispatch_report(ReportRequest{"metar", "KLGA", "", "tiny"});
    REQUIRE(limited.status == 429);
    REQUIRE(limited.state == RequestState::Rejected);
    REQUIRE(limited.last_stage == RequestState::Resolved);
    REQUIRE(limited.quota.has_value());
    REQUIRE(harness.fetcher->call_count.load() == 1);
}

TEST_CASE("RequestDispatcher maps fetch failures onto error responses") {
    DispatcherHarness harness{};

    SECTION("upstream unavailable") {
        harness.fetcher->failure = ErrorKind::ServiceUnavailable;
        const DispatchResult result = harness.dispatcher.dispatch_report(ReportRequest{"metar", "KJFK", "", "abc"});
        REQUIRE(result.status == 503);
        REQUIRE(result.last_stage == RequestState::FetchFailed);
        REQUIRE(result.state == RequestState::Responded);
    }

    SECTION("parser failure") {
        harness.fetcher->failure = ErrorKind::UpstreamParseError;
        const DispatchResult result = harness.dispatcher.dispatch_report(ReportRequest{"taf", "KJFK", "", "abc"});
        REQUIRE(result.status == 503);
        REQUIRE(result.error == ErrorKind::UpstreamParseError);
        REQUIRE(result.body["kind"] == "UpstreamParseError");
    }

    SECTION("station without reports") {
        const DispatchResult result = harness.dispatcher.dispatch_report(ReportRequest{"metar", "KNYC", "", "abc"});
        REQUIRE(result.status == 404);
        REQUIRE(harness.fetcher->call_count.load() == 0);
    }

    SECTION("index not loaded") {
        StationIndex empty_index{};
        RequestDispatcher dispatcher{empty_index, harness.ledger, harness.cache, harness.fetcher,
                                     std::make_shared<BasicReportParser>(), harness.clock};
        REQUIRE(dispatcher.dispatch_report(ReportRequest{"metar", "KJFK", "", "abc"}).status == 503);
    }
}

TEST_CASE("RequestDispatcher returns station metadata") {
    DispatcherHarness harness{};

    const DispatchResult result = harness.dispatcher.station_info("klga", "abc");
    REQUIRE(result.status == 200);
    REQUIRE(result.body["icao"] == "KLGA");
    REQUIRE(result.body["reporting"] == true);
    REQUIRE(result.body["meta"]["cache_timestamp"].is_null());

    REQUIRE(harness.dispatcher.station_info("40.6,-73.7", "abc").status == 400);
    REQUIRE(harness.dispatcher.station_info("KXYZ", "abc").status == 404);
    REQUIRE(harness.dispatcher.station_info("KJFK", "nobody").status == 401);
}

TEST_CASE("RequestDispatcher lists nearby stations") {
    DispatcherHarness harness{};

    const DispatchResult result = harness.dispatcher.near(NearRequest{"40.6413,-73.7781", "2", "", "", "abc"});
    REQUIRE(result.status == 200);
    REQUIRE(result.body["stations"].size() == 2);
    REQUIRE(result.body["stations"][0]["station"]["icao"] == "KJFK");
    REQUIRE(result.body["stations"][0]["distance_deg"].get<double>() < 0.01);

    const DispatchResult everything = harness.dispatcher.near(NearRequest{"40.7789,-73.9692", "", "", "false", "abc"});
    REQUIRE(everything.body["stations"].size() == 5);
    REQUIRE(everything.body["stations"][0]["station"]["icao"] == "KNYC");

    REQUIRE(harness.dispatcher.near(NearRequest{"40.6,-73.7", "0", "", "", "abc"}).body["param"] == "n");
    REQUIRE(harness.dispatcher.near(NearRequest{"40.6,-73.7", "201", "", "", "abc"}).status == 400);
    REQUIRE(harness.dispatcher.near(NearRequest{"40.6,-73.7", "", "361", "", "abc"}).body["param"] == "maxdist");
    REQUIRE(harness.dispatcher.near(NearRequest{"KJFK", "", "", "", "abc"}).body["param"] == "coord");
    REQUIRE(harness.dispatcher.near(NearRequest{"40.6,-73.7", "", "", "maybe", "abc"}).body["param"] == "reporting");
}

TEST_CASE("RequestDispatcher parses client-supplied reports without the cache") {
    DispatcherHarness harness{};

    const DispatchResult result = harness.dispatcher.parse_given(
        ParseRequest{"metar", "METAR KJFK 121651Z 31008KT 10SM FEW250 02/M12 A3012 RMK AO2", "info", "abc"}
    );
    REQUIRE(result.status == 200);
    REQUIRE(result.body["station"] == "KJFK");
    REQUIRE(result.body["time"]["day"] == 12);
    REQUIRE(result.body["remarks"] == "AO2");
    REQUIRE(result.body["info"]["icao"] == "KJFK");
    REQUIRE(harness.cache.size() == 0);
    REQUIRE(harness.fetcher->call_count.load() == 0);

    REQUIRE(harness.dispatcher.parse_given(ParseRequest{"metar", "KJ", "", "abc"}).status == 400);
    REQUIRE(harness.dispatcher.parse_given(ParseRequest{"metar", R"({"raw":"KJFK"})", "", "abc"}).status == 400);
    REQUIRE(harness.dispatcher.parse_given(ParseRequest{"metar", "KXYZ 121651Z 31008KT", "", "abc"}).status == 404);
}

TEST_CASE("RequestDispatcher serves several stations behind one admission") {
    DispatcherHarness harness{};

    const DispatchResult result = harness.dispatcher.dispatch_multi(MultiRequest{"metar", "kjfk, KLGA,KNYC", "", "abc"});
    REQUIRE(result.status == 200);
    REQUIRE(result.quota->remaining == 99);
    REQUIRE(result.body["reports"].size() == 2);
    REQUIRE(result.body["reports"]["KJFK"]["raw"] == "KJFK scripted");
    REQUIRE(result.body["reports"]["KLGA"]["meta"]["cache_timestamp"].is_string());
    REQUIRE_FALSE(result.body["reports"].contains("KNYC"));
    REQUIRE(harness.fetcher->call_count.load() == 2);
    REQUIRE(harness.cache.size() == 2);

    const DispatchResult cached = harness.dispatcher.dispatch_multi(MultiRequest{"metar", "KJFK,KLGA", "", "abc"});
    REQUIRE(cached.last_stage == RequestState::CacheHit);
    REQUIRE(harness.fetcher->call_count.load() == 2);

    // A single-station request shares the cache entry.
    REQUIRE(harness.dispatcher.dispatch_report(ReportRequest{"metar", "KLGA", "", "abc"}).cache_outcome == CacheOutcome::Hit);
}

TEST_CASE("RequestDispatcher leaves failed stations out of a multi response") {
    DispatcherHarness harness{};
    REQUIRE(harness.dispatcher.dispatch_report(ReportRequest{"taf", "KJFK", "", "abc"}).status == 200);

    harness.fetcher->failure = ErrorKind::ServiceUnavailable;
    const DispatchResult result = harness.dispatcher.dispatch_multi(MultiRequest{"taf", "KJFK,KEWR", "", "abc"});
    REQUIRE(result.status == 200);
    REQUIRE(result.body["reports"].size() == 1);
    REQUIRE(result.body["reports"].contains("KJFK"));

    const DispatchResult nothing = harness.dispatcher.dispatch_multi(MultiRequest{"taf", "KEWR", "", "abc"});
    REQUIRE(nothing.status == 200);
    REQUIRE(nothing.last_stage == RequestState::FetchFailed);
    REQUIRE(nothing.body["reports"].empty());
}

TEST_CASE("RequestDispatcher validates multi station lists before admission") {
    DispatcherHarness harness{};

    const DispatchResult too_many = harness.dispatcher.dispatch_multi(
        MultiRequest{"metar", "KJFK,KLGA,KEWR,KTEB,KNYC,KAAA,KBBB,KCCC,KDDD,KEEE,KFFF", "", "tiny"}
    );
    REQUIRE(too_many.status == 400);
    REQUIRE(too_many.body["param"] == "stations");

    const DispatchResult unknown = harness.dispatcher.dispatch_multi(MultiRequest{"metar", "KJFK,KXYZ", "", "tiny"});
    REQUIRE(unknown.status == 400);
    REQUIRE(unknown.body["param"] == "stations");

    REQUIRE(harness.dispatcher.dispatch_multi(MultiRequest{"metar", " , ", "", "tiny"}).status == 400);
    REQUIRE(harness.dispatcher.dispatch_multi(MultiRequest{"pirep", "KJFK", "", "tiny"}).body["param"] == "report_type");
    REQUIRE_FALSE(harness.ledger.window_for("tiny").has_value());
    REQUIRE(harness.fetcher->call_count.load() == 0);

    REQUIRE(harness.dispatcher.dispatch_multi(MultiRequest{"metar", "KJFK,KLGA", "", "tiny"}).status == 200);
    REQUIRE(harness.dispatcher.dispatch_multi(MultiRequest{"metar", "KJFK", "", "tiny"}).status == 429);
}

TEST_CASE("RequestDispatcher returns several station records keyed by identifier") {
    DispatcherHarness harness{};

    const DispatchResult result = harness.dispatcher.multi_station_info("KJFK,knyc", "abc");
    REQUIRE(result.status == 200);
    REQUIRE(result.body["stations"].size() == 2);
    REQUIRE(result.body["stations"]["KNYC"]["reporting"] == false);
    REQUIRE(result.quota->remaining == 99);

    REQUIRE(harness.dispatcher.multi_station_info("KJFK,KXYZ", "abc").status == 400);
    REQUIRE(harness.dispatcher.multi_station_info("KJFK", "nobody").status == 401);
}

TEST_CASE("RequestDispatcher searches stations by text") {
    DispatcherHarness harness{};

    const DispatchResult result = harness.dispatcher.search_stations(SearchRequest{"klga", "", "", "abc"});
    REQUIRE(result.status == 200);
    REQUIRE(result.body["stations"].size() == 1);
    REQUIRE(result.body["stations"][0]["icao"] == "KLGA");

    const DispatchResult airports = harness.dispatcher.search_stations(SearchRequest{"airport", "3", "false", "abc"});
    REQUIRE(airports.body["stations"].size() == 3);

    REQUIRE(harness.dispatcher.search_stations(SearchRequest{"kj", "", "", "abc"}).body["param"] == "text");
    REQUIRE(harness.dispatcher.search_stations(SearchRequest{std::string(201, 'a'), "", "", "abc"}).status == 400);
    REQUIRE(harness.dispatcher.search_stations(SearchRequest{"airport", "0", "", "abc"}).body["param"] == "n");
    REQUIRE(harness.dispatcher.search_stations(SearchRequest{"airport", "", "", "nobody"}).status == 401);
}

TEST_CASE("parse_station_list normalizes and deduplicates codes") {
    const std::vector<std::string> expected{"KJFK", "KLGA"};
    REQUIRE(parse_station_list("kjfk, KLGA,,kjfk") == expected);
    REQUIRE_THROWS_AS(parse_station_list("KJFK,40.6"), ServiceError);
    REQUIRE(parse_station_list("KAAA,KBBB,KCCC,KDDD,KEEE,KFFF,KGGG,KHHH,KIII,KJJJ").size() == 10);
}

TEST_CASE("parse_location distinguishes codes from coordinates") {
    const Location code = parse_location(" kjfk ");
    REQUIRE(std::get<std::string>(code) == "KJFK");

    const Location coordinate = parse_location("40.6413, -73.7781");
    REQUIRE(std::get<GeodeticCoordinate>(coordinate).latitude_deg == Approx(40.6413));
    REQUIRE(std::get<GeodeticCoordinate>(coordinate).longitude_deg == Approx(-73.7781));

    REQUIRE_THROWS_AS(parse_location("40.6413"), ServiceError);
    REQUIRE_THROWS_AS(parse_location("40.6x,-73.7"), ServiceError);
    REQUIRE_THROWS_AS(parse_location("nan,0"), ServiceError);

    REQUIRE(parse_options("") == OptionSet{});
    REQUIRE(parse_options("Speech,translate") == OptionSet{OutputOption::Translate, OutputOption::Speech});
}
