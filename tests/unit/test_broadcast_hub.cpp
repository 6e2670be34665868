///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_broadcast_hub.cpp
 * @brief Unit tests for message routing, airport lookups and telemetry fan-out
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "flight/airport_database.h"
#include "net/broadcast_hub.h"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <map>
#include <stdexcept>

using namespace FlightBridge;
using namespace TestHelpers;
using nlohmann::json;

namespace {

/// Lookup whose calls block until Open(); answers from a fixed table
class GatedLookup : public CoordinateLookup {
public:
    explicit GatedLookup(bool open = true) : open_(open) {}

    std::optional<GeoPosition> Lookup(const std::string& icao) override {
        ++calls;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return open_; });
        }
        if (icao == "FAIL") {
            throw std::runtime_error("backend exploded");
        }
        auto it = answers.find(icao);
        if (it == answers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void Open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    std::atomic<int> calls{0};
    std::map<std::string, GeoPosition> answers{{"KSEZ", GeoPosition{34.8486, -111.7884}}};

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_;
};

/// Blocks only lookups for `stalled` until Release(); answers others at once
class StallingLookup : public CoordinateLookup {
public:
    explicit StallingLookup(std::string stalled) : stalled_(std::move(stalled)) {}

    std::optional<GeoPosition> Lookup(const std::string& icao) override {
        ++calls;
        if (icao == stalled_) {
            std::unique_lock<std::mutex> lock(mutex_);
            ++stalled_calls;
            cv_.wait(lock, [this] { return released_; });
        }
        return GeoPosition{1.0, 2.0};
    }

    void Release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    std::atomic<int> calls{0};
    std::atomic<int> stalled_calls{0};

private:
    std::string stalled_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
};

struct ReleaseOnExit {
    StallingLookup& lookup;
    ~ReleaseOnExit() { lookup.Release(); }
};

/// Releases the gate before the hub joins its worker
struct OpenOnExit {
    GatedLookup& lookup;
    ~OpenOnExit() { lookup.Open(); }
};

json LastMessage(const std::shared_ptr<FakeConnection>& connection) {
    auto messages = connection->Messages();
    REQUIRE_FALSE(messages.empty());
    return json::parse(messages.back());
}

std::string AirportRequestText(const std::string& icao) {
    return json{{"type", "getAirport"}, {"data", icao}}.dump();
}

} // namespace

TEST_CASE("Hub welcome payload", "[unit][hub]") {
    ConnectionRegistry registry;
    BroadcastHub hub(registry, nullptr);

    SECTION("Nothing is sent without a session or a route") {
        auto a = std::make_shared<FakeConnection>(1);
        hub.OnOpen(a);
        REQUIRE(registry.Count() == 1);
        REQUIRE(a->MessageCount() == 0);
    }

    SECTION("Late joiner gets the placeholder and the current route") {
        hub.SetSessionCode(std::string("ABCD-2345"));
        auto a = std::make_shared<FakeConnection>(1);
        hub.OnOpen(a);
        REQUIRE(a->MessageCount() == 1);
        json placeholder = LastMessage(a);
        REQUIRE(placeholder["connected"] == false);
        REQUIRE(placeholder["sessionCode"] == "ABCD-2345");

        hub.OnMessage(a, R"({"type":"route","data":{"origin":"eddf","destination":"egll"}})");

        auto late = std::make_shared<FakeConnection>(2);
        hub.OnOpen(late);
        auto messages = late->Messages();
        REQUIRE(messages.size() == 2);
        REQUIRE(json::parse(messages[0])["connected"] == false);
        json route = json::parse(messages[1]);
        REQUIRE(route["type"] == "route");
        REQUIRE(route["route"]["origin"] == "EDDF");
    }

    SECTION("Connections opened during shutdown are closed") {
        registry.CloseAll();
        auto a = std::make_shared<FakeConnection>(1);
        hub.OnOpen(a);
        REQUIRE(a->IsClosed());
        REQUIRE(registry.Count() == 0);
    }
}

TEST_CASE("Hub message routing", "[unit][hub]") {
    ConnectionRegistry registry;
    BroadcastHub hub(registry, nullptr);
    auto a = std::make_shared<FakeConnection>(1);
    auto b = std::make_shared<FakeConnection>(2);
    hub.OnOpen(a);
    hub.OnOpen(b);

    SECTION("Ping is answered to the sender only") {
        hub.OnMessage(a, R"({"type":"ping"})");
        REQUIRE(LastMessage(a)["type"] == "pong");
        REQUIRE(b->MessageCount() == 0);
    }

    SECTION("Route is normalized, stored and broadcast") {
        std::optional<RouteSpec> heard;
        hub.SetRouteListener([&heard](const RouteSpec& route) { heard = route; });

        hub.OnMessage(a, R"({"type":"route","data":{"origin":" lfpg","destination":"eham "}})");

        REQUIRE(heard.has_value());
        REQUIRE(heard->origin == std::optional<std::string>("LFPG"));
        REQUIRE(hub.CurrentRoute()->destination == std::optional<std::string>("EHAM"));
        REQUIRE(LastMessage(a)["route"]["destination"] == "EHAM");
        REQUIRE(LastMessage(b)["route"]["origin"] == "LFPG");
    }

    SECTION("Last route wins") {
        hub.OnMessage(a, R"({"type":"route","data":{"origin":"EDDF"}})");
        hub.OnMessage(b, R"({"type":"route","data":{"destination":"EGLL"}})");
        REQUIRE_FALSE(hub.CurrentRoute()->origin.has_value());
        REQUIRE(hub.CurrentRoute()->destination == std::optional<std::string>("EGLL"));
    }

    SECTION("Auth reaches the listener") {
        std::optional<AuthUpdate> heard;
        hub.SetAuthListener([&heard](const AuthUpdate& update) { heard = update; });

        hub.OnMessage(a, R"({"type":"auth","data":"user-7","token":"jwt"})");
        REQUIRE(heard->user_id == std::optional<std::string>("user-7"));
        REQUIRE(heard->token == std::optional<std::string>("jwt"));

        hub.OnMessage(a, R"({"type":"auth","data":null})");
        REQUIRE_FALSE(heard->user_id.has_value());
        REQUIRE(a->MessageCount() == 0);
    }

    SECTION("Malformed messages are ignored") {
        hub.OnMessage(a, "{{{");
        hub.OnMessage(a, R"({"type":"launch"})");
        REQUIRE(a->MessageCount() == 0);
        REQUIRE(registry.Count() == 2);
    }

    SECTION("Closed connections are forgotten") {
        hub.OnClose(1);
        REQUIRE(registry.Count() == 1);
    }
}

TEST_CASE("Hub airport lookups", "[unit][hub]") {
    ConnectionRegistry registry;
    auto lookup = std::make_shared<GatedLookup>();
    BroadcastHub hub(registry, lookup);
    OpenOnExit release{*lookup};

    auto a = std::make_shared<FakeConnection>(1);
    auto b = std::make_shared<FakeConnection>(2);
    hub.OnOpen(a);
    hub.OnOpen(b);

    SECTION("Resolved coordinates are sent to the requester and cached") {
        hub.OnMessage(a, AirportRequestText(" ksez"));
        REQUIRE(WaitFor([&] { return a->MessageCount() == 1; }));

        json reply = LastMessage(a);
        REQUIRE(reply["type"] == "airportCoords");
        REQUIRE(reply["icao"] == "KSEZ");
        REQUIRE(reply["coords"]["lat"].get<double>() == Catch::Approx(34.8486));
        REQUIRE(b->MessageCount() == 0);
        REQUIRE(hub.CachedCoordinates("ksez").has_value());

        hub.OnMessage(b, AirportRequestText("KSEZ"));
        REQUIRE(b->MessageCount() == 1);
        REQUIRE(lookup->calls.load() == 1);
    }

    SECTION("Unknown airport is reported and not cached") {
        hub.OnMessage(a, AirportRequestText("ZZZZ"));
        REQUIRE(WaitFor([&] { return a->MessageCount() == 1; }));
        REQUIRE(LastMessage(a)["error"] == "not_found");
        REQUIRE(LastMessage(a)["coords"].is_null());
        REQUIRE_FALSE(hub.CachedCoordinates("ZZZZ").has_value());

        hub.OnMessage(a, AirportRequestText("ZZZZ"));
        REQUIRE(WaitFor([&] { return a->MessageCount() == 2; }));
        REQUIRE(lookup->calls.load() == 2);
    }

    SECTION("A failing backend is reported as not found") {
        hub.OnMessage(a, AirportRequestText("fail"));
        REQUIRE(WaitFor([&] { return a->MessageCount() == 1; }));
        REQUIRE(LastMessage(a)["error"] == "not_found");
    }

    SECTION("Invalid identifiers get no answer") {
        hub.OnMessage(a, AirportRequestText("ED"));
        hub.OnMessage(a, AirportRequestText("TOOLONG"));
        hub.OnMessage(a, AirportRequestText("K/SZ"));
        hub.OnMessage(a, AirportRequestText("ED?"));
        SleepMs(50);
        REQUIRE(a->MessageCount() == 0);
        REQUIRE(lookup->calls.load() == 0);
    }
}

TEST_CASE("Hub coalesces concurrent lookups", "[unit][hub]") {
    ConnectionRegistry registry;
    auto lookup = std::make_shared<GatedLookup>(false);
    BroadcastHub hub(registry, lookup);
    OpenOnExit release{*lookup};

    auto a = std::make_shared<FakeConnection>(1);
    auto b = std::make_shared<FakeConnection>(2);
    hub.OnOpen(a);
    hub.OnOpen(b);

    hub.OnMessage(a, AirportRequestText("KSEZ"));
    REQUIRE(WaitFor([&] { return lookup->calls.load() == 1; }));
    hub.OnMessage(b, AirportRequestText("ksez"));

    lookup->Open();
    REQUIRE(WaitFor([&] { return a->MessageCount() == 1 && b->MessageCount() == 1; }));
    REQUIRE(lookup->calls.load() == 1);
    REQUIRE(LastMessage(b)["icao"] == "KSEZ");
}

TEST_CASE("Hub lookups for one airport do not hold up others", "[unit][hub]") {
    ConnectionRegistry registry;
    auto remote = std::make_shared<StallingLookup>("KSEZ");
    auto local = std::make_shared<AirportDatabase>();
    BroadcastHub hub(registry, remote, local);
    ReleaseOnExit release{*remote};

    auto a = std::make_shared<FakeConnection>(1);
    auto b = std::make_shared<FakeConnection>(2);
    hub.OnOpen(a);
    hub.OnOpen(b);

    hub.OnMessage(a, AirportRequestText("KSEZ"));
    REQUIRE(WaitFor([&] { return remote->stalled_calls.load() == 1; }));

    SECTION("Known airports are answered from the local table") {
        hub.OnMessage(b, AirportRequestText("EDDF"));
        REQUIRE(b->MessageCount() == 1);
        json reply = LastMessage(b);
        REQUIRE(reply["icao"] == "EDDF");
        REQUIRE(reply["coords"]["lat"].get<double>() == Catch::Approx(50.0379));
        REQUIRE(remote->calls.load() == 1);
        REQUIRE(hub.CachedCoordinates("EDDF").has_value());
    }

    SECTION("Other backend lookups proceed in parallel") {
        hub.OnMessage(b, AirportRequestText("ZZZZ"));
        REQUIRE(WaitFor([&] { return b->MessageCount() == 1; }));
        REQUIRE(LastMessage(b)["icao"] == "ZZZZ");
        REQUIRE(a->MessageCount() == 0);
    }

    remote->Release();
    REQUIRE(WaitFor([&] { return a->MessageCount() == 1; }));
    REQUIRE(LastMessage(a)["icao"] == "KSEZ");
}

TEST_CASE("Hub without a lookup backend", "[unit][hub]") {
    ConnectionRegistry registry;
    BroadcastHub hub(registry, nullptr);
    auto a = std::make_shared<FakeConnection>(1);
    hub.OnOpen(a);

    hub.OnMessage(a, AirportRequestText("EDDF"));
    REQUIRE(a->MessageCount() == 1);
    REQUIRE(LastMessage(a)["error"] == "not_found");
}

TEST_CASE("Hub telemetry fan-out", "[unit][hub]") {
    ConnectionRegistry registry;
    BroadcastHub hub(registry, nullptr);
    hub.SetSessionCode(std::string("QRST-6789"));

    auto a = std::make_shared<FakeConnection>(1);
    auto broken = std::make_shared<FakeConnection>(2, true);
    auto c = std::make_shared<FakeConnection>(3);
    hub.OnOpen(a);
    hub.OnOpen(broken);
    hub.OnOpen(c);
    const size_t welcome = a->MessageCount();

    SECTION("Snapshots reach every healthy viewer") {
        hub.BroadcastSnapshot(MakeSnapshot(0, true, 0));

        REQUIRE(a->MessageCount() == welcome + 1);
        REQUIRE(c->MessageCount() == welcome + 1);
        json doc = LastMessage(c);
        REQUIRE(doc["connected"] == true);
        REQUIRE(doc["sessionCode"] == "QRST-6789");
        REQUIRE(broken->IsClosed());
        REQUIRE(registry.Count() == 2);
    }

    SECTION("Relay sink sees every broadcast, and its failures stay contained") {
        std::vector<std::string> relayed;
        hub.SetRelaySink([&relayed](const std::string& payload) {
            relayed.push_back(payload);
            throw std::runtime_error("relay offline");
        });

        hub.BroadcastSnapshot(MakeSnapshot(0, true, 0));
        hub.BroadcastDisconnected();

        REQUIRE(relayed.size() == 2);
        REQUIRE(json::parse(relayed[1])["connected"] == false);
        REQUIRE(a->MessageCount() == welcome + 2);
    }

    SECTION("Landing broadcast") {
        LandingEvent landing;
        landing.rating = LandingRating{"Perfect", 5};
        hub.BroadcastLanding(landing);

        json doc = LastMessage(a);
        REQUIRE(doc["type"] == "landing");
        REQUIRE(doc["landing"]["ratingScore"] == 5);
    }
}
