/*
 * File: tests/test_bridge.cpp
 * Project: Radar Bridge
 * Purpose: Bridge start/stop against a recording host
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <boost/asio.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "bridge_client.hpp"
#include "bridge_host.hpp"
#include "support/fake_backend.hpp"
#include "support/fake_stream.hpp"
#include "support/local_servers.hpp"
#include "support/test_io.hpp"

using namespace std::chrono_literals;

namespace
{
    class RecordingHost : public HostPlatform
    {
    public:
        std::vector<std::string> events;
        bool refuse = false;
        DeviceProxy *registered = nullptr;
        std::size_t frames = 0;

        void register_provider(const std::string &id, const std::string &name, DeviceProxy &methods) override
        {
            if (refuse)
                throw std::runtime_error("slot taken");
            registered = &methods;
            events.push_back("register " + id + " " + name);
        }

        void unregister_provider(const std::string &id) override
        {
            registered = nullptr;
            events.push_back("unregister " + id);
        }

        void emit_binary(const std::string &key, const char *, std::size_t) override
        {
            ++frames;
            events.push_back("frame " + key);
        }

        void set_status(const std::string &text) override { events.push_back("status " + text); }
        void set_error(const std::string &text) override { events.push_back("error " + text); }
    };

    FleetReconciler::Options fast()
    {
        FleetReconciler::Options o;
        o.discovery_interval = 30ms;
        o.reconnect_interval = 20ms;
        o.relay_reconnect_delay = 20ms;
        return o;
    }

    struct BridgeFixture
    {
        boost::asio::io_context ioc;
        RecordingHost host;
        FakeBackend backend{ioc.get_executor()};
        FakeConnector connector;
        Bridge bridge{ioc.get_executor(), host, backend, connector, fast()};

        bool saw(const std::string &e) const
        {
            for (const auto &x : host.events)
                if (x == e)
                    return true;
            return false;
        }
    };
}

TEST_CASE("start registers the provider and discovery feeds frames to the host")
{
    BridgeFixture f;
    f.backend.script({FakeBackend::ok({"A"})});

    REQUIRE(f.bridge.start());
    REQUIRE(f.bridge.started());
    REQUIRE(f.host.registered == &f.bridge.proxy());
    REQUIRE(f.host.events.front() == "register radar-bridge Radar Bridge (Server)");

    REQUIRE(run_until(f.ioc, [&]
                      { return f.connector.opens_for("/A/") == 1; }));
    REQUIRE(f.saw("status Connected - 1 radar(s) found"));

    auto s = f.connector.last_for("/A/");
    s->open();
    s->frame("spoke");
    REQUIRE(f.host.frames == 1);
    REQUIRE(f.saw("frame radars/A"));
}

TEST_CASE("registration failure is reported and nothing starts")
{
    BridgeFixture f;
    f.host.refuse = true;
    f.backend.script({FakeBackend::ok({"A"})});

    REQUIRE_FALSE(f.bridge.start());
    REQUIRE_FALSE(f.bridge.started());
    REQUIRE(f.saw("error Failed to register radar provider: slot taken"));

    run_for(f.ioc, 60ms);
    REQUIRE(f.backend.list_calls.empty());
    REQUIRE(f.connector.sessions.empty());
}

TEST_CASE("stop unregisters, tears down relays, closes the client and reports Stopped")
{
    BridgeFixture f;
    f.backend.script({FakeBackend::ok({"A", "B"})});
    REQUIRE(f.bridge.start());
    REQUIRE(run_until(f.ioc, [&]
                      { return f.bridge.fleet().known_devices().size() == 2; }));

    f.bridge.stop();
    REQUIRE_FALSE(f.bridge.started());
    REQUIRE(f.host.registered == nullptr);
    REQUIRE(f.backend.closes == 1);
    REQUIRE(f.connector.closes_for("/A/") == 1);
    REQUIRE(f.connector.closes_for("/B/") == 1);
    REQUIRE(f.bridge.fleet().known_devices().empty());
    REQUIRE(f.host.events.back() == "status Stopped");

    auto calls = f.backend.list_calls.size();
    run_for(f.ioc, 80ms);
    REQUIRE(f.backend.list_calls.size() == calls);
}

TEST_CASE("stop before start is harmless")
{
    BridgeFixture f;
    REQUIRE_NOTHROW(f.bridge.stop());
    REQUIRE_FALSE(f.saw("status Stopped"));
    REQUIRE(f.backend.closes == 1);
}

TEST_CASE("start reopens the backend client for the start after stop")
{
    BridgeFixture f;
    f.backend.script({FakeBackend::ok({"A"})});
    REQUIRE(f.bridge.start());
    f.bridge.stop();
    REQUIRE(f.backend.closes == 1);
    REQUIRE(f.bridge.start());
    REQUIRE(f.backend.opens == 2);
    REQUIRE(f.host.registered == &f.bridge.proxy());
}

TEST_CASE("bridge over a real client reconnects after stop and start")
{
    LocalHttpBackend server;
    server.handler = [](const TestRequest &req)
    {
        if (std::string(req.target()) == "/v2/api/radars")
            return make_response(req, test_http::status::ok, R"({"A":{}})");
        return make_response(req, test_http::status::ok, R"({"status":"transmit"})");
    };

    boost::asio::io_context ioc;
    BackendClient::Options copts;
    copts.host = "127.0.0.1";
    copts.port = server.port();
    copts.request_timeout = 2s;
    BackendClient client(ioc.get_executor(), copts);
    RecordingHost host;
    FakeConnector connector;
    Bridge bridge(ioc.get_executor(), host, client, connector, fast());

    REQUIRE(bridge.start());
    REQUIRE(run_until(ioc, [&]
                      { return bridge.fleet().connected(); }));

    bridge.stop();
    REQUIRE_FALSE(bridge.fleet().connected());
    REQUIRE_FALSE(bridge.proxy().get_state("A"));

    REQUIRE(bridge.start());
    REQUIRE(run_until(ioc, [&]
                      { return bridge.fleet().connected(); }, 1500ms));
    REQUIRE(bridge.fleet().known_devices() == std::vector<std::string>{"A"});
    REQUIRE(connector.opens_for("/A/") == 2);

    auto state = bridge.proxy().get_state("A");
    REQUIRE(state);
    REQUIRE((*state)["status"] == "transmit");

    for (const auto &e : host.events)
        CHECK(e.find("client closed") == std::string::npos);
    bridge.stop();
}
