/*
 * File: tests/test_http_endpoints.cpp
 * Project: Radar Bridge
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - Routes are driven through handle_request; one test goes over a socket
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <string>
#include <thread>

#include "bridge_http.hpp"
#include "bridge_state.hpp"
#include "support/fake_backend.hpp"

using nlohmann::json;

namespace
{
    HttpRequest make_request(http::verb method, const std::string &target, const std::string &body = {})
    {
        HttpRequest req{method, target, 11};
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    struct HostFixture
    {
        boost::asio::io_context ioc;
        FakeBackend backend{ioc.get_executor()};
        DeviceProxy proxy{backend};
        BridgeState state;
        LocalHost host{state};

        HostFixture() { host.register_provider("radar-bridge", "Radar Bridge (Server)", proxy); }

        HttpResponse call(http::verb method, const std::string &target, const std::string &body = {})
        {
            return handle_request(make_request(method, target, body), state);
        }

        static json body(const HttpResponse &res) { return json::parse(res.body()); }
    };
}

TEST_CASE("split_target drops the query and decodes segments")
{
    REQUIRE(split_target("/radars/a%2Fb/controls/gain?x=1") == std::vector<std::string>{"radars", "a/b", "controls", "gain"});
    REQUIRE(split_target("/").empty());
    REQUIRE(split_target("//radars//") == std::vector<std::string>{"radars"});
}

TEST_CASE("health and status")
{
    HostFixture f;
    auto h = f.call(http::verb::get, "/health");
    REQUIRE(h.result() == http::status::ok);
    REQUIRE(HostFixture::body(h)["status"] == "ok");

    f.host.set_error("Lost connection: connect refused");
    f.host.emit_binary("radars/A", "abcd", 4);
    f.host.emit_binary("radars/A", "ef", 2);

    auto s = f.call(http::verb::get, "/status");
    REQUIRE(s.result() == http::status::ok);
    auto j = HostFixture::body(s);
    REQUIRE(j["status"] == "Lost connection: connect refused");
    REQUIRE(j["error"] == true);
    REQUIRE(j["provider"] == "radar-bridge");
    REQUIRE(j["connected"] == false);
    REQUIRE(j["streams"]["radars/A"]["frames"] == 2);
    REQUIRE(j["streams"]["radars/A"]["bytes"] == 6);
    REQUIRE(j["streams"]["radars/A"]["lastFrame"].get<std::string>().size() > 0);

    REQUIRE(f.call(http::verb::get, "/nope").result() == http::status::not_found);
}

TEST_CASE("radar routes need a registered provider")
{
    HostFixture f;
    f.host.unregister_provider("radar-bridge");
    auto r = f.call(http::verb::get, "/radars");
    REQUIRE(r.result() == http::status::service_unavailable);
    REQUIRE(HostFixture::body(r).contains("error"));
    REQUIRE(status_json(f.state)["provider"].is_null());
}

TEST_CASE("the provider slot holds one provider")
{
    HostFixture f;
    DeviceProxy other{f.backend};
    REQUIRE_THROWS(f.host.register_provider("other", "Other", other));
    REQUIRE_NOTHROW(f.host.register_provider("radar-bridge", "Radar Bridge (Server)", f.proxy));
    REQUIRE_THROWS(f.host.unregister_provider("other"));
}

TEST_CASE("read routes map onto provider getters")
{
    HostFixture f;
    f.backend.script({FakeBackend::ok({"A", "B"})});
    f.backend.state = json{{"status", "transmit"}, {"controls", {{"gain", {{"value", 40}}}}}};
    f.backend.capabilities = json{{"model", "HALO"}};

    auto list = f.call(http::verb::get, "/radars");
    REQUIRE(list.result() == http::status::ok);
    REQUIRE(HostFixture::body(list) == json::array({"A", "B"}));

    auto info = f.call(http::verb::get, "/radars/A");
    REQUIRE(info.result() == http::status::ok);
    REQUIRE(HostFixture::body(info)["name"] == "HALO");

    REQUIRE(HostFixture::body(f.call(http::verb::get, "/radars/A/state"))["status"] == "transmit");
    REQUIRE(HostFixture::body(f.call(http::verb::get, "/radars/A/capabilities"))["model"] == "HALO");
    REQUIRE(HostFixture::body(f.call(http::verb::get, "/radars/A/controls/gain"))["value"] == 40);
    REQUIRE(f.call(http::verb::get, "/radars/A/controls/sea").result() == http::status::not_found);

    f.backend.fail_calls = true;
    auto down = f.call(http::verb::get, "/radars/A/state");
    REQUIRE(down.result() == http::status::not_found);
    REQUIRE(HostFixture::body(down)["error"] == "unavailable");
    REQUIRE(HostFixture::body(f.call(http::verb::get, "/radars")) == json::array());
}

TEST_CASE("write routes map onto provider setters")
{
    HostFixture f;

    REQUIRE(f.call(http::verb::put, "/radars/A/power", R"({"value":"transmit"})").result() == http::status::ok);
    REQUIRE(f.call(http::verb::put, "/radars/A/range", R"({"value":1852})").result() == http::status::ok);
    REQUIRE(f.call(http::verb::put, "/radars/A/gain", R"({"auto":false,"value":30})").result() == http::status::ok);
    REQUIRE(f.call(http::verb::put, "/radars/A/controls/ftc", R"({"value":3})").result() == http::status::ok);

    auto &c = f.backend.controls;
    REQUIRE(c.size() == 4);
    CHECK(c[0].value == "transmit");
    CHECK(c[1].value == 1852);
    CHECK(c[2].value == json{{"mode", "manual"}, {"value", 30}});
    CHECK(c[3].key == "ftc");
    CHECK(c[3].value == 3);

    REQUIRE(f.call(http::verb::put, "/radars/A/controls", R"({"gain":1})").result() == http::status::ok);
    REQUIRE(f.backend.bulk_controls.size() == 1);

    auto acq = f.call(http::verb::post, "/radars/A/targets", R"({"bearing":10,"distance":500})");
    REQUIRE(acq.result() == http::status::ok);
    REQUIRE(HostFixture::body(acq) == json{{"success", true}, {"targetId", 7}});

    REQUIRE(f.call(http::verb::delete_, "/radars/A/targets/7").result() == http::status::ok);
    REQUIRE(f.backend.cancelled == std::vector<std::string>{"7"});
}

TEST_CASE("write route failures and bad input")
{
    HostFixture f;

    REQUIRE(f.call(http::verb::put, "/radars/A/gain", "{nope").result() == http::status::bad_request);
    REQUIRE(f.call(http::verb::put, "/radars/A/gain", R"({"auto":"yes"})").result() == http::status::bad_request);
    REQUIRE(f.call(http::verb::put, "/radars/A/sea", R"({"auto":1,"value":20})").result() == http::status::bad_request);
    REQUIRE(f.call(http::verb::put, "/radars/A/rain", R"({"auto":false,"value":"high"})").result() == http::status::bad_request);
    REQUIRE(f.backend.controls.empty());
    REQUIRE(f.call(http::verb::post, "/radars/A/targets", R"({"bearing":10})").result() == http::status::bad_request);
    REQUIRE(f.call(http::verb::put, "/radars/A/power", R"({"value":1})").result() == http::status::not_found);
    REQUIRE(f.call(http::verb::post, "/radars").result() == http::status::method_not_allowed);
    REQUIRE(f.call(http::verb::delete_, "/radars/A").result() == http::status::method_not_allowed);

    f.backend.fail_calls = true;
    auto r = f.call(http::verb::put, "/radars/A/power", R"({"value":"standby"})");
    REQUIRE(r.result() == http::status::bad_gateway);
    REQUIRE(HostFixture::body(r) == json{{"success", false}});

    auto c = f.call(http::verb::put, "/radars/A/controls/gain", R"({"value":3})");
    REQUIRE(c.result() == http::status::bad_gateway);
    REQUIRE(HostFixture::body(c)["success"] == false);
    REQUIRE(HostFixture::body(c).contains("error"));
}

TEST_CASE("server answers over a socket")
{
    HostFixture f;
    boost::asio::io_context http_ioc;
    HttpServer server(http_ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}, f.state);
    std::thread t([&]
                  { http_ioc.run(); });

    boost::asio::io_context client_ioc;
    boost::beast::tcp_stream stream(client_ioc);
    stream.connect(server.local_endpoint());
    auto req = make_request(http::verb::get, "/health");
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);
    boost::beast::flat_buffer buf;
    HttpResponse res;
    http::read(stream, buf, res);

    server.shutdown();
    t.join();
    REQUIRE_FALSE(server.listening());

    REQUIRE(res.result() == http::status::ok);
    REQUIRE(std::string(res[http::field::server]) == "radar-bridge");
    REQUIRE(json::parse(res.body())["status"] == "ok");
}
