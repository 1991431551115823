/*
 * File: src/bridge_http.hpp
 * Project: Radar Bridge
 * Purpose: Local HTTP surface: /health, /status and the provider routes
 * Notes:
 *  - /radars/* maps 1:1 onto the registered DeviceProxy methods
 *  - Provider calls block this server's thread only
 *  - One request per connection
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "bridge_proxy.hpp"
#include "bridge_state.hpp"
#include "common/log.hpp"
#include "common/url.hpp"

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

inline HttpResponse json_response(const HttpRequest &req, http::status status, const nlohmann::json &body)
{
    HttpResponse res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

// "/radars/a%2Fb/controls/gain?x=1" -> {"radars", "a/b", "controls", "gain"}
inline std::vector<std::string> split_target(const std::string &target)
{
    std::string path = target.substr(0, target.find('?'));
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (pos <= path.size())
    {
        auto next = path.find('/', pos);
        if (next == std::string::npos)
            next = path.size();
        if (next > pos)
            parts.push_back(decode_path_segment(path.substr(pos, next - pos)));
        pos = next + 1;
    }
    return parts;
}

namespace detail
{
    inline HttpResponse optional_json(const HttpRequest &req, const std::optional<nlohmann::json> &v)
    {
        if (!v)
            return json_response(req, http::status::not_found, nlohmann::json{{"error", "unavailable"}});
        return json_response(req, http::status::ok, *v);
    }

    inline HttpResponse success_json(const HttpRequest &req, bool ok)
    {
        return json_response(req, ok ? http::status::ok : http::status::bad_gateway, nlohmann::json{{"success", ok}});
    }

    // nullopt when "auto" or "value" has the wrong type
    inline std::optional<ClutterSetting> clutter_from(const nlohmann::json &body)
    {
        ClutterSetting s;
        s.automatic = false;
        auto a = body.find("auto");
        if (a != body.end() && !a->is_null())
        {
            if (!a->is_boolean())
                return std::nullopt;
            s.automatic = a->get<bool>();
        }
        auto v = body.find("value");
        if (v != body.end() && !v->is_null())
        {
            if (!v->is_number())
                return std::nullopt;
            s.value = v->get<double>();
        }
        return s;
    }

    inline HttpResponse provider_route(const HttpRequest &req, DeviceProxy &p, const std::vector<std::string> &parts)
    {
        using nlohmann::json;
        const auto method = req.method();
        const std::size_t n = parts.size();

        // GET /radars
        if (n == 1)
        {
            if (method != http::verb::get)
                return json_response(req, http::status::method_not_allowed, json{{"error", "method not allowed"}});
            return json_response(req, http::status::ok, p.get_radars());
        }

        const std::string &id = parts[1];
        if (n == 2)
        {
            if (method != http::verb::get)
                return json_response(req, http::status::method_not_allowed, json{{"error", "method not allowed"}});
            return optional_json(req, p.get_radar_info(id));
        }

        const std::string &sub = parts[2];
        if (n == 3 && method == http::verb::get)
        {
            if (sub == "capabilities")
                return optional_json(req, p.get_capabilities(id));
            if (sub == "state")
                return optional_json(req, p.get_state(id));
            if (sub == "targets")
                return optional_json(req, p.get_targets(id));
        }

        // everything below carries a JSON body
        json body = req.body().empty() ? json::object() : json::parse(req.body(), nullptr, false);
        if (body.is_discarded())
            return json_response(req, http::status::bad_request, json{{"error", "bad json"}});

        if (sub == "controls")
        {
            if (n == 4 && method == http::verb::get)
                return optional_json(req, p.get_control(id, parts[3]));
            if (n == 4 && method == http::verb::put)
            {
                auto r = p.set_control(id, parts[3], body.is_object() ? body.value("value", json()) : body);
                return json_response(req, r.success ? http::status::ok : http::status::bad_gateway, to_json(r));
            }
            if (n == 3 && method == http::verb::put)
                return success_json(req, p.set_controls(id, body));
        }

        if (n == 3 && method == http::verb::put && body.is_object())
        {
            if (sub == "power" && body.contains("value") && body["value"].is_string())
                return success_json(req, p.set_power(id, body["value"].get<std::string>()));
            if (sub == "range" && body.contains("value") && body["value"].is_number())
                return success_json(req, p.set_range(id, body["value"].get<double>()));
            if (sub == "gain" || sub == "sea" || sub == "rain")
            {
                auto setting = clutter_from(body);
                if (!setting)
                    return json_response(req, http::status::bad_request, json{{"error", "bad field type"}, {"fields", {"auto", "value"}}});
                if (sub == "gain")
                    return success_json(req, p.set_gain(id, *setting));
                if (sub == "sea")
                    return success_json(req, p.set_sea(id, *setting));
                return success_json(req, p.set_rain(id, *setting));
            }
        }

        if (sub == "targets")
        {
            if (n == 3 && method == http::verb::post)
            {
                if (!body.is_object() || !body.contains("bearing") || !body.contains("distance") ||
                    !body["bearing"].is_number() || !body["distance"].is_number())
                    return json_response(req, http::status::bad_request, json{{"error", "missing fields"}, {"required", {"bearing", "distance"}}});
                auto r = p.acquire_target(id, body["bearing"].get<double>(), body["distance"].get<double>());
                return json_response(req, r.success ? http::status::ok : http::status::bad_gateway, to_json(r));
            }
            if (n == 4 && method == http::verb::delete_)
                return success_json(req, p.cancel_target(id, parts[3]));
        }

        return json_response(req, http::status::not_found, json{{"error", "not found"}});
    }
}

inline HttpResponse handle_request(const HttpRequest &req, BridgeState &state)
{
    using nlohmann::json;
    const std::string target(req.target());

    // GET /health
    if (req.method() == http::verb::get && target == "/health")
    {
        auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
        return json_response(req, http::status::ok, json{{"status", "ok"}, {"uptime_s", up}});
    }

    // GET /status
    if (req.method() == http::verb::get && target == "/status")
        return json_response(req, http::status::ok, status_json(state));

    auto parts = split_target(target);
    if (!parts.empty() && parts[0] == "radars")
    {
        DeviceProxy *provider = nullptr;
        {
            std::scoped_lock lk(state.mtx);
            provider = state.provider;
        }
        if (!provider)
            return json_response(req, http::status::service_unavailable, json{{"error", "no radar provider registered"}});
        return detail::provider_route(req, *provider, parts);
    }

    return json_response(req, http::status::not_found, json{{"error", "not found"}});
}

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    BridgeState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, BridgeState &s)
        : ioc_(ioc), acceptor_(ioc), socket_(ioc), state_(s)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("http listen on " + ep.address().to_string() + ":" + std::to_string(ep.port()) + " failed: " + ec.message());
        do_accept();
    }

    boost::asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

    bool listening() const { return acceptor_.is_open(); }

    void close()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }

    // Callable from any thread: closes the acceptor on the server's loop, then stops it.
    void shutdown()
    {
        boost::asio::post(ioc_, [this]()
                          {
            close();
            ioc_.stop(); });
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](boost::system::error_code ec)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec)
                std::make_shared<Session>(std::move(socket_), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        HttpRequest req;
        BridgeState &state;

        Session(boost::asio::ip::tcp::socket &&s, BridgeState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (!ec) self->handle(); });
        }

        // keep response alive through async_write
        void respond(HttpResponse &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<HttpResponse>(std::move(res));
            sp->set(http::field::server, "radar-bridge");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void handle()
        {
            log_debug("host", std::string(http::to_string(req.method())) + " " + std::string(req.target()));
            try
            {
                respond(handle_request(req, state));
            }
            catch (const std::exception &e)
            {
                respond(json_response(req, http::status::internal_server_error, nlohmann::json{{"error", "internal"}, {"what", e.what()}}));
            }
        }
    };
};
