/*
 * File: src/bridge_client.hpp
 * Project: Radar Bridge
 * Purpose: HTTP(S) client for the radar backend REST API
 * Notes:
 *  - One connection per request, fixed deadline per request
 *  - Async path runs on the caller's executor; sync path on a private io_context
 *  - No retries: callers own the retry policy
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include "bridge_backend.hpp"
#include "common/backend_error.hpp"
#include "common/log.hpp"
#include "common/url.hpp"

namespace http = boost::beast::http;

namespace detail
{
    template <class S>
    struct is_ssl_stream : std::false_type
    {
    };
    template <class N>
    struct is_ssl_stream<boost::beast::ssl_stream<N>> : std::true_type
    {
    };

    inline BackendError classify(const boost::beast::error_code &ec, const std::string &stage, bool connected)
    {
        if (ec == boost::beast::error::timeout)
            return BackendError(BackendErrorKind::timeout, stage + ": request timeout");
        if (!connected)
            return BackendError(BackendErrorKind::unreachable, stage + ": " + ec.message());
        return BackendError(BackendErrorKind::socket_error, stage + ": " + ec.message());
    }

    // 2xx: JSON body, or the raw text when it is not JSON, or null when empty
    inline nlohmann::json decode_body(const http::response<http::string_body> &res)
    {
        const unsigned status = res.result_int();
        if (status < 200 || status >= 300)
            throw BackendError(BackendErrorKind::bad_response,
                               "HTTP " + std::to_string(status) + ": " + res.body(), status);
        if (res.body().empty())
            return nullptr;
        auto j = nlohmann::json::parse(res.body(), nullptr, false);
        if (j.is_discarded())
            return res.body();
        return j;
    }

    using JsonHandler = std::function<void(std::optional<BackendError>, nlohmann::json)>;

    // resolve -> connect -> [tls handshake] -> write -> read, all under one deadline
    template <class Stream>
    class HttpExchange : public std::enable_shared_from_this<HttpExchange<Stream>>
    {
        boost::asio::ip::tcp::resolver resolver_;
        Stream stream_;
        boost::beast::flat_buffer buffer_;
        http::request<http::string_body> req_;
        http::response<http::string_body> res_;
        std::string host_;
        std::string port_;
        std::chrono::steady_clock::time_point deadline_;
        std::chrono::steady_clock::duration timeout_;
        JsonHandler handler_;
        bool connected_ = false;

    public:
        template <class... StreamArgs>
        HttpExchange(boost::asio::any_io_executor ex, http::request<http::string_body> req,
                     std::string host, std::string port, std::chrono::steady_clock::duration timeout,
                     JsonHandler handler, StreamArgs &&...stream_args)
            : resolver_(ex), stream_(ex, std::forward<StreamArgs>(stream_args)...), req_(std::move(req)),
              host_(std::move(host)), port_(std::move(port)), timeout_(timeout), handler_(std::move(handler))
        {
        }

        void run()
        {
            deadline_ = std::chrono::steady_clock::now() + timeout_;
            if constexpr (is_ssl_stream<Stream>::value)
            {
                if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str()))
                {
                    boost::beast::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
                    return fail(ec, "tls sni");
                }
                stream_.set_verify_callback(boost::asio::ssl::host_name_verification(host_));
            }
            auto self = this->shared_from_this();
            resolver_.async_resolve(host_, port_, [self](boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
                                    { self->on_resolve(ec, results); });
        }

    private:
        void on_resolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
        {
            if (ec)
                return fail(ec, "resolve " + host_);
            auto self = this->shared_from_this();
            boost::beast::get_lowest_layer(stream_).expires_at(deadline_);
            boost::beast::get_lowest_layer(stream_).async_connect(
                results, [self](boost::beast::error_code ec, boost::asio::ip::tcp::endpoint)
                { self->on_connect(ec); });
        }

        void on_connect(boost::beast::error_code ec)
        {
            if (ec)
                return fail(ec, "connect " + host_ + ":" + port_);
            connected_ = true;
            if constexpr (is_ssl_stream<Stream>::value)
            {
                auto self = this->shared_from_this();
                boost::beast::get_lowest_layer(stream_).expires_at(deadline_);
                stream_.async_handshake(boost::asio::ssl::stream_base::client, [self](boost::beast::error_code ec)
                                        {
                    if (ec) return self->fail(ec, "tls handshake");
                    self->do_write(); });
            }
            else
            {
                do_write();
            }
        }

        void do_write()
        {
            auto self = this->shared_from_this();
            boost::beast::get_lowest_layer(stream_).expires_at(deadline_);
            http::async_write(stream_, req_, [self](boost::beast::error_code ec, std::size_t)
                              {
                if (ec) return self->fail(ec, "write");
                self->do_read(); });
        }

        void do_read()
        {
            auto self = this->shared_from_this();
            http::async_read(stream_, buffer_, res_, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (ec) return self->fail(ec, "read");
                self->on_response(); });
        }

        void on_response()
        {
            boost::beast::error_code ignored;
            boost::beast::get_lowest_layer(stream_).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
            boost::beast::get_lowest_layer(stream_).close();
            try
            {
                complete(std::nullopt, decode_body(res_));
            }
            catch (const BackendError &e)
            {
                complete(e, nullptr);
            }
        }

        void fail(boost::beast::error_code ec, const std::string &stage)
        {
            complete(classify(ec, stage, connected_), nullptr);
        }

        void complete(std::optional<BackendError> err, nlohmann::json body)
        {
            auto h = std::move(handler_);
            handler_ = nullptr;
            if (h)
                h(std::move(err), std::move(body));
        }
    };
}

class BackendClient : public DeviceBackend
{
public:
    struct Options
    {
        std::string host{"localhost"};
        int port{6502};
        bool secure{false};
        std::string api_base_path{"/v2/api/radars"};
        std::chrono::steady_clock::duration request_timeout{std::chrono::seconds(10)};
        bool tls_verify{true};
    };

private:
    boost::asio::any_io_executor ex_;
    Options opts_;
    std::shared_ptr<boost::asio::ssl::context> tls_;
    std::atomic<bool> closed_{false};

public:
    BackendClient(boost::asio::any_io_executor ex, Options opts)
        : ex_(std::move(ex)), opts_(std::move(opts))
    {
        if (opts_.secure)
        {
            tls_ = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
            if (opts_.tls_verify)
            {
                tls_->set_default_verify_paths();
                tls_->set_verify_mode(boost::asio::ssl::verify_peer);
            }
            else
            {
                tls_->set_verify_mode(boost::asio::ssl::verify_none);
            }
        }
    }

    const Options &options() const { return opts_; }

    std::string base_url() const
    {
        return std::string(opts_.secure ? "https" : "http") + "://" + url_host(opts_.host) + ":" + std::to_string(opts_.port);
    }

    std::string device_path(const std::string &id) const
    {
        return opts_.api_base_path + "/" + encode_path_segment(id);
    }

    std::string stream_url(const std::string &id) const override
    {
        return ws_base() + device_path(id) + "/spokes";
    }

    std::string target_stream_url(const std::string &id) const
    {
        return ws_base() + device_path(id) + "/targets/stream";
    }

    // -------- async --------

    void async_request(http::verb method, const std::string &target, std::optional<nlohmann::json> body,
                       detail::JsonHandler handler)
    {
        launch(ex_, method, target, body, std::move(handler));
    }

    void async_list_devices(ListHandler handler) override
    {
        async_request(http::verb::get, opts_.api_base_path, std::nullopt,
                      [h = std::move(handler)](std::optional<BackendError> err, nlohmann::json body)
                      {
                          if (!err && !body.is_object())
                              err = BackendError(BackendErrorKind::bad_response, "device list is not a JSON object");
                          if (err)
                              return h(std::move(err), nullptr);
                          h(std::nullopt, std::move(body));
                      });
    }

    // -------- sync --------

    nlohmann::json request(http::verb method, const std::string &target, std::optional<nlohmann::json> body = std::nullopt)
    {
        boost::asio::io_context ioc{1};
        std::optional<BackendError> err;
        nlohmann::json out;
        launch(ioc.get_executor(), method, target, body, [&](std::optional<BackendError> e, nlohmann::json j)
               {
            err = std::move(e);
            out = std::move(j); });
        ioc.run();
        if (err)
            throw *err;
        return out;
    }

    nlohmann::json list_devices() override
    {
        auto j = request(http::verb::get, opts_.api_base_path);
        if (!j.is_object())
            throw BackendError(BackendErrorKind::bad_response, "device list is not a JSON object");
        return j;
    }

    nlohmann::json get_capabilities(const std::string &id) override
    {
        return request(http::verb::get, device_path(id) + "/capabilities");
    }

    nlohmann::json get_state(const std::string &id) override
    {
        return request(http::verb::get, device_path(id) + "/state");
    }

    nlohmann::json set_control(const std::string &id, const std::string &key, const nlohmann::json &value) override
    {
        return request(http::verb::put, device_path(id) + "/controls/" + encode_path_segment(key), nlohmann::json{{"value", value}});
    }

    nlohmann::json set_controls(const std::string &id, const nlohmann::json &controls) override
    {
        return request(http::verb::put, device_path(id) + "/controls", controls);
    }

    nlohmann::json get_targets(const std::string &id) override
    {
        return request(http::verb::get, device_path(id) + "/targets");
    }

    nlohmann::json acquire_target(const std::string &id, double bearing, double distance) override
    {
        return request(http::verb::post, device_path(id) + "/targets", nlohmann::json{{"bearing", bearing}, {"distance", distance}});
    }

    nlohmann::json cancel_target(const std::string &id, const std::string &target_id) override
    {
        return request(http::verb::delete_, device_path(id) + "/targets/" + encode_path_segment(target_id));
    }

    void open() override
    {
        if (closed_.exchange(false))
            log_debug("client", "reopened " + base_url());
    }

    // Connections are per request; after close() every call fails as unreachable.
    void close() override
    {
        if (!closed_.exchange(true))
            log_debug("client", "closed " + base_url());
    }

private:
    std::string ws_base() const
    {
        return std::string(opts_.secure ? "wss" : "ws") + "://" + url_host(opts_.host) + ":" + std::to_string(opts_.port);
    }

    void launch(boost::asio::any_io_executor ex, http::verb method, const std::string &target,
                const std::optional<nlohmann::json> &body, detail::JsonHandler handler)
    {
        if (closed_.load())
        {
            boost::asio::post(ex, [h = std::move(handler)]()
                              { h(BackendError(BackendErrorKind::unreachable, "client closed"), nullptr); });
            return;
        }

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, url_host(opts_.host) + ":" + std::to_string(opts_.port));
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::accept, "application/json");
        req.set(http::field::content_type, "application/json");
        if (body)
            req.body() = body->dump();
        req.prepare_payload();

        const std::string port = std::to_string(opts_.port);
        if (opts_.secure)
        {
            std::make_shared<detail::HttpExchange<boost::beast::ssl_stream<boost::beast::tcp_stream>>>(
                ex, std::move(req), opts_.host, port, opts_.request_timeout, std::move(handler), *tls_)
                ->run();
        }
        else
        {
            std::make_shared<detail::HttpExchange<boost::beast::tcp_stream>>(
                ex, std::move(req), opts_.host, port, opts_.request_timeout, std::move(handler))
                ->run();
        }
    }
};
