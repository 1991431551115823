/*
 * File: src/bridge_stream.hpp
 * Project: Radar Bridge
 * Purpose: Outbound binary stream sessions (Beast WebSocket, ws:// and wss://)
 * Notes:
 *  - A session reports open once, frames while open, and close at most once
 *  - After close() no handler of that session runs again
 *  - Keepalive pings; a silent peer is dropped after the idle timeout
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

#include "common/backend_error.hpp"
#include "common/log.hpp"
#include "common/url.hpp"

namespace websocket = boost::beast::websocket;

struct StreamHandlers
{
    std::function<void()> on_open;
    std::function<void(const char *data, std::size_t size)> on_frame;
    std::function<void(const BackendError &reason)> on_close;
};

class StreamSession
{
public:
    virtual ~StreamSession() = default;
    virtual void close() = 0;
};

class StreamConnector
{
public:
    virtual ~StreamConnector() = default;

    // Must not invoke any handler before returning.
    virtual std::shared_ptr<StreamSession> open(const std::string &url, StreamHandlers handlers) = 0;
};

namespace detail
{
    template <class NextLayer>
    class WsSession : public StreamSession, public std::enable_shared_from_this<WsSession<NextLayer>>
    {
        static constexpr bool tls = !std::is_same<NextLayer, boost::beast::tcp_stream>::value;

        boost::asio::ip::tcp::resolver resolver_;
        websocket::stream<NextLayer> ws_;
        boost::beast::flat_buffer buffer_;
        UrlParts url_;
        std::chrono::steady_clock::duration connect_timeout_;
        StreamHandlers handlers_;
        bool handshake_done_ = false;
        bool connected_ = false;
        bool closing_ = false;

    public:
        template <class... Args>
        WsSession(boost::asio::any_io_executor ex, UrlParts url, std::chrono::steady_clock::duration connect_timeout,
                  StreamHandlers handlers, Args &&...next_layer_args)
            : resolver_(ex), ws_(ex, std::forward<Args>(next_layer_args)...), url_(std::move(url)),
              connect_timeout_(connect_timeout), handlers_(std::move(handlers))
        {
        }

        void run()
        {
            auto self = this->shared_from_this();
            resolver_.async_resolve(url_.host, url_.port, [self](boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
                                    { self->on_resolve(ec, results); });
        }

        void close() override
        {
            if (closing_)
                return;
            closing_ = true;
            handlers_ = StreamHandlers{};
            resolver_.cancel();
            if (handshake_done_)
            {
                auto self = this->shared_from_this();
                ws_.async_close(websocket::close_code::normal, [self](boost::beast::error_code ec)
                                {
                    if (ec && ec != boost::asio::error::operation_aborted)
                        log_debug("relay", "close " + self->url_.host + ": " + ec.message()); });
            }
            else
            {
                boost::beast::get_lowest_layer(ws_).close();
            }
        }

    private:
        void on_resolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
        {
            if (closing_)
                return;
            if (ec)
                return fail(ec, "resolve " + url_.host);
            auto self = this->shared_from_this();
            boost::beast::get_lowest_layer(ws_).expires_after(connect_timeout_);
            boost::beast::get_lowest_layer(ws_).async_connect(
                results, [self](boost::beast::error_code ec, boost::asio::ip::tcp::endpoint)
                { self->on_connect(ec); });
        }

        void on_connect(boost::beast::error_code ec)
        {
            if (closing_)
                return;
            if (ec)
                return fail(ec, "connect " + url_.host + ":" + url_.port);
            connected_ = true;
            if constexpr (tls)
            {
                if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str()))
                {
                    boost::beast::error_code sni{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
                    return fail(sni, "tls sni");
                }
                ws_.next_layer().set_verify_callback(boost::asio::ssl::host_name_verification(url_.host));
                auto self = this->shared_from_this();
                boost::beast::get_lowest_layer(ws_).expires_after(connect_timeout_);
                ws_.next_layer().async_handshake(boost::asio::ssl::stream_base::client, [self](boost::beast::error_code ec)
                                                 {
                    if (self->closing_) return;
                    if (ec) return self->fail(ec, "tls handshake");
                    self->do_handshake(); });
            }
            else
            {
                do_handshake();
            }
        }

        void do_handshake()
        {
            // websocket::stream keeps its own timers from here on
            boost::beast::get_lowest_layer(ws_).expires_never();
            auto timeouts = websocket::stream_base::timeout::suggested(boost::beast::role_type::client);
            timeouts.idle_timeout = std::chrono::seconds(30);
            timeouts.keep_alive_pings = true;
            ws_.set_option(timeouts);
            ws_.set_option(websocket::stream_base::decorator([](websocket::request_type &req)
                                                             { req.set(boost::beast::http::field::user_agent,
                                                                       std::string(BOOST_BEAST_VERSION_STRING) + " radar-bridge"); }));
            auto self = this->shared_from_this();
            ws_.async_handshake(url_.host + ":" + url_.port, url_.target, [self](boost::beast::error_code ec)
                                {
                if (self->closing_) return;
                if (ec) return self->fail(ec, "websocket handshake");
                self->handshake_done_ = true;
                auto on_open = self->handlers_.on_open;
                if (on_open) on_open();
                self->do_read(); });
        }

        void do_read()
        {
            if (closing_)
                return;
            auto self = this->shared_from_this();
            ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t)
                           { self->on_read(ec); });
        }

        void on_read(boost::beast::error_code ec)
        {
            if (closing_)
                return;
            if (ec == websocket::error::closed)
            {
                auto reason = ws_.reason();
                return report_close(BackendError(BackendErrorKind::socket_error,
                                                 "closed by peer: " + std::to_string(reason.code) + " " + std::string(reason.reason.data(), reason.reason.size())));
            }
            if (ec)
                return fail(ec, "read");

            if (ws_.got_binary())
            {
                // the handler may close this session
                auto on_frame = handlers_.on_frame;
                auto data = buffer_.data();
                if (on_frame)
                    on_frame(static_cast<const char *>(data.data()), data.size());
            }
            else
            {
                log_debug("relay", "dropping text frame (" + std::to_string(buffer_.size()) + " bytes) from " + url_.host);
            }
            buffer_.consume(buffer_.size());
            do_read();
        }

        void fail(boost::beast::error_code ec, const std::string &stage)
        {
            BackendErrorKind kind = BackendErrorKind::socket_error;
            if (ec == boost::beast::error::timeout)
                kind = BackendErrorKind::timeout;
            else if (!connected_)
                kind = BackendErrorKind::unreachable;
            report_close(BackendError(kind, stage + ": " + ec.message()));
        }

        void report_close(const BackendError &reason)
        {
            auto on_close = std::move(handlers_.on_close);
            handlers_ = StreamHandlers{};
            closing_ = true;
            boost::beast::error_code ignored;
            boost::beast::get_lowest_layer(ws_).socket().close(ignored);
            if (on_close)
                on_close(reason);
        }
    };
}

class WsStreamConnector : public StreamConnector
{
    boost::asio::any_io_executor ex_;
    std::chrono::steady_clock::duration connect_timeout_;
    bool tls_verify_;
    std::once_flag tls_once_;
    std::shared_ptr<boost::asio::ssl::context> tls_;

public:
    WsStreamConnector(boost::asio::any_io_executor ex, std::chrono::steady_clock::duration connect_timeout, bool tls_verify = true)
        : ex_(std::move(ex)), connect_timeout_(connect_timeout), tls_verify_(tls_verify) {}

    std::shared_ptr<StreamSession> open(const std::string &url, StreamHandlers handlers) override
    {
        UrlParts parts = parse_url(url);
        if (parts.secure)
        {
            auto s = std::make_shared<detail::WsSession<boost::beast::ssl_stream<boost::beast::tcp_stream>>>(
                ex_, std::move(parts), connect_timeout_, std::move(handlers), tls_context());
            s->run();
            return s;
        }
        auto s = std::make_shared<detail::WsSession<boost::beast::tcp_stream>>(
            ex_, std::move(parts), connect_timeout_, std::move(handlers));
        s->run();
        return s;
    }

private:
    boost::asio::ssl::context &tls_context()
    {
        std::call_once(tls_once_, [this]()
                       {
            tls_ = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
            if (tls_verify_)
            {
                tls_->set_default_verify_paths();
                tls_->set_verify_mode(boost::asio::ssl::verify_peer);
            }
            else
            {
                tls_->set_verify_mode(boost::asio::ssl::verify_none);
            } });
        return *tls_;
    }
};
