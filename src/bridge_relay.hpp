/*
 * File: src/bridge_relay.hpp
 * Project: Radar Bridge
 * Purpose: Per-device spoke relay: one outbound stream, frames to the host sink
 * Notes:
 *  - All member functions run on the relay's executor (single thread)
 *  - connected()/state()/counters may be read from any thread
 *  - Reconnects after a fixed delay; at most one reconnect pending
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "bridge_stream.hpp"
#include "common/backend_error.hpp"
#include "common/log.hpp"

// stream_key, raw frame bytes; invoked synchronously once per inbound frame
using FrameSink = std::function<void(const std::string &stream_key, const char *data, std::size_t size)>;

class StreamRelay : public std::enable_shared_from_this<StreamRelay>
{
public:
    enum class State
    {
        idle,
        connecting,
        open,
        reconnect_pending,
        stopped
    };

private:
    std::string device_id_;
    std::string url_;
    std::string stream_key_;
    StreamConnector &connector_;
    FrameSink sink_;
    std::chrono::steady_clock::duration reconnect_delay_;

    boost::asio::steady_timer reconnect_timer_;
    bool reconnect_pending_ = false;
    bool closed_ = false;
    std::uint64_t session_gen_ = 0;
    std::shared_ptr<StreamSession> session_;

    std::atomic<State> state_{State::idle};
    std::atomic<bool> connected_{false};
    std::atomic<std::uint64_t> frames_{0};
    std::atomic<std::uint64_t> bytes_{0};
    std::atomic<std::uint64_t> attempts_{0};

public:
    StreamRelay(boost::asio::any_io_executor ex, std::string device_id, std::string url, StreamConnector &connector,
                FrameSink sink, std::chrono::steady_clock::duration reconnect_delay)
        : device_id_(std::move(device_id)), url_(std::move(url)), stream_key_(stream_key_for(device_id_)),
          connector_(connector), sink_(std::move(sink)), reconnect_delay_(reconnect_delay), reconnect_timer_(ex)
    {
    }

    StreamRelay(const StreamRelay &) = delete;
    StreamRelay &operator=(const StreamRelay &) = delete;

    ~StreamRelay() { stop(); }

    static std::string stream_key_for(const std::string &device_id) { return "radars/" + device_id; }

    const std::string &device_id() const { return device_id_; }
    const std::string &url() const { return url_; }
    const std::string &stream_key() const { return stream_key_; }

    bool connected() const { return connected_.load(); }
    State state() const { return state_.load(); }
    std::uint64_t frames_forwarded() const { return frames_.load(); }
    std::uint64_t bytes_forwarded() const { return bytes_.load(); }
    std::uint64_t connect_attempts() const { return attempts_.load(); }

    void start()
    {
        if (closed_ || state_.load() != State::idle)
            return;
        connect();
    }

    // Idempotent. Nothing is forwarded and nothing reconnects once this returns.
    void stop()
    {
        if (closed_)
            return;
        closed_ = true;

        if (reconnect_pending_)
        {
            reconnect_pending_ = false;
            reconnect_timer_.cancel();
        }
        if (session_)
        {
            auto s = std::move(session_);
            s->close();
        }
        ++session_gen_;
        connected_ = false;
        state_ = State::stopped;
        log_debug("relay", "stopped spoke relay for " + device_id_);
    }

private:
    void connect()
    {
        if (closed_)
            return;

        const std::uint64_t gen = ++session_gen_;
        state_ = State::connecting;
        ++attempts_;
        log_debug("relay", "connecting to spoke stream: " + url_);

        std::weak_ptr<StreamRelay> weak = weak_from_this();
        StreamHandlers h;
        h.on_open = [weak, gen]()
        {
            if (auto self = weak.lock())
                self->on_open(gen);
        };
        h.on_frame = [weak, gen](const char *data, std::size_t size)
        {
            if (auto self = weak.lock())
                self->on_frame(gen, data, size);
        };
        h.on_close = [weak, gen](const BackendError &reason)
        {
            if (auto self = weak.lock())
                self->on_close(gen, reason);
        };

        try
        {
            session_ = connector_.open(url_, std::move(h));
        }
        catch (const std::exception &e)
        {
            log_debug("relay", "failed to open spoke stream for " + device_id_ + ": " + e.what());
            session_.reset();
            state_ = State::reconnect_pending;
            schedule_reconnect();
        }
    }

    bool current(std::uint64_t gen) const { return !closed_ && gen == session_gen_; }

    void on_open(std::uint64_t gen)
    {
        if (!current(gen))
            return;
        connected_ = true;
        state_ = State::open;
        log_debug("relay", "connected to spoke stream for " + device_id_);
    }

    void on_frame(std::uint64_t gen, const char *data, std::size_t size)
    {
        if (!current(gen) || state_.load() != State::open)
            return;
        ++frames_;
        bytes_ += size;
        if (sink_)
            sink_(stream_key_, data, size);
    }

    void on_close(std::uint64_t gen, const BackendError &reason)
    {
        if (!current(gen))
            return;
        connected_ = false;
        session_.reset();
        state_ = State::reconnect_pending;
        log_debug("relay", "spoke stream closed for " + device_id_ + " (" + to_string(reason.kind()) + "): " + reason.what());
        schedule_reconnect();
    }

    void schedule_reconnect()
    {
        if (closed_ || reconnect_pending_)
            return;
        reconnect_pending_ = true;
        log_debug("relay", "scheduling reconnect for " + device_id_ + " in " +
                               std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(reconnect_delay_).count()) + "ms");

        std::weak_ptr<StreamRelay> weak = weak_from_this();
        reconnect_timer_.expires_after(reconnect_delay_);
        reconnect_timer_.async_wait([weak](boost::system::error_code ec)
                                    {
            auto self = weak.lock();
            if (!self || ec == boost::asio::error::operation_aborted)
                return;
            if (self->closed_ || !self->reconnect_pending_)
                return;
            self->reconnect_pending_ = false;
            self->connect(); });
    }
};
