/*
 * File: src/bridge_fleet.hpp
 * Project: Radar Bridge
 * Purpose: Device discovery, reconciliation and the backend connection phase
 * Notes:
 *  - Exactly one timer regime is armed: discovery while Connected,
 *    reconnect while Disconnected/Connecting
 *  - known_ and relays_ change only inside reconcile(), under mtx_
 *  - start/stop and every callback run on the fleet executor
 *  - status() may be called from any thread
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "bridge_backend.hpp"
#include "bridge_relay.hpp"
#include "bridge_stream.hpp"
#include "common/backend_error.hpp"
#include "common/log.hpp"

struct RelayStatus
{
    std::string device_id;
    bool connected = false;
    std::uint64_t frames = 0;
    std::uint64_t bytes = 0;
};

struct FleetStatus
{
    bool connected = false;
    std::string phase;
    std::vector<std::string> devices; // sorted
    std::vector<RelayStatus> relays;  // sorted by device id
};

inline nlohmann::json fleet_status_to_json(const FleetStatus &s)
{
    nlohmann::json relays = nlohmann::json::array();
    for (const auto &r : s.relays)
        relays.push_back({{"radarId", r.device_id}, {"connected", r.connected}, {"frames", r.frames}, {"bytes", r.bytes}});
    return nlohmann::json{
        {"connected", s.connected},
        {"phase", s.phase},
        {"radars", s.devices},
        {"spokeForwarders", relays}};
}

class FleetReconciler
{
public:
    enum class Phase
    {
        disconnected,
        connecting,
        connected
    };

    enum class TimerRegime
    {
        none,
        discovery,
        reconnect
    };

    struct Options
    {
        std::chrono::steady_clock::duration discovery_interval{std::chrono::seconds(10)};
        std::chrono::steady_clock::duration reconnect_interval{std::chrono::seconds(5)};
        // per-relay reconnect delay; normally the same as reconnect_interval
        std::chrono::steady_clock::duration relay_reconnect_delay{std::chrono::seconds(5)};
    };

    struct Callbacks
    {
        FrameSink on_frame;
        std::function<void(const std::string &)> on_status;
        std::function<void(const std::string &)> on_error;
    };

    struct Delta
    {
        std::vector<std::string> added;
        std::vector<std::string> removed;
    };

private:
    boost::asio::any_io_executor ex_;
    DeviceBackend &backend_;
    StreamConnector &connector_;
    Callbacks cb_;
    Options opts_;

    // single timer slot, tagged with the regime it serves
    boost::asio::steady_timer timer_;
    TimerRegime regime_ = TimerRegime::none;
    std::uint64_t timer_epoch_ = 0;
    std::chrono::steady_clock::time_point deadline_{};

    bool running_ = false;
    bool poll_in_flight_ = false;
    std::uint64_t run_epoch_ = 0;
    std::shared_ptr<bool> life_ = std::make_shared<bool>(true);

    std::atomic<Phase> phase_{Phase::disconnected};
    mutable std::mutex mtx_;
    std::set<std::string> known_;
    std::map<std::string, std::shared_ptr<StreamRelay>> relays_;

public:
    FleetReconciler(boost::asio::any_io_executor ex, DeviceBackend &backend, StreamConnector &connector,
                    Callbacks cb, Options opts)
        : ex_(ex), backend_(backend), connector_(connector), cb_(std::move(cb)), opts_(opts), timer_(ex)
    {
    }

    FleetReconciler(const FleetReconciler &) = delete;
    FleetReconciler &operator=(const FleetReconciler &) = delete;

    ~FleetReconciler() { stop(); }

    static const char *phase_name(Phase p)
    {
        switch (p)
        {
        case Phase::disconnected:
            return "disconnected";
        case Phase::connecting:
            return "connecting";
        case Phase::connected:
            return "connected";
        }
        return "unknown";
    }

    Phase phase() const { return phase_.load(); }
    bool connected() const { return phase_.load() == Phase::connected; }
    TimerRegime timer_regime() const { return regime_; }
    bool running() const { return running_; }

    void start()
    {
        if (running_)
            return;
        running_ = true;
        ++run_epoch_;
        log_info("fleet", "starting discovery against backend");
        attempt_connect(true);
    }

    // Hard teardown: timers, then every relay, then the bookkeeping.
    void stop()
    {
        const bool was_running = running_;
        running_ = false;
        ++run_epoch_;
        poll_in_flight_ = false;
        arm(TimerRegime::none);

        std::size_t stopped = 0;
        {
            std::scoped_lock lk(mtx_);
            for (auto &[id, relay] : relays_)
            {
                relay->stop();
                ++stopped;
            }
            relays_.clear();
            known_.clear();
        }
        phase_ = Phase::disconnected;
        if (was_running)
            log_info("fleet", "stopped (" + std::to_string(stopped) + " relay(s) torn down)");
    }

    // One atomic pass: afterwards known_ == keys(relays_) == current.
    Delta reconcile(const std::vector<std::string> &current)
    {
        Delta d;
        std::set<std::string> cur(current.begin(), current.end());

        std::scoped_lock lk(mtx_);
        for (const auto &id : cur)
        {
            if (known_.count(id))
                continue;
            log_debug("fleet", "new radar discovered: " + id);
            auto relay = std::make_shared<StreamRelay>(ex_, id, backend_.stream_url(id), connector_, cb_.on_frame,
                                                       opts_.relay_reconnect_delay);
            known_.insert(id);
            relays_.emplace(id, relay);
            relay->start();
            d.added.push_back(id);
        }

        for (auto it = known_.begin(); it != known_.end();)
        {
            if (cur.count(*it))
            {
                ++it;
                continue;
            }
            const std::string id = *it;
            log_debug("fleet", "radar disconnected: " + id);
            it = known_.erase(it);
            auto r = relays_.find(id);
            if (r != relays_.end())
            {
                auto relay = std::move(r->second);
                relays_.erase(r);
                relay->stop();
            }
            d.removed.push_back(id);
        }
        return d;
    }

    FleetStatus status() const
    {
        FleetStatus s;
        std::scoped_lock lk(mtx_);
        s.connected = phase_.load() == Phase::connected;
        s.phase = phase_name(phase_.load());
        s.devices.assign(known_.begin(), known_.end());
        for (const auto &[id, relay] : relays_)
            s.relays.push_back(RelayStatus{id, relay->connected(), relay->frames_forwarded(), relay->bytes_forwarded()});
        return s;
    }

    std::vector<std::string> known_devices() const
    {
        std::scoped_lock lk(mtx_);
        return {known_.begin(), known_.end()};
    }

    std::vector<std::string> relay_ids() const
    {
        std::scoped_lock lk(mtx_);
        std::vector<std::string> out;
        for (const auto &kv : relays_)
            out.push_back(kv.first);
        return out;
    }

private:
    static std::vector<std::string> device_ids(const nlohmann::json &devices)
    {
        std::vector<std::string> ids;
        for (auto it = devices.begin(); it != devices.end(); ++it)
            ids.push_back(it.key());
        return ids;
    }

    void report_status(const std::string &s)
    {
        log_info("fleet", s);
        if (cb_.on_status)
            cb_.on_status(s);
    }

    void report_error(const std::string &s)
    {
        log_warn("fleet", s);
        if (cb_.on_error)
            cb_.on_error(s);
    }

    std::chrono::steady_clock::duration interval(TimerRegime r) const
    {
        return r == TimerRegime::discovery ? opts_.discovery_interval : opts_.reconnect_interval;
    }

    // Switch the single timer slot to regime r (fresh cadence), or disarm it.
    void arm(TimerRegime r)
    {
        timer_.cancel();
        ++timer_epoch_;
        regime_ = r;
        if (r == TimerRegime::none)
            return;
        deadline_ = std::chrono::steady_clock::now() + interval(r);
        wait();
    }

    void wait()
    {
        std::weak_ptr<bool> life = life_;
        timer_.expires_at(deadline_);
        timer_.async_wait([this, life, epoch = timer_epoch_](boost::system::error_code ec)
                          {
            if (life.expired() || ec == boost::asio::error::operation_aborted)
                return;
            if (epoch != timer_epoch_ || !running_)
                return;
            on_tick(); });
    }

    void on_tick()
    {
        // fixed cadence; skip ahead instead of bursting after a stall
        auto now = std::chrono::steady_clock::now();
        deadline_ += interval(regime_);
        if (deadline_ <= now)
            deadline_ = now + interval(regime_);
        wait();

        if (poll_in_flight_)
        {
            log_debug("fleet", "previous poll still running, skipping tick");
            return;
        }
        if (regime_ == TimerRegime::discovery)
            poll_discovery();
        else
            attempt_connect(false);
    }

    // Shared by the startup attempt and every reconnect tick.
    void attempt_connect(bool initial)
    {
        poll_in_flight_ = true;
        phase_ = Phase::connecting;
        std::weak_ptr<bool> life = life_;
        backend_.async_list_devices([this, life, epoch = run_epoch_, initial](std::optional<BackendError> err, nlohmann::json devices)
                                    {
            if (life.expired() || epoch != run_epoch_)
                return;
            poll_in_flight_ = false;
            if (err)
                return on_connect_failed(*err, initial);
            on_connected(devices); });
    }

    void on_connected(const nlohmann::json &devices)
    {
        auto ids = device_ids(devices);
        phase_ = Phase::connected;
        report_status("Connected - " + std::to_string(ids.size()) + " radar(s) found");
        arm(TimerRegime::none);
        reconcile(ids);
        arm(TimerRegime::discovery);
    }

    void on_connect_failed(const BackendError &err, bool initial)
    {
        phase_ = Phase::disconnected;
        if (initial)
        {
            report_error(std::string("Cannot connect to backend: ") + err.what());
            arm(TimerRegime::reconnect);
        }
        else
        {
            log_debug("fleet", std::string("reconnect failed: ") + err.what());
        }
    }

    void poll_discovery()
    {
        poll_in_flight_ = true;
        std::weak_ptr<bool> life = life_;
        backend_.async_list_devices([this, life, epoch = run_epoch_](std::optional<BackendError> err, nlohmann::json devices)
                                    {
            if (life.expired() || epoch != run_epoch_)
                return;
            poll_in_flight_ = false;
            if (err)
                return on_discovery_failed(*err);
            auto ids = device_ids(devices);
            reconcile(ids);
            report_status("Connected - " + std::to_string(ids.size()) + " radar(s)"); });
    }

    // Relays are left running; only a later successful pass removes devices.
    void on_discovery_failed(const BackendError &err)
    {
        phase_ = Phase::disconnected;
        report_error(std::string("Lost connection: ") + err.what());
        arm(TimerRegime::reconnect);
    }
};
