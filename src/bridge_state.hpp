/*
 * File: src/bridge_state.hpp
 * Project: Radar Bridge
 * Purpose: Local host platform: provider registry, status line, stream counters
 * Notes:
 *  - Written from the fleet thread, read from the HTTP thread; guarded by mtx
 *  - Emitted frames are accounted per stream key, not fanned out
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "bridge_fleet.hpp"
#include "bridge_host.hpp"
#include "bridge_proxy.hpp"
#include "common/log.hpp"

struct StreamCounter
{
    std::uint64_t frames{0};
    std::uint64_t bytes{0};
    std::string last_frame; // RFC3339 ms
};

struct BridgeState
{
    std::mutex mtx;
    std::string status{"Starting"};
    bool status_is_error{false};
    std::string status_at;
    std::string provider_id;
    std::string provider_name;
    DeviceProxy *provider = nullptr;
    std::map<std::string, StreamCounter> streams;
    const FleetReconciler *fleet = nullptr;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};

class LocalHost : public HostPlatform
{
    BridgeState &state_;

public:
    explicit LocalHost(BridgeState &s) : state_(s) {}

    void register_provider(const std::string &provider_id, const std::string &name, DeviceProxy &methods) override
    {
        std::scoped_lock lk(state_.mtx);
        if (state_.provider && state_.provider_id != provider_id)
            throw std::runtime_error("provider slot taken by " + state_.provider_id);
        state_.provider_id = provider_id;
        state_.provider_name = name;
        state_.provider = &methods;
        log_info("host", "provider registered: " + provider_id + " (" + name + ")");
    }

    void unregister_provider(const std::string &provider_id) override
    {
        std::scoped_lock lk(state_.mtx);
        if (state_.provider_id != provider_id)
            throw std::runtime_error("unknown provider: " + provider_id);
        state_.provider = nullptr;
        state_.provider_id.clear();
        state_.provider_name.clear();
        log_info("host", "provider unregistered: " + provider_id);
    }

    void emit_binary(const std::string &stream_key, const char *, std::size_t size) override
    {
        std::scoped_lock lk(state_.mtx);
        auto &c = state_.streams[stream_key];
        ++c.frames;
        c.bytes += size;
        c.last_frame = iso8601_now_ms();
    }

    void set_status(const std::string &text) override { set(text, false); }
    void set_error(const std::string &text) override { set(text, true); }

private:
    void set(const std::string &text, bool error)
    {
        std::scoped_lock lk(state_.mtx);
        state_.status = text;
        state_.status_is_error = error;
        state_.status_at = iso8601_now_ms();
    }
};

// GET /status body: fleet view plus host-side status and stream counters
inline nlohmann::json status_json(BridgeState &state)
{
    nlohmann::json j = state.fleet ? fleet_status_to_json(state.fleet->status())
                                   : nlohmann::json{{"connected", false}, {"radars", nlohmann::json::array()}, {"spokeForwarders", nlohmann::json::array()}};
    std::scoped_lock lk(state.mtx);
    j["status"] = state.status;
    j["error"] = state.status_is_error;
    j["statusAt"] = state.status_at;
    j["provider"] = state.provider ? nlohmann::json(state.provider_id) : nlohmann::json();
    nlohmann::json streams = nlohmann::json::object();
    for (const auto &[key, c] : state.streams)
        streams[key] = {{"frames", c.frames}, {"bytes", c.bytes}, {"lastFrame", c.last_frame}};
    j["streams"] = streams;
    return j;
}
