/*
 * File: src/bridge_proxy.hpp
 * Project: Radar Bridge
 * Purpose: Provider method surface exposed to the host platform
 * Notes:
 *  - Every call is a pass-through to the backend
 *  - Failures become nullopt / false / {success:false}; nothing is thrown
 * Last updated: 2026-10-19
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge_backend.hpp"
#include "common/backend_error.hpp"
#include "common/log.hpp"

struct ControlResult
{
    bool success = false;
    std::string error;
};

struct AcquireResult
{
    bool success = false;
    nlohmann::json target_id; // null unless success
    std::string error;
};

// gain / sea / rain: automatic or manual with an optional level
struct ClutterSetting
{
    bool automatic = true;
    std::optional<double> value;
};

inline nlohmann::json to_json(const ControlResult &r)
{
    nlohmann::json j{{"success", r.success}};
    if (!r.success)
        j["error"] = r.error;
    return j;
}

inline nlohmann::json to_json(const AcquireResult &r)
{
    nlohmann::json j{{"success", r.success}};
    if (r.success)
        j["targetId"] = r.target_id;
    else
        j["error"] = r.error;
    return j;
}

class DeviceProxy
{
    DeviceBackend &backend_;

public:
    explicit DeviceProxy(DeviceBackend &backend) : backend_(backend) {}

    std::vector<std::string> get_radars()
    {
        std::vector<std::string> ids;
        try
        {
            auto devices = backend_.list_devices();
            for (auto it = devices.begin(); it != devices.end(); ++it)
                ids.push_back(it.key());
        }
        catch (const std::exception &e)
        {
            log_debug("proxy", std::string("getRadars error: ") + e.what());
            ids.clear();
        }
        return ids;
    }

    // Summary record combining state and capabilities.
    std::optional<nlohmann::json> get_radar_info(const std::string &id)
    {
        try
        {
            auto state = backend_.get_state(id);
            if (state.is_null())
                return std::nullopt;
            auto caps = backend_.get_capabilities(id);
            return std::make_optional<nlohmann::json>(build_radar_info(id, state, caps));
        }
        catch (const std::exception &e)
        {
            log_debug("proxy", "getRadarInfo error for " + id + ": " + e.what());
            return std::nullopt;
        }
    }

    std::optional<nlohmann::json> get_capabilities(const std::string &id)
    {
        return fetch("getCapabilities", id, [&]
                     { return backend_.get_capabilities(id); });
    }

    std::optional<nlohmann::json> get_state(const std::string &id)
    {
        return fetch("getState", id, [&]
                     { return backend_.get_state(id); });
    }

    std::optional<nlohmann::json> get_control(const std::string &id, const std::string &control_id)
    {
        try
        {
            auto state = backend_.get_state(id);
            if (!state.is_object())
                return std::nullopt;
            auto controls = state.find("controls");
            if (controls == state.end() || !controls->is_object())
                return std::nullopt;
            auto c = controls->find(control_id);
            if (c == controls->end() || c->is_null())
                return std::nullopt;
            return std::make_optional<nlohmann::json>(*c);
        }
        catch (const std::exception &e)
        {
            log_debug("proxy", "getControl error for " + id + "/" + control_id + ": " + e.what());
            return std::nullopt;
        }
    }

    std::optional<nlohmann::json> get_targets(const std::string &id)
    {
        return fetch("getTargets", id, [&]
                     { return backend_.get_targets(id); });
    }

    bool set_power(const std::string &id, const std::string &power_state)
    {
        return mutate("setPower", id, [&]
                      { backend_.set_control(id, "power", power_state); });
    }

    bool set_range(const std::string &id, double meters)
    {
        return mutate("setRange", id, [&]
                      { backend_.set_control(id, "range", meters); });
    }

    bool set_gain(const std::string &id, const ClutterSetting &gain)
    {
        return mutate("setGain", id, [&]
                      { backend_.set_control(id, "gain", clutter_value(gain, 50)); });
    }

    bool set_sea(const std::string &id, const ClutterSetting &sea)
    {
        return mutate("setSea", id, [&]
                      { backend_.set_control(id, "sea", clutter_value(sea, 50)); });
    }

    bool set_rain(const std::string &id, const ClutterSetting &rain)
    {
        return mutate("setRain", id, [&]
                      { backend_.set_control(id, "rain", clutter_value(rain, 0)); });
    }

    ControlResult set_control(const std::string &id, const std::string &control_id, const nlohmann::json &value)
    {
        try
        {
            backend_.set_control(id, control_id, value);
            return ControlResult{true, {}};
        }
        catch (const std::exception &e)
        {
            log_debug("proxy", "setControl error for " + id + "/" + control_id + ": " + e.what());
            return ControlResult{false, e.what()};
        }
    }

    bool set_controls(const std::string &id, const nlohmann::json &controls)
    {
        return mutate("setControls", id, [&]
                      { backend_.set_controls(id, controls); });
    }

    AcquireResult acquire_target(const std::string &id, double bearing, double distance)
    {
        try
        {
            auto result = backend_.acquire_target(id, bearing, distance);
            AcquireResult r;
            r.success = true;
            if (result.is_object())
                r.target_id = result.value("targetId", nlohmann::json());
            return r;
        }
        catch (const std::exception &e)
        {
            log_debug("proxy", "acquireTarget error for " + id + ": " + e.what());
            return AcquireResult{false, nullptr, e.what()};
        }
    }

    bool cancel_target(const std::string &id, const std::string &target_id)
    {
        return mutate("cancelTarget", id + "/" + target_id, [&]
                      { backend_.cancel_target(id, target_id); });
    }

    static nlohmann::json build_radar_info(const std::string &id, const nlohmann::json &state, const nlohmann::json &caps)
    {
        using nlohmann::json;
        auto at = [](const json &j, std::initializer_list<const char *> path) -> const json *
        {
            const json *cur = &j;
            for (const char *k : path)
            {
                if (!cur->is_object())
                    return nullptr;
                auto it = cur->find(k);
                if (it == cur->end() || it->is_null())
                    return nullptr;
                cur = &*it;
            }
            return cur;
        };
        // missing, null, false, 0 and "" all fall back to the default
        auto pick = [&](const json &j, std::initializer_list<const char *> path, json fallback) -> json
        {
            const json *v = at(j, path);
            if (!v)
                return fallback;
            if ((v->is_boolean() && !v->get<bool>()) || (v->is_number() && v->get<double>() == 0.0) ||
                (v->is_string() && v->get<std::string>().empty()))
                return fallback;
            return *v;
        };

        std::string name = id;
        json model = pick(caps, {"model"}, nullptr);
        json make = pick(caps, {"make"}, nullptr);
        if (!model.is_null())
        {
            std::string m = model.is_string() ? model.get<std::string>() : model.dump();
            std::string mk = make.is_string() ? make.get<std::string>() : (make.is_null() ? "" : make.dump());
            name = mk.empty() ? m : mk + " " + m;
            auto b = name.find_first_not_of(' ');
            auto e = name.find_last_not_of(' ');
            name = (b == std::string::npos) ? std::string() : name.substr(b, e - b + 1);
        }

        return json{
            {"id", id},
            {"name", name},
            {"brand", make.is_null() ? json("Unknown") : make},
            {"status", pick(state, {"status"}, "standby")},
            {"spokesPerRevolution", pick(caps, {"characteristics", "spokesPerRevolution"}, 2048)},
            {"maxSpokeLen", pick(caps, {"characteristics", "maxSpokeLength"}, 512)},
            {"range", pick(state, {"controls", "range"}, 1852)},
            {"controls",
             {{"gain", pick(state, {"controls", "gain"}, json{{"auto", true}, {"value", 50}})},
              {"sea", pick(state, {"controls", "sea"}, json{{"auto", true}, {"value", 50}})},
              {"rain", pick(state, {"controls", "rain"}, json{{"value", 0}})}}}};
    }

private:
    static nlohmann::json clutter_value(const ClutterSetting &s, double fallback)
    {
        return nlohmann::json{{"mode", s.automatic ? "auto" : "manual"}, {"value", s.value.value_or(fallback)}};
    }

    template <class Fn>
    std::optional<nlohmann::json> fetch(const char *op, const std::string &id, Fn &&fn)
    {
        try
        {
            return std::make_optional<nlohmann::json>(fn());
        }
        catch (const std::exception &e)
        {
            log_debug("proxy", std::string(op) + " error for " + id + ": " + e.what());
            return std::nullopt;
        }
    }

    template <class Fn>
    bool mutate(const char *op, const std::string &what, Fn &&fn)
    {
        try
        {
            fn();
            return true;
        }
        catch (const std::exception &e)
        {
            log_debug("proxy", std::string(op) + " error for " + what + ": " + e.what());
            return false;
        }
    }
};
