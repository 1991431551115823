/*
 * File: src/bridge_config.hpp
 * Project: Radar Bridge
 * Purpose: Bridge settings: JSON file + command line overrides
 * Notes:
 *  - Keys mirror the provider settings schema (host, port, secure, ...)
 *  - validate() is called after every source has been applied
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class ConfigError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

struct BridgeConfig
{
    std::string host{"localhost"};
    int port{6502};
    bool secure{false};
    int discovery_poll_interval_s{10};
    int reconnect_interval_s{5};
    int request_timeout_s{10};
    bool tls_verify{true};
    std::string api_base_path{"/v2/api/radars"};
    std::string status_bind{"127.0.0.1:6503"};
    bool debug{false};

    std::chrono::seconds discovery_poll_interval() const { return std::chrono::seconds(discovery_poll_interval_s); }
    std::chrono::seconds reconnect_interval() const { return std::chrono::seconds(reconnect_interval_s); }
    std::chrono::seconds request_timeout() const { return std::chrono::seconds(request_timeout_s); }

    void validate() const
    {
        if (host.empty())
            throw ConfigError("host must not be empty");
        if (port < 1 || port > 65535)
            throw ConfigError("port must be in 1..65535, got " + std::to_string(port));
        if (discovery_poll_interval_s < 5 || discovery_poll_interval_s > 60)
            throw ConfigError("discoveryPollIntervalSeconds must be in 5..60, got " + std::to_string(discovery_poll_interval_s));
        if (reconnect_interval_s < 1 || reconnect_interval_s > 30)
            throw ConfigError("reconnectIntervalSeconds must be in 1..30, got " + std::to_string(reconnect_interval_s));
        if (request_timeout_s < 1)
            throw ConfigError("requestTimeoutSeconds must be >= 1, got " + std::to_string(request_timeout_s));
        if (api_base_path.empty() || api_base_path.front() != '/')
            throw ConfigError("apiBasePath must start with '/'");
        if (status_bind.find(':') == std::string::npos)
            throw ConfigError("statusBind must be host:port, got '" + status_bind + "'");
    }
};

namespace detail
{
    template <typename T>
    void read_key(const nlohmann::json &j, const char *key, T &out)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return;
        try
        {
            out = it->get<T>();
        }
        catch (const nlohmann::json::exception &e)
        {
            throw ConfigError(std::string("bad value for '") + key + "': " + e.what());
        }
    }

    // integer keys: 6502.7 or 1e12 is an error, not a truncation
    inline void read_key(const nlohmann::json &j, const char *key, int &out)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return;
        if (!it->is_number_integer())
            throw ConfigError(std::string("bad value for '") + key + "': expected an integer, got " + it->dump());
        const bool fits = it->is_number_unsigned()
                              ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                              : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                    it->get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!fits)
            throw ConfigError(std::string("bad value for '") + key + "': out of range: " + it->dump());
        out = static_cast<int>(it->get<std::int64_t>());
    }
}

// Unknown keys are ignored; missing keys keep their defaults.
inline void apply_json(BridgeConfig &cfg, const nlohmann::json &j)
{
    if (!j.is_object())
        throw ConfigError("configuration must be a JSON object");
    detail::read_key(j, "host", cfg.host);
    detail::read_key(j, "port", cfg.port);
    detail::read_key(j, "secure", cfg.secure);
    detail::read_key(j, "discoveryPollIntervalSeconds", cfg.discovery_poll_interval_s);
    detail::read_key(j, "reconnectIntervalSeconds", cfg.reconnect_interval_s);
    detail::read_key(j, "requestTimeoutSeconds", cfg.request_timeout_s);
    detail::read_key(j, "tlsVerify", cfg.tls_verify);
    detail::read_key(j, "apiBasePath", cfg.api_base_path);
    detail::read_key(j, "statusBind", cfg.status_bind);
    detail::read_key(j, "debug", cfg.debug);
}

inline BridgeConfig load_config_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f)
        throw ConfigError("cannot open config file: " + path);
    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded())
        throw ConfigError("config file is not valid JSON: " + path);
    BridgeConfig cfg;
    apply_json(cfg, j);
    return cfg;
}

inline int parse_int_flag(const std::string &flag, const std::string &v)
{
    try
    {
        std::size_t used = 0;
        int n = std::stoi(v, &used);
        if (used != v.size())
            throw ConfigError(flag + " expects an integer, got '" + v + "'");
        return n;
    }
    catch (const std::logic_error &)
    {
        throw ConfigError(flag + " expects an integer, got '" + v + "'");
    }
}

// --config is applied first so that explicit flags win regardless of order.
inline BridgeConfig parse_command_line(int argc, char **argv)
{
    BridgeConfig cfg;
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--config")
        {
            cfg = load_config_file(argv[i + 1]);
            break;
        }
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        auto value = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw ConfigError(a + " requires a value");
            return argv[++i];
        };

        if (a == "--config")
            ++i;
        else if (a == "--host")
            cfg.host = value();
        else if (a == "--port")
            cfg.port = parse_int_flag(a, value());
        else if (a == "--secure")
            cfg.secure = true;
        else if (a == "--discovery-interval")
            cfg.discovery_poll_interval_s = parse_int_flag(a, value());
        else if (a == "--reconnect-interval")
            cfg.reconnect_interval_s = parse_int_flag(a, value());
        else if (a == "--http")
            cfg.status_bind = value();
        else if (a == "--debug")
            cfg.debug = true;
        else
            throw ConfigError("unknown argument: " + a);
    }
    cfg.validate();
    return cfg;
}
