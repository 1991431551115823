/*
 * File: src/bridge_host.hpp
 * Project: Radar Bridge
 * Purpose: Host platform boundary and the bridge lifecycle (start/stop)
 * Notes:
 *  - Bridge::start/stop run on the fleet executor
 *  - Shutdown order: unregister, fleet (relays), backend client
 *  - start() reopens the backend client, so stop/start may repeat
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>

#include <cstddef>
#include <string>

#include "bridge_backend.hpp"
#include "bridge_fleet.hpp"
#include "bridge_proxy.hpp"
#include "bridge_stream.hpp"
#include "common/log.hpp"

class HostPlatform
{
public:
    virtual ~HostPlatform() = default;

    // May throw; the bridge reports the failure and stays idle.
    virtual void register_provider(const std::string &provider_id, const std::string &name, DeviceProxy &methods) = 0;
    virtual void unregister_provider(const std::string &provider_id) = 0;

    virtual void emit_binary(const std::string &stream_key, const char *data, std::size_t size) = 0;

    virtual void set_status(const std::string &text) = 0;
    virtual void set_error(const std::string &text) = 0;
};

class Bridge
{
public:
    static constexpr const char *provider_id = "radar-bridge";
    static constexpr const char *provider_name = "Radar Bridge (Server)";

private:
    HostPlatform &host_;
    DeviceBackend &backend_;
    DeviceProxy proxy_;
    FleetReconciler fleet_;
    bool registered_ = false;
    bool started_ = false;

public:
    Bridge(boost::asio::any_io_executor ex, HostPlatform &host, DeviceBackend &backend, StreamConnector &connector,
           FleetReconciler::Options opts)
        : host_(host), backend_(backend), proxy_(backend),
          fleet_(ex, backend, connector,
                 FleetReconciler::Callbacks{
                     [&host](const std::string &key, const char *data, std::size_t size)
                     { host.emit_binary(key, data, size); },
                     [&host](const std::string &s)
                     { host.set_status(s); },
                     [&host](const std::string &s)
                     { host.set_error(s); }},
                 opts)
    {
    }

    Bridge(const Bridge &) = delete;
    Bridge &operator=(const Bridge &) = delete;

    DeviceProxy &proxy() { return proxy_; }
    FleetReconciler &fleet() { return fleet_; }
    const FleetReconciler &fleet() const { return fleet_; }
    bool started() const { return started_; }

    bool start()
    {
        if (started_)
            return true;
        log_debug("host", "starting bridge");
        try
        {
            host_.register_provider(provider_id, provider_name, proxy_);
            registered_ = true;
            log_debug("host", "registered as radar provider");
        }
        catch (const std::exception &e)
        {
            host_.set_error(std::string("Failed to register radar provider: ") + e.what());
            return false;
        }
        started_ = true;
        backend_.open();
        fleet_.start();
        return true;
    }

    void stop()
    {
        log_debug("host", "stopping bridge");
        if (registered_)
        {
            registered_ = false;
            try
            {
                host_.unregister_provider(provider_id);
            }
            catch (const std::exception &e)
            {
                log_debug("host", std::string("error unregistering: ") + e.what());
            }
        }
        fleet_.stop();
        backend_.close();
        if (started_)
        {
            started_ = false;
            host_.set_status("Stopped");
        }
    }
};
