/*
 * File: src/bridge_backend.hpp
 * Project: Radar Bridge
 * Purpose: Backend seam consumed by the fleet reconciler and the device proxy
 * Notes:
 *  - Synchronous calls throw BackendError; nothing here retries
 *  - async_list_devices never invokes the handler inline
 * Last updated: 2026-10-19
 */

#pragma once
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/backend_error.hpp"

class DeviceBackend
{
public:
    // devices is a JSON object keyed by device id when err is empty
    using ListHandler = std::function<void(std::optional<BackendError> err, nlohmann::json devices)>;

    virtual ~DeviceBackend() = default;

    virtual void async_list_devices(ListHandler handler) = 0;
    virtual nlohmann::json list_devices() = 0;

    virtual nlohmann::json get_capabilities(const std::string &id) = 0;
    virtual nlohmann::json get_state(const std::string &id) = 0;
    virtual nlohmann::json set_control(const std::string &id, const std::string &key, const nlohmann::json &value) = 0;
    virtual nlohmann::json set_controls(const std::string &id, const nlohmann::json &controls) = 0;
    virtual nlohmann::json get_targets(const std::string &id) = 0;
    virtual nlohmann::json acquire_target(const std::string &id, double bearing, double distance) = 0;
    virtual nlohmann::json cancel_target(const std::string &id, const std::string &target_id) = 0;

    // Pure; never fails.
    virtual std::string stream_url(const std::string &id) const = 0;

    // close() fails later calls as Unreachable until open() is called again.
    virtual void open() = 0;
    virtual void close() = 0;
};
