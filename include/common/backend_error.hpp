/*
 * File: include/common/backend_error.hpp
 * Project: Radar Bridge
 * Purpose: Failure taxonomy shared by the backend client and the relays
 * Last updated: 2026-10-19
 */

#pragma once
#include <stdexcept>
#include <string>

enum class BackendErrorKind
{
    unreachable,  // no connection established
    bad_response, // non-2xx status or malformed body
    socket_error, // transport failure after connecting
    timeout       // request deadline exceeded
};

inline const char *to_string(BackendErrorKind k)
{
    switch (k)
    {
    case BackendErrorKind::unreachable:
        return "Unreachable";
    case BackendErrorKind::bad_response:
        return "BadResponse";
    case BackendErrorKind::socket_error:
        return "SocketError";
    case BackendErrorKind::timeout:
        return "Timeout";
    }
    return "Unknown";
}

class BackendError : public std::runtime_error
{
    BackendErrorKind kind_;
    unsigned status_;

public:
    BackendError(BackendErrorKind kind, const std::string &what, unsigned http_status = 0)
        : std::runtime_error(what), kind_(kind), status_(http_status) {}

    BackendErrorKind kind() const noexcept { return kind_; }

    // HTTP status for bad_response from a non-2xx reply, 0 otherwise
    unsigned http_status() const noexcept { return status_; }
};
