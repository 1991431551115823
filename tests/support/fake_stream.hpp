/*
 * File: tests/support/fake_stream.hpp
 * Project: Radar Bridge
 * Purpose: StreamConnector whose sessions are driven by the test
 * Last updated: 2026-10-19
 */

#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "bridge_stream.hpp"

class FakeSession : public StreamSession
{
public:
    std::string url;
    StreamHandlers handlers;
    int close_calls = 0;

    void close() override
    {
        ++close_calls;
        handlers = StreamHandlers{};
    }

    // what the transport would deliver; no-ops once closed
    void open()
    {
        if (handlers.on_open)
            handlers.on_open();
    }

    void frame(const std::string &bytes)
    {
        if (handlers.on_frame)
            handlers.on_frame(bytes.data(), bytes.size());
    }

    void drop(const std::string &why = "connection reset")
    {
        auto h = handlers.on_close;
        handlers = StreamHandlers{};
        if (h)
            h(BackendError(BackendErrorKind::socket_error, why));
    }

    // deliver callbacks even after close(), as a late transport event would
    StreamHandlers stale;
};

class FakeConnector : public StreamConnector
{
public:
    std::vector<std::shared_ptr<FakeSession>> sessions;
    bool throw_on_open = false;

    std::shared_ptr<StreamSession> open(const std::string &url, StreamHandlers handlers) override
    {
        if (throw_on_open)
            throw std::runtime_error("bad url: " + url);
        auto s = std::make_shared<FakeSession>();
        s->url = url;
        s->stale = handlers;
        s->handlers = std::move(handlers);
        sessions.push_back(s);
        return s;
    }

    int opens_for(const std::string &url_part) const
    {
        int n = 0;
        for (const auto &s : sessions)
            if (s->url.find(url_part) != std::string::npos)
                ++n;
        return n;
    }

    int closes_for(const std::string &url_part) const
    {
        int n = 0;
        for (const auto &s : sessions)
            if (s->url.find(url_part) != std::string::npos)
                n += s->close_calls;
        return n;
    }

    std::shared_ptr<FakeSession> last_for(const std::string &url_part) const
    {
        for (auto it = sessions.rbegin(); it != sessions.rend(); ++it)
            if ((*it)->url.find(url_part) != std::string::npos)
                return *it;
        return nullptr;
    }
};
