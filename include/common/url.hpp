/*
 * File: include/common/url.hpp
 * Project: Radar Bridge
 * Purpose: Split ws/wss/http/https URLs into connect parameters
 * Last updated: 2026-10-19
 */

#pragma once
#include <string>

struct UrlParts
{
    std::string scheme; // lower-case as given: ws, wss, http, https
    std::string host;
    std::string port;
    std::string target; // path + query, "/" when absent
    bool secure = false;
};

// expect scheme://host[:port][/path]; a missing scheme is treated as ws://
inline UrlParts parse_url(const std::string &url)
{
    UrlParts out;
    auto scheme_pos = url.find("://");
    out.scheme = (scheme_pos == std::string::npos) ? "ws" : url.substr(0, scheme_pos);
    auto rest = (scheme_pos == std::string::npos) ? url : url.substr(scheme_pos + 3);
    out.secure = (out.scheme == "wss" || out.scheme == "https");

    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    // bracketed IPv6 literal: [::1]:6502
    std::string::size_type colon;
    if (!hp.empty() && hp.front() == '[')
    {
        auto close = hp.find(']');
        colon = (close == std::string::npos) ? std::string::npos : hp.find(':', close);
        out.host = hp.substr(1, (close == std::string::npos ? hp.size() : close) - 1);
    }
    else
    {
        colon = hp.rfind(':');
        out.host = hp.substr(0, colon);
    }

    if (colon == std::string::npos)
        out.port = out.secure ? "443" : "80";
    else
        out.port = hp.substr(colon + 1);
    return out;
}

// host for the authority part of a URL; IPv6 literals need brackets
inline std::string url_host(const std::string &host)
{
    if (host.find(':') != std::string::npos && (host.empty() || host.front() != '['))
        return "[" + host + "]";
    return host;
}

// percent-encode one path segment; RFC 3986 unreserved characters pass through
inline std::string encode_path_segment(const std::string &s)
{
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '.' || c == '_' || c == '~';
        if (unreserved)
        {
            out += static_cast<char>(c);
        }
        else
        {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

inline std::string decode_path_segment(const std::string &s)
{
    auto nibble = [](char c) -> int
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '%' && i + 2 < s.size())
        {
            int hi = nibble(s[i + 1]), lo = nibble(s[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}
