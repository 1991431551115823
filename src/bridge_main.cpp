/*
 * File: src/bridge_main.cpp
 * Project: Radar Bridge
 * Purpose: Daemon: backend discovery + spoke relays, local status/provider HTTP
 * Notes:
 *  - Fleet and relays run on one io_context thread, HTTP surface on another
 *  - SIGINT/SIGTERM: Bridge::stop() then both loops wind down
 * Last updated: 2026-10-19
 */

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

#include <boost/asio.hpp>

#include "bridge_client.hpp"
#include "bridge_config.hpp"
#include "bridge_host.hpp"
#include "bridge_http.hpp"
#include "bridge_state.hpp"
#include "bridge_stream.hpp"
#include "common/log.hpp"

static void usage()
{
    std::cerr << "usage: radar_bridge [--config file.json] [--host H] [--port P] [--secure]\n"
                 "                    [--discovery-interval S] [--reconnect-interval S]\n"
                 "                    [--http ADDR:PORT] [--debug]\n";
}

int main(int argc, char **argv)
{
    BridgeConfig cfg;
    try
    {
        cfg = parse_command_line(argc, argv);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "config error: " << e.what() << "\n";
        usage();
        return 1;
    }
    if (cfg.debug)
        set_log_level(LogLevel::debug);

    boost::asio::ip::tcp::endpoint http_ep;
    try
    {
        auto p = cfg.status_bind.rfind(':');
        http_ep = boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address(cfg.status_bind.substr(0, p)),
                                                 static_cast<unsigned short>(std::stoi(cfg.status_bind.substr(p + 1))));
    }
    catch (const std::exception &e)
    {
        std::cerr << "config error: bad statusBind '" << cfg.status_bind << "': " << e.what() << "\n";
        return 1;
    }

    boost::asio::io_context ioc{1};
    boost::asio::io_context http_ioc{1};

    BackendClient::Options copts;
    copts.host = cfg.host;
    copts.port = cfg.port;
    copts.secure = cfg.secure;
    copts.api_base_path = cfg.api_base_path;
    copts.request_timeout = cfg.request_timeout();
    copts.tls_verify = cfg.tls_verify;
    BackendClient client(ioc.get_executor(), copts);
    WsStreamConnector connector(ioc.get_executor(), cfg.request_timeout(), cfg.tls_verify);

    FleetReconciler::Options fopts;
    fopts.discovery_interval = cfg.discovery_poll_interval();
    fopts.reconnect_interval = cfg.reconnect_interval();
    fopts.relay_reconnect_delay = cfg.reconnect_interval();

    BridgeState state;
    LocalHost host(state);
    Bridge bridge(ioc.get_executor(), host, client, connector, fopts);
    state.fleet = &bridge.fleet();

    std::unique_ptr<HttpServer> server;
    try
    {
        server = std::make_unique<HttpServer>(http_ioc, http_ep, state);
    }
    catch (const std::exception &e)
    {
        log_error("main", e.what());
        return 1;
    }
    std::thread http_thread([&http_ioc]()
                            { http_ioc.run(); });

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int sig)
                       {
        if (ec)
            return;
        log_info("main", "signal " + std::to_string(sig) + ", shutting down");
        bridge.stop();
        server->shutdown(); });

    boost::asio::post(ioc, [&]()
                      {
        if (!bridge.start())
            log_error("main", "bridge did not start; serving status only"); });

    log_info("main", "radar bridge backend=" + client.base_url() + " http=" + cfg.status_bind);
    ioc.run();

    http_thread.join();
    return 0;
}
