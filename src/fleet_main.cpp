/*
 * File: src/fleet_main.cpp
 * Project: Signage Fleet Sync
 * Purpose: Daemon binary: fleet sync hub, HTTP surface, WS change feed
 * Notes:
 *  - Exit codes: 2 config, 3 unauthorized, 4 unreachable, 1 anything else
 *  - SIGINT/SIGTERM stop the drivers and cancel queued commands
 * Last updated: 2026-10-18
 */

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <condition_variable>
#include <mutex>

#include "fleet_config.hpp"
#include "fleet_state.hpp"
#include "fleet_surface_http.hpp"
#include "fleet_surface_ws.hpp"

namespace
{
    int exit_code_for(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Unauthorized:
            return 3;
        case ErrorKind::Unreachable:
            return 4;
        default:
            return 1;
        }
    }
} // namespace

int main(int argc, char **argv)
{
    HubConfig cfg;
    try
    {
        cfg = parse_args(argc, argv);
    }
    catch (const ConfigError &e)
    {
        spdlog::error("config: {}", e.what());
        return 2;
    }
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    try
    {
        FleetHub hub{cfg};
        hub.setup();

        auto http_ep = bind_endpoint("http_bind", cfg.http_bind);
        auto ws_ep = bind_endpoint("ws_bind", cfg.ws_bind);

        HttpServer http{hub.io(), http_ep, hub};
        WsServer ws{hub.io(), ws_ep, hub.cache()};

        std::mutex m;
        std::condition_variable cv;
        bool stopping = false;
        boost::asio::signal_set signals{hub.io(), SIGINT, SIGTERM};
        signals.async_wait([&](boost::system::error_code ec, int sig)
                           {
            if (ec)
                return;
            spdlog::info("signal {} received, shutting down", sig);
            std::scoped_lock lk(m);
            stopping = true;
            cv.notify_all(); });

        hub.start();
        spdlog::info("fleet sync listening http={} ws={} fleet={}", cfg.http_bind, cfg.ws_bind, cfg.base_url);

        {
            std::unique_lock lk(m);
            cv.wait(lk, [&]
                    { return stopping; });
        }
        http.close();
        ws.close();
        hub.stop();
        return 0;
    }
    catch (const ConfigError &e)
    {
        spdlog::error("config: {}", e.what());
        return 2;
    }
    catch (const FleetError &e)
    {
        spdlog::error("fleet: {} ({})", e.what(), to_string(e.kind()));
        return exit_code_for(e.kind());
    }
    catch (const std::exception &e)
    {
        spdlog::error("fatal: {}", e.what());
        return 1;
    }
}
