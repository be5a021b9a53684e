/*
 * File: src/fleet_state.hpp
 * Project: Signage Fleet Sync
 * Purpose: FleetHub: owns the io_context and wires the sync components
 * Notes:
 *  - setup() authenticates and runs one full cycle before anything is served
 *  - stop() cancels drivers and queued commands, then joins the io threads
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "common/fleet_error.hpp"
#include "fleet_api.hpp"
#include "fleet_cache.hpp"
#include "fleet_config.hpp"
#include "fleet_coordinator.hpp"
#include "fleet_dispatcher.hpp"
#include "fleet_http.hpp"
#include "fleet_registry.hpp"
#include "fleet_screenshot.hpp"

inline CoordinatorOptions coordinator_options(const HubConfig &cfg)
{
    CoordinatorOptions o;
    o.interval = std::chrono::seconds(cfg.poll_interval_s);
    o.fetch_concurrency = static_cast<std::size_t>(cfg.fetch_concurrency);
    return o;
}

inline DispatcherOptions dispatcher_options(const HubConfig &cfg)
{
    DispatcherOptions o;
    o.concurrency = static_cast<std::size_t>(cfg.command_concurrency);
    o.max_attempts = cfg.max_attempts;
    o.backoff_base = std::chrono::milliseconds(cfg.backoff_base_ms);
    o.backoff_max = std::chrono::milliseconds(cfg.backoff_max_ms);
    return o;
}

class FleetHub
{
    boost::asio::io_context ioc_;
    std::shared_ptr<FleetApi> api_;
    PlayerRegistry registry_;
    StateCache cache_;
    PollingCoordinator coordinator_;
    ScreenshotFetcher screenshots_;
    CommandDispatcher dispatcher_;

    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;
    std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();

public:
    explicit FleetHub(const HubConfig &cfg)
        : FleetHub(cfg, std::make_shared<HttpFleetClient>(cfg.base_url, cfg.username, cfg.password, cfg.token,
                                                          std::chrono::seconds(cfg.request_timeout_s))) {}

    // Any FleetApi, e.g. a scripted one in tests
    FleetHub(const HubConfig &cfg, std::shared_ptr<FleetApi> api)
        : api_(std::move(api)),
          registry_(cfg.removal_threshold),
          // An overlay gets one poll interval to be confirmed
          cache_(std::chrono::seconds(cfg.poll_interval_s), cfg.offline_after_misses),
          coordinator_(ioc_, *api_, registry_, cache_, coordinator_options(cfg)),
          screenshots_(ioc_, *api_, cache_, std::chrono::seconds(cfg.screenshot_interval_s),
                       static_cast<std::size_t>(cfg.fetch_concurrency)),
          dispatcher_(ioc_, *api_, cache_, dispatcher_options(cfg))
    {
        coordinator_.on_removed([this](const std::vector<std::string> &ids)
                                { screenshots_.evict(ids); });
    }

    ~FleetHub() { stop(); }

    FleetHub(const FleetHub &) = delete;
    FleetHub &operator=(const FleetHub &) = delete;

    // Throws FleetError (Unauthorized, Unreachable, ...) instead of starting degraded
    void setup()
    {
        api_->authenticate();
        auto report = coordinator_.runCycle();
        if (report.error)
            throw FleetError(*report.error, "initial listing failed: " + report.message);
        spdlog::info("hub: initial cycle found {} players", report.players);
    }

    void start(std::size_t threads = 4)
    {
        if (work_)
            return;
        work_.emplace(boost::asio::make_work_guard(ioc_));
        coordinator_.start();
        screenshots_.start();
        for (std::size_t i = 0; i < (threads < 1 ? 1 : threads); ++i)
            threads_.emplace_back([this]
                                  { ioc_.run(); });
    }

    void stop()
    {
        dispatcher_.stop();
        coordinator_.stop();
        screenshots_.stop();
        work_.reset();
        for (auto &t : threads_)
            if (t.joinable())
                t.join();
        threads_.clear();
    }

    boost::asio::io_context &io() { return ioc_; }
    FleetApi &api() { return *api_; }
    PlayerRegistry &registry() { return registry_; }
    StateCache &cache() { return cache_; }
    PollingCoordinator &coordinator() { return coordinator_; }
    ScreenshotFetcher &screenshots() { return screenshots_; }
    CommandDispatcher &dispatcher() { return dispatcher_; }

    double uptime_s() const
    {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

    nlohmann::json health() const
    {
        const bool degraded = coordinator_.degraded();
        nlohmann::json j{
            {"status", degraded ? "degraded" : "ok"},
            {"uptime_s", uptime_s()},
            {"degraded", degraded},
            {"players", registry_.size()},
            {"cycles", coordinator_.cycles()},
            {"phase", to_string(coordinator_.phase())}};
        if (degraded)
            j["reason"] = coordinator_.degraded_reason();
        if (coordinator_.cycles() > 0)
            j["last_cycle"] = iso8601(coordinator_.last_cycle());
        else
            j["last_cycle"] = nullptr;
        return j;
    }

    static std::string iso8601(std::chrono::system_clock::time_point tp)
    {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[64];
        std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
        return buf;
    }
};
