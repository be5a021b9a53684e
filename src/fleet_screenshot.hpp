/*
 * File: src/fleet_screenshot.hpp
 * Project: Signage Fleet Sync
 * Purpose: Independent screenshot refresh with a stale-tolerant cache
 * Notes:
 *  - Own timer, decoupled from the metrics poll
 *  - A failed fetch keeps the previous image and its capture time
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/fleet_error.hpp"
#include "fleet_api.hpp"
#include "fleet_cache.hpp"

struct ScreenshotSnapshot
{
    std::string bytes;
    std::string content_type;
    std::chrono::system_clock::time_point captured_at{};
    std::chrono::system_clock::time_point last_attempt{};
    int failures = 0; // consecutive
};

class ScreenshotFetcher
{
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    FleetApi &api_;
    StateCache &cache_;
    std::chrono::milliseconds interval_;

    Strand strand_;
    boost::asio::steady_timer timer_;
    boost::asio::thread_pool pool_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> generation_{0};

    mutable std::mutex m_;
    std::map<std::string, ScreenshotSnapshot> shots_;

public:
    ScreenshotFetcher(boost::asio::io_context &ioc, FleetApi &api, StateCache &cache,
                      std::chrono::milliseconds interval = std::chrono::seconds(10), std::size_t concurrency = 2)
        : api_(api),
          cache_(cache),
          interval_(interval),
          strand_(boost::asio::make_strand(ioc)),
          timer_(strand_),
          pool_(concurrency < 1 ? 1 : concurrency) {}

    ~ScreenshotFetcher()
    {
        stop();
        pool_.join();
    }

    ScreenshotFetcher(const ScreenshotFetcher &) = delete;
    ScreenshotFetcher &operator=(const ScreenshotFetcher &) = delete;

    void start()
    {
        if (running_.exchange(true))
            return;
        boost::asio::post(strand_, [this]
                          { tick(); });
    }

    void stop()
    {
        if (!running_.exchange(false))
            return;
        ++generation_;
        boost::asio::post(strand_, [this]
                          { timer_.cancel(); });
    }

    // Refreshes every online player once; returns how many images were updated
    std::size_t refreshAll()
    {
        const auto gen = generation_.load();
        std::vector<std::pair<std::string, std::future<bool>>> pending;
        for (const auto &player : cache_.snapshot())
        {
            if (!player.online)
                continue;
            auto task = std::make_shared<std::packaged_task<bool()>>(
                [this, gen, id = player.id]
                { return refresh(id, gen); });
            pending.emplace_back(player.id, task->get_future());
            boost::asio::post(pool_, [task]
                              { (*task)(); });
        }

        std::size_t updated = 0;
        for (auto &p : pending)
        {
            try
            {
                if (p.second.get())
                    ++updated;
            }
            catch (const std::exception &e)
            {
                spdlog::warn("screenshot: refresh of {} failed: {}", p.first, e.what());
            }
        }
        return updated;
    }

    bool refresh(const std::string &id) { return refresh(id, generation_.load()); }

    std::optional<ScreenshotSnapshot> latest(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        auto it = shots_.find(id);
        if (it == shots_.end() || it->second.bytes.empty())
            return std::nullopt;
        return it->second;
    }

    int failures(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        auto it = shots_.find(id);
        return it == shots_.end() ? 0 : it->second.failures;
    }

    void evict(const std::vector<std::string> &ids)
    {
        std::scoped_lock lk(m_);
        for (const auto &id : ids)
            shots_.erase(id);
    }

private:
    void tick()
    {
        if (!running_)
            return;
        try
        {
            refreshAll();
        }
        catch (const std::exception &e)
        {
            spdlog::error("screenshot: refresh round aborted: {}", e.what());
        }
        if (!running_)
            return;
        timer_.expires_after(interval_);
        timer_.async_wait([this](boost::system::error_code ec)
                          {
            if (!ec)
                tick(); });
    }

    bool refresh(const std::string &id, std::uint64_t gen)
    {
        const auto now = std::chrono::system_clock::now();
        try
        {
            Screenshot shot = api_.getScreenshot(id);
            if (gen != generation_.load() || !cache_.contains(id))
                return false;
            std::scoped_lock lk(m_);
            auto &snap = shots_[id];
            snap.bytes = std::move(shot.bytes);
            snap.content_type = std::move(shot.content_type);
            snap.captured_at = now;
            snap.last_attempt = now;
            snap.failures = 0;
            return true;
        }
        catch (const FleetError &e)
        {
            if (gen != generation_.load() || !cache_.contains(id))
                return false;
            std::scoped_lock lk(m_);
            auto &snap = shots_[id];
            snap.last_attempt = now;
            ++snap.failures;
            spdlog::debug("screenshot: {} keeps stale image ({} failures): {}", id, snap.failures, e.what());
            return false;
        }
    }
};
