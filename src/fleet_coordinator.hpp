/*
 * File: src/fleet_coordinator.hpp
 * Project: Signage Fleet Sync
 * Purpose: Fixed-interval full-fleet poll: list, fetch, reconcile
 * Notes:
 *  - Cycle phases: Idle -> Listing -> FetchingStatuses -> Reconciling -> Idle
 *  - Next tick is armed only after the current cycle returns
 *  - Per-player failures never abort the cycle
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/fleet_error.hpp"
#include "common/player.hpp"
#include "fleet_api.hpp"
#include "fleet_cache.hpp"
#include "fleet_registry.hpp"

enum class CyclePhase
{
    Idle,
    Listing,
    FetchingStatuses,
    Reconciling
};

inline const char *to_string(CyclePhase phase)
{
    switch (phase)
    {
    case CyclePhase::Idle:
        return "idle";
    case CyclePhase::Listing:
        return "listing";
    case CyclePhase::FetchingStatuses:
        return "fetching";
    case CyclePhase::Reconciling:
        return "reconciling";
    }
    return "unknown";
}

struct CycleReport
{
    bool listed = false;
    bool discarded = false;
    std::size_t players = 0;
    std::size_t fetched = 0;
    std::size_t failed = 0;
    std::size_t malformed = 0;
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::optional<ErrorKind> error;
    std::string message;
};

struct CoordinatorOptions
{
    std::chrono::milliseconds interval{std::chrono::seconds(30)};
    std::size_t fetch_concurrency = 4;
};

class PollingCoordinator
{
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    struct FetchOutcome
    {
        std::optional<nlohmann::json> status;
        std::optional<nlohmann::json> cec;
        std::optional<ErrorKind> error;
        std::string message;
    };

    FleetApi &api_;
    PlayerRegistry &registry_;
    StateCache &cache_;
    CoordinatorOptions opts_;

    Strand strand_;
    boost::asio::steady_timer timer_;
    boost::asio::thread_pool fetch_pool_;

    std::mutex cycle_mtx_; // one reconciliation at a time
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> generation_{0};
    std::atomic<CyclePhase> phase_{CyclePhase::Idle};

    mutable std::mutex status_mtx_;
    bool degraded_ = false;
    std::string degraded_reason_;
    std::chrono::system_clock::time_point last_cycle_{};
    std::uint64_t cycles_ = 0;

    std::function<void(const std::vector<std::string> &)> on_removed_;

public:
    PollingCoordinator(boost::asio::io_context &ioc, FleetApi &api, PlayerRegistry &registry, StateCache &cache,
                       CoordinatorOptions opts = {})
        : api_(api),
          registry_(registry),
          cache_(cache),
          opts_(opts),
          strand_(boost::asio::make_strand(ioc)),
          timer_(strand_),
          fetch_pool_(opts.fetch_concurrency < 1 ? 1 : opts.fetch_concurrency) {}

    ~PollingCoordinator()
    {
        stop();
        fetch_pool_.join();
    }

    PollingCoordinator(const PollingCoordinator &) = delete;
    PollingCoordinator &operator=(const PollingCoordinator &) = delete;

    // Called with ids the registry dropped, after they left the cache
    void on_removed(std::function<void(const std::vector<std::string> &)> fn) { on_removed_ = std::move(fn); }

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

    CyclePhase phase() const { return phase_.load(); }

    bool degraded() const
    {
        std::scoped_lock lk(status_mtx_);
        return degraded_;
    }

    std::string degraded_reason() const
    {
        std::scoped_lock lk(status_mtx_);
        return degraded_reason_;
    }

    std::chrono::system_clock::time_point last_cycle() const
    {
        std::scoped_lock lk(status_mtx_);
        return last_cycle_;
    }

    std::uint64_t cycles() const
    {
        std::scoped_lock lk(status_mtx_);
        return cycles_;
    }

    std::chrono::milliseconds interval() const { return opts_.interval; }

    // One full cycle, synchronously. Used by the timer, by setup and by tests.
    CycleReport runCycle()
    {
        std::scoped_lock cycle_lk(cycle_mtx_);
        const auto gen = generation_.load();
        CycleReport report;

        phase_ = CyclePhase::Listing;
        std::vector<PlayerListing> listing;
        try
        {
            listing = api_.listPlayers();
        }
        catch (const FleetError &e)
        {
            report.error = e.kind();
            report.message = e.what();
            set_degraded(true, std::string(to_string(e.kind())) + ": " + e.what());
            spdlog::warn("poll: listing failed ({}): {}", to_string(e.kind()), e.what());
            phase_ = CyclePhase::Idle;
            return report;
        }
        report.listed = true;
        set_degraded(false, {});

        // Later duplicates of an id are ignored
        std::map<std::string, PlayerListing> listed;
        for (auto &p : listing)
            listed.emplace(p.id, std::move(p));
        report.players = listed.size();

        phase_ = CyclePhase::FetchingStatuses;
        auto outcomes = fetch_all(listed);

        if (gen != generation_.load())
        {
            spdlog::debug("poll: discarding results of a cancelled cycle");
            report.discarded = true;
            phase_ = CyclePhase::Idle;
            return report;
        }

        phase_ = CyclePhase::Reconciling;
        reconcile(listed, outcomes, report);
        phase_ = CyclePhase::Idle;

        {
            std::scoped_lock lk(status_mtx_);
            last_cycle_ = std::chrono::system_clock::now();
            ++cycles_;
        }
        spdlog::info("poll: {} players, {} fetched, {} failed, {} malformed, +{} -{}",
                     report.players, report.fetched, report.failed, report.malformed,
                     report.added.size(), report.removed.size());
        return report;
    }

private:
    void tick()
    {
        if (!running_)
            return;
        const auto started = std::chrono::steady_clock::now();
        try
        {
            runCycle();
        }
        catch (const std::exception &e)
        {
            phase_ = CyclePhase::Idle;
            spdlog::error("poll: cycle aborted: {}", e.what());
        }
        if (!running_)
            return;
        // Fixed cadence from the cycle start; an overrun fires immediately
        timer_.expires_at(started + opts_.interval);
        timer_.async_wait([this](boost::system::error_code ec)
                          {
            if (!ec)
                tick(); });
    }

    void set_degraded(bool degraded, std::string reason)
    {
        std::scoped_lock lk(status_mtx_);
        if (degraded && !degraded_)
            spdlog::warn("poll: hub degraded: {}", reason);
        else if (!degraded && degraded_)
            spdlog::info("poll: hub recovered");
        degraded_ = degraded;
        degraded_reason_ = std::move(reason);
    }

    FetchOutcome fetch_one(const std::string &id)
    {
        FetchOutcome out;
        try
        {
            out.status = api_.getPlayerStatus(id);
        }
        catch (const FleetError &e)
        {
            out.error = e.kind();
            out.message = e.what();
        }
        // CEC is best effort; a failure keeps the previous CEC state
        try
        {
            out.cec = api_.getCecStatus(id);
        }
        catch (const FleetError &e)
        {
            spdlog::debug("poll: cec status for {} unavailable: {}", id, e.what());
        }
        return out;
    }

    // Fans out status fetches for players the listing reports online; the pool
    // size bounds how many run at once.
    std::map<std::string, FetchOutcome> fetch_all(const std::map<std::string, PlayerListing> &listed)
    {
        std::map<std::string, std::future<FetchOutcome>> pending;
        for (const auto &kv : listed)
        {
            if (!kv.second.is_online)
                continue;
            auto task = std::make_shared<std::packaged_task<FetchOutcome()>>(
                [this, id = kv.first]
                { return fetch_one(id); });
            pending.emplace(kv.first, task->get_future());
            boost::asio::post(fetch_pool_, [task]
                              { (*task)(); });
        }

        std::map<std::string, FetchOutcome> outcomes;
        for (auto &kv : pending)
        {
            try
            {
                outcomes.emplace(kv.first, kv.second.get());
            }
            catch (const std::exception &e)
            {
                FetchOutcome failed;
                failed.error = ErrorKind::Unreachable;
                failed.message = e.what();
                outcomes.emplace(kv.first, std::move(failed));
            }
        }
        return outcomes;
    }

    static bool cec_valid(const std::optional<nlohmann::json> &cec)
    {
        return cec && cec->is_object();
    }

    void reconcile(const std::map<std::string, PlayerListing> &listed,
                   const std::map<std::string, FetchOutcome> &outcomes, CycleReport &report)
    {
        std::set<std::string> observed;
        for (const auto &kv : listed)
            observed.insert(kv.first);

        auto delta = registry_.reconcile(observed);
        report.added = delta.added;
        report.removed = delta.removed;
        for (const auto &id : delta.removed)
        {
            spdlog::info("poll: player {} removed after {} missed listings", id, registry_.removal_threshold());
            cache_.remove(id);
        }
        if (!delta.removed.empty() && on_removed_)
            on_removed_(delta.removed);

        // Known players missing from this listing but not yet removed
        for (const auto &id : registry_.ids())
            if (!observed.count(id))
                cache_.recordMiss(id);

        for (const auto &kv : listed)
        {
            const auto &id = kv.first;
            const auto &entry = kv.second;
            try
            {
                if (!entry.is_online)
                    apply_offline(id, entry, report);
                else
                    apply_online(id, entry, outcomes.at(id), report);
            }
            catch (const std::exception &e)
            {
                ++report.failed;
                spdlog::error("poll: reconciling {} failed: {}", id, e.what());
            }
        }
    }

    // The server says the player is offline: no status fetch, the listing's
    // last_status stands in for metrics when it is complete.
    void apply_offline(const std::string &id, const PlayerListing &entry, CycleReport &report)
    {
        PlayerPayload payload{entry, nullptr, std::nullopt};
        if (has_required_metrics(entry.last_status))
            payload.status = entry.last_status;
        try
        {
            cache_.applyPlayerSnapshot(id, payload);
        }
        catch (const FleetError &e)
        {
            ++report.malformed;
            spdlog::warn("poll: last_status of {} rejected: {}", id, e.what());
            ensure_known(id, entry);
            cache_.recordHeartbeat(id, false);
        }
    }

    void apply_online(const std::string &id, const PlayerListing &entry, const FetchOutcome &out,
                      CycleReport &report)
    {
        if (!out.status)
        {
            ++report.failed;
            spdlog::debug("poll: status of {} failed ({}): {}", id, to_string(*out.error), out.message);
            ensure_known(id, entry);
            cache_.recordMiss(id);
            return;
        }

        PlayerPayload payload{entry, *out.status, std::nullopt};
        if (cec_valid(out.cec))
            payload.cec = out.cec;
        try
        {
            cache_.applyPlayerSnapshot(id, payload);
            ++report.fetched;
        }
        catch (const FleetError &e)
        {
            ++report.malformed;
            spdlog::warn("poll: status of {} rejected ({}): {}", id, to_string(e.kind()), e.what());
            ensure_known(id, entry);
            // An incomplete payload still proves the player answered
            if (metrics_absent(*out.status))
                cache_.recordMiss(id);
            else
                cache_.recordHeartbeat(id, entry.is_online);
        }
    }

    // First sighting with no usable status: create the entry from the listing alone
    void ensure_known(const std::string &id, const PlayerListing &entry)
    {
        if (cache_.contains(id))
            return;
        cache_.applyPlayerSnapshot(id, PlayerPayload{entry, nullptr, std::nullopt});
    }
};
