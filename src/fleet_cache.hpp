/*
 * File: src/fleet_cache.hpp
 * Project: Signage Fleet Sync
 * Purpose: Per-player state cache with optimistic overlays and change feed
 * Notes:
 *  - A snapshot is decoded in full before it replaces the stored one
 *  - Visible state = confirmed snapshot + pending overlays, in arrival order
 *  - Observers run after the cache lock is released, one change at a time
 *    and in arrival order; a change may be delivered by another thread
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/fleet_error.hpp"
#include "common/player.hpp"

// Raw material for one player's snapshot, as gathered by a poll cycle
struct PlayerPayload
{
    PlayerListing listing;
    nlohmann::json status;             // null keeps the previous metrics, schedule and assets
    std::optional<nlohmann::json> cec; // nullopt keeps the previous CEC state
};

struct PlayerPatch
{
    std::string label;
    std::function<void(Player &)> apply;
    std::function<bool(const Player &)> confirmed_by;
};

struct PatchHandle
{
    std::uint64_t id = 0;
    Player player;
};

enum class ChangeKind
{
    Added,
    Updated,
    Removed
};

inline const char *to_string(ChangeKind kind)
{
    switch (kind)
    {
    case ChangeKind::Added:
        return "added";
    case ChangeKind::Updated:
        return "updated";
    case ChangeKind::Removed:
        return "removed";
    }
    return "unknown";
}

struct PlayerChange
{
    ChangeKind kind;
    Player player;
    std::uint64_t sequence = 0; // cache-wide, increasing in arrival order
};

class StateCache
{
public:
    using Clock = std::chrono::steady_clock;
    using Observer = std::function<void(const PlayerChange &)>;

    explicit StateCache(Clock::duration patch_ttl = std::chrono::seconds(30), int offline_after_misses = 2,
                        std::function<Clock::time_point()> now = &Clock::now)
        : patch_ttl_(patch_ttl),
          offline_after_misses_(offline_after_misses < 1 ? 1 : offline_after_misses),
          now_(std::move(now)) {}

    // Decodes and stores a complete snapshot; on FleetError the stored one is untouched.
    Player applyPlayerSnapshot(const std::string &id, const PlayerPayload &payload)
    {
        Player result;
        {
            std::scoped_lock lk(m_);
            auto it = entries_.find(id);
            Player next = build(it == entries_.end() ? nullptr : &it->second.confirmed, id, payload);

            if (it == entries_.end())
            {
                Entry e;
                e.confirmed = std::move(next);
                e.reachable = payload.listing.is_online;
                refresh(e);
                result = e.visible;
                entries_.emplace(id, std::move(e));
                enqueue(PlayerChange{ChangeKind::Added, result});
            }
            else
            {
                Entry &e = it->second;
                Player before = e.visible;
                e.confirmed = std::move(next);
                e.reachable = payload.listing.is_online;
                e.misses = 0;
                settle(id, e);
                refresh(e);
                result = e.visible;
                if (result != before)
                    enqueue(PlayerChange{ChangeKind::Updated, result});
            }
        }
        notify();
        return result;
    }

    PatchHandle applyOptimisticPatch(const std::string &id, PlayerPatch patch)
    {
        PatchHandle handle;
        {
            std::scoped_lock lk(m_);
            auto it = entries_.find(id);
            if (it == entries_.end())
                throw FleetError(ErrorKind::NotFound, "unknown player " + id);
            Entry &e = it->second;
            Player before = e.visible;
            handle.id = next_patch_id_++;
            e.overlays.push_back(Overlay{handle.id, std::move(patch), now_() + patch_ttl_});
            refresh(e);
            handle.player = e.visible;
            if (e.visible != before)
                enqueue(PlayerChange{ChangeKind::Updated, e.visible});
        }
        notify();
        return handle;
    }

    // Drops one overlay; returns the resulting visible state, or nullopt when
    // the overlay was already confirmed or expired.
    std::optional<Player> rollbackPatch(const std::string &id, std::uint64_t patch_id)
    {
        std::optional<Player> result;
        {
            std::scoped_lock lk(m_);
            auto it = entries_.find(id);
            if (it == entries_.end())
                return std::nullopt;
            Entry &e = it->second;
            auto &ov = e.overlays;
            auto pos = std::find_if(ov.begin(), ov.end(), [&](const Overlay &o)
                                    { return o.id == patch_id; });
            if (pos == ov.end())
                return std::nullopt;
            spdlog::debug("cache: rolling back '{}' on {}", pos->patch.label, id);
            Player before = e.visible;
            ov.erase(pos);
            refresh(e);
            result = e.visible;
            if (e.visible != before)
                enqueue(PlayerChange{ChangeKind::Updated, e.visible});
        }
        notify();
        return result;
    }

    // A poll reached the server about this player without producing a new snapshot
    void recordHeartbeat(const std::string &id, bool reachable)
    {
        mutate(id, [&](Entry &e)
               { e.reachable = reachable; e.misses = 0; });
    }

    void recordMiss(const std::string &id)
    {
        mutate(id, [](Entry &e)
               { ++e.misses; });
    }

    bool remove(const std::string &id)
    {
        {
            std::scoped_lock lk(m_);
            auto it = entries_.find(id);
            if (it == entries_.end())
                return false;
            enqueue(PlayerChange{ChangeKind::Removed, it->second.visible});
            entries_.erase(it);
        }
        notify();
        return true;
    }

    std::optional<Player> get(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return std::nullopt;
        return it->second.visible;
    }

    // Last server-confirmed state, without overlays
    std::optional<Player> confirmed(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return std::nullopt;
        return it->second.confirmed;
    }

    std::vector<Player> snapshot() const
    {
        std::scoped_lock lk(m_);
        std::vector<Player> out;
        out.reserve(entries_.size());
        for (const auto &kv : entries_)
            out.push_back(kv.second.visible);
        return out;
    }

    bool contains(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        return entries_.count(id) != 0;
    }

    std::size_t pending_patches(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        auto it = entries_.find(id);
        return it == entries_.end() ? 0 : it->second.overlays.size();
    }

    int misses(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        auto it = entries_.find(id);
        return it == entries_.end() ? 0 : it->second.misses;
    }

    int subscribe(Observer obs)
    {
        std::scoped_lock lk(obs_mtx_);
        int token = next_observer_++;
        observers_.emplace(token, std::move(obs));
        return token;
    }

    void unsubscribe(int token)
    {
        std::scoped_lock lk(obs_mtx_);
        observers_.erase(token);
    }

    Clock::duration patch_ttl() const { return patch_ttl_; }

private:
    struct Overlay
    {
        std::uint64_t id;
        PlayerPatch patch;
        Clock::time_point deadline;
    };

    struct Entry
    {
        Player confirmed;
        Player visible;
        std::vector<Overlay> overlays;
        bool reachable = false;
        int misses = 0;
    };

    mutable std::mutex m_;
    std::map<std::string, Entry> entries_;
    std::uint64_t next_patch_id_ = 1;
    Clock::duration patch_ttl_;
    int offline_after_misses_;
    std::function<Clock::time_point()> now_;

    std::deque<PlayerChange> outbox_; // guarded by m_
    std::uint64_t next_change_ = 1;
    bool delivering_ = false;

    std::mutex obs_mtx_;
    std::map<int, Observer> observers_;
    int next_observer_ = 1;

    // Fields the payload does not carry are taken from the previous snapshot
    static Player build(const Player *prev, const std::string &id, const PlayerPayload &payload)
    {
        std::optional<PlayerStatus> status;
        if (!payload.status.is_null())
            status = decode_player_status(payload.status);
        std::optional<CecState> cec;
        if (payload.cec)
            cec = decode_cec(*payload.cec);

        Player p = prev ? *prev : Player{};
        p.id = id;
        p.name = payload.listing.name.empty() ? id : payload.listing.name;
        if (!payload.listing.last_seen.empty())
            p.last_seen = payload.listing.last_seen;

        // Listing sections first; the /info/ body overrides what it carries itself
        const PlayerContent &listed = payload.listing.content;
        merge_content(p, listed);
        if (status)
        {
            p.metrics = status->metrics;
            if (status->has_now_playing || !listed.has_now_playing)
                p.now_playing = status->now_playing;
            merge_content(p, *status);
        }
        else if (!payload.listing.is_online && !listed.has_now_playing)
        {
            p.now_playing.reset();
        }
        if (cec)
            p.cec = *cec;
        return p;
    }

    static void merge_content(Player &p, const PlayerContent &c)
    {
        if (c.has_now_playing)
            p.now_playing = c.now_playing;
        if (c.has_schedule_status)
            p.active_slot = c.active_slot;
        if (c.slots)
            p.slots = *c.slots;
        if (c.assets)
            p.assets = *c.assets;
    }

    // Confirmed overlays are dropped; unconfirmed ones past their deadline revert
    void settle(const std::string &id, Entry &e)
    {
        const auto now = now_();
        auto &ov = e.overlays;
        ov.erase(std::remove_if(ov.begin(), ov.end(), [&](const Overlay &o)
                                {
            if (o.patch.confirmed_by && o.patch.confirmed_by(e.confirmed))
            {
                spdlog::debug("cache: '{}' confirmed on {}", o.patch.label, id);
                return true;
            }
            if (now >= o.deadline)
            {
                spdlog::info("cache: '{}' not confirmed in time on {}, reverting", o.patch.label, id);
                return true;
            }
            return false; }),
                 ov.end());
    }

    void expire(const std::string &id, Entry &e)
    {
        const auto now = now_();
        auto &ov = e.overlays;
        ov.erase(std::remove_if(ov.begin(), ov.end(), [&](const Overlay &o)
                                {
            if (now < o.deadline)
                return false;
            spdlog::info("cache: '{}' not confirmed in time on {}, reverting", o.patch.label, id);
            return true; }),
                 ov.end());
    }

    void refresh(Entry &e)
    {
        e.confirmed.online = e.reachable && e.misses < offline_after_misses_;
        Player v = e.confirmed;
        for (const auto &o : e.overlays)
            if (o.patch.apply)
                o.patch.apply(v);
        e.visible = std::move(v);
    }

    template <typename Fn>
    void mutate(const std::string &id, Fn &&fn)
    {
        {
            std::scoped_lock lk(m_);
            auto it = entries_.find(id);
            if (it == entries_.end())
                return;
            Entry &e = it->second;
            Player before = e.visible;
            fn(e);
            expire(id, e);
            refresh(e);
            if (e.visible != before)
                enqueue(PlayerChange{ChangeKind::Updated, e.visible});
        }
        notify();
    }

    // Caller holds m_
    void enqueue(PlayerChange change)
    {
        change.sequence = next_change_++;
        outbox_.push_back(std::move(change));
    }

    // Drains the outbox unless another thread already is; that thread then
    // delivers what was queued here, after everything queued before it.
    void notify()
    {
        {
            std::scoped_lock lk(m_);
            if (delivering_ || outbox_.empty())
                return;
            delivering_ = true;
        }
        for (;;)
        {
            std::optional<PlayerChange> change;
            {
                std::scoped_lock lk(m_);
                if (outbox_.empty())
                {
                    delivering_ = false;
                    return;
                }
                change = std::move(outbox_.front());
                outbox_.pop_front();
            }
            deliver(*change);
        }
    }

    void deliver(const PlayerChange &change)
    {
        std::vector<Observer> observers;
        {
            std::scoped_lock lk(obs_mtx_);
            for (const auto &kv : observers_)
                observers.push_back(kv.second);
        }
        for (const auto &obs : observers)
        {
            try
            {
                obs(change);
            }
            catch (const std::exception &e)
            {
                spdlog::error("cache: change observer failed for {}: {}", change.player.id, e.what());
            }
        }
    }
};
