/*
 * File: src/fleet_registry.hpp
 * Project: Signage Fleet Sync
 * Purpose: Authoritative set of known player ids with debounced removal
 * Notes:
 *  - Additions are immediate, removals wait for consecutive misses
 *  - Only successful full listings should be reconciled
 * Last updated: 2026-10-18
 */

#pragma once
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct ReconcileResult
{
    std::vector<std::string> added;
    std::vector<std::string> removed;
};

class PlayerRegistry
{
    mutable std::mutex m_;
    std::map<std::string, int> misses_; // id -> consecutive listings without it
    int removal_threshold_;

public:
    explicit PlayerRegistry(int removal_threshold = 3)
        : removal_threshold_(removal_threshold < 1 ? 1 : removal_threshold) {}

    ReconcileResult reconcile(const std::set<std::string> &observed)
    {
        std::scoped_lock lk(m_);
        ReconcileResult out;
        for (const auto &id : observed)
        {
            auto [it, inserted] = misses_.try_emplace(id, 0);
            if (inserted)
                out.added.push_back(id);
            else
                it->second = 0;
        }
        for (auto it = misses_.begin(); it != misses_.end();)
        {
            if (observed.count(it->first))
            {
                ++it;
                continue;
            }
            if (++it->second >= removal_threshold_)
            {
                out.removed.push_back(it->first);
                it = misses_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return out;
    }

    bool contains(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        return misses_.count(id) != 0;
    }

    int misses(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        auto it = misses_.find(id);
        return it == misses_.end() ? 0 : it->second;
    }

    std::vector<std::string> ids() const
    {
        std::scoped_lock lk(m_);
        std::vector<std::string> out;
        out.reserve(misses_.size());
        for (const auto &kv : misses_)
            out.push_back(kv.first);
        return out;
    }

    std::size_t size() const
    {
        std::scoped_lock lk(m_);
        return misses_.size();
    }

    int removal_threshold() const { return removal_threshold_; }
};
