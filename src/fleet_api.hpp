/*
 * File: src/fleet_api.hpp
 * Project: Signage Fleet Sync
 * Purpose: Fleet server operations consumed by the sync engine
 * Notes:
 *  - Every call is one request; failures surface as FleetError
 *  - HttpFleetClient (fleet_http.hpp) is the production implementation
 * Last updated: 2026-10-18
 */

#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/player.hpp"

struct AssetSpec
{
    std::string name;
    std::string uri;
    std::string mimetype{"webpage"};
    int duration = 10;
};

struct SlotSpec
{
    std::string name;
    std::string slot_type{"default"};
    std::string start_time;
    std::string end_time;
    std::vector<int> days_of_week;
};

struct Screenshot
{
    std::string bytes;
    std::string content_type{"image/png"};
};

class FleetApi
{
public:
    virtual ~FleetApi() = default;

    // Establishes credentials before the first request (token exchange).
    virtual void authenticate() = 0;

    virtual std::vector<PlayerListing> listPlayers() = 0;
    virtual nlohmann::json getPlayerStatus(const std::string &player_id) = 0;
    virtual nlohmann::json getCecStatus(const std::string &player_id) = 0;
    virtual Screenshot getScreenshot(const std::string &player_id) = 0;

    virtual nlohmann::json createAsset(const std::string &player_id, const AssetSpec &spec) = 0;
    virtual nlohmann::json deleteAsset(const std::string &player_id, const std::string &asset_id) = 0;
    virtual nlohmann::json toggleAsset(const std::string &player_id, const std::string &asset_id, bool enabled) = 0;

    virtual nlohmann::json createScheduleSlot(const std::string &player_id, const SlotSpec &spec) = 0;
    virtual nlohmann::json deleteScheduleSlot(const std::string &player_id, const std::string &slot_id) = 0;
    virtual nlohmann::json addSlotItem(const std::string &player_id, const std::string &slot_id,
                                       const std::string &asset_id) = 0;
    virtual nlohmann::json removeSlotItem(const std::string &player_id, const std::string &slot_id,
                                          const std::string &item_id) = 0;

    virtual nlohmann::json setPower(const std::string &player_id, bool on) = 0;
    virtual nlohmann::json reboot(const std::string &player_id) = 0;
    virtual nlohmann::json shutdown(const std::string &player_id) = 0;
    virtual nlohmann::json triggerUpdate(const std::string &player_id) = 0;
    virtual nlohmann::json deployContent(const std::string &player_id, const std::string &media_file_id) = 0;
    virtual nlohmann::json playbackControl(const std::string &player_id, const std::string &command) = 0;
};
