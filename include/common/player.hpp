/*
 * File: include/common/player.hpp
 * Project: Signage Fleet Sync
 * Purpose: Player data model and fleet-server payload decoding
 * Notes:
 *  - Decoders throw FleetError(Malformed) on unexpected shapes
 *  - player_to_json is the wire form served to consumers
 * Last updated: 2026-10-18
 */

#pragma once
#include <cmath>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/fleet_error.hpp"

struct Metrics
{
    double cpu_temp = 0.0;
    double cpu_usage = 0.0;
    std::optional<double> memory_percent;
    std::optional<double> disk_free_gb;
    std::optional<double> uptime_hours;
    std::string ip_address;
    std::string mac_address;
    std::string device_model;
    std::string software_version;
};

struct NowPlaying
{
    std::string asset_id;
    std::string asset_name;
    std::string mimetype;
    std::string started_at;
};

struct CecState
{
    bool available = false;
    std::optional<bool> tv_on;
};

struct Asset
{
    std::string id;
    std::string name;
    std::string uri;
    std::string mimetype;
    int duration = 0;
    bool enabled = true;
};

struct SlotItem
{
    std::string id;
    std::string asset_id;
};

struct ScheduleSlot
{
    std::string id;
    std::string name;
    std::string slot_type{"default"};
    std::string start_time;
    std::string end_time;
    std::vector<int> days_of_week;
    std::vector<SlotItem> items;
};

struct ActiveSlot
{
    std::string id;
    std::string name;
    std::string slot_type;
};

struct Player
{
    std::string id;
    std::string name;
    bool online = false;
    std::string last_seen;
    std::optional<Metrics> metrics;
    std::optional<NowPlaying> now_playing;
    CecState cec;
    std::optional<ActiveSlot> active_slot;
    std::vector<ScheduleSlot> slots;
    std::vector<Asset> assets;

    const Asset *find_asset(const std::string &asset_id) const
    {
        for (const auto &a : assets)
            if (a.id == asset_id)
                return &a;
        return nullptr;
    }

    const ScheduleSlot *find_slot(const std::string &slot_id) const
    {
        for (const auto &s : slots)
            if (s.id == slot_id)
                return &s;
        return nullptr;
    }
};

inline bool operator==(const Metrics &a, const Metrics &b)
{
    return std::tie(a.cpu_temp, a.cpu_usage, a.memory_percent, a.disk_free_gb, a.uptime_hours,
                    a.ip_address, a.mac_address, a.device_model, a.software_version) ==
           std::tie(b.cpu_temp, b.cpu_usage, b.memory_percent, b.disk_free_gb, b.uptime_hours,
                    b.ip_address, b.mac_address, b.device_model, b.software_version);
}

inline bool operator==(const NowPlaying &a, const NowPlaying &b)
{
    return std::tie(a.asset_id, a.asset_name, a.mimetype, a.started_at) ==
           std::tie(b.asset_id, b.asset_name, b.mimetype, b.started_at);
}

inline bool operator==(const CecState &a, const CecState &b)
{
    return a.available == b.available && a.tv_on == b.tv_on;
}

inline bool operator==(const Asset &a, const Asset &b)
{
    return std::tie(a.id, a.name, a.uri, a.mimetype, a.duration, a.enabled) ==
           std::tie(b.id, b.name, b.uri, b.mimetype, b.duration, b.enabled);
}

inline bool operator==(const SlotItem &a, const SlotItem &b)
{
    return a.id == b.id && a.asset_id == b.asset_id;
}

inline bool operator==(const ScheduleSlot &a, const ScheduleSlot &b)
{
    return std::tie(a.id, a.name, a.slot_type, a.start_time, a.end_time, a.days_of_week, a.items) ==
           std::tie(b.id, b.name, b.slot_type, b.start_time, b.end_time, b.days_of_week, b.items);
}

inline bool operator==(const ActiveSlot &a, const ActiveSlot &b)
{
    return std::tie(a.id, a.name, a.slot_type) == std::tie(b.id, b.name, b.slot_type);
}

inline bool operator==(const Player &a, const Player &b)
{
    return std::tie(a.id, a.name, a.online, a.last_seen, a.metrics, a.now_playing, a.cec,
                    a.active_slot, a.slots, a.assets) ==
           std::tie(b.id, b.name, b.online, b.last_seen, b.metrics, b.now_playing, b.cec,
                    b.active_slot, b.slots, b.assets);
}

inline bool operator!=(const Player &a, const Player &b) { return !(a == b); }

// Playback and schedule sections, carried by both the player list entry and
// the /info/ body. Absent sections stay nullopt so the cache can carry the
// previous value forward.
struct PlayerContent
{
    bool has_now_playing = false;
    std::optional<NowPlaying> now_playing;
    bool has_schedule_status = false;
    std::optional<ActiveSlot> active_slot;
    std::optional<std::vector<ScheduleSlot>> slots;
    std::optional<std::vector<Asset>> assets;
};

// One entry of GET /api/players/
struct PlayerListing
{
    std::string id;
    std::string name;
    bool is_online = false;
    std::string last_seen;
    nlohmann::json last_status; // null when the server sent none
    PlayerContent content;
};

// Decoded GET /api/players/{id}/info/
struct PlayerStatus : PlayerContent
{
    Metrics metrics;
};

// -------- json field helpers --------

inline double round1(double v) { return std::round(v * 10.0) / 10.0; }

// Ids arrive as strings or integers depending on the server model
inline std::string json_id(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number_unsigned())
        return std::to_string(it->get<unsigned long long>());
    if (it->is_number_integer())
        return std::to_string(it->get<long long>());
    return it->dump();
}

inline std::string json_string(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

// Numbers may be sent as JSON numbers or numeric strings
inline std::optional<double> json_number(const nlohmann::json &j, const char *key)
{
    if (!j.is_object())
        return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    if (it->is_number())
        return it->get<double>();
    if (it->is_string())
    {
        try
        {
            std::size_t used = 0;
            const auto &s = it->get_ref<const std::string &>();
            double v = std::stod(s, &used);
            if (used == s.size())
                return v;
        }
        catch (const std::exception &)
        {
        }
    }
    return std::nullopt;
}

inline bool json_bool(const nlohmann::json &j, const char *key, bool fallback)
{
    auto it = j.find(key);
    if (it == j.end())
        return fallback;
    if (it->is_boolean())
        return it->get<bool>();
    if (it->is_number_integer())
        return it->get<long long>() != 0;
    return fallback;
}

// -------- decoders --------

inline std::string strip_url_prefix(std::string ip)
{
    for (const char *prefix : {"http://", "https://"})
    {
        const std::string p{prefix};
        if (ip.compare(0, p.size(), p) == 0)
            ip = ip.substr(p.size());
    }
    while (!ip.empty() && ip.back() == '/')
        ip.pop_back();
    return ip;
}

inline bool has_required_metrics(const nlohmann::json &info)
{
    return info.is_object() && json_number(info, "cpu_temp") && json_number(info, "cpu_usage");
}

// True when the payload carries no metric section at all (as opposed to an
// incomplete one).
inline bool metrics_absent(const nlohmann::json &info)
{
    if (!info.is_object())
        return true;
    for (const char *key : {"cpu_temp", "cpu_usage", "memory", "disk_usage", "uptime"})
        if (info.contains(key))
            return false;
    return true;
}

inline Metrics decode_metrics(const nlohmann::json &info)
{
    if (!info.is_object())
        throw FleetError(ErrorKind::Malformed, "status payload is not an object");
    auto temp = json_number(info, "cpu_temp");
    if (!temp)
        throw FleetError(ErrorKind::Malformed, "status payload missing cpu_temp");
    auto usage = json_number(info, "cpu_usage");
    if (!usage)
        throw FleetError(ErrorKind::Malformed, "status payload missing cpu_usage");

    Metrics m;
    m.cpu_temp = round1(*temp);
    m.cpu_usage = round1(*usage);

    auto mem = info.find("memory");
    if (mem != info.end() && mem->is_object())
    {
        auto total = json_number(*mem, "total");
        auto used = json_number(*mem, "used");
        if (total && used && *total > 0.0)
            m.memory_percent = round1(*used / *total * 100.0);
    }

    auto disk = info.find("disk_usage");
    if (disk != info.end() && disk->is_object())
    {
        if (auto free_gb = json_number(*disk, "free_gb"))
            m.disk_free_gb = round1(*free_gb);
    }

    auto uptime = info.find("uptime");
    if (uptime != info.end() && uptime->is_object())
    {
        double days = json_number(*uptime, "days").value_or(0.0);
        double hours = json_number(*uptime, "hours").value_or(0.0);
        m.uptime_hours = round1(days * 24.0 + hours);
    }

    auto ips = info.find("ip_addresses");
    if (ips != info.end() && ips->is_array() && !ips->empty())
    {
        const auto &first = ips->front();
        m.ip_address = strip_url_prefix(first.is_string() ? first.get<std::string>() : first.dump());
    }

    m.mac_address = json_string(info, "mac_address");
    m.device_model = json_string(info, "device_model");
    m.software_version = json_string(info, "anthias_version");
    return m;
}

inline Asset decode_asset(const nlohmann::json &j)
{
    if (!j.is_object())
        throw FleetError(ErrorKind::Malformed, "asset entry is not an object");
    Asset a;
    a.id = json_id(j, "asset_id");
    if (a.id.empty())
        a.id = json_id(j, "id");
    if (a.id.empty())
        throw FleetError(ErrorKind::Malformed, "asset entry without id");
    a.name = json_string(j, "name");
    a.uri = json_string(j, "uri");
    a.mimetype = json_string(j, "mimetype");
    a.duration = static_cast<int>(json_number(j, "duration").value_or(0.0));
    a.enabled = json_bool(j, "is_enabled", true);
    return a;
}

inline ScheduleSlot decode_slot(const nlohmann::json &j)
{
    if (!j.is_object())
        throw FleetError(ErrorKind::Malformed, "schedule slot is not an object");
    ScheduleSlot s;
    s.id = json_id(j, "id");
    if (s.id.empty())
        throw FleetError(ErrorKind::Malformed, "schedule slot without id");
    s.name = json_string(j, "name");
    s.slot_type = json_string(j, "slot_type");
    s.start_time = json_string(j, "start_time");
    s.end_time = json_string(j, "end_time");

    auto days = j.find("days_of_week");
    if (days != j.end() && days->is_array())
        for (const auto &d : *days)
            if (d.is_number_integer())
                s.days_of_week.push_back(d.get<int>());

    auto items = j.find("items");
    if (items != j.end() && items->is_array())
    {
        for (const auto &it : *items)
        {
            if (!it.is_object())
                throw FleetError(ErrorKind::Malformed, "slot item is not an object");
            SlotItem item{json_id(it, "id"), json_id(it, "asset_id")};
            if (item.id.empty())
                throw FleetError(ErrorKind::Malformed, "slot item without id");
            s.items.push_back(std::move(item));
        }
    }
    return s;
}

inline PlayerContent decode_content(const nlohmann::json &j)
{
    PlayerContent c;
    if (!j.is_object())
        return c;

    auto np = j.find("now_playing");
    if (np != j.end())
    {
        c.has_now_playing = true;
        if (np->is_object())
            c.now_playing = NowPlaying{json_id(*np, "asset_id"), json_string(*np, "asset_name"),
                                       json_string(*np, "mimetype"), json_string(*np, "started_at")};
    }

    auto status = j.find("schedule_status");
    if (status != j.end() && status->is_object())
    {
        c.has_schedule_status = true;
        auto active = status->find("active_slot");
        if (active != status->end() && active->is_object())
            c.active_slot = ActiveSlot{json_id(*active, "id"), json_string(*active, "name"),
                                       json_string(*active, "slot_type")};
    }

    auto slots = j.find("schedule_slots");
    if (slots != j.end())
    {
        if (!slots->is_array())
            throw FleetError(ErrorKind::Malformed, "schedule_slots is not an array");
        std::vector<ScheduleSlot> out;
        for (const auto &s : *slots)
            out.push_back(decode_slot(s));
        c.slots = std::move(out);
    }

    auto assets = j.find("assets");
    if (assets != j.end())
    {
        if (!assets->is_array())
            throw FleetError(ErrorKind::Malformed, "assets is not an array");
        std::vector<Asset> out;
        for (const auto &a : *assets)
            out.push_back(decode_asset(a));
        c.assets = std::move(out);
    }
    return c;
}

inline PlayerStatus decode_player_status(const nlohmann::json &info)
{
    PlayerStatus st;
    st.metrics = decode_metrics(info);
    static_cast<PlayerContent &>(st) = decode_content(info);
    return st;
}

inline CecState decode_cec(const nlohmann::json &j)
{
    if (!j.is_object())
        throw FleetError(ErrorKind::Malformed, "cec status is not an object");
    CecState c;
    c.available = json_bool(j, "cec_available", false);
    auto on = j.find("tv_on");
    if (on != j.end() && on->is_boolean())
        c.tv_on = on->get<bool>();
    return c;
}

inline PlayerListing decode_listing_entry(const nlohmann::json &j)
{
    if (!j.is_object())
        throw FleetError(ErrorKind::Malformed, "player entry is not an object");
    PlayerListing p;
    p.id = json_id(j, "id");
    if (p.id.empty())
        throw FleetError(ErrorKind::Malformed, "player entry without id");
    p.name = json_string(j, "name");
    if (p.name.empty())
        p.name = p.id;
    p.is_online = json_bool(j, "is_online", false);
    p.last_seen = json_string(j, "last_seen");
    auto ls = j.find("last_status");
    if (ls != j.end() && ls->is_object() && !ls->empty())
        p.last_status = *ls;
    // A malformed section in one entry must not fail the whole listing; the
    // /info/ body still supplies it for online players.
    try
    {
        p.content = decode_content(j);
    }
    catch (const FleetError &)
    {
        p.content = PlayerContent{};
    }
    return p;
}

// Accepts both a plain array and a paginated {"results": [...]} body
inline std::vector<PlayerListing> decode_player_list(const nlohmann::json &body)
{
    const nlohmann::json *arr = &body;
    if (body.is_object())
    {
        auto it = body.find("results");
        if (it == body.end())
            throw FleetError(ErrorKind::Malformed, "player list object without results");
        arr = &*it;
    }
    if (!arr->is_array())
        throw FleetError(ErrorKind::Malformed, "player list is not an array");

    std::vector<PlayerListing> out;
    out.reserve(arr->size());
    for (const auto &entry : *arr)
        out.push_back(decode_listing_entry(entry));
    return out;
}

// -------- encoders --------

inline nlohmann::json asset_to_json(const Asset &a)
{
    return nlohmann::json{
        {"id", a.id},
        {"name", a.name},
        {"uri", a.uri},
        {"mimetype", a.mimetype},
        {"duration", a.duration},
        {"is_enabled", a.enabled}};
}

inline nlohmann::json slot_to_json(const ScheduleSlot &s)
{
    using nlohmann::json;
    json items = json::array();
    for (const auto &it : s.items)
        items.push_back(json{{"id", it.id}, {"asset_id", it.asset_id}});
    return json{
        {"id", s.id},
        {"name", s.name},
        {"slot_type", s.slot_type},
        {"start_time", s.start_time},
        {"end_time", s.end_time},
        {"days_of_week", s.days_of_week},
        {"items", items}};
}

inline nlohmann::json player_to_json(const Player &p)
{
    using nlohmann::json;
    json j{
        {"id", p.id},
        {"name", p.name},
        {"online", p.online},
        {"last_seen", p.last_seen}};

    if (p.metrics)
    {
        const auto &m = *p.metrics;
        auto opt = [](const std::optional<double> &v)
        { return v ? json(*v) : json(nullptr); };
        j["metrics"] = json{
            {"cpu_temp", m.cpu_temp},
            {"cpu_usage", m.cpu_usage},
            {"memory_usage", opt(m.memory_percent)},
            {"disk_free_gb", opt(m.disk_free_gb)},
            {"uptime_hours", opt(m.uptime_hours)},
            {"ip_address", m.ip_address},
            {"mac_address", m.mac_address},
            {"device_model", m.device_model},
            {"software_version", m.software_version}};
    }
    else
    {
        j["metrics"] = nullptr;
    }

    if (p.now_playing)
        j["now_playing"] = json{
            {"asset_id", p.now_playing->asset_id},
            {"asset_name", p.now_playing->asset_name},
            {"mimetype", p.now_playing->mimetype},
            {"started_at", p.now_playing->started_at}};
    else
        j["now_playing"] = nullptr;

    j["cec"] = json{
        {"available", p.cec.available},
        {"tv_on", p.cec.tv_on ? json(*p.cec.tv_on) : json(nullptr)}};

    json slots = json::array();
    for (const auto &s : p.slots)
        slots.push_back(slot_to_json(s));
    json schedule{{"slot_count", p.slots.size()}, {"slots", slots}};
    if (p.active_slot)
        schedule["active_slot"] = json{
            {"id", p.active_slot->id},
            {"name", p.active_slot->name},
            {"slot_type", p.active_slot->slot_type}};
    else
        schedule["active_slot"] = nullptr;
    j["schedule"] = schedule;

    json assets = json::array();
    for (const auto &a : p.assets)
        assets.push_back(asset_to_json(a));
    j["assets"] = assets;
    return j;
}
