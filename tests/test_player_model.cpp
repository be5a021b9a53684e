/*
 * File: tests/test_player_model.cpp
 * Project: Signage Fleet Sync
 * Purpose: Decoding of server payloads into the player model
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>

#include "common/fleet_error.hpp"
#include "common/player.hpp"

using nlohmann::json;

TEST_CASE("metrics are derived and rounded from the info payload")
{
    json info{
        {"cpu_temp", 51.26},
        {"cpu_usage", "12.04"},
        {"memory", {{"total", 3000}, {"used", 1000}}},
        {"disk_usage", {{"free_gb", 7.77}}},
        {"uptime", {{"days", 2}, {"hours", 3.5}}},
        {"ip_addresses", {"http://192.168.1.20/"}},
        {"mac_address", "aa:bb"},
        {"anthias_version", "v0.19"}};

    auto m = decode_metrics(info);
    REQUIRE(m.cpu_temp == Catch::Approx(51.3));
    REQUIRE(m.cpu_usage == Catch::Approx(12.0));
    REQUIRE(m.memory_percent);
    REQUIRE(*m.memory_percent == Catch::Approx(33.3));
    REQUIRE(*m.disk_free_gb == Catch::Approx(7.8));
    REQUIRE(*m.uptime_hours == Catch::Approx(51.5));
    REQUIRE(m.ip_address == "192.168.1.20");
    REQUIRE(m.software_version == "v0.19");
}

TEST_CASE("a status without cpu metrics is malformed")
{
    json info{{"cpu_temp", 40.0}};
    try
    {
        decode_player_status(info);
        FAIL("expected FleetError");
    }
    catch (const FleetError &e)
    {
        REQUIRE(e.kind() == ErrorKind::Malformed);
    }
    REQUIRE_FALSE(has_required_metrics(info));
    REQUIRE_FALSE(metrics_absent(info));
    REQUIRE(metrics_absent(json{{"now_playing", nullptr}}));
}

TEST_CASE("plain and paginated player lists decode the same")
{
    json players = json::array({
        {{"id", 1}, {"name", "Lobby"}, {"is_online", true}, {"last_seen", "t1"}},
        {{"id", "2"}, {"is_online", false}, {"last_status", {{"cpu_temp", 30}, {"cpu_usage", 2}}}},
    });
    auto plain = decode_player_list(players);
    auto paged = decode_player_list(json{{"count", 2}, {"next", nullptr}, {"results", players}});

    REQUIRE(plain.size() == 2);
    REQUIRE(paged.size() == 2);
    for (std::size_t i = 0; i < plain.size(); ++i)
    {
        REQUIRE(plain[i].id == paged[i].id);
        REQUIRE(plain[i].name == paged[i].name);
        REQUIRE(plain[i].is_online == paged[i].is_online);
    }
    REQUIRE(plain[0].id == "1");
    REQUIRE(plain[1].name == "2");
    REQUIRE(has_required_metrics(plain[1].last_status));
}

TEST_CASE("a list entry without id is malformed")
{
    REQUIRE_THROWS_AS(decode_player_list(json::array({{{"name", "x"}}})), FleetError);
    REQUIRE_THROWS_AS(decode_player_list(json{{"detail", "oops"}}), FleetError);
}

TEST_CASE("schedule and assets are decoded with their ids")
{
    json info{
        {"cpu_temp", 40},
        {"cpu_usage", 5},
        {"schedule_status", {{"active_slot", {{"id", 7}, {"name", "Morning"}, {"slot_type", "time"}}}}},
        {"schedule_slots", json::array({{{"id", 7},
                                         {"name", "Morning"},
                                         {"slot_type", "time"},
                                         {"days_of_week", {1, 2, 3}},
                                         {"items", json::array({{{"id", 70}, {"asset_id", "a1"}}})}}})},
        {"assets", json::array({{{"asset_id", "a1"}, {"name", "Menu"}, {"uri", "http://m"}, {"is_enabled", false}}})}};

    auto st = decode_player_status(info);
    REQUIRE(st.has_schedule_status);
    REQUIRE(st.active_slot->id == "7");
    REQUIRE(st.slots->size() == 1);
    REQUIRE(st.slots->front().items.front().id == "70");
    REQUIRE(st.slots->front().days_of_week == std::vector<int>{1, 2, 3});
    REQUIRE(st.assets->front().id == "a1");
    REQUIRE_FALSE(st.assets->front().enabled);
}

TEST_CASE("only unreachable and server errors are transient")
{
    REQUIRE(is_transient(ErrorKind::Unreachable));
    REQUIRE(is_transient(ErrorKind::ServerError));
    REQUIRE_FALSE(is_transient(ErrorKind::Unauthorized));
    REQUIRE_FALSE(is_transient(ErrorKind::NotFound));
    REQUIRE_FALSE(is_transient(ErrorKind::Malformed));
    REQUIRE_FALSE(is_transient(ErrorKind::Rejected));
}

TEST_CASE("player json carries schedule counts and cec state")
{
    Player p;
    p.id = "p1";
    p.name = "Lobby";
    p.online = true;
    p.cec.available = true;
    p.cec.tv_on = false;
    p.slots.push_back(ScheduleSlot{"s1", "Default", "default", "", "", {}, {}});

    auto j = player_to_json(p);
    REQUIRE(j["schedule"]["slot_count"] == 1);
    REQUIRE(j["cec"]["tv_on"] == false);
    REQUIRE(j["metrics"].is_null());
    REQUIRE(j["schedule"]["active_slot"].is_null());
}
