/*
 * File: tests/test_coordinator.cpp
 * Project: Signage Fleet Sync
 * Purpose: Poll cycle: listing, per-player fetch, reconciliation
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <thread>

#include "fake_fleet_api.hpp"
#include "fleet_cache.hpp"
#include "fleet_coordinator.hpp"
#include "fleet_registry.hpp"

using nlohmann::json;
using namespace std::chrono_literals;

namespace
{
    struct Rig
    {
        boost::asio::io_context ioc;
        FakeFleetApi api;
        PlayerRegistry registry{3};
        StateCache cache{30s, 2};
        PollingCoordinator coordinator;

        explicit Rig(std::size_t concurrency = 4)
            : coordinator(ioc, api, registry, cache, CoordinatorOptions{30s, concurrency}) {}
    };
} // namespace

TEST_CASE("a full cycle populates registry and cache")
{
    Rig rig;
    rig.api.set_listing({FakeFleetApi::entry("P1"), FakeFleetApi::entry("P2")});
    rig.api.set_status("P1", FakeFleetApi::status_json(40.0, 1.0));
    rig.api.set_status("P2", FakeFleetApi::status_json(50.0, 2.0));
    rig.api.set_cec("P1", json{{"cec_available", true}, {"tv_on", true}});

    auto report = rig.coordinator.runCycle();
    REQUIRE(report.listed);
    REQUIRE(report.fetched == 2);
    REQUIRE(report.added.size() == 2);
    REQUIRE(rig.registry.size() == 2);
    REQUIRE(rig.cache.get("P1")->cec.tv_on == true);
    REQUIRE(rig.cache.get("P2")->metrics->cpu_temp == Catch::Approx(50.0));
    REQUIRE(rig.coordinator.phase() == CyclePhase::Idle);
    REQUIRE(rig.coordinator.cycles() == 1);
}

TEST_CASE("a failed listing marks the hub degraded and changes nothing")
{
    Rig rig;
    rig.api.set_listing({FakeFleetApi::entry("P1")});
    rig.api.set_status("P1", FakeFleetApi::status_json(40.0, 1.0));
    rig.coordinator.runCycle();

    rig.api.fail("listPlayers", {ErrorKind::Unreachable});
    auto report = rig.coordinator.runCycle();
    REQUIRE_FALSE(report.listed);
    REQUIRE(report.error == ErrorKind::Unreachable);
    REQUIRE(rig.coordinator.degraded());
    REQUIRE(rig.registry.misses("P1") == 0);
    REQUIRE(rig.cache.get("P1")->online);

    rig.coordinator.runCycle();
    REQUIRE_FALSE(rig.coordinator.degraded());
}

TEST_CASE("one player's failure does not abort the others")
{
    Rig rig;
    rig.api.set_listing({FakeFleetApi::entry("P1"), FakeFleetApi::entry("P2"), FakeFleetApi::entry("P3")});
    rig.api.set_status("P1", FakeFleetApi::status_json(40.0, 1.0));
    rig.api.set_status("P3", FakeFleetApi::status_json(42.0, 1.0));

    auto report = rig.coordinator.runCycle();
    REQUIRE(report.fetched == 2);
    REQUIRE(report.failed == 1);
    REQUIRE(rig.cache.contains("P2"));
    REQUIRE(rig.cache.get("P3")->metrics);
    REQUIRE_FALSE(rig.cache.get("P2")->metrics);
}

TEST_CASE("status failures need two cycles to flip a player offline")
{
    Rig rig;
    rig.api.set_listing({FakeFleetApi::entry("P1")});
    rig.api.set_status("P1", FakeFleetApi::status_json(40.0, 1.0));
    rig.coordinator.runCycle();

    rig.api.fail_always("getPlayerStatus", ErrorKind::Unreachable);
    rig.coordinator.runCycle();
    REQUIRE(rig.cache.get("P1")->online);
    rig.coordinator.runCycle();
    REQUIRE_FALSE(rig.cache.get("P1")->online);

    rig.api.clear_failures();
    rig.coordinator.runCycle();
    REQUIRE(rig.cache.get("P1")->online);
}

TEST_CASE("offline players are not fetched and use their last status")
{
    Rig rig;
    auto off = FakeFleetApi::entry("P9", false);
    off.last_status = FakeFleetApi::status_json(33.0, 4.0);
    rig.api.set_listing({off});

    rig.coordinator.runCycle();
    REQUIRE(rig.api.count("getPlayerStatus") == 0);
    auto p = rig.cache.get("P9");
    REQUIRE(p);
    REQUIRE_FALSE(p->online);
    REQUIRE(p->metrics->cpu_temp == Catch::Approx(33.0));
}

TEST_CASE("an offline first sighting with a broken last status is still cached offline")
{
    Rig rig;
    auto off = FakeFleetApi::entry("P9", false);
    off.last_status = FakeFleetApi::status_json(33.0, 4.0);
    off.last_status["assets"] = "broken";
    rig.api.set_listing({off});

    for (int i = 0; i < 3; ++i)
    {
        auto report = rig.coordinator.runCycle();
        REQUIRE(report.malformed == 1);
    }
    REQUIRE(rig.registry.size() == 1);
    auto p = rig.cache.get("P9");
    REQUIRE(p);
    REQUIRE_FALSE(p->online);
    REQUIRE_FALSE(p->metrics);
}

TEST_CASE("playback and schedule sections are taken from the player list")
{
    Rig rig;
    auto entry = decode_listing_entry(json{
        {"id", "A"},
        {"name", "Lobby"},
        {"is_online", true},
        {"now_playing", {{"asset_id", "a1"}, {"asset_name", "Menu"}, {"mimetype", "image"}}},
        {"schedule_status", {{"active_slot", {{"id", "S1"}, {"name", "Morning"}, {"slot_type", "time"}}}}},
        {"schedule_slots", json::array({{{"id", "S1"}, {"name", "Morning"}, {"slot_type", "time"}}})},
        {"assets", json::array({{{"asset_id", "a1"}, {"name", "Menu"}, {"uri", "http://m"}}})}});
    rig.api.set_listing({entry});
    auto metrics_only = json{{"cpu_temp", 40.0}, {"cpu_usage", 1.0}};
    rig.api.set_status("A", metrics_only);

    rig.coordinator.runCycle();
    auto p = rig.cache.get("A");
    REQUIRE(p);
    REQUIRE(p->now_playing);
    REQUIRE(p->now_playing->asset_name == "Menu");
    REQUIRE(p->active_slot);
    REQUIRE(p->active_slot->id == "S1");
    REQUIRE(p->find_slot("S1"));
    REQUIRE(p->find_asset("a1"));

    // The status body wins for sections it carries itself
    auto with_slots = metrics_only;
    with_slots["schedule_slots"] = json::array({{{"id", "S2"}, {"name", "Evening"}, {"slot_type", "time"}}});
    with_slots["now_playing"] = nullptr;
    rig.api.set_status("A", with_slots);
    rig.coordinator.runCycle();
    p = rig.cache.get("A");
    REQUIRE_FALSE(p->now_playing);
    REQUIRE(p->slots.size() == 1);
    REQUIRE(p->find_slot("S2"));
    REQUIRE(p->find_asset("a1"));
}

TEST_CASE("a status without cpu_temp keeps the previous snapshot and the player online")
{
    Rig rig;
    rig.api.set_listing({FakeFleetApi::entry("P1")});
    rig.api.set_status("P1", FakeFleetApi::status_json(40.0, 1.0));
    rig.coordinator.runCycle();

    auto partial = FakeFleetApi::status_json(55.0, 3.0);
    partial.erase("cpu_temp");
    rig.api.set_status("P1", partial);
    for (int i = 0; i < 3; ++i)
    {
        auto report = rig.coordinator.runCycle();
        REQUIRE(report.malformed == 1);
    }
    auto p = rig.cache.get("P1");
    REQUIRE(p->online);
    REQUIRE(p->metrics->cpu_temp == Catch::Approx(40.0));
    REQUIRE(p->metrics->cpu_usage == Catch::Approx(1.0));
    REQUIRE(rig.cache.misses("P1") == 0);
}

TEST_CASE("a player gone for three listings leaves registry, cache and screenshots")
{
    Rig rig;
    std::vector<std::string> evicted;
    rig.coordinator.on_removed([&](const std::vector<std::string> &ids)
                               { evicted = ids; });
    rig.api.set_listing({FakeFleetApi::entry("P1"), FakeFleetApi::entry("P2")});
    rig.api.set_status("P1", FakeFleetApi::status_json(40.0, 1.0));
    rig.api.set_status("P2", FakeFleetApi::status_json(40.0, 1.0));
    rig.coordinator.runCycle();

    rig.api.set_listing({FakeFleetApi::entry("P1")});
    rig.coordinator.runCycle();
    rig.coordinator.runCycle();
    REQUIRE(rig.cache.contains("P2"));
    REQUIRE_FALSE(rig.cache.get("P2")->online);

    auto report = rig.coordinator.runCycle();
    REQUIRE(report.removed == std::vector<std::string>{"P2"});
    REQUIRE_FALSE(rig.cache.contains("P2"));
    REQUIRE(evicted == std::vector<std::string>{"P2"});
}

TEST_CASE("duplicate ids in one listing are fetched once")
{
    Rig rig;
    rig.api.set_listing({FakeFleetApi::entry("P1"), FakeFleetApi::entry("P1")});
    rig.api.set_status("P1", FakeFleetApi::status_json(40.0, 1.0));
    auto report = rig.coordinator.runCycle();
    REQUIRE(report.players == 1);
    REQUIRE(rig.api.count("getPlayerStatus") == 1);
}

TEST_CASE("status fetches respect the concurrency bound")
{
    Rig rig{2};
    std::vector<PlayerListing> listing;
    for (int i = 0; i < 6; ++i)
    {
        auto id = "P" + std::to_string(i);
        listing.push_back(FakeFleetApi::entry(id));
        rig.api.set_status(id, FakeFleetApi::status_json(40.0, 1.0));
    }
    rig.api.set_listing(listing);
    rig.api.set_delay(20ms);

    auto report = rig.coordinator.runCycle();
    REQUIRE(report.fetched == 6);
    // listPlayers runs alone; status and cec calls share the two workers
    REQUIRE(rig.api.max_in_flight() <= 2);
}

TEST_CASE("a status with metrics but a bad schedule counts as a heartbeat")
{
    Rig rig;
    rig.api.set_listing({FakeFleetApi::entry("P1")});
    auto s = FakeFleetApi::status_json(40.0, 1.0);
    rig.api.set_status("P1", s);
    rig.coordinator.runCycle();

    s["schedule_slots"] = "broken";
    rig.api.set_status("P1", s);
    auto report = rig.coordinator.runCycle();
    REQUIRE(report.malformed == 1);
    rig.coordinator.runCycle();
    REQUIRE(rig.cache.get("P1")->online);
    REQUIRE(rig.cache.misses("P1") == 0);
}

TEST_CASE("the timer drives cycles until stopped")
{
    boost::asio::io_context ioc;
    FakeFleetApi api;
    PlayerRegistry registry;
    StateCache cache;
    PollingCoordinator coordinator(ioc, api, registry, cache, CoordinatorOptions{20ms, 2});
    api.set_listing({FakeFleetApi::entry("P1")});
    api.set_status("P1", FakeFleetApi::status_json(40.0, 1.0));

    auto guard = boost::asio::make_work_guard(ioc);
    std::thread runner([&]
                       { ioc.run(); });
    coordinator.start();
    std::this_thread::sleep_for(150ms);
    coordinator.stop();
    guard.reset();
    runner.join();

    REQUIRE(coordinator.cycles() >= 2);
    REQUIRE(cache.contains("P1"));
}
