/*
 * File: tests/test_dispatcher.cpp
 * Project: Signage Fleet Sync
 * Purpose: Command validation, retry, ordering and cancellation
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>

#include <boost/asio.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>

#include "fake_fleet_api.hpp"
#include "fleet_cache.hpp"
#include "fleet_dispatcher.hpp"

using nlohmann::json;
using namespace std::chrono_literals;

namespace
{
    DispatcherOptions fast_retries()
    {
        DispatcherOptions o;
        o.concurrency = 4;
        o.max_attempts = 3;
        o.backoff_base = 1ms;
        o.backoff_max = 4ms;
        return o;
    }

    json seeded_status()
    {
        auto s = FakeFleetApi::status_json(40.0, 1.0);
        s["assets"] = json::array({{{"asset_id", "A1"}, {"name", "Menu"}, {"uri", "http://menu"}, {"is_enabled", true}}});
        s["schedule_slots"] = json::array({{{"id", "S1"},
                                            {"name", "Default"},
                                            {"slot_type", "default"},
                                            {"items", json::array({{{"id", "I1"}, {"asset_id", "A1"}}})}}});
        return s;
    }

    struct Rig
    {
        boost::asio::io_context ioc;
        std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guard;
        std::thread runner;
        FakeFleetApi api;
        StateCache cache{30s, 2};
        std::unique_ptr<CommandDispatcher> dispatcher;

        explicit Rig(DispatcherOptions opts = fast_retries())
        {
            guard.emplace(boost::asio::make_work_guard(ioc));
            runner = std::thread([this]
                                 { ioc.run(); });
            dispatcher = std::make_unique<CommandDispatcher>(ioc, api, cache, opts);

            cache.applyPlayerSnapshot("P1", PlayerPayload{FakeFleetApi::entry("P1"), seeded_status(),
                                                          json{{"cec_available", true}, {"tv_on", false}}});
            cache.applyPlayerSnapshot("P2", PlayerPayload{FakeFleetApi::entry("P2"), seeded_status(), std::nullopt});
        }

        ~Rig()
        {
            dispatcher->stop();
            guard.reset();
            runner.join();
            dispatcher.reset();
        }

        CommandResult run(CommandKind kind, const std::string &player, json params = json::object())
        {
            return dispatcher->execute(Command{kind, player, std::move(params)}).get();
        }
    };

    json new_asset()
    {
        return json{{"name", "Promo"}, {"uri", "http://promo"}, {"duration", 15}, {"mimetype", "webpage"}};
    }
} // namespace

TEST_CASE("backoff doubles from the base and is capped")
{
    DispatcherOptions o;
    REQUIRE(backoff_delay(o, 1) == 500ms);
    REQUIRE(backoff_delay(o, 2) == 1000ms);
    REQUIRE(backoff_delay(o, 3) == 2000ms);
    REQUIRE(backoff_delay(o, 5) == 8000ms);
    REQUIRE(backoff_delay(o, 12) == 8000ms);
}

TEST_CASE("commands decode from consumer json")
{
    auto cmd = command_from_json(json{{"kind", "toggle_asset"}, {"player_id", 5}, {"asset_id", "A1"}, {"is_enabled", false}});
    REQUIRE(cmd.kind == CommandKind::ToggleAsset);
    REQUIRE(cmd.player_id == "5");
    REQUIRE_FALSE(cmd.params.contains("kind"));
    REQUIRE(cmd.params["asset_id"] == "A1");

    REQUIRE_THROWS_AS(command_from_json(json{{"kind", "format_disk"}, {"player_id", "P1"}}), FleetError);
    REQUIRE_THROWS_AS(command_from_json(json::array()), FleetError);
}

TEST_CASE("transient failures are retried until success")
{
    Rig rig;
    rig.api.fail("createAsset", {ErrorKind::Unreachable, ErrorKind::Unreachable});

    auto r = rig.run(CommandKind::CreateAsset, "P1", new_asset());
    REQUIRE(r.ok);
    REQUIRE(r.attempts == 3);
    REQUIRE(rig.api.count("createAsset") == 3);

    // Visible optimistically until a poll shows the asset
    auto p = rig.cache.get("P1");
    REQUIRE(p->assets.size() == 2);
    REQUIRE(p->assets.back().name == "Promo");
    REQUIRE(rig.cache.pending_patches("P1") == 1);

    auto s = seeded_status();
    s["assets"].push_back(json{{"asset_id", "A2"}, {"name", "Promo"}, {"uri", "http://promo"}});
    rig.cache.applyPlayerSnapshot("P1", PlayerPayload{FakeFleetApi::entry("P1"), s, std::nullopt});
    REQUIRE(rig.cache.pending_patches("P1") == 0);
    REQUIRE(rig.cache.get("P1")->assets.back().id == "A2");
}

TEST_CASE("exhausted retries roll the optimistic change back")
{
    Rig rig;
    rig.api.fail_always("toggleAsset", ErrorKind::ServerError);

    auto r = rig.run(CommandKind::ToggleAsset, "P1", json{{"asset_id", "A1"}, {"is_enabled", false}});
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.error == ErrorKind::ServerError);
    REQUIRE(r.attempts == 3);
    REQUIRE(rig.cache.get("P1")->find_asset("A1")->enabled);
    REQUIRE(rig.cache.pending_patches("P1") == 0);
}

TEST_CASE("non-transient failures are not retried")
{
    Rig rig;
    rig.api.fail("reboot", {ErrorKind::Unauthorized});
    auto r = rig.run(CommandKind::Reboot, "P1");
    REQUIRE(r.error == ErrorKind::Unauthorized);
    REQUIRE(r.attempts == 1);

    rig.api.fail("deleteAsset", {ErrorKind::Rejected});
    r = rig.run(CommandKind::DeleteAsset, "P1", json{{"asset_id", "A1"}});
    REQUIRE(r.error == ErrorKind::Rejected);
    REQUIRE(r.attempts == 1);
    REQUIRE(rig.cache.get("P1")->find_asset("A1"));
}

TEST_CASE("unknown targets fail fast without a request")
{
    Rig rig;
    auto r = rig.run(CommandKind::DeleteAsset, "P1", json{{"asset_id", "A9"}});
    REQUIRE(r.error == ErrorKind::NotFound);
    REQUIRE(r.attempts == 0);

    r = rig.run(CommandKind::RemoveSlotItem, "P1", json{{"slot_id", "S1"}, {"item_id", "I9"}});
    REQUIRE(r.error == ErrorKind::NotFound);

    r = rig.run(CommandKind::AddSlotItem, "P1", json{{"slot_id", "S9"}, {"asset_id", "A1"}});
    REQUIRE(r.error == ErrorKind::NotFound);

    r = rig.run(CommandKind::Reboot, "P404");
    REQUIRE(r.error == ErrorKind::NotFound);

    REQUIRE(rig.api.calls().empty());
}

TEST_CASE("missing or invalid fields are rejected before any request")
{
    Rig rig;
    auto bad = new_asset();
    bad.erase("uri");
    REQUIRE(rig.run(CommandKind::CreateAsset, "P1", bad).error == ErrorKind::InvalidArgument);

    bad = new_asset();
    bad["mimetype"] = "flash";
    REQUIRE(rig.run(CommandKind::CreateAsset, "P1", bad).error == ErrorKind::InvalidArgument);

    REQUIRE(rig.run(CommandKind::PlaybackControl, "P1", json{{"command", "rewind"}}).error ==
            ErrorKind::InvalidArgument);
    REQUIRE(rig.run(CommandKind::ToggleAsset, "P1", json{{"asset_id", "A1"}}).error == ErrorKind::InvalidArgument);
    REQUIRE(rig.run(CommandKind::Reboot, "").error == ErrorKind::InvalidArgument);
    REQUIRE(rig.api.calls().empty());
}

TEST_CASE("durations outside the int range are rejected")
{
    Rig rig;
    for (double d : {1e20, -1.0, 2.5, 2147483648.0})
    {
        auto bad = new_asset();
        bad["duration"] = d;
        REQUIRE(rig.run(CommandKind::CreateAsset, "P1", bad).error == ErrorKind::InvalidArgument);
    }
    REQUIRE(rig.api.count("createAsset") == 0);

    auto ok = new_asset();
    ok["duration"] = 2147483647.0;
    REQUIRE(rig.run(CommandKind::CreateAsset, "P1", ok).ok);
}

TEST_CASE("power off that never reaches the player restores the confirmed power state")
{
    Rig rig;
    rig.cache.applyPlayerSnapshot("P3", PlayerPayload{FakeFleetApi::entry("P3"), seeded_status(),
                                                      json{{"cec_available", true}, {"tv_on", true}}});
    rig.api.fail_always("setPower", ErrorKind::Unreachable);

    auto r = rig.run(CommandKind::SetPower, "P3", json{{"on", false}});
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.error == ErrorKind::Unreachable);
    REQUIRE(r.attempts == 3);
    REQUIRE(rig.api.count("setPower") == 3);
    REQUIRE(rig.cache.get("P3")->cec.tv_on == true);
    REQUIRE(rig.cache.pending_patches("P3") == 0);
}

TEST_CASE("toggling to the current state is a no-op")
{
    Rig rig;
    auto r = rig.run(CommandKind::ToggleAsset, "P1", json{{"asset_id", "A1"}, {"is_enabled", true}});
    REQUIRE(r.ok);
    REQUIRE(r.noop);
    REQUIRE(rig.api.count("toggleAsset") == 0);

    r = rig.run(CommandKind::SetPower, "P1", json{{"on", false}});
    REQUIRE(r.noop);
    REQUIRE(rig.api.count("setPower") == 0);
}

TEST_CASE("power control needs CEC")
{
    Rig rig;
    auto r = rig.run(CommandKind::SetPower, "P2", json{{"on", true}});
    REQUIRE(r.error == ErrorKind::InvalidArgument);

    r = rig.run(CommandKind::SetPower, "P1", json{{"on", true}});
    REQUIRE(r.ok);
    REQUIRE(rig.cache.get("P1")->cec.tv_on == true);
}

TEST_CASE("slot edits show up optimistically")
{
    Rig rig;
    auto r = rig.run(CommandKind::AddSlotItem, "P1", json{{"slot_id", "S1"}, {"asset_id", "A1"}});
    REQUIRE(r.ok);
    REQUIRE(rig.cache.get("P1")->find_slot("S1")->items.size() == 2);

    r = rig.run(CommandKind::CreateScheduleSlot, "P1",
                json{{"name", "Evening"}, {"slot_type", "time"}, {"start_time", "18:00"}, {"days_of_week", "1, 2,3"}});
    REQUIRE(r.ok);
    auto p = rig.cache.get("P1");
    REQUIRE(p->slots.size() == 2);
    REQUIRE(p->slots.back().days_of_week == std::vector<int>{1, 2, 3});

    r = rig.run(CommandKind::DeleteScheduleSlot, "P1", json{{"slot_id", "S1"}});
    REQUIRE(r.ok);
    REQUIRE_FALSE(rig.cache.get("P1")->find_slot("S1"));
}

TEST_CASE("commands for one player run one at a time in submission order")
{
    Rig rig;
    rig.api.set_delay(30ms);
    auto f1 = rig.dispatcher->execute(Command{CommandKind::Reboot, "P1", json::object()});
    auto f2 = rig.dispatcher->execute(Command{CommandKind::TriggerUpdate, "P1", json::object()});
    auto f3 = rig.dispatcher->execute(Command{CommandKind::Shutdown, "P1", json::object()});
    auto r1 = f1.get();
    auto r2 = f2.get();
    auto r3 = f3.get();

    REQUIRE(r1.ok);
    REQUIRE(r2.ok);
    REQUIRE(r3.ok);
    REQUIRE(r1.sequence < r2.sequence);
    REQUIRE(r2.sequence < r3.sequence);
    REQUIRE(rig.api.calls() == std::vector<std::string>{"reboot:P1", "triggerUpdate:P1", "shutdown:P1"});
    REQUIRE(rig.api.max_in_flight_for("P1") == 1);
}

TEST_CASE("different players are served in parallel")
{
    Rig rig;
    rig.api.set_delay(100ms);
    auto f1 = rig.dispatcher->execute(Command{CommandKind::Reboot, "P1", json::object()});
    auto f2 = rig.dispatcher->execute(Command{CommandKind::Reboot, "P2", json::object()});
    REQUIRE(f1.get().ok);
    REQUIRE(f2.get().ok);
    REQUIRE(rig.api.max_in_flight() == 2);
}

TEST_CASE("stop cancels queued commands and pending retries")
{
    DispatcherOptions slow = fast_retries();
    slow.backoff_base = 500ms;
    slow.backoff_max = 500ms;
    Rig rig{slow};

    rig.api.fail_always("reboot", ErrorKind::Unreachable);
    auto retrying = rig.dispatcher->execute(Command{CommandKind::Reboot, "P2", json::object()});

    rig.api.set_delay(300ms);
    auto running = rig.dispatcher->execute(Command{CommandKind::TriggerUpdate, "P1", json::object()});
    auto queued = rig.dispatcher->execute(Command{CommandKind::Shutdown, "P1", json::object()});
    std::this_thread::sleep_for(100ms);

    rig.dispatcher->stop();

    REQUIRE(queued.wait_for(1s) == std::future_status::ready);
    auto q = queued.get();
    REQUIRE(q.error == ErrorKind::Cancelled);
    REQUIRE(q.attempts == 0);

    REQUIRE(retrying.wait_for(1s) == std::future_status::ready);
    REQUIRE(retrying.get().error == ErrorKind::Cancelled);

    REQUIRE(running.wait_for(1s) == std::future_status::ready);
    REQUIRE(running.get().error == ErrorKind::Cancelled);

    auto late = rig.dispatcher->execute(Command{CommandKind::Reboot, "P1", json::object()});
    REQUIRE(late.get().error == ErrorKind::Cancelled);
    REQUIRE(rig.api.count("shutdown") == 0);
}
