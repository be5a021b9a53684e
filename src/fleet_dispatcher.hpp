/*
 * File: src/fleet_dispatcher.hpp
 * Project: Signage Fleet Sync
 * Purpose: Operator command execution against the fleet server
 * Notes:
 *  - FIFO per player, parallel across players up to the pool size
 *  - Transient failures retry with capped exponential backoff
 *  - Every submitted command gets exactly one terminal CommandResult
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "common/fleet_error.hpp"
#include "common/player.hpp"
#include "fleet_api.hpp"
#include "fleet_cache.hpp"

enum class CommandKind
{
    DeployContent,
    CreateAsset,
    DeleteAsset,
    ToggleAsset,
    CreateScheduleSlot,
    DeleteScheduleSlot,
    AddSlotItem,
    RemoveSlotItem,
    TriggerUpdate,
    SetPower,
    Reboot,
    Shutdown,
    PlaybackControl
};

inline const char *to_string(CommandKind kind)
{
    switch (kind)
    {
    case CommandKind::DeployContent:
        return "deploy_content";
    case CommandKind::CreateAsset:
        return "create_asset";
    case CommandKind::DeleteAsset:
        return "delete_asset";
    case CommandKind::ToggleAsset:
        return "toggle_asset";
    case CommandKind::CreateScheduleSlot:
        return "create_schedule_slot";
    case CommandKind::DeleteScheduleSlot:
        return "delete_schedule_slot";
    case CommandKind::AddSlotItem:
        return "add_slot_item";
    case CommandKind::RemoveSlotItem:
        return "remove_slot_item";
    case CommandKind::TriggerUpdate:
        return "trigger_update";
    case CommandKind::SetPower:
        return "set_power";
    case CommandKind::Reboot:
        return "reboot";
    case CommandKind::Shutdown:
        return "shutdown";
    case CommandKind::PlaybackControl:
        return "playback_control";
    }
    return "unknown";
}

inline std::optional<CommandKind> command_kind_from_string(const std::string &name)
{
    static const std::map<std::string, CommandKind> kinds{
        {"deploy_content", CommandKind::DeployContent},
        {"create_asset", CommandKind::CreateAsset},
        {"delete_asset", CommandKind::DeleteAsset},
        {"toggle_asset", CommandKind::ToggleAsset},
        {"create_schedule_slot", CommandKind::CreateScheduleSlot},
        {"delete_schedule_slot", CommandKind::DeleteScheduleSlot},
        {"add_slot_item", CommandKind::AddSlotItem},
        {"remove_slot_item", CommandKind::RemoveSlotItem},
        {"trigger_update", CommandKind::TriggerUpdate},
        {"set_power", CommandKind::SetPower},
        {"reboot", CommandKind::Reboot},
        {"shutdown", CommandKind::Shutdown},
        {"playback_control", CommandKind::PlaybackControl}};
    auto it = kinds.find(name);
    if (it == kinds.end())
        return std::nullopt;
    return it->second;
}

struct Command
{
    CommandKind kind = CommandKind::Reboot;
    std::string player_id;
    nlohmann::json params = nlohmann::json::object();
};

// Body of POST /v1/commands: {"kind": "...", "player_id": "...", <fields>}
inline Command command_from_json(const nlohmann::json &body)
{
    if (!body.is_object())
        throw FleetError(ErrorKind::InvalidArgument, "command must be a JSON object");
    auto kind_name = json_string(body, "kind");
    auto kind = command_kind_from_string(kind_name);
    if (!kind)
        throw FleetError(ErrorKind::InvalidArgument, "unknown command kind '" + kind_name + "'");
    Command cmd;
    cmd.kind = *kind;
    cmd.player_id = json_id(body, "player_id");
    cmd.params = body;
    cmd.params.erase("kind");
    cmd.params.erase("player_id");
    return cmd;
}

struct CommandResult
{
    bool ok = false;
    std::optional<ErrorKind> error;
    std::string message;
    int attempts = 0;
    bool noop = false;
    std::uint64_t sequence = 0;
    nlohmann::json response;
};

inline nlohmann::json result_to_json(const CommandResult &r)
{
    return nlohmann::json{
        {"ok", r.ok},
        {"error", r.error ? nlohmann::json(to_string(*r.error)) : nlohmann::json(nullptr)},
        {"message", r.message},
        {"attempts", r.attempts},
        {"noop", r.noop},
        {"sequence", r.sequence},
        {"response", r.response}};
}

struct DispatcherOptions
{
    std::size_t concurrency = 4;
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{500};
    std::chrono::milliseconds backoff_max{8000};
};

// Delay before attempt n+1 after n failed attempts: base * 2^(n-1), capped
inline std::chrono::milliseconds backoff_delay(const DispatcherOptions &opts, int failed_attempts)
{
    auto delay = opts.backoff_base;
    for (int i = 1; i < failed_attempts && delay < opts.backoff_max; ++i)
        delay *= 2;
    return std::min(delay, opts.backoff_max);
}

class CommandDispatcher
{
public:
    using Callback = std::function<void(const CommandResult &)>;

    CommandDispatcher(boost::asio::io_context &ioc, FleetApi &api, StateCache &cache, DispatcherOptions opts = {})
        : api_(api),
          cache_(cache),
          opts_(opts),
          strand_(boost::asio::make_strand(ioc)),
          pool_(opts.concurrency < 1 ? 1 : opts.concurrency) {}

    ~CommandDispatcher()
    {
        stop();
        pool_.join();
    }

    CommandDispatcher(const CommandDispatcher &) = delete;
    CommandDispatcher &operator=(const CommandDispatcher &) = delete;

    std::uint64_t submit(Command command, Callback done)
    {
        auto pc = std::make_shared<PendingCommand>();
        pc->command = std::move(command);
        pc->done = std::move(done);

        bool start_now = false;
        bool rejected = false;
        {
            std::scoped_lock lk(m_);
            pc->sequence = next_sequence_++;
            pc->generation = generation_.load();
            if (stopped_)
            {
                rejected = true;
            }
            else
            {
                auto &q = queues_[pc->command.player_id];
                q.push_back(pc);
                start_now = q.size() == 1;
            }
        }
        if (rejected)
            deliver(pc, cancelled(pc));
        else if (start_now)
            start(pc);
        return pc->sequence;
    }

    std::future<CommandResult> execute(Command command)
    {
        auto promise = std::make_shared<std::promise<CommandResult>>();
        auto fut = promise->get_future();
        submit(std::move(command), [promise](const CommandResult &r)
               { promise->set_value(r); });
        return fut;
    }

    // Queued commands resolve as Cancelled; in-flight ones resolve as Cancelled
    // when their request returns.
    void stop()
    {
        std::vector<PendingPtr> dropped;
        {
            std::scoped_lock lk(m_);
            if (stopped_)
                return;
            stopped_ = true;
            ++generation_;
            for (auto &kv : queues_)
            {
                auto &q = kv.second;
                if (q.size() > 1)
                {
                    dropped.insert(dropped.end(), q.begin() + 1, q.end());
                    q.erase(q.begin() + 1, q.end());
                }
            }
        }
        for (auto &pc : dropped)
            deliver(pc, cancelled(pc));
        boost::asio::post(strand_, [this]
                          {
            for (auto &t : timers_)
                t->cancel(); });
    }

    // Commands waiting or running for one player
    std::size_t queued(const std::string &player_id) const
    {
        std::scoped_lock lk(m_);
        auto it = queues_.find(player_id);
        return it == queues_.end() ? 0 : it->second.size();
    }

    const DispatcherOptions &options() const { return opts_; }

private:
    struct PendingCommand
    {
        std::uint64_t sequence = 0;
        std::uint64_t generation = 0;
        Command command;
        int attempts = 0;
        std::optional<std::uint64_t> patch_id;
        std::function<nlohmann::json()> call;
        Callback done;
    };
    using PendingPtr = std::shared_ptr<PendingCommand>;
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    struct Plan
    {
        std::function<nlohmann::json()> call;
        std::optional<PlayerPatch> patch;
        bool noop = false;
    };

    FleetApi &api_;
    StateCache &cache_;
    DispatcherOptions opts_;
    Strand strand_;
    boost::asio::thread_pool pool_;
    std::set<std::shared_ptr<boost::asio::steady_timer>> timers_; // touched on strand_ only

    mutable std::mutex m_;
    std::map<std::string, std::deque<PendingPtr>> queues_; // front is the running command
    std::uint64_t next_sequence_ = 1;
    bool stopped_ = false;
    std::atomic<std::uint64_t> generation_{0};

    // -------- result helpers --------

    static CommandResult failure(ErrorKind kind, const std::string &message)
    {
        CommandResult r;
        r.error = kind;
        r.message = message;
        return r;
    }

    static CommandResult cancelled(const PendingPtr &pc)
    {
        CommandResult r = failure(ErrorKind::Cancelled, "dispatcher stopped");
        r.attempts = pc->attempts;
        r.sequence = pc->sequence;
        return r;
    }

    bool stale(const PendingPtr &pc) const { return pc->generation != generation_.load(); }

    // -------- parameter extraction --------

    static FleetError missing(const char *key)
    {
        return FleetError(ErrorKind::InvalidArgument, std::string("missing required field '") + key + "'");
    }

    static std::string require_string(const nlohmann::json &p, const char *key)
    {
        auto it = p.find(key);
        if (it == p.end() || it->is_null())
            throw missing(key);
        if (it->is_number_integer())
            return json_id(p, key);
        if (!it->is_string() || it->get<std::string>().empty())
            throw FleetError(ErrorKind::InvalidArgument, std::string("field '") + key + "' must be a non-empty string");
        return it->get<std::string>();
    }

    static std::string optional_string(const nlohmann::json &p, const char *key)
    {
        auto it = p.find(key);
        if (it == p.end() || it->is_null())
            return {};
        if (!it->is_string())
            throw FleetError(ErrorKind::InvalidArgument, std::string("field '") + key + "' must be a string");
        return it->get<std::string>();
    }

    static bool require_bool(const nlohmann::json &p, const char *key)
    {
        auto it = p.find(key);
        if (it == p.end() || it->is_null())
            throw missing(key);
        if (!it->is_boolean())
            throw FleetError(ErrorKind::InvalidArgument, std::string("field '") + key + "' must be a boolean");
        return it->get<bool>();
    }

    static int require_duration(const nlohmann::json &p)
    {
        if (!p.contains("duration") || p["duration"].is_null())
            throw missing("duration");
        auto v = json_number(p, "duration");
        if (!v || !std::isfinite(*v) || *v < 0 || *v > std::numeric_limits<int>::max() || *v != std::floor(*v))
            throw FleetError(ErrorKind::InvalidArgument, "field 'duration' must be a non-negative integer");
        return static_cast<int>(*v);
    }

    static std::string require_one_of(const nlohmann::json &p, const char *key, std::initializer_list<const char *> allowed)
    {
        auto value = require_string(p, key);
        for (const char *a : allowed)
            if (value == a)
                return value;
        throw FleetError(ErrorKind::InvalidArgument, std::string("field '") + key + "' has unsupported value '" + value + "'");
    }

    // Accepts [1, 2, 3] or "1,2,3"
    static std::vector<int> parse_days(const nlohmann::json &p)
    {
        std::vector<int> days;
        auto it = p.find("days_of_week");
        if (it == p.end() || it->is_null())
            return days;
        auto check = [](int d)
        {
            if (d < 0 || d > 7)
                throw FleetError(ErrorKind::InvalidArgument, "days_of_week entries must be 0-7");
            return d;
        };
        if (it->is_array())
        {
            for (const auto &d : *it)
            {
                if (!d.is_number_integer())
                    throw FleetError(ErrorKind::InvalidArgument, "days_of_week entries must be integers");
                days.push_back(check(d.get<int>()));
            }
            return days;
        }
        if (!it->is_string())
            throw FleetError(ErrorKind::InvalidArgument, "days_of_week must be a list or a comma separated string");
        std::stringstream ss(it->get<std::string>());
        std::string part;
        while (std::getline(ss, part, ','))
        {
            auto first = part.find_first_not_of(' ');
            if (first == std::string::npos)
                continue;
            try
            {
                days.push_back(check(std::stoi(part.substr(first))));
            }
            catch (const std::logic_error &)
            {
                throw FleetError(ErrorKind::InvalidArgument, "days_of_week has a non-numeric entry '" + part + "'");
            }
        }
        return days;
    }

    static std::size_t count_assets(const Player &p, const std::string &name, const std::string &uri)
    {
        return static_cast<std::size_t>(std::count_if(p.assets.begin(), p.assets.end(), [&](const Asset &a)
                                                      { return a.name == name && a.uri == uri; }));
    }

    static std::size_t count_slots(const Player &p, const std::string &name)
    {
        return static_cast<std::size_t>(std::count_if(p.slots.begin(), p.slots.end(), [&](const ScheduleSlot &s)
                                                      { return s.name == name; }));
    }

    static std::size_t count_items(const Player &p, const std::string &slot_id, const std::string &asset_id)
    {
        const ScheduleSlot *slot = p.find_slot(slot_id);
        if (!slot)
            return 0;
        return static_cast<std::size_t>(std::count_if(slot->items.begin(), slot->items.end(), [&](const SlotItem &i)
                                                      { return i.asset_id == asset_id; }));
    }

    static ScheduleSlot *mutable_slot(Player &p, const std::string &slot_id)
    {
        for (auto &s : p.slots)
            if (s.id == slot_id)
                return &s;
        return nullptr;
    }

    // -------- validation and planning --------

    // Validates against the cached model; throws FleetError for bad input
    Plan make_plan(const PendingPtr &pc)
    {
        const Command &cmd = pc->command;
        const std::string pid = cmd.player_id;
        const auto &p = cmd.params;
        if (pid.empty())
            throw missing("player_id");

        auto visible = cache_.get(pid);
        if (!visible)
            throw FleetError(ErrorKind::NotFound, "unknown player " + pid);
        const Player confirmed = cache_.confirmed(pid).value_or(*visible);
        const std::string pending_id = "pending-" + std::to_string(pc->sequence);

        Plan plan;
        switch (cmd.kind)
        {
        case CommandKind::DeployContent:
        {
            auto media = require_string(p, "media_file_id");
            plan.call = [this, pid, media]
            { return api_.deployContent(pid, media); };
            break;
        }
        case CommandKind::CreateAsset:
        {
            AssetSpec spec;
            spec.name = require_string(p, "name");
            spec.uri = require_string(p, "uri");
            spec.duration = require_duration(p);
            spec.mimetype = require_one_of(p, "mimetype", {"webpage", "image", "video"});
            const auto baseline = count_assets(confirmed, spec.name, spec.uri);
            plan.patch = PlayerPatch{
                "create asset " + spec.name,
                [spec, pending_id](Player &pl)
                { pl.assets.push_back(Asset{pending_id, spec.name, spec.uri, spec.mimetype, spec.duration, true}); },
                [spec, baseline](const Player &pl)
                { return count_assets(pl, spec.name, spec.uri) > baseline; }};
            plan.call = [this, pid, spec]
            { return api_.createAsset(pid, spec); };
            break;
        }
        case CommandKind::DeleteAsset:
        {
            auto aid = require_string(p, "asset_id");
            if (!visible->find_asset(aid))
                throw FleetError(ErrorKind::NotFound, "player " + pid + " has no asset " + aid);
            plan.patch = PlayerPatch{
                "delete asset " + aid,
                [aid](Player &pl)
                {
                    pl.assets.erase(std::remove_if(pl.assets.begin(), pl.assets.end(), [&](const Asset &a)
                                                   { return a.id == aid; }),
                                    pl.assets.end());
                },
                [aid](const Player &pl)
                { return pl.find_asset(aid) == nullptr; }};
            plan.call = [this, pid, aid]
            { return api_.deleteAsset(pid, aid); };
            break;
        }
        case CommandKind::ToggleAsset:
        {
            auto aid = require_string(p, "asset_id");
            bool enabled = require_bool(p, "is_enabled");
            const Asset *asset = visible->find_asset(aid);
            if (!asset)
                throw FleetError(ErrorKind::NotFound, "player " + pid + " has no asset " + aid);
            if (asset->enabled == enabled)
            {
                plan.noop = true;
                break;
            }
            plan.patch = PlayerPatch{
                std::string(enabled ? "enable" : "disable") + " asset " + aid,
                [aid, enabled](Player &pl)
                {
                    for (auto &a : pl.assets)
                        if (a.id == aid)
                            a.enabled = enabled;
                },
                [aid, enabled](const Player &pl)
                {
                    const Asset *a = pl.find_asset(aid);
                    return a == nullptr || a->enabled == enabled;
                }};
            plan.call = [this, pid, aid, enabled]
            { return api_.toggleAsset(pid, aid, enabled); };
            break;
        }
        case CommandKind::CreateScheduleSlot:
        {
            SlotSpec spec;
            spec.name = require_string(p, "name");
            spec.slot_type = require_one_of(p, "slot_type", {"default", "time", "event"});
            spec.start_time = optional_string(p, "start_time");
            spec.end_time = optional_string(p, "end_time");
            spec.days_of_week = parse_days(p);
            const auto baseline = count_slots(confirmed, spec.name);
            plan.patch = PlayerPatch{
                "create slot " + spec.name,
                [spec, pending_id](Player &pl)
                {
                    ScheduleSlot s;
                    s.id = pending_id;
                    s.name = spec.name;
                    s.slot_type = spec.slot_type;
                    s.start_time = spec.start_time;
                    s.end_time = spec.end_time;
                    s.days_of_week = spec.days_of_week;
                    pl.slots.push_back(std::move(s));
                },
                [spec, baseline](const Player &pl)
                { return count_slots(pl, spec.name) > baseline; }};
            plan.call = [this, pid, spec]
            { return api_.createScheduleSlot(pid, spec); };
            break;
        }
        case CommandKind::DeleteScheduleSlot:
        {
            auto sid = require_string(p, "slot_id");
            if (!visible->find_slot(sid))
                throw FleetError(ErrorKind::NotFound, "player " + pid + " has no schedule slot " + sid);
            plan.patch = PlayerPatch{
                "delete slot " + sid,
                [sid](Player &pl)
                {
                    pl.slots.erase(std::remove_if(pl.slots.begin(), pl.slots.end(), [&](const ScheduleSlot &s)
                                                  { return s.id == sid; }),
                                   pl.slots.end());
                },
                [sid](const Player &pl)
                { return pl.find_slot(sid) == nullptr; }};
            plan.call = [this, pid, sid]
            { return api_.deleteScheduleSlot(pid, sid); };
            break;
        }
        case CommandKind::AddSlotItem:
        {
            auto sid = require_string(p, "slot_id");
            auto aid = require_string(p, "asset_id");
            if (!visible->find_slot(sid))
                throw FleetError(ErrorKind::NotFound, "player " + pid + " has no schedule slot " + sid);
            if (!visible->find_asset(aid))
                throw FleetError(ErrorKind::NotFound, "player " + pid + " has no asset " + aid);
            const auto baseline = count_items(confirmed, sid, aid);
            plan.patch = PlayerPatch{
                "add " + aid + " to slot " + sid,
                [sid, aid, pending_id](Player &pl)
                {
                    if (auto *slot = mutable_slot(pl, sid))
                        slot->items.push_back(SlotItem{pending_id, aid});
                },
                [sid, aid, baseline](const Player &pl)
                { return pl.find_slot(sid) == nullptr || count_items(pl, sid, aid) > baseline; }};
            plan.call = [this, pid, sid, aid]
            { return api_.addSlotItem(pid, sid, aid); };
            break;
        }
        case CommandKind::RemoveSlotItem:
        {
            auto sid = require_string(p, "slot_id");
            auto iid = require_string(p, "item_id");
            const ScheduleSlot *slot = visible->find_slot(sid);
            if (!slot)
                throw FleetError(ErrorKind::NotFound, "player " + pid + " has no schedule slot " + sid);
            bool present = std::any_of(slot->items.begin(), slot->items.end(), [&](const SlotItem &i)
                                       { return i.id == iid; });
            if (!present)
                throw FleetError(ErrorKind::NotFound, "slot " + sid + " has no item " + iid);
            auto without_item = [sid, iid](const Player &pl)
            {
                const ScheduleSlot *s = pl.find_slot(sid);
                return s == nullptr || std::none_of(s->items.begin(), s->items.end(), [&](const SlotItem &i)
                                                    { return i.id == iid; });
            };
            plan.patch = PlayerPatch{
                "remove item " + iid + " from slot " + sid,
                [sid, iid](Player &pl)
                {
                    if (auto *s = mutable_slot(pl, sid))
                        s->items.erase(std::remove_if(s->items.begin(), s->items.end(), [&](const SlotItem &i)
                                                      { return i.id == iid; }),
                                       s->items.end());
                },
                without_item};
            plan.call = [this, pid, sid, iid]
            { return api_.removeSlotItem(pid, sid, iid); };
            break;
        }
        case CommandKind::SetPower:
        {
            bool on = require_bool(p, "on");
            if (!visible->cec.available)
                throw FleetError(ErrorKind::InvalidArgument, "player " + pid + " has no CEC control");
            if (visible->cec.tv_on && *visible->cec.tv_on == on)
            {
                plan.noop = true;
                break;
            }
            plan.patch = PlayerPatch{
                std::string("power ") + (on ? "on" : "off"),
                [on](Player &pl)
                { pl.cec.tv_on = on; },
                [on](const Player &pl)
                { return pl.cec.tv_on && *pl.cec.tv_on == on; }};
            plan.call = [this, pid, on]
            { return api_.setPower(pid, on); };
            break;
        }
        case CommandKind::TriggerUpdate:
            plan.call = [this, pid]
            { return api_.triggerUpdate(pid); };
            break;
        case CommandKind::Reboot:
            plan.call = [this, pid]
            { return api_.reboot(pid); };
            break;
        case CommandKind::Shutdown:
            plan.call = [this, pid]
            { return api_.shutdown(pid); };
            break;
        case CommandKind::PlaybackControl:
        {
            auto action = require_one_of(p, "command", {"next", "previous"});
            plan.call = [this, pid, action]
            { return api_.playbackControl(pid, action); };
            break;
        }
        }
        return plan;
    }

    // -------- execution --------

    void start(const PendingPtr &pc)
    {
        boost::asio::post(pool_, [this, pc]
                          { begin(pc); });
    }

    void begin(const PendingPtr &pc)
    {
        if (stale(pc))
            return finish(pc, cancelled(pc));

        Plan plan;
        try
        {
            plan = make_plan(pc);
            if (plan.noop)
            {
                CommandResult r;
                r.ok = true;
                r.noop = true;
                r.message = "already in the requested state";
                return finish(pc, r);
            }
            if (plan.patch)
                pc->patch_id = cache_.applyOptimisticPatch(pc->command.player_id, std::move(*plan.patch)).id;
        }
        catch (const FleetError &e)
        {
            return finish(pc, failure(e.kind(), e.what()));
        }
        pc->call = std::move(plan.call);
        attempt(pc);
    }

    void attempt(const PendingPtr &pc)
    {
        if (stale(pc))
            return finish(pc, cancelled(pc));

        ++pc->attempts;
        const char *kind = to_string(pc->command.kind);
        try
        {
            auto response = pc->call();
            if (stale(pc))
                return finish(pc, cancelled(pc));
            CommandResult r;
            r.ok = true;
            r.response = std::move(response);
            return finish(pc, r);
        }
        catch (const FleetError &e)
        {
            if (stale(pc))
                return finish(pc, cancelled(pc));
            if (is_transient(e.kind()) && pc->attempts < opts_.max_attempts)
            {
                auto delay = backoff_delay(opts_, pc->attempts);
                spdlog::warn("dispatch: {} on {} attempt {}/{} failed ({}), retrying in {} ms", kind,
                             pc->command.player_id, pc->attempts, opts_.max_attempts, e.what(), delay.count());
                return schedule_retry(pc, delay);
            }
            return finish(pc, failure(e.kind(), e.what()));
        }
        catch (const std::exception &e)
        {
            return finish(pc, failure(ErrorKind::Malformed, e.what()));
        }
    }

    void schedule_retry(const PendingPtr &pc, std::chrono::milliseconds delay)
    {
        boost::asio::post(strand_, [this, pc, delay]
                          {
            if (stale(pc))
                return finish(pc, cancelled(pc));
            auto timer = std::make_shared<boost::asio::steady_timer>(strand_, delay);
            timers_.insert(timer);
            timer->async_wait([this, pc, timer](boost::system::error_code ec)
                              {
                timers_.erase(timer);
                if (ec || stale(pc))
                    return finish(pc, cancelled(pc));
                boost::asio::post(pool_, [this, pc]
                                  { attempt(pc); }); }); });
    }

    void finish(const PendingPtr &pc, CommandResult result)
    {
        result.attempts = pc->attempts;
        result.sequence = pc->sequence;
        const auto &pid = pc->command.player_id;
        if (!result.ok && pc->patch_id)
            cache_.rollbackPatch(pid, *pc->patch_id);

        if (result.ok)
            spdlog::info("dispatch: {} on {} done after {} attempt(s){}", to_string(pc->command.kind), pid,
                         result.attempts, result.noop ? " (no change needed)" : "");
        else if (result.error == ErrorKind::Cancelled)
            spdlog::info("dispatch: {} on {} cancelled", to_string(pc->command.kind), pid);
        else
            spdlog::error("dispatch: {} on {} failed ({}): {}", to_string(pc->command.kind), pid,
                          to_string(*result.error), result.message);

        deliver(pc, result);

        PendingPtr next;
        {
            std::scoped_lock lk(m_);
            auto it = queues_.find(pid);
            if (it != queues_.end())
            {
                auto &q = it->second;
                if (!q.empty() && q.front() == pc)
                    q.pop_front();
                if (q.empty())
                    queues_.erase(it);
                else
                    next = q.front();
            }
        }
        if (next)
            start(next);
    }

    static void deliver(const PendingPtr &pc, const CommandResult &result)
    {
        if (!pc->done)
            return;
        try
        {
            pc->done(result);
        }
        catch (const std::exception &e)
        {
            spdlog::error("dispatch: result callback for #{} threw: {}", pc->sequence, e.what());
        }
    }
};
