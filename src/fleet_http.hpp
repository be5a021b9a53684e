/*
 * File: src/fleet_http.hpp
 * Project: Signage Fleet Sync
 * Purpose: Boost.Beast client for the fleet manager REST API
 * Notes:
 *  - One request per call, token auth, per-request deadline
 *  - A 401 triggers exactly one token refresh and one replay
 *  - No other retries here; callers own their retry policy
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/fleet_error.hpp"
#include "common/player.hpp"
#include "fleet_api.hpp"

namespace http = boost::beast::http;

// -------- url helpers --------

struct BaseUrl
{
    std::string host;
    std::string port{"80"};
    std::string prefix; // path below the host, no trailing slash
};

// Accepts http://host[:port][/prefix]; trailing slashes are dropped
inline BaseUrl parse_base_url(const std::string &url)
{
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0)
        throw std::invalid_argument("base url must start with http:// (" + url + ")");

    std::string rest = url.substr(scheme.size());
    while (!rest.empty() && rest.back() == '/')
        rest.pop_back();

    BaseUrl b;
    auto slash = rest.find('/');
    std::string hostport = rest.substr(0, slash);
    if (slash != std::string::npos)
        b.prefix = rest.substr(slash);

    auto colon = hostport.find(':');
    b.host = hostport.substr(0, colon);
    if (colon != std::string::npos)
    {
        b.port = hostport.substr(colon + 1);
        bool digits = !b.port.empty() && b.port.size() <= 5;
        for (char c : b.port)
            digits = digits && std::isdigit(static_cast<unsigned char>(c));
        if (!digits || std::stoul(b.port) == 0 || std::stoul(b.port) > 65535)
            throw std::invalid_argument("base url has an invalid port (" + url + ")");
    }
    if (b.host.empty())
        throw std::invalid_argument("base url has no host (" + url + ")");
    return b;
}

inline std::string url_encode(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

// -------- response classification --------

struct HttpReply
{
    unsigned status = 0;
    std::string body;
    std::string content_type;
};

inline void check_status(unsigned status, const std::string &what)
{
    if (status >= 200 && status < 300)
        return;
    const std::string msg = what + ": HTTP " + std::to_string(status);
    if (status == 401 || status == 403)
        throw FleetError(ErrorKind::Unauthorized, msg);
    if (status == 404)
        throw FleetError(ErrorKind::NotFound, msg);
    if (status >= 500)
        throw FleetError(ErrorKind::ServerError, msg);
    if (status >= 400)
        throw FleetError(ErrorKind::Rejected, msg);
    throw FleetError(ErrorKind::Malformed, msg + " (unexpected status)");
}

// 204 and other empty bodies decode as an empty object
inline nlohmann::json parse_body(const HttpReply &reply, const std::string &what)
{
    if (reply.body.empty())
        return nlohmann::json::object();
    auto j = nlohmann::json::parse(reply.body, nullptr, false);
    if (j.is_discarded())
        throw FleetError(ErrorKind::Malformed, what + ": response is not JSON");
    return j;
}

// -------- client --------

class HttpFleetClient : public FleetApi
{
    BaseUrl base_;
    std::string username_;
    std::string password_;
    std::chrono::seconds timeout_;
    std::chrono::seconds screenshot_timeout_;

    mutable std::mutex token_mtx_;
    std::string token_;
    std::mutex refresh_mtx_;

public:
    HttpFleetClient(const std::string &base_url, std::string username, std::string password, std::string token,
                    std::chrono::seconds timeout = std::chrono::seconds(15),
                    std::chrono::seconds screenshot_timeout = std::chrono::seconds(10))
        : base_(parse_base_url(base_url)),
          username_(std::move(username)),
          password_(std::move(password)),
          timeout_(timeout),
          screenshot_timeout_(screenshot_timeout),
          token_(std::move(token)) {}

    std::string token() const
    {
        std::scoped_lock lk(token_mtx_);
        return token_;
    }

    // POST /api/auth/token/ with form credentials; a 400 means bad credentials.
    std::string obtainToken(const std::string &username, const std::string &password)
    {
        const std::string target = "/api/auth/token/";
        const std::string form = "username=" + url_encode(username) + "&password=" + url_encode(password);
        HttpReply reply = send(http::verb::post, target, form, "application/x-www-form-urlencoded", timeout_, "");

        if (reply.status == 400)
        {
            std::string msg = "invalid credentials";
            auto j = nlohmann::json::parse(reply.body, nullptr, false);
            if (j.is_object() && j.contains("non_field_errors") && j["non_field_errors"].is_array() &&
                !j["non_field_errors"].empty() && j["non_field_errors"][0].is_string())
                msg = j["non_field_errors"][0].get<std::string>();
            throw FleetError(ErrorKind::Unauthorized, "POST " + target + ": " + msg);
        }
        check_status(reply.status, "POST " + target);

        auto j = parse_body(reply, "POST " + target);
        if (!j.is_object() || !j.contains("token") || !j["token"].is_string())
            throw FleetError(ErrorKind::Malformed, "POST " + target + ": response without token");
        return j["token"].get<std::string>();
    }

    void authenticate() override
    {
        if (!username_.empty())
        {
            auto fresh = obtainToken(username_, password_);
            std::scoped_lock lk(token_mtx_);
            token_ = std::move(fresh);
            spdlog::info("fleet: authenticated as {}", username_);
            return;
        }
        if (token().empty())
            throw FleetError(ErrorKind::Unauthorized, "no token or credentials configured");
    }

    std::vector<PlayerListing> listPlayers() override
    {
        return decode_player_list(call(http::verb::get, "/api/players/"));
    }

    nlohmann::json getPlayerStatus(const std::string &player_id) override
    {
        return expect_object(call(http::verb::get, player_path(player_id) + "info/"), "player status");
    }

    nlohmann::json getCecStatus(const std::string &player_id) override
    {
        return expect_object(call(http::verb::get, player_path(player_id) + "cec-status/"), "cec status");
    }

    Screenshot getScreenshot(const std::string &player_id) override
    {
        const std::string target = player_path(player_id) + "screenshot/";
        HttpReply reply = exchange(http::verb::get, target, "", screenshot_timeout_);
        if (reply.body.empty())
            throw FleetError(ErrorKind::Malformed, "GET " + target + ": empty screenshot");
        Screenshot shot;
        shot.bytes = std::move(reply.body);
        if (!reply.content_type.empty())
            shot.content_type = reply.content_type;
        return shot;
    }

    nlohmann::json createAsset(const std::string &player_id, const AssetSpec &spec) override
    {
        nlohmann::json body{
            {"name", spec.name},
            {"uri", spec.uri},
            {"duration", std::to_string(spec.duration)},
            {"mimetype", spec.mimetype}};
        return call(http::verb::post, player_path(player_id) + "assets/", body);
    }

    nlohmann::json deleteAsset(const std::string &player_id, const std::string &asset_id) override
    {
        return call(http::verb::delete_, player_path(player_id) + "assets/" + url_encode(asset_id) + "/");
    }

    nlohmann::json toggleAsset(const std::string &player_id, const std::string &asset_id, bool enabled) override
    {
        return call(http::verb::patch, player_path(player_id) + "assets/" + url_encode(asset_id) + "/",
                    nlohmann::json{{"is_enabled", enabled}});
    }

    nlohmann::json createScheduleSlot(const std::string &player_id, const SlotSpec &spec) override
    {
        nlohmann::json body{{"slot_type", spec.slot_type}, {"name", spec.name}};
        if (!spec.start_time.empty())
            body["start_time"] = spec.start_time;
        if (!spec.end_time.empty())
            body["end_time"] = spec.end_time;
        if (!spec.days_of_week.empty())
            body["days_of_week"] = spec.days_of_week;
        return call(http::verb::post, player_path(player_id) + "schedule-slots/", body);
    }

    nlohmann::json deleteScheduleSlot(const std::string &player_id, const std::string &slot_id) override
    {
        return call(http::verb::delete_, slot_path(player_id, slot_id));
    }

    nlohmann::json addSlotItem(const std::string &player_id, const std::string &slot_id,
                               const std::string &asset_id) override
    {
        return call(http::verb::post, slot_path(player_id, slot_id) + "items/",
                    nlohmann::json{{"asset_id", asset_id}});
    }

    nlohmann::json removeSlotItem(const std::string &player_id, const std::string &slot_id,
                                  const std::string &item_id) override
    {
        return call(http::verb::delete_, slot_path(player_id, slot_id) + "items/" + url_encode(item_id) + "/");
    }

    nlohmann::json setPower(const std::string &player_id, bool on) override
    {
        return call(http::verb::post, player_path(player_id) + (on ? "cec-wake/" : "cec-standby/"));
    }

    nlohmann::json reboot(const std::string &player_id) override
    {
        return call(http::verb::post, player_path(player_id) + "reboot/");
    }

    nlohmann::json shutdown(const std::string &player_id) override
    {
        return call(http::verb::post, player_path(player_id) + "shutdown/");
    }

    nlohmann::json triggerUpdate(const std::string &player_id) override
    {
        return call(http::verb::post, player_path(player_id) + "update/");
    }

    nlohmann::json deployContent(const std::string &player_id, const std::string &media_file_id) override
    {
        return call(http::verb::post, "/api/deploy/",
                    nlohmann::json{{"player_id", player_id}, {"media_file_id", media_file_id}});
    }

    nlohmann::json playbackControl(const std::string &player_id, const std::string &command) override
    {
        return call(http::verb::post, player_path(player_id) + "playback/", nlohmann::json{{"command", command}});
    }

private:
    static std::string player_path(const std::string &player_id)
    {
        return "/api/players/" + url_encode(player_id) + "/";
    }

    static std::string slot_path(const std::string &player_id, const std::string &slot_id)
    {
        return player_path(player_id) + "schedule-slots/" + url_encode(slot_id) + "/";
    }

    static nlohmann::json expect_object(nlohmann::json j, const char *what)
    {
        if (!j.is_object())
            throw FleetError(ErrorKind::Malformed, std::string(what) + " is not a JSON object");
        return j;
    }

    bool can_reauthenticate() const { return !username_.empty(); }

    // Swaps in a fresh token unless another thread already replaced the rejected one
    void refresh_token(const std::string &rejected)
    {
        std::scoped_lock lk(refresh_mtx_);
        if (token() != rejected)
            return;
        auto fresh = obtainToken(username_, password_);
        std::scoped_lock tk(token_mtx_);
        token_ = std::move(fresh);
    }

    nlohmann::json call(http::verb verb, const std::string &target, const nlohmann::json &body = nullptr)
    {
        const std::string payload = body.is_null() ? std::string() : body.dump();
        HttpReply reply = exchange(verb, target, payload, timeout_);
        return parse_body(reply, std::string(http::to_string(verb)) + " " + target);
    }

    HttpReply exchange(http::verb verb, const std::string &target, const std::string &payload,
                       std::chrono::seconds timeout)
    {
        const std::string what = std::string(http::to_string(verb)) + " " + target;
        std::string used = token();
        HttpReply reply = send(verb, target, payload, "application/json", timeout, used);
        if (reply.status == 401 && can_reauthenticate())
        {
            spdlog::info("fleet: {} rejected the token, re-authenticating", what);
            refresh_token(used);
            reply = send(verb, target, payload, "application/json", timeout, token());
        }
        check_status(reply.status, what);
        return reply;
    }

    HttpReply send(http::verb verb, const std::string &target, const std::string &body,
                   const char *content_type, std::chrono::seconds timeout, const std::string &token) const
    {
        namespace beast = boost::beast;
        using tcp = boost::asio::ip::tcp;
        const std::string what = std::string(http::to_string(verb)) + " " + target;

        boost::asio::io_context ioc;
        tcp::resolver resolver{ioc};
        beast::error_code ec;
        auto const results = resolver.resolve(base_.host, base_.port, ec);
        if (ec)
            throw FleetError(ErrorKind::Unreachable, what + ": resolve failed: " + ec.message());

        http::request<http::string_body> req{verb, base_.prefix + target, 11};
        req.set(http::field::host, base_.host);
        req.set(http::field::user_agent, "fleet-sync " BOOST_BEAST_VERSION_STRING);
        req.set(http::field::accept, "application/json, image/*");
        if (!token.empty())
            req.set(http::field::authorization, "Token " + token);
        if (!body.empty())
        {
            req.set(http::field::content_type, content_type);
            req.body() = body;
        }
        req.prepare_payload();

        beast::tcp_stream stream{ioc};
        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(32 * 1024 * 1024);
        beast::error_code op_ec;
        const char *stage = "connect";

        // One deadline covers connect, write and read
        stream.expires_after(timeout);
        stream.async_connect(results, [&](beast::error_code e, const tcp::endpoint &)
                             {
            if (e) { op_ec = e; return; }
            stage = "write";
            http::async_write(stream, req, [&](beast::error_code we, std::size_t)
                              {
                if (we) { op_ec = we; return; }
                stage = "read";
                http::async_read(stream, buffer, parser, [&](beast::error_code re, std::size_t)
                                 { op_ec = re; }); }); });
        ioc.run();

        if (op_ec)
        {
            if (op_ec == beast::error::timeout)
                throw FleetError(ErrorKind::Unreachable, what + ": timed out during " + stage);
            throw FleetError(ErrorKind::Unreachable, what + ": " + stage + " failed: " + op_ec.message());
        }
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        auto &res = parser.get();
        HttpReply reply;
        reply.status = res.result_int();
        auto ct = res[http::field::content_type];
        reply.content_type.assign(ct.data(), ct.size());
        reply.body = std::move(res.body());
        spdlog::debug("fleet: {} -> {}", what, reply.status);
        return reply;
    }
};
