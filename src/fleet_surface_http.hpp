/*
 * File: src/fleet_surface_http.hpp
 * Project: Signage Fleet Sync
 * Purpose: Local HTTP surface: fleet queries and command submission
 * Notes:
 *  - One request per connection, closed after the response
 *  - POST /v1/commands answers once the command reaches a terminal result
 *  - Routing is separate from the socket so it can be driven directly
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "common/fleet_error.hpp"
#include "common/player.hpp"
#include "fleet_dispatcher.hpp"
#include "fleet_state.hpp"

namespace http = boost::beast::http;

using SurfaceRequest = http::request<http::string_body>;
using SurfaceResponse = http::response<http::string_body>;

inline http::status status_for(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::InvalidArgument:
        return http::status::bad_request;
    case ErrorKind::NotFound:
        return http::status::not_found;
    case ErrorKind::Rejected:
        return http::status::unprocessable_entity;
    case ErrorKind::Unreachable:
    case ErrorKind::Cancelled:
        return http::status::service_unavailable;
    case ErrorKind::Unauthorized:
    case ErrorKind::ServerError:
    case ErrorKind::Malformed:
        return http::status::bad_gateway;
    }
    return http::status::internal_server_error;
}

inline SurfaceResponse json_response(http::status status, unsigned version, const nlohmann::json &body)
{
    SurfaceResponse res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

class SurfaceRouter
{
    FleetHub &hub_;

public:
    using Reply = std::function<void(SurfaceResponse &&)>;

    explicit SurfaceRouter(FleetHub &hub) : hub_(hub) {}

    // Calls reply exactly once; synchronously for queries, later for commands
    void handle(const SurfaceRequest &req, Reply reply)
    {
        using nlohmann::json;
        std::string target(req.target());
        auto q = target.find('?');
        if (q != std::string::npos)
            target.resize(q);
        const auto version = req.version();

        // GET /health
        if (req.method() == http::verb::get && target == "/health")
            return reply(json_response(http::status::ok, version, hub_.health()));

        // GET /v1/players
        if (req.method() == http::verb::get && target == "/v1/players")
        {
            json out = json::array();
            for (const auto &p : hub_.cache().snapshot())
                out.push_back(player_json(p));
            return reply(json_response(http::status::ok, version, out));
        }

        // GET /v1/players/{id} and /v1/players/{id}/screenshot
        const std::string prefix = "/v1/players/";
        if (req.method() == http::verb::get && target.rfind(prefix, 0) == 0)
        {
            std::string rest = target.substr(prefix.size());
            const std::string suffix = "/screenshot";
            if (rest.size() > suffix.size() && rest.compare(rest.size() - suffix.size(), suffix.size(), suffix) == 0)
                return reply(screenshot(rest.substr(0, rest.size() - suffix.size()), version));
            if (rest.empty() || rest.find('/') != std::string::npos)
                return reply(not_found(version));
            auto player = hub_.cache().get(rest);
            if (!player)
                return reply(json_response(http::status::not_found, version,
                                           json{{"error", "unknown player"}, {"player_id", rest}}));
            return reply(json_response(http::status::ok, version, player_json(*player)));
        }

        // POST /v1/commands  body: {"kind": "...", "player_id": "...", ...}
        if (req.method() == http::verb::post && target == "/v1/commands")
        {
            Command cmd;
            try
            {
                auto body = json::parse(req.body());
                cmd = command_from_json(body);
            }
            catch (const FleetError &e)
            {
                return reply(rejected(version, e.kind(), e.what()));
            }
            catch (const json::exception &e)
            {
                return reply(rejected(version, ErrorKind::InvalidArgument, std::string("bad json: ") + e.what()));
            }
            hub_.dispatcher().submit(std::move(cmd), [reply, version](const CommandResult &r)
                                     {
                auto status = r.ok ? http::status::ok : status_for(*r.error);
                reply(json_response(status, version, result_to_json(r))); });
            return;
        }

        return reply(not_found(version));
    }

private:
    // Cached snapshot plus screenshot bookkeeping
    nlohmann::json player_json(const Player &p) const
    {
        auto j = player_to_json(p);
        if (auto shot = hub_.screenshots().latest(p.id))
            j["screenshot"] = {{"captured_at", FleetHub::iso8601(shot->captured_at)},
                               {"content_type", shot->content_type},
                               {"size_bytes", shot->bytes.size()},
                               {"failures", shot->failures}};
        else
            j["screenshot"] = nullptr;
        return j;
    }

    SurfaceResponse screenshot(const std::string &id, unsigned version) const
    {
        auto shot = hub_.screenshots().latest(id);
        if (!shot)
            return json_response(http::status::not_found, version,
                                 nlohmann::json{{"error", "no screenshot"}, {"player_id", id}});
        SurfaceResponse res{http::status::ok, version};
        res.set(http::field::content_type, shot->content_type.empty() ? "image/png" : shot->content_type);
        res.set("X-Captured-At", FleetHub::iso8601(shot->captured_at));
        res.body() = std::move(shot->bytes);
        res.prepare_payload();
        return res;
    }

    static SurfaceResponse rejected(unsigned version, ErrorKind kind, const std::string &message)
    {
        CommandResult r;
        r.error = kind;
        r.message = message;
        return json_response(status_for(kind), version, result_to_json(r));
    }

    static SurfaceResponse not_found(unsigned version)
    {
        return json_response(http::status::not_found, version, nlohmann::json{{"error", "not found"}});
    }
};

// -------- HTTP server --------

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    SurfaceRouter router_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, FleetHub &hub)
        : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), router_(hub)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("http surface cannot listen on " + ep.address().to_string() + ":" +
                                     std::to_string(ep.port()) + ": " + ec.message());
        do_accept();
    }

    void close()
    {
        boost::asio::post(acceptor_.get_executor(), [this]
                          {
            boost::system::error_code ignored;
            acceptor_.close(ignored); });
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_),
                               [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec)
                std::make_shared<Session>(std::move(socket), router_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::beast::tcp_stream stream;
        boost::beast::flat_buffer buffer;
        SurfaceRequest req;
        SurfaceRouter &router;

        Session(boost::asio::ip::tcp::socket &&s, SurfaceRouter &r)
            : stream(std::move(s)), router(r) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            stream.expires_after(std::chrono::seconds(30));
            http::async_read(stream, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (!ec)
                    self->handle(); });
        }

        void handle()
        {
            auto self = shared_from_this();
            spdlog::debug("surface: {} {}", std::string(http::to_string(req.method())), std::string(req.target()));
            router.handle(req, [self](SurfaceResponse &&res)
                          {
                // Command results arrive on a dispatcher thread
                auto sp = std::make_shared<SurfaceResponse>(std::move(res));
                boost::asio::dispatch(self->stream.get_executor(), [self, sp]
                                      { self->respond(sp); }); });
        }

        // Response is kept alive through async_write
        void respond(const std::shared_ptr<SurfaceResponse> &sp)
        {
            auto self = shared_from_this();
            sp->set(http::field::server, "fleet-sync");
            sp->keep_alive(false);
            stream.expires_after(std::chrono::seconds(30));
            http::async_write(stream, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }
    };
};
