/*
 * File: src/fleet_surface_ws.hpp
 * Project: Signage Fleet Sync
 * Purpose: WebSocket broadcast of player changes
 * Notes:
 *  - Messages are {"topic": "player.<kind>", "payload": {...}}
 *  - A new client first gets a player.snapshot with the whole fleet
 *  - Writes are queued per session; a slow client never blocks the cache
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/player.hpp"
#include "fleet_cache.hpp"

namespace websocket = boost::beast::websocket;

inline std::string change_message(const PlayerChange &change)
{
    nlohmann::json payload;
    if (change.kind == ChangeKind::Removed)
        payload = {{"id", change.player.id}, {"name", change.player.name}};
    else
        payload = player_to_json(change.player);
    return nlohmann::json{{"topic", std::string("player.") + to_string(change.kind)}, {"payload", payload}}.dump();
}

inline std::string snapshot_message(const std::vector<Player> &players)
{
    nlohmann::json payload = nlohmann::json::array();
    for (const auto &p : players)
        payload.push_back(player_to_json(p));
    return nlohmann::json{{"topic", "player.snapshot"}, {"payload", payload}}.dump();
}

class WsServer
{
    struct Session;

    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    StateCache &cache_;
    int subscription_ = 0;

    // Outlives the server when sessions are torn down with the io_context
    struct SessionSet
    {
        std::mutex m;
        std::map<Session *, std::weak_ptr<Session>> live;
    };
    std::shared_ptr<SessionSet> sessions_ = std::make_shared<SessionSet>();

public:
    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, StateCache &cache)
        : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), cache_(cache)
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
            throw std::runtime_error("ws surface cannot listen on " + ep.address().to_string() + ":" +
                                     std::to_string(ep.port()) + ": " + ec.message());
        subscription_ = cache_.subscribe([this](const PlayerChange &change)
                                         { broadcast(change_message(change)); });
        do_accept();
    }

    ~WsServer() { cache_.unsubscribe(subscription_); }

    WsServer(const WsServer &) = delete;
    WsServer &operator=(const WsServer &) = delete;

    void broadcast(const std::string &msg)
    {
        auto shared = std::make_shared<const std::string>(msg);
        std::vector<std::shared_ptr<Session>> targets;
        {
            std::scoped_lock lk(sessions_->m);
            for (auto &kv : sessions_->live)
                if (auto s = kv.second.lock())
                    targets.push_back(std::move(s));
        }
        for (auto &s : targets)
            s->send(shared);
    }

    std::size_t clients()
    {
        std::scoped_lock lk(sessions_->m);
        return sessions_->live.size();
    }

    // Stops accepting and drops every client so the io_context can drain
    void close()
    {
        boost::asio::post(acceptor_.get_executor(), [this]
                          {
            boost::system::error_code ignored;
            acceptor_.close(ignored); });
        std::vector<std::shared_ptr<Session>> targets;
        {
            std::scoped_lock lk(sessions_->m);
            for (auto &kv : sessions_->live)
                if (auto s = kv.second.lock())
                    targets.push_back(std::move(s));
        }
        for (auto &s : targets)
            s->shutdown();
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
                std::make_shared<Session>(std::move(socket), *this)->run();
            do_accept(); });
    }

    void attach(const std::shared_ptr<Session> &s)
    {
        {
            std::scoped_lock lk(sessions_->m);
            sessions_->live[s.get()] = s;
        }
        // Registered before the snapshot is taken so no change falls in between
        s->send(std::make_shared<const std::string>(snapshot_message(cache_.snapshot())));
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::beast::tcp_stream> ws;
        boost::beast::flat_buffer buffer;
        WsServer &server;
        std::shared_ptr<SessionSet> registry;
        std::deque<std::shared_ptr<const std::string>> outbox; // strand only
        bool open = false;

        Session(boost::asio::ip::tcp::socket &&s, WsServer &sv)
            : ws(std::move(s)), server(sv), registry(sv.sessions_) {}

        ~Session()
        {
            std::scoped_lock lk(registry->m);
            registry->live.erase(this);
        }

        void run()
        {
            auto self = shared_from_this();
            boost::asio::dispatch(ws.get_executor(), [self]
                                  {
                self->ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
                self->ws.async_accept([self](boost::beast::error_code ec)
                                      {
                    if (ec)
                    {
                        spdlog::debug("ws: handshake failed: {}", ec.message());
                        return;
                    }
                    self->open = true;
                    self->server.attach(self);
                    self->do_read(); }); });
        }

        // Inbound frames are read only to notice the close
        void do_read()
        {
            auto self = shared_from_this();
            ws.async_read(buffer, [self](boost::beast::error_code ec, std::size_t)
                          {
                if (ec)
                {
                    self->open = false;
                    return;
                }
                self->buffer.consume(self->buffer.size());
                self->do_read(); });
        }

        void send(std::shared_ptr<const std::string> msg)
        {
            auto self = shared_from_this();
            boost::asio::post(ws.get_executor(), [self, msg]
                              {
                if (!self->open)
                    return;
                self->outbox.push_back(msg);
                if (self->outbox.size() == 1)
                    self->do_write(); });
        }

        void shutdown()
        {
            auto self = shared_from_this();
            boost::asio::post(ws.get_executor(), [self]
                              {
                self->open = false;
                boost::beast::get_lowest_layer(self->ws).close(); });
        }

        void do_write()
        {
            auto self = shared_from_this();
            ws.text(true);
            ws.async_write(boost::asio::buffer(*outbox.front()), [self](boost::beast::error_code ec, std::size_t)
                           {
                if (ec)
                {
                    self->open = false;
                    self->outbox.clear();
                    return;
                }
                self->outbox.pop_front();
                if (!self->outbox.empty())
                    self->do_write(); });
        }
    };
};
