/*
 * File: src/fleet_config.hpp
 * Project: Signage Fleet Sync
 * Purpose: Hub configuration: JSON file plus --flag value overrides
 * Notes:
 *  - Every violation raises ConfigError naming the offending key
 *  - Validation happens once, before anything touches the network
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "fleet_http.hpp" // parse_base_url

class ConfigError : public std::runtime_error
{
    std::string key_;

public:
    ConfigError(std::string key, const std::string &what)
        : std::runtime_error(key + ": " + what), key_(std::move(key)) {}

    const std::string &key() const noexcept { return key_; }
};

struct HubConfig
{
    std::string base_url;
    std::string username;
    std::string password;
    std::string token;

    int poll_interval_s = 30;
    int screenshot_interval_s = 10;
    int request_timeout_s = 15;
    int fetch_concurrency = 4;
    int command_concurrency = 4;
    int max_attempts = 3;
    int backoff_base_ms = 500;
    int backoff_max_ms = 8000;
    int removal_threshold = 3;
    int offline_after_misses = 2;

    std::string http_bind = "127.0.0.1:8080";
    std::string ws_bind = "127.0.0.1:8090";
    std::string log_level = "info";
};

// "host:port" -> {host, port}
inline std::pair<std::string, unsigned short> split_bind(const std::string &key, const std::string &bind)
{
    auto p = bind.rfind(':');
    if (p == std::string::npos || p == 0 || p + 1 == bind.size())
        throw ConfigError(key, "expected host:port, got '" + bind + "'");
    const std::string port = bind.substr(p + 1);
    unsigned long value = 0;
    try
    {
        std::size_t used = 0;
        value = std::stoul(port, &used);
        if (used != port.size())
            throw std::invalid_argument(port);
    }
    catch (const std::logic_error &)
    {
        throw ConfigError(key, "port '" + port + "' is not a number");
    }
    if (value == 0 || value > 65535)
        throw ConfigError(key, "port " + port + " out of range");
    return {bind.substr(0, p), static_cast<unsigned short>(value)};
}

// host must be an IP literal; the listeners bind it without resolving
inline boost::asio::ip::tcp::endpoint bind_endpoint(const std::string &key, const std::string &bind)
{
    auto [host, port] = split_bind(key, bind);
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(host, ec);
    if (ec)
        throw ConfigError(key, "host '" + host + "' is not an IP address");
    return boost::asio::ip::tcp::endpoint(address, port);
}

namespace config_detail
{
    inline void read_string(const nlohmann::json &j, const char *key, std::string &out)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return;
        if (!it->is_string())
            throw ConfigError(key, "must be a string");
        out = it->get<std::string>();
    }

    inline void read_int(const nlohmann::json &j, const char *key, int &out)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return;
        if (!it->is_number_integer())
            throw ConfigError(key, "must be an integer");
        out = it->get<int>();
    }

    inline int parse_int(const char *key, const std::string &text)
    {
        try
        {
            std::size_t used = 0;
            int v = std::stoi(text, &used);
            if (used == text.size())
                return v;
        }
        catch (const std::logic_error &)
        {
        }
        throw ConfigError(key, "'" + text + "' is not an integer");
    }
} // namespace config_detail

inline HubConfig config_from_json(const nlohmann::json &j, HubConfig cfg = {})
{
    using namespace config_detail;
    if (!j.is_object())
        throw ConfigError("config", "top level must be a JSON object");
    read_string(j, "base_url", cfg.base_url);
    read_string(j, "username", cfg.username);
    read_string(j, "password", cfg.password);
    read_string(j, "token", cfg.token);
    read_int(j, "poll_interval_s", cfg.poll_interval_s);
    read_int(j, "screenshot_interval_s", cfg.screenshot_interval_s);
    read_int(j, "request_timeout_s", cfg.request_timeout_s);
    read_int(j, "fetch_concurrency", cfg.fetch_concurrency);
    read_int(j, "command_concurrency", cfg.command_concurrency);
    read_int(j, "max_attempts", cfg.max_attempts);
    read_int(j, "backoff_base_ms", cfg.backoff_base_ms);
    read_int(j, "backoff_max_ms", cfg.backoff_max_ms);
    read_int(j, "removal_threshold", cfg.removal_threshold);
    read_int(j, "offline_after_misses", cfg.offline_after_misses);
    read_string(j, "http_bind", cfg.http_bind);
    read_string(j, "ws_bind", cfg.ws_bind);
    read_string(j, "log_level", cfg.log_level);
    return cfg;
}

inline HubConfig load_config(const std::string &path, HubConfig cfg = {})
{
    std::ifstream f(path);
    if (!f)
        throw ConfigError("config", "cannot open " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    auto j = nlohmann::json::parse(ss.str(), nullptr, false);
    if (j.is_discarded())
        throw ConfigError("config", path + " is not valid JSON");
    return config_from_json(j, std::move(cfg));
}

inline void validate(const HubConfig &cfg)
{
    if (cfg.base_url.empty())
        throw ConfigError("base_url", "is required");
    try
    {
        parse_base_url(cfg.base_url);
    }
    catch (const std::invalid_argument &e)
    {
        throw ConfigError("base_url", e.what());
    }
    if (cfg.token.empty())
    {
        if (cfg.username.empty())
            throw ConfigError("username", "either token or username and password are required");
        if (cfg.password.empty())
            throw ConfigError("password", "is required with username");
    }

    auto at_least_one = [](const char *key, int v)
    {
        if (v < 1)
            throw ConfigError(key, "must be >= 1, got " + std::to_string(v));
    };
    at_least_one("poll_interval_s", cfg.poll_interval_s);
    at_least_one("screenshot_interval_s", cfg.screenshot_interval_s);
    at_least_one("request_timeout_s", cfg.request_timeout_s);
    at_least_one("fetch_concurrency", cfg.fetch_concurrency);
    at_least_one("command_concurrency", cfg.command_concurrency);
    at_least_one("max_attempts", cfg.max_attempts);
    at_least_one("backoff_base_ms", cfg.backoff_base_ms);
    at_least_one("backoff_max_ms", cfg.backoff_max_ms);
    at_least_one("removal_threshold", cfg.removal_threshold);
    at_least_one("offline_after_misses", cfg.offline_after_misses);
    if (cfg.backoff_max_ms < cfg.backoff_base_ms)
        throw ConfigError("backoff_max_ms", "must not be below backoff_base_ms");

    bind_endpoint("http_bind", cfg.http_bind);
    bind_endpoint("ws_bind", cfg.ws_bind);

    static const char *levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    bool known = false;
    for (const char *l : levels)
        known = known || cfg.log_level == l;
    if (!known)
        throw ConfigError("log_level", "unknown level '" + cfg.log_level + "'");
}

// --config FILE is read first, then every other flag overrides it
inline HubConfig parse_args(int argc, char **argv)
{
    using config_detail::parse_int;
    HubConfig cfg;
    for (int i = 1; i < argc; ++i)
    {
        if (std::string(argv[i]) == "--config")
        {
            if (i + 1 >= argc)
                throw ConfigError("config", "--config needs a path");
            cfg = load_config(argv[i + 1], cfg);
        }
    }
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (i + 1 >= argc)
            throw ConfigError(a, "missing value");
        std::string v = argv[++i];
        if (a == "--config")
            continue;
        else if (a == "--base-url")
            cfg.base_url = v;
        else if (a == "--username")
            cfg.username = v;
        else if (a == "--password")
            cfg.password = v;
        else if (a == "--token")
            cfg.token = v;
        else if (a == "--http")
            cfg.http_bind = v;
        else if (a == "--ws")
            cfg.ws_bind = v;
        else if (a == "--log-level")
            cfg.log_level = v;
        else if (a == "--poll-interval")
            cfg.poll_interval_s = parse_int("poll_interval_s", v);
        else if (a == "--screenshot-interval")
            cfg.screenshot_interval_s = parse_int("screenshot_interval_s", v);
        else
            throw ConfigError(a, "unknown option");
    }
    validate(cfg);
    return cfg;
}
