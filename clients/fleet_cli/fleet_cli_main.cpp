/*
 * File: clients/fleet_cli/fleet_cli_main.cpp
 * Project: Signage Fleet Sync
 * Purpose: Command-line consumer of the hub's HTTP surface
 * Notes:
 *  - fleet_cli [--http URL] [--pretty] health|players|player <id>|command '<json>'
 *  - Exit code 0 on a 2xx answer, 1 otherwise
 * Last updated: 2026-10-18
 */

#include <iostream>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace
{
    int usage()
    {
        std::cerr << "usage: fleet_cli [--http URL] [--pretty] <health | players | player ID | command JSON>\n";
        return 1;
    }

    http::response<http::string_body> request(const std::string &base, http::verb verb, const std::string &target,
                                              const std::string &body)
    {
        auto pos = base.find("//");
        auto hp = pos == std::string::npos ? base : base.substr(pos + 2);
        auto slash = hp.find('/');
        if (slash != std::string::npos)
            hp.resize(slash);
        auto colon = hp.find(':');
        auto host = hp.substr(0, colon);
        auto port = colon == std::string::npos ? std::string("80") : hp.substr(colon + 1);

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, res.resolve(host, port));

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, host);
        if (!body.empty())
        {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        http::write(sock, req);

        boost::beast::flat_buffer buf;
        http::response<http::string_body> reply;
        http::read(sock, buf, reply);
        boost::system::error_code ignored;
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        return reply;
    }
} // namespace

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:8080";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--pretty")
            pretty = true;
        else
            args.push_back(a);
    }
    if (args.empty())
        return usage();

    http::verb verb = http::verb::get;
    std::string target;
    std::string body;
    if (args[0] == "health" && args.size() == 1)
        target = "/health";
    else if (args[0] == "players" && args.size() == 1)
        target = "/v1/players";
    else if (args[0] == "player" && args.size() == 2)
        target = "/v1/players/" + args[1];
    else if (args[0] == "command" && args.size() == 2)
    {
        auto j = json::parse(args[1], nullptr, false);
        if (j.is_discarded() || !j.is_object())
        {
            std::cerr << "[fleet_cli] command must be a JSON object\n";
            return 1;
        }
        verb = http::verb::post;
        target = "/v1/commands";
        body = j.dump();
    }
    else
        return usage();

    http::response<http::string_body> res;
    try
    {
        res = request(base, verb, target, body);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[fleet_cli] " << base << ": " << e.what() << "\n";
        return 1;
    }

    auto j = json::parse(res.body(), nullptr, false);
    if (j.is_discarded())
        std::cout << "[fleet_cli] status=" << res.result_int() << " raw body=" << res.body() << std::endl;
    else
        std::cout << (pretty ? j.dump(2) : j.dump()) << std::endl;

    return res.result_int() >= 200 && res.result_int() < 300 ? 0 : 1;
}
