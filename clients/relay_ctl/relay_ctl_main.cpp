/*
 * File: clients/relay_ctl/relay_ctl_main.cpp
 * Project: OBS Relay
 * Purpose: Command-line HTTP client: sends one command and prints the reply
 * Notes:
 *  - relay_ctl [--http http://host:port] [--key K] [--pretty] <cmd> [name=value ...]
 *  - Values that parse as JSON (numbers, true/false) are sent typed, others as strings
 *  - Exit status 0 on ok, 1 on a relay error, 2 on usage or transport failure
 * Last updated: 2026-10-17
 */

#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>
#include <string>

namespace http = boost::beast::http;
using json = nlohmann::json;

static void usage()
{
    std::cerr << "usage: relay_ctl [--http http://host:port] [--key K] [--pretty] <cmd> [name=value ...]\n"
                 "       relay_ctl [--http ...] --get /v1/status|/v1/playlists|/v1/playlists/validate|/health\n";
}

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:8080";
    std::string key;
    std::string get_path;
    std::string cmd;
    json params = json::object();
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--key" && i + 1 < argc)
            key = argv[++i];
        else if (a == "--get" && i + 1 < argc)
            get_path = argv[++i];
        else if (a == "--pretty")
            pretty = true;
        else if (cmd.empty())
            cmd = a;
        else
        {
            auto eq = a.find('=');
            if (eq == std::string::npos || eq == 0)
            {
                usage();
                return 2;
            }
            auto value = a.substr(eq + 1);
            auto parsed = json::parse(value, nullptr, false);
            params[a.substr(0, eq)] = (parsed.is_discarded() || parsed.is_object() || parsed.is_array()) ? json(value) : parsed;
        }
    }
    if (cmd.empty() && get_path.empty())
    {
        usage();
        return 2;
    }
    if (key.empty())
        if (const char *env = std::getenv("API_KEY"))
            key = env;

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = base.find("//");
        auto hp = pos == std::string::npos ? base : base.substr(pos + 2);
        auto host = hp.substr(0, hp.find(":"));
        auto port = hp.size() > host.size() ? hp.substr(host.size() + 1) : std::string("80");
        auto results = res.resolve(host, port);

        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        http::request<http::string_body> req{get_path.empty() ? http::verb::post : http::verb::get,
                                             get_path.empty() ? "/v1/command" : get_path, 11};
        req.set(http::field::host, host);
        if (!key.empty())
            req.set(http::field::authorization, "Bearer " + key);
        if (get_path.empty())
        {
            req.set(http::field::content_type, "application/json");
            req.body() = json{{"cmd", cmd}, {"params", params}}.dump();
        }
        req.prepare_payload();
        http::write(sock, req);
        boost::beast::flat_buffer buf;
        http::response<http::string_body> resp;
        http::read(sock, buf, resp);

        boost::system::error_code ignored;
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);

        auto j = json::parse(resp.body(), nullptr, false);
        if (j.is_discarded())
        {
            std::cout << "[relay_ctl] status=" << resp.result_int() << " raw body=" << resp.body() << std::endl;
            return 2;
        }
        std::cout << (pretty ? j.dump(2) : j.dump()) << std::endl;
        if (j.contains("warning"))
            std::cerr << "[relay_ctl] warning: " << j["warning"].get<std::string>() << std::endl;
        return resp.result_int() < 300 ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[relay_ctl] " << base << ": " << e.what() << std::endl;
        return 2;
    }
}
