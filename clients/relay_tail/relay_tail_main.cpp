/*
 * File: clients/relay_tail/relay_tail_main.cpp
 * Project: OBS Relay
 * Purpose: Prints every event pushed by the relay WebSocket, one JSON document per line
 * Notes:
 *  - relay_tail [--ws ws://host:port/ws] [--key K] [--only event1,event2] [--pretty]
 *  - Exits when the server closes the connection
 * Last updated: 2026-10-17
 */

#include <iostream>
#include <set>
#include <sstream>
#include <boost/asio.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

int main(int argc, char **argv)
{
    std::string ws_url = "ws://localhost:8090/ws";
    std::string key;
    std::set<std::string> only;
    bool pretty = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
        else if (a == "--key" && i + 1 < argc)
            key = argv[++i];
        else if (a == "--only" && i + 1 < argc)
        {
            std::stringstream ss(argv[++i]);
            std::string name;
            while (std::getline(ss, name, ','))
                if (!name.empty())
                    only.insert(name);
        }
        else if (a == "--pretty")
            pretty = true;
    }

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = ws_url.find("//");
        auto hp = pos == std::string::npos ? ws_url : ws_url.substr(pos + 2);
        auto slash = hp.find("/");
        std::string target = slash == std::string::npos ? "/" : hp.substr(slash);
        hp = hp.substr(0, slash);
        auto host = hp.substr(0, hp.find(":"));
        auto port = hp.size() > host.size() ? hp.substr(host.size() + 1) : std::string("80");
        if (!key.empty())
            target += (target.find('?') == std::string::npos ? "?token=" : "&token=") + key;

        auto const results = res.resolve(host, port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(host + ":" + port, target);
        std::cerr << "relay_tail: connected to " << host << ":" << port << "\n";

        boost::beast::flat_buffer buf;
        while (true)
        {
            boost::system::error_code ec;
            ws.read(buf, ec);
            if (ec == websocket::error::closed)
            {
                std::cerr << "relay_tail: closed by server (" << ws.reason().reason << ")\n";
                return 0;
            }
            if (ec)
                throw boost::system::system_error(ec);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (!j.is_object())
                continue;
            if (!only.empty() && !only.count(j.value("event", std::string())))
                continue;
            std::cout << (pretty ? j.dump(2) : j.dump()) << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "relay_tail: " << e.what() << "\n";
        return 1;
    }
}
