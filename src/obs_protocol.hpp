/*
 * File: src/obs_protocol.hpp
 * Project: OBS Relay
 * Purpose: obs-websocket v5 message framing and authentication
 * Notes:
 *  - auth = base64(sha256(base64(sha256(password + salt)) + challenge))
 *  - Event subscription mask is sent in every Identify so a reconnect re-subscribes
 * Last updated: 2026-10-17
 */

#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace obs
{
    enum Op : int
    {
        Hello = 0,
        Identify = 1,
        Identified = 2,
        Reidentify = 3,
        Event = 5,
        Request = 6,
        RequestResponse = 7,
        RequestBatch = 8,
        RequestBatchResponse = 9
    };

    constexpr int kRpcVersion = 1;

    // EventSubscription bits (obs-websocket 5.x)
    constexpr std::uint32_t kSubGeneral = 1u << 0;
    constexpr std::uint32_t kSubScenes = 1u << 2;
    constexpr std::uint32_t kSubTransitions = 1u << 4;
    constexpr std::uint32_t kSubOutputs = 1u << 6;
    constexpr std::uint32_t kSubMediaInputs = 1u << 8;
    constexpr std::uint32_t kStandingSubscriptions =
        kSubGeneral | kSubScenes | kSubTransitions | kSubOutputs | kSubMediaInputs;

    inline std::string base64(const unsigned char *data, std::size_t n)
    {
        std::string out(4 * ((n + 2) / 3), '\0');
        int len = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data, static_cast<int>(n));
        out.resize(static_cast<std::size_t>(len));
        return out;
    }

    inline std::string sha256_base64(const std::string &in)
    {
        unsigned char digest[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char *>(in.data()), in.size(), digest);
        return base64(digest, sizeof(digest));
    }

    inline std::string auth_response(const std::string &password, const std::string &salt,
                                     const std::string &challenge)
    {
        std::string secret = sha256_base64(password + salt);
        return sha256_base64(secret + challenge);
    }

    // Identify reply to a Hello message. Empty password + auth challenge yields no auth field,
    // the server then closes with 4009 which the supervisor treats as a failed attempt.
    inline nlohmann::json make_identify(const nlohmann::json &hello, const std::string &password,
                                        std::uint32_t subscriptions = kStandingSubscriptions)
    {
        nlohmann::json d{{"rpcVersion", kRpcVersion}, {"eventSubscriptions", subscriptions}};
        const auto &hd = hello.at("d");
        if (auto it = hd.find("authentication"); it != hd.end() && !password.empty())
        {
            d["authentication"] = auth_response(password, it->at("salt").get<std::string>(),
                                                it->at("challenge").get<std::string>());
        }
        return nlohmann::json{{"op", Identify}, {"d", d}};
    }

    inline nlohmann::json make_request(const std::string &type, const std::string &id,
                                       const nlohmann::json &data = nlohmann::json::object())
    {
        nlohmann::json d{{"requestType", type}, {"requestId", id}};
        if (!data.empty())
            d["requestData"] = data;
        return nlohmann::json{{"op", Request}, {"d", d}};
    }

    using RequestList = std::vector<std::pair<std::string, nlohmann::json>>;

    // Requests run in order and the batch stops at the first failure.
    inline nlohmann::json make_batch(const RequestList &requests, const std::string &id)
    {
        auto arr = nlohmann::json::array();
        for (const auto &[type, data] : requests)
        {
            nlohmann::json r{{"requestType", type}};
            if (!data.empty())
                r["requestData"] = data;
            arr.push_back(std::move(r));
        }
        return nlohmann::json{{"op", RequestBatch},
                              {"d", {{"requestId", id}, {"haltOnFailure", true}, {"executionType", 0}, {"requests", arr}}}};
    }
}
