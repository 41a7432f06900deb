#pragma once
#include <string>
#include <variant>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace ddcore {

// Wire envelopes for newline-delimited JSON-RPC 2.0.

struct RpcRequest {
    int64_t id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct RpcResponse {
    int64_t id = 0;
    nlohmann::json result;               // null when error is set
    std::optional<nlohmann::json> error; // {code, message, data?}
};

struct RpcNotification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

using RpcMessage = std::variant<RpcRequest, RpcResponse, RpcNotification>;

std::string encode(const RpcRequest& req);
std::string encode(const RpcNotification& notif);
std::string encode(const RpcResponse& resp);

// Classifies one decoded line. Returns nullopt for anything that is valid
// JSON but not a recognizable envelope (e.g. a response with a string id).
// Throws nlohmann::json::parse_error for malformed text.
std::optional<RpcMessage> decode(const std::string& line);

} // namespace ddcore
