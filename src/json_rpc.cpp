#include "json_rpc.hpp"

namespace ddcore {

std::string encode(const RpcRequest& req) {
    nlohmann::json j = {
        {"jsonrpc", "2.0"},
        {"id", req.id},
        {"method", req.method},
        {"params", req.params.is_null() ? nlohmann::json::object() : req.params}
    };
    return j.dump();
}

std::string encode(const RpcNotification& notif) {
    nlohmann::json j = {
        {"jsonrpc", "2.0"},
        {"method", notif.method},
        {"params", notif.params.is_null() ? nlohmann::json::object() : notif.params}
    };
    return j.dump();
}

std::string encode(const RpcResponse& resp) {
    nlohmann::json j = {
        {"jsonrpc", "2.0"},
        {"id", resp.id}
    };
    if (resp.error) j["error"] = *resp.error;
    else j["result"] = resp.result;
    return j.dump();
}

std::optional<RpcMessage> decode(const std::string& line) {
    auto j = nlohmann::json::parse(line);
    if (!j.is_object()) return std::nullopt;

    bool has_id = j.contains("id") && !j["id"].is_null();
    bool has_method = j.contains("method") && j["method"].is_string();

    if (has_id) {
        if (!j["id"].is_number_integer()) return std::nullopt;
        int64_t id = j["id"].get<int64_t>();

        if (has_method) {
            RpcRequest req;
            req.id = id;
            req.method = j["method"].get<std::string>();
            if (j.contains("params")) req.params = j["params"];
            return RpcMessage{std::move(req)};
        }

        RpcResponse resp;
        resp.id = id;
        if (j.contains("error") && !j["error"].is_null()) {
            resp.error = j["error"];
        } else if (j.contains("result")) {
            resp.result = j["result"];
        }
        return RpcMessage{std::move(resp)};
    }

    if (has_method) {
        RpcNotification notif;
        notif.method = j["method"].get<std::string>();
        if (j.contains("params")) notif.params = j["params"];
        return RpcMessage{std::move(notif)};
    }

    return std::nullopt;
}

} // namespace ddcore
