#include "mcp_client.hpp"
#include <iostream>

namespace ddcore {

namespace {

std::string string_field(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return fallback;
}

} // namespace

McpClient::McpClient(const McpServerConfig& cfg, int connect_timeout_ms, int request_timeout_ms)
    : config_(cfg), connect_timeout_ms_(connect_timeout_ms), request_timeout_ms_(request_timeout_ms) {}

McpClient::~McpClient() {
    disconnect();
}

// ── Lifecycle ──

bool McpClient::connect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (connected_) return true;

    // Clear whatever a previous session left behind
    teardown_locked();

    if (config_.command.empty()) {
        std::cerr << "[mcp:" << name() << "] No command specified\n";
        return false;
    }

    std::map<std::string, std::string> env;
    for (auto& [k, v] : config_.env) {
        env[k] = expand_env_vars(v);
    }
    std::vector<std::string> argv;
    argv.push_back(config_.command);
    argv.insert(argv.end(), config_.args.begin(), config_.args.end());

    auto proc = std::make_shared<ChildProcess>();
    std::string error;
    if (!proc->spawn(argv, env, error)) {
        std::cerr << "[mcp:" << name() << "] Failed to start " << config_.command << ": " << error << "\n";
        return false;
    }

    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        proc_ = proc;
        server_info_ = nlohmann::json::object();
    }
    {
        std::lock_guard<std::mutex> plock(pending_mutex_);
        accepting_ = true;
    }
    running_ = true;
    reader_ = std::thread(&McpClient::reader_loop, this, proc);

    try {
        auto result = send_request("initialize", {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", {{"roots", {{"listChanged", true}}}}},
            {"clientInfo", {{"name", "ddcore"}, {"version", DDCORE_VERSION}}}
        }, connect_timeout_ms_);

        {
            std::lock_guard<std::mutex> slock(state_mutex_);
            server_info_ = result.is_object() && result.contains("serverInfo")
                ? result["serverInfo"] : nlohmann::json::object();
        }
        send_notification("notifications/initialized");
    } catch (const std::exception& e) {
        std::cerr << "[mcp:" << name() << "] Initialize failed: " << e.what() << "\n";
        teardown_locked();
        return false;
    }

    connected_ = true;
    std::cerr << "[mcp:" << name() << "] Connected ("
              << string_field(server_info(), "name", "unknown server") << ")\n";
    return true;
}

void McpClient::disconnect() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        bool had_process = process() != nullptr;
        teardown_locked();
        if (had_process) std::cerr << "[mcp:" << name() << "] Disconnected\n";
    }

    // A list_changed refresh may still be finishing; it fails fast now
    // that every pending request has been released.
    std::future<void> refresh;
    {
        std::lock_guard<std::mutex> lock(refresh_mutex_);
        refresh = std::move(refresh_future_);
    }
    if (refresh.valid()) refresh.wait();
}

void McpClient::teardown_locked() {
    connected_ = false;
    running_ = false;

    auto proc = process();
    if (proc) proc->terminate(3000);
    if (reader_.joinable()) reader_.join();
    if (proc) proc->close_pipes();

    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        proc_.reset();
        tools_.clear();
    }
    fail_pending("client disconnected");
}

bool McpClient::ensure_connected() {
    if (connected()) return true;
    std::cerr << "[mcp:" << name() << "] Not connected, attempting reconnect\n";
    return connect();
}

bool McpClient::connected() {
    if (!connected_) return false;
    auto proc = process();
    return proc && proc->alive();
}

std::shared_ptr<ChildProcess> McpClient::process() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return proc_;
}

// ── Requests ──

nlohmann::json McpClient::send_request(const std::string& method, const nlohmann::json& params,
                                       int timeout_ms) {
    auto proc = process();
    if (!proc) throw McpError(-32000, "server " + name() + " is not running");

    auto pending = std::make_shared<PendingRequest>();
    pending->created = std::chrono::steady_clock::now();
    auto future = pending->promise.get_future();

    int64_t id = 0;
    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        id = next_id_++;
        {
            std::lock_guard<std::mutex> plock(pending_mutex_);
            if (!accepting_) throw McpError(-32000, "server " + name() + " is not running");
            pending_[id] = pending;
        }
        if (!proc->write_line(encode(RpcRequest{id, method, params}))) {
            std::lock_guard<std::mutex> plock(pending_mutex_);
            pending_.erase(id);
            throw McpError(-32000, "failed to send '" + method + "' to " + name());
        }
    }

    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        std::lock_guard<std::mutex> plock(pending_mutex_);
        // Still ours: abandon it. Otherwise the reader already claimed the
        // entry and the value is about to land.
        if (pending_.erase(id) > 0) {
            throw McpTimeoutError("'" + method + "' to " + name() + " timed out after "
                                  + std::to_string(timeout_ms) + "ms");
        }
    }
    return future.get();
}

void McpClient::send_notification(const std::string& method, const nlohmann::json& params) {
    auto proc = process();
    if (!proc || !proc->write_line(encode(RpcNotification{method, params}))) {
        throw McpError(-32000, "failed to send '" + method + "' to " + name());
    }
}

std::vector<McpToolInfo> McpClient::list_tools() {
    if (!ensure_connected()) {
        throw McpError(-32000, "server " + name() + " is not connected");
    }
    return fetch_tools();
}

std::vector<McpToolInfo> McpClient::fetch_tools() {
    auto result = send_request("tools/list", nlohmann::json::object(), request_timeout_ms_);

    std::vector<McpToolInfo> tools;
    if (result.is_object() && result.contains("tools") && result["tools"].is_array()) {
        for (auto& t : result["tools"]) {
            std::string tool_name = string_field(t, "name");
            if (tool_name.empty()) {
                std::cerr << "[mcp:" << name() << "] Warning: skipping tool without a name\n";
                continue;
            }
            McpToolInfo info;
            info.name = tool_name;
            info.description = string_field(t, "description");
            if (t.contains("inputSchema") && t["inputSchema"].is_object()) {
                info.input_schema = t["inputSchema"];
            } else {
                info.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
            }
            tools.push_back(std::move(info));
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    tools_ = tools;
    return tools;
}

std::string McpClient::call_tool(const std::string& tool_name, const nlohmann::json& args,
                                 int timeout_ms) {
    if (!ensure_connected()) {
        throw McpError(-32000, "server " + name() + " is not connected");
    }
    auto result = send_request("tools/call", {
        {"name", tool_name},
        {"arguments", args.is_null() ? nlohmann::json::object() : args}
    }, timeout_ms);
    return flatten_tool_result(result);
}

std::string flatten_tool_result(const nlohmann::json& result) {
    bool is_error = result.is_object() && result.contains("isError") && result["isError"].is_boolean()
                    && result["isError"].get<bool>();

    if (!result.is_object() || !result.contains("content") || !result["content"].is_array()) {
        if (is_error) throw ToolExecutionError("tool reported an error");
        return result.is_null() ? "" : result.dump();
    }

    std::string output;
    std::string error_text;
    for (auto& item : result["content"]) {
        std::string type = string_field(item, "type");
        std::string part;
        if (type == "text") {
            part = string_field(item, "text");
            if (!error_text.empty()) error_text += "\n";
            error_text += part;
        } else if (type == "image") {
            part = "[Image: " + string_field(item, "mimeType", "image/*") + "]";
        } else if (type == "resource") {
            std::string uri = item.contains("resource") ? string_field(item["resource"], "uri")
                                                        : string_field(item, "uri");
            part = "[Resource: " + uri + "]";
        } else {
            continue;
        }
        if (!output.empty()) output += "\n";
        output += part;
    }

    if (is_error) {
        throw ToolExecutionError(error_text.empty() ? "tool reported an error" : error_text);
    }
    return output;
}

// ── Reader thread ──

void McpClient::reader_loop(std::shared_ptr<ChildProcess> proc) {
    while (running_) {
        std::string line;
        bool is_stderr = false;
        auto status = proc->read_line(line, is_stderr, 200);
        if (status == ChildProcess::ReadStatus::timeout) continue;
        if (status == ChildProcess::ReadStatus::closed) break;

        if (is_stderr) {
            std::cerr << "[mcp:" << name() << "] " << line << "\n";
            continue;
        }
        handle_line(line);
    }

    bool unexpected = running_;
    connected_ = false;
    if (unexpected) {
        std::cerr << "[mcp:" << name() << "] Server process exited\n";
    }
    fail_pending(unexpected ? "server " + name() + " process exited" : "client disconnected");
}

void McpClient::handle_line(const std::string& line) {
    std::optional<RpcMessage> msg;
    try {
        msg = decode(line);
    } catch (const nlohmann::json::exception&) {
        std::cerr << "[mcp:" << name() << "] Skipping unparsable line: " << truncate_output(line, 200) << "\n";
        return;
    }
    if (!msg) {
        std::cerr << "[mcp:" << name() << "] Ignoring unrecognized message: " << truncate_output(line, 200) << "\n";
        return;
    }

    if (auto* resp = std::get_if<RpcResponse>(&*msg)) {
        deliver(*resp);
    } else if (auto* notif = std::get_if<RpcNotification>(&*msg)) {
        handle_notification(*notif);
    } else if (auto* req = std::get_if<RpcRequest>(&*msg)) {
        handle_server_request(*req);
    }
}

void McpClient::deliver(const RpcResponse& resp) {
    std::shared_ptr<PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(resp.id);
        if (it == pending_.end()) {
            std::cerr << "[mcp:" << name() << "] Dropping response for unknown or expired id " << resp.id << "\n";
            return;
        }
        pending = it->second;
        pending_.erase(it);
    }

    if (resp.error) {
        int code = -32603;
        if (resp.error->is_object() && resp.error->contains("code") && (*resp.error)["code"].is_number_integer()) {
            code = (*resp.error)["code"].get<int>();
        }
        std::string message = string_field(*resp.error, "message", "unknown error");
        pending->promise.set_exception(std::make_exception_ptr(McpError(code, message)));
    } else {
        pending->promise.set_value(resp.result);
    }
}

void McpClient::handle_notification(const RpcNotification& notif) {
    if (notif.method == "notifications/tools/list_changed") {
        std::cerr << "[mcp:" << name() << "] Tool list changed, refreshing\n";
        schedule_refresh();
    } else if (notif.method == "notifications/progress") {
        std::cerr << "[mcp:" << name() << "] Progress: " << notif.params.dump() << "\n";
    } else {
        std::cerr << "[mcp:" << name() << "] Ignoring notification " << notif.method << "\n";
    }
}

void McpClient::handle_server_request(const RpcRequest& req) {
    RpcResponse resp;
    resp.id = req.id;
    if (req.method == "roots/list") {
        resp.result = {{"roots", nlohmann::json::array()}};
    } else if (req.method == "ping") {
        resp.result = nlohmann::json::object();
    } else {
        resp.error = nlohmann::json{{"code", -32601}, {"message", "Method not found: " + req.method}};
    }
    auto proc = process();
    if (!proc || !proc->write_line(encode(resp))) {
        std::cerr << "[mcp:" << name() << "] Warning: failed to answer " << req.method << "\n";
    }
}

void McpClient::schedule_refresh() {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    if (refresh_future_.valid() &&
        refresh_future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        refresh_again_ = true;
        return;
    }

    refresh_future_ = std::async(std::launch::async, [this]() {
        do {
            refresh_again_ = false;
            if (!connected_) return;
            try {
                auto tools = fetch_tools();
                std::cerr << "[mcp:" << name() << "] Refreshed " << tools.size() << " tools\n";
            } catch (const std::exception& e) {
                std::cerr << "[mcp:" << name() << "] Warning: tool refresh failed: " << e.what() << "\n";
                return;
            }

            ToolsChangedFn cb;
            {
                std::lock_guard<std::mutex> slock(state_mutex_);
                cb = on_tools_changed_;
            }
            if (cb) {
                try {
                    cb(name());
                } catch (const std::exception& e) {
                    std::cerr << "[mcp:" << name() << "] Warning: tools-changed handler failed: " << e.what() << "\n";
                }
            }
        } while (refresh_again_);
    });
}

void McpClient::fail_pending(const std::string& reason) {
    std::map<int64_t, std::shared_ptr<PendingRequest>> orphaned;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        accepting_ = false;
        orphaned.swap(pending_);
    }
    for (auto& [id, pending] : orphaned) {
        pending->promise.set_exception(std::make_exception_ptr(McpError(-32000, reason)));
    }
}

// ── Accessors ──

void McpClient::set_on_tools_changed(ToolsChangedFn fn) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    on_tools_changed_ = std::move(fn);
}

nlohmann::json McpClient::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

std::vector<McpToolInfo> McpClient::tools() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tools_;
}

size_t McpClient::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

} // namespace ddcore
