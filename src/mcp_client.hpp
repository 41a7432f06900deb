#pragma once
#include "config.hpp"
#include "json_rpc.hpp"
#include "mcp_errors.hpp"
#include "process.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <future>
#include <functional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace ddcore {

struct McpToolInfo {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// One live session with an MCP server over stdio. Requests may be issued
// from any thread; a single reader thread routes responses back to the
// waiting caller by id.
class McpClient {
public:
    using ToolsChangedFn = std::function<void(const std::string& server)>;

    explicit McpClient(const McpServerConfig& cfg,
                       int connect_timeout_ms = 15000,
                       int request_timeout_ms = 30000);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    // Spawns the server and performs the initialize handshake. Returns
    // false (with the process torn down) on any failure.
    bool connect();
    void disconnect();

    // Reconnects once if the session is down.
    bool ensure_connected();

    std::vector<McpToolInfo> list_tools();

    // Throws McpTimeoutError, McpError or ToolExecutionError.
    std::string call_tool(const std::string& tool_name, const nlohmann::json& args,
                          int timeout_ms = 30000);

    // Invoked from a background thread after a list_changed refresh.
    void set_on_tools_changed(ToolsChangedFn fn);

    const std::string& name() const { return config_.name; }
    bool connected();
    nlohmann::json server_info() const;
    std::vector<McpToolInfo> tools() const;
    size_t pending_count() const;

private:
    struct PendingRequest {
        std::promise<nlohmann::json> promise;
        std::chrono::steady_clock::time_point created;
    };

    McpServerConfig config_;
    int connect_timeout_ms_;
    int request_timeout_ms_;

    std::mutex lifecycle_mutex_;         // connect / disconnect
    std::mutex write_mutex_;             // allocate id + write
    mutable std::mutex pending_mutex_;
    mutable std::mutex state_mutex_;
    std::mutex refresh_mutex_;

    std::shared_ptr<ChildProcess> proc_;
    std::thread reader_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};

    int64_t next_id_ = 1;
    bool accepting_ = false;
    std::map<int64_t, std::shared_ptr<PendingRequest>> pending_;

    nlohmann::json server_info_ = nlohmann::json::object();
    std::vector<McpToolInfo> tools_;

    ToolsChangedFn on_tools_changed_;
    std::future<void> refresh_future_;
    std::atomic<bool> refresh_again_{false};

    std::shared_ptr<ChildProcess> process() const;
    nlohmann::json send_request(const std::string& method, const nlohmann::json& params,
                                int timeout_ms);
    void send_notification(const std::string& method,
                           const nlohmann::json& params = nlohmann::json::object());
    std::vector<McpToolInfo> fetch_tools();

    void reader_loop(std::shared_ptr<ChildProcess> proc);
    void handle_line(const std::string& line);
    void deliver(const RpcResponse& resp);
    void handle_notification(const RpcNotification& notif);
    void handle_server_request(const RpcRequest& req);
    void schedule_refresh();
    void fail_pending(const std::string& reason);
    void teardown_locked();
};

// Joins the content parts of a tools/call result into one string.
// Throws ToolExecutionError when the result carries isError: true.
std::string flatten_tool_result(const nlohmann::json& result);

} // namespace ddcore
