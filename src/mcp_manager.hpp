#pragma once
#include "mcp_client.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <functional>

namespace ddcore {

struct McpToolEntry {
    std::string name;          // name in the shared namespace
    std::string server;
    std::string remote_name;   // name the server knows it by
    std::string description;
    nlohmann::json input_schema;
};

// Owns one McpClient per configured server and merges their tools into a
// single namespace. A short name goes to the first server that offers it;
// later servers get mcp_<server>_<tool>.
class McpManager {
public:
    // Returns true when a name is taken outside the MCP namespace.
    using NameFilter = std::function<bool(const std::string&)>;

    explicit McpManager(int connect_timeout_ms = 15000, int call_timeout_ms = 30000);
    ~McpManager();

    McpManager(const McpManager&) = delete;
    McpManager& operator=(const McpManager&) = delete;

    void set_reserved_filter(NameFilter fn);

    // Connects every enabled server in order. Servers that fail stay known
    // so they can be reconnected. Returns the number that came up.
    int initialize_all(const std::vector<McpServerConfig>& configs);

    // Throws UnknownToolError, McpTimeoutError, McpError, ToolExecutionError.
    // timeout_ms < 0 uses the configured call timeout.
    std::string call_tool(const std::string& name, const nlohmann::json& args, int timeout_ms = -1);

    bool reconnect_server(const std::string& server);
    void shutdown_all();

    // Drops the tools of every server whose process is gone.
    void refresh();

    // Re-registers the server that owns name so it moves off a name now
    // reserved elsewhere. Must not be called with the reserved filter's
    // lock held.
    void yield_name(const std::string& name);

    int load_config(const std::string& path);
    int reload_config();

    nlohmann::json server_status();
    bool has_tool(const std::string& name) const;
    std::vector<McpToolEntry> tools() const;
    std::vector<std::string> server_names() const;
    size_t server_count() const;
    size_t connected_count();

private:
    int connect_timeout_ms_;
    int call_timeout_ms_;
    std::string config_path_;

    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::map<std::string, std::shared_ptr<McpClient>> clients_;
    std::map<std::string, McpToolEntry> tools_;
    NameFilter reserved_;

    std::vector<std::pair<std::string, std::shared_ptr<McpClient>>> snapshot_clients() const;
    void register_server_tools(const std::string& server, const std::vector<McpToolInfo>& tools);
    size_t drop_server_tools_locked(const std::string& server);
    bool name_taken_locked(const std::string& name) const;
    void on_tools_changed(const std::string& server);
};

} // namespace ddcore
