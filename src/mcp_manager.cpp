#include "mcp_manager.hpp"
#include <iostream>

namespace ddcore {

McpManager::McpManager(int connect_timeout_ms, int call_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms), call_timeout_ms_(call_timeout_ms) {}

McpManager::~McpManager() {
    shutdown_all();
}

void McpManager::set_reserved_filter(NameFilter fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_ = std::move(fn);
}

// ── Connection management ──

int McpManager::initialize_all(const std::vector<McpServerConfig>& configs) {
    int ok = 0;
    for (auto& cfg : configs) {
        if (!cfg.enabled) {
            std::cerr << "[mcp] Skipping disabled server: " << cfg.name << "\n";
            continue;
        }

        auto client = std::make_shared<McpClient>(cfg, connect_timeout_ms_, call_timeout_ms_);
        client->set_on_tools_changed([this](const std::string& server) { on_tools_changed(server); });
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (clients_.count(cfg.name)) {
                std::cerr << "[mcp] Warning: duplicate server name " << cfg.name << ", skipping\n";
                continue;
            }
            clients_[cfg.name] = client;
            order_.push_back(cfg.name);
        }

        if (!client->connect()) {
            std::cerr << "[mcp] Failed to connect to server: " << cfg.name << "\n";
            continue;
        }
        try {
            auto tools = client->list_tools();
            register_server_tools(cfg.name, tools);
            ok++;
            std::cerr << "[mcp] Connected to server: " << cfg.name << " (" << tools.size() << " tools)\n";
        } catch (const std::exception& e) {
            std::cerr << "[mcp] Failed to list tools of " << cfg.name << ": " << e.what() << "\n";
        }
    }
    std::cerr << "[mcp] " << ok << "/" << configs.size() << " servers initialized\n";
    return ok;
}

bool McpManager::reconnect_server(const std::string& server) {
    std::shared_ptr<McpClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(server);
        if (it == clients_.end()) {
            std::cerr << "[mcp] Unknown server: " << server << "\n";
            return false;
        }
        client = it->second;
        drop_server_tools_locked(server);
    }

    client->disconnect();
    if (!client->connect()) {
        std::cerr << "[mcp] Reconnect failed: " << server << "\n";
        return false;
    }
    try {
        auto tools = client->list_tools();
        register_server_tools(server, tools);
        std::cerr << "[mcp] Reconnected to server: " << server << " (" << tools.size() << " tools)\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[mcp] Failed to list tools of " << server << ": " << e.what() << "\n";
        return false;
    }
}

void McpManager::shutdown_all() {
    std::map<std::string, std::shared_ptr<McpClient>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients.swap(clients_);
        tools_.clear();
        order_.clear();
    }
    for (auto& [name, client] : clients) {
        client->disconnect();
    }
}

void McpManager::refresh() {
    for (auto& [name, client] : snapshot_clients()) {
        if (client->connected()) continue;
        std::lock_guard<std::mutex> lock(mutex_);
        size_t dropped = drop_server_tools_locked(name);
        if (dropped > 0) {
            std::cerr << "[mcp] Server " << name << " is down, removed " << dropped << " tools\n";
        }
    }
}

void McpManager::yield_name(const std::string& name) {
    std::string server;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) return;
        server = it->second.server;
    }
    std::cerr << "[mcp] Tool name " << name << " is now reserved, re-registering " << server << "\n";
    on_tools_changed(server);
}

int McpManager::load_config(const std::string& path) {
    config_path_ = path;
    auto configs = load_mcp_servers(path);
    shutdown_all();
    return initialize_all(configs);
}

int McpManager::reload_config() {
    if (config_path_.empty()) {
        std::cerr << "[mcp] Warning: no server config loaded, nothing to reload\n";
        return 0;
    }
    return load_config(config_path_);
}

// ── Calls ──

std::string McpManager::call_tool(const std::string& name, const nlohmann::json& args, int timeout_ms) {
    std::shared_ptr<McpClient> client;
    std::string remote;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) throw UnknownToolError("Unknown MCP tool: " + name);
        auto cit = clients_.find(it->second.server);
        if (cit == clients_.end()) throw UnknownToolError("Unknown MCP tool: " + name);
        client = cit->second;
        remote = it->second.remote_name;
    }
    return client->call_tool(remote, args, timeout_ms < 0 ? call_timeout_ms_ : timeout_ms);
}

// ── Namespace ──

bool McpManager::name_taken_locked(const std::string& name) const {
    if (tools_.count(name)) return true;
    return reserved_ && reserved_(name);
}

void McpManager::register_server_tools(const std::string& server, const std::vector<McpToolInfo>& tools) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!clients_.count(server)) return;
    drop_server_tools_locked(server);

    for (auto& t : tools) {
        std::string name = t.name;
        if (name_taken_locked(name)) {
            name = "mcp_" + server + "_" + t.name;
            if (name_taken_locked(name)) {
                std::cerr << "[mcp] Warning: tool " << t.name << " from " << server
                          << " conflicts under both names, skipping\n";
                continue;
            }
            std::cerr << "[mcp] Tool " << t.name << " from " << server << " registered as " << name << "\n";
        }

        McpToolEntry entry;
        entry.name = name;
        entry.server = server;
        entry.remote_name = t.name;
        entry.description = t.description;
        entry.input_schema = t.input_schema;
        tools_[name] = std::move(entry);
    }
}

size_t McpManager::drop_server_tools_locked(const std::string& server) {
    size_t dropped = 0;
    for (auto it = tools_.begin(); it != tools_.end();) {
        if (it->second.server == server) {
            it = tools_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    return dropped;
}

void McpManager::on_tools_changed(const std::string& server) {
    std::shared_ptr<McpClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(server);
        if (it == clients_.end()) return;
        client = it->second;
    }
    auto tools = client->tools();
    register_server_tools(server, tools);
    std::cerr << "[mcp] Re-registered " << tools.size() << " tools from " << server << "\n";
}

// ── Snapshots ──

std::vector<std::pair<std::string, std::shared_ptr<McpClient>>> McpManager::snapshot_clients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, std::shared_ptr<McpClient>>> out;
    for (auto& name : order_) {
        auto it = clients_.find(name);
        if (it != clients_.end()) out.emplace_back(name, it->second);
    }
    return out;
}

nlohmann::json McpManager::server_status() {
    auto clients = snapshot_clients();

    std::map<std::string, std::vector<std::string>> names_by_server;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, entry] : tools_) names_by_server[entry.server].push_back(name);
    }

    nlohmann::json out = nlohmann::json::object();
    for (auto& [name, client] : clients) {
        out[name] = {
            {"connected", client->connected()},
            {"tools", names_by_server[name]},
            {"serverInfo", client->server_info()}
        };
    }
    return out;
}

bool McpManager::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

std::vector<McpToolEntry> McpManager::tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<McpToolEntry> out;
    for (auto& [_, entry] : tools_) out.push_back(entry);
    return out;
}

std::vector<std::string> McpManager::server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t McpManager::server_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

size_t McpManager::connected_count() {
    size_t n = 0;
    for (auto& [_, client] : snapshot_clients()) {
        if (client->connected()) n++;
    }
    return n;
}

} // namespace ddcore
