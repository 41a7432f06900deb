#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace ddcore {

struct McpServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;   // values may contain ${VAR}
    bool enabled = true;
};

struct Config {
    std::string data_dir = "~/.ddcore";
    std::vector<std::string> skill_dirs;       // empty = <data_dir>/skills
    std::string mcp_config;                    // empty = <data_dir>/mcp-servers.json
    std::vector<std::string> skill_executor;   // argv; empty = python3 <data_dir>/skills/skill-executor/execute.py
    std::map<std::string, std::string> runtimes = {
        {"python", "python3"},
        {"node", "node"}
    };

    int tool_timeout = 60;                     // seconds, per plugin/instruction call
    size_t max_tool_output = 512 * 1024;       // bytes
    int mcp_call_timeout = 30;                 // seconds
    int mcp_connect_timeout = 15;              // seconds

    int max_subagents = 5;
    int subagent_retention = 3600;             // seconds
    int subagent_sweep_interval = 300;         // seconds

    std::string host = "127.0.0.1";
    int port = 3001;

    // Derived helpers
    std::string data_path() const { return expand_path(data_dir); }
    std::vector<std::string> skill_paths() const;
    std::string mcp_config_path() const;
    std::vector<std::string> skill_executor_argv() const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

// Parses the declarative MCP server file. Order follows the file; disabled
// servers and servers without a command are dropped with a log line.
std::vector<McpServerConfig> load_mcp_servers(const std::string& path);
std::vector<McpServerConfig> parse_mcp_servers(const std::string& content);

} // namespace ddcore
