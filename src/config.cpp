#include "config.hpp"
#include <fstream>
#include <iostream>

namespace ddcore {

std::vector<std::string> Config::skill_paths() const {
    if (skill_dirs.empty()) return {data_path() + "/skills"};
    std::vector<std::string> out;
    for (auto& d : skill_dirs) out.push_back(expand_path(d));
    return out;
}

std::string Config::mcp_config_path() const {
    if (mcp_config.empty()) return data_path() + "/mcp-servers.json";
    return expand_path(mcp_config);
}

std::vector<std::string> Config::skill_executor_argv() const {
    if (skill_executor.empty()) {
        return {"python3", data_path() + "/skills/skill-executor/execute.py"};
    }
    std::vector<std::string> argv;
    for (auto& a : skill_executor) argv.push_back(expand_path(a));
    return argv;
}

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["data_dir"] = data_dir;
    if (!skill_dirs.empty()) j["skill_dirs"] = skill_dirs;
    if (!mcp_config.empty()) j["mcp_config"] = mcp_config;
    if (!skill_executor.empty()) j["skill_executor"] = skill_executor;
    j["runtimes"] = runtimes;
    j["tool_timeout"] = tool_timeout;
    j["max_tool_output"] = max_tool_output;
    j["mcp_call_timeout"] = mcp_call_timeout;
    j["mcp_connect_timeout"] = mcp_connect_timeout;
    j["max_subagents"] = max_subagents;
    j["subagent_retention"] = subagent_retention;
    j["subagent_sweep_interval"] = subagent_sweep_interval;
    j["host"] = host;
    j["port"] = port;
    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    c.data_dir = j.value("data_dir", c.data_dir);
    if (j.contains("skill_dirs")) c.skill_dirs = parse_string_array(j["skill_dirs"]);
    c.mcp_config = j.value("mcp_config", c.mcp_config);
    if (j.contains("skill_executor")) c.skill_executor = parse_string_array(j["skill_executor"]);

    if (j.contains("runtimes") && j["runtimes"].is_object()) {
        for (auto& [k, v] : j["runtimes"].items()) {
            if (v.is_string()) c.runtimes[k] = v.get<std::string>();
        }
    }

    c.tool_timeout = j.value("tool_timeout", c.tool_timeout);
    c.max_tool_output = j.value("max_tool_output", c.max_tool_output);
    c.mcp_call_timeout = j.value("mcp_call_timeout", c.mcp_call_timeout);
    c.mcp_connect_timeout = j.value("mcp_connect_timeout", c.mcp_connect_timeout);
    c.max_subagents = j.value("max_subagents", c.max_subagents);
    c.subagent_retention = j.value("subagent_retention", c.subagent_retention);
    c.subagent_sweep_interval = j.value("subagent_sweep_interval", c.subagent_sweep_interval);
    c.host = j.value("host", c.host);
    c.port = j.value("port", c.port);

    if (c.max_subagents < 1) {
        std::cerr << "[config] Warning: max_subagents must be >= 1, using 1\n";
        c.max_subagents = 1;
    }
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] Warning: config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[config] Warning: failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

// ── MCP server file ──────────────────────────────────────────────────

std::vector<McpServerConfig> parse_mcp_servers(const std::string& content) {
    std::vector<McpServerConfig> configs;

    // ordered_json keeps servers in file order, which decides who owns a
    // contested short tool name.
    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(content);
    } catch (const std::exception& e) {
        std::cerr << "[config] Invalid JSON in MCP server config: " << e.what() << "\n";
        return configs;
    }
    if (!j.is_object()) return configs;

    const nlohmann::ordered_json* servers = nullptr;
    if (j.contains("servers")) servers = &j["servers"];
    else if (j.contains("mcpServers")) servers = &j["mcpServers"];
    if (!servers || !servers->is_object()) return configs;

    for (auto& [name, srv] : servers->items()) {
        if (!srv.is_object()) {
            std::cerr << "[config] Invalid config for MCP server " << name << "\n";
            continue;
        }
        if (srv.contains("command") && !srv["command"].is_string()) {
            std::cerr << "[config] Invalid config for MCP server " << name << ": command must be a string\n";
            continue;
        }
        if (srv.contains("enabled") && !srv["enabled"].is_boolean()) {
            std::cerr << "[config] Invalid config for MCP server " << name << ": enabled must be a boolean\n";
            continue;
        }
        McpServerConfig mcp;
        mcp.name = name;
        mcp.command = srv.value("command", "");
        mcp.enabled = srv.value("enabled", true);
        if (srv.contains("args") && srv["args"].is_array()) {
            for (auto& a : srv["args"]) {
                if (a.is_string()) mcp.args.push_back(a.get<std::string>());
            }
        }
        if (srv.contains("env") && srv["env"].is_object()) {
            for (auto& [ek, ev] : srv["env"].items()) {
                if (ev.is_string()) mcp.env[ek] = ev.get<std::string>();
                else mcp.env[ek] = ev.dump();
            }
        }

        if (!mcp.enabled) {
            std::cerr << "[config] Skipping disabled MCP server: " << name << "\n";
            continue;
        }
        if (mcp.command.empty()) {
            std::cerr << "[config] Invalid config for MCP server " << name << ": missing command\n";
            continue;
        }
        configs.push_back(std::move(mcp));
    }
    return configs;
}

std::vector<McpServerConfig> load_mcp_servers(const std::string& path) {
    if (!fs::exists(path)) {
        std::cerr << "[config] MCP server config not found: " << path << "\n";
        return {};
    }
    auto configs = parse_mcp_servers(read_file(path));
    std::cerr << "[config] Loaded " << configs.size() << " MCP server config(s)\n";
    return configs;
}

} // namespace ddcore
