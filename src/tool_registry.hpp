#pragma once
#include "config.hpp"
#include "tool_spec.hpp"
#include "mcp_manager.hpp"
#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace ddcore {

using ToolFunction = std::function<std::string(const nlohmann::json&)>;

// Catalog of every callable tool: in-process builtins, manifest plugins,
// SKILL.md instruction tools and tools served over MCP. Plugin and
// instruction maps are rebuilt wholesale by scan_plugins(); the MCP side
// lives in the owned McpManager.
class ToolRegistry {
public:
    explicit ToolRegistry(const Config& cfg);
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    void register_builtin(const std::string& name, ToolFunction fn);
    void register_builtin(ToolSpec spec, ToolFunction fn);

    // Returns the number of plugin + instruction tools registered
    size_t scan_plugins();
    // Restarts every MCP server from the server file; returns servers up
    int scan_mcp_servers();
    // Both scans; returns per-source counts
    nlohmann::json reload();

    bool is_registered(const std::string& name);
    std::optional<ToolSpec> find(const std::string& name);
    std::vector<ToolSpec> list_specs();
    nlohmann::json list_all();

    // Never throws; failures come back as an error result
    DispatchResult dispatch(const std::string& name, const nlohmann::json& args);

    McpManager& mcp() { return mcp_; }
    const Config& config() const { return config_; }

    size_t builtin_count() const;
    size_t plugin_count() const;
    size_t instruction_count() const;

private:
    struct BuiltinEntry {
        ToolSpec spec;
        ToolFunction func;
    };

    Config config_;
    mutable std::mutex mutex_;
    std::map<std::string, BuiltinEntry> builtins_;
    std::map<std::string, ToolSpec> plugins_;
    std::map<std::string, ToolSpec> instructions_;
    McpManager mcp_;

    bool reserved_name(const std::string& name) const;
    std::vector<std::string> plugin_command(const PluginSource& src) const;

    DispatchResult run_plugin(const ToolSpec& spec, const nlohmann::json& args);
    DispatchResult run_instruction(const ToolSpec& spec, const nlohmann::json& args);
    DispatchResult run_mcp(const std::string& name, const nlohmann::json& args);
    DispatchResult run_builtin(const std::string& name, const ToolFunction& fn, const nlohmann::json& args);
};

} // namespace ddcore
