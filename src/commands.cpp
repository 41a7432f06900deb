#include "commands.hpp"
#include "tool_registry.hpp"
#include "tools/builtin_tools.hpp"
#include <iostream>
#include <iomanip>

namespace ddcore {

// Registry with every source loaded, as the server would see it
static void load_all(ToolRegistry& tools, const Config& cfg) {
    register_builtin_tools(tools, cfg);
    tools.scan_plugins();
    tools.scan_mcp_servers();
}

int cmd_tools(const Config& cfg, bool as_json) {
    ToolRegistry tools(cfg);
    load_all(tools, cfg);

    if (as_json) {
        std::cout << tools.list_all().dump(2) << "\n";
        tools.mcp().shutdown_all();
        return 0;
    }

    auto specs = tools.list_specs();
    std::cout << "=== ddcore tools (" << specs.size() << ") ===\n";
    for (auto& spec : specs) {
        std::string desc = spec.description;
        if (desc.size() > 60) desc = desc.substr(0, 57) + "...";
        std::cout << std::left << std::setw(28) << spec.name
                  << std::setw(13) << kind_name(spec.kind())
                  << desc << "\n";
    }
    tools.mcp().shutdown_all();
    return 0;
}

int cmd_call(const Config& cfg, const std::string& name, const std::string& args_json) {
    nlohmann::json args = nlohmann::json::object();
    if (!args_json.empty()) {
        args = nlohmann::json::parse(args_json, nullptr, false);
        if (args.is_discarded()) {
            std::cerr << "Invalid JSON arguments: " << args_json << "\n";
            return 1;
        }
    }

    ToolRegistry tools(cfg);
    load_all(tools, cfg);

    auto result = tools.dispatch(name, args);
    if (result.ok) {
        std::cout << result.result << "\n";
    } else {
        std::cerr << "Error: " << result.result << "\n";
    }
    tools.mcp().shutdown_all();
    return result.ok ? 0 : 1;
}

int cmd_mcp(const Config& cfg) {
    McpManager mcp(cfg.mcp_connect_timeout * 1000, cfg.mcp_call_timeout * 1000);
    std::string path = cfg.mcp_config_path();
    int up = mcp.load_config(path);

    std::cout << "=== ddcore MCP servers ===\n";
    std::cout << "Config file  : " << path << "\n";
    std::cout << "Connected    : " << up << "/" << mcp.server_count() << "\n";

    auto status = mcp.server_status();
    for (auto& name : mcp.server_names()) {
        auto& s = status[name];
        std::cout << "  " << name << (s.value("connected", false) ? "  [up]" : "  [down]");
        if (s.contains("tools") && s["tools"].is_array()) {
            std::cout << "  " << s["tools"].size() << " tool(s)";
        }
        std::cout << "\n";
    }
    for (auto& entry : mcp.tools()) {
        std::cout << "    " << entry.name;
        if (entry.name != entry.remote_name) std::cout << " (" << entry.remote_name << ")";
        std::cout << "  <- " << entry.server << "\n";
    }

    mcp.shutdown_all();
    return 0;
}

int cmd_version() {
    std::cout << "ddcore " << DDCORE_VERSION << "\n";
    return 0;
}

} // namespace ddcore
