#include "gateway.hpp"
#include "tool_registry.hpp"
#include "subagent_manager.hpp"
#include "http_server.hpp"
#include "tools/builtin_tools.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

namespace ddcore {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

int cmd_serve(const Config& cfg, const std::string& host, int port) {
    std::error_code ec;
    fs::create_directories(cfg.data_path(), ec);

    ToolRegistry tools(cfg);
    register_builtin_tools(tools, cfg);

    size_t local = tools.scan_plugins();
    int servers = tools.scan_mcp_servers();
    std::cerr << "[gateway] " << tools.builtin_count() << " builtin, " << local
              << " plugin/instruction tools, " << servers << " MCP server(s) up\n";

    SubagentManager agents(tools, cfg.max_subagents,
                           cfg.subagent_retention, cfg.subagent_sweep_interval);
    agents.start_sweeper();

    HttpServer http(tools, agents, host, port);
    http.start();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cerr << "[gateway] Ready on " << host << ":" << port << ". Ctrl+C to quit.\n";
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[gateway] Shutting down...\n";
    http.stop();
    agents.shutdown();
    tools.mcp().shutdown_all();
    std::cerr << "[gateway] Done.\n";
    return 0;
}

} // namespace ddcore
