#include <iostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "gateway.hpp"
#include "commands.hpp"

static void print_usage() {
    std::cout << "Usage: ddcore [--config PATH] <command> [options]\n\n"
              << "Commands:\n"
              << "  serve [--host H] [--port P]  Start the HTTP API server\n"
              << "  tools [--json]               List every registered tool\n"
              << "  call <name> [json-args]      Dispatch one tool and print the result\n"
              << "  mcp                          Connect configured MCP servers and show status\n"
              << "  version                      Print version\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = ddcore::default_config_path();
    std::vector<std::string> words;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            words.push_back(a);
        }
    }

    if (words.empty()) {
        print_usage();
        return 1;
    }

    std::string cmd = words[0];
    std::vector<std::string> args(words.begin() + 1, words.end());

    if (cmd == "version" || cmd == "--version") {
        return ddcore::cmd_version();
    }
    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }

    ddcore::Config cfg = ddcore::Config::load(config_path);

    if (cmd == "serve") {
        std::string host = cfg.host;
        int port = cfg.port;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                try {
                    port = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid port: " << args[i] << "\n";
                    return 1;
                }
            }
        }
        return ddcore::cmd_serve(cfg, host, port);
    }
    else if (cmd == "tools") {
        bool as_json = !args.empty() && args[0] == "--json";
        return ddcore::cmd_tools(cfg, as_json);
    }
    else if (cmd == "call") {
        if (args.empty()) {
            std::cerr << "Usage: ddcore call <name> [json-args]\n";
            return 1;
        }
        return ddcore::cmd_call(cfg, args[0], args.size() > 1 ? args[1] : "");
    }
    else if (cmd == "mcp") {
        return ddcore::cmd_mcp(cfg);
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
