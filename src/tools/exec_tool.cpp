#include "builtin_tools.hpp"
#include "../process.hpp"
#include <algorithm>
#include <stdexcept>

namespace ddcore {

// Destructive patterns, matched as plain substrings
static bool is_dangerous(const std::string& cmd) {
    static const std::vector<std::string> blocked = {
        "rm -rf /", "rm -rf /*", "mkfs", "format c:", "format d:",
        "shutdown", "reboot", "halt", "poweroff",
        "dd if=/dev/zero", "dd if=/dev/random", ":(){ :|:& };:"
    };
    std::string lower = to_lower(cmd);
    for (auto& b : blocked) {
        if (lower.find(b) != std::string::npos) return true;
    }

    // rm with both -r and -f aimed at an absolute path
    size_t rm_pos = lower.find("rm ");
    if (rm_pos != std::string::npos &&
        lower.find("-r", rm_pos) != std::string::npos &&
        lower.find("-f", rm_pos) != std::string::npos) {
        std::string after_rm = lower.substr(rm_pos + 2);
        size_t i = 0;
        while (i < after_rm.size()) {
            while (i < after_rm.size() && (after_rm[i] == ' ' || after_rm[i] == '\t')) i++;
            if (i >= after_rm.size()) break;
            if (after_rm[i] == '-') {
                while (i < after_rm.size() && after_rm[i] != ' ' && after_rm[i] != '\t') i++;
            } else {
                return after_rm[i] == '/';
            }
        }
    }
    return false;
}

void register_exec_tool(ToolRegistry& reg, const Config& cfg) {
    std::string data_dir = cfg.data_path();
    size_t max_output = cfg.max_tool_output;

    ToolSpec spec;
    spec.name = "runCmd";
    spec.description = "Run a shell command (working directory defaults to the data directory).";
    spec.inputs = inputs_from_json(nlohmann::json::parse(R"JSON({
        "command": {"type": "string", "required": true},
        "cwd": {"type": "string"},
        "timeout": {"type": "integer", "description": "Seconds, at most 300"}
    })JSON"));
    spec.danger_level = "high";

    reg.register_builtin(std::move(spec), [data_dir, max_output](const nlohmann::json& args) -> std::string {
        std::string command = args.contains("command") && args["command"].is_string()
                              ? args["command"].get<std::string>() : "";
        std::string cwd = args.contains("cwd") && args["cwd"].is_string()
                          ? args["cwd"].get<std::string>() : data_dir;
        int timeout = args.contains("timeout") && args["timeout"].is_number_integer()
                      ? args["timeout"].get<int>() : 60;
        if (timeout > 300) timeout = 300;
        if (timeout < 1) timeout = 60;

        if (command.empty()) throw std::runtime_error("Command cannot be empty");
        if (is_dangerous(command)) {
            throw std::runtime_error("Dangerous command blocked: " + command);
        }

        std::error_code ec;
        fs::create_directories(cwd, ec);

        auto r = run_process({"/bin/sh", "-c", command}, "", cwd, timeout * 1000, max_output);
        if (r.timed_out) return "Command timed out after " + std::to_string(timeout) + "s";

        std::string result;
        if (!r.out.empty()) result += "STDOUT:\n" + r.out + "\n";
        if (!r.err.empty()) result += "STDERR:\n" + r.err + "\n";
        if (r.truncated) result += "...[truncated]\n";
        result += "Exit Code: " + std::to_string(r.exit_code);
        return result;
    });
}

} // namespace ddcore
