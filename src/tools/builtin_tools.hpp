#pragma once
#include "../tool_registry.hpp"
#include "../config.hpp"

namespace ddcore {

// readFile, writeFile, appendFile, listDir. Paths resolve inside the data dir.
void register_fs_tools(ToolRegistry& reg, const Config& cfg);

// runCmd: shell command with timeout and a destructive-pattern blocklist.
void register_exec_tool(ToolRegistry& reg, const Config& cfg);

inline void register_builtin_tools(ToolRegistry& reg, const Config& cfg) {
    register_fs_tools(reg, cfg);
    register_exec_tool(reg, cfg);
}

} // namespace ddcore
