#pragma once
#include "config.hpp"
#include <string>

namespace ddcore {
int cmd_tools(const Config& cfg, bool as_json);
int cmd_call(const Config& cfg, const std::string& name, const std::string& args_json);
int cmd_mcp(const Config& cfg);
int cmd_version();
} // namespace ddcore
