#pragma once
#include "config.hpp"
#include <string>

namespace ddcore {
// Runs the HTTP API until SIGINT/SIGTERM.
int cmd_serve(const Config& cfg, const std::string& host, int port);
} // namespace ddcore
