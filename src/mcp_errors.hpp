#pragma once
#include <stdexcept>
#include <string>

namespace ddcore {

// Protocol-level failure: a JSON-RPC error object, a write to a dead
// process, or a server process that exited with the call outstanding.
class McpError : public std::runtime_error {
public:
    McpError(int code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}
    int code() const { return code_; }
private:
    int code_;
};

// No response arrived within the caller's deadline.
class McpTimeoutError : public McpError {
public:
    explicit McpTimeoutError(const std::string& msg) : McpError(-32001, msg) {}
};

// The tool ran and reported isError: true.
class ToolExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnknownToolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ddcore
