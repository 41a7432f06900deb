#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <sys/types.h>

namespace ddcore {

// A long-lived child process speaking line-oriented text over its stdio.
// write_line may be called from any thread; read_line belongs to a single
// reader thread.
class ChildProcess {
public:
    enum class ReadStatus { line, timeout, closed };

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // env entries are added on top of the inherited environment.
    bool spawn(const std::vector<std::string>& argv,
               const std::map<std::string, std::string>& env,
               std::string& error);

    bool write_line(const std::string& line);

    // Returns the next complete line from stdout or stderr (is_stderr tells
    // which). `closed` means stdout reached EOF and its buffer is drained.
    ReadStatus read_line(std::string& line, bool& is_stderr, int timeout_ms);

    bool alive();

    // Closes stdin, sends SIGTERM, waits up to grace_ms, then SIGKILL.
    // Leaves stdout/stderr open for the reader; see close_pipes().
    void terminate(int grace_ms = 3000);
    void close_pipes();

    pid_t pid() const { return pid_; }

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool stdout_open_ = false;
    bool stderr_open_ = false;
    bool reaped_ = false;
    std::string out_buf_;
    std::string err_buf_;
    std::mutex stdin_mutex_;
    std::mutex wait_mutex_;

    bool take_line(std::string& buf, std::string& line);
    void close_stdin();
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool truncated = false;
    std::string out;
    std::string err;
};

// One-shot execution: writes `input` to stdin, drains stdout/stderr until
// exit or timeout. Captured streams are capped at max_output bytes each.
// On timeout the child is left running and reaped in the background.
// Throws std::runtime_error if pipes or fork fail.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& input,
                          const std::string& cwd,
                          int timeout_ms,
                          size_t max_output);

} // namespace ddcore
