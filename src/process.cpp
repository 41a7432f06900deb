#include "process.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ddcore {

namespace {

void ignore_sigpipe() {
    // A child that dies mid-write must surface as EPIPE, not kill us.
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) return;
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool make_pipe(int fds[2]) {
    return pipe2(fds, O_CLOEXEC) == 0;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e;
        auto eq = kv.find('=');
        if (eq != std::string::npos && overrides.count(kv.substr(0, eq))) continue;
        out.push_back(std::move(kv));
    }
    for (auto& [k, v] : overrides) {
        out.push_back(k + "=" + v);
    }
    return out;
}

std::vector<char*> to_cstrings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(const_cast<char*>(s.c_str()));
    out.push_back(nullptr);
    return out;
}

[[noreturn]] void child_fail(const char* what, int code) {
    // Only async-signal-safe calls between fork and exec.
    ssize_t ignored = ::write(STDERR_FILENO, what, std::strlen(what));
    (void)ignored;
    _exit(code);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Reads everything currently available. Bytes beyond cap are read and
// dropped so the child never blocks on a full pipe.
void drain_capped(int fd, bool& open, std::string& buf, size_t cap, bool& truncated) {
    char tmp[4096];
    while (true) {
        ssize_t n = ::read(fd, tmp, sizeof(tmp));
        if (n > 0) {
            size_t got = static_cast<size_t>(n);
            size_t room = got;
            if (cap > 0) room = buf.size() < cap ? cap - buf.size() : 0;
            size_t take = std::min(room, got);
            buf.append(tmp, take);
            if (take < got) truncated = true;
            continue;
        }
        if (n == 0) { open = false; return; }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) open = false;
        return;
    }
}

} // namespace

// ── ChildProcess ─────────────────────────────────────────────────────

ChildProcess::~ChildProcess() {
    terminate();
    close_pipes();
}

bool ChildProcess::spawn(const std::vector<std::string>& argv,
                         const std::map<std::string, std::string>& env,
                         std::string& error) {
    if (argv.empty() || argv[0].empty()) {
        error = "no command specified";
        return false;
    }
    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(err_pipe)) {
        error = std::string("failed to create pipes: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return false;
    }

    // Everything the child needs is built before fork.
    std::vector<std::string> args = argv;
    std::vector<std::string> env_strings = build_environment(env);
    std::vector<char*> c_argv = to_cstrings(args);
    std::vector<char*> c_envp = to_cstrings(env_strings);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return false;
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvpe(c_argv[0], c_argv.data(), c_envp.data());
        child_fail("exec failed\n", 127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    set_nonblocking(stdout_fd_);
    set_nonblocking(stderr_fd_);
    stdout_open_ = true;
    stderr_open_ = true;
    reaped_ = false;
    out_buf_.clear();
    err_buf_.clear();
    return true;
}

bool ChildProcess::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    if (stdin_fd_ < 0) return false;

    std::string data = line + "\n";
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

bool ChildProcess::take_line(std::string& buf, std::string& line) {
    while (true) {
        auto pos = buf.find('\n');
        if (pos == std::string::npos) return false;
        line = buf.substr(0, pos);
        buf.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) return true;
    }
}

ChildProcess::ReadStatus ChildProcess::read_line(std::string& line, bool& is_stderr, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool dummy = false;

    while (true) {
        if (take_line(out_buf_, line)) { is_stderr = false; return ReadStatus::line; }
        if (take_line(err_buf_, line)) { is_stderr = true; return ReadStatus::line; }

        if (!stdout_open_) {
            if (!out_buf_.empty()) {
                line.swap(out_buf_);
                out_buf_.clear();
                if (!line.empty() && line.back() == '\r') line.pop_back();
                is_stderr = false;
                return ReadStatus::line;
            }
            return ReadStatus::closed;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return ReadStatus::timeout;

        pollfd fds[2];
        nfds_t n = 0;
        fds[n].fd = stdout_fd_;
        fds[n].events = POLLIN;
        fds[n].revents = 0;
        n++;
        if (stderr_open_) {
            fds[n].fd = stderr_fd_;
            fds[n].events = POLLIN;
            fds[n].revents = 0;
            n++;
        }

        int rc = ::poll(fds, n, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            stdout_open_ = false;
            continue;
        }
        if (rc == 0) return ReadStatus::timeout;

        if (fds[0].revents != 0) drain_capped(stdout_fd_, stdout_open_, out_buf_, 0, dummy);
        if (n > 1 && fds[1].revents != 0) drain_capped(stderr_fd_, stderr_open_, err_buf_, 0, dummy);
    }
}

bool ChildProcess::alive() {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (pid_ <= 0 || reaped_) return false;
    int status = 0;
    if (waitpid(pid_, &status, WNOHANG) == 0) return true;
    reaped_ = true;
    return false;
}

void ChildProcess::close_stdin() {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    close_fd(stdin_fd_);
}

void ChildProcess::terminate(int grace_ms) {
    close_stdin();

    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (pid_ <= 0 || reaped_) return;

    int status = 0;
    if (waitpid(pid_, &status, WNOHANG) != 0) {
        reaped_ = true;
        return;
    }

    kill(pid_, SIGTERM);
    for (int waited = 0; waited < grace_ms; waited += 50) {
        if (waitpid(pid_, &status, WNOHANG) != 0) {
            reaped_ = true;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // Force kill if still running
    kill(pid_, SIGKILL);
    waitpid(pid_, &status, 0);
    reaped_ = true;
}

void ChildProcess::close_pipes() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    stdout_open_ = false;
    stderr_open_ = false;
}

// ── One-shot runner ──────────────────────────────────────────────────

ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& input,
                          const std::string& cwd,
                          int timeout_ms,
                          size_t max_output) {
    if (argv.empty() || argv[0].empty()) {
        throw std::runtime_error("no command specified");
    }
    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(err_pipe)) {
        std::string msg = std::string("failed to create pipes: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw std::runtime_error(msg);
    }

    std::vector<std::string> args = argv;
    std::vector<char*> c_argv = to_cstrings(args);

    pid_t pid = fork();
    if (pid < 0) {
        std::string msg = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw std::runtime_error(msg);
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_fail("cannot change to working directory\n", 126);
        }
        execvp(c_argv[0], c_argv.data());
        child_fail("exec failed\n", 127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    set_nonblocking(in_fd);
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    ProcessResult result;
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    size_t written = 0;
    if (input.empty()) close_fd(in_fd);

    const auto started = std::chrono::steady_clock::now();

    while (true) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        if (timeout_ms > 0 && elapsed >= timeout_ms) {
            result.timed_out = true;
            break;
        }
        int wait_ms = 50;
        if (timeout_ms > 0) wait_ms = static_cast<int>(std::min<int64_t>(50, timeout_ms - elapsed));

        if (!out_open && !err_open) {
            int status = 0;
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid || r < 0) {
                result.exit_code = r == pid ? decode_status(status) : -1;
                exited = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(std::max(1, std::min(wait_ms, 10))));
            continue;
        }

        pollfd fds[3];
        nfds_t n = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) { in_idx = static_cast<int>(n); fds[n++] = {in_fd, POLLOUT, 0}; }
        if (out_open) { out_idx = static_cast<int>(n); fds[n++] = {out_fd, POLLIN, 0}; }
        if (err_open) { err_idx = static_cast<int>(n); fds[n++] = {err_fd, POLLIN, 0}; }

        int rc = ::poll(fds, n, wait_ms);
        if (rc < 0 && errno != EINTR) break;
        if (rc <= 0) continue;

        if (in_idx >= 0 && fds[in_idx].revents != 0) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                close_fd(in_fd);
            } else {
                ssize_t w = ::write(in_fd, input.data() + written, input.size() - written);
                if (w > 0) {
                    written += static_cast<size_t>(w);
                    if (written >= input.size()) close_fd(in_fd);
                } else if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    close_fd(in_fd);
                }
            }
        }
        if (out_idx >= 0 && fds[out_idx].revents != 0) {
            drain_capped(out_fd, out_open, result.out, max_output, result.truncated);
        }
        if (err_idx >= 0 && fds[err_idx].revents != 0) {
            bool err_truncated = false;
            drain_capped(err_fd, err_open, result.err, max_output, err_truncated);
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    if (!exited) {
        // Not killed here; the caller decides what a timeout means. Reap it
        // whenever it finishes so it does not linger as a zombie.
        std::thread([pid]() {
            int status = 0;
            waitpid(pid, &status, 0);
        }).detach();
    }
    return result;
}

} // namespace ddcore
