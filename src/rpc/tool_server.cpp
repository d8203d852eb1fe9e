#include "tool_server.hpp"
#include "line_framer.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace autoship {

namespace {

constexpr int kPollSliceMs = 100;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Inherited environment with the overrides applied, as owned strings.
std::vector<std::string> build_environment(
        const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& kv : overrides) {
            if (kv.first == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.push_back(std::move(entry));
    }
    for (const auto& kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

// Waits for readability on fd in short slices so the stop flag is honoured.
// Returns false once the caller should stop reading.
bool wait_readable(int fd, const std::atomic<bool>& stopping) {
    while (!stopping.load()) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, kPollSliceMs);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (ret > 0) return true;
    }
    return false;
}

} // namespace

std::string locate_server_entry(const std::string& entry,
                                const std::vector<std::string>& search_dirs) {
    namespace fs = std::filesystem;
    fs::path entry_path(entry);
    std::vector<fs::path> candidates;
    if (entry_path.is_absolute() || search_dirs.empty()) {
        candidates.push_back(entry_path);
    } else {
        for (const auto& dir : search_dirs) {
            candidates.push_back((fs::path(dir) / entry_path).lexically_normal());
        }
    }

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (!fs::is_regular_file(candidate, ec)) continue;
        fs::path resolved = fs::absolute(candidate, ec);
        return ec ? candidate.string() : resolved.lexically_normal().string();
    }

    std::string looked;
    for (const auto& candidate : candidates) {
        if (!looked.empty()) looked += ", ";
        looked += candidate.string();
    }
    throw StartupError("Tool server not found at " + looked);
}

bool is_diagnostic_error(const std::string& line) {
    std::string lower = to_lower(line);
    for (const char* needle : {"error", "fatal", "panic", "exception"}) {
        if (lower.find(needle) != std::string::npos) return true;
    }
    return false;
}

ToolServerProcess::~ToolServerProcess() {
    close();
}

void ToolServerProcess::start(const ProcessSpec& spec, MessageHandler on_message,
                              CloseHandler on_close) {
    if (spec.command.empty()) {
        throw StartupError("No tool server command configured");
    }
    if (pid_ > 0) {
        throw StartupError("Tool server already started");
    }

    // Writes to a dead child must surface as EPIPE, not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    int in_pipe[2], out_pipe[2], err_pipe[2], exec_pipe[2];
    if (pipe(in_pipe) != 0) {
        throw StartupError(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (pipe(out_pipe) != 0) {
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        throw StartupError(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (pipe(err_pipe) != 0) {
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        throw StartupError(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (pipe(exec_pipe) != 0) {
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        throw StartupError(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    // No pipe end may leak into other children (bash tool commands). dup2
    // clears the flag on the child's 0/1/2 copies.
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                   err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
        set_cloexec(fd);
    }

    // Everything the child needs is built before fork.
    std::vector<std::string> env_storage = build_environment(spec.env);
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(&e[0]);
    envp.push_back(nullptr);

    std::vector<std::string> arg_storage;
    arg_storage.push_back(spec.command);
    for (const auto& a : spec.args) arg_storage.push_back(a);
    std::vector<char*> argv;
    for (auto& a : arg_storage) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                       err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            ::close(fd);
        }
        throw StartupError(std::string("Failed to fork tool server: ") + std::strerror(err));
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                       err_pipe[0], err_pipe[1], exec_pipe[0]}) {
            ::close(fd);
        }
        environ = envp.data();
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    // exec succeeded iff the CLOEXEC pipe closes without data.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n > 0) {
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        throw StartupError("Failed to start tool server '" + spec.command + "': " +
                           std::strerror(exec_errno));
    }

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);
    closed_ = false;
    stopping_.store(false);
    running_.store(true);

    stdout_thread_ = std::thread(&ToolServerProcess::read_stdout, this);
    stderr_thread_ = std::thread(&ToolServerProcess::read_stderr, this);

    std::cerr << "[tool-server] Started " << spec.command << " (pid " << pid_ << ")\n";
}

void ToolServerProcess::send_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        throw TransportError("Tool server stdin is closed");
    }
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = write(stdin_fd_, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Write to tool server failed: ") +
                                 std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
}

void ToolServerProcess::read_stdout() {
    LineFramer framer;
    std::array<char, 4096> buffer;
    std::string reason = "tool server closed the connection";

    while (wait_readable(stdout_fd_, stopping_)) {
        ssize_t n = read(stdout_fd_, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            reason = std::string("read from tool server failed: ") + std::strerror(errno);
            break;
        }
        if (n == 0) break;

        framer.feed(buffer.data(), static_cast<size_t>(n));
        while (auto message = framer.next()) {
            if (on_message_) on_message_(*message);
        }
    }

    if (framer.dropped_lines() > 0) {
        std::cerr << "[tool-server] Dropped " << framer.dropped_lines()
                  << " unparseable line(s) from stdout\n";
    }
    running_.store(false);
    if (on_close_) on_close_(reason);
}

void ToolServerProcess::read_stderr() {
    std::array<char, 4096> buffer;
    std::string pending;

    while (wait_readable(stderr_fd_, stopping_)) {
        ssize_t n = read(stderr_fd_, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        pending.append(buffer.data(), static_cast<size_t>(n));

        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = trim(pending.substr(0, pos));
            pending.erase(0, pos + 1);
            if (!line.empty() && is_diagnostic_error(line)) {
                std::cerr << "[tool-server] " << line << "\n";
            }
        }
    }
    std::string tail = trim(pending);
    if (!tail.empty() && is_diagnostic_error(tail)) {
        std::cerr << "[tool-server] " << tail << "\n";
    }
}

bool ToolServerProcess::wait_for_exit(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        int status = 0;
        pid_t r = waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            reap(status);
            return true;
        }
        if (r < 0 && errno != EINTR) {
            // Already reaped elsewhere; nothing left to wait for.
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        usleep(20 * 1000);
    }
}

void ToolServerProcess::reap(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
        if (exit_code_ != 0) {
            std::cerr << "[tool-server] Exited with code " << exit_code_ << "\n";
        }
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -1;
        if (!signalled_by_us_) {
            std::cerr << "[tool-server] Killed by signal " << WTERMSIG(status) << "\n";
        }
    }
}

void ToolServerProcess::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_ || pid_ <= 0) return;
    closed_ = true;

    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        close_fd(stdin_fd_);
    }

    if (!wait_for_exit(1000)) {
        signalled_by_us_ = true;
        kill(pid_, SIGTERM);
        if (!wait_for_exit(2000)) {
            kill(pid_, SIGKILL);
            wait_for_exit(5000);
        }
    }

    stopping_.store(true);
    if (stdout_thread_.joinable()) stdout_thread_.join();
    if (stderr_thread_.joinable()) stderr_thread_.join();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    running_.store(false);
}

} // namespace autoship
