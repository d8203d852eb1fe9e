#include "bash.hpp"
#include "tool_util.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace autoship {

ToolResult BashTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "command")) return *err;

    RunResult r = run(args["command"].get<std::string>());

    std::string output = r.out;
    if (!r.err.empty()) {
        output += "\nSTDERR:\n" + r.err;
    }
    if (output.empty()) {
        output = "(no output)";
    }
    output = truncate_with_marker(output, kMaxOutput, "\n[truncated]");

    std::string text = "Exit code: " + std::to_string(r.exit_code) + "\n";
    if (r.aborted) {
        text += "Command aborted by shutdown\n";
    } else if (r.timed_out) {
        text += "Command timed out after " + std::to_string(timeout_seconds_) + "s\n";
    } else if (r.signal != 0) {
        text += "Killed by signal " + std::to_string(r.signal) + "\n";
    }
    text += output;
    return ToolResult{r.exit_code == 0, text};
}

BashTool::RunResult BashTool::run(const std::string& command) {
    RunResult result;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        throw ToolExecutionError(std::string("cannot create pipes: ") + std::strerror(errno));
    }
    if (pipe(err_pipe) != 0) {
        int err = errno;
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw ToolExecutionError(std::string("cannot create pipes: ") + std::strerror(err));
    }

    // Read ends must not leak into commands forked concurrently.
    fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw ToolExecutionError(std::string("cannot fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Own process group so a timeout can kill the whole tree
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        execl("/bin/bash", "bash", "-c", command.c_str(), nullptr);
        execlp("bash", "bash", "-c", command.c_str(), nullptr);
        _exit(127);
    }

    // Also set from the parent so a timeout kill cannot race the child's setpgid
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);

    std::array<struct pollfd, 2> pfds{};
    pfds[0].fd = out_pipe[0];
    pfds[0].events = POLLIN;
    pfds[1].fd = err_pipe[0];
    pfds[1].events = POLLIN;
    std::string* sinks[2] = {&result.out, &result.err};

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds_);
    std::array<char, 4096> buffer;

    while (pfds[0].fd >= 0 || pfds[1].fd >= 0) {
        if (abort_requested()) {
            result.aborted = true;
            kill(-pid, SIGKILL);
            break;
        }

        int wait_ms = abort_flag_ ? kAbortCheckMs : -1;
        if (timeout_seconds_ > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                result.timed_out = true;
                kill(-pid, SIGKILL);
                break;
            }
            if (wait_ms < 0 || left < wait_ms) wait_ms = static_cast<int>(left);
        }

        int ret = poll(pfds.data(), pfds.size(), wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue; // deadline and abort checks at loop top

        for (size_t i = 0; i < pfds.size(); ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            ssize_t n = read(pfds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(pfds[i].fd);
                pfds[i].fd = -1;
            }
        }
    }

    for (auto& pfd : pfds) {
        if (pfd.fd >= 0) close(pfd.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (result.timed_out || result.aborted) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = -1;
    }
    return result;
}

std::string BashTool::description() const {
    return "Execute a bash command. Use this for git operations, running tests, "
           "and other shell commands.";
}

std::string BashTool::parameters_json() const {
    return R"JSON({"type":"object","properties":{"command":{"type":"string","description":"The bash command to execute"}},"required":["command"]})JSON";
}

} // namespace autoship
