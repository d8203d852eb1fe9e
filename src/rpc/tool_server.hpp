#pragma once
#include "rpc_client.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace autoship {

struct ProcessSpec {
    std::string command;
    std::vector<std::string> args;
    // Extra variables added to (or overriding) the inherited environment.
    std::vector<std::pair<std::string, std::string>> env;
};

// True for stderr lines worth surfacing (error/fatal/panic/exception,
// case-insensitive). Everything else a server prints is chatter.
bool is_diagnostic_error(const std::string& line);

// Resolves the tool server's entry script. An absolute entry is used as is;
// a relative one is tried under each search directory in order. Throws
// StartupError naming every place looked when none exists.
std::string locate_server_entry(const std::string& entry,
                                const std::vector<std::string>& search_dirs);

// Child process speaking line-delimited JSON over its stdin/stdout.
//
// A reader thread feeds stdout through a LineFramer and hands each message
// to on_message; on EOF it calls on_close exactly once. A second thread
// drains stderr. close() is idempotent and also runs from the destructor.
class ToolServerProcess : public RpcTransport {
public:
    using MessageHandler = std::function<void(const nlohmann::json&)>;
    using CloseHandler = std::function<void(const std::string&)>;

    ToolServerProcess() = default;
    ~ToolServerProcess() override;

    ToolServerProcess(const ToolServerProcess&) = delete;
    ToolServerProcess& operator=(const ToolServerProcess&) = delete;

    // Throws StartupError when the pipes, fork or exec fail.
    void start(const ProcessSpec& spec, MessageHandler on_message, CloseHandler on_close);

    void send_line(const std::string& line) override;

    // Close stdin, give the child a second to exit, then SIGTERM, then SIGKILL.
    void close();

    bool running() const { return running_.load(); }
    pid_t pid() const { return pid_; }
    // Exit status once reaped; -1 before that or when killed by a signal.
    int exit_code() const { return exit_code_; }

private:
    void read_stdout();
    void read_stderr();
    bool wait_for_exit(int timeout_ms);
    void reap(int status);

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::mutex write_mutex_;
    std::mutex close_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    bool closed_ = false;
    bool signalled_by_us_ = false;
    int exit_code_ = -1;

    MessageHandler on_message_;
    CloseHandler on_close_;
    std::thread stdout_thread_;
    std::thread stderr_thread_;
};

} // namespace autoship
