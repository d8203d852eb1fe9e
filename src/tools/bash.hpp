#pragma once
#include "../tool.hpp"
#include <atomic>
#include <string>
#include <sys/types.h>

namespace autoship {

// Runs a command with `bash -c`, waits for it, and reports
// "Exit code: N\n<stdout>[\nSTDERR:\n<stderr>]".
class BashTool : public Tool {
public:
    // While *abort_flag is set, a running command's process group is killed
    // within kAbortCheckMs.
    explicit BashTool(uint32_t timeout_seconds = 600,
                      const std::atomic<bool>* abort_flag = nullptr)
        : timeout_seconds_(timeout_seconds), abort_flag_(abort_flag) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "bash"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    static constexpr size_t kMaxOutput = 30000;
    static constexpr int kAbortCheckMs = 200;

    struct RunResult {
        std::string out;
        std::string err;
        int exit_code = -1;
        bool timed_out = false;
        bool aborted = false;
        int signal = 0;
    };
    RunResult run(const std::string& command);

    bool abort_requested() const { return abort_flag_ && abort_flag_->load(); }

    uint32_t timeout_seconds_;
    const std::atomic<bool>* abort_flag_;
};

} // namespace autoship
