#pragma once
#include "provider.hpp"
#include "tool_router.hpp"
#include "config.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <memory>

namespace autoship {

class EventBus; // forward declaration

enum class LoopState { AwaitingModel, ModelResponded, ExecutingTools, Done };

enum class RunOutcome {
    Completed,       // model stopped requesting tools
    MaxTurnsReached, // truncated, not completed
    ProviderFailed,  // no usable response from the model service
    Aborted          // abort flag raised between turns or during a model call
};

const char* run_outcome_name(RunOutcome outcome);

struct RunResult {
    RunOutcome outcome = RunOutcome::Completed;
    uint32_t turns = 0;
    std::string final_text; // assistant text of the last response
    std::string error;      // ProviderFailed / Aborted detail
};

// Drives one conversation: model call, tool batch, model call, ... until the
// model stops invoking tools or the turn cap is hit. One turn is one model
// call, however many tools it requested.
class Agent {
public:
    Agent(std::unique_ptr<Provider> provider,
          const ToolRouter& router,
          const Config& config);

    // Seed history with the instruction and run to completion.
    RunResult run(const std::string& instruction);

    const std::vector<ChatMessage>& history() const { return history_; }
    uint32_t turns() const { return turns_; }
    LoopState state() const { return state_; }

    // Optional event bus integration (nullptr = disabled)
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }
    // Checked before every turn; nullptr = never aborted
    void set_abort_flag(const std::atomic<bool>* flag) { abort_flag_ = flag; }

private:
    bool aborted() const { return abort_flag_ && abort_flag_->load(); }
    RunResult finish(RunResult result);
    void execute_tools(const std::vector<ToolCall>& calls);

    std::unique_ptr<Provider> provider_;
    const ToolRouter& router_;
    Config config_;
    std::vector<ChatMessage> history_;
    uint32_t turns_ = 0;
    LoopState state_ = LoopState::AwaitingModel;
    EventBus* event_bus_ = nullptr;
    const std::atomic<bool>* abort_flag_ = nullptr;
};

} // namespace autoship
