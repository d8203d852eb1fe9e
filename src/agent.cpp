#include "agent.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include <iostream>

namespace autoship {

const char* run_outcome_name(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Completed: return "completed";
        case RunOutcome::MaxTurnsReached: return "max_turns_reached";
        case RunOutcome::ProviderFailed: return "provider_failed";
        case RunOutcome::Aborted: return "aborted";
    }
    return "unknown";
}

Agent::Agent(std::unique_ptr<Provider> provider,
             const ToolRouter& router,
             const Config& config)
    : provider_(std::move(provider)), router_(router), config_(config) {}

RunResult Agent::finish(RunResult result) {
    state_ = LoopState::Done;
    result.turns = turns_;

    if (event_bus_) {
        RunFinishedEvent ev;
        ev.outcome = run_outcome_name(result.outcome);
        ev.turns = turns_;
        ev.error = result.error;
        event_bus_->publish(ev);
    }
    return result;
}

RunResult Agent::run(const std::string& instruction) {
    history_.clear();
    turns_ = 0;
    state_ = LoopState::AwaitingModel;
    history_.push_back(ChatMessage{Role::User, {ContentBlock::make_text(instruction)}});

    const uint32_t max_turns = config_.agent.max_turns;
    const auto& tool_specs = router_.specs();

    RunResult result;
    if (max_turns == 0) {
        result.outcome = RunOutcome::MaxTurnsReached;
        return finish(std::move(result));
    }

    while (true) {
        if (aborted()) {
            result.outcome = RunOutcome::Aborted;
            result.error = "Run aborted";
            return finish(std::move(result));
        }

        turns_++;
        if (event_bus_) {
            TurnStartedEvent ev;
            ev.turn = turns_;
            ev.max_turns = max_turns;
            ev.message_count = history_.size();
            event_bus_->publish(ev);
        }

        ChatResponse response;
        try {
            response = provider_->chat(history_, tool_specs, config_.model,
                                       config_.temperature);
        } catch (const std::exception& e) {
            result.outcome = aborted() ? RunOutcome::Aborted : RunOutcome::ProviderFailed;
            result.error = e.what();
            return finish(std::move(result));
        }
        state_ = LoopState::ModelResponded;

        std::vector<ToolCall> calls = response.tool_calls();
        result.final_text = response.text();

        if (event_bus_) {
            ProviderResponseEvent ev;
            ev.turn = turns_;
            ev.model = response.model;
            ev.text = result.final_text;
            ev.stop_reason = response.stop_reason;
            ev.tool_call_count = calls.size();
            ev.usage = response.usage;
            event_bus_->publish(ev);
        }

        history_.push_back(ChatMessage{Role::Assistant, response.content});

        // Tool invocations decide completion; stop_reason is only a hint.
        if (calls.empty()) {
            result.outcome = RunOutcome::Completed;
            return finish(std::move(result));
        }
        if (response.stop_reason == "end_turn") {
            std::cerr << "[agent] stop_reason is end_turn but " << calls.size()
                      << " tool call(s) present; executing them\n";
        }

        if (turns_ >= max_turns) {
            result.outcome = RunOutcome::MaxTurnsReached;
            return finish(std::move(result));
        }

        state_ = LoopState::ExecutingTools;
        execute_tools(calls);
        state_ = LoopState::AwaitingModel;
    }
}

void Agent::execute_tools(const std::vector<ToolCall>& calls) {
    if (event_bus_) {
        for (const auto& call : calls) {
            ToolCallRequestEvent ev;
            ev.turn = turns_;
            ev.tool_name = call.name;
            ev.tool_call_id = call.id;
            ev.arguments = call.arguments;
            event_bus_->publish(ev);
        }
    }

    std::vector<ToolResult> results = router_.dispatch_all(calls, config_.agent.parallel_tools);

    ChatMessage reply{Role::User, {}};
    reply.content.reserve(calls.size());
    for (size_t i = 0; i < calls.size(); ++i) {
        const ToolResult& r = results[i];
        if (event_bus_) {
            ToolCallResultEvent ev;
            ev.turn = turns_;
            ev.tool_name = calls[i].name;
            ev.tool_call_id = calls[i].id;
            ev.success = r.success;
            ev.output = r.output;
            event_bus_->publish(ev);
        }
        reply.content.push_back(ContentBlock::make_tool_result(calls[i].id, r.output, !r.success));
    }
    history_.push_back(std::move(reply));
}

} // namespace autoship
