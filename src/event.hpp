#pragma once
#include "provider.hpp"
#include <string>
#include <cstdint>

namespace autoship {

// Tag-based event dispatch, no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

namespace event_tags {
    constexpr const char* TurnStarted      = "TurnStarted";
    constexpr const char* ProviderResponse = "ProviderResponse";
    constexpr const char* ToolCallRequest  = "ToolCallRequest";
    constexpr const char* ToolCallResult   = "ToolCallResult";
    constexpr const char* RunFinished      = "RunFinished";
} // namespace event_tags

struct TurnStartedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnStarted;
    uint32_t turn = 0;
    uint32_t max_turns = 0;
    size_t message_count = 0;

    TurnStartedEvent() { type_tag = TAG; }
};

struct ProviderResponseEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderResponse;
    uint32_t turn = 0;
    std::string model;
    std::string text;
    std::string stop_reason;
    size_t tool_call_count = 0;
    TokenUsage usage;

    ProviderResponseEvent() { type_tag = TAG; }
};

struct ToolCallRequestEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallRequest;
    uint32_t turn = 0;
    std::string tool_name;
    std::string tool_call_id;
    std::string arguments; // raw JSON

    ToolCallRequestEvent() { type_tag = TAG; }
};

struct ToolCallResultEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallResult;
    uint32_t turn = 0;
    std::string tool_name;
    std::string tool_call_id;
    bool success = false;
    std::string output;

    ToolCallResultEvent() { type_tag = TAG; }
};

struct RunFinishedEvent : Event {
    static constexpr const char* TAG = event_tags::RunFinished;
    std::string outcome; // run_outcome_name()
    uint32_t turns = 0;
    std::string error;

    RunFinishedEvent() { type_tag = TAG; }
};

} // namespace autoship
