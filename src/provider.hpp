#pragma once
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace autoship {

enum class Role { User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

enum class BlockType { Text, ToolUse, ToolResult };

// One entry of a message's content array.
//   Text:       text
//   ToolUse:    id, name, input
//   ToolResult: id (the invocation it answers), text, is_error
struct ContentBlock {
    BlockType type = BlockType::Text;
    std::string text;
    std::string id;
    std::string name;
    nlohmann::json input;
    bool is_error = false;

    static ContentBlock make_text(const std::string& text);
    static ContentBlock make_tool_use(const std::string& id, const std::string& name,
                                      nlohmann::json input);
    static ContentBlock make_tool_result(const std::string& invocation_id,
                                         const std::string& text, bool is_error);
};

struct ChatMessage {
    Role role;
    std::vector<ContentBlock> content;
};

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON string
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::vector<ContentBlock> content;
    std::string stop_reason;
    TokenUsage usage;
    std::string model;

    bool has_tool_calls() const;

    // ToolUse blocks in content order
    std::vector<ToolCall> tool_calls() const;

    // Text blocks joined with newlines
    std::string text() const;
};

// Abstract base class for model services
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::vector<ToolSpec>& tools,
                              const std::string& model,
                              double temperature) = 0;

    virtual std::string provider_name() const = 0;
};

class HttpClient; // forward declaration

// Factory: create provider by name. Throws ProviderError for unknown names.
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url = "",
                                          uint32_t max_tokens = 8096);

} // namespace autoship
