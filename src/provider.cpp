#include "provider.hpp"
#include "errors.hpp"
#include "providers/anthropic.hpp"

namespace autoship {

ContentBlock ContentBlock::make_text(const std::string& text) {
    ContentBlock block;
    block.type = BlockType::Text;
    block.text = text;
    return block;
}

ContentBlock ContentBlock::make_tool_use(const std::string& id, const std::string& name,
                                         nlohmann::json input) {
    ContentBlock block;
    block.type = BlockType::ToolUse;
    block.id = id;
    block.name = name;
    block.input = std::move(input);
    return block;
}

ContentBlock ContentBlock::make_tool_result(const std::string& invocation_id,
                                            const std::string& text, bool is_error) {
    ContentBlock block;
    block.type = BlockType::ToolResult;
    block.id = invocation_id;
    block.text = text;
    block.is_error = is_error;
    return block;
}

bool ChatResponse::has_tool_calls() const {
    for (const auto& block : content) {
        if (block.type == BlockType::ToolUse) return true;
    }
    return false;
}

std::vector<ToolCall> ChatResponse::tool_calls() const {
    std::vector<ToolCall> calls;
    for (const auto& block : content) {
        if (block.type != BlockType::ToolUse) continue;
        std::string args = block.input.is_null() ? "{}" : block.input.dump();
        calls.push_back(ToolCall{block.id, block.name, std::move(args)});
    }
    return calls;
}

std::string ChatResponse::text() const {
    std::string out;
    for (const auto& block : content) {
        if (block.type != BlockType::Text) continue;
        if (!out.empty()) out += "\n";
        out += block.text;
    }
    return out;
}

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url,
                                          uint32_t max_tokens) {
    if (name == "anthropic") {
        return std::make_unique<AnthropicProvider>(api_key, http, base_url, max_tokens);
    }
    throw ProviderError("Unknown provider: " + name);
}

} // namespace autoship
