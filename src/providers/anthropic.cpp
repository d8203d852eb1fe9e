#include "anthropic.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace autoship {

json content_block_to_json(const ContentBlock& block) {
    switch (block.type) {
        case BlockType::Text:
            return {{"type", "text"}, {"text", block.text}};
        case BlockType::ToolUse:
            return {{"type", "tool_use"},
                    {"id", block.id},
                    {"name", block.name},
                    {"input", block.input.is_null() ? json::object() : block.input}};
        case BlockType::ToolResult: {
            json j = {{"type", "tool_result"},
                      {"tool_use_id", block.id},
                      {"content", block.text}};
            if (block.is_error) j["is_error"] = true;
            return j;
        }
    }
    return json::object();
}

AnthropicProvider::AnthropicProvider(const std::string& api_key, HttpClient& http,
                                     const std::string& base_url,
                                     uint32_t max_tokens)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.anthropic.com/v1" : base_url),
      max_tokens_(max_tokens) {}

void AnthropicProvider::backoff_sleep(uint32_t attempt) {
    double delay = std::min(INITIAL_DELAY_S * std::pow(2.0, static_cast<double>(attempt)),
                            MAX_DELAY_S);
    auto ms = static_cast<long>(delay * 1000);
    std::cerr << "[anthropic] Retrying in " << ms << "ms...\n";
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

json AnthropicProvider::build_request(const std::vector<ChatMessage>& messages,
                                      const std::vector<ToolSpec>& tools,
                                      const std::string& model,
                                      double temperature) const {
    json request;
    request["model"] = model;
    request["max_tokens"] = max_tokens_;
    request["temperature"] = temperature;

    json msgs = json::array();
    for (const auto& msg : messages) {
        json content = json::array();
        for (const auto& block : msg.content) {
            content.push_back(content_block_to_json(block));
        }
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", content}});
    }
    request["messages"] = msgs;

    if (!tools.empty()) {
        json tools_arr = json::array();
        for (const auto& tool : tools) {
            tools_arr.push_back({{"name", tool.name},
                                 {"description", tool.description},
                                 {"input_schema", normalize_schema(tool.input_schema)}});
        }
        request["tools"] = tools_arr;
    }

    return request;
}

ChatResponse AnthropicProvider::parse_response(const json& resp,
                                               const std::string& fallback_model) {
    ChatResponse result;
    result.model = resp.value("model", fallback_model);
    if (resp.contains("stop_reason") && resp["stop_reason"].is_string()) {
        result.stop_reason = resp["stop_reason"].get<std::string>();
    }

    if (resp.contains("content") && resp["content"].is_array()) {
        for (const auto& block : resp["content"]) {
            std::string type = block.value("type", "");
            if (type == "text") {
                result.content.push_back(ContentBlock::make_text(block.value("text", "")));
            } else if (type == "tool_use") {
                json input = block.contains("input") ? block["input"] : json::object();
                result.content.push_back(ContentBlock::make_tool_use(
                    block.value("id", ""), block.value("name", ""), std::move(input)));
            }
        }
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const auto& usage = resp["usage"];
        result.usage.prompt_tokens = usage.value("input_tokens", 0u);
        result.usage.completion_tokens = usage.value("output_tokens", 0u);
        result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;
    }
    return result;
}

ChatResponse AnthropicProvider::chat(const std::vector<ChatMessage>& messages,
                                     const std::vector<ToolSpec>& tools,
                                     const std::string& model,
                                     double temperature) {
    std::string body = build_request(messages, tools, model, temperature)
        .dump(-1, ' ', false, json::error_handler_t::replace);

    std::vector<Header> headers = {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"content-type", "application/json"}
    };

    for (uint32_t attempt = 0; attempt <= MAX_RETRIES; ++attempt) {
        auto response = http_.post(base_url_ + "/messages", body, headers);

        if (response.ok()) {
            json resp = json::parse(response.body, nullptr, false);
            if (resp.is_discarded() || !resp.is_object()) {
                throw ProviderError("Anthropic API returned malformed JSON");
            }
            return parse_response(resp, model);
        }

        if (response.status_code == 0) {
            throw ProviderError("Anthropic API request failed (no response)");
        }

        if (response.transient() && attempt < MAX_RETRIES) {
            backoff_sleep(attempt);
            continue;
        }

        throw ProviderError("Anthropic API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    throw ProviderError("Anthropic API error: max retries exceeded");
}

} // namespace autoship
