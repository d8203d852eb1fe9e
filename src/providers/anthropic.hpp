#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace autoship {

// Anthropic Messages API client
class AnthropicProvider : public Provider {
public:
    AnthropicProvider(const std::string& api_key, HttpClient& http,
                      const std::string& base_url,
                      uint32_t max_tokens = 8096);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::vector<ToolSpec>& tools,
                      const std::string& model,
                      double temperature) override;

    std::string provider_name() const override { return "anthropic"; }

    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::vector<ToolSpec>& tools,
                                 const std::string& model,
                                 double temperature) const;

    static ChatResponse parse_response(const nlohmann::json& resp,
                                       const std::string& fallback_model);

private:
    static void backoff_sleep(uint32_t attempt);

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    uint32_t max_tokens_;
    static constexpr const char* API_VERSION = "2023-06-01";
    static constexpr uint32_t MAX_RETRIES = 2;
    static constexpr double INITIAL_DELAY_S = 0.5;
    static constexpr double MAX_DELAY_S = 8.0;
};

// Wire form of a single content block
nlohmann::json content_block_to_json(const ContentBlock& block);

} // namespace autoship
