#pragma once
#include <string>
#include <cstdint>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace autoship {

struct AnthropicConfig {
    std::string api_key;
    std::string base_url; // empty = provider default
};

struct AgentConfig {
    uint32_t max_turns = 50;
    bool parallel_tools = false;
    uint32_t shell_timeout = 600;  // seconds per bash invocation
    uint32_t result_preview = 500; // chars of each tool result echoed to the console
};

struct ToolServerConfig {
    std::string command = "node";
    // Script handed to command ahead of args. A relative path is looked up
    // in the working directory, then beside the executable and one level up.
    // Empty when the command line came from an override.
    std::string entry = "mcp-servers/autoship-mcp/dist/index.js";
    std::vector<std::string> args;
    std::vector<std::string> required_env = {"SUPABASE_URL", "SUPABASE_SERVICE_KEY"};
    std::vector<std::string> passthrough_env = {"SUPABASE_URL", "SUPABASE_SERVICE_KEY"};
    uint32_t request_timeout = 30; // seconds
    std::string tool_prefix = "mcp_";
};

struct Config {
    std::string model = "claude-sonnet-4-20250514";
    double temperature = 1.0;
    uint32_t max_tokens = 8096;

    AnthropicConfig anthropic;
    AgentConfig agent;
    ToolServerConfig tool_server;

    // Load from $AUTOSHIP_CONFIG or ~/.autoship/config.json, then env vars
    static Config load();

    // Load from an explicit path (created with defaults when missing), then env vars
    static Config load_from(const std::string& path);

    // Parse an already merged JSON document; no env overrides
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static std::string config_path();

    // Environment variables always override the file
    void apply_env();

    // Required variables that are unset or empty, including ANTHROPIC_API_KEY
    // when no key is configured.
    std::vector<std::string> missing_credentials() const;

    // passthrough_env variables present in our environment, as name/value pairs
    std::vector<std::pair<std::string, std::string>> tool_server_env() const;
};

} // namespace autoship
