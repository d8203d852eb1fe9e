#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace autoship {

namespace {

bool env_present(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    return v && *v;
}

std::vector<std::string> string_list(const nlohmann::json& arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) return out;
    for (const auto& item : arr) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

nlohmann::json Config::defaults_json() {
    ToolServerConfig ts;
    return {
        {"model", "claude-sonnet-4-20250514"},
        {"temperature", 1.0},
        {"max_tokens", 8096},
        {"anthropic", {{"api_key", ""}, {"base_url", ""}}},
        {"agent", {
            {"max_turns", 50},
            {"parallel_tools", false},
            {"shell_timeout", 600},
            {"result_preview", 500}
        }},
        {"tool_server", {
            {"command", ts.command},
            {"entry", ts.entry},
            {"args", ts.args},
            {"required_env", ts.required_env},
            {"passthrough_env", ts.passthrough_env},
            {"request_timeout", 30},
            {"tool_prefix", "mcp_"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string Config::config_path() {
    if (const char* v = std::getenv("AUTOSHIP_CONFIG")) {
        if (*v) return v;
    }
    return expand_home("~/.autoship/config.json");
}

Config Config::load() {
    return load_from(config_path());
}

Config Config::load_from(const std::string& path) {
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        nlohmann::json original = nlohmann::json::parse(file, nullptr, false);
        file.close();
        if (original.is_discarded() || !original.is_object()) {
            std::cerr << "[config] Malformed config, using defaults: " << path << "\n";
            j = defaults_json();
        } else {
            j = merge_defaults(original, defaults_json());
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (j.contains("max_tokens") && j["max_tokens"].is_number_unsigned())
        cfg.max_tokens = j["max_tokens"].get<uint32_t>();

    if (j.contains("anthropic") && j["anthropic"].is_object()) {
        auto& a = j["anthropic"];
        if (a.contains("api_key") && a["api_key"].is_string())
            cfg.anthropic.api_key = a["api_key"].get<std::string>();
        if (a.contains("base_url") && a["base_url"].is_string())
            cfg.anthropic.base_url = a["base_url"].get<std::string>();
    }

    if (j.contains("agent") && j["agent"].is_object()) {
        auto& a = j["agent"];
        if (a.contains("max_turns") && a["max_turns"].is_number_unsigned())
            cfg.agent.max_turns = a["max_turns"].get<uint32_t>();
        if (a.contains("parallel_tools") && a["parallel_tools"].is_boolean())
            cfg.agent.parallel_tools = a["parallel_tools"].get<bool>();
        if (a.contains("shell_timeout") && a["shell_timeout"].is_number_unsigned())
            cfg.agent.shell_timeout = a["shell_timeout"].get<uint32_t>();
        if (a.contains("result_preview") && a["result_preview"].is_number_unsigned())
            cfg.agent.result_preview = a["result_preview"].get<uint32_t>();
    }

    if (j.contains("tool_server") && j["tool_server"].is_object()) {
        auto& t = j["tool_server"];
        if (t.contains("command") && t["command"].is_string())
            cfg.tool_server.command = t["command"].get<std::string>();
        if (t.contains("args") && t["args"].is_array())
            cfg.tool_server.args = string_list(t["args"]);
        if (t.contains("entry") && t["entry"].is_string())
            cfg.tool_server.entry = t["entry"].get<std::string>();
        if (t.contains("required_env") && t["required_env"].is_array())
            cfg.tool_server.required_env = string_list(t["required_env"]);
        if (t.contains("passthrough_env") && t["passthrough_env"].is_array())
            cfg.tool_server.passthrough_env = string_list(t["passthrough_env"]);
        if (t.contains("request_timeout") && t["request_timeout"].is_number_unsigned())
            cfg.tool_server.request_timeout = t["request_timeout"].get<uint32_t>();
        if (t.contains("tool_prefix") && t["tool_prefix"].is_string())
            cfg.tool_server.tool_prefix = t["tool_prefix"].get<std::string>();
    }

    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"))
        anthropic.api_key = v;
    if (const char* v = std::getenv("ANTHROPIC_BASE_URL"))
        anthropic.base_url = v;
    if (const char* v = std::getenv("AUTOSHIP_MODEL"))
        if (*v) model = v;
    if (const char* v = std::getenv("AUTOSHIP_MAX_TURNS")) {
        try {
            unsigned long n = std::stoul(v);
            if (n > 0) agent.max_turns = static_cast<uint32_t>(n);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid AUTOSHIP_MAX_TURNS: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("AUTOSHIP_TOOL_SERVER")) {
        auto parts = split_whitespace(v);
        if (!parts.empty()) {
            tool_server.command = parts[0];
            tool_server.entry.clear();
            tool_server.args.assign(parts.begin() + 1, parts.end());
        }
    }
}

std::vector<std::string> Config::missing_credentials() const {
    std::vector<std::string> missing;
    if (anthropic.api_key.empty()) {
        missing.push_back("ANTHROPIC_API_KEY");
    }
    for (const auto& name : tool_server.required_env) {
        if (!env_present(name)) missing.push_back(name);
    }
    return missing;
}

std::vector<std::pair<std::string, std::string>> Config::tool_server_env() const {
    std::vector<std::pair<std::string, std::string>> env;
    for (const auto& name : tool_server.passthrough_env) {
        if (const char* v = std::getenv(name.c_str())) {
            env.emplace_back(name, v);
        }
    }
    return env;
}

} // namespace autoship
