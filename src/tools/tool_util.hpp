#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace autoship {

// Bad input and runtime failures come back as results the model can read.
inline ToolResult tool_failure(const std::string& what, const std::string& detail) {
    return ToolResult{false, "Error " + what + ": " + detail};
}

// Arguments arrive as the model wrote them; anything but an object is rejected.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    out = nlohmann::json::parse(args_json.empty() ? "{}" : args_json, nullptr, false);
    if (out.is_discarded()) {
        return ToolResult{false, "Failed to parse arguments: invalid JSON"};
    }
    if (!out.is_object()) {
        return ToolResult{false, "Failed to parse arguments: expected a JSON object"};
    }
    return std::nullopt;
}

inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    return std::nullopt;
}

// Empty or non-string values fall back.
inline std::string optional_string(const nlohmann::json& args, const char* field,
                                   const std::string& fallback) {
    if (!args.contains(field) || !args[field].is_string()) return fallback;
    std::string value = args[field].get<std::string>();
    return value.empty() ? fallback : value;
}

inline bool optional_bool(const nlohmann::json& args, const char* field, bool fallback) {
    if (!args.contains(field) || !args[field].is_boolean()) return fallback;
    return args[field].get<bool>();
}

// Rejects any ".." component so a relative path cannot climb out of the
// working tree. Names that merely contain dots ("notes..txt") and absolute
// paths are accepted.
inline std::optional<ToolResult> validate_safe_path(const std::string& path) {
    for (const auto& part : std::filesystem::path(path)) {
        if (part == "..") {
            return ToolResult{false, "Path must not contain '..' components"};
        }
    }
    return std::nullopt;
}

} // namespace autoship
