#pragma once
#include <nlohmann/json.hpp>
#include <atomic>
#include <string>
#include <memory>
#include <vector>
#include <cstdint>

namespace autoship {

// What the model is told about one tool.
struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct ToolResult {
    bool success;
    std::string output;
};

// A tool that runs inside this process. Bad input and runtime failures come
// back as ToolResult{false, ...} rather than exceptions.
class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const;
};

// Object schemas pass through; anything else becomes an empty object schema.
nlohmann::json normalize_schema(const nlohmann::json& schema);

// bash, read_file, write_file, list_files. abort_flag reaches bash so a
// shutdown does not wait for a long command.
std::vector<std::unique_ptr<Tool>> create_builtin_tools(
    uint32_t shell_timeout_seconds, const std::atomic<bool>* abort_flag = nullptr);

} // namespace autoship
