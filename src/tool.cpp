#include "tool.hpp"
#include "tools/bash.hpp"
#include "tools/read_file.hpp"
#include "tools/write_file.hpp"
#include "tools/list_files.hpp"

namespace autoship {

nlohmann::json normalize_schema(const nlohmann::json& schema) {
    if (schema.is_object()) return schema;
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

ToolSpec Tool::spec() const {
    auto schema = nlohmann::json::parse(parameters_json(), nullptr, false);
    return ToolSpec{tool_name(), description(), normalize_schema(schema)};
}

std::vector<std::unique_ptr<Tool>> create_builtin_tools(
        uint32_t shell_timeout_seconds, const std::atomic<bool>* abort_flag) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<BashTool>(shell_timeout_seconds, abort_flag));
    tools.push_back(std::make_unique<ReadFileTool>());
    tools.push_back(std::make_unique<WriteFileTool>());
    tools.push_back(std::make_unique<ListFilesTool>());
    return tools;
}

} // namespace autoship
