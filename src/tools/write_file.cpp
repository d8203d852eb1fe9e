#include "write_file.hpp"
#include "tool_util.hpp"
#include <filesystem>
#include <fstream>

namespace autoship {

ToolResult WriteFileTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;
    if (auto err = require_string(args, "content")) return *err;

    std::string path = args["path"].get<std::string>();
    std::string content = args["content"].get<std::string>();
    if (auto err = validate_safe_path(path)) return *err;

    std::filesystem::path fs_path(path);
    if (fs_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) {
            return tool_failure("writing file", ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return tool_failure("writing file", "cannot open " + path);
    }
    file << content;
    file.close();
    if (file.fail()) {
        return tool_failure("writing file", "write to " + path + " failed");
    }

    return ToolResult{true, "Successfully wrote to " + path};
}

std::string WriteFileTool::description() const {
    return "Write content to a file (creates or overwrites)";
}

std::string WriteFileTool::parameters_json() const {
    return R"JSON({"type":"object","properties":{"path":{"type":"string","description":"The path to the file to write"},"content":{"type":"string","description":"The content to write to the file"}},"required":["path","content"]})JSON";
}

} // namespace autoship
