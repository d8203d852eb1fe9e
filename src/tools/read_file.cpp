#include "read_file.hpp"
#include "tool_util.hpp"
#include "../util.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace autoship {

ToolResult ReadFileTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;

    std::string path = args["path"].get<std::string>();
    if (auto err = validate_safe_path(path)) return *err;

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return tool_failure("reading file", path + " is a directory");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return tool_failure("reading file", path + ": " + std::strerror(errno));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    constexpr size_t max_size = 50000;
    return ToolResult{true, truncate_with_marker(ss.str(), max_size, "\n[truncated]")};
}

std::string ReadFileTool::description() const {
    return "Read the contents of a file";
}

std::string ReadFileTool::parameters_json() const {
    return R"JSON({"type":"object","properties":{"path":{"type":"string","description":"The path to the file to read"}},"required":["path"]})JSON";
}

} // namespace autoship
