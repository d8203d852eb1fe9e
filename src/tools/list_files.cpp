#include "list_files.hpp"
#include "tool_util.hpp"
#include <algorithm>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace autoship {

static std::string describe_entry(const fs::directory_entry& entry, const fs::path& root) {
    std::error_code ec;
    std::string rel = fs::relative(entry.path(), root, ec).generic_string();
    if (ec || rel.empty()) rel = entry.path().filename().generic_string();

    if (entry.is_directory(ec)) return rel + "/";
    if (entry.is_symlink(ec)) return rel + "@";
    auto size = entry.file_size(ec);
    if (ec) return rel;
    return rel + " (" + std::to_string(size) + " bytes)";
}

template <typename Iterator>
static bool collect_entries(Iterator it, const fs::path& root, size_t max_entries,
                            std::vector<std::string>& lines, std::error_code& ec) {
    for (; it != Iterator{}; it.increment(ec)) {
        if (ec) return false;
        if (lines.size() >= max_entries) return true;
        lines.push_back(describe_entry(*it, root));
    }
    return false;
}

ToolResult ListFilesTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    std::string path = optional_string(args, "path", ".");
    if (auto err = validate_safe_path(path)) return *err;
    bool recursive = optional_bool(args, "recursive", false);

    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return tool_failure("listing files", path + " is not a directory");
    }

    fs::path root(path);
    std::vector<std::string> lines;
    bool truncated = false;

    const auto opts = fs::directory_options::skip_permission_denied;
    if (recursive) {
        fs::recursive_directory_iterator it(root, opts, ec);
        if (!ec) truncated = collect_entries(it, root, kMaxEntries, lines, ec);
    } else {
        fs::directory_iterator it(root, opts, ec);
        if (!ec) truncated = collect_entries(it, root, kMaxEntries, lines, ec);
    }
    if (ec) {
        return tool_failure("listing files", ec.message());
    }

    std::sort(lines.begin(), lines.end());
    std::string out;
    for (const auto& line : lines) {
        out += line + "\n";
    }
    if (truncated) out += "[truncated]\n";
    if (out.empty()) out = "(empty directory)";
    return ToolResult{true, out};
}

std::string ListFilesTool::description() const {
    return "List files in a directory";
}

std::string ListFilesTool::parameters_json() const {
    return R"JSON({"type":"object","properties":{"path":{"type":"string","description":"The directory path to list (defaults to current directory)"},"recursive":{"type":"boolean","description":"Whether to list recursively"}}})JSON";
}

} // namespace autoship
