#pragma once
#include "../tool.hpp"

namespace autoship {

// One entry per line: directories end in '/', files carry their byte size.
class ListFilesTool : public Tool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "list_files"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    static constexpr size_t kMaxEntries = 2000;
};

} // namespace autoship
