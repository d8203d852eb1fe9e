#pragma once
#include "../tool.hpp"

namespace autoship {

class WriteFileTool : public Tool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "write_file"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace autoship
