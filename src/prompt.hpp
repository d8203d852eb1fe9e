#pragma once
#include <string>

namespace autoship {

// Instruction used when the operator supplies none: claim one pending task
// from the remote task tools, implement it on a branch, report back.
// remote_prefix is the prefix the router puts on remote tool names.
std::string default_instruction(const std::string& remote_prefix = "mcp_");

} // namespace autoship
