#pragma once
#include "provider.hpp"
#include "tool.hpp"
#include "rpc/rpc_client.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace autoship {

enum class ToolOrigin { Builtin, Remote };

struct ToolEntry {
    ToolOrigin origin = ToolOrigin::Builtin;
    ToolSpec spec;            // as advertised to the model
    std::string remote_name;  // Remote only: name on the tool server
    Tool* builtin = nullptr;  // Builtin only
};

// Merged, immutable tool catalogue for one run.
//
// Origin is fixed at registration, so routing never re-inspects the name:
// a built-in that happens to start with the remote prefix still runs
// locally. Remote tools are advertised as prefix + server name.
class ToolRouter {
public:
    ToolRouter(std::vector<std::unique_ptr<Tool>> builtins,
               const std::vector<RemoteToolDefinition>& remote_tools,
               RpcClient* remote,
               const std::string& remote_prefix = "mcp_");

    ToolRouter(const ToolRouter&) = delete;
    ToolRouter& operator=(const ToolRouter&) = delete;

    // Definitions handed to the model, built-ins first.
    const std::vector<ToolSpec>& specs() const { return specs_; }

    const ToolEntry* find(const std::string& name) const;
    size_t size() const { return entries_.size(); }

    // Never throws: every failure becomes an error ToolResult.
    ToolResult dispatch(const ToolCall& call) const;

    // Results in call order. With parallel set, calls run concurrently.
    std::vector<ToolResult> dispatch_all(const std::vector<ToolCall>& calls,
                                         bool parallel) const;

private:
    bool add(ToolEntry entry);
    ToolResult call_remote(const ToolEntry& entry, const std::string& args_json) const;

    std::vector<std::unique_ptr<Tool>> builtins_;
    RpcClient* remote_;
    std::vector<ToolEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<ToolSpec> specs_;
};

} // namespace autoship
