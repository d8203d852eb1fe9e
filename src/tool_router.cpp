#include "tool_router.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <future>
#include <iostream>

namespace autoship {

ToolRouter::ToolRouter(std::vector<std::unique_ptr<Tool>> builtins,
                       const std::vector<RemoteToolDefinition>& remote_tools,
                       RpcClient* remote,
                       const std::string& remote_prefix)
    : builtins_(std::move(builtins)), remote_(remote) {
    for (const auto& tool : builtins_) {
        ToolEntry entry;
        entry.origin = ToolOrigin::Builtin;
        entry.spec = tool->spec();
        entry.builtin = tool.get();
        add(std::move(entry));
    }

    for (const auto& def : remote_tools) {
        ToolEntry entry;
        entry.origin = ToolOrigin::Remote;
        entry.spec.name = remote_prefix + def.name;
        entry.spec.description = def.description;
        entry.spec.input_schema = normalize_schema(def.input_schema);
        entry.remote_name = def.name;
        add(std::move(entry));
    }
}

bool ToolRouter::add(ToolEntry entry) {
    if (index_.count(entry.spec.name)) {
        std::cerr << "[tools] Skipping duplicate tool name: " << entry.spec.name << "\n";
        return false;
    }
    index_[entry.spec.name] = entries_.size();
    specs_.push_back(entry.spec);
    entries_.push_back(std::move(entry));
    return true;
}

const ToolEntry* ToolRouter::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

ToolResult ToolRouter::call_remote(const ToolEntry& entry, const std::string& args_json) const {
    if (!remote_) {
        return ToolResult{false, "Remote tool error: no tool server connected"};
    }

    nlohmann::json args = nlohmann::json::parse(args_json, nullptr, false);
    if (args.is_discarded() || args.is_null()) {
        args = nlohmann::json::object();
    }

    try {
        CallToolResult result = remote_->call_tool(entry.remote_name, args);
        return ToolResult{!result.is_error, result.text()};
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Remote tool error: ") + e.what()};
    }
}

ToolResult ToolRouter::dispatch(const ToolCall& call) const {
    const ToolEntry* entry = find(call.name);
    if (!entry) {
        return ToolResult{false, "Unknown tool: " + call.name};
    }

    if (entry->origin == ToolOrigin::Remote) {
        return call_remote(*entry, call.arguments);
    }

    try {
        return entry->builtin->execute(call.arguments);
    } catch (const ToolExecutionError& e) {
        return ToolResult{false, "Tool " + call.name + " failed: " + e.what()};
    } catch (const std::exception& e) {
        std::cerr << "[tools] Unexpected exception from " << call.name << ": " << e.what() << "\n";
        return ToolResult{false, "Tool " + call.name + " failed: " + e.what()};
    }
}

std::vector<ToolResult> ToolRouter::dispatch_all(const std::vector<ToolCall>& calls,
                                                 bool parallel) const {
    std::vector<ToolResult> results;
    results.reserve(calls.size());

    if (!parallel || calls.size() < 2) {
        for (const auto& call : calls) {
            results.push_back(dispatch(call));
        }
        return results;
    }

    std::vector<std::future<ToolResult>> futures;
    futures.reserve(calls.size());
    for (const auto& call : calls) {
        futures.push_back(std::async(std::launch::async,
                                     [this, &call]() { return dispatch(call); }));
    }
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

} // namespace autoship
