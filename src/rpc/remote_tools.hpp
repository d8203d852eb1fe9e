#pragma once
#include "rpc_client.hpp"
#include "tool_server.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace autoship {

// A started, initialized tool server together with its tool catalogue.
// Destruction closes the child before the client it feeds goes away.
class RemoteToolSession {
public:
    RemoteToolSession() = default;
    ~RemoteToolSession();

    RemoteToolSession(const RemoteToolSession&) = delete;
    RemoteToolSession& operator=(const RemoteToolSession&) = delete;

    // Spawn, handshake, list tools. Any failure is reported as StartupError
    // and leaves no child process behind.
    void connect(const ProcessSpec& spec,
                 std::chrono::milliseconds timeout,
                 const nlohmann::json& client_info);

    void close();

    RpcClient* client() { return client_.get(); }
    const std::vector<RemoteToolDefinition>& tools() const { return tools_; }
    const std::string& server_name() const { return server_name_; }
    bool connected() const { return client_ != nullptr; }

private:
    std::unique_ptr<ToolServerProcess> process_;
    std::unique_ptr<RpcClient> client_;
    std::vector<RemoteToolDefinition> tools_;
    std::string server_name_;
};

} // namespace autoship
