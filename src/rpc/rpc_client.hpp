#pragma once
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autoship {

// Line-oriented byte sink the client writes requests to.
class RpcTransport {
public:
    virtual ~RpcTransport() = default;

    // Write one complete newline-terminated line, atomically with respect
    // to other callers. Throws TransportError when the peer is gone.
    virtual void send_line(const std::string& line) = 0;
};

struct RemoteToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct CallToolResult {
    std::vector<std::string> content; // text of each text content item
    bool is_error = false;
    nlohmann::json raw;

    // Content joined with '\n'; the raw result JSON when there is no text.
    std::string text() const;
};

// JSON-RPC 2.0 client with id-correlated requests.
//
// Any thread may call send_request(); each caller blocks until the response
// carrying its id is delivered through handle_message(), or the timeout
// expires. A pending call is removed exactly once: by its response, by its
// timeout, or by handle_close().
class RpcClient {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr size_t kMaxToolPages = 64;

    explicit RpcClient(RpcTransport& transport,
                       std::chrono::milliseconds timeout = std::chrono::seconds(30));

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    // Fire-and-forget; no pending call is created.
    void send_notification(const std::string& method,
                           const nlohmann::json& params = nlohmann::json::object());

    // Returns the response's result. Throws RpcError when the response
    // carries an error or the connection closed, RpcTimeout on deadline.
    nlohmann::json send_request(const std::string& method,
                                const nlohmann::json& params = nlohmann::json::object());

    // initialize request followed by notifications/initialized.
    // Returns the server's result object (capabilities, serverInfo).
    nlohmann::json initialize(const std::string& protocol_version,
                              const nlohmann::json& capabilities,
                              const nlohmann::json& client_info);

    std::vector<RemoteToolDefinition> list_tools();

    // Tool-level failure comes back as is_error=true; only transport-level
    // failure throws.
    CallToolResult call_tool(const std::string& name, const nlohmann::json& arguments);

    // Delivery side, driven by the reader of the child's stdout.
    void handle_message(const nlohmann::json& message);
    void handle_close(const std::string& reason);

    bool initialized() const { return initialized_.load(); }
    const std::string& server_name() const { return server_name_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    size_t pending_count() const;

private:
    struct PendingCall {
        std::string method;
        std::promise<nlohmann::json> promise;
    };

    void handle_response(const nlohmann::json& message);
    void answer_server_request(const nlohmann::json& message);
    void require_initialized(const char* method) const;

    RpcTransport& transport_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex mutex_;
    std::unordered_map<int64_t, PendingCall> pending_;
    int64_t next_id_ = 1;
    bool closed_ = false;
    std::string close_reason_;

    std::atomic<bool> initialized_{false};
    std::string server_name_;
};

} // namespace autoship
