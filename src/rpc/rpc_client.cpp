#include "rpc_client.hpp"
#include "line_framer.hpp"
#include "../errors.hpp"
#include <iostream>

using json = nlohmann::json;

namespace autoship {

std::string CallToolResult::text() const {
    std::string out;
    for (size_t i = 0; i < content.size(); ++i) {
        if (i > 0) out += "\n";
        out += content[i];
    }
    if (out.empty()) {
        return raw.dump(-1, ' ', false, json::error_handler_t::replace);
    }
    return out;
}

RpcClient::RpcClient(RpcTransport& transport, std::chrono::milliseconds timeout)
    : transport_(transport), timeout_(timeout) {}

void RpcClient::send_notification(const std::string& method, const json& params) {
    json message = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
    transport_.send_line(LineFramer::encode(message));
}

json RpcClient::send_request(const std::string& method, const json& params) {
    int64_t id = 0;
    std::future<json> response;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw RpcError(close_reason_);
        }
        id = next_id_++;
        PendingCall call;
        call.method = method;
        response = call.promise.get_future();
        pending_.emplace(id, std::move(call));
    }

    json message = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    try {
        transport_.send_line(LineFramer::encode(message));
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
        throw RpcError(std::string("Failed to send ") + method + ": " + e.what());
    }

    if (response.wait_for(timeout_) == std::future_status::timeout) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            removed = pending_.erase(id) > 0;
        }
        if (removed) {
            throw RpcTimeout(method);
        }
        // The response won the race; its promise is being fulfilled.
    }
    return response.get();
}

json RpcClient::initialize(const std::string& protocol_version,
                           const json& capabilities,
                           const json& client_info) {
    json params = {
        {"protocolVersion", protocol_version},
        {"capabilities", capabilities},
        {"clientInfo", client_info}
    };
    json result = send_request("initialize", params);

    if (result.is_object() && result.contains("serverInfo") && result["serverInfo"].is_object()) {
        server_name_ = result["serverInfo"].value("name", "unknown");
    } else {
        server_name_ = "unknown";
    }

    send_notification("notifications/initialized");
    initialized_.store(true);
    return result;
}

void RpcClient::require_initialized(const char* method) const {
    if (!initialized_.load()) {
        throw RpcError(std::string(method) + " called before the session was initialized");
    }
}

std::vector<RemoteToolDefinition> RpcClient::list_tools() {
    require_initialized("tools/list");

    std::vector<RemoteToolDefinition> tools;
    std::string cursor;
    for (size_t page = 0; page < kMaxToolPages; ++page) {
        json params = json::object();
        if (!cursor.empty()) params["cursor"] = cursor;

        json result = send_request("tools/list", params);
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
            throw RpcError("tools/list returned no tools array");
        }

        for (const auto& t : result["tools"]) {
            if (!t.is_object()) continue;
            RemoteToolDefinition def;
            def.name = t.value("name", "");
            def.description = t.value("description", "");
            if (t.contains("inputSchema") && t["inputSchema"].is_object()) {
                def.input_schema = t["inputSchema"];
            } else {
                def.input_schema = {{"type", "object"}, {"properties", json::object()}};
            }
            if (!def.name.empty()) tools.push_back(std::move(def));
        }

        if (result.contains("nextCursor") && result["nextCursor"].is_string()) {
            cursor = result["nextCursor"].get<std::string>();
            if (cursor.empty()) break;
        } else {
            break;
        }
    }
    return tools;
}

CallToolResult RpcClient::call_tool(const std::string& name, const json& arguments) {
    require_initialized("tools/call");

    json result = send_request("tools/call", {{"name", name}, {"arguments", arguments}});

    CallToolResult out;
    out.raw = result;
    if (!result.is_object()) return out;

    out.is_error = result.value("isError", false);
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& item : result["content"]) {
            if (item.is_object() && item.contains("text") && item["text"].is_string()) {
                out.content.push_back(item["text"].get<std::string>());
            }
        }
    }
    return out;
}

void RpcClient::handle_message(const json& message) {
    switch (classify_message(message)) {
        case MessageKind::Response:
            handle_response(message);
            break;
        case MessageKind::Request:
            answer_server_request(message);
            break;
        case MessageKind::Notification:
        case MessageKind::Invalid:
            break;
    }
}

void RpcClient::handle_response(const json& message) {
    const auto& id_field = message["id"];
    if (!id_field.is_number_integer()) {
        std::cerr << "[rpc] Ignoring response with non-integer id: " << id_field.dump() << "\n";
        return;
    }

    PendingCall call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id_field.get<int64_t>());
        if (it == pending_.end()) {
            std::cerr << "[rpc] Ignoring response for unknown or expired id "
                      << id_field.get<int64_t>() << "\n";
            return;
        }
        call = std::move(it->second);
        pending_.erase(it);
    }

    if (message.contains("error") && !message["error"].is_null()) {
        const auto& err = message["error"];
        std::string text = "Unknown error";
        std::optional<int> code;
        if (err.is_object()) {
            if (err.contains("message") && err["message"].is_string()) {
                text = err["message"].get<std::string>();
            }
            if (err.contains("code") && err["code"].is_number_integer()) {
                code = err["code"].get<int>();
            }
        } else if (err.is_string()) {
            text = err.get<std::string>();
        }
        call.promise.set_exception(std::make_exception_ptr(RpcError(text, code)));
        return;
    }
    call.promise.set_value(message.contains("result") ? message["result"] : json());
}

void RpcClient::answer_server_request(const json& message) {
    json reply = {{"jsonrpc", "2.0"}, {"id", message["id"]}};
    if (message["method"] == "ping") {
        reply["result"] = json::object();
    } else {
        reply["error"] = {{"code", -32601},
                          {"message", "Method not found: " + message["method"].get<std::string>()}};
    }
    try {
        transport_.send_line(LineFramer::encode(reply));
    } catch (const std::exception& e) {
        std::cerr << "[rpc] Failed to answer server request: " << e.what() << "\n";
    }
}

void RpcClient::handle_close(const std::string& reason) {
    std::unordered_map<int64_t, PendingCall> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        close_reason_ = reason;
        orphaned.swap(pending_);
    }
    for (auto& [id, call] : orphaned) {
        call.promise.set_exception(std::make_exception_ptr(
            RpcError(reason)));
    }
}

size_t RpcClient::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace autoship
