#include "remote_tools.hpp"
#include "../errors.hpp"
#include <iostream>

namespace autoship {

RemoteToolSession::~RemoteToolSession() {
    close();
}

void RemoteToolSession::connect(const ProcessSpec& spec,
                                std::chrono::milliseconds timeout,
                                const nlohmann::json& client_info) {
    close();

    process_ = std::make_unique<ToolServerProcess>();
    client_ = std::make_unique<RpcClient>(*process_, timeout);
    RpcClient* client = client_.get();

    try {
        process_->start(spec,
            [client](const nlohmann::json& message) { client->handle_message(message); },
            [client](const std::string& reason) { client->handle_close(reason); });

        client_->initialize(RpcClient::kProtocolVersion,
                            nlohmann::json::object(), client_info);
        server_name_ = client_->server_name();
        tools_ = client_->list_tools();
    } catch (const StartupError&) {
        close();
        throw;
    } catch (const std::exception& e) {
        close();
        throw StartupError(std::string("Tool server handshake failed: ") + e.what());
    }

    std::cerr << "[remote] Connected to " << server_name_ << " with "
              << tools_.size() << " tool(s)\n";
}

void RemoteToolSession::close() {
    // Stop the reader thread first; it calls into the client.
    if (process_) process_->close();
    client_.reset();
    process_.reset();
    tools_.clear();
}

} // namespace autoship
