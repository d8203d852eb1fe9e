#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace autoship {

// Root of every failure this codebase throws on purpose.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unreadable or closed byte stream to the tool server.
class TransportError : public Error {
public:
    using Error::Error;
};

// The remote side answered with an error object, or the session is unusable.
class RpcError : public Error {
public:
    explicit RpcError(const std::string& message, std::optional<int> code = std::nullopt)
        : Error(message), code_(code) {}

    std::optional<int> code() const { return code_; }

private:
    std::optional<int> code_;
};

// No response arrived before the per-call deadline.
class RpcTimeout : public Error {
public:
    explicit RpcTimeout(const std::string& method)
        : Error("Request " + method + " timed out"), method_(method) {}

    const std::string& method() const { return method_; }

private:
    std::string method_;
};

// A built-in could not run at all (no pipes, no fork). Bad input and failed
// commands are results, not exceptions. The router turns this into an error
// result; it never reaches the loop.
class ToolExecutionError : public Error {
public:
    using Error::Error;
};

// Tool server could not be spawned or the handshake failed.
class StartupError : public Error {
public:
    using Error::Error;
};

// Model service unreachable or returned something unusable.
class ProviderError : public Error {
public:
    using Error::Error;
};

} // namespace autoship
