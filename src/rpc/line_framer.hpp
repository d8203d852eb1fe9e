#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstddef>

namespace autoship {

enum class MessageKind { Request, Response, Notification, Invalid };

// Request: method + id. Response: id + (result | error), no method.
// Notification: method, no id.
MessageKind classify_message(const nlohmann::json& message);

// Splits a byte stream into newline-delimited JSON messages.
//
// Bytes arrive in arbitrary chunks via feed(); next() yields each complete
// line parsed as a JSON object. The unterminated tail stays buffered until
// its newline arrives, so the parsed sequence does not depend on where the
// chunk boundaries fall. Lines that fail to parse are dropped and counted;
// blank lines are skipped.
class LineFramer {
public:
    void feed(const char* data, size_t len);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // Next complete message, or nullopt when no full line is buffered.
    std::optional<nlohmann::json> next();

    size_t dropped_lines() const { return dropped_; }
    size_t buffered_bytes() const { return buffer_.size() - head_; }

    // Single-line JSON + '\n'. Invalid UTF-8 is replaced, never thrown on.
    static std::string encode(const nlohmann::json& message);

private:
    void compact();

    std::string buffer_;
    size_t head_ = 0; // start of the first unconsumed line
    size_t dropped_ = 0;
};

} // namespace autoship
