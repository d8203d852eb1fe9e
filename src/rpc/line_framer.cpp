#include "line_framer.hpp"

namespace autoship {

MessageKind classify_message(const nlohmann::json& message) {
    if (!message.is_object()) return MessageKind::Invalid;

    bool has_id = message.contains("id") && !message["id"].is_null();
    bool has_method = message.contains("method") && message["method"].is_string();

    if (has_method) {
        return has_id ? MessageKind::Request : MessageKind::Notification;
    }
    if (has_id && (message.contains("result") || message.contains("error"))) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

void LineFramer::feed(const char* data, size_t len) {
    buffer_.append(data, len);
}

std::optional<nlohmann::json> LineFramer::next() {
    while (true) {
        size_t nl = buffer_.find('\n', head_);
        if (nl == std::string::npos) {
            compact();
            return std::nullopt;
        }

        size_t begin = head_;
        size_t end = nl;
        head_ = nl + 1;
        if (end > begin && buffer_[end - 1] == '\r') --end;

        size_t first = buffer_.find_first_not_of(" \t", begin);
        if (first == std::string::npos || first >= end) continue;

        auto message = nlohmann::json::parse(buffer_.begin() + static_cast<std::ptrdiff_t>(begin),
                                             buffer_.begin() + static_cast<std::ptrdiff_t>(end),
                                             nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            ++dropped_;
            continue;
        }
        return message;
    }
}

void LineFramer::compact() {
    if (head_ == 0) return;
    buffer_.erase(0, head_);
    head_ = 0;
}

std::string LineFramer::encode(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

} // namespace autoship
