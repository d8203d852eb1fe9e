#pragma once
#include "event_bus.hpp"
#include <cstdint>
#include <ostream>
#include <vector>

namespace autoship {

// Operator-facing progress log: turn banners, assistant text, each tool
// call with its input, a preview of each result, and the final outcome.
class ConsoleReporter {
public:
    ConsoleReporter(EventBus& bus, std::ostream& out, uint32_t result_preview = 500);

    ConsoleReporter(const ConsoleReporter&) = delete;
    ConsoleReporter& operator=(const ConsoleReporter&) = delete;

private:
    std::ostream& out_;
    uint32_t result_preview_;
    std::vector<Subscription> subscriptions_;
};

} // namespace autoship
