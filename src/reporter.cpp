#include "reporter.hpp"
#include "event.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace autoship {

namespace {

std::string rule(const char* unit, size_t n) {
    std::string s;
    for (size_t i = 0; i < n; ++i) s += unit;
    return s;
}

std::string pretty_arguments(const std::string& raw) {
    nlohmann::json j = nlohmann::json::parse(raw, nullptr, false);
    if (j.is_discarded()) return raw;
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

ConsoleReporter::ConsoleReporter(EventBus& bus, std::ostream& out, uint32_t result_preview)
    : out_(out), result_preview_(result_preview) {
    subscriptions_.push_back(scoped_subscribe<TurnStartedEvent>(bus,
        [this](const TurnStartedEvent& ev) {
            out_ << "\n" << rule("─", 40) << "\n"
                 << "Turn " << ev.turn << "/" << ev.max_turns << "\n"
                 << rule("─", 40) << "\n\n";
        }));

    subscriptions_.push_back(scoped_subscribe<ProviderResponseEvent>(bus,
        [this](const ProviderResponseEvent& ev) {
            if (!ev.text.empty()) out_ << "Assistant: " << ev.text << "\n";
        }));

    subscriptions_.push_back(scoped_subscribe<ToolCallRequestEvent>(bus,
        [this](const ToolCallRequestEvent& ev) {
            out_ << "\nTool: " << ev.tool_name << "\n"
                 << "   Input: " << indent_lines(pretty_arguments(ev.arguments), "   ")
                 << "\n";
        }));

    subscriptions_.push_back(scoped_subscribe<ToolCallResultEvent>(bus,
        [this](const ToolCallResultEvent& ev) {
            std::string preview = truncate_with_marker(ev.output, result_preview_,
                                                       "\n... (truncated)");
            out_ << "\n   " << ev.tool_name << (ev.success ? "" : " [error]")
                 << " result: " << indent_lines(preview, "   ") << "\n";
        }));

    subscriptions_.push_back(scoped_subscribe<RunFinishedEvent>(bus,
        [this](const RunFinishedEvent& ev) {
            std::string outcome = ev.outcome;
            if (outcome == "completed") {
                out_ << "\n" << rule("=", 60) << "\nAgent completed after "
                     << ev.turns << " turn(s)\n" << rule("=", 60) << "\n";
            } else if (outcome == "max_turns_reached") {
                out_ << "\nMax turns reached (" << ev.turns << "), stopping agent.\n";
            } else {
                out_ << "\nAgent stopped (" << outcome << ")";
                if (!ev.error.empty()) out_ << ": " << ev.error;
                out_ << "\n";
            }
            out_.flush();
        }));
}

} // namespace autoship
