#include <catch2/catch_test_macros.hpp>
#include "prompt.hpp"

using namespace autoship;

TEST_CASE("default_instruction: names the prefixed task tools", "[prompt]") {
    auto text = default_instruction("mcp_");
    for (const char* tool : {"mcp_list_pending_tasks", "mcp_claim_task", "mcp_complete_task",
                             "mcp_fail_task", "mcp_ask_question",
                             "mcp_check_answered_questions"}) {
        INFO(tool);
        REQUIRE(text.find(tool) != std::string::npos);
    }
    REQUIRE(text.find("ONE task per run") != std::string::npos);
}

TEST_CASE("default_instruction: follows a custom prefix", "[prompt]") {
    auto text = default_instruction("tasks_");
    REQUIRE(text.find("tasks_claim_task") != std::string::npos);
    REQUIRE(text.find("mcp_") == std::string::npos);
}
