#include "config.hpp"
#include "provider.hpp"
#include "tool.hpp"
#include "tool_router.hpp"
#include "agent.hpp"
#include "http.hpp"
#include "event_bus.hpp"
#include "reporter.hpp"
#include "prompt.hpp"
#include "util.hpp"
#include "rpc/remote_tools.hpp"
#include "rpc/tool_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <chrono>

#ifndef AUTOSHIP_VERSION
#define AUTOSHIP_VERSION "dev"
#endif

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: autoship [options] [PROMPT]\n"
              << "\n"
              << "Runs the agent until the model stops calling tools or the turn\n"
              << "limit is hit. Without PROMPT, works through one pending task.\n"
              << "\n"
              << "Options:\n"
              << "  --model NAME         Use specific model\n"
              << "  --max-turns N        Stop after N model calls (default: 50)\n"
              << "  --server \"CMD ARGS\"  Tool server command line\n"
              << "  --parallel-tools     Run the tool calls of one turn concurrently\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  ANTHROPIC_API_KEY    API key for Anthropic (required)\n"
              << "  ANTHROPIC_BASE_URL   Override the API base URL\n"
              << "  SUPABASE_URL         Passed to the tool server (required)\n"
              << "  SUPABASE_SERVICE_KEY Passed to the tool server (required)\n"
              << "  AUTOSHIP_CONFIG      Config file (default: ~/.autoship/config.json)\n"
              << "  AUTOSHIP_MODEL       Model override\n"
              << "  AUTOSHIP_MAX_TURNS   Turn limit override\n"
              << "  AUTOSHIP_TOOL_SERVER Tool server command line override\n"
              << "\n"
              << "Exit status: 0 completed, 2 max turns reached, 1 failure.\n";
}

static int exit_status(autoship::RunOutcome outcome) {
    switch (outcome) {
        case autoship::RunOutcome::Completed: return 0;
        case autoship::RunOutcome::MaxTurnsReached: return 2;
        case autoship::RunOutcome::ProviderFailed:
        case autoship::RunOutcome::Aborted: return 1;
    }
    return 1;
}

int main(int argc, char* argv[]) try {
    std::string prompt;
    std::string model_name;
    std::string server_line;
    long max_turns = -1;
    bool parallel_tools = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--max-turns") == 0 && i + 1 < argc) {
            try {
                max_turns = std::stol(argv[++i]);
            } catch (const std::exception&) {
                max_turns = 0;
            }
            if (max_turns <= 0) {
                std::cerr << "Error: --max-turns expects a positive number\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            server_line = argv[++i];
        } else if (std::strcmp(argv[i], "--parallel-tools") == 0) {
            parallel_tools = true;
        } else if (argv[i][0] == '-' || !prompt.empty()) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            prompt = argv[i];
        }
    }

    auto config = autoship::Config::load();

    if (!model_name.empty()) {
        config.model = model_name;
    }
    if (max_turns > 0) {
        config.agent.max_turns = static_cast<uint32_t>(max_turns);
    }
    if (parallel_tools) {
        config.agent.parallel_tools = true;
    }
    if (!server_line.empty()) {
        auto parts = autoship::split_whitespace(server_line);
        if (parts.empty()) {
            std::cerr << "Error: --server needs a command\n";
            return 1;
        }
        config.tool_server.command = parts[0];
        config.tool_server.entry.clear();
        config.tool_server.args.assign(parts.begin() + 1, parts.end());
    }

    auto missing = config.missing_credentials();
    if (!missing.empty()) {
        std::cerr << "Error: missing required environment variables:\n";
        for (const auto& name : missing) {
            std::cerr << "  - " << name << "\n";
        }
        return 1;
    }

    if (prompt.empty()) {
        prompt = autoship::default_instruction(config.tool_server.tool_prefix);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    autoship::http_init();
    autoship::http_set_abort_flag(&g_shutdown);

    std::cout << std::string(60, '=') << "\n"
              << "autoship " << AUTOSHIP_VERSION << "\n"
              << "Model: " << config.model
              << " | Max turns: " << config.agent.max_turns << "\n"
              << std::string(60, '=') << "\n\n";

    autoship::ProcessSpec spec;
    spec.command = config.tool_server.command;
    spec.env = config.tool_server_env();

    autoship::RemoteToolSession remote;
    try {
        if (!config.tool_server.entry.empty()) {
            std::string exe_dir = autoship::executable_dir(argv[0]);
            spec.args.push_back(autoship::locate_server_entry(
                config.tool_server.entry, {".", exe_dir, exe_dir + "/.."}));
        }
        spec.args.insert(spec.args.end(), config.tool_server.args.begin(),
                         config.tool_server.args.end());
        remote.connect(spec,
                       std::chrono::seconds(config.tool_server.request_timeout),
                       {{"name", "autoship"}, {"version", AUTOSHIP_VERSION}});
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        autoship::http_cleanup();
        return 1;
    }
    std::cout << "Connected to tool server " << remote.server_name() << "\n"
              << "Loaded " << remote.tools().size() << " remote tool(s)\n";

    autoship::PlatformHttpClient http_client;
    std::unique_ptr<autoship::Provider> provider;
    try {
        provider = autoship::create_provider(
            "anthropic",
            config.anthropic.api_key,
            http_client,
            config.anthropic.base_url,
            config.max_tokens);
    } catch (const std::exception& e) {
        std::cerr << "Error creating provider: " << e.what() << "\n";
        autoship::http_cleanup();
        return 1;
    }

    autoship::ToolRouter router(
        autoship::create_builtin_tools(config.agent.shell_timeout, &g_shutdown),
        remote.tools(), remote.client(), config.tool_server.tool_prefix);

    autoship::EventBus bus;
    autoship::ConsoleReporter reporter(bus, std::cout, config.agent.result_preview);

    autoship::Agent agent(std::move(provider), router, config);
    agent.set_event_bus(&bus);
    agent.set_abort_flag(&g_shutdown);

    autoship::RunResult result = agent.run(prompt);

    remote.close();
    autoship::http_cleanup();

    if (result.outcome == autoship::RunOutcome::ProviderFailed) {
        std::cerr << "Error calling provider: " << result.error << "\n";
    }
    return exit_status(result.outcome);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
