#include <catch2/catch_test_macros.hpp>
#include "rpc/tool_server.hpp"
#include "rpc/remote_tools.hpp"
#include "errors.hpp"
#include "tools/bash.hpp"
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace autoship;
using json = nlohmann::json;
using namespace std::chrono_literals;

// Minimal line-protocol server in POSIX sh. Pulls the numeric id out of
// each request and answers by method.
static const char* kShServer = R"SH(
while IFS= read -r line; do
  id=$(printf '%s' "$line" | sed -n 's/.*"id":\([0-9][0-9]*\).*/\1/p')
  case "$line" in
    *'"method":"initialize"'*)
      echo "server ready" >&2
      printf '{"jsonrpc":"2.0","id":%s,"result":{"protocolVersion":"2024-11-05","capabilities":{},"serverInfo":{"name":"sh-server","version":"1"}}}\n' "$id" ;;
    *'"method":"tools/list"'*)
      printf 'not json, should be dropped\n'
      printf '{"jsonrpc":"2.0","id":%s,"result":{"tools":[{"name":"whoami","description":"Echo env","inputSchema":{"type":"object"}}]}}\n' "$id" ;;
    *'"method":"tools/call"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"token=%s"}]}}\n' "$id" "$AUTOSHIP_TEST_TOKEN" ;;
  esac
done
)SH";

static ProcessSpec sh_spec(const std::string& script) {
    ProcessSpec spec;
    spec.command = "/bin/sh";
    spec.args = {"-c", script};
    return spec;
}

// ── Stderr heuristic ────────────────────────────────────────────

TEST_CASE("is_diagnostic_error: flags error-like lines only", "[tool_server]") {
    REQUIRE(is_diagnostic_error("Error: connection refused"));
    REQUIRE(is_diagnostic_error("FATAL could not bind"));
    REQUIRE(is_diagnostic_error("thread panicked"));
    REQUIRE(is_diagnostic_error("Unhandled exception in handler"));
    REQUIRE_FALSE(is_diagnostic_error("server listening on stdio"));
    REQUIRE_FALSE(is_diagnostic_error(""));
}

// ── Process lifecycle ───────────────────────────────────────────

TEST_CASE("ToolServerProcess: missing executable is a StartupError", "[tool_server]") {
    ToolServerProcess proc;
    ProcessSpec spec;
    spec.command = "/nonexistent/autoship-tool-server";
    REQUIRE_THROWS_AS(proc.start(spec, nullptr, nullptr), StartupError);
    REQUIRE_FALSE(proc.running());
}

// ── Entry script lookup ─────────────────────────────────────────

TEST_CASE("locate_server_entry: finds the script in a later search directory", "[tool_server]") {
    namespace fs = std::filesystem;
    fs::path base = fs::temp_directory_path() /
                    ("autoship_entry_" + std::to_string(getpid()));
    fs::create_directories(base / "bin");
    fs::create_directories(base / "server" / "dist");
    std::ofstream(base / "server" / "dist" / "index.js") << "// server\n";

    std::string found = locate_server_entry(
        "server/dist/index.js", {(base / "bin").string(), (base / "bin" / "..").string()});
    REQUIRE(found == (base / "server" / "dist" / "index.js").lexically_normal().string());

    // Absolute entries ignore the search directories.
    std::string absolute = (base / "server" / "dist" / "index.js").string();
    REQUIRE(locate_server_entry(absolute, {"/nonexistent"}) == absolute);

    fs::remove_all(base);
}

TEST_CASE("locate_server_entry: missing script is a StartupError naming the paths", "[tool_server]") {
    bool threw = false;
    try {
        locate_server_entry("mcp-servers/none/index.js", {"/nonexistent-a", "/nonexistent-b"});
    } catch (const StartupError& e) {
        threw = true;
        std::string msg = e.what();
        REQUIRE(msg.find("Tool server not found at") != std::string::npos);
        REQUIRE(msg.find("/nonexistent-a/mcp-servers/none/index.js") != std::string::npos);
        REQUIRE(msg.find("/nonexistent-b/mcp-servers/none/index.js") != std::string::npos);
    }
    REQUIRE(threw);
}

TEST_CASE("ToolServerProcess: empty command is a StartupError", "[tool_server]") {
    ToolServerProcess proc;
    REQUIRE_THROWS_AS(proc.start(ProcessSpec{}, nullptr, nullptr), StartupError);
}

TEST_CASE("ToolServerProcess: delivers stdout messages and reports EOF", "[tool_server]") {
    ToolServerProcess proc;
    std::vector<json> received;
    std::mutex mu;
    std::atomic<bool> closed{false};

    proc.start(sh_spec(R"(printf '{"jsonrpc":"2.0","method":"hello"}\n'; printf 'junk\n')"),
        [&](const json& msg) {
            std::lock_guard<std::mutex> lock(mu);
            received.push_back(msg);
        },
        [&](const std::string&) { closed.store(true); });

    for (int i = 0; i < 200 && !closed.load(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(closed.load());
    proc.close();

    std::lock_guard<std::mutex> lock(mu);
    REQUIRE(received.size() == 1);
    REQUIRE(received[0]["method"] == "hello");
    REQUIRE(proc.exit_code() == 0);
}

TEST_CASE("ToolServerProcess: nonzero exit status is recorded", "[tool_server]") {
    ToolServerProcess proc;
    proc.start(sh_spec("exit 3"), nullptr, nullptr);
    proc.close();
    REQUIRE(proc.exit_code() == 3);
}

TEST_CASE("ToolServerProcess: close is idempotent", "[tool_server]") {
    ToolServerProcess proc;
    proc.start(sh_spec("cat > /dev/null"), nullptr, nullptr);
    REQUIRE(proc.pid() > 0);

    proc.close();
    REQUIRE_FALSE(proc.running());
    REQUIRE_NOTHROW(proc.close());
    REQUIRE_THROWS_AS(proc.send_line("{}\n"), TransportError);
}

TEST_CASE("ToolServerProcess: child ignoring stdin is terminated", "[tool_server]") {
    ToolServerProcess proc;
    proc.start(sh_spec("sleep 30"), nullptr, nullptr);

    auto start = std::chrono::steady_clock::now();
    proc.close();
    REQUIRE(std::chrono::steady_clock::now() - start < 10s);
    REQUIRE_FALSE(proc.running());
}

TEST_CASE("ToolServerProcess: backgrounded bash command does not hold server stdin", "[tool_server]") {
    ToolServerProcess proc;
    proc.start(sh_spec("cat > /dev/null; exit 0"), nullptr, nullptr);

    BashTool bash(10);
    auto result = bash.execute(R"({"command":"sleep 3 > /dev/null 2>&1 &"})");
    REQUIRE(result.success);

    // Server sees EOF as soon as stdin closes, so no signal is needed.
    auto start = std::chrono::steady_clock::now();
    proc.close();
    REQUIRE(std::chrono::steady_clock::now() - start < 900ms);
    REQUIRE(proc.exit_code() == 0);
}

// ── RPC over a real child ───────────────────────────────────────

TEST_CASE("RemoteToolSession: handshake, listing and call over sh server", "[tool_server]") {
    ProcessSpec spec = sh_spec(kShServer);
    spec.env = {{"AUTOSHIP_TEST_TOKEN", "s3cret"}};

    RemoteToolSession session;
    session.connect(spec, 5s, {{"name", "autoship"}, {"version", "test"}});

    REQUIRE(session.connected());
    REQUIRE(session.server_name() == "sh-server");
    REQUIRE(session.tools().size() == 1);
    REQUIRE(session.tools()[0].name == "whoami");

    auto result = session.client()->call_tool("whoami", json::object());
    REQUIRE_FALSE(result.is_error);
    REQUIRE(result.text() == "token=s3cret");

    session.close();
    REQUIRE_FALSE(session.connected());
    REQUIRE_NOTHROW(session.close());
}

TEST_CASE("RemoteToolSession: server that never answers fails startup", "[tool_server]") {
    RemoteToolSession session;
    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(session.connect(sh_spec("cat > /dev/null"), 200ms, json::object()),
                      StartupError);
    REQUIRE(std::chrono::steady_clock::now() - start < 10s);
    REQUIRE_FALSE(session.connected());
}

TEST_CASE("RemoteToolSession: exit during a call rejects it without waiting", "[tool_server]") {
    // Answers the handshake, then exits on the first tools/call.
    const char* script = R"SH(
while IFS= read -r line; do
  id=$(printf '%s' "$line" | sed -n 's/.*"id":\([0-9][0-9]*\).*/\1/p')
  case "$line" in
    *'"method":"initialize"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"serverInfo":{"name":"dying"}}}\n' "$id" ;;
    *'"method":"tools/list"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"tools":[{"name":"crash"}]}}\n' "$id" ;;
    *'"method":"tools/call"'*)
      exit 1 ;;
  esac
done
)SH";

    RemoteToolSession session;
    session.connect(sh_spec(script), 30s, json::object());

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(session.client()->call_tool("crash", json::object()), RpcError);
    REQUIRE(std::chrono::steady_clock::now() - start < 10s);
}
