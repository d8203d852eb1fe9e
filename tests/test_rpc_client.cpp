#include <catch2/catch_test_macros.hpp>
#include "rpc/rpc_client.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include <future>
#include <thread>

using namespace autoship;
using json = nlohmann::json;
using namespace std::chrono_literals;

// ── Requests ────────────────────────────────────────────────────

TEST_CASE("RpcClient: request carries jsonrpc, id, method, params", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);
    transport.client = &client;
    transport.responder = [](const json& req) { return rpc_result(req, {{"pong", true}}); };

    json result = client.send_request("echo", {{"x", 1}});
    REQUIRE(result["pong"] == true);

    auto sent = transport.sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0]["jsonrpc"] == "2.0");
    REQUIRE(sent[0]["method"] == "echo");
    REQUIRE(sent[0]["params"]["x"] == 1);
    REQUIRE(sent[0]["id"].is_number_integer());
    REQUIRE(client.pending_count() == 0);
}

TEST_CASE("RpcClient: ids are fresh per request", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);
    transport.client = &client;
    transport.responder = [](const json& req) { return rpc_result(req, json::object()); };

    client.send_request("a");
    client.send_request("b");
    auto sent = transport.sent();
    REQUIRE(sent[0]["id"] != sent[1]["id"]);
}

TEST_CASE("RpcClient: notification has no id and creates no pending call", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);

    client.send_notification("notifications/initialized");
    auto sent = transport.sent();
    REQUIRE(sent.size() == 1);
    REQUIRE_FALSE(sent[0].contains("id"));
    REQUIRE(client.pending_count() == 0);
}

TEST_CASE("RpcClient: error response raises RpcError with code", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);
    transport.client = &client;
    transport.responder = [](const json& req) -> json {
        return {{"jsonrpc", "2.0"}, {"id", req["id"]},
                {"error", {{"code", -32602}, {"message", "bad params"}}}};
    };

    try {
        client.send_request("tools/call");
        FAIL("expected RpcError");
    } catch (const RpcError& e) {
        REQUIRE(std::string(e.what()) == "bad params");
        REQUIRE(e.code() == -32602);
    }
    REQUIRE(client.pending_count() == 0);
}

TEST_CASE("RpcClient: write failure leaves no pending call", "[rpc_client]") {
    FakeTransport transport;
    transport.fail_writes = true;
    RpcClient client(transport, 1s);

    REQUIRE_THROWS_AS(client.send_request("x"), RpcError);
    REQUIRE(client.pending_count() == 0);
}

// ── Correlation ─────────────────────────────────────────────────

TEST_CASE("RpcClient: concurrent requests resolve by id, not arrival order", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 5s);

    auto a = std::async(std::launch::async, [&] { return client.send_request("a"); });
    auto b = std::async(std::launch::async, [&] { return client.send_request("b"); });
    auto c = std::async(std::launch::async, [&] { return client.send_request("c"); });

    REQUIRE(transport.wait_for_sent(3, 2s));
    auto sent = transport.sent();

    // Answer in reverse order, echoing the method name.
    for (auto it = sent.rbegin(); it != sent.rend(); ++it) {
        client.handle_message(rpc_result(*it, {{"method", (*it)["method"]}}));
    }

    REQUIRE(a.get()["method"] == "a");
    REQUIRE(b.get()["method"] == "b");
    REQUIRE(c.get()["method"] == "c");
    REQUIRE(client.pending_count() == 0);
}

TEST_CASE("RpcClient: response for unknown id is ignored", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);
    REQUIRE_NOTHROW(client.handle_message({{"jsonrpc", "2.0"}, {"id", 999}, {"result", 1}}));
    REQUIRE(client.pending_count() == 0);
}

// ── Timeout ─────────────────────────────────────────────────────

TEST_CASE("RpcClient: silent server times out and leaves no pending call", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 50ms);

    try {
        client.send_request("tools/call");
        FAIL("expected RpcTimeout");
    } catch (const RpcTimeout& e) {
        REQUIRE(e.method() == "tools/call");
        REQUIRE(std::string(e.what()) == "Request tools/call timed out");
    }
    REQUIRE(client.pending_count() == 0);

    // A late response for the expired id is dropped quietly.
    auto sent = transport.sent();
    REQUIRE_NOTHROW(client.handle_message(rpc_result(sent[0], json::object())));
    REQUIRE(client.pending_count() == 0);
}

// ── Close ───────────────────────────────────────────────────────

TEST_CASE("RpcClient: close rejects pending calls immediately", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 10s);

    auto call = std::async(std::launch::async, [&] { return client.send_request("slow"); });
    REQUIRE(transport.wait_for_sent(1, 2s));

    auto start = std::chrono::steady_clock::now();
    client.handle_close("tool server closed the connection");
    REQUIRE_THROWS_AS(call.get(), RpcError);
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE(client.pending_count() == 0);

    // Later requests fail without writing.
    REQUIRE_THROWS_AS(client.send_request("after"), RpcError);
    REQUIRE(transport.sent().size() == 1);
}

// ── Server-initiated requests ───────────────────────────────────

TEST_CASE("RpcClient: answers ping and rejects unknown server methods", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);

    client.handle_message({{"jsonrpc", "2.0"}, {"id", "s1"}, {"method", "ping"}});
    client.handle_message({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "sampling/createMessage"}});
    client.handle_message({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});

    auto sent = transport.sent();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[0]["id"] == "s1");
    REQUIRE(sent[0]["result"] == json::object());
    REQUIRE(sent[1]["id"] == 5);
    REQUIRE(sent[1]["error"]["code"] == -32601);
}

// ── Handshake and tools ─────────────────────────────────────────

TEST_CASE("RpcClient: initialize sends request then initialized notification", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);
    transport.client = &client;
    transport.responder = mcp_responder(json::array());

    REQUIRE_FALSE(client.initialized());
    json caps = client.initialize(RpcClient::kProtocolVersion, json::object(),
                                  {{"name", "autoship"}, {"version", "test"}});
    REQUIRE(client.initialized());
    REQUIRE(client.server_name() == "fake-server");
    REQUIRE(caps["capabilities"].contains("tools"));

    auto sent = transport.sent();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[0]["method"] == "initialize");
    REQUIRE(sent[0]["params"]["protocolVersion"] == "2024-11-05");
    REQUIRE(sent[0]["params"]["clientInfo"]["name"] == "autoship");
    REQUIRE(sent[1]["method"] == "notifications/initialized");
    REQUIRE_FALSE(sent[1].contains("id"));
}

TEST_CASE("RpcClient: list_tools before initialize fails loudly", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);
    REQUIRE_THROWS_AS(client.list_tools(), RpcError);
    REQUIRE_THROWS_AS(client.call_tool("x", json::object()), RpcError);
    REQUIRE(transport.sent().empty());
}

TEST_CASE("RpcClient: list_tools parses definitions", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);
    transport.client = &client;
    transport.responder = mcp_responder(json::array({
        {{"name", "list_pending_tasks"}, {"description", "List tasks"},
         {"inputSchema", {{"type", "object"}, {"properties", {{"limit", {{"type", "number"}}}}}}}},
        {{"name", "claim_task"}}
    }));

    client.initialize(RpcClient::kProtocolVersion, json::object(), json::object());
    auto tools = client.list_tools();

    REQUIRE(tools.size() == 2);
    REQUIRE(tools[0].name == "list_pending_tasks");
    REQUIRE(tools[0].description == "List tasks");
    REQUIRE(tools[0].input_schema["properties"].contains("limit"));
    REQUIRE(tools[1].input_schema["type"] == "object");
}

TEST_CASE("RpcClient: list_tools follows nextCursor", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);
    transport.client = &client;
    auto base = mcp_responder(json::array());
    transport.responder = [base](const json& req) -> json {
        if (req.value("method", "") != "tools/list") return base(req);
        if (!req["params"].contains("cursor")) {
            return rpc_result(req, {{"tools", {{{"name", "one"}}}}, {"nextCursor", "p2"}});
        }
        REQUIRE(req["params"]["cursor"] == "p2");
        return rpc_result(req, {{"tools", {{{"name", "two"}}}}});
    };

    client.initialize(RpcClient::kProtocolVersion, json::object(), json::object());
    auto tools = client.list_tools();
    REQUIRE(tools.size() == 2);
    REQUIRE(tools[0].name == "one");
    REQUIRE(tools[1].name == "two");
}

TEST_CASE("RpcClient: call_tool joins text content and keeps isError", "[rpc_client]") {
    FakeTransport transport;
    RpcClient client(transport, 1s);
    transport.client = &client;
    transport.responder = mcp_responder(json::array(), [](const json& req) {
        if (req["params"]["name"] == "fails") {
            return rpc_result(req, {{"content", {{{"type", "text"}, {"text", "no such task"}}}},
                                    {"isError", true}});
        }
        return rpc_result(req, {{"content", {{{"type", "text"}, {"text", "line 1"}},
                                             {{"type", "text"}, {"text", "line 2"}}}}});
    });

    client.initialize(RpcClient::kProtocolVersion, json::object(), json::object());

    auto ok = client.call_tool("claim_task", {{"task_id", "t1"}});
    REQUIRE_FALSE(ok.is_error);
    REQUIRE(ok.text() == "line 1\nline 2");
    auto sent = transport.sent();
    REQUIRE(sent.back()["params"]["name"] == "claim_task");
    REQUIRE(sent.back()["params"]["arguments"]["task_id"] == "t1");

    auto bad = client.call_tool("fails", json::object());
    REQUIRE(bad.is_error);
    REQUIRE(bad.text() == "no such task");
}

TEST_CASE("CallToolResult: falls back to raw JSON without text content", "[rpc_client]") {
    CallToolResult r;
    r.raw = {{"content", json::array()}};
    REQUIRE(r.text() == R"({"content":[]})");
}
