#include <catch2/catch_test_macros.hpp>
#include "tool.hpp"
#include "tools/bash.hpp"
#include "tools/read_file.hpp"
#include "tools/write_file.hpp"
#include "tools/list_files.hpp"
#include "tools/tool_util.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>

using namespace autoship;

// Helper: create a temp directory and return its path
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "autoship_test_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static std::string args(const nlohmann::json& j) {
    return j.dump();
}

// ═══ BashTool ═════════════════════════════════════════════════════

TEST_CASE("BashTool: echo reports exit code and stdout", "[tools]") {
    BashTool tool;
    auto result = tool.execute(R"({"command":"echo hi"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "Exit code: 0\nhi\n");
}

TEST_CASE("BashTool: stderr is appended in its own section", "[tools]") {
    BashTool tool;
    auto result = tool.execute(R"({"command":"echo out; echo err >&2"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "Exit code: 0\nout\n\nSTDERR:\nerr\n");
}

TEST_CASE("BashTool: nonzero exit is a failed result, not an exception", "[tools]") {
    BashTool tool;
    auto result = tool.execute(R"({"command":"exit 7"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Exit code: 7\n(no output)");
}

TEST_CASE("BashTool: silent success says so", "[tools]") {
    BashTool tool;
    auto result = tool.execute(R"({"command":"true"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "Exit code: 0\n(no output)");
}

TEST_CASE("BashTool: runs through bash, not sh", "[tools]") {
    BashTool tool;
    auto result = tool.execute(R"({"command":"echo ${BASH_VERSION:+bash}"})");
    REQUIRE(result.output == "Exit code: 0\nbash\n");
}

TEST_CASE("BashTool: stdin is not inherited", "[tools]") {
    BashTool tool;
    auto result = tool.execute(R"({"command":"cat; echo done"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "Exit code: 0\ndone\n");
}

TEST_CASE("BashTool: timeout kills the command", "[tools]") {
    BashTool tool(1);
    auto start = std::chrono::steady_clock::now();
    auto result = tool.execute(R"({"command":"sleep 30"})");
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.rfind("Exit code: -1\nCommand timed out after 1s\n", 0) == 0);
}

TEST_CASE("BashTool: abort flag kills a running command", "[tools]") {
    std::atomic<bool> abort_flag{false};
    BashTool tool(600, &abort_flag);

    std::thread raiser([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        abort_flag.store(true);
    });
    auto start = std::chrono::steady_clock::now();
    auto result = tool.execute(R"({"command":"sleep 5"})");
    auto elapsed = std::chrono::steady_clock::now() - start;
    raiser.join();

    REQUIRE(elapsed < std::chrono::seconds(1));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.rfind("Exit code: -1\nCommand aborted by shutdown\n", 0) == 0);
}

TEST_CASE("BashTool: unraised abort flag does not disturb a command", "[tools]") {
    std::atomic<bool> abort_flag{false};
    BashTool tool(600, &abort_flag);
    auto result = tool.execute(R"({"command":"sleep 0.3; echo ok"})");
    REQUIRE(result.success);
    REQUIRE(result.output == "Exit code: 0\nok\n");
}

TEST_CASE("BashTool: missing command parameter", "[tools]") {
    BashTool tool;
    auto result = tool.execute(R"({})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("command") != std::string::npos);
}

TEST_CASE("BashTool: invalid JSON args", "[tools]") {
    BashTool tool;
    auto result = tool.execute("not json");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("parse") != std::string::npos);
}

// ═══ ReadFileTool ════════════════════════════════════════════════

TEST_CASE("ReadFileTool: reads existing file", "[tools]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    auto file = dir + "/test.txt";
    write_file(file, "hello world");

    ReadFileTool tool;
    auto result = tool.execute(args({{"path", file}}));
    REQUIRE(result.success);
    REQUIRE(result.output == "hello world");

    std::filesystem::remove_all(dir);
}

TEST_CASE("ReadFileTool: large file is truncated", "[tools]") {
    auto dir = make_temp_dir();
    auto file = dir + "/big.txt";
    write_file(file, std::string(60000, 'x'));

    ReadFileTool tool;
    auto result = tool.execute(args({{"path", file}}));
    REQUIRE(result.success);
    REQUIRE(result.output.size() == 50000 + std::string("\n[truncated]").size());

    std::filesystem::remove_all(dir);
}

TEST_CASE("ReadFileTool: nonexistent file degrades to error text", "[tools]") {
    ReadFileTool tool;
    auto result = tool.execute(R"({"path":"/tmp/autoship_test_no_such_file_ever.txt"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.rfind("Error reading file:", 0) == 0);
}

TEST_CASE("ReadFileTool: directory is rejected", "[tools]") {
    auto dir = make_temp_dir();
    ReadFileTool tool;
    auto result = tool.execute(args({{"path", dir}}));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("is a directory") != std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST_CASE("ReadFileTool: rejects path traversal", "[tools]") {
    ReadFileTool tool;
    auto result = tool.execute(R"({"path":"../../../etc/passwd"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("..") != std::string::npos);
}

// ═══ WriteFileTool ═══════════════════════════════════════════════

TEST_CASE("WriteFileTool: writes new file and confirms", "[tools]") {
    auto dir = make_temp_dir();
    auto file = dir + "/out.txt";

    WriteFileTool tool;
    auto result = tool.execute(args({{"path", file}, {"content", "written"}}));
    REQUIRE(result.success);
    REQUIRE(result.output == "Successfully wrote to " + file);
    REQUIRE(read_file(file) == "written");

    std::filesystem::remove_all(dir);
}

TEST_CASE("WriteFileTool: creates parent directories and overwrites", "[tools]") {
    auto dir = make_temp_dir();
    auto file = dir + "/a/b/c.txt";

    WriteFileTool tool;
    REQUIRE(tool.execute(args({{"path", file}, {"content", "first"}})).success);
    REQUIRE(tool.execute(args({{"path", file}, {"content", "second"}})).success);
    REQUIRE(read_file(file) == "second");

    std::filesystem::remove_all(dir);
}

TEST_CASE("WriteFileTool: missing content parameter", "[tools]") {
    WriteFileTool tool;
    auto result = tool.execute(R"({"path":"/tmp/x.txt"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("content") != std::string::npos);
}

TEST_CASE("WriteFileTool: rejects path traversal", "[tools]") {
    WriteFileTool tool;
    auto result = tool.execute(R"({"path":"../evil.txt","content":"x"})");
    REQUIRE_FALSE(result.success);
}

// ═══ ListFilesTool ═══════════════════════════════════════════════

TEST_CASE("ListFilesTool: lists entries sorted with markers", "[tools]") {
    auto dir = make_temp_dir();
    write_file(dir + "/b.txt", "12345");
    std::filesystem::create_directory(dir + "/a_dir");
    write_file(dir + "/a_dir/nested.txt", "x");

    ListFilesTool tool;
    auto result = tool.execute(args({{"path", dir}}));
    REQUIRE(result.success);
    REQUIRE(result.output == "a_dir/\nb.txt (5 bytes)\n");

    std::filesystem::remove_all(dir);
}

TEST_CASE("ListFilesTool: recursive listing uses relative paths", "[tools]") {
    auto dir = make_temp_dir();
    std::filesystem::create_directory(dir + "/sub");
    write_file(dir + "/sub/inner.txt", "abc");

    ListFilesTool tool;
    auto result = tool.execute(args({{"path", dir}, {"recursive", true}}));
    REQUIRE(result.success);
    REQUIRE(result.output == "sub/\nsub/inner.txt (3 bytes)\n");

    std::filesystem::remove_all(dir);
}

TEST_CASE("ListFilesTool: empty directory", "[tools]") {
    auto dir = make_temp_dir();
    ListFilesTool tool;
    auto result = tool.execute(args({{"path", dir}}));
    REQUIRE(result.success);
    REQUIRE(result.output == "(empty directory)");
    std::filesystem::remove_all(dir);
}

TEST_CASE("ListFilesTool: missing directory degrades to error text", "[tools]") {
    ListFilesTool tool;
    auto result = tool.execute(R"({"path":"/tmp/autoship_test_no_such_dir"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output.find("not a directory") != std::string::npos);
}

TEST_CASE("ListFilesTool: defaults to current directory", "[tools]") {
    ListFilesTool tool;
    auto result = tool.execute("{}");
    REQUIRE(result.success);
}

// ═══ Registry ════════════════════════════════════════════════════

TEST_CASE("create_builtin_tools: the four built-ins in order", "[tools]") {
    auto tools = create_builtin_tools(600);
    REQUIRE(tools.size() == 4);
    REQUIRE(tools[0]->tool_name() == "bash");
    REQUIRE(tools[1]->tool_name() == "read_file");
    REQUIRE(tools[2]->tool_name() == "write_file");
    REQUIRE(tools[3]->tool_name() == "list_files");

    for (const auto& t : tools) {
        auto spec = t->spec();
        REQUIRE(spec.input_schema["type"] == "object");
        REQUIRE(spec.input_schema.contains("properties"));
        REQUIRE_FALSE(spec.description.empty());
    }
}

TEST_CASE("normalize_schema: non-object schemas become an empty object schema", "[tools]") {
    auto kept = normalize_schema({{"type", "object"}, {"required", nlohmann::json::array({"id"})}});
    REQUIRE(kept["required"][0] == "id");

    for (const auto& bad : {nlohmann::json(), nlohmann::json("text"), nlohmann::json::array()}) {
        auto schema = normalize_schema(bad);
        REQUIRE(schema["type"] == "object");
        REQUIRE(schema["properties"].empty());
    }
}

TEST_CASE("Built-in parameter schemas are valid JSON as written", "[tools]") {
    auto tools = create_builtin_tools(600);
    for (const auto& t : tools) {
        nlohmann::json schema;
        REQUIRE_NOTHROW(schema = nlohmann::json::parse(t->parameters_json()));
        REQUIRE(schema["type"] == "object");
        for (const auto& field : schema.value("required", nlohmann::json::array())) {
            REQUIRE(schema["properties"].contains(field.get<std::string>()));
        }
    }

    ListFilesTool list;
    auto schema = nlohmann::json::parse(list.parameters_json());
    REQUIRE(schema["properties"]["path"]["description"] ==
            "The directory path to list (defaults to current directory)");
    REQUIRE(schema["properties"]["recursive"]["type"] == "boolean");
}

TEST_CASE("validate_safe_path: only whole '..' components are rejected", "[tools]") {
    REQUIRE(validate_safe_path("../sibling").has_value());
    REQUIRE(validate_safe_path("src/../../etc/passwd").has_value());
    REQUIRE(validate_safe_path("a/..").has_value());
    REQUIRE_FALSE(validate_safe_path("notes..txt").has_value());
    REQUIRE_FALSE(validate_safe_path("dir/..hidden/file").has_value());
    REQUIRE_FALSE(validate_safe_path("/tmp/absolute.txt").has_value());
    REQUIRE_FALSE(validate_safe_path(".").has_value());
}

TEST_CASE("WriteFileTool: dotted file names are allowed", "[tools]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    auto file = dir + "/notes..txt";

    WriteFileTool tool;
    auto result = tool.execute(args({{"path", file}, {"content", "kept"}}));
    REQUIRE(result.success);
    REQUIRE(read_file(file) == "kept");

    std::filesystem::remove_all(dir);
}
