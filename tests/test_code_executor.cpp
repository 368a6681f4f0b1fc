#include <catch2/catch_test_macros.hpp>
#include "executor/code_executor.hpp"
#include "tools/tool_generator.hpp"
#include "core/random.hpp"
#include "mocks/mock_tool_provider.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>

using namespace execbox;
using execbox::testing::MockToolProvider;

namespace {

struct TmpWorkspace {
    std::filesystem::path path;
    TmpWorkspace()
        : path(std::filesystem::temp_directory_path() / ("execbox_exec_" + random::hex(4))) {}
    ~TmpWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

ExecutorConfig test_config(const std::filesystem::path& workspace) {
    ExecutorConfig cfg;
    cfg.workspace = workspace;
    cfg.timeout_seconds = 10;
    cfg.max_cpu_seconds = 10;
    return cfg;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("CodeExecutor: program outcomes", "[executor][python]") {
    TmpWorkspace ws;
    const CodeExecutor executor(test_config(ws.path), NetworkPolicy());

    SECTION("_result carries the value") {
        const auto r = executor.execute("_result = 40 + 2");
        REQUIRE(r.success);
        REQUIRE(r.result == 42);
        REQUIRE_FALSE(r.error.has_value());
    }

    SECTION("result is the fallback slot") {
        const auto r = executor.execute("result = {'items': [1, 2]}");
        REQUIRE(r.success);
        REQUIRE(r.result["items"].size() == 2);
    }

    SECTION("module-level names are locals of the entry coroutine") {
        const auto r = executor.execute(
            "x = 1\n"
            "def set_x():\n"
            "    global x\n"
            "    x = 2\n"
            "set_x()\n"
            "state = {'x': 1}\n"
            "def set_state():\n"
            "    state['x'] = 2\n"
            "set_state()\n"
            "_result = [x, state['x']]");
        REQUIRE(r.success);
        REQUIRE(r.result == nlohmann::json::array({1, 2}));
    }

    SECTION("no slot set gives a null result") {
        const auto r = executor.execute("x = 1");
        REQUIRE(r.success);
        REQUIRE(r.result.is_null());
    }

    SECTION("program output is captured without the outcome line") {
        const auto r = executor.execute("print('hello')\n_result = 1");
        REQUIRE(r.success);
        REQUIRE(r.stdout_text == "hello\n");
    }

    SECTION("top-level await works") {
        const auto r = executor.execute("import asyncio\nawait asyncio.sleep(0)\n_result = 'done'");
        REQUIRE(r.success);
        REQUIRE(r.result == "done");
    }

    SECTION("multi-line strings keep their contents") {
        const auto r = executor.execute("text = '''a\nb'''\n_result = text");
        REQUIRE(r.success);
        REQUIRE(r.result == "a\nb");
    }

    SECTION("raised exceptions are reported by type") {
        const auto r = executor.execute("raise ValueError('bad value')");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_type == "ValueError");
        REQUIRE(contains(r.error.value_or(""), "bad value"));
        REQUIRE(r.traceback.has_value());
    }

    SECTION("unparseable source never starts an interpreter") {
        const auto r = executor.execute("def broken(:\n    pass\n");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_type == "SyntaxError");
    }

    SECTION("executions are counted") {
        (void)executor.execute("_result = 1");
        (void)executor.execute("_result = 2");
        REQUIRE(executor.total_executions() == 2);
    }

    SECTION("script files are cleaned up") {
        (void)executor.execute("_result = 1");
        for (const auto& entry : std::filesystem::directory_iterator(executor.workspace())) {
            REQUIRE_FALSE(entry.path().filename().string().starts_with(".exec_"));
        }
    }
}

TEST_CASE("CodeExecutor: limits", "[executor][python]") {
    TmpWorkspace ws;
    auto cfg = test_config(ws.path);

    SECTION("wall-clock timeout kills the program") {
        cfg.timeout_seconds = 1;
        const CodeExecutor executor(cfg, NetworkPolicy());
        const auto r = executor.execute("while True:\n    pass");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_type == "ExecutionTimeout");
        REQUIRE(executor.timeouts() == 1);
    }

    SECTION("per-call limits override the configured ones") {
        const CodeExecutor executor(cfg, NetworkPolicy());
        ExecutionLimits limits = executor.default_limits();
        limits.timeout_seconds = 1;
        const auto r = executor.execute("import time\ntime.sleep(30)", limits);
        REQUIRE(r.error_type == "ExecutionTimeout");
    }

    SECTION("too much output kills the program") {
        cfg.max_output_bytes = 1024;
        const CodeExecutor executor(cfg, NetworkPolicy());
        const auto r = executor.execute("for _ in range(1000):\n    print('x' * 100)");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_type == "OutputLimitExceeded");
        REQUIRE(r.stdout_text.size() <= 1024);
    }
}

TEST_CASE("CodeExecutor: sandbox policies", "[executor][python]") {
    TmpWorkspace ws;
    auto cfg = test_config(ws.path);

    SECTION("system files are off limits") {
        const CodeExecutor executor(cfg, NetworkPolicy());
        const auto r = executor.execute("_result = open('/etc/passwd').read()");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_type == "PolicyViolation");
        REQUIRE(contains(r.error.value_or(""), "restricted system directory"));
    }

    SECTION("workspace files are readable and writable") {
        const CodeExecutor executor(cfg, NetworkPolicy());
        const auto r = executor.execute(
            "with open('notes.txt', 'w') as f:\n"
            "    f.write('kept')\n"
            "_result = open('notes.txt').read()");
        REQUIRE(r.success);
        REQUIRE(r.result == "kept");
    }

    SECTION("writes can be disabled") {
        cfg.allow_writes = false;
        const CodeExecutor executor(cfg, NetworkPolicy());
        const auto r = executor.execute("open('out.txt', 'w').write('x')");
        REQUIRE(r.error_type == "PolicyViolation");
        REQUIRE(contains(r.error.value_or(""), "writes are disabled"));
    }

    SECTION("connections to unlisted hosts are blocked") {
        const CodeExecutor executor(cfg, NetworkPolicy({"api.example.com:443"}));
        const auto r = executor.execute(
            "import socket\n"
            "s = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
            "s.connect(('10.255.255.1', 80))");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_type == "PolicyViolation");
        REQUIRE(contains(r.error.value_or(""), "10.255.255.1:80"));
        REQUIRE(contains(r.error.value_or(""), "api.example.com:443"));
    }

    SECTION("loopback connections pass an allow-list that omits them") {
        const CodeExecutor executor(cfg, NetworkPolicy({"api.example.com:443"}));
        const auto r = executor.execute(
            "import socket\n"
            "server = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
            "server.bind(('127.0.0.1', 0))\n"
            "server.listen(4)\n"
            "port = server.getsockname()[1]\n"
            "by_address = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
            "by_address.connect(('127.0.0.1', port))\n"
            "by_name = socket.create_connection(('localhost', port), timeout=5)\n"
            "_result = port\n"
            "by_address.close()\n"
            "by_name.close()\n"
            "server.close()");
        REQUIRE(r.success);
        REQUIRE(r.result.get<int>() > 0);
    }

    SECTION("allow-listed endpoints connect, others do not") {
        const std::string program =
            "import socket\n"
            "server = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
            "server.bind(('127.0.0.2', 0))\n"
            "server.listen(1)\n"
            "client = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
            "client.connect(('127.0.0.2', server.getsockname()[1]))\n"
            "_result = 'connected'\n"
            "client.close()\n"
            "server.close()";

        const CodeExecutor allowed(cfg, NetworkPolicy({"127.0.0.*"}));
        const auto ok = allowed.execute(program);
        REQUIRE(ok.success);
        REQUIRE(ok.result == "connected");

        const CodeExecutor denied(cfg, NetworkPolicy({"api.example.com:443"}));
        const auto blocked = denied.execute(program);
        REQUIRE(blocked.error_type == "PolicyViolation");
        REQUIRE(contains(blocked.error.value_or(""), "127.0.0.2"));
    }

    SECTION("disabled enforcement leaves open() alone") {
        cfg.enforce_filesystem = false;
        const CodeExecutor executor(cfg, NetworkPolicy());
        const auto r = executor.execute("_result = len(open('/etc/passwd').read()) >= 0");
        REQUIRE(r.success);
    }
}

TEST_CASE("CodeExecutor: tool bridge", "[executor][python][tools]") {
    TmpWorkspace ws;
    auto provider = std::make_shared<MockToolProvider>();
    auto client = std::make_shared<ToolClient>(provider, nullptr);
    CodeExecutor executor(test_config(ws.path), NetworkPolicy(), client);

    SECTION("a program calls a tool through sandbox_runtime") {
        const auto r = executor.execute(
            "from sandbox_runtime import call_tool\n"
            "reply = await call_tool('lookup', {'key': 'k1'})\n"
            "_result = reply.content");
        REQUIRE(r.success);
        REQUIRE(r.result[0]["key"] == "k1");
        REQUIRE(provider->last_tool() == "lookup");
        REQUIRE(provider->call_count() == 1);
    }

    SECTION("provider failures surface as exceptions in the program") {
        provider->set_handler([](const std::string&, const nlohmann::json&) -> ToolResult {
            throw ToolCallError("upstream unavailable");
        });
        const auto r = executor.execute(
            "from sandbox_runtime import call_tool\n"
            "await call_tool('lookup', {})");
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_type == "ToolCallError");
        REQUIRE(contains(r.error.value_or(""), "upstream unavailable"));
    }

    SECTION("without a client the call fails inside the program") {
        executor.set_tool_client(nullptr);
        const auto r = executor.execute(
            "from sandbox_runtime import call_tool\n"
            "await call_tool('lookup', {})");
        REQUIRE_FALSE(r.success);
        REQUIRE(contains(r.error.value_or(""), "Tool client not initialized"));
    }

    SECTION("generated wrappers are importable") {
        const ToolGenerator generator(executor.workspace());
        (void)generator.generate_server_files(
            "demo", {MockToolProvider::make_tool("get_weather", {"city"})});
        const auto r = executor.execute(
            "from demo import get_weather\n"
            "reply = await get_weather(city='Oslo')\n"
            "_result = reply.content[0]['city']");
        REQUIRE(r.success);
        REQUIRE(r.result == "Oslo");
        REQUIRE(provider->last_tool() == "get_weather");
    }

    SECTION("a hung tool call does not stretch the timeout") {
        std::promise<void> release;
        auto released = release.get_future().share();
        provider->set_handler([released](const std::string&, const nlohmann::json&) {
            (void)released.wait_for(std::chrono::seconds(10));
            return ToolResult{};
        });

        ExecutionLimits limits = executor.default_limits();
        limits.timeout_seconds = 1;
        const auto r = executor.execute(
            "from sandbox_runtime import call_tool\n"
            "_result = (await call_tool('slow', {})).content", limits);
        release.set_value();

        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_type == "ExecutionTimeout");
        REQUIRE(r.duration_ms < 4000);
        REQUIRE(executor.timeouts() == 1);

        // The abandoned call does not hold up the next execution
        const auto next = executor.execute("_result = 'after'");
        REQUIRE(next.success);
        REQUIRE(next.result == "after");
    }

    SECTION("async execution") {
        auto future = executor.execute_async("_result = 7 * 6");
        const auto r = future.get();
        REQUIRE(r.success);
        REQUIRE(r.result == 42);
    }
}

TEST_CASE("CodeExecutor: bridge request handling", "[executor][tools]") {
    TmpWorkspace ws;
    auto provider = std::make_shared<MockToolProvider>();
    CodeExecutor executor(test_config(ws.path), NetworkPolicy(),
                          std::make_shared<ToolClient>(provider, nullptr));

    SECTION("malformed line") {
        const auto reply = executor.handle_bridge_request("not json");
        REQUIRE(reply["id"].is_null());
        REQUIRE(reply["error_type"] == "ProtocolError");
    }

    SECTION("missing tool name keeps the id") {
        const auto reply = executor.handle_bridge_request(R"({"id": 7})");
        REQUIRE(reply["id"] == 7);
        REQUIRE(reply["error_type"] == "ProtocolError");
    }

    SECTION("successful call") {
        const auto reply = executor.handle_bridge_request(
            R"({"id": 1, "tool": "t", "arguments": {"a": 1}})");
        REQUIRE(reply["id"] == 1);
        REQUIRE_FALSE(reply.contains("error"));
        REQUIRE(reply["content"][0]["a"] == 1);
        REQUIRE(reply["is_error"] == false);
    }

    SECTION("no client") {
        executor.set_tool_client(nullptr);
        const auto reply = executor.handle_bridge_request(R"({"id": 2, "tool": "t"})");
        REQUIRE(reply["error_type"] == "RuntimeError");
    }
}

TEST_CASE("CodeExecutor: output decoding", "[executor]") {

    SECTION("outcome line is stripped from stdout") {
        const auto r = CodeExecutor::decode_output(
            "noise\n\n{\"success\": true, \"result\": 5}\n", "", 0);
        REQUIRE(r.success);
        REQUIRE(r.result == 5);
        REQUIRE(r.stdout_text == "noise\n");
    }

    SECTION("failure outcome") {
        const auto r = CodeExecutor::decode_output(
            "\n{\"success\": false, \"error\": \"boom\", \"error_type\": \"KeyError\"}\n", "", 0);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error == "boom");
        REQUIRE(r.error_type == "KeyError");
    }

    SECTION("clean exit without an outcome") {
        const auto r = CodeExecutor::decode_output("plain output\n", "", 0);
        REQUIRE(r.success);
        REQUIRE(r.result.is_null());
        REQUIRE(r.stdout_text == "plain output\n");
    }

    SECTION("non-zero exit without an outcome") {
        const auto r = CodeExecutor::decode_output("", "Fatal Python error: oops\n", 1 << 8);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_type == "ProcessError");
        REQUIRE(contains(r.error.value_or(""), "Fatal Python error: oops"));
    }
}

TEST_CASE("CodeExecutor: tool inventory", "[executor][tools]") {
    TmpWorkspace ws;
    const CodeExecutor executor(test_config(ws.path), NetworkPolicy());

    SECTION("nothing generated yet") {
        const auto info = executor.list_available_tools();
        REQUIRE(info["servers"].empty());
        REQUIRE(contains(info["errors"][0].get<std::string>(), "does not exist"));

        const auto check = executor.verify_tool_exists("demo", "x");
        REQUIRE(check["exists"] == false);
        REQUIRE_FALSE(check["suggestions"].empty());
    }

    SECTION("generated servers are listed and verified") {
        const ToolGenerator generator(executor.workspace());
        (void)generator.generate_server_files("demo", {
            MockToolProvider::make_tool("get_weather", {"city"}),
            MockToolProvider::make_tool("send_email", {"to"}),
        });

        const auto info = executor.list_available_tools();
        REQUIRE(info["errors"].empty());
        REQUIRE(info["servers"]["demo"]["tool_count"] == 2);
        REQUIRE(info["servers"]["demo"]["tools"][0] == "get_weather");

        REQUIRE(executor.verify_tool_exists("demo", "get_weather")["exists"] == true);
        REQUIRE(executor.verify_tool_exists("demo", "get-weather")["exists"] == true);

        const auto missing = executor.verify_tool_exists("demo", "delete_all");
        REQUIRE(missing["exists"] == false);
        REQUIRE(contains(missing["errors"][0].get<std::string>(), "get_weather, send_email"));

        const auto other = executor.verify_tool_exists("nope", "x");
        REQUIRE(contains(other["errors"][0].get<std::string>(), "Available servers: demo"));

        const auto escape = executor.verify_tool_exists("..", "passwd");
        REQUIRE(escape["exists"] == false);
        REQUIRE(contains(escape["errors"][0].get<std::string>(), "Invalid"));
    }
}
