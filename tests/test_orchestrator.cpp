#include <catch2/catch_test_macros.hpp>
#include "core/orchestrator.hpp"
#include "core/random.hpp"
#include "core/utils.hpp"
#include "mocks/mock_tool_provider.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>

using namespace execbox;
using execbox::testing::MockToolProvider;

namespace {

struct TmpWorkspace {
    std::filesystem::path path;
    TmpWorkspace()
        : path(std::filesystem::temp_directory_path() / ("execbox_orch_" + random::hex(4))) {}
    ~TmpWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

SandboxConfig test_config(const std::filesystem::path& workspace) {
    SandboxConfig cfg;
    cfg.workspace.root = workspace.string();
    cfg.limits.timeout_seconds = 10;
    cfg.limits.max_cpu_seconds = 10;
    return cfg;
}

class CannedGenerator : public ICodeGenerator {
public:
    explicit CannedGenerator(std::string reply) : reply_(std::move(reply)) {}
    std::string generate(const std::string& prompt) override {
        last_prompt = prompt;
        return reply_;
    }
    std::string name() const override { return "canned"; }

    std::string last_prompt;

private:
    std::string reply_;
};

// Returns a fixed program per prompt
class ScriptedGenerator : public ICodeGenerator {
public:
    explicit ScriptedGenerator(std::map<std::string, std::string> programs)
        : programs_(std::move(programs)) {}
    std::string generate(const std::string& prompt) override { return programs_.at(prompt); }
    std::string name() const override { return "scripted"; }

private:
    const std::map<std::string, std::string> programs_;
};

// Renames a misspelled result slot
class ResultSlotFixer : public ISourceFixer {
public:
    FixResult fix(const std::string& source) override {
        FixResult out{source, {}};
        if (source.find("RESULT = ") != std::string::npos) {
            utils::replace_all(out.source, "RESULT = ", "_result = ");
            out.fixes.push_back("renamed RESULT to _result");
        }
        return out;
    }
    std::string name() const override { return "result_slot"; }
};

std::shared_ptr<MockToolProvider> echo_provider() {
    return std::make_shared<MockToolProvider>(
        std::vector<Tool>{MockToolProvider::make_tool("echo", {"text"})});
}

} // namespace

TEST_CASE("Orchestrator: startup", "[orchestrator]") {
    TmpWorkspace ws;

    SECTION("generates wrappers for the provider's tools") {
        Orchestrator orch(test_config(ws.path), echo_provider());
        REQUIRE_FALSE(orch.started());
        orch.startup();
        REQUIRE(orch.started());

        const auto& report = orch.generation_report();
        CHECK(report["total_tools"] == 1);
        CHECK(std::filesystem::exists(ws.path / "servers" / "mock_server" / "echo.py"));
        CHECK(std::filesystem::exists(ws.path / "skills" / "__init__.py"));
        CHECK(orch.executor().list_available_tools()["servers"]["mock_server"]["tool_count"] == 1);
    }

    SECTION("discovery failure still starts the sandbox") {
        auto provider = echo_provider();
        provider->set_discovery_failure(true);
        Orchestrator orch(test_config(ws.path), provider);
        orch.startup();
        REQUIRE(orch.started());
        CHECK(orch.generation_report().contains("error"));
        CHECK(orch.generation_report()["total_tools"] == 0);
    }

    SECTION("unknown provider type is a configuration error") {
        auto cfg = test_config(ws.path);
        cfg.provider.type = "carrier_pigeon";
        Orchestrator orch(cfg);
        REQUIRE_THROWS_AS(orch.startup(), UnknownProviderError);
        REQUIRE_FALSE(orch.started());
    }

    SECTION("use before startup") {
        Orchestrator orch(test_config(ws.path), echo_provider());
        REQUIRE_THROWS_AS(orch.validate_then_execute("_result = 1"), std::logic_error);
        REQUIRE_THROWS_AS(orch.executor(), std::logic_error);
    }

    SECTION("executor settings follow the config") {
        auto cfg = test_config(ws.path);
        cfg.policy.allow_writes = false;
        cfg.policy.allowed_endpoints = {"api.example.com:443"};
        Orchestrator orch(cfg, echo_provider());
        orch.startup();
        CHECK_FALSE(orch.executor().filesystem_policy().allow_writes());
        CHECK(orch.executor().network_policy().is_allowed("api.example.com", 443));
        CHECK(orch.executor().network_policy().is_allowed("127.0.0.1", 8974));
    }
}

TEST_CASE("Orchestrator: validate then execute", "[orchestrator][python]") {
    TmpWorkspace ws;
    auto provider = echo_provider();
    Orchestrator orch(test_config(ws.path), provider);
    orch.startup();

    SECTION("clean source runs") {
        const auto outcome = orch.validate_then_execute("_result = sum([1, 2, 3])");
        REQUIRE(outcome.executed());
        REQUIRE(outcome.success());
        CHECK(outcome.execution->result == 6);
    }

    SECTION("blocked source never executes") {
        const auto outcome = orch.validate_then_execute("import os\n_result = os.getcwd()");
        CHECK(outcome.validation.blocked);
        CHECK_FALSE(outcome.executed());
        CHECK_FALSE(outcome.success());
        CHECK(outcome.to_json()["execution"].is_null());
    }

    SECTION("generated wrappers reach the provider") {
        const auto outcome = orch.validate_then_execute(
            "from servers.mock_server import echo\n"
            "reply = await echo(text='ping')\n"
            "_result = reply.content[0]['text']");
        REQUIRE(outcome.success());
        CHECK(outcome.execution->result == "ping");
        CHECK(provider->last_tool() == "echo");
    }

    SECTION("personal data is tokenized on the way to the provider") {
        const auto outcome = orch.validate_then_execute(
            "from servers.mock_server import echo\n"
            "reply = await echo(text='alice@example.com')\n"
            "_result = reply.content[0]['text']");
        REQUIRE(outcome.success());
        CHECK(outcome.execution->result == "alice@example.com");
        const auto seen = provider->last_arguments()["text"].get<std::string>();
        CHECK(seen.find("alice") == std::string::npos);
        CHECK(orch.tokenizer()->size() == 1);
    }

    SECTION("async variant") {
        auto future = orch.validate_then_execute_async("_result = 'async'");
        const auto outcome = future.get();
        REQUIRE(outcome.success());
        CHECK(outcome.execution->result == "async");
    }
}

TEST_CASE("Orchestrator: tasks from a code generator", "[orchestrator][python]") {
    TmpWorkspace ws;
    auto provider = echo_provider();
    Orchestrator orch(test_config(ws.path), provider);
    orch.startup();

    SECTION("requires a generator") {
        REQUIRE_THROWS_AS(orch.run_task("anything"), std::logic_error);
    }

    SECTION("fenced output is unwrapped and fixed before running") {
        auto generator = std::make_shared<CannedGenerator>("```python\nRESULT = 6 * 7\n```");
        orch.set_code_generator(generator);
        orch.set_source_fixer(std::make_shared<ResultSlotFixer>());

        const auto outcome = orch.run_task("multiply six by seven");
        CHECK(generator->last_prompt == "multiply six by seven");
        REQUIRE(outcome.fixes_applied.size() == 1);
        CHECK(outcome.source == "_result = 6 * 7");
        REQUIRE(outcome.success());
        CHECK(outcome.execution->result == 42);
    }

    SECTION("tokens do not outlive the task") {
        orch.set_code_generator(std::make_shared<CannedGenerator>(
            "from servers.mock_server import echo\n"
            "reply = await echo(text='bob@example.com')\n"
            "_result = reply.content[0]['text']"));
        const auto outcome = orch.run_task("echo an address");
        REQUIRE(outcome.success());
        CHECK(outcome.execution->result == "bob@example.com");
        CHECK(orch.tokenizer()->size() == 0);
    }
}

TEST_CASE("Orchestrator: overlapping tasks share the tokenizer", "[orchestrator][python]") {
    TmpWorkspace ws;
    auto provider = echo_provider();
    Orchestrator orch(test_config(ws.path), provider);
    orch.startup();
    orch.set_code_generator(std::make_shared<ScriptedGenerator>(std::map<std::string, std::string>{
        {"slow", "from servers.mock_server import echo\n"
                 "reply = await echo(text='alice@example.com')\n"
                 "_result = reply.content[0]['text']"},
        {"fast", "_result = 'done'"},
    }));

    // The slow task's tool call stays open until the fast task has finished
    auto call_started = std::make_shared<std::promise<void>>();
    auto started = call_started->get_future();
    std::promise<void> fast_finished;
    auto fast_done = fast_finished.get_future().share();
    provider->set_handler([call_started, fast_done](const std::string&,
                                                    const nlohmann::json& arguments) {
        call_started->set_value();
        (void)fast_done.wait_for(std::chrono::seconds(10));
        ToolResult result;
        result.content.push_back(arguments);
        return result;
    });

    auto slow = std::async(std::launch::async, [&orch] { return orch.run_task("slow"); });
    REQUIRE(started.wait_for(std::chrono::seconds(10)) ==
            std::future_status::ready);

    const auto fast = orch.run_task("fast");
    CHECK(fast.success());
    CHECK(orch.tokenizer()->size() == 1);
    fast_finished.set_value();

    const auto outcome = slow.get();
    REQUIRE(outcome.success());
    CHECK(outcome.execution->result == "alice@example.com");
    CHECK(provider->last_arguments()["text"].get<std::string>().find("alice") ==
          std::string::npos);
    CHECK(orch.tokenizer()->size() == 0);
}

TEST_CASE("Orchestrator: code extraction", "[orchestrator]") {
    CHECK(Orchestrator::extract_code("```python\nx = 1\n```") == "x = 1");
    CHECK(Orchestrator::extract_code("```\nx = 1\n```\n") == "x = 1");
    CHECK(Orchestrator::extract_code("  x = 1  \n") == "x = 1");
    CHECK(Orchestrator::extract_code("x = 1\n```") == "x = 1");
}
