#include <catch2/catch_test_macros.hpp>
#include "security/security_rule_engine.hpp"
#include "security/security_rules.hpp"
#include "parser/python_parser.hpp"

#include <algorithm>
#include <memory>
#include <string>

using namespace execbox;

namespace {

bool has_message(const std::vector<SecurityViolation>& list, const std::string& msg) {
    return std::ranges::any_of(list, [&](const auto& v) { return v.message == msg; });
}

// Flags every "print" call, used to exercise add_rule()
class NoPrintRule : public ISecurityRule {
public:
    [[nodiscard]] std::vector<SecurityViolation> check(
        const python::Module& module) const override {
        std::vector<SecurityViolation> out;
        python::walk(*module.root, [&](const python::Node& node) {
            if (node.kind == python::NodeKind::Call && node.child(0) &&
                node.child(0)->name == "print") {
                SecurityViolation v;
                v.rule_name = name();
                v.level = ViolationLevel::INFO;
                v.message = "print call";
                v.line = node.line;
                out.push_back(std::move(v));
            }
        });
        return out;
    }
    [[nodiscard]] std::string name() const override { return "no_print"; }
    [[nodiscard]] ViolationLevel level() const override { return ViolationLevel::INFO; }
};

} // namespace

TEST_CASE("DangerousImportRule: blocked and allowed modules", "[security]") {

    SECTION("prefix matching on dotted names") {
        REQUIRE(DangerousImportRule::is_blocked("os"));
        REQUIRE(DangerousImportRule::is_blocked("os.path"));
        REQUIRE(DangerousImportRule::is_blocked("concurrent.futures"));
        REQUIRE(DangerousImportRule::is_blocked("concurrent.futures.thread"));
        REQUIRE(DangerousImportRule::is_blocked("urllib.request"));
        REQUIRE_FALSE(DangerousImportRule::is_blocked("concurrent"));
        REQUIRE_FALSE(DangerousImportRule::is_blocked("osmosis"));
    }

    SECTION("allow list matches the first segment") {
        REQUIRE(DangerousImportRule::is_allowed("json"));
        REQUIRE(DangerousImportRule::is_allowed("servers.demo_mcp"));
        REQUIRE(DangerousImportRule::is_allowed("sandbox_runtime"));
        REQUIRE_FALSE(DangerousImportRule::is_allowed("numpy"));
    }
}

TEST_CASE("SecurityRuleEngine: blocking outcomes", "[security]") {
    const SecurityRuleEngine engine;

    SECTION("import os is blocked") {
        auto r = engine.validate("import os\n");
        REQUIRE(r.blocked);
        REQUIRE_FALSE(r.valid);
        REQUIRE(r.blocking_violations.size() == 1);
        REQUIRE(r.blocking_violations[0].message == "Dangerous import blocked: os");
        REQUIRE(r.blocking_violations[0].rule_name == "dangerous_import");
        REQUIRE(r.blocking_violations[0].line == 1);
        REQUIRE(r.blocking_violations[0].snippet == "import os");
    }

    SECTION("from-import of a blocked submodule") {
        auto r = engine.validate("from subprocess import run\n");
        REQUIRE(r.blocked);
        REQUIRE(has_message(r.blocking_violations, "Dangerous import blocked: subprocess"));
    }

    SECTION("eval and bare open are blocked") {
        auto r = engine.validate("x = eval('1')\nf = open('a.txt')\n");
        REQUIRE(r.blocked);
        REQUIRE(has_message(r.blocking_violations, "Dangerous function call blocked: eval()"));
        REQUIRE(has_message(r.blocking_violations, "Dangerous function call blocked: open()"));
    }

    SECTION("method named open is not a builtin call") {
        auto r = engine.validate("import io\nbuf = io.StringIO('x')\nbuf.open()\n");
        REQUIRE_FALSE(r.blocked);
    }

    SECTION("attribute calls on dangerous modules") {
        auto r = engine.validate("os.system('ls')\nos.spawnl(0, 'x')\nsys.exit(1)\n");
        REQUIRE(r.blocked);
        REQUIRE(has_message(r.blocking_violations, "Dangerous function call blocked: os.system()"));
        REQUIRE(has_message(r.blocking_violations, "Dangerous function call blocked: os.spawnl()"));
        REQUIRE(has_message(r.blocking_violations, "Dangerous function call blocked: sys.exit()"));
    }

    SECTION("syntax error short-circuits") {
        auto r = engine.validate("def broken(:\n");
        REQUIRE(r.blocked);
        REQUIRE_FALSE(r.valid);
        REQUIRE(r.syntax_error.has_value());
        REQUIRE(r.violations.empty());
        REQUIRE(r.format_violations().starts_with("[SYNTAX] Syntax error:"));
    }

    SECTION("multi-item with statements are valid") {
        for (const char* source : {
                 "with A() as a, B() as b:\n    _result = a + b\n",
                 "with (A() as a, B() as b):\n    _result = a + b\n",
                 "with A(), B() as b:\n    _result = b\n"}) {
            auto r = engine.validate(source);
            INFO(source);
            REQUIRE_FALSE(r.syntax_error.has_value());
            REQUIRE_FALSE(r.blocked);
            REQUIRE(r.valid);
        }
    }

    SECTION("rules still see every with item") {
        auto r = engine.validate("with A() as a, open('x.txt') as f:\n    pass\n");
        REQUIRE_FALSE(r.syntax_error.has_value());
        REQUIRE(r.blocked);
        REQUIRE(has_message(r.blocking_violations, "Dangerous function call blocked: open()"));
    }
}

TEST_CASE("SecurityRuleEngine: warnings do not block", "[security]") {
    const SecurityRuleEngine engine;

    SECTION("unknown import") {
        auto r = engine.validate("import numpy\n");
        REQUIRE_FALSE(r.blocked);
        REQUIRE(r.valid);
        REQUIRE(has_message(r.warnings, "Unknown import: numpy (may be unsafe)"));
    }

    SECTION("restricted path literal") {
        auto r = engine.validate("path = '/etc/passwd'\n");
        REQUIRE_FALSE(r.blocked);
        REQUIRE(has_message(r.warnings,
                            "Potential filesystem access to restricted path: /etc/passwd"));
    }

    SECTION("while True without break") {
        auto r = engine.validate("while True:\n    x = 1\n");
        REQUIRE_FALSE(r.blocked);
        REQUIRE(has_message(r.warnings,
                            "Potential infinite loop: 'while True:' without 'break'"));
    }

    SECTION("while True with a nested break is fine") {
        auto r = engine.validate(
            "while True:\n"
            "    if done():\n"
            "        break\n");
        REQUIRE(r.warnings.empty());
    }

    SECTION("break inside a try handler counts") {
        auto r = engine.validate(
            "while True:\n"
            "    try:\n"
            "        step()\n"
            "    except ValueError:\n"
            "        break\n");
        REQUIRE(r.warnings.empty());
    }

    SECTION("break inside a nested function does not count") {
        auto r = engine.validate(
            "while True:\n"
            "    def inner():\n"
            "        pass\n");
        REQUIRE(r.warnings.size() == 1);
    }

    SECTION("clean generated code") {
        auto r = engine.validate(
            "import asyncio\n"
            "from servers.demo_mcp import get_weather\n"
            "async def main():\n"
            "    return await get_weather(city='Paris')\n"
            "_result = asyncio.run(main())\n");
        REQUIRE(r.valid);
        REQUIRE(r.violations.empty());
    }
}

TEST_CASE("SecurityRuleEngine: extension and reporting", "[security]") {

    SECTION("add_rule appends a custom rule") {
        SecurityRuleEngine engine;
        const size_t before = engine.rule_count();
        engine.add_rule(std::make_unique<NoPrintRule>());
        REQUIRE(engine.rule_count() == before + 1);

        auto r = engine.validate("print('hi')\n");
        REQUIRE_FALSE(r.blocked);
        REQUIRE(r.info.size() == 1);
        REQUIRE(r.info[0].rule_name == "no_print");
    }

    SECTION("empty engine accepts anything that parses") {
        const SecurityRuleEngine engine(std::vector<std::unique_ptr<ISecurityRule>>{});
        auto r = engine.validate("import os\nos.system('x')\n");
        REQUIRE(r.valid);
        REQUIRE(r.violations.empty());
    }

    SECTION("format_violations prints one line per violation") {
        const SecurityRuleEngine engine;
        auto r = engine.validate("import os\nimport numpy\n");
        const auto text = r.format_violations();
        REQUIRE(text.find("[BLOCK] dangerous_import (line 1): Dangerous import blocked: os")
                != std::string::npos);
        REQUIRE(text.find("[WARN] dangerous_import (line 2): Unknown import: numpy (may be unsafe)")
                != std::string::npos);
    }

    SECTION("to_json carries every list") {
        const SecurityRuleEngine engine;
        auto j = engine.validate("import os\n").to_json();
        REQUIRE(j["blocked"] == true);
        REQUIRE(j["blocking_violations"].size() == 1);
        REQUIRE(j["blocking_violations"][0]["level"] == "block");
        REQUIRE(j["syntax_error"].is_null());
    }
}
