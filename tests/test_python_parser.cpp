#include <catch2/catch_test_macros.hpp>
#include "parser/python_lexer.hpp"
#include "parser/python_parser.hpp"

#include <string>
#include <vector>

using namespace execbox;
using namespace execbox::python;

namespace {

std::vector<NodeKind> kinds_of(const Node& root) {
    std::vector<NodeKind> kinds;
    walk(root, [&](const Node& n) { kinds.push_back(n.kind); });
    return kinds;
}

bool contains_kind(const Node& root, NodeKind kind) {
    bool found = false;
    walk(root, [&](const Node& n) { if (n.kind == kind) found = true; });
    return found;
}

} // namespace

TEST_CASE("PythonParser: statement kinds", "[parser]") {

    SECTION("import and from-import") {
        auto result = Parser::parse("import os.path as p\nfrom json import loads, dumps\n");
        REQUIRE(result.is_ok());
        const auto& body = result.value().root->body;
        REQUIRE(body.size() == 2);
        REQUIRE(body[0]->kind == NodeKind::Import);
        REQUIRE(body[0]->children[0]->name == "os.path");
        REQUIRE(body[0]->children[0]->asname == "p");
        REQUIRE(body[1]->kind == NodeKind::ImportFrom);
        REQUIRE(body[1]->name == "json");
        REQUIRE(body[1]->children.size() == 2);
    }

    SECTION("relative import keeps its level") {
        auto result = Parser::parse("from ..pkg import thing\n");
        REQUIRE(result.is_ok());
        const auto& node = *result.value().root->body[0];
        REQUIRE(node.kind == NodeKind::ImportFrom);
        REQUIRE(node.level == 2);
        REQUIRE(node.name == "pkg");
    }

    SECTION("async function with decorators and annotations") {
        auto result = Parser::parse(
            "@cache\n"
            "async def fetch(url: str, *, retries: int = 3, **kw) -> dict:\n"
            "    async with session() as s:\n"
            "        return await s.get(url)\n");
        REQUIRE(result.is_ok());
        const auto& fn = *result.value().root->body[0];
        REQUIRE(fn.kind == NodeKind::AsyncFunctionDef);
        REQUIRE(fn.name == "fetch");
        REQUIRE(fn.decorators.size() == 1);
        REQUIRE(contains_kind(fn, NodeKind::AsyncWith));
        REQUIRE(contains_kind(fn, NodeKind::Await));
    }

    SECTION("try with except, else and finally") {
        auto result = Parser::parse(
            "try:\n"
            "    x = 1\n"
            "except (ValueError, KeyError) as e:\n"
            "    x = 2\n"
            "else:\n"
            "    x = 3\n"
            "finally:\n"
            "    x = 4\n");
        REQUIRE(result.is_ok());
        const auto& node = *result.value().root->body[0];
        REQUIRE(node.kind == NodeKind::Try);
        REQUIRE(node.handlers.size() == 1);
        REQUIRE(node.handlers[0]->name == "e");
        REQUIRE(node.orelse.size() == 1);
        REQUIRE(node.finalbody.size() == 1);
    }

    SECTION("match statement") {
        auto result = Parser::parse(
            "match command:\n"
            "    case 'go':\n"
            "        pass\n"
            "    case _:\n"
            "        pass\n");
        REQUIRE(result.is_ok());
        REQUIRE(result.value().root->body[0]->kind == NodeKind::Match);
    }

    SECTION("match used as an identifier") {
        auto result = Parser::parse("match = 1\nprint(match)\n");
        REQUIRE(result.is_ok());
        REQUIRE(result.value().root->body[0]->kind == NodeKind::Assign);
    }
}

TEST_CASE("PythonParser: with items", "[parser]") {

    auto items_of = [](const std::string& source) {
        auto result = Parser::parse(source);
        REQUIRE(result.is_ok());
        const auto& node = *result.value().root->body[0];
        REQUIRE((node.kind == NodeKind::With || node.kind == NodeKind::AsyncWith));
        std::vector<const Node*> targets;
        for (const auto& item : node.children) {
            REQUIRE(item->kind == NodeKind::WithItem);
            targets.push_back(item->children[1].get());
        }
        return targets;
    };

    SECTION("several items each bound with as") {
        const auto targets = items_of("with A() as a, B() as b:\n    pass\n");
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0]->kind == NodeKind::Name);
        REQUIRE(targets[0]->name == "a");
        REQUIRE(targets[1]->name == "b");
    }

    SECTION("parenthesized item list") {
        const auto targets = items_of(
            "with (\n"
            "    A() as a,\n"
            "    B() as b,\n"
            "):\n"
            "    pass\n");
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[1]->name == "b");
    }

    SECTION("mixed bound and unbound items") {
        const auto targets = items_of("with A(), B() as b:\n    pass\n");
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0] == nullptr);
        REQUIRE(targets[1]->name == "b");
    }

    SECTION("async form") {
        auto result = Parser::parse(
            "async def f():\n"
            "    async with A() as a, B() as b:\n"
            "        pass\n");
        REQUIRE(result.is_ok());
        REQUIRE(contains_kind(*result.value().root, NodeKind::AsyncWith));
    }

    SECTION("tuple target stays a single item") {
        const auto targets = items_of("with A() as (x, y):\n    pass\n");
        REQUIRE(targets.size() == 1);
        REQUIRE(targets[0]->kind == NodeKind::Tuple);
    }

    SECTION("call is still not a valid target") {
        auto result = Parser::parse("with A() as f():\n    pass\n");
        REQUIRE(result.is_error());
    }
}

TEST_CASE("PythonParser: expressions", "[parser]") {

    SECTION("comprehensions of every form") {
        auto result = Parser::parse(
            "a = [x for x in range(3) if x]\n"
            "b = {x for x in y}\n"
            "c = {k: v for k, v in d.items()}\n"
            "e = sum(x * x for x in y)\n");
        REQUIRE(result.is_ok());
        const auto& root = *result.value().root;
        REQUIRE(contains_kind(root, NodeKind::ListComp));
        REQUIRE(contains_kind(root, NodeKind::SetComp));
        REQUIRE(contains_kind(root, NodeKind::DictComp));
        REQUIRE(contains_kind(root, NodeKind::GeneratorExp));
    }

    SECTION("f-string with nested replacement fields") {
        auto result = Parser::parse("s = f\"{name!r:>{width}} and {obj.attr}\"\n");
        REQUIRE(result.is_ok());
        const auto& root = *result.value().root;
        REQUIRE(contains_kind(root, NodeKind::JoinedStr));
        REQUIRE(contains_kind(root, NodeKind::FormattedValue));
        REQUIRE(contains_kind(root, NodeKind::Attribute));
    }

    SECTION("walrus, ternary and lambda") {
        auto result = Parser::parse(
            "if (n := len(a)) > 10:\n"
            "    f = lambda x, y=2: x if x else y\n");
        REQUIRE(result.is_ok());
        const auto& root = *result.value().root;
        REQUIRE(contains_kind(root, NodeKind::NamedExpr));
        REQUIRE(contains_kind(root, NodeKind::Lambda));
        REQUIRE(contains_kind(root, NodeKind::IfExp));
    }

    SECTION("numeric literals") {
        auto result = Parser::parse("n = [1_000, 0xff, 0o17, 0b101, 1.5e3, 2j, ...]\n");
        REQUIRE(result.is_ok());
        int constants = 0;
        walk(*result.value().root, [&](const Node& n) {
            if (n.kind == NodeKind::Constant) ++constants;
        });
        REQUIRE(constants == 7);
    }

    SECTION("call with keywords and unpacking") {
        auto result = Parser::parse("f(1, *rest, key=2, **extra)\n");
        REQUIRE(result.is_ok());
        const auto& call = *result.value().root->body[0]->children[0];
        REQUIRE(call.kind == NodeKind::Call);
        REQUIRE(dotted_name(*call.children[0]) == "f");
    }

    SECTION("dotted_name follows attribute chains") {
        auto result = Parser::parse("os.path.join('a', 'b')\n");
        REQUIRE(result.is_ok());
        const auto& call = *result.value().root->body[0]->children[0];
        REQUIRE(dotted_name(*call.children[0]) == "os.path.join");
    }
}

TEST_CASE("PythonParser: syntax errors", "[parser]") {

    SECTION("unbalanced bracket") {
        auto result = Parser::parse("x = (1, 2\n");
        REQUIRE(result.is_error());
        REQUIRE(result.error_category() == ErrorCategory::SYNTAX_ERROR);
        REQUIRE(result.error_message().starts_with("Syntax error:"));
        REQUIRE(result.error_message().find("at line") != std::string::npos);
    }

    SECTION("missing block") {
        auto result = Parser::parse("def f():\nreturn 1\n");
        REQUIRE(result.is_error());
    }

    SECTION("assignment to a literal") {
        auto result = Parser::parse("1 = x\n");
        REQUIRE(result.is_error());
    }

    SECTION("error reports the offending line") {
        auto result = Parser::parse("a = 1\nb = 2\nc = = 3\n");
        REQUIRE(result.is_error());
        REQUIRE(result.error_message().find("at line 3") != std::string::npos);
    }
}

TEST_CASE("PythonLexer: multi-line strings", "[parser][lexer]") {
    Lexer lexer("x = '''first\nsecond\nthird'''\ny = 1\n");
    auto tokens = lexer.tokenize();
    REQUIRE_FALSE(tokens.empty());

    const auto& lines = lexer.string_continuation_lines();
    REQUIRE(lines.count(2) == 1);
    REQUIRE(lines.count(3) == 1);
    REQUIRE(lines.count(1) == 0);
    REQUIRE(lines.count(4) == 0);
}

TEST_CASE("PythonParser: walk visits parents before children", "[parser]") {
    auto result = Parser::parse("x = f(y)\n");
    REQUIRE(result.is_ok());
    const auto kinds = kinds_of(*result.value().root);
    REQUIRE(kinds.front() == NodeKind::Module);
    REQUIRE(kinds[1] == NodeKind::Assign);
}
