#include <catch2/catch_test_macros.hpp>
#include "skills/skill_registry.hpp"
#include "core/random.hpp"

#include <filesystem>
#include <fstream>

using namespace execbox;

namespace {

struct TmpSkills {
    std::filesystem::path path;
    TmpSkills()
        : path(std::filesystem::temp_directory_path() / ("execbox_skills_" + random::hex(4))) {}
    ~TmpSkills() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    void write(const std::string& rel, const std::string& content) const {
        const auto p = path / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p);
        out << content;
    }
};

constexpr const char* kCompleteDoc = R"(# Summarize Logs

## Description
Condenses a log file into counts per level.

## Usage
```python
from skills.summarize_logs import summarize_logs
_result = await summarize_logs("app.log")
```

## Parameters
- path: Log file inside the workspace
- top: Number of entries to keep

## Returns
Dict mapping level to count
)";

} // namespace

TEST_CASE("SkillRegistry: document parsing", "[skills]") {

    SECTION("complete document") {
        const auto info = SkillRegistry::parse_skill_doc(kCompleteDoc);
        CHECK(info.name == "Summarize Logs");
        CHECK(info.description == "Condenses a log file into counts per level.");
        CHECK(info.usage.starts_with("from skills.summarize_logs import summarize_logs"));
        CHECK(info.usage.find("```") == std::string::npos);
        REQUIRE(info.parameters.size() == 2);
        CHECK(info.parameters[0] == "- path: Log file inside the workspace");
        CHECK(info.returns == "Dict mapping level to count");
    }

    SECTION("a section runs until the next header") {
        const auto info = SkillRegistry::parse_skill_doc(
            "# T\n## Description\nline one\nline two\n## Usage\nrun()\n");
        CHECK(info.description == "line one\nline two");
        CHECK(info.usage == "run()");
    }

    SECTION("usage without a fence is taken verbatim") {
        const auto info = SkillRegistry::parse_skill_doc("## Usage\ncall_it()\n");
        CHECK(info.usage == "call_it()");
        CHECK(info.name.empty());
    }
}

TEST_CASE("SkillRegistry: discovery and validation", "[skills]") {
    TmpSkills tmp;
    const SkillRegistry registry(tmp.path);

    SECTION("missing directory lists nothing") {
        CHECK(registry.list_skills().empty());
        CHECK(registry.validate_all().empty());
    }

    SECTION("only directories with a SKILL.md are skills") {
        tmp.write("summarize_logs/SKILL.md", kCompleteDoc);
        tmp.write("summarize_logs/summarize_logs.py", "async def summarize_logs(path):\n    return {}\n");
        tmp.write("scratch/notes.txt", "not a skill");

        const auto skills = registry.list_skills();
        REQUIRE(skills.size() == 1);
        CHECK(skills.begin()->first == "summarize_logs");

        const auto v = registry.validate_skill(skills.begin()->second);
        CHECK(v.valid);
        CHECK(v.errors.empty());
        CHECK(v.warnings.empty());
        CHECK(v.skill_info.name == "Summarize Logs");
    }

    SECTION("required sections are errors, optional ones warnings") {
        tmp.write("half/SKILL.md", "## Description\nOnly a description\n");
        const auto v = registry.validate_skill(tmp.path / "half" / "SKILL.md");
        CHECK_FALSE(v.valid);
        REQUIRE(v.errors.size() == 1);
        CHECK(v.errors[0] == "Missing section: Usage");
        // Parameters, Returns, the title and the module
        CHECK(v.warnings.size() == 4);
    }

    SECTION("missing document") {
        const auto v = registry.validate_skill(tmp.path / "ghost" / "SKILL.md");
        CHECK_FALSE(v.valid);
        CHECK(v.errors[0].find("file not found") != std::string::npos);
    }

    SECTION("validate_all keys by skill name") {
        tmp.write("a/SKILL.md", kCompleteDoc);
        tmp.write("b/SKILL.md", "# B\n");
        const auto all = registry.validate_all();
        CHECK(all["a"]["valid"] == true);
        CHECK(all["b"]["valid"] == false);
    }
}

TEST_CASE("SkillRegistry: template and package", "[skills]") {
    TmpSkills tmp;

    SECTION("template passes its own validation") {
        const auto doc = SkillRegistry::generate_template("Fetch Report", "Downloads a report");
        CHECK(doc.find("from skills.fetch_report import fetch_report") != std::string::npos);

        tmp.write("fetch_report/SKILL.md", doc);
        tmp.write("fetch_report/fetch_report.py", "async def fetch_report():\n    pass\n");
        const SkillRegistry registry(tmp.path);
        const auto v = registry.validate_skill(tmp.path / "fetch_report" / "SKILL.md");
        CHECK(v.valid);
        CHECK(v.warnings.empty());
        CHECK(v.skill_info.description == "Downloads a report");
    }

    SECTION("ensure_package creates the package init once") {
        const SkillRegistry registry(tmp.path);
        registry.ensure_package();
        const auto init = tmp.path / "__init__.py";
        REQUIRE(std::filesystem::exists(init));

        { std::ofstream(init) << "# kept\n"; }
        registry.ensure_package();
        std::ifstream in(init);
        std::string first;
        std::getline(in, first);
        CHECK(first == "# kept");
    }
}
