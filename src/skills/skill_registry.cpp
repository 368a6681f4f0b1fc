#include "skills/skill_registry.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace execbox {

namespace {

struct Sections {
    std::string title;
    std::map<std::string, std::string> bodies;
};

Sections split_sections(std::string_view content) {
    Sections out;
    std::string current;
    bool in_section = false;
    std::string body;

    auto close_section = [&]() {
        if (in_section) out.bodies[current] = utils::trim(body);
        body.clear();
    };

    std::istringstream stream{std::string(content)};
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.starts_with("##")) {
            close_section();
            const auto text = line.find_first_not_of('#');
            current = text == std::string::npos ? std::string() : utils::trim(line.substr(text));
            in_section = true;
            continue;
        }
        if (out.title.empty() && line.starts_with("# ")) {
            out.title = utils::trim(line.substr(2));
            continue;
        }
        if (in_section) {
            body += line;
            body += '\n';
        }
    }
    close_section();
    return out;
}

// Contents of the first ```python fence, or the whole text when there is none
std::string fenced_code(const std::string& text) {
    const auto open = text.find("```");
    if (open == std::string::npos) return text;
    const auto code_start = text.find('\n', open);
    if (code_start == std::string::npos) return text;
    const auto close = text.find("```", code_start);
    return utils::trim(text.substr(code_start + 1,
                                   close == std::string::npos ? std::string::npos
                                                              : close - code_start - 1));
}

std::string module_name(const std::string& skill_name) {
    std::string name = utils::to_lower(utils::trim(skill_name));
    for (char& c : name) {
        if (c == ' ' || c == '-') c = '_';
    }
    return name;
}

} // anonymous namespace

nlohmann::json SkillInfo::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"usage", usage},
        {"parameters", parameters},
        {"returns", returns},
    };
}

nlohmann::json SkillValidation::to_json() const {
    return {
        {"valid", valid},
        {"errors", errors},
        {"warnings", warnings},
        {"skill_info", skill_info.to_json()},
    };
}

SkillRegistry::SkillRegistry(fs::path skills_dir) : skills_dir_(std::move(skills_dir)) {}

std::map<std::string, fs::path> SkillRegistry::list_skills() const {
    std::map<std::string, fs::path> skills;
    std::error_code ec;
    if (!fs::is_directory(skills_dir_, ec)) return skills;

    for (const auto& entry : fs::directory_iterator(skills_dir_, ec)) {
        if (!entry.is_directory()) continue;
        const fs::path doc = entry.path() / kSkillDoc;
        if (fs::is_regular_file(doc, ec)) {
            skills.emplace(entry.path().filename().string(), doc);
        }
    }
    return skills;
}

SkillInfo SkillRegistry::parse_skill_doc(std::string_view content) {
    const auto sections = split_sections(content);

    SkillInfo info;
    info.name = sections.title;
    if (auto it = sections.bodies.find("Description"); it != sections.bodies.end()) {
        info.description = it->second;
    }
    if (auto it = sections.bodies.find("Usage"); it != sections.bodies.end()) {
        info.usage = fenced_code(it->second);
    }
    if (auto it = sections.bodies.find("Parameters"); it != sections.bodies.end()) {
        for (const auto& line : utils::split(it->second, '\n')) {
            const std::string item = utils::trim(line);
            if (item.starts_with("-")) info.parameters.push_back(item);
        }
    }
    if (auto it = sections.bodies.find("Returns"); it != sections.bodies.end()) {
        info.returns = it->second;
    }
    return info;
}

SkillValidation SkillRegistry::validate_skill(const fs::path& skill_doc) const {
    SkillValidation result;

    std::ifstream in(skill_doc, std::ios::binary);
    if (!in) {
        result.errors.push_back(std::format("{} file not found: {}", kSkillDoc, skill_doc.string()));
        return result;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    const std::string content = buf.str();

    const auto sections = split_sections(content);
    for (const char* required : {"Description", "Usage"}) {
        if (!sections.bodies.contains(required)) {
            result.errors.push_back(std::format("Missing section: {}", required));
        }
    }
    for (const char* optional : {"Parameters", "Returns"}) {
        if (!sections.bodies.contains(optional)) {
            result.warnings.push_back(std::format("Missing section: {}", optional));
        }
    }
    if (sections.title.empty()) {
        result.warnings.push_back("Missing title heading ('# Name')");
    }

    std::error_code ec;
    bool has_module = false;
    for (const auto& entry : fs::directory_iterator(skill_doc.parent_path(), ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".py") {
            has_module = true;
            break;
        }
    }
    if (!has_module) {
        result.warnings.push_back(std::format("No Python module next to {}", kSkillDoc));
    }

    result.skill_info = parse_skill_doc(content);
    result.valid = result.errors.empty();
    return result;
}

nlohmann::json SkillRegistry::validate_all() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, doc] : list_skills()) {
        out[name] = validate_skill(doc).to_json();
    }
    return out;
}

std::string SkillRegistry::generate_template(const std::string& skill_name,
                                             const std::string& description) {
    const std::string module = module_name(skill_name);
    return std::format(
        "# {0}\n"
        "\n"
        "## Description\n"
        "{1}\n"
        "\n"
        "## Usage\n"
        "```python\n"
        "from skills.{2} import {2}\n"
        "result = await {2}(...)\n"
        "```\n"
        "\n"
        "## Parameters\n"
        "- parameter1: Description\n"
        "- parameter2: Description\n"
        "\n"
        "## Returns\n"
        "Description of return value\n",
        skill_name, description, module);
}

void SkillRegistry::ensure_package() const {
    fs::create_directories(skills_dir_);
    const fs::path init = skills_dir_ / "__init__.py";
    if (!fs::exists(init)) {
        std::ofstream out(init);
        if (!out) {
            throw std::runtime_error(std::format("Cannot create {}", init.string()));
        }
        utils::log::info(std::format("Created skills package at {}", skills_dir_.string()));
    }
}

} // namespace execbox
