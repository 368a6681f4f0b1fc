#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

struct SkillInfo {
    std::string name;
    std::string description;
    std::string usage;
    std::vector<std::string> parameters;
    std::string returns;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct SkillValidation {
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    SkillInfo skill_info;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Reusable helper modules under <workspace>/skills
 *
 * A skill is a sub-directory holding a Python module and a SKILL.md
 * companion document. The document is parsed line by line: the title is the
 * first "# " heading and each "## Name" header opens a section that runs to
 * the next "##" header or the end of the file. Description and Usage are
 * required.
 */
class SkillRegistry {
public:
    static constexpr const char* kSkillDoc = "SKILL.md";

    explicit SkillRegistry(std::filesystem::path skills_dir);

    /// Skill name -> SKILL.md path, sorted by name
    [[nodiscard]] std::map<std::string, std::filesystem::path> list_skills() const;

    [[nodiscard]] SkillValidation validate_skill(const std::filesystem::path& skill_doc) const;

    /// Validate every listed skill: {name: validation}
    [[nodiscard]] nlohmann::json validate_all() const;

    [[nodiscard]] static SkillInfo parse_skill_doc(std::string_view content);

    [[nodiscard]] static std::string generate_template(const std::string& skill_name,
                                                       const std::string& description);

    /// Create the directory and its __init__.py so "import skills.x" works
    void ensure_package() const;

    [[nodiscard]] const std::filesystem::path& skills_dir() const { return skills_dir_; }

private:
    std::filesystem::path skills_dir_;
};

} // namespace execbox
