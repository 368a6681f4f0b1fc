#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace execbox {

nlohmann::json SecurityViolation::to_json() const {
    nlohmann::json j = {
        {"rule_name", rule_name},
        {"level", violation_level_to_string(level)},
        {"message", message},
        {"line", line},
    };
    j["column"] = column ? nlohmann::json(*column) : nlohmann::json(nullptr);
    j["snippet"] = snippet ? nlohmann::json(*snippet) : nlohmann::json(nullptr);
    return j;
}

namespace {

nlohmann::json violations_to_json(const std::vector<SecurityViolation>& list) {
    auto arr = nlohmann::json::array();
    for (const auto& v : list) {
        arr.push_back(v.to_json());
    }
    return arr;
}

} // anonymous namespace

nlohmann::json ValidationResult::to_json() const {
    nlohmann::json j = {
        {"valid", valid},
        {"blocked", blocked},
        {"violations", violations_to_json(violations)},
        {"blocking_violations", violations_to_json(blocking_violations)},
        {"warnings", violations_to_json(warnings)},
        {"info", violations_to_json(info)},
    };
    j["syntax_error"] = syntax_error ? nlohmann::json(*syntax_error) : nlohmann::json(nullptr);
    return j;
}

std::string ValidationResult::format_violations() const {
    if (syntax_error) {
        return std::format("[SYNTAX] {}", *syntax_error);
    }
    std::string out;
    for (const auto& v : violations) {
        std::string level = violation_level_to_string(v.level);
        std::ranges::transform(level, level.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (!out.empty()) out += '\n';
        out += std::format("[{}] {} (line {}): {}", level, v.rule_name, v.line, v.message);
    }
    return out;
}

nlohmann::json ExecutionResult::to_json() const {
    nlohmann::json j = {
        {"success", success},
        {"result", result},
        {"stdout", stdout_text},
        {"stderr", stderr_text},
        {"duration_ms", duration_ms},
    };
    if (error) j["error"] = *error;
    if (error_type) j["error_type"] = *error_type;
    if (traceback) j["traceback"] = *traceback;
    return j;
}

nlohmann::json Tool::to_json() const {
    nlohmann::json j = {
        {"name", name},
        {"description", description},
        {"input_schema", input_schema},
    };
    if (provider_name) j["provider_name"] = *provider_name;
    return j;
}

nlohmann::json ToolResult::to_json() const {
    nlohmann::json j = {
        {"content", content},
        {"is_error", is_error},
    };
    j["error_message"] = error_message ? nlohmann::json(*error_message) : nlohmann::json(nullptr);
    j["metadata"] = metadata ? *metadata : nlohmann::json(nullptr);
    return j;
}

} // namespace execbox
