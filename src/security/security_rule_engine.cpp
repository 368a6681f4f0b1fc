#include "security/security_rule_engine.hpp"
#include "security/security_rules.hpp"
#include "parser/python_parser.hpp"
#include "core/utils.hpp"

#include <format>

namespace execbox {

SecurityRuleEngine::SecurityRuleEngine()
    : rules_(default_rules()) {}

SecurityRuleEngine::SecurityRuleEngine(std::vector<std::unique_ptr<ISecurityRule>> rules)
    : rules_(std::move(rules)) {}

std::vector<std::unique_ptr<ISecurityRule>> SecurityRuleEngine::default_rules() {
    std::vector<std::unique_ptr<ISecurityRule>> rules;
    rules.push_back(std::make_unique<DangerousImportRule>());
    rules.push_back(std::make_unique<DangerousFunctionCallRule>());
    rules.push_back(std::make_unique<FileSystemAccessRule>());
    rules.push_back(std::make_unique<InfiniteLoopRule>());
    return rules;
}

void SecurityRuleEngine::add_rule(std::unique_ptr<ISecurityRule> rule) {
    if (rule) rules_.push_back(std::move(rule));
}

ValidationResult SecurityRuleEngine::validate(std::string_view source) const {
    ValidationResult result;

    auto parsed = python::Parser::parse(source);
    if (parsed.is_error()) {
        result.valid = false;
        result.blocked = true;
        result.syntax_error = parsed.error_message();
        utils::log::info(std::format("Validation rejected source: {}", parsed.error_message()));
        return result;
    }

    const python::Module& module = parsed.value();
    for (const auto& rule : rules_) {
        auto found = rule->check(module);
        for (auto& v : found) {
            result.violations.push_back(std::move(v));
        }
    }

    for (const auto& v : result.violations) {
        switch (v.level) {
            case ViolationLevel::BLOCK: result.blocking_violations.push_back(v); break;
            case ViolationLevel::WARN:  result.warnings.push_back(v); break;
            case ViolationLevel::INFO:  result.info.push_back(v); break;
        }
    }

    result.blocked = !result.blocking_violations.empty();
    result.valid = !result.blocked;

    if (result.blocked) {
        utils::log::warn(std::format("Validation blocked source: {} blocking violation(s), first: {}",
            result.blocking_violations.size(), result.blocking_violations.front().message));
    } else if (!result.warnings.empty()) {
        utils::log::debug(std::format("Validation passed with {} warning(s)",
            result.warnings.size()));
    }
    return result;
}

} // namespace execbox
