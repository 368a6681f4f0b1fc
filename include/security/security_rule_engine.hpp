#pragma once

#include "core/types.hpp"
#include "security/security_rule.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace execbox {

/**
 * @brief Static validation of candidate source
 *
 * Parses the source once and runs every rule over the AST. Only a parse
 * failure or a BLOCK-level finding marks the result as blocked.
 *
 * Rules are registered before first use; validate() is const and may be
 * called concurrently afterwards.
 */
class SecurityRuleEngine {
public:
    /// Engine with the default rules: import, call, filesystem literal, infinite loop
    SecurityRuleEngine();

    /// Engine with a caller-supplied rule list (may be empty)
    explicit SecurityRuleEngine(std::vector<std::unique_ptr<ISecurityRule>> rules);

    void add_rule(std::unique_ptr<ISecurityRule> rule);

    /**
     * @brief Validate source text
     * @return Result with violations sorted by level; syntax errors short-circuit
     */
    [[nodiscard]] ValidationResult validate(std::string_view source) const;

    [[nodiscard]] size_t rule_count() const { return rules_.size(); }

    [[nodiscard]] static std::vector<std::unique_ptr<ISecurityRule>> default_rules();

private:
    std::vector<std::unique_ptr<ISecurityRule>> rules_;
};

} // namespace execbox
