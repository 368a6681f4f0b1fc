#pragma once

#include "core/types.hpp"
#include "parser/python_ast.hpp"

#include <string>
#include <vector>

namespace execbox {

/**
 * @brief Interface for static source rules
 *
 * Each rule inspects the parsed module and reports what it finds.
 * SecurityRuleEngine runs every registered rule and merges the output.
 */
class ISecurityRule {
public:
    virtual ~ISecurityRule() = default;

    /**
     * @brief Inspect a parsed module
     * @param module Parsed source (AST plus source lines for snippets)
     * @return Violations found, in source order
     */
    [[nodiscard]] virtual std::vector<SecurityViolation> check(
        const python::Module& module) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Level used for the rule's primary finding
    [[nodiscard]] virtual ViolationLevel level() const = 0;
};

} // namespace execbox
