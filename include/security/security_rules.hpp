#pragma once

#include "security/security_rule.hpp"

#include <string_view>

namespace execbox {

/**
 * @brief Blocks process, network and serialization modules; warns on
 * modules that are on neither list.
 */
class DangerousImportRule : public ISecurityRule {
public:
    [[nodiscard]] std::vector<SecurityViolation> check(
        const python::Module& module) const override;

    [[nodiscard]] std::string name() const override { return "dangerous_import"; }
    [[nodiscard]] ViolationLevel level() const override { return ViolationLevel::BLOCK; }

    /// True when the module or any dotted prefix of it is blocked
    [[nodiscard]] static bool is_blocked(std::string_view module);

    /// True when the first segment of the module is on the allow list
    [[nodiscard]] static bool is_allowed(std::string_view module);
};

/**
 * @brief Blocks reflection/eval built-ins and process-control attribute calls
 */
class DangerousFunctionCallRule : public ISecurityRule {
public:
    [[nodiscard]] std::vector<SecurityViolation> check(
        const python::Module& module) const override;

    [[nodiscard]] std::string name() const override { return "dangerous_function_call"; }
    [[nodiscard]] ViolationLevel level() const override { return ViolationLevel::BLOCK; }

    [[nodiscard]] static bool is_dangerous_builtin(std::string_view name);
    [[nodiscard]] static bool is_dangerous_attribute(std::string_view dotted_path);
};

/**
 * @brief Warns on string literals naming OS-sensitive absolute paths.
 *
 * Advisory only; FileSystemPolicy is what enforces access at run time.
 */
class FileSystemAccessRule : public ISecurityRule {
public:
    [[nodiscard]] std::vector<SecurityViolation> check(
        const python::Module& module) const override;

    [[nodiscard]] std::string name() const override { return "filesystem_access"; }
    [[nodiscard]] ViolationLevel level() const override { return ViolationLevel::WARN; }
};

/**
 * @brief Warns on `while True:` loops whose body never breaks
 */
class InfiniteLoopRule : public ISecurityRule {
public:
    [[nodiscard]] std::vector<SecurityViolation> check(
        const python::Module& module) const override;

    [[nodiscard]] std::string name() const override { return "infinite_loop"; }
    [[nodiscard]] ViolationLevel level() const override { return ViolationLevel::WARN; }
};

} // namespace execbox
