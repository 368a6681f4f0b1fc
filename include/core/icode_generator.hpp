#pragma once

#include <string>
#include <vector>

namespace execbox {

/**
 * @brief Interface for the model call that turns a task prompt into source
 *
 * Implementations may retry or fall back internally; the orchestrator only
 * sees the final text, which may still be wrapped in a ```python fence.
 */
class ICodeGenerator {
public:
    virtual ~ICodeGenerator() = default;

    /**
     * @brief Produce program text for a task
     * @throws std::runtime_error when no text could be produced
     */
    [[nodiscard]] virtual std::string generate(const std::string& prompt) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Interface for heuristic repair of generated source
 *
 * fix() is idempotent and never throws; it returns the possibly modified
 * source plus one description per fix applied.
 */
class ISourceFixer {
public:
    struct FixResult {
        std::string source;
        std::vector<std::string> fixes;
    };

    virtual ~ISourceFixer() = default;

    [[nodiscard]] virtual FixResult fix(const std::string& source) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace execbox
