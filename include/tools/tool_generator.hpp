#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "provider/tool_provider.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/**
 * @brief Files written for one server, plus per-tool generation failures
 */
struct GeneratedServer {
    std::string server_name;
    std::filesystem::path server_dir;
    std::vector<std::filesystem::path> tool_files;   // wrappers then __init__.py
    std::vector<std::string> tool_names;             // importable wrapper names
    std::vector<std::string> errors;                 // "<tool>: <reason>"
};

struct GenerationVerification {
    bool all_files_exist = true;
    std::vector<std::string> missing_files;
    std::vector<std::string> file_paths;
    std::vector<std::string> errors;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Emits importable Python wrappers for discovered tools
 *
 * Layout under the workspace:
 *   servers/<server>/<tool>.py    one async wrapper per tool
 *   servers/<server>/__init__.py  re-exports every wrapper
 *
 * Each wrapper forwards its non-None arguments to call_tool() from the
 * sandbox_runtime module, which the executor's harness binds to the tool
 * bridge. The server directory is rebuilt from scratch on every run.
 */
class ToolGenerator {
public:
    explicit ToolGenerator(std::filesystem::path workspace_dir);

    /// JSON Schema type -> Python annotation ("str", "List[int]", "Dict[str, Any]", "Any")
    [[nodiscard]] static std::string python_type(const nlohmann::json& schema);

    /// Replace '-' and '.' with '_', prefix a leading digit, suffix keywords with '_'
    [[nodiscard]] static std::string safe_identifier(std::string_view name);

    /// Render a JSON value as a Python literal (None/True/False, lists, dicts)
    [[nodiscard]] static std::string python_literal(const nlohmann::json& value);

    /**
     * @brief Source text of one wrapper module
     * @return GENERATION_VERIFICATION error when the tool's schema is unusable
     */
    [[nodiscard]] static Result<std::string> generate_tool_source(const Tool& tool);

    /**
     * @brief Write all wrapper files for one server
     *
     * A tool whose source cannot be generated or written is recorded in
     * GeneratedServer::errors; the remaining tools are still written.
     * @throws std::filesystem::filesystem_error if the server directory cannot be created
     */
    [[nodiscard]] GeneratedServer generate_server_files(const std::string& server_name,
                                                        const std::vector<Tool>& tools) const;

    /// Re-read every emitted path: must exist and be non-empty
    [[nodiscard]] GenerationVerification verify(const GeneratedServer& server) const;

    /**
     * @brief Discover tools from @p provider, generate, verify, and build the startup report
     * @throws ToolDiscoveryError when discovery fails
     */
    [[nodiscard]] nlohmann::json generate(IToolProvider& provider) const;

    [[nodiscard]] const std::filesystem::path& workspace_dir() const { return workspace_dir_; }
    [[nodiscard]] const std::filesystem::path& servers_dir() const { return servers_dir_; }

private:
    std::filesystem::path workspace_dir_;
    std::filesystem::path servers_dir_;
};

} // namespace execbox
