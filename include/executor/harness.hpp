#pragma once

#include "policy/filesystem_policy.hpp"
#include "policy/network_policy.hpp"

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace execbox {

/**
 * @brief Everything baked into one generated harness script
 *
 * Policies are copied in as JSON, so the child never shares state with the
 * supervisor. A null policy pointer disables that layer of enforcement.
 */
struct HarnessOptions {
    std::filesystem::path workspace;
    std::filesystem::path servers_dir;
    uint64_t max_memory_bytes = 0;
    uint32_t max_cpu_seconds = 0;
    const NetworkPolicy* network_policy = nullptr;
    const FileSystemPolicy* filesystem_policy = nullptr;
};

/// File descriptor the child uses to reach the tool bridge
inline constexpr int kBridgeFd = 3;

/// Indentation applied to user code inside the harness entry coroutine
inline constexpr std::string_view kUserCodeIndent = "    ";

/**
 * @brief Indent user code for insertion into the harness coroutine.
 *
 * Lines listed in @p string_lines start inside a multi-line string literal and
 * are left untouched, as are blank lines.
 */
[[nodiscard]] std::string indent_user_code(std::string_view source,
                                           const std::set<uint32_t>& string_lines);

/**
 * @brief Build the complete Python script for one execution.
 *
 * The script applies resource limits, installs the socket and open() guards,
 * binds the in-child sandbox_runtime module to the tool bridge, runs the user
 * code inside an async entry coroutine and prints the serialized outcome as
 * its final stdout line.
 */
[[nodiscard]] std::string build_harness(const HarnessOptions& options,
                                        std::string_view user_code,
                                        const std::set<uint32_t>& string_lines);

} // namespace execbox
