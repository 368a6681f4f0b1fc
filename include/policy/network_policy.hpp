#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/**
 * @brief Outbound connection allow-list for sandboxed programs
 *
 * Default deny. An endpoint entry is "host", "host:port", or a wildcard
 * pattern with '*' per dot-separated label ("*.internal", "10.0.*.*:8080").
 *
 * Match order for is_allowed(host, port):
 * 1. Loopback hosts (127.0.0.1, localhost, ::1, 0.0.0.0) always pass
 * 2. Exact "host:port" (or "host" when no port is given)
 * 3. Host-only entry (any port)
 * 4. Wildcard patterns, label count must match, optional ":port" must match
 *
 * Built once per executor and baked into each child's harness; mutation
 * after construction is not synchronized.
 */
class NetworkPolicy {
public:
    NetworkPolicy() = default;
    explicit NetworkPolicy(const std::vector<std::string>& allowed_endpoints);

    /**
     * @brief Policy seeded with a provider URL plus explicit extra endpoints
     * @param provider_url e.g. "http://mcp:8974/mcp" (ignored when empty or unparsable)
     */
    [[nodiscard]] static NetworkPolicy from_provider_endpoint(
        std::string_view provider_url,
        const std::vector<std::string>& extra_endpoints = {});

    /**
     * @brief Extract "host:port" from a URL
     *
     * Port defaults to 443 for https/wss and 80 otherwise.
     * "http://mcp:8974/mcp" -> "mcp:8974", "https://api.example.com/v1" -> "api.example.com:443"
     */
    [[nodiscard]] static std::optional<std::string> extract_endpoint(std::string_view url);

    [[nodiscard]] static bool is_loopback(std::string_view host);

    [[nodiscard]] bool is_allowed(std::string_view host,
                                  std::optional<uint16_t> port = std::nullopt) const;

    /**
     * @brief Check a connection attempt
     * @return Denial message, or std::nullopt when allowed
     */
    [[nodiscard]] std::optional<std::string> validate_connection(
        std::string_view host, std::optional<uint16_t> port = std::nullopt) const;

    void add_allowed_endpoint(const std::string& endpoint);
    void remove_allowed_endpoint(const std::string& endpoint);

    /// Sorted copy of the allow-set
    [[nodiscard]] std::vector<std::string> get_allowed_endpoints() const;

    /// {"allowed_endpoints": [...], "loopback": [...]}
    [[nodiscard]] nlohmann::json to_json() const;

private:
    [[nodiscard]] static bool matches_pattern(std::string_view host,
                                              std::optional<uint16_t> port,
                                              std::string_view pattern);

    std::set<std::string> allowed_;
};

} // namespace execbox
