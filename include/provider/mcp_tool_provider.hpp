#pragma once

#include "provider/tool_provider.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace execbox {

/**
 * @brief Tool provider for MCP servers over streamable HTTP
 *
 * Speaks JSON-RPC 2.0 to a single endpoint via httplib::Client:
 * initialize + notifications/initialized once per session, then tools/list
 * (following nextCursor) and tools/call. Replies may be application/json or
 * a text/event-stream whose data lines carry the JSON-RPC response.
 *
 * The Mcp-Session-Id returned by initialize is reused; a 404 on a request
 * drops the session and retries once with a fresh one.
 */
class McpToolProvider : public IToolProvider {
public:
    static constexpr const char* kProtocolVersion = "2025-03-26";

    explicit McpToolProvider(ProviderSettings settings);

    [[nodiscard]] std::vector<Tool> discover_tools() override;

    [[nodiscard]] ToolResult call_tool(const std::string& tool_name,
                                       const nlohmann::json& arguments) override;

    [[nodiscard]] std::string provider_name() const override;

    [[nodiscard]] nlohmann::json provider_config() const override;

    /// Convert a tools/call result object into a ToolResult
    [[nodiscard]] static ToolResult convert_result(const nlohmann::json& result);

    /**
     * @brief Extract the JSON-RPC response with @p id from an SSE body
     * @return The matching message, or std::nullopt if none was found
     */
    [[nodiscard]] static std::optional<nlohmann::json> parse_event_stream(
        const std::string& body, int64_t id);

private:
    struct Endpoint {
        std::string base;   // scheme://host:port
        std::string path;   // "/mcp"
    };

    struct HttpReply {
        int status = 0;
        std::string content_type;
        std::string body;
        std::string session_id;
    };

    [[nodiscard]] static Endpoint split_endpoint(const std::string& url);

    /// POST one JSON-RPC message; no session handling
    [[nodiscard]] HttpReply post(const nlohmann::json& message,
                                 const std::string& session_id) const;

    /// Session id, initializing a session first if none is open
    [[nodiscard]] std::string ensure_session();

    void reset_session(const std::string& stale_id);

    /**
     * @brief Send a request and return its "result" member
     * @throws ProviderError on transport, HTTP, or JSON-RPC errors
     */
    [[nodiscard]] nlohmann::json request(const std::string& method, nlohmann::json params);

    [[nodiscard]] static nlohmann::json decode_reply(const HttpReply& reply, int64_t id);

    ProviderSettings settings_;
    Endpoint endpoint_;

    std::mutex session_mutex_;
    std::string session_id_;
    bool session_open_ = false;

    std::atomic<int64_t> next_id_{1};
};

} // namespace execbox
