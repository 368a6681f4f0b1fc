#include "provider/mcp_tool_provider.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>

namespace execbox {

namespace {

constexpr const char* kAccept = "application/json, text/event-stream";
constexpr const char* kSessionHeader = "Mcp-Session-Id";

} // anonymous namespace

McpToolProvider::McpToolProvider(ProviderSettings settings)
    : settings_(std::move(settings)),
      endpoint_(split_endpoint(settings_.endpoint)) {}

McpToolProvider::Endpoint McpToolProvider::split_endpoint(const std::string& url) {
    Endpoint ep;
    const auto scheme_end = url.find("://");
    const size_t host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    const auto path_start = url.find('/', host_start);
    if (path_start == std::string::npos) {
        ep.base = url;
        ep.path = "/";
    } else {
        ep.base = url.substr(0, path_start);
        ep.path = url.substr(path_start);
    }
    if (scheme_end == std::string::npos) {
        ep.base = "http://" + ep.base;
    }
    return ep;
}

std::string McpToolProvider::provider_name() const {
    return settings_.server_name.empty() ? std::string("mcp") : settings_.server_name;
}

nlohmann::json McpToolProvider::provider_config() const {
    return {
        {"type", "mcp"},
        {"endpoint", settings_.endpoint},
        {"server_name", provider_name()},
    };
}

// ============================================================================
// Transport
// ============================================================================

McpToolProvider::HttpReply McpToolProvider::post(const nlohmann::json& message,
                                                 const std::string& session_id) const {
    httplib::Client client(endpoint_.base);
    const auto timeout_sec = static_cast<time_t>(settings_.timeout_ms / 1000);
    const auto timeout_usec = static_cast<time_t>((settings_.timeout_ms % 1000) * 1000);
    client.set_connection_timeout(timeout_sec, timeout_usec);
    client.set_read_timeout(timeout_sec, timeout_usec);
    client.set_write_timeout(timeout_sec, timeout_usec);

    httplib::Headers headers = {
        {"Accept", kAccept},
        {"MCP-Protocol-Version", kProtocolVersion},
    };
    if (!session_id.empty()) {
        headers.emplace(kSessionHeader, session_id);
    }

    auto res = client.Post(endpoint_.path, headers, message.dump(), "application/json");
    if (!res) {
        throw ProviderError(std::format("HTTP request to {}{} failed: {}",
            endpoint_.base, endpoint_.path, httplib::to_string(res.error())));
    }

    HttpReply reply;
    reply.status = res->status;
    reply.body = res->body;
    reply.content_type = res->get_header_value("Content-Type");
    reply.session_id = res->get_header_value(kSessionHeader);
    return reply;
}

std::optional<nlohmann::json> McpToolProvider::parse_event_stream(const std::string& body,
                                                                  int64_t id) {
    // Events are separated by blank lines; data lines of one event are joined with '\n'
    std::string data;
    std::optional<nlohmann::json> match;

    auto flush_event = [&]() {
        if (data.empty()) return;
        auto msg = nlohmann::json::parse(data, nullptr, false);
        data.clear();
        if (msg.is_discarded() || !msg.is_object()) return;
        if (msg.contains("id") && msg["id"].is_number_integer() &&
            msg["id"].get<int64_t>() == id) {
            match = std::move(msg);
        }
    };

    size_t pos = 0;
    while (pos <= body.size()) {
        auto end = body.find('\n', pos);
        if (end == std::string::npos) end = body.size();
        std::string line = body.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.empty()) {
            flush_event();
        } else if (line.starts_with("data:")) {
            std::string_view value(line);
            value.remove_prefix(5);
            if (!value.empty() && value.front() == ' ') value.remove_prefix(1);
            if (!data.empty()) data += '\n';
            data += value;
        }
        if (end == body.size()) break;
        pos = end + 1;
    }
    flush_event();
    return match;
}

nlohmann::json McpToolProvider::decode_reply(const HttpReply& reply, int64_t id) {
    nlohmann::json msg;
    if (reply.content_type.find("text/event-stream") != std::string::npos) {
        auto found = parse_event_stream(reply.body, id);
        if (!found) {
            throw ProviderError(std::format("No response with id {} in event stream", id));
        }
        msg = std::move(*found);
    } else {
        msg = nlohmann::json::parse(reply.body, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) {
            throw ProviderError("Invalid JSON-RPC response body");
        }
    }

    if (msg.contains("error") && !msg["error"].is_null()) {
        const auto& err = msg["error"];
        if (!err.is_object()) {
            throw ProviderError(std::format("JSON-RPC error: {}", err.dump()));
        }
        const auto code = err.find("code");
        const auto message = err.find("message");
        throw ProviderError(std::format("JSON-RPC error {}: {}",
            code != err.end() && code->is_number_integer() ? code->get<int64_t>() : 0,
            message != err.end() && message->is_string() ? message->get<std::string>()
                                                         : err.dump()));
    }
    if (!msg.contains("result")) {
        throw ProviderError("JSON-RPC response has no result");
    }
    return msg["result"];
}

// ============================================================================
// Session
// ============================================================================

std::string McpToolProvider::ensure_session() {
    std::lock_guard lock(session_mutex_);
    if (session_open_) return session_id_;

    const int64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
    const nlohmann::json init = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "initialize"},
        {"params", {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", "execbox"}, {"version", "1.0.0"}}},
        }},
    };

    const auto reply = post(init, "");
    if (reply.status < 200 || reply.status >= 300) {
        throw ProviderError(std::format("MCP initialize failed with HTTP {}", reply.status));
    }
    const auto result = decode_reply(reply, id);
    session_id_ = reply.session_id;

    const nlohmann::json initialized = {
        {"jsonrpc", "2.0"},
        {"method", "notifications/initialized"},
    };
    const auto ack = post(initialized, session_id_);
    if (ack.status < 200 || ack.status >= 300) {
        throw ProviderError(std::format("MCP initialized notification failed with HTTP {}",
                                        ack.status));
    }

    session_open_ = true;
    utils::log::debug(std::format("MCP session opened with {} (server: {}, session: {})",
        settings_.endpoint,
        result.contains("serverInfo") && result["serverInfo"].is_object()
            ? result["serverInfo"].value("name", std::string("?")) : "?",
        session_id_.empty() ? "none" : session_id_));
    return session_id_;
}

void McpToolProvider::reset_session(const std::string& stale_id) {
    std::lock_guard lock(session_mutex_);
    if (session_open_ && session_id_ == stale_id) {
        session_open_ = false;
        session_id_.clear();
    }
}

nlohmann::json McpToolProvider::request(const std::string& method, nlohmann::json params) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        const std::string session = ensure_session();
        const int64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
        const nlohmann::json msg = {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params", params},
        };

        const auto reply = post(msg, session);
        if (reply.status == 404 && attempt == 0 && !session.empty()) {
            utils::log::info("MCP session expired, re-initializing");
            reset_session(session);
            continue;
        }
        if (reply.status < 200 || reply.status >= 300) {
            throw ProviderError(std::format("HTTP {} from MCP server", reply.status));
        }
        return decode_reply(reply, id);
    }
    throw ProviderError("MCP session could not be re-established");
}

// ============================================================================
// IToolProvider
// ============================================================================

std::vector<Tool> McpToolProvider::discover_tools() {
    std::vector<Tool> tools;
    try {
        std::optional<std::string> cursor;
        do {
            nlohmann::json params = nlohmann::json::object();
            if (cursor) params["cursor"] = *cursor;

            const auto result = request("tools/list", std::move(params));
            if (result.contains("tools") && result["tools"].is_array()) {
                for (const auto& t : result["tools"]) {
                    Tool tool;
                    tool.name = t.value("name", std::string());
                    if (t.contains("description") && t["description"].is_string()) {
                        tool.description = t["description"].get<std::string>();
                    }
                    if (t.contains("inputSchema") && t["inputSchema"].is_object()) {
                        tool.input_schema = t["inputSchema"];
                    }
                    tool.provider_name = provider_name();
                    tools.push_back(std::move(tool));
                }
            }

            cursor.reset();
            if (result.contains("nextCursor") && result["nextCursor"].is_string()) {
                cursor = result["nextCursor"].get<std::string>();
            }
        } while (cursor && !cursor->empty());
    } catch (const std::exception& e) {
        throw ToolDiscoveryError(std::format("Failed to discover MCP tools: {}", e.what()));
    }

    utils::log::info(std::format("Discovered {} tool(s) from MCP server {}",
                                 tools.size(), settings_.endpoint));
    return tools;
}

ToolResult McpToolProvider::call_tool(const std::string& tool_name,
                                      const nlohmann::json& arguments) {
    try {
        const nlohmann::json params = {
            {"name", tool_name},
            {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments},
        };
        return convert_result(request("tools/call", params));
    } catch (const std::exception& e) {
        throw ToolCallError(std::format("Failed to call MCP tool '{}': {}", tool_name, e.what()));
    }
}

ToolResult McpToolProvider::convert_result(const nlohmann::json& result) {
    ToolResult out;
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& item : result["content"]) {
            if (item.is_object() && item.value("type", std::string()) == "text" &&
                item.contains("text") && item["text"].is_string()) {
                out.content.push_back(item["text"]);
            } else {
                out.content.push_back(item);
            }
        }
    }

    out.is_error = result.value("isError", false);
    if (out.is_error && !out.content.empty()) {
        const auto& first = out.content.front();
        out.error_message = first.is_string() ? first.get<std::string>() : first.dump();
    }

    nlohmann::json metadata = nlohmann::json::object();
    if (result.contains("structuredContent") && !result["structuredContent"].is_null()) {
        metadata["structuredContent"] = result["structuredContent"];
    }
    if (result.contains("_meta") && result["_meta"].is_object()) {
        metadata["_meta"] = result["_meta"];
    }
    if (!metadata.empty()) {
        out.metadata = std::move(metadata);
    }
    return out;
}

} // namespace execbox
