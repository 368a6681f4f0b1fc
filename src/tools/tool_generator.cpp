#include "tools/tool_generator.hpp"
#include "parser/python_lexer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <optional>
#include <set>

namespace fs = std::filesystem;

namespace execbox {

namespace {

// Text safe inside a triple-quoted docstring
std::string docstring_text(std::string_view text) {
    std::string out(text);
    utils::replace_all(out, "\\", "\\\\");
    utils::replace_all(out, "\"\"\"", "\\\"\\\"\\\"");
    if (!out.empty() && out.back() == '"') out.insert(out.size() - 1, "\\");
    return out;
}

// JSON string escapes are valid Python string escapes
std::string python_string(std::string_view text) {
    return nlohmann::json(std::string(text)).dump();
}

std::string first_line(const std::string& text) {
    const auto nl = text.find('\n');
    return utils::trim(nl == std::string::npos ? text : text.substr(0, nl));
}

struct Param {
    std::string wire_name;
    std::string ident;
    std::string type;
    std::string description;
    bool required = false;
    std::optional<nlohmann::json> default_value;
};

bool write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << content;
    out.close();
    return !out.fail();
}

} // anonymous namespace

nlohmann::json GenerationVerification::to_json() const {
    return {
        {"all_files_exist", all_files_exist},
        {"missing_files", missing_files},
        {"file_paths", file_paths},
        {"errors", errors},
    };
}

ToolGenerator::ToolGenerator(fs::path workspace_dir)
    : workspace_dir_(std::move(workspace_dir)),
      servers_dir_(workspace_dir_ / "servers") {}

// ============================================================================
// Type and name mapping
// ============================================================================

std::string ToolGenerator::python_type(const nlohmann::json& schema) {
    if (!schema.is_object() || !schema.contains("type")) return "Any";

    const auto& type = schema["type"];
    // ["string", "null"] style unions: first non-null member wins
    if (type.is_array()) {
        for (const auto& t : type) {
            if (t.is_string() && t.get<std::string>() != "null") {
                nlohmann::json narrowed = schema;
                narrowed["type"] = t;
                return python_type(narrowed);
            }
        }
        return "Any";
    }
    if (!type.is_string()) return "Any";

    const auto& name = type.get_ref<const std::string&>();
    if (name == "string") return "str";
    if (name == "integer") return "int";
    if (name == "number") return "float";
    if (name == "boolean") return "bool";
    if (name == "array") {
        const auto items = schema.contains("items") ? schema["items"] : nlohmann::json::object();
        return std::format("List[{}]", python_type(items));
    }
    if (name == "object") return "Dict[str, Any]";
    return "Any";
}

std::string ToolGenerator::safe_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 1);
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_') {
            out += c;
        } else {
            out += '_';
        }
    }
    if (out.empty()) return out;
    if (std::isdigit(static_cast<unsigned char>(out.front()))) out.insert(0, "_");
    if (python::Lexer::is_keyword(out)) out += '_';
    return out;
}

std::string ToolGenerator::python_literal(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return "None";
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? "True" : "False";
        case nlohmann::json::value_t::string:
            return python_string(value.get_ref<const std::string&>());
        case nlohmann::json::value_t::array: {
            std::vector<std::string> items;
            for (const auto& item : value) items.push_back(python_literal(item));
            return "[" + utils::join(items, ", ") + "]";
        }
        case nlohmann::json::value_t::object: {
            std::vector<std::string> items;
            for (auto it = value.begin(); it != value.end(); ++it) {
                items.push_back(python_string(it.key()) + ": " + python_literal(it.value()));
            }
            return "{" + utils::join(items, ", ") + "}";
        }
        default:
            return value.dump();
    }
}

// ============================================================================
// Source generation
// ============================================================================

Result<std::string> ToolGenerator::generate_tool_source(const Tool& tool) {
    const std::string func_name = safe_identifier(tool.name);
    if (func_name.empty()) {
        return Result<std::string>::error(ErrorCategory::GENERATION_VERIFICATION,
            "tool name is empty");
    }

    const auto& schema = tool.input_schema;
    if (!schema.is_null() && !schema.is_object()) {
        return Result<std::string>::error(ErrorCategory::GENERATION_VERIFICATION,
            "input schema is not an object");
    }

    std::set<std::string> required;
    if (schema.is_object() && schema.contains("required")) {
        if (!schema["required"].is_array()) {
            return Result<std::string>::error(ErrorCategory::GENERATION_VERIFICATION,
                "'required' is not an array");
        }
        for (const auto& r : schema["required"]) {
            if (r.is_string()) required.insert(r.get<std::string>());
        }
    }

    std::vector<Param> params;
    std::set<std::string> idents;
    if (schema.is_object() && schema.contains("properties")) {
        const auto& props = schema["properties"];
        if (!props.is_object()) {
            return Result<std::string>::error(ErrorCategory::GENERATION_VERIFICATION,
                "'properties' is not an object");
        }
        for (auto it = props.begin(); it != props.end(); ++it) {
            Param p;
            p.wire_name = it.key();
            p.ident = safe_identifier(it.key());
            if (p.ident.empty() || !idents.insert(p.ident).second) {
                return Result<std::string>::error(ErrorCategory::GENERATION_VERIFICATION,
                    std::format("parameter name '{}' cannot be mapped to a unique identifier",
                                it.key()));
            }
            const auto& ps = it.value();
            p.type = python_type(ps);
            p.required = required.contains(p.wire_name);
            if (ps.is_object()) {
                if (ps.contains("description") && ps["description"].is_string()) {
                    p.description = first_line(ps["description"].get<std::string>());
                }
                if (ps.contains("default") && !ps["default"].is_null()) {
                    p.default_value = ps["default"];
                }
            }
            params.push_back(std::move(p));
        }
    }

    // Required parameters first so the signature stays valid Python
    std::stable_partition(params.begin(), params.end(),
                          [](const Param& p) { return p.required; });

    std::vector<std::string> signature;
    std::vector<std::string> arg_docs;
    for (const auto& p : params) {
        if (p.required) {
            signature.push_back(std::format("{}: {}", p.ident, p.type));
        } else if (p.default_value) {
            signature.push_back(std::format("{}: {} = {}", p.ident, p.type,
                                            python_literal(*p.default_value)));
        } else {
            signature.push_back(std::format("{}: Optional[{}] = None", p.ident, p.type));
        }
        arg_docs.push_back(std::format("    {} ({}): {}", p.ident, p.type, p.description));
    }

    const std::string description = tool.description.empty()
        ? std::format("Call tool {}", tool.name) : tool.description;

    std::string src;
    src += "\"\"\"\n";
    src += docstring_text(description);
    src += "\n\nArgs:\n";
    src += arg_docs.empty() ? std::string("    None") : docstring_text(utils::join(arg_docs, "\n"));
    src += "\n\nReturns:\n    ToolResult: Result from the tool call\n\"\"\"\n";
    src += "from typing import Any, Dict, List, Optional\n\n";
    src += "from sandbox_runtime import ToolResult\n";
    src += "from sandbox_runtime import call_tool as _call_tool\n\n\n";
    src += std::format("async def {}({}) -> ToolResult:\n", func_name, utils::join(signature, ", "));
    src += std::format("    \"\"\"{}\"\"\"\n", docstring_text(first_line(description)));
    src += "    _args = {\n";
    for (const auto& p : params) {
        src += std::format("        {}: {},\n", python_string(p.wire_name), p.ident);
    }
    src += "    }\n";
    src += "    _args = {k: v for k, v in _args.items() if v is not None}\n";
    src += std::format("    return await _call_tool({}, _args)\n", python_string(tool.name));

    return Result<std::string>::ok(std::move(src));
}

GeneratedServer ToolGenerator::generate_server_files(const std::string& server_name,
                                                     const std::vector<Tool>& tools) const {
    GeneratedServer server;
    server.server_name = safe_identifier(server_name);
    if (server.server_name.empty()) server.server_name = "tools";
    server.server_dir = servers_dir_ / server.server_name;

    fs::create_directories(servers_dir_);
    if (!fs::exists(servers_dir_ / "__init__.py")) {
        if (!write_file(servers_dir_ / "__init__.py", "\"\"\"Generated tool packages.\"\"\"\n")) {
            utils::log::warn(std::format("Could not write {}", (servers_dir_ / "__init__.py").string()));
        }
    }

    std::error_code ec;
    fs::remove_all(server.server_dir, ec);
    if (ec) {
        utils::log::warn(std::format("Could not remove stale server directory {}: {}",
                                     server.server_dir.string(), ec.message()));
    }
    fs::create_directories(server.server_dir);

    std::string init = std::format(
        "\"\"\"\n{} tool wrappers\n\nGenerated from tool provider discovery.\n\"\"\"\n",
        server.server_name);

    for (const auto& tool : tools) {
        auto source = generate_tool_source(tool);
        if (source.is_error()) {
            server.errors.push_back(std::format("{}: {}", tool.name, source.error_message()));
            utils::log::warn(std::format("Skipping tool '{}': {}", tool.name, source.error_message()));
            continue;
        }

        const std::string ident = safe_identifier(tool.name);
        if (std::find(server.tool_names.begin(), server.tool_names.end(), ident) !=
            server.tool_names.end()) {
            server.errors.push_back(std::format("{}: duplicate wrapper name '{}'", tool.name, ident));
            continue;
        }

        const fs::path file = server.server_dir / (ident + ".py");
        server.tool_files.push_back(file);
        if (!write_file(file, source.value())) {
            server.errors.push_back(std::format("{}: could not write {}", tool.name, file.string()));
            continue;
        }
        init += std::format("from .{} import {}\n", ident, ident);
        server.tool_names.push_back(ident);
    }

    std::vector<std::string> quoted;
    for (const auto& name : server.tool_names) quoted.push_back(std::format("'{}'", name));
    init += std::format("\n__all__ = [{}]\n", utils::join(quoted, ", "));

    const fs::path init_file = server.server_dir / "__init__.py";
    server.tool_files.push_back(init_file);
    if (!write_file(init_file, init)) {
        server.errors.push_back(std::format("__init__.py: could not write {}", init_file.string()));
    }
    return server;
}

GenerationVerification ToolGenerator::verify(const GeneratedServer& server) const {
    GenerationVerification v;
    for (const auto& err : server.errors) {
        v.errors.push_back(err);
    }

    std::error_code ec;
    if (server.server_dir.empty() || !fs::is_directory(server.server_dir, ec)) {
        v.all_files_exist = false;
        v.errors.push_back(std::format("Server directory does not exist: {}",
                                       server.server_dir.string()));
        return v;
    }

    for (const auto& file : server.tool_files) {
        v.file_paths.push_back(file.string());
        if (!fs::exists(file, ec)) {
            v.all_files_exist = false;
            v.missing_files.push_back(file.string());
        } else if (fs::file_size(file, ec) == 0 || ec) {
            v.all_files_exist = false;
            v.errors.push_back(std::format("File is empty: {}", file.string()));
        }
    }
    return v;
}

nlohmann::json ToolGenerator::generate(IToolProvider& provider) const {
    const auto tools = provider.discover_tools();
    const std::string server_name = provider.provider_name();

    const auto server = generate_server_files(server_name, tools);
    const auto verification = verify(server);

    std::vector<std::string> files;
    for (const auto& f : server.tool_files) files.push_back(f.string());

    // Counts cover importable wrappers only; skipped tools show up in errors
    nlohmann::json servers = nlohmann::json::object();
    servers[server.server_name] = {
        {"tool_count", server.tool_names.size()},
        {"discovered_count", tools.size()},
        {"tools", server.tool_names},
        {"server_dir", server.server_dir.string()},
        {"tool_files", files},
        {"verification", verification.to_json()},
        {"provider_config", provider.provider_config()},
    };

    if (verification.all_files_exist) {
        utils::log::info(std::format("Generated {} tool wrapper(s) for server '{}' in {}",
            server.tool_names.size(), server.server_name, server.server_dir.string()));
    } else {
        utils::log::warn(std::format("Tool generation for server '{}' incomplete: {} error(s), {} missing file(s)",
            server.server_name, verification.errors.size(), verification.missing_files.size()));
    }

    return {
        {"servers", std::move(servers)},
        {"total_tools", server.tool_names.size()},
        {"server_count", 1},
        {"workspace_dir", workspace_dir_.string()},
        {"servers_dir", servers_dir_.string()},
        {"provider_type", server_name},
    };
}

} // namespace execbox
