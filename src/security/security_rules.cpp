#include "security/security_rules.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace execbox {

namespace {

using python::Node;
using python::NodeKind;

constexpr std::array<std::string_view, 16> kBlockedImports = {
    "os", "subprocess", "sys", "socket", "urllib", "requests",
    "http", "ftplib", "smtplib", "telnetlib", "pickle", "marshal",
    "ctypes", "multiprocessing", "threading", "concurrent.futures",
};

constexpr std::array<std::string_view, 22> kAllowedImports = {
    "json", "pathlib", "typing", "collections", "itertools", "functools",
    "datetime", "time", "math", "random", "string", "csv", "re", "io",
    "asyncio", "servers", "skills", "importlib", "inspect", "pkgutil", "ast",
    "sandbox_runtime",
};

constexpr std::array<std::string_view, 17> kDangerousBuiltins = {
    "eval", "exec", "compile", "__import__", "open", "input", "raw_input",
    "execfile", "reload", "getattr", "setattr", "delattr", "hasattr",
    "globals", "locals", "vars", "dir",
};

constexpr std::array<std::string_view, 8> kDangerousAttributes = {
    "os.system", "os.popen", "subprocess.run", "subprocess.call",
    "subprocess.Popen", "subprocess.check_output", "sys.exit", "sys.modules",
};

// os.spawnv, os.execvp, ...
constexpr std::array<std::string_view, 2> kDangerousAttributePrefixes = {
    "os.spawn", "os.exec",
};

constexpr std::array<std::string_view, 12> kRestrictedPathPrefixes = {
    "/etc", "/home", "/var", "/usr", "/bin", "/sbin",
    "/sys", "/proc", "/dev", "/root", "/boot", "/lib",
};

template<size_t N>
bool contains(const std::array<std::string_view, N>& list, std::string_view value) {
    for (const auto& item : list) {
        if (item == value) return true;
    }
    return false;
}

SecurityViolation make_violation(const ISecurityRule& rule, ViolationLevel level,
                                 std::string message, const Node& node,
                                 const python::Module& module) {
    SecurityViolation v;
    v.rule_name = rule.name();
    v.level = level;
    v.message = std::move(message);
    v.line = node.line;
    v.column = node.col;
    const auto line = module.line_text(node.line);
    if (!line.empty()) {
        v.snippet = utils::trim(std::string(line));
    }
    return v;
}

bool body_has_break(const std::vector<python::NodePtr>& body);

bool node_has_break(const Node& node) {
    switch (node.kind) {
        case NodeKind::Break:
            return true;
        case NodeKind::For:
        case NodeKind::AsyncFor:
        case NodeKind::While:
        case NodeKind::If:
            return body_has_break(node.body) || body_has_break(node.orelse);
        case NodeKind::Try:
        case NodeKind::TryStar:
            if (body_has_break(node.body) || body_has_break(node.orelse) ||
                body_has_break(node.finalbody)) {
                return true;
            }
            for (const auto& handler : node.handlers) {
                if (body_has_break(handler->body)) return true;
            }
            return false;
        case NodeKind::With:
        case NodeKind::AsyncWith:
            return body_has_break(node.body);
        default:
            return false;
    }
}

bool body_has_break(const std::vector<python::NodePtr>& body) {
    for (const auto& stmt : body) {
        if (stmt && node_has_break(*stmt)) return true;
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// DangerousImportRule
// ============================================================================

bool DangerousImportRule::is_blocked(std::string_view module) {
    // The module itself, then every dotted prefix ("concurrent.futures.thread" -> ...)
    std::string_view candidate = module;
    for (;;) {
        if (contains(kBlockedImports, candidate)) return true;
        const auto dot = candidate.rfind('.');
        if (dot == std::string_view::npos) return false;
        candidate = candidate.substr(0, dot);
    }
}

bool DangerousImportRule::is_allowed(std::string_view module) {
    const auto dot = module.find('.');
    return contains(kAllowedImports, module.substr(0, dot));
}

std::vector<SecurityViolation> DangerousImportRule::check(
    const python::Module& module) const {

    std::vector<SecurityViolation> out;

    auto inspect = [&](const std::string& mod, const Node& node) {
        if (mod.empty()) return;
        if (is_blocked(mod)) {
            out.push_back(make_violation(*this, ViolationLevel::BLOCK,
                std::format("Dangerous import blocked: {}", mod), node, module));
        } else if (!is_allowed(mod)) {
            out.push_back(make_violation(*this, ViolationLevel::WARN,
                std::format("Unknown import: {} (may be unsafe)", mod), node, module));
        }
    };

    python::walk(*module.root, [&](const Node& node) {
        if (node.kind == NodeKind::Import) {
            for (const auto& alias : node.children) {
                inspect(alias->name, node);
            }
        } else if (node.kind == NodeKind::ImportFrom && node.level == 0) {
            // Relative imports stay inside the workspace package tree
            inspect(node.name, node);
        }
    });
    return out;
}

// ============================================================================
// DangerousFunctionCallRule
// ============================================================================

bool DangerousFunctionCallRule::is_dangerous_builtin(std::string_view name) {
    return contains(kDangerousBuiltins, name);
}

bool DangerousFunctionCallRule::is_dangerous_attribute(std::string_view dotted_path) {
    if (contains(kDangerousAttributes, dotted_path)) return true;
    for (const auto& prefix : kDangerousAttributePrefixes) {
        if (dotted_path.size() > prefix.size() && dotted_path.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

std::vector<SecurityViolation> DangerousFunctionCallRule::check(
    const python::Module& module) const {

    std::vector<SecurityViolation> out;
    python::walk(*module.root, [&](const Node& node) {
        if (node.kind != NodeKind::Call) return;
        const Node* func = node.child(0);
        if (!func) return;

        if (func->kind == NodeKind::Name) {
            if (is_dangerous_builtin(func->name)) {
                out.push_back(make_violation(*this, ViolationLevel::BLOCK,
                    std::format("Dangerous function call blocked: {}()", func->name),
                    node, module));
            }
        } else if (func->kind == NodeKind::Attribute) {
            const std::string path = python::dotted_name(*func);
            if (is_dangerous_attribute(path)) {
                out.push_back(make_violation(*this, ViolationLevel::BLOCK,
                    std::format("Dangerous function call blocked: {}()", path),
                    node, module));
            }
        }
    });
    return out;
}

// ============================================================================
// FileSystemAccessRule
// ============================================================================

std::vector<SecurityViolation> FileSystemAccessRule::check(
    const python::Module& module) const {

    std::vector<SecurityViolation> out;
    python::walk(*module.root, [&](const Node& node) {
        if (!node.is_constant(python::ConstantKind::STR)) return;
        for (const auto& prefix : kRestrictedPathPrefixes) {
            if (node.value.starts_with(prefix)) {
                out.push_back(make_violation(*this, ViolationLevel::WARN,
                    std::format("Potential filesystem access to restricted path: {}", node.value),
                    node, module));
                break;
            }
        }
    });
    return out;
}

// ============================================================================
// InfiniteLoopRule
// ============================================================================

std::vector<SecurityViolation> InfiniteLoopRule::check(
    const python::Module& module) const {

    std::vector<SecurityViolation> out;
    python::walk(*module.root, [&](const Node& node) {
        if (node.kind != NodeKind::While) return;
        const Node* test = node.child(0);
        if (!test || !test->is_constant(python::ConstantKind::TRUE)) return;
        if (!body_has_break(node.body)) {
            out.push_back(make_violation(*this, ViolationLevel::WARN,
                "Potential infinite loop: 'while True:' without 'break'", node, module));
        }
    });
    return out;
}

} // namespace execbox
