#include "executor/harness.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

namespace execbox {

namespace {

// @@SETTINGS@@ becomes a Python string literal holding the settings JSON;
// @@USER_CODE@@ becomes the indented user program.
constexpr std::string_view kHarnessTemplate = R"PY(import sys
import os
import io
import json
import types
import asyncio
import builtins
import linecache
import tokenize
import threading
import traceback
import socket as _socket_module

_SETTINGS = json.loads(@@SETTINGS@@)
_STDOUT = sys.__stdout__


def _emit(payload):
    try:
        text = json.dumps(payload, default=repr)
    except (TypeError, ValueError) as exc:
        text = json.dumps({
            "success": False,
            "error": "Result could not be serialized: " + str(exc),
            "error_type": type(exc).__name__,
        })
    _STDOUT.write("\n" + text + "\n")
    _STDOUT.flush()


def _failure(exc):
    return {
        "success": False,
        "error": str(exc),
        "error_type": type(exc).__name__,
        "traceback": traceback.format_exc(),
    }


try:
    import resource
    if _SETTINGS["max_memory_bytes"] > 0:
        _limit = _SETTINGS["max_memory_bytes"]
        resource.setrlimit(resource.RLIMIT_AS, (_limit, _limit))
    if _SETTINGS["max_cpu_seconds"] > 0:
        _limit = _SETTINGS["max_cpu_seconds"]
        resource.setrlimit(resource.RLIMIT_CPU, (_limit, _limit + 1))
except (ImportError, OSError, ValueError):
    pass


class PolicyViolation(PermissionError):
    """Raised when the network or filesystem policy denies an operation."""


# ---------------------------------------------------------------------------
# sandbox_runtime: tool calls travel to the supervisor over the bridge fd
# ---------------------------------------------------------------------------

class ToolResult:
    __slots__ = ("content", "is_error", "error_message", "metadata")

    def __init__(self, content=None, is_error=False, error_message=None, metadata=None):
        self.content = list(content or [])
        self.is_error = bool(is_error)
        self.error_message = error_message
        self.metadata = metadata

    @property
    def text(self):
        return "\n".join(item for item in self.content if isinstance(item, str))

    def to_dict(self):
        return {
            "content": self.content,
            "is_error": self.is_error,
            "error_message": self.error_message,
            "metadata": self.metadata,
        }

    def __repr__(self):
        return "ToolResult(content={!r}, is_error={!r}, error_message={!r})".format(
            self.content, self.is_error, self.error_message)


class ToolError(RuntimeError):
    """A tool call the supervisor could not complete."""


class _Bridge:
    def __init__(self, fd):
        self._lock = threading.Lock()
        self._next_id = 0
        try:
            self._sock = _socket_module.socket(fileno=fd)
        except OSError:
            self._sock = None
            self._reader = None
        else:
            self._reader = self._sock.makefile("rb")

    def call(self, tool_name, arguments):
        if self._sock is None:
            raise RuntimeError("Tool client not initialized")
        with self._lock:
            self._next_id += 1
            request = json.dumps(
                {"id": self._next_id, "tool": tool_name, "arguments": arguments},
                default=repr)
            self._sock.sendall(request.encode("utf-8") + b"\n")
            line = self._reader.readline()
        if not line:
            raise RuntimeError("Tool bridge closed by supervisor")
        reply = json.loads(line)
        if "error" in reply:
            error_type = reply.get("error_type") or "ToolError"
            raise type(error_type, (ToolError,), {})(reply["error"])
        return ToolResult(reply.get("content"), reply.get("is_error", False),
                          reply.get("error_message"), reply.get("metadata"))


_bridge = _Bridge(_SETTINGS["bridge_fd"])


async def _call_tool(tool_name, arguments=None):
    loop = asyncio.get_running_loop()
    return await loop.run_in_executor(None, _bridge.call, tool_name, dict(arguments or {}))


_runtime = types.ModuleType("sandbox_runtime")
_runtime.ToolResult = ToolResult
_runtime.ToolError = ToolError
_runtime.PolicyViolation = PolicyViolation
_runtime.call_tool = _call_tool
sys.modules["sandbox_runtime"] = _runtime


# ---------------------------------------------------------------------------
# Filesystem policy
# ---------------------------------------------------------------------------

_filesystem = _SETTINGS.get("filesystem")


def _fs_violation(path, action):
    if _filesystem is None:
        return None
    root = _filesystem["workspace_root"]
    try:
        raw = os.fsdecode(os.fspath(path))
        if not os.path.isabs(raw):
            raw = os.path.join(root, raw)
        resolved = os.path.realpath(raw)
    except (TypeError, ValueError, OSError):
        return "File system {} access to '{}' is blocked: path could not be resolved".format(
            action, path)
    inside = resolved == root or resolved.startswith(root.rstrip("/") + "/")
    parts = resolved.split("/")
    top = "/" + parts[1] if len(parts) > 1 and parts[1] else ""
    if top in _filesystem["restricted_dirs"] and not (top in _filesystem["exempt_dirs"] and inside):
        return ("File system {} access to '{}' is blocked by security policy: "
                "restricted system directory").format(action, path)
    if not inside:
        return ("File system {} access to '{}' is blocked by security policy: "
                "outside workspace directory '{}'").format(action, path, root)
    if action in ("write", "delete") and not _filesystem["allow_writes"]:
        return "Write access denied: writes are disabled"
    return None


if _filesystem is not None:
    _real_open = builtins.open

    def _guarded_open(file, mode="r", *args, **kwargs):
        if not isinstance(file, int):
            action = "write" if any(flag in mode for flag in "wax+") else "read"
            message = _fs_violation(file, action)
            if message is not None:
                raise PolicyViolation(message)
        return _real_open(file, mode, *args, **kwargs)

    builtins.open = _guarded_open
    io.open = _guarded_open


# ---------------------------------------------------------------------------
# Network policy
# ---------------------------------------------------------------------------

_network = _SETTINGS.get("network")

if _network is not None:
    _allowed = list(_network["allowed_endpoints"])
    _loopback = set(_network["loopback"])
    _resolved = set()

    def _pattern_match(host, port, pattern):
        pattern_host, sep, pattern_port = pattern.partition(":")
        if "*" not in pattern_host:
            return False
        pattern_labels = pattern_host.split(".")
        host_labels = host.split(".")
        if len(pattern_labels) != len(host_labels):
            return False
        for expected, actual in zip(pattern_labels, host_labels):
            if expected != "*" and expected != actual:
                return False
        if sep:
            return port is not None and str(port) == pattern_port
        return True

    def _endpoint_allowed(host, port):
        if host in _loopback or (host, port) in _resolved:
            return True
        if not _allowed:
            return False
        target = "{}:{}".format(host, port) if port is not None else host
        if target in _allowed or host in _allowed:
            return True
        return any(_pattern_match(host, port, pattern) for pattern in _allowed)

    def _check_address(family, address):
        if family == getattr(_socket_module, "AF_UNIX", None):
            if isinstance(address, (str, bytes)) and address[:1] not in ("\0", b"\0"):
                message = _fs_violation(address, "read")
                if message is not None:
                    raise PolicyViolation(message)
            return
        if not isinstance(address, tuple) or not address:
            return
        host = address[0]
        if isinstance(host, bytes):
            host = host.decode("ascii", "replace")
        port = address[1] if len(address) > 1 else None
        if not _endpoint_allowed(str(host), port):
            target = "{}:{}".format(host, port) if port is not None else host
            raise PolicyViolation(
                "Network access to {} is blocked by security policy. "
                "Only allowed endpoints: {}".format(
                    target, ", ".join(_allowed) if _allowed else "(none)"))

    class _GuardedSocket(_socket_module.socket):
        def connect(self, address):
            _check_address(self.family, address)
            return super().connect(address)

        def connect_ex(self, address):
            _check_address(self.family, address)
            return super().connect_ex(address)

        def sendto(self, data, *args):
            if args:
                _check_address(self.family, args[-1])
            return super().sendto(data, *args)

    _real_getaddrinfo = _socket_module.getaddrinfo

    def _guarded_getaddrinfo(host, port, *args, **kwargs):
        infos = _real_getaddrinfo(host, port, *args, **kwargs)
        name = host.decode("idna") if isinstance(host, bytes) else host
        try:
            number = int(port) if port is not None else None
        except (TypeError, ValueError):
            number = None
        if name is not None and _endpoint_allowed(str(name), number):
            for info in infos:
                address = info[4]
                if isinstance(address, tuple) and len(address) > 1:
                    _resolved.add((address[0], address[1]))
        return infos

    _socket_module.socket = _GuardedSocket
    _socket_module.getaddrinfo = _guarded_getaddrinfo


for _entry in (_SETTINGS["servers_dir"], _SETTINGS["workspace"]):
    if _entry not in sys.path:
        sys.path.insert(0, _entry)
os.chdir(_SETTINGS["workspace"])


async def _user_main():
    _result = None
    result = None
@@USER_CODE@@
    pass
    return _result if _result is not None else result


async def _main():
    try:
        return {"success": True, "result": await _user_main()}
    except Exception as exc:
        return _failure(exc)


if __name__ == "__main__":
    try:
        _outcome = asyncio.run(_main())
    except BaseException as exc:
        _outcome = _failure(exc)
    _emit(_outcome)
)PY";

} // anonymous namespace

std::string indent_user_code(std::string_view source, const std::set<uint32_t>& string_lines) {
    std::string out;
    out.reserve(source.size() + source.size() / 8);

    uint32_t line_no = 1;
    size_t start = 0;
    while (start <= source.size()) {
        const auto nl = source.find('\n', start);
        const auto end = nl == std::string_view::npos ? source.size() : nl;
        const std::string_view line = source.substr(start, end - start);

        const bool blank = line.find_first_not_of(" \t\r\f") == std::string_view::npos;
        if (!blank && !string_lines.contains(line_no)) {
            out += kUserCodeIndent;
        }
        out += line;

        if (nl == std::string_view::npos) break;
        out += '\n';
        start = nl + 1;
        ++line_no;
    }
    return out;
}

std::string build_harness(const HarnessOptions& options,
                          std::string_view user_code,
                          const std::set<uint32_t>& string_lines) {
    nlohmann::json settings = {
        {"workspace", options.workspace.string()},
        {"servers_dir", options.servers_dir.string()},
        {"max_memory_bytes", options.max_memory_bytes},
        {"max_cpu_seconds", options.max_cpu_seconds},
        {"bridge_fd", kBridgeFd},
        {"network", nullptr},
        {"filesystem", nullptr},
    };
    if (options.network_policy) settings["network"] = options.network_policy->to_json();
    if (options.filesystem_policy) settings["filesystem"] = options.filesystem_policy->to_json();

    // A JSON string literal is also a valid Python string literal
    const std::string settings_literal =
        nlohmann::json(settings.dump()).dump(-1, ' ', true);

    std::string script(kHarnessTemplate);
    utils::replace_all(script, "@@SETTINGS@@", settings_literal);

    const auto marker = script.find("@@USER_CODE@@");
    script.replace(marker, std::string_view("@@USER_CODE@@").size(),
                   indent_user_code(user_code, string_lines));
    return script;
}

} // namespace execbox
