#include "sandbox/harness.hpp"

namespace sandforge::sandbox {

const std::string& HarnessScript() {
    static const std::string kScript = R"PY(import _socket
import json
import os
import socket
import sys


def _blocked(*args, **kwargs):
    raise PermissionError("network access is disabled in the sandbox")


socket.socket = _blocked
socket.create_connection = _blocked
socket.socketpair = _blocked
socket.fromfd = _blocked
_socket.socket = _blocked
_socket.SocketType = _blocked
_socket.socketpair = _blocked
_socket.dup = _blocked

_result_path = os.environ["SANDFORGE_RESULT_PATH"]


def _write(payload):
    with open(_result_path, "w", encoding="utf-8") as handle:
        json.dump(payload, handle, sort_keys=True, allow_nan=False)


def _fail(error_type, message):
    _write({"status": "runtime_error", "error_type": error_type, "error": message})
    sys.exit(1)


def _main():
    with open(sys.argv[1], "r", encoding="utf-8") as handle:
        source = handle.read()
    with open(sys.argv[2], "r", encoding="utf-8") as handle:
        context = json.load(handle)

    scope = {"__name__": "__sandforge__"}
    scope.update(context)
    try:
        code = compile(source, "<candidate>", "exec")
        exec(code, scope)
    except MemoryError:
        _write({"status": "memory_exceeded"})
        sys.exit(3)
    except BaseException as exc:
        _fail(type(exc).__name__, str(exc).splitlines()[0] if str(exc) else "")

    value = scope.get("result")
    try:
        json.dumps(value, allow_nan=False)
    except (TypeError, ValueError):
        _fail("TypeError", "result of type %s is not JSON serializable" % type(value).__name__)
    _write({"status": "success", "result": value})


try:
    _main()
except MemoryError:
    try:
        _write({"status": "memory_exceeded"})
    finally:
        os._exit(3)
)PY";
    return kScript;
}

}  // namespace sandforge::sandbox
