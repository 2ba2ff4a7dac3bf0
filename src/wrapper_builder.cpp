#include "wrapper_builder.hpp"
#include "base64.hpp"
#include "executors/result_record.hpp"

static const char* kCodePlaceholder = "@CODE_B64@";
static const char* kMarkerPlaceholder = "@RECORD_MARKER@";

// The embedded source travels as base64 so nothing in it can close the
// literal or start a new statement in the driver.
static const char* kDriverTemplate = R"PY(import base64
import builtins
import io
import json
import os
import sys
import traceback
from contextlib import redirect_stdout

_CODE_B64 = "@CODE_B64@"
_MARKER = "@RECORD_MARKER@"
_RECOGNISED = (ZeroDivisionError, AttributeError, TypeError, NameError)
_OUTPUT_LIMIT = 4096


def _fault_label(exc):
    for kind in _RECOGNISED:
        if isinstance(exc, kind):
            return kind.__name__
    return type(exc).__name__


def _describe(exc):
    try:
        return str(exc)
    except Exception:
        return type(exc).__name__


def _main():
    result = {"success": False, "output": "", "error": None,
              "error_type": None, "traceback": None}
    captured = io.StringIO()
    try:
        source = base64.b64decode(_CODE_B64).decode("utf-8")
        namespace = {"__name__": "__main__", "__builtins__": builtins}
        with redirect_stdout(captured):
            exec(compile(source, "<codeguard>", "exec"), namespace)
        result["success"] = True
    except SystemExit as exc:
        if exc.code is None or exc.code == 0:
            result["success"] = True
        else:
            result["error_type"] = "SystemExit"
            result["error"] = _describe(exc.code)
            result["traceback"] = traceback.format_exc()
    except BaseException as exc:
        result["error_type"] = _fault_label(exc)
        result["error"] = _describe(exc)
        result["traceback"] = traceback.format_exc()
    result["output"] = captured.getvalue()[:_OUTPUT_LIMIT]
    return result


def _emit(result):
    try:
        sys.__stdout__.flush()
    except BaseException:
        pass
    # Own line even after an unterminated write; raw fd so a replaced or
    # closed sys.__stdout__ cannot lose it.
    data = ("\n" + _MARKER + json.dumps(result) + "\n").encode("utf-8")
    while data:
        data = data[os.write(1, data):]


_emit(_main())
# Skip atexit hooks, thread joins and finalizers: nothing may print after
# the record.
os._exit(0)
)PY";

WrapperScript build_wrapper(const std::string& code) {
    std::string text = kDriverTemplate;
    const std::string placeholder = kCodePlaceholder;
    text.replace(text.find(placeholder), placeholder.size(), base64_encode(code));
    const std::string marker_placeholder = kMarkerPlaceholder;
    text.replace(text.find(marker_placeholder), marker_placeholder.size(), kRecordMarker);
    return WrapperScript{std::move(text)};
}
