#pragma once
#include "executors/iexecutor.hpp"
#include <string>

// Builds the Python driver that runs `code` in a fresh namespace and prints
// exactly one JSON line:
//   {"success": bool, "output": str, "error": str|null,
//    "error_type": str|null, "traceback": str|null}
// Output printed by the code itself is captured into "output" (first 4096
// characters) instead of reaching stdout. Pure: same code, same script.
WrapperScript build_wrapper(const std::string& code);
