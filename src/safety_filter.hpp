#pragma once
#include <string>
#include <vector>

// Lexical deny-list gate for the subprocess backend. This is a heuristic,
// not a security boundary: it only sees literal `import x` / `from x`
// statements (including `import a, x`), so `__import__("os")`, importlib or
// string-built names get through, and matches inside comments or strings are
// rejected anyway. Never consulted for the container backend.
struct SafetyVerdict {
    bool permitted{true};
    std::string blocked_module;  // first deny-listed module found
};

// process control, filesystem, networking, signals/terminal, concurrency
const std::vector<std::string>& subprocess_denied_modules();

SafetyVerdict check_subprocess_safety(const std::string& code);

inline bool is_safe_for_subprocess(const std::string& code) {
    return check_subprocess_safety(code).permitted;
}
