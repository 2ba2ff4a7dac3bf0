#include "safety_filter.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>

const std::vector<std::string>& subprocess_denied_modules() {
    static const std::vector<std::string> modules = {
        "os", "subprocess", "shutil", "socket", "ctypes", "multiprocessing",
        "threading", "signal", "pty", "tty", "termios", "resource",
    };
    return modules;
}

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Single forward pass over the source: runs of word characters are one
// token, every other non-blank byte is a token of its own. Newlines count as
// blanks, so backslash continuations need no special case.
class ImportScanner {
public:
    explicit ImportScanner(const std::string& code) : code_(code) { advance(); }

    bool done() const { return tok_.empty(); }
    std::string_view token() const { return tok_; }
    void advance() {
        while (pos_ < code_.size() && std::isspace(static_cast<unsigned char>(code_[pos_]))) ++pos_;
        const size_t start = pos_;
        if (pos_ < code_.size()) {
            if (is_word_char(code_[pos_])) {
                while (pos_ < code_.size() && is_word_char(code_[pos_])) ++pos_;
            } else {
                ++pos_;
            }
        }
        tok_ = std::string_view(code_).substr(start, pos_ - start);
    }
    bool accept(std::string_view t) {
        if (tok_ != t) return false;
        advance();
        return true;
    }

private:
    const std::string& code_;
    size_t pos_ = 0;
    std::string_view tok_;
};

bool is_identifier(std::string_view t) {
    return !t.empty() && is_word_char(t[0]) && !std::isdigit(static_cast<unsigned char>(t[0]));
}

const std::string* denied(std::string_view name) {
    const auto& modules = subprocess_denied_modules();
    auto it = std::find(modules.begin(), modules.end(), name);
    return it == modules.end() ? nullptr : &*it;
}

// Consumes `a.b.c [as d] (, ...)*` and returns the first denied top-level
// name, if any.
const std::string* scan_import_list(ImportScanner& s) {
    const std::string* hit = nullptr;
    while (is_identifier(s.token())) {
        if (!hit) hit = denied(s.token());
        s.advance();
        while (s.token() == ".") {
            s.advance();
            if (!is_identifier(s.token())) return hit;
            s.advance();
        }
        if (s.accept("as")) {
            if (!is_identifier(s.token())) return hit;
            s.advance();
        }
        if (!s.accept(",")) break;
    }
    return hit;
}

} // namespace

SafetyVerdict check_subprocess_safety(const std::string& code) {
    SafetyVerdict verdict;
    ImportScanner s(code);
    while (!s.done()) {
        const std::string* hit = nullptr;
        if (s.accept("import")) {
            hit = scan_import_list(s);
        } else if (s.accept("from")) {
            if (is_identifier(s.token())) hit = denied(s.token());
        } else {
            s.advance();
        }
        if (hit) {
            verdict.permitted = false;
            verdict.blocked_module = *hit;
            return verdict;
        }
    }
    return verdict;
}
