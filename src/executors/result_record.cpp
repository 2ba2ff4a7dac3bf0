#include "result_record.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Payload of the last marked line, or nullopt when there is none.
std::optional<std::string> last_record_line(const std::string& text) {
    const std::string marker = kRecordMarker;
    size_t end = text.size();
    while (end > 0) {
        size_t start = text.rfind('\n', end - 1);
        start = (start == std::string::npos) ? 0 : start + 1;
        if (text.compare(start, marker.size(), marker) == 0 && end - start >= marker.size())
            return text.substr(start + marker.size(), end - start - marker.size());
        if (start == 0) break;
        end = start - 1;
    }
    return std::nullopt;
}

// null and absent both mean "not set"; any other non-string is malformed.
bool read_optional_string(const json& j, const char* key, std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

FaultKind fault_kind_from_label(const std::string& label) {
    if (label == "ZeroDivisionError") return FaultKind::ZeroDivision;
    if (label == "AttributeError") return FaultKind::Attribute;
    if (label == "TypeError") return FaultKind::Type;
    if (label == "NameError") return FaultKind::Name;
    return FaultKind::Other;
}

FaultKind fault_kind_of(const RawExecutionResult& result) {
    if (result.success) return FaultKind::None;
    return fault_kind_from_label(result.error_kind.value_or(""));
}

RawExecutionResult make_timeout_result() {
    RawExecutionResult r;
    r.error = "Execution timed out";
    r.error_kind = kTimeoutLabel;
    return r;
}

RawExecutionResult make_parse_error_result(const std::string& raw_output) {
    RawExecutionResult r;
    r.output = raw_output;
    r.error = "Failed to parse execution result";
    r.error_kind = kParseErrorLabel;
    return r;
}

void keep_tail(std::string& text, size_t limit) {
    if (text.size() > limit) text.erase(0, text.size() - limit);
}

std::string select_record_stream(const std::string& primary, const std::string& secondary) {
    auto p = trim(primary);
    if (!p.empty()) return p;
    return trim(secondary);
}

RawExecutionResult parse_result_record(const std::string& text) {
    const std::string body = trim(text);
    const auto line = last_record_line(body);
    if (!line) return make_parse_error_result(body);
    const json j = json::parse(*line, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded() || !j.is_object()) return make_parse_error_result(body);

    auto success = j.find("success");
    if (success == j.end() || !success->is_boolean()) return make_parse_error_result(body);

    RawExecutionResult r;
    r.success = success->get<bool>();

    auto output = j.find("output");
    if (output != j.end() && output->is_string()) r.output = output->get<std::string>();

    if (!read_optional_string(j, "error", r.error) ||
        !read_optional_string(j, "error_type", r.error_kind) ||
        !read_optional_string(j, "traceback", r.traceback)) {
        return make_parse_error_result(body);
    }
    // A failure without a kind label cannot be classified by name.
    if (!r.success && !r.error_kind) r.error_kind = "UnknownError";
    return r;
}
