#pragma once
#include "iexecutor.hpp"
#include <string>

// Fault labels the classifier knows by name. Everything else, including the
// synthesized TimeoutError / ParseError outcomes, is Other.
enum class FaultKind {
    None,
    ZeroDivision,
    Attribute,
    Type,
    Name,
    Other
};

FaultKind fault_kind_from_label(const std::string& label);
FaultKind fault_kind_of(const RawExecutionResult& result);

inline constexpr const char* kTimeoutLabel = "TimeoutError";
inline constexpr const char* kParseErrorLabel = "ParseError";

RawExecutionResult make_timeout_result();
RawExecutionResult make_parse_error_result(const std::string& raw_output);

// Prefix of the record line the wrapper prints. It always starts a line.
inline constexpr const char* kRecordMarker = "@@codeguard-record@@";

// Drops the oldest bytes so at most `limit` remain. The record is the last
// thing a wrapper prints, so capture keeps the tail rather than the head.
void keep_tail(std::string& text, size_t limit);

// Primary stream first; secondary only when the primary is blank.
std::string select_record_stream(const std::string& primary, const std::string& secondary);

// Parses the last line of `text` that starts with kRecordMarker as the
// wrapper's JSON record; output around it is ignored. Never throws: a missing
// or malformed record becomes a ParseError result carrying `text`.
RawExecutionResult parse_result_record(const std::string& text);
