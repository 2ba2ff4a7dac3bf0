#include <gtest/gtest.h>
#include "executors/result_record.hpp"

namespace {

std::string marked(const std::string& record) { return std::string(kRecordMarker) + record; }

} // namespace

TEST(ResultRecord, ParsesSuccessRecord) {
    auto r = parse_result_record(
        marked(R"({"success": true, "output": "hi\n", "error": null, "error_type": null, "traceback": null})") + "\n");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output, "hi\n");
    EXPECT_FALSE(r.error);
    EXPECT_FALSE(r.error_kind);
    EXPECT_EQ(fault_kind_of(r), FaultKind::None);
}

TEST(ResultRecord, ParsesFaultRecord) {
    auto r = parse_result_record(
        marked(R"({"success": false, "output": "", "error": "division by zero", "error_type": "ZeroDivisionError", "traceback": "Traceback ..."})"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error.value_or(""), "division by zero");
    EXPECT_EQ(r.traceback.value_or(""), "Traceback ...");
    EXPECT_EQ(fault_kind_of(r), FaultKind::ZeroDivision);
}

TEST(ResultRecord, FindsTheMarkedLineAmongNoise) {
    auto r = parse_result_record("warming up\nstill noise\n" + marked(R"({"success": true, "output": ""})") +
                                 "\nbye from atexit\npartial");
    EXPECT_TRUE(r.success);
}

TEST(ResultRecord, LastMarkedLineWins) {
    auto r = parse_result_record(marked(R"({"success": true})") + "\n" +
                                 marked(R"({"success": false, "error_type": "NameError"})") + "\n");
    EXPECT_EQ(fault_kind_of(r), FaultKind::Name);
}

TEST(ResultRecord, UnmarkedJsonIsNotARecord) {
    auto r = parse_result_record(R"({"success": true, "output": ""})");
    EXPECT_EQ(r.error_kind.value_or(""), kParseErrorLabel);
    // The marker has to start its line.
    r = parse_result_record("partial" + marked(R"({"success": true})"));
    EXPECT_EQ(r.error_kind.value_or(""), kParseErrorLabel);
}

TEST(ResultRecord, GarbageBecomesParseError) {
    auto r = parse_result_record("  Traceback (most recent call last):\n  boom\n");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind.value_or(""), kParseErrorLabel);
    EXPECT_EQ(r.output, "Traceback (most recent call last):\n  boom");
    EXPECT_EQ(fault_kind_of(r), FaultKind::Other);
}

TEST(ResultRecord, EmptyOutputBecomesParseError) {
    auto r = parse_result_record("");
    EXPECT_EQ(r.error_kind.value_or(""), kParseErrorLabel);
    EXPECT_EQ(r.output, "");
}

TEST(ResultRecord, RejectsRecordsWithWrongShapes) {
    EXPECT_EQ(parse_result_record(marked("[1, 2]")).error_kind.value_or(""), kParseErrorLabel);
    EXPECT_EQ(parse_result_record(marked(R"({"output": "x"})")).error_kind.value_or(""), kParseErrorLabel);
    EXPECT_EQ(parse_result_record(marked(R"({"success": "yes"})")).error_kind.value_or(""), kParseErrorLabel);
    EXPECT_EQ(parse_result_record(marked(R"({"success": false, "error_type": 7})")).error_kind.value_or(""),
              kParseErrorLabel);
    EXPECT_EQ(parse_result_record(marked("")).error_kind.value_or(""), kParseErrorLabel);
}

TEST(ResultRecord, FailureWithoutLabelIsUnknown) {
    auto r = parse_result_record(marked(R"({"success": false, "error": "?"})"));
    EXPECT_EQ(r.error_kind.value_or(""), "UnknownError");
}

TEST(ResultRecord, SelectsSecondaryStreamOnlyWhenPrimaryIsBlank) {
    EXPECT_EQ(select_record_stream("out\n", "err"), "out");
    EXPECT_EQ(select_record_stream(" \n\t", "err\n"), "err");
    EXPECT_EQ(select_record_stream("", ""), "");
}

TEST(ResultRecord, KeepTailDropsOldestBytes) {
    std::string text = "0123456789";
    keep_tail(text, 4);
    EXPECT_EQ(text, "6789");
    keep_tail(text, 10);
    EXPECT_EQ(text, "6789");
}

TEST(ResultRecord, TimeoutOutcome) {
    auto r = make_timeout_result();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind.value_or(""), kTimeoutLabel);
    EXPECT_EQ(fault_kind_of(r), FaultKind::Other);
}

TEST(ResultRecord, RecognisedLabels) {
    EXPECT_EQ(fault_kind_from_label("ZeroDivisionError"), FaultKind::ZeroDivision);
    EXPECT_EQ(fault_kind_from_label("AttributeError"), FaultKind::Attribute);
    EXPECT_EQ(fault_kind_from_label("TypeError"), FaultKind::Type);
    EXPECT_EQ(fault_kind_from_label("NameError"), FaultKind::Name);
    EXPECT_EQ(fault_kind_from_label("UnboundLocalError"), FaultKind::Other);
    EXPECT_EQ(fault_kind_from_label(""), FaultKind::Other);
}
