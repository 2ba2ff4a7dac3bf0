#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include "base64.hpp"
#include "executors/result_record.hpp"
#include "wrapper_builder.hpp"
#include "test_support.hpp"

using json = nlohmann::json;

namespace {

std::string embedded_payload(const std::string& script) {
    const std::string marker = "_CODE_B64 = \"";
    auto start = script.find(marker);
    if (start == std::string::npos) return "";
    start += marker.size();
    return script.substr(start, script.find('"', start) - start);
}

std::vector<std::string> non_empty_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

// The record must be the last line and the only marked one, whatever else
// the code wrote to the real stdout before it.
json run_and_parse(const std::string& code) {
    auto lines = non_empty_lines(test_support::run_python_script(build_wrapper(code).text));
    const std::string marker = kRecordMarker;
    size_t marked = 0;
    for (const auto& line : lines) marked += line.rfind(marker, 0) == 0 ? 1 : 0;
    EXPECT_EQ(marked, 1u);
    if (lines.empty() || lines.back().rfind(marker, 0) != 0) {
        ADD_FAILURE() << "last line is not the record";
        return json();
    }
    return json::parse(lines.back().substr(marker.size()));
}

} // namespace

TEST(WrapperBuilder, IsDeterministic) {
    const std::string code = "x = 1\nprint(x)\n";
    EXPECT_EQ(build_wrapper(code).text, build_wrapper(code).text);
    EXPECT_NE(build_wrapper(code).text, build_wrapper(code + " ").text);
}

TEST(WrapperBuilder, HostileCodeStaysInsideTheLiteral) {
    const std::string code =
        "s = \"\"\"\n\"\n'''\\\" ); import os; os.system('x') #\nprint(\"}\")\r\n\x01\xc3\xa9";
    const std::string script = build_wrapper(code).text;

    EXPECT_EQ(script.find("os.system"), std::string::npos);
    EXPECT_EQ(script.find("'''"), std::string::npos);

    const std::string payload = embedded_payload(script);
    ASSERT_FALSE(payload.empty());
    EXPECT_EQ(payload.find_first_not_of(
                  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/="),
              std::string::npos);
    EXPECT_EQ(base64_decode(payload), code);
}

TEST(WrapperBuilder, EmptyCodeStillProducesAScript) {
    const std::string script = build_wrapper("").text;
    EXPECT_NE(script.find("_CODE_B64 = \"\""), std::string::npos);
}

class WrapperExecutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!test_support::python_available()) GTEST_SKIP() << "python3 not on PATH";
    }
};

TEST_F(WrapperExecutionTest, PrintsOneRecordWhateverTheCodePrints) {
    json r = run_and_parse(
        "print('{\"success\": false}')\n"
        "for i in range(50):\n"
        "    print('line', i)\n");
    EXPECT_TRUE(r["success"].get<bool>());
    EXPECT_TRUE(r["error_type"].is_null());
    EXPECT_NE(r["output"].get<std::string>().find("line 49"), std::string::npos);
}

TEST_F(WrapperExecutionTest, RecordsDivisionByZero) {
    json r = run_and_parse("def ratio(a, b):\n    return a / b\nratio(1, 0)\n");
    EXPECT_FALSE(r["success"].get<bool>());
    EXPECT_EQ(r["error_type"], "ZeroDivisionError");
    EXPECT_NE(r["traceback"].get<std::string>().find("ratio"), std::string::npos);
}

TEST_F(WrapperExecutionTest, LabelsSubclassesByRecognisedBase) {
    json r = run_and_parse("def f():\n    print(x)\n    x = 1\nf()\n");
    EXPECT_EQ(r["error_type"], "NameError");  // UnboundLocalError
}

TEST_F(WrapperExecutionTest, KeepsUnrecognisedLabels) {
    json r = run_and_parse("{}['missing']\n");
    EXPECT_EQ(r["error_type"], "KeyError");
}

TEST_F(WrapperExecutionTest, SyntaxErrorIsAFaultNotACrash) {
    json r = run_and_parse("def broken(:\n");
    EXPECT_FALSE(r["success"].get<bool>());
    EXPECT_EQ(r["error_type"], "SyntaxError");
}

TEST_F(WrapperExecutionTest, SystemExitZeroIsSuccess) {
    EXPECT_TRUE(run_and_parse("import sys\nsys.exit(0)\n")["success"].get<bool>());

    json r = run_and_parse("raise SystemExit(3)\n");
    EXPECT_FALSE(r["success"].get<bool>());
    EXPECT_EQ(r["error_type"], "SystemExit");
    EXPECT_EQ(r["error"], "3");
}

TEST_F(WrapperExecutionTest, ExitHooksRunNothingAfterTheRecord) {
    json r = run_and_parse("import atexit\natexit.register(print, 'bye')\n");
    EXPECT_TRUE(r["success"].get<bool>());
}

TEST_F(WrapperExecutionTest, UnterminatedRealStdoutWriteKeepsRecordOnItsOwnLine) {
    const std::string out = test_support::run_python_script(
        build_wrapper("import sys\nsys.__stdout__.write('partial')\n").text);
    EXPECT_EQ(out.rfind("partial\n" + std::string(kRecordMarker), 0), 0u) << out;
    EXPECT_TRUE(parse_result_record(out).success);
}

TEST_F(WrapperExecutionTest, RunsAsMainModule) {
    json r = run_and_parse("if __name__ == '__main__':\n    undefined_name\n");
    EXPECT_EQ(r["error_type"], "NameError");
}
