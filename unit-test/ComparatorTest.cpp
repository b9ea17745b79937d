#include "gtest/gtest.h"
#include "judge/comparator.hpp"

using namespace std;
using namespace autograder;

TEST(ComparatorTest, ExactMatchTest) {
    test_result result = compare_output("2 3\n", "5\n", "5\n");
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.missing_output, 0);
    ASSERT_EQ(result.output.size(), 2u);
    EXPECT_EQ(result.output[0].ch, "5");
    EXPECT_FALSE(result.output[0].incorrect);
    EXPECT_FALSE(result.output[0].newline);
    EXPECT_EQ(result.output[1].ch, "\n");
    EXPECT_TRUE(result.output[1].newline);
    EXPECT_FALSE(result.output[1].incorrect);
}

TEST(ComparatorTest, MissingTrailingNewlineTest) {
    test_result result = compare_output("2 3\n", "5\n", "5");
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.missing_output, 1);
    ASSERT_EQ(result.output.size(), 1u);
    EXPECT_FALSE(result.output[0].incorrect);
}

TEST(ComparatorTest, ExtraOutputTest) {
    test_result result = compare_output("2 3\n", "5\n", "55\n");
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.missing_output, -1);
    ASSERT_EQ(result.output.size(), 3u);
    EXPECT_FALSE(result.output[0].incorrect);
    EXPECT_TRUE(result.output[1].incorrect);  // '5' vs '\n'
    EXPECT_FALSE(result.output[1].newline);
    EXPECT_TRUE(result.output[2].incorrect);  // 超出标准输出长度
    EXPECT_TRUE(result.output[2].newline);
}

TEST(ComparatorTest, WhitespaceAndCaseSensitiveTest) {
    EXPECT_FALSE(compare_output("", "Hello\n", "hello\n").passed);
    EXPECT_FALSE(compare_output("", "1 2\n", "1  2\n").passed);
    EXPECT_FALSE(compare_output("", "1\n", "1\r\n").passed);
}

TEST(ComparatorTest, EmptyOutputTest) {
    test_result result = compare_output("1\n", "1\n", "");
    EXPECT_FALSE(result.passed);
    EXPECT_TRUE(result.output.empty());
    EXPECT_EQ(result.missing_output, 2);

    result = compare_output("", "", "");
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.missing_output, 0);
}

TEST(ComparatorTest, MultibyteOutputTest) {
    test_result result = compare_output("", "\u00e9\n", "\u00e9\n");
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.missing_output, 0);
    ASSERT_EQ(result.output.size(), 2u);
    EXPECT_EQ(result.output[0].ch, "\u00e9");
    EXPECT_FALSE(result.output[0].incorrect);
    EXPECT_TRUE(result.output[1].newline);

    result = compare_output("", "\u00e9\n", "e\n");
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.missing_output, 0);
    ASSERT_EQ(result.output.size(), 2u);
    EXPECT_TRUE(result.output[0].incorrect);
    EXPECT_FALSE(result.output[1].incorrect);

    // 中文字符占三个字节，表情占四个字节
    result = compare_output("", "\u4f60\u597d\n", "\u4f60\U0001F600\u597d\n");
    EXPECT_EQ(result.missing_output, -1);
    ASSERT_EQ(result.output.size(), 4u);
    EXPECT_FALSE(result.output[0].incorrect);
    EXPECT_EQ(result.output[1].ch, "\U0001F600");
    EXPECT_TRUE(result.output[1].incorrect);
    EXPECT_TRUE(result.output[3].incorrect);

    nlohmann::json j = compare_output("", "\u00e9", "\u00e9");
    EXPECT_EQ(j.at("output")[0].at("char"), "\u00e9");
}

TEST(ComparatorTest, InvalidUtf8OutputTest) {
    // 截断的多字节序列和孤立的后续字节各自算作一个字符
    vector<string> characters = split_characters("a\xC3\x80\x80" "b\xE4\xBD");
    vector<string> expected{"a", "\xC3\x80", "\x80", "b", "\xE4", "\xBD"};
    EXPECT_EQ(characters, expected);

    test_result result = compare_output("", "\xFF\n", "\xFF\n");
    EXPECT_TRUE(result.passed);
    ASSERT_EQ(result.output.size(), 2u);
    EXPECT_EQ(result.output[0].ch, "\xFF");
}

TEST(ComparatorTest, GradeSummaryTest) {
    submission_results results;
    results.compiled = compile_state::COMPILED;
    results.tests.push_back(compare_output("", "1\n", "1\n"));
    results.tests.push_back(compare_output("", "2\n", "3\n"));
    results.tests.push_back(compare_output("", "3\n", "3\n"));
    EXPECT_EQ(results.passed(), 2u);
    EXPECT_EQ(grade_summary(results, 3), "66.67% (2/3)");

    submission_results empty;
    empty.compiled = compile_state::COMPILED;
    EXPECT_EQ(grade_summary(empty, 0), "0.00% (0/0)");

    submission_results failed;
    failed.compiled = compile_state::FAILED;
    EXPECT_EQ(grade_summary(failed, 3), "Compilation Failed or Timed Out");
}

TEST(ComparatorTest, JsonShapeTest) {
    submission_results results;
    results.compiled = compile_state::COMPILED;
    results.tests.push_back(compare_output("2 3\n", "5\n", "6"));

    nlohmann::json j = results;
    EXPECT_EQ(j.at("compiled"), true);
    ASSERT_EQ(j.at("tests").size(), 1u);
    auto &test = j.at("tests")[0];
    EXPECT_EQ(test.at("passed"), false);
    EXPECT_EQ(test.at("input"), "2 3\n");
    EXPECT_EQ(test.at("expected_output"), "5\n");
    EXPECT_EQ(test.at("missing_output"), 1);
    ASSERT_EQ(test.at("output").size(), 1u);
    EXPECT_EQ(test.at("output")[0].at("char"), "6");
    EXPECT_EQ(test.at("output")[0].at("incorrect"), true);
    EXPECT_EQ(test.at("output")[0].at("newline"), false);

    submission_results failed;
    failed.compiled = compile_state::FAILED;
    nlohmann::json f = failed;
    EXPECT_EQ(f.at("compiled"), false);
    EXPECT_TRUE(f.at("tests").empty());
}
