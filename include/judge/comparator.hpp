#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace autograder {

/**
 * @brief 选手输出中的一个字符及其标注
 */
struct annotated_char {
    /**
     * @brief 一个 UTF-8 字符的完整字节序列，不合法的字节单独成为一个字符
     */
    std::string ch;

    /**
     * @brief 该位置超出了标准输出的长度，或者与标准输出对应位置的字符不同
     */
    bool incorrect;

    /**
     * @brief 该字符是否为换行符，便于展示时换行
     */
    bool newline;
};

/**
 * @brief 一个测试点的比较结果
 */
struct test_result {
    /**
     * @brief 选手输出是否与标准输出完全一致（区分大小写和空白字符）
     * 与逐字符标注无关，标注只用于展示
     */
    bool passed = false;

    std::string input;

    std::string expected_output;

    /**
     * @brief 逐字符标注后的选手输出，长度为选手输出的字符数
     */
    std::vector<annotated_char> output;

    /**
     * @brief 标准输出字符数减去选手输出字符数
     * 为负数表示选手输出比标准输出长，不截断为 0
     */
    long missing_output = 0;
};

/**
 * @brief 一个提交的全部评测结果
 * compiled 不为 COMPILED 时 tests 必然为空
 */
struct submission_results {
    compile_state compiled = compile_state::UNKNOWN;

    /**
     * @brief 按照测试点顺序排列的结果
     */
    std::vector<test_result> tests;

    /**
     * @brief 通过的测试点个数
     */
    size_t passed() const;
};

/**
 * @brief 将 UTF-8 文本切分为字符
 * 不构成合法序列的字节（截断的多字节序列、多余的后续字节等）各自作为一个字符
 */
std::vector<std::string> split_characters(const std::string &text);

/**
 * @brief 比较选手输出和标准输出
 * 位置按 UTF-8 字符计算，是否通过按字节比较。
 * 对选手输出的每个位置 i：incorrect = i 超出标准输出长度 或 两者第 i 个字符不同；
 * newline = 第 i 个字符为 '\n'。
 * @param input 测试点输入，原样放进结果中
 * @param expected 标准输出
 * @param actual 选手程序的输出
 */
test_result compare_output(const std::string &input, const std::string &expected, const std::string &actual);

/**
 * @brief 生成成绩概要
 * 编译通过时为 "<百分比，保留两位小数>% (<通过数>/<总数>)"，否则为 "Compilation Failed or Timed Out"
 * @param results 提交的评测结果
 * @param total 作业的测试点总数
 */
std::string grade_summary(const submission_results &results, size_t total);

void to_json(nlohmann::json &j, const annotated_char &c);
void to_json(nlohmann::json &j, const test_result &result);
void to_json(nlohmann::json &j, const submission_results &results);

}  // namespace autograder
