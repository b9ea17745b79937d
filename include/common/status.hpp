#pragma once

#include <string>

namespace autograder {

/**
 * @brief 表示提交的编译状态
 * 每个提交的状态机为 UNKNOWN -> { FAILED | COMPILED }，
 * 源代码被替换或者提交被移动到其他作业之后重新回到 UNKNOWN。
 */
enum class compile_state {
    /**
     * @brief 提交还没有被完整评测过，或者源代码在上次评测之后被修改
     */
    UNKNOWN = 0,

    /**
     * @brief 编译失败、编译超时或者编译器崩溃
     * 对于当前的源代码来说这是终止状态，不会再尝试运行任何测试点
     */
    FAILED = 1,

    /**
     * @brief 编译通过，测试点的结果可以按需计算并缓存
     */
    COMPILED = 2
};

const char *get_display_message(compile_state);

/**
 * @brief 将状态序列化为存储用的字符串
 */
std::string to_string(compile_state);

/**
 * @brief 从存储用的字符串解析编译状态
 * @throw std::invalid_argument 字符串不是合法的编译状态
 */
compile_state parse_compile_state(const std::string &value);

}  // namespace autograder
