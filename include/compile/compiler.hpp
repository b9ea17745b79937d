#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include "config.hpp"

namespace autograder {

/**
 * @brief 表示选手程序编译失败
 * 可以表示编译器返回非零值、编译超时或者编译器崩溃。
 * 这是选手程序的问题，评测流程会将它记录为 compiled = false，而不是向上层报告系统错误。
 */
struct compilation_error : public std::runtime_error {
public:
    /**
     * @brief 编译器的 stdout 和 stderr 输出
     */
    const std::string error_log;

    explicit compilation_error(const std::string &what, const std::string &error_log);
};

/**
 * @brief 编译阶段
 * 调用本机的编译器编译选手提交的源代码，并限制编译的时钟时间。
 */
struct compiler {
    /**
     * @brief 编译产生的可执行文件在工作目录中的文件名
     */
    static const char *const BINARY_NAME;

    /**
     * @brief 编译器输出在工作目录中的文件名
     */
    static const char *const LOG_NAME;

    explicit compiler(const compiler_config &config);

    /**
     * @brief 编译源代码
     * 调用方式相当于 `<compiler> <flags...> -o <workdir>/student-program <source>`
     * @param source 选手源代码路径
     * @param workdir 本次评测的工作目录，若不存在则创建
     * @return 可执行文件的路径
     * @throw compilation_error 编译失败，此时工作目录已经被完全删除
     */
    std::filesystem::path compile(const std::filesystem::path &source, const std::filesystem::path &workdir) const;

private:
    compiler_config config;
};

}  // namespace autograder
