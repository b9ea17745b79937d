#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace autograder {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 外部程序的运行结果
 */
struct process_result {
    /**
     * @brief 外部程序的返回值，如果外部程序因为信号崩溃或者被强制终止而没有返回码，则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 外部程序是否因为超出时间限制而被强制终止
     */
    bool timed_out = false;
};

/**
 * @brief 执行外部命令
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)，以 nullptr 结尾
 * @param output 外部命令的 stdout 和 stderr 重定向到该文件，为空则不重定向
 * @param timeout 外部命令的时钟时间限制，超时后整个进程组会被 SIGKILL 终止。0 表示不限制
 * @return 外部命令的运行结果
 */
process_result exec_program(const char **argv, const std::filesystem::path &output, std::chrono::milliseconds timeout);

/**
 * @brief 调用外部程序，并限制其运行时间
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param output 外部程序的 stdout 和 stderr 的保存路径
 * @param timeout 时钟时间限制
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     // 相当于 timeout 2 g++ -o /tmp/a.out /tmp/a.cpp > /tmp/compile.out 2>&1
 *     auto result = call_process_timeout("/tmp/compile.out", 2000ms, "g++", "-o", "/tmp/a.out", "/tmp/a.cpp");
 * @endcode
 */
template <typename... Args>
process_result call_process_timeout(const std::filesystem::path &output, std::chrono::milliseconds timeout, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv;
    for (auto &arg : list)
        argv.push_back(arg.c_str());
    argv.push_back(nullptr);

#ifndef NDEBUG
    std::stringstream ss;
    for (auto &arg : list)
        ss << arg << ' ';
    LOG(INFO) << ss.str();
#endif

    return exec_program(argv.data(), output, timeout);
}

/**
 * @brief 调用外部程序，不限制运行时间，不重定向输出
 * @return 外部程序的返回值，如果外部程序因为信号崩溃而没有返回码，则返回 -1
 */
template <typename... Args>
int call_process(Args &&... args) {
    return call_process_timeout({}, std::chrono::milliseconds::zero(), args...).exit_code;
}

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace autograder
