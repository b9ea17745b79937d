#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <boost/throw_exception.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace autograder {

/**
 * @brief 评测系统所有基础设施错误的基类
 * 选手程序本身的问题（编译失败、超时、崩溃）不会以异常的形式离开评测流程，
 * 只有容器引擎、镜像构建、存储这类系统错误才会抛出该异常的子类。
 */
struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示编译成功后构建沙箱镜像失败
 * 这种情况下本次评测无法执行任何测试点，但不能被当成"编译失败"
 */
struct build_failure : public grader_exception {
    build_failure();
    explicit build_failure(const std::string &message);
};

/**
 * @brief 表示容器引擎无法连接
 * 通常是 docker 守护进程没有启动，或者 socket 路径配置错误
 */
struct engine_unavailable : public grader_exception {
    engine_unavailable();
    explicit engine_unavailable(const std::string &message);
};

/**
 * @brief 容器引擎返回了错误，比如镜像不存在、容器创建被拒绝
 */
struct engine_error : public grader_exception {
    engine_error();
    explicit engine_error(const std::string &message);
};

/**
 * @brief 表示结果缓存的存储后端出错
 */
struct store_error : public grader_exception {
    store_error();
    explicit store_error(const std::string &message);
};

}  // namespace autograder
