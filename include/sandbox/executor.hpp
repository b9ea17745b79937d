#pragma once

#include <string>
#include <vector>
#include "config.hpp"
#include "model/submission.hpp"
#include "sandbox/engine.hpp"

namespace autograder::sandbox {

/**
 * @brief 执行阶段
 * 每个测试点在一个新的、一次性的容器中运行：禁止网络、根文件系统只读、钉在固定的 CPU 核心上、
 * 限制内存、禁止提权。测试点的输入通过标准输入喂给学生程序。
 *
 * 学生程序超时不是错误：容器被强制终止，已经产生的输出照常返回并参与比较。
 * 容器引擎的错误（无法连接、镜像不存在）会向上抛出，使整次评测失败。
 * 容器在任何情况下都会被删除。
 */
struct executor {
    executor(container_engine &engine, const sandbox_config &config);

    /**
     * @brief 生成运行一个测试点的容器参数
     * @param image 提交的镜像标签
     * @param submission_id 提交 id，用于给容器命名
     * @param tc 要运行的测试点
     */
    container_spec make_spec(const std::string &image, const std::string &submission_id, const test_case &tc) const;

    /**
     * @brief 在新容器中运行一个测试点
     * @return 学生程序的标准输出和标准错误
     * @throw engine_error, engine_unavailable 容器引擎出错
     */
    std::string run(const std::string &image, const std::string &submission_id, const test_case &tc) const;

    /**
     * @brief 运行多个测试点，同时运行的容器数不超过 sandbox_config::parallelism
     * @return 按照 test_cases 的顺序排列的输出
     * @throw engine_error, engine_unavailable 任意一个测试点的容器引擎出错，
     *        已经开始运行的测试点会先运行完毕再抛出
     */
    std::vector<std::string> run_all(const std::string &image, const std::string &submission_id, const std::vector<test_case> &test_cases) const;

private:
    container_engine &engine;
    sandbox_config config;
};

}  // namespace autograder::sandbox
