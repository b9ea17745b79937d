#pragma once

#include <string>
#include "config.hpp"
#include "judge/comparator.hpp"
#include "judge/result_cache.hpp"
#include "model/catalog.hpp"
#include "sandbox/engine.hpp"
#include "store/result_store.hpp"

namespace autograder {

/**
 * @brief 评测流程的入口
 * 编译 -> 构建镜像 -> 逐个测试点运行 -> 比较 -> 缓存。
 * 容器引擎、记录仓库、缓存存储都由调用者持有并显式传入，评测流程中没有全局状态。
 *
 * 选手程序的问题（编译失败、超时、运行错误）会被吸收进评测结果；
 * 基础设施错误（build_failure、engine_unavailable、engine_error、store_error）会抛给调用者。
 * 两种评测方式在任何退出路径上都会删除本次评测创建的工作目录和镜像。
 */
struct grader {
    grader(const grader_config &config, sandbox::container_engine &engine, catalog &records, result_store &store);

    /**
     * @brief 完整评测
     * 在提交创建或者要求重新评测时调用。先删除该提交的所有缓存结果，然后编译：
     * 编译失败时记录 compiled = FAILED 并返回，不创建任何容器；
     * 编译成功时构建一次镜像，运行所有测试点并缓存结果，最后记录 compiled = COMPILED。
     * @param submission_id 提交 id
     * @throw std::out_of_range 提交不存在
     * @throw build_failure, engine_unavailable, engine_error, store_error 基础设施错误
     */
    submission_results full_test(const std::string &submission_id);

    /**
     * @brief 按需评测
     * 在需要展示结果时调用。已知编译失败时直接返回，不运行任何测试点。
     * 否则每个测试点优先使用缓存结果，只有在存在缺失时才编译和构建一次镜像，
     * 在同一个镜像中运行所有缺失的测试点。缓存完整时不会创建任何容器。
     * @param submission_id 提交 id
     * @throw std::out_of_range 提交不存在
     * @throw build_failure, engine_unavailable, engine_error, store_error 基础设施错误
     */
    submission_results test_results(const std::string &submission_id);

    /**
     * @brief 提交的成绩概要，按需评测后计算
     */
    std::string grade(const std::string &submission_id);

    result_cache &get_cache();

private:
    grader_config config;
    sandbox::container_engine &engine;
    catalog &records;
    result_cache cache;

    /**
     * @brief 记录编译失败，编译失败的提交不保留任何缓存结果
     */
    submission_results compile_failed(const std::string &submission_id, const compilation_error &error);

    submission_results compare(compile_state state, const std::vector<test_case> &test_cases, const std::vector<std::string> &outputs) const;
};

}  // namespace autograder
