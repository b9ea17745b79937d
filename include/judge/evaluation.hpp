#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/io_utils.hpp"
#include "compile/compiler.hpp"
#include "config.hpp"
#include "model/submission.hpp"
#include "sandbox/engine.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/image_builder.hpp"

namespace autograder {

/**
 * @brief 一个提交的一次评测
 * 评测对象在构造时获得该提交的评测锁，在析构时释放。同一个提交的多次评测（不论是否在同一个进程中）
 * 因此是串行的，不同提交互不影响。
 *
 * 工作目录和镜像只有在第一次需要运行测试点（prepare）时才会创建，一次评测中至多编译和构建一次，
 * 之后所有测试点都复用同一个镜像。析构时无条件删除本次评测创建的镜像和工作目录，
 * 删除失败时以 ERROR 级别记录泄漏的资源。
 */
struct evaluation {
    /**
     * @param config 评测系统配置
     * @param engine 容器引擎客户端
     * @param submit 要评测的提交
     * @param test_cases 提交所属作业的测试点，用于构建镜像
     */
    evaluation(const grader_config &config, sandbox::container_engine &engine, const submission &submit, const std::vector<test_case> &test_cases);
    evaluation(const evaluation &) = delete;
    ~evaluation();

    /**
     * @brief 编译并构建镜像，已经准备好时什么都不做
     * 创建工作目录之前先检查容器引擎是否可用，避免引擎不可用时留下工作目录。
     * @throw compilation_error 编译失败，工作目录已经被删除，没有创建任何容器
     * @throw build_failure 镜像构建失败
     * @throw engine_unavailable 无法连接到容器引擎
     */
    void prepare();

    /**
     * @brief 在本次评测的镜像中运行测试点，必要时先调用 prepare
     * @return 按照 test_cases 顺序排列的输出
     */
    std::vector<std::string> run(const std::vector<test_case> &test_cases);

    /**
     * @brief 是否已经编译并构建了镜像
     */
    bool prepared() const;

    /**
     * @brief 工作目录 <work_root>/context-<submission_id>
     */
    const std::filesystem::path &get_workdir() const;

    const submission &get_submission() const;

private:
    sandbox::container_engine &engine;
    submission submit;
    std::vector<test_case> test_cases;
    std::filesystem::path workdir;

    compiler compile_stage;
    sandbox::image_builder build_stage;
    sandbox::executor execute_stage;

    scoped_file_lock lock;

    /**
     * @brief 已经构建的镜像标签，为空表示还没有构建镜像
     */
    std::string image;
};

}  // namespace autograder
