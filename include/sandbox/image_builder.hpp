#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "model/submission.hpp"
#include "sandbox/engine.hpp"

namespace autograder::sandbox {

/**
 * @brief 镜像构建阶段
 * 在工作目录中准备构建上下文（可执行文件 + 每个测试点的输入文件 + 运行时描述文件），
 * 并构建以提交 id 命名的镜像。镜像由评测流程负责在用完之后删除。
 */
struct image_builder {
    /**
     * @param engine 容器引擎客户端
     * @param runtime_descriptor 运行时描述文件（Dockerfile）模板的路径
     * @param image_namespace 镜像标签的命名空间
     */
    image_builder(container_engine &engine, const std::filesystem::path &runtime_descriptor, const std::string &image_namespace);

    /**
     * @brief 测试点输入文件在工作目录中的文件名 input-file-<testcase_id>.txt
     */
    static std::string input_file_name(const std::string &testcase_id);

    /**
     * @brief 提交的镜像标签 <namespace>/submission-<submission_id>
     * 以提交 id 命名可以避免并发评测的不同提交互相覆盖，也便于有针对性地回收镜像
     */
    std::string image_tag(const std::string &submission_id) const;

    /**
     * @brief 准备构建上下文并构建镜像
     * @param submit 要构建镜像的提交
     * @param workdir 已经包含编译好的可执行文件的工作目录
     * @param test_cases 提交所属作业的所有测试点
     * @return 镜像标签
     * @throw build_failure 构建上下文准备失败或者镜像构建失败
     * @throw engine_unavailable 无法连接到容器引擎
     */
    std::string build(const submission &submit, const std::filesystem::path &workdir, const std::vector<test_case> &test_cases) const;

private:
    container_engine &engine;
    std::filesystem::path runtime_descriptor;
    std::string image_namespace;
};

}  // namespace autograder::sandbox
