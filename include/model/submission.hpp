#pragma once

#include <ctime>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"

/**
 * 这个头文件包含评测核心从课程系统读取的记录
 * 包含：
 * 1. submission 类（表示一个学生提交）
 * 2. test_case 类（表示一个测试点）
 * 课程、作业、学生等记录由外部系统维护，评测核心只通过 id 引用它们。
 */
namespace autograder {

/**
 * @brief 表示一个测试点
 * 测试点只会被教师修改，修改输入或者标准输出后，所有引用该测试点的缓存结果都要失效
 */
struct test_case {
    /**
     * @brief 测试点 id，用于命名输入文件 input-file-<id>.txt
     */
    std::string id;

    /**
     * @brief 测试点所属的作业 id
     */
    std::string assignment_id;

    /**
     * @brief 喂给选手程序标准输入的内容
     */
    std::string input;

    /**
     * @brief 标准输出，选手程序的输出必须与之完全一致才算通过
     */
    std::string expected_output;
};

/**
 * @brief 一个学生提交
 */
struct submission {
    /**
     * @brief 提交 id
     * 工作目录 context-<id> 和镜像标签 <namespace>/submission-<id> 都以此命名，
     * 以避免同时评测的不同提交互相冲突
     */
    std::string id;

    /**
     * @brief 提交所属的学生 id
     */
    std::string student_id;

    /**
     * @brief 提交所属的作业 id，决定了要运行哪些测试点
     */
    std::string assignment_id;

    /**
     * @brief 源代码文件的路径
     */
    std::filesystem::path source_path;

    /**
     * @brief 编译状态，只有在至少完成一次完整评测之后才有意义
     */
    compile_state compiled = compile_state::UNKNOWN;

    /**
     * @brief 学生是否已经确认该提交为最终提交，评测核心不读取这个字段
     */
    bool confirmed = false;

    /**
     * @brief 提交创建时间
     */
    time_t created_at = 0;
};

void from_json(const nlohmann::json &j, test_case &tc);
void to_json(nlohmann::json &j, const test_case &tc);
void from_json(const nlohmann::json &j, submission &submit);
void to_json(nlohmann::json &j, const submission &submit);

}  // namespace autograder
