#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "model/submission.hpp"

namespace autograder {

/**
 * @brief 课程系统的记录仓库
 * 评测核心只通过这个接口读取提交和测试点、写回编译状态。
 *
 * 所有会影响缓存结果的修改（修改/删除测试点、替换源代码、移动提交到其他作业、删除提交）
 * 都必须通过这里的操作完成，这些操作在修改记录之后显式触发失效事件，
 * 由注册的监听者（比如 result_cache）删除受影响的缓存结果。
 */
struct catalog {
    virtual ~catalog();

    /**
     * @brief 根据 id 获取提交
     * @throw std::out_of_range 提交不存在
     */
    virtual submission get_submission(const std::string &id) const = 0;

    /**
     * @brief 写回提交的编译状态
     */
    virtual void set_compile_state(const std::string &id, compile_state state) = 0;

    /**
     * @brief 获取作业的所有测试点，按照测试点创建的顺序排列
     */
    virtual std::vector<test_case> test_cases_of(const std::string &assignment_id) const = 0;

    virtual void add_submission(const submission &submit) = 0;

    /**
     * @brief 添加测试点
     * 新测试点在所有提交的缓存中都不存在，下次读取时会被按需计算，因此不需要触发失效事件
     */
    virtual void add_test_case(const test_case &tc) = 0;

    /**
     * @brief 修改测试点的输入和标准输出
     * 若内容确实发生了变化，触发 test_case_changed 事件
     */
    virtual void update_test_case(const std::string &id, const std::string &input, const std::string &expected_output) = 0;

    /**
     * @brief 删除测试点，触发 test_case_changed 事件
     */
    virtual void delete_test_case(const std::string &id) = 0;

    /**
     * @brief 替换提交的源代码，编译状态回到 UNKNOWN，触发 submission_changed 事件
     */
    virtual void replace_source(const std::string &id, const std::filesystem::path &source_path) = 0;

    /**
     * @brief 将提交移动到其他作业，编译状态回到 UNKNOWN，触发 submission_changed 事件
     */
    virtual void reassign_submission(const std::string &id, const std::string &assignment_id) = 0;

    /**
     * @brief 删除提交，触发 submission_changed 事件
     */
    virtual void delete_submission(const std::string &id) = 0;

    /**
     * @brief 注册测试点失效的事件回调函数
     * 回调函数的参数为测试点 id
     */
    void on_test_case_changed(std::function<void(const std::string &)> callback);

    /**
     * @brief 注册提交失效的事件回调函数
     * 回调函数的参数为提交 id
     */
    void on_submission_changed(std::function<void(const std::string &)> callback);

protected:
    void fire_test_case_changed(const std::string &testcase_id) const;
    void fire_submission_changed(const std::string &submission_id) const;

private:
    std::vector<std::function<void(const std::string &)>> test_case_changed;
    std::vector<std::function<void(const std::string &)>> submission_changed;
};

/**
 * @brief 保存在内存中的记录仓库
 * 命令行工具从 JSON 文件加载该仓库：
 * @code{.json}
 * {
 *     "test_cases": [
 *         { "id": "1", "assignment_id": "hw1", "input": "2 3\n", "expected_output": "5\n" }
 *     ],
 *     "submissions": [
 *         { "id": "17", "student_id": "alice", "assignment_id": "hw1", "source_path": "/srv/alice/main.cpp" }
 *     ]
 * }
 * @endcode
 */
struct memory_catalog : public catalog {
    submission get_submission(const std::string &id) const override;
    void set_compile_state(const std::string &id, compile_state state) override;
    std::vector<test_case> test_cases_of(const std::string &assignment_id) const override;

    void add_submission(const submission &submit) override;
    void add_test_case(const test_case &tc) override;
    void update_test_case(const std::string &id, const std::string &input, const std::string &expected_output) override;
    void delete_test_case(const std::string &id) override;
    void replace_source(const std::string &id, const std::filesystem::path &source_path) override;
    void reassign_submission(const std::string &id, const std::string &assignment_id) override;
    void delete_submission(const std::string &id) override;

    /**
     * @brief 从 JSON 文件加载记录
     */
    void load(const std::filesystem::path &path);

    /**
     * @brief 将所有记录导出为 JSON，格式与 load 一致
     */
    nlohmann::json dump() const;

private:
    mutable std::mutex mut;
    std::map<std::string, submission> submissions;
    // 测试点的顺序就是评测和展示的顺序
    std::vector<test_case> test_cases;

    submission &find_submission(const std::string &id);
    std::vector<test_case>::iterator find_test_case(const std::string &id);
};

}  // namespace autograder
