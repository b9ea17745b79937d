#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace autograder {

/**
 * @brief 缓存结果的持久化接口
 * 键为 (提交 id, 测试点 id)，值为选手程序在该测试点上的输出。
 * 每个键至多对应一个值。实现必须是线程安全的。
 * 存储后端出错时抛出 store_error。
 */
struct result_store {
    virtual ~result_store();

    /**
     * @brief 查找缓存结果
     * @return 缓存的输出，不存在表示还没有运行过或者已经失效
     */
    virtual std::optional<std::string> find(const std::string &submission_id, const std::string &testcase_id) const = 0;

    /**
     * @brief 保存缓存结果，已经存在时覆盖
     */
    virtual void save(const std::string &submission_id, const std::string &testcase_id, const std::string &output) = 0;

    /**
     * @brief 删除提交的所有缓存结果
     * @return 删除的结果个数
     */
    virtual size_t erase_submission(const std::string &submission_id) = 0;

    /**
     * @brief 删除所有提交在该测试点上的缓存结果
     * @return 删除的结果个数
     */
    virtual size_t erase_test_case(const std::string &testcase_id) = 0;

    /**
     * @brief 缓存结果的总数
     */
    virtual size_t size() const = 0;
};

/**
 * @brief 保存在内存中的缓存结果，进程退出后丢失
 */
struct memory_result_store : public result_store {
    std::optional<std::string> find(const std::string &submission_id, const std::string &testcase_id) const override;
    void save(const std::string &submission_id, const std::string &testcase_id, const std::string &output) override;
    size_t erase_submission(const std::string &submission_id) override;
    size_t erase_test_case(const std::string &testcase_id) override;
    size_t size() const override;

private:
    mutable std::mutex mut;
    std::map<std::pair<std::string, std::string>, std::string> results;
};

}  // namespace autograder
