#pragma once

#include "store/redis.hpp"
#include "store/result_store.hpp"

namespace autograder {

/**
 * @brief 保存在 Redis 中的缓存结果
 * 键的布局：
 * <prefix>:submission:<submission_id>  hash，测试点 id -> 输出
 * <prefix>:testcase:<testcase_id>      set，缓存了该测试点结果的提交 id
 * <prefix>:submissions                 set，有缓存结果的提交 id
 * 测试点的反向索引使得测试点失效时不需要扫描所有键。
 */
struct redis_result_store : public result_store {
    explicit redis_result_store(const redis_config &config);

    std::optional<std::string> find(const std::string &submission_id, const std::string &testcase_id) const override;
    void save(const std::string &submission_id, const std::string &testcase_id, const std::string &output) override;
    size_t erase_submission(const std::string &submission_id) override;
    size_t erase_test_case(const std::string &testcase_id) override;
    size_t size() const override;

    std::string submission_key(const std::string &submission_id) const;
    std::string testcase_key(const std::string &testcase_id) const;
    std::string submissions_key() const;

private:
    std::string prefix;
    mutable redis_conn conn;
};

}  // namespace autograder
