#pragma once

#include <optional>
#include <string>
#include <vector>
#include "judge/evaluation.hpp"
#include "model/catalog.hpp"
#include "store/result_store.hpp"

namespace autograder {

/**
 * @brief 每个 (提交, 测试点) 的输出缓存
 * 构造时向记录仓库注册失效回调：
 * 1. 测试点被修改或者删除时，删除所有提交在该测试点上的缓存结果；
 * 2. 提交的源代码被替换、被移动到其他作业或者被删除时，删除该提交的所有缓存结果。
 * 因此 result_cache 的生命周期必须覆盖记录仓库的所有修改操作。
 */
struct result_cache {
    result_cache(result_store &store, catalog &records);

    std::optional<std::string> find(const std::string &submission_id, const std::string &testcase_id) const;

    /**
     * @brief 获取一个测试点的输出，缓存不存在时在 session 中运行该测试点并缓存
     * @throw compilation_error session 还没有编译，且编译失败
     */
    std::string resolve(evaluation &session, const test_case &tc);

    /**
     * @brief 获取多个测试点的输出
     * 先查找所有缓存，只有在存在缺失的测试点时才编译和构建镜像（每个 session 至多一次），
     * 然后在同一个镜像中运行所有缺失的测试点并保存结果。
     * @return 按照 test_cases 顺序排列的输出
     * @throw compilation_error session 还没有编译，且编译失败
     */
    std::vector<std::string> resolve_all(evaluation &session, const std::vector<test_case> &test_cases);

    /**
     * @brief 删除提交的所有缓存结果
     * @return 删除的结果个数
     */
    size_t invalidate_submission(const std::string &submission_id);

    /**
     * @brief 删除所有提交在该测试点上的缓存结果
     * @return 删除的结果个数
     */
    size_t invalidate_test_case(const std::string &testcase_id);

private:
    result_store &store;
};

}  // namespace autograder
