#include "gtest/gtest.h"
#include "store/redis_result_store.hpp"
#include "store/result_store.hpp"

using namespace std;
using namespace autograder;

TEST(ResultStoreTest, UpsertTest) {
    memory_result_store store;
    EXPECT_FALSE(store.find("1", "a").has_value());
    store.save("1", "a", "first");
    store.save("1", "a", "second");
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find("1", "a").value(), "second");

    // 空输出也是有效的缓存结果
    store.save("1", "b", "");
    ASSERT_TRUE(store.find("1", "b").has_value());
    EXPECT_EQ(*store.find("1", "b"), "");
}

TEST(ResultStoreTest, EraseSubmissionTest) {
    memory_result_store store;
    store.save("1", "a", "x");
    store.save("1", "b", "y");
    store.save("10", "a", "z");
    store.save("2", "a", "w");

    EXPECT_EQ(store.erase_submission("1"), 2u);
    EXPECT_FALSE(store.find("1", "a").has_value());
    EXPECT_FALSE(store.find("1", "b").has_value());
    EXPECT_TRUE(store.find("10", "a").has_value());
    EXPECT_TRUE(store.find("2", "a").has_value());
    EXPECT_EQ(store.erase_submission("1"), 0u);
}

TEST(ResultStoreTest, EraseTestCaseTest) {
    memory_result_store store;
    store.save("1", "a", "x");
    store.save("1", "b", "y");
    store.save("2", "a", "z");

    EXPECT_EQ(store.erase_test_case("a"), 2u);
    EXPECT_FALSE(store.find("1", "a").has_value());
    EXPECT_FALSE(store.find("2", "a").has_value());
    EXPECT_EQ(store.find("1", "b").value(), "y");
    EXPECT_EQ(store.size(), 1u);
}

TEST(ResultStoreTest, RedisKeyLayoutTest) {
    redis_config config;
    config.prefix = "grader";
    redis_result_store store(config);
    EXPECT_EQ(store.submission_key("17"), "grader:submission:17");
    EXPECT_EQ(store.testcase_key("sum-1"), "grader:testcase:sum-1");
    EXPECT_EQ(store.submissions_key(), "grader:submissions");
}
