#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "judge/result_cache.hpp"
#include "model/catalog.hpp"
#include "store/result_store.hpp"
#include "test/temp_dir.hpp"

using namespace std;
using namespace autograder;

class CatalogTest : public ::testing::Test {
protected:
    memory_catalog records;
    memory_result_store store;

    void SetUp() override {
        records.add_test_case({"a", "hw1", "1\n", "1\n"});
        records.add_test_case({"b", "hw1", "2\n", "2\n"});
        records.add_test_case({"c", "hw2", "3\n", "3\n"});

        submission s1;
        s1.id = "1";
        s1.assignment_id = "hw1";
        s1.source_path = "/tmp/1.cpp";
        s1.compiled = compile_state::COMPILED;
        records.add_submission(s1);

        submission s2 = s1;
        s2.id = "2";
        records.add_submission(s2);
    }

    void fill_cache() {
        store.save("1", "a", "1\n");
        store.save("1", "b", "2\n");
        store.save("2", "a", "1\n");
        store.save("2", "b", "3\n");
    }
};

TEST_F(CatalogTest, TestCaseOrderTest) {
    auto cases = records.test_cases_of("hw1");
    ASSERT_EQ(cases.size(), 2u);
    EXPECT_EQ(cases[0].id, "a");
    EXPECT_EQ(cases[1].id, "b");
    EXPECT_TRUE(records.test_cases_of("hw3").empty());
}

TEST_F(CatalogTest, InvalidIdTest) {
    EXPECT_THROW((records.add_test_case({"A B", "hw1", "", ""})), invalid_argument);
    submission s;
    s.id = "../etc";
    s.assignment_id = "hw1";
    EXPECT_THROW(records.add_submission(s), invalid_argument);
    EXPECT_THROW(records.get_submission("404"), out_of_range);
}

TEST_F(CatalogTest, EditTestCaseInvalidatesAcrossSubmissionsTest) {
    result_cache cache(store, records);
    fill_cache();
    records.update_test_case("a", "10\n", "10\n");
    EXPECT_FALSE(store.find("1", "a").has_value());
    EXPECT_FALSE(store.find("2", "a").has_value());
    EXPECT_TRUE(store.find("1", "b").has_value());
    EXPECT_TRUE(store.find("2", "b").has_value());
}

TEST_F(CatalogTest, UnchangedTestCaseKeepsCacheTest) {
    result_cache cache(store, records);
    fill_cache();
    records.update_test_case("a", "1\n", "1\n");
    EXPECT_EQ(store.size(), 4u);
}

TEST_F(CatalogTest, DeleteTestCaseTest) {
    result_cache cache(store, records);
    fill_cache();
    records.delete_test_case("b");
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(records.test_cases_of("hw1").size(), 1u);
}

TEST_F(CatalogTest, AddTestCaseKeepsCacheTest) {
    result_cache cache(store, records);
    fill_cache();
    records.add_test_case({"d", "hw1", "4\n", "4\n"});
    EXPECT_EQ(store.size(), 4u);
}

TEST_F(CatalogTest, ReplaceSourceTest) {
    result_cache cache(store, records);
    fill_cache();
    records.replace_source("1", "/tmp/1-new.cpp");
    EXPECT_FALSE(store.find("1", "a").has_value());
    EXPECT_FALSE(store.find("1", "b").has_value());
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(records.get_submission("1").compiled, compile_state::UNKNOWN);
    EXPECT_EQ(records.get_submission("1").source_path, "/tmp/1-new.cpp");
    EXPECT_EQ(records.get_submission("2").compiled, compile_state::COMPILED);
}

TEST_F(CatalogTest, ReassignSubmissionTest) {
    result_cache cache(store, records);
    fill_cache();
    records.reassign_submission("2", "hw1");
    EXPECT_EQ(store.size(), 4u);
    EXPECT_EQ(records.get_submission("2").compiled, compile_state::COMPILED);

    records.reassign_submission("2", "hw2");
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(records.get_submission("2").compiled, compile_state::UNKNOWN);
}

TEST_F(CatalogTest, DeleteSubmissionTest) {
    result_cache cache(store, records);
    fill_cache();
    records.delete_submission("2");
    EXPECT_EQ(store.size(), 2u);
    EXPECT_THROW(records.get_submission("2"), out_of_range);
}

TEST_F(CatalogTest, LoadAndDumpTest) {
    test::temp_dir tmp;
    write_file_content(tmp / "catalog.json", R"({
    "test_cases": [
        { "id": "sum-1", "assignment_id": "hw1", "input": "2 3\n", "expected_output": "5\n" }
    ],
    "submissions": [
        { "id": "17", "student_id": "alice", "assignment_id": "hw1", "source_path": "/srv/17/main.cpp", "compiled": "failed" }
    ]
})");
    memory_catalog loaded;
    loaded.load(tmp / "catalog.json");
    submission submit = loaded.get_submission("17");
    EXPECT_EQ(submit.student_id, "alice");
    EXPECT_EQ(submit.compiled, compile_state::FAILED);
    ASSERT_EQ(loaded.test_cases_of("hw1").size(), 1u);
    EXPECT_EQ(loaded.test_cases_of("hw1")[0].expected_output, "5\n");

    loaded.set_compile_state("17", compile_state::COMPILED);
    nlohmann::json dumped = loaded.dump();
    EXPECT_EQ(dumped.at("submissions")[0].at("compiled"), "compiled");
    EXPECT_EQ(dumped.at("test_cases").size(), 1u);
}
