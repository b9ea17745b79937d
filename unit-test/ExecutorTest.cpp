#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/executor.hpp"
#include "sandbox/image_builder.hpp"
#include "test/fake_engine.hpp"
#include "test/temp_dir.hpp"

using namespace std;
using namespace std::filesystem;
using namespace autograder;
using namespace autograder::sandbox;

class ExecutorTest : public ::testing::Test {
protected:
    test::temp_dir tmp;
    test::fake_engine engine;
    sandbox_config config;
    vector<test_case> test_cases;
    string image = "autograder/submission-9";

    void SetUp() override {
        for (int i = 1; i <= 6; ++i) {
            string id = to_string(i);
            test_cases.push_back({id, "hw1", id + "\n", id + id + "\n"});
            write_file_content(tmp / image_builder::input_file_name(id), id + "\n");
        }
        write_file_content(tmp / "Dockerfile", "FROM ubuntu:22.04\n");
        engine.build_image(tmp.path, image);

        // 将输入重复一遍
        engine.program = [](const string &input) {
            string line = input.substr(0, input.find('\n'));
            return make_pair(line + line + "\n", true);
        };
    }
};

TEST_F(ExecutorTest, ContainerSpecTest) {
    config.memory_limit = 256;
    config.cpu_shares = 512;
    config.cpuset = "2";
    executor exec(engine, config);
    container_spec spec = exec.make_spec(image, "9", test_cases[0]);
    EXPECT_EQ(spec.image, image);
    EXPECT_EQ(spec.memory_limit, 256LL * 1024 * 1024);
    EXPECT_EQ(spec.cpu_shares, 512);
    EXPECT_EQ(spec.cpuset, "2");
    EXPECT_TRUE(spec.network_disabled);
    EXPECT_TRUE(spec.read_only_rootfs);
    EXPECT_EQ(spec.security_opt, vector<string>{"no-new-privileges"});
    vector<string> command{"bash", "-c", "./student-program < input-file-1.txt"};
    EXPECT_EQ(spec.command, command);
    EXPECT_EQ(spec.name.rfind("submission-9-testcase-1-", 0), 0);

    // 同一个测试点多次运行时容器不能重名
    EXPECT_NE(spec.name, exec.make_spec(image, "9", test_cases[0]).name);
}

TEST_F(ExecutorTest, RunTest) {
    executor exec(engine, config);
    EXPECT_EQ(exec.run(image, "9", test_cases[2]), "33\n");
    EXPECT_EQ(engine.containers_created(), 1u);
    EXPECT_EQ(engine.containers_killed(), 0u);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(ExecutorTest, TimeLimitExceededTest) {
    engine.program = [](const string &) {
        return make_pair(string("partial"), false);
    };
    executor exec(engine, config);
    // 超时不是错误，已经产生的输出照常返回
    EXPECT_EQ(exec.run(image, "9", test_cases[0]), "partial");
    EXPECT_EQ(engine.containers_killed(), 1u);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(ExecutorTest, EngineErrorStillRemovesContainerTest) {
    engine.fail_start = true;
    executor exec(engine, config);
    EXPECT_THROW(exec.run(image, "9", test_cases[0]), engine_error);
    EXPECT_EQ(engine.containers_created(), 1u);
    EXPECT_EQ(engine.containers_removed(), 1u);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(ExecutorTest, MissingImageTest) {
    executor exec(engine, config);
    EXPECT_THROW(exec.run("autograder/submission-missing", "9", test_cases[0]), engine_error);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(ExecutorTest, RemoveFailureIsNotFatalTest) {
    engine.fail_remove_container = true;
    executor exec(engine, config);
    EXPECT_EQ(exec.run(image, "9", test_cases[0]), "11\n");
}

TEST_F(ExecutorTest, SequentialTest) {
    engine.run_delay = chrono::milliseconds(10);
    executor exec(engine, config);
    vector<string> outputs = exec.run_all(image, "9", test_cases);
    ASSERT_EQ(outputs.size(), test_cases.size());
    for (size_t i = 0; i < test_cases.size(); ++i)
        EXPECT_EQ(outputs[i], test_cases[i].expected_output);
    EXPECT_EQ(engine.max_running(), 1u);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(ExecutorTest, ParallelTest) {
    engine.run_delay = chrono::milliseconds(50);
    config.parallelism = 3;
    executor exec(engine, config);
    vector<string> outputs = exec.run_all(image, "9", test_cases);
    ASSERT_EQ(outputs.size(), test_cases.size());
    for (size_t i = 0; i < test_cases.size(); ++i)
        EXPECT_EQ(outputs[i], test_cases[i].expected_output);
    EXPECT_LE(engine.max_running(), 3u);
    EXPECT_GT(engine.max_running(), 1u);
    EXPECT_EQ(engine.containers_created(), test_cases.size());
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(ExecutorTest, ParallelEngineErrorTest) {
    config.parallelism = 4;
    engine.fail_start = true;
    executor exec(engine, config);
    EXPECT_THROW(exec.run_all(image, "9", test_cases), engine_error);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(ExecutorTest, RealProcessTimeLimitTest) {
    // 不使用脚本化的输出，真实运行一个先输出再死循环的程序
    engine.program = nullptr;
    write_file_content(tmp / "student-program", "#!/bin/sh\necho partial\nwhile true; do :; done\n");
    permissions(tmp / "student-program", perms::owner_all);
    config.time_limit = chrono::milliseconds(300);
    executor exec(engine, config);
    EXPECT_EQ(exec.run(image, "9", test_cases[0]), "partial\n");
    EXPECT_EQ(engine.containers_killed(), 1u);
}
