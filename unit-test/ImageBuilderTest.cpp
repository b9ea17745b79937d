#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/image_builder.hpp"
#include "test/fake_engine.hpp"
#include "test/temp_dir.hpp"

using namespace std;
using namespace std::filesystem;
using namespace autograder;
using namespace autograder::sandbox;

// 在构建上下文中依次执行运行时描述文件的 RUN 指令，返回第一个失败指令的返回值
static int run_descriptor_steps(const path &descriptor, const path &context) {
    istringstream lines(read_file_content(descriptor));
    string line;
    while (getline(lines, line)) {
        if (!boost::starts_with(line, "RUN ")) continue;
        string command = fmt::format("cd '{}' && {}", context.string(), line.substr(4));
        int ret = call_process("/bin/sh", "-c", command);
        if (ret != 0) return ret;
    }
    return 0;
}

class ImageBuilderTest : public ::testing::Test {
protected:
    test::temp_dir tmp;
    test::fake_engine engine;
    path descriptor;
    path workdir;
    submission submit;
    vector<test_case> test_cases;

    void SetUp() override {
        descriptor = tmp / "Dockerfile.template";
        write_file_content(descriptor, "FROM ubuntu:22.04\nCOPY . .\n");
        workdir = tmp / "context-42";
        create_directories(workdir);
        write_file_content(workdir / "student-program", "");

        submit.id = "42";
        submit.assignment_id = "hw1";
        test_cases.push_back({"a", "hw1", "1 2\n", "3\n"});
        test_cases.push_back({"b", "hw1", "", "0\n"});
    }
};

TEST_F(ImageBuilderTest, NamingTest) {
    image_builder builder(engine, descriptor, "gav-autograder");
    EXPECT_EQ(image_builder::input_file_name("7"), "input-file-7.txt");
    EXPECT_EQ(builder.image_tag("42"), "gav-autograder/submission-42");
    EXPECT_THROW(builder.image_tag("../42"), invalid_argument);
    EXPECT_THROW(image_builder::input_file_name("a b"), invalid_argument);
}

TEST_F(ImageBuilderTest, BuildContextTest) {
    image_builder builder(engine, descriptor, "autograder");
    string tag = builder.build(submit, workdir, test_cases);
    EXPECT_EQ(tag, "autograder/submission-42");
    EXPECT_EQ(engine.builds(), 1u);
    EXPECT_EQ(engine.live_images(), set<string>{tag});

    set<string> expected{"Dockerfile", "student-program", "input-file-a.txt", "input-file-b.txt"};
    EXPECT_EQ(engine.context_files(tag), expected);
    EXPECT_EQ(read_file_content(workdir / "input-file-a.txt"), "1 2\n");
    EXPECT_EQ(read_file_content(workdir / "input-file-b.txt"), "");
    EXPECT_EQ(read_file_content(workdir / "Dockerfile"), read_file_content(descriptor));
}

TEST_F(ImageBuilderTest, BuildFailureTest) {
    engine.fail_build = true;
    image_builder builder(engine, descriptor, "autograder");
    EXPECT_THROW(builder.build(submit, workdir, test_cases), build_failure);
    EXPECT_TRUE(engine.live_images().empty());
}

TEST_F(ImageBuilderTest, MissingDescriptorTest) {
    image_builder builder(engine, tmp / "missing", "autograder");
    EXPECT_THROW(builder.build(submit, workdir, test_cases), build_failure);
    EXPECT_EQ(engine.builds(), 0u);
}

TEST_F(ImageBuilderTest, EngineUnavailableTest) {
    engine.unavailable = true;
    image_builder builder(engine, descriptor, "autograder");
    EXPECT_THROW(builder.build(submit, workdir, test_cases), engine_unavailable);
}

TEST_F(ImageBuilderTest, ShippedDescriptorTest) {
    path shipped = path(AUTOGRADER_SOURCE_DIR) / "exec" / "Dockerfile";
    ASSERT_TRUE(exists(shipped));
    image_builder builder(engine, shipped, "autograder");

    builder.build(submit, workdir, test_cases);
    EXPECT_EQ(run_descriptor_steps(workdir / "Dockerfile", workdir), 0);
    EXPECT_EQ(status(workdir / "input-file-a.txt").permissions() & perms::all, perms::owner_read | perms::group_read | perms::others_read);
}

TEST_F(ImageBuilderTest, ShippedDescriptorWithoutTestCasesTest) {
    path shipped = path(AUTOGRADER_SOURCE_DIR) / "exec" / "Dockerfile";
    image_builder builder(engine, shipped, "autograder");

    builder.build(submit, workdir, {});
    EXPECT_EQ(engine.context_files("autograder/submission-42"), (set<string>{"Dockerfile", "student-program"}));
    EXPECT_EQ(run_descriptor_steps(workdir / "Dockerfile", workdir), 0);
}
