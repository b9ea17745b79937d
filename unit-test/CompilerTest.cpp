#include "common/io_utils.hpp"
#include "compile/compiler.hpp"
#include "gtest/gtest.h"
#include "test/temp_dir.hpp"

using namespace std;
using namespace std::filesystem;
using namespace autograder;

class CompilerTest : public ::testing::Test {
protected:
    test::temp_dir tmp;
    compiler_config config;

    path write_source(const string &source) {
        path file = tmp / "main.cpp";
        write_file_content(file, source);
        return file;
    }
};

TEST_F(CompilerTest, CompileSucceededTest) {
    path source = write_source(R"(#include <iostream>
int main() {
    int a, b;
    std::cin >> a >> b;
    std::cout << a + b << std::endl;
    return 0;
})");
    path workdir = tmp / "context-1";
    path binary = compiler(config).compile(source, workdir);
    EXPECT_EQ(binary, workdir / compiler::BINARY_NAME);
    EXPECT_TRUE(is_regular_file(binary));
}

TEST_F(CompilerTest, CompilationErrorRemovesWorkdirTest) {
    path source = write_source(R"(int main() {
    return 0
})");
    path workdir = tmp / "context-2";
    try {
        compiler(config).compile(source, workdir);
        FAIL() << "compilation should fail";
    } catch (compilation_error &e) {
        EXPECT_NE(e.error_log.find("error"), string::npos) << e.error_log;
    }
    EXPECT_FALSE(exists(workdir));
}

TEST_F(CompilerTest, CompilationTimeLimitTest) {
    // 模拟模板无限展开一类卡住的编译器
    path stall = tmp / "stall-compiler.sh";
    write_file_content(stall, "#!/bin/sh\nsleep 10\n");
    permissions(stall, perms::owner_all);
    config.path = stall.string();
    config.time_limit = chrono::milliseconds(300);

    path source = write_source("int main() { return 0; }");
    path workdir = tmp / "context-3";
    auto start = chrono::steady_clock::now();
    EXPECT_THROW(compiler(config).compile(source, workdir), compilation_error);
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(5));
    EXPECT_FALSE(exists(workdir));
}

TEST_F(CompilerTest, MissingSourceTest) {
    path workdir = tmp / "context-4";
    EXPECT_THROW(compiler(config).compile(tmp / "missing.cpp", workdir), compilation_error);
    EXPECT_FALSE(exists(workdir));
}

TEST_F(CompilerTest, StaleWorkdirTest) {
    path workdir = tmp / "context-5";
    create_directories(workdir);
    write_file_content(workdir / "input-file-old.txt", "stale");

    path source = write_source("int main() { return 0; }");
    compiler(config).compile(source, workdir);
    EXPECT_FALSE(exists(workdir / "input-file-old.txt"));
    EXPECT_TRUE(exists(workdir / compiler::BINARY_NAME));
}
