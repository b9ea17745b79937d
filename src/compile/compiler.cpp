#include "compile/compiler.hpp"
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace autograder {
using namespace std;
namespace fs = std::filesystem;

const char *const compiler::BINARY_NAME = "student-program";
const char *const compiler::LOG_NAME = "compile.out";

compilation_error::compilation_error(const string &what, const string &error_log)
    : runtime_error(what), error_log(error_log) {}

compiler::compiler(const compiler_config &config) : config(config) {}

fs::path compiler::compile(const fs::path &source, const fs::path &workdir) const {
    if (fs::exists(workdir)) {
        // 同一个提交的评测有提交锁保护，残留的工作目录只可能来自崩溃的评测进程
        LOG(WARNING) << "Removing stale working directory " << workdir;
        fs::remove_all(workdir);
    }
    fs::create_directories(workdir);

    // 编译失败时整个工作目录都要被删除，不能留下孤立的目录
    auto cleanup = scoped_guard() + [&] {
        error_code ec;
        fs::remove_all(workdir, ec);
        if (ec) LOG(ERROR) << "Unable to delete directory " << workdir << ": " << ec.message();
    };

    fs::path binary = workdir / BINARY_NAME;
    fs::path log = workdir / LOG_NAME;

    if (!fs::is_regular_file(source))
        throw compilation_error("source file " + source.string() + " does not exist", "");

    elapsed_time timer;
    process_result result = call_process_timeout(log, config.time_limit, config.path, config.flags, "-o", binary, source);
    string error_log = read_file_content(log, "");

    if (result.timed_out) {
        LOG(INFO) << "Compilation of " << source << " exceeded " << config.time_limit.count() << "ms";
        throw compilation_error("compilation time limit exceeded", error_log);
    }
    if (result.exit_code != 0) {
        LOG(INFO) << "Compilation of " << source << " failed with exit code " << result.exit_code;
        throw compilation_error("compiler exited with code " + to_string(result.exit_code), error_log);
    }
    if (!fs::is_regular_file(binary))
        throw compilation_error("compiler did not produce an executable", error_log);

    DLOG(INFO) << "Compiled " << source << " in " << timer.duration<chrono::milliseconds>().count() << "ms";
    cleanup.dismiss();
    return binary;
}

}  // namespace autograder
