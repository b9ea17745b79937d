#include "judge/evaluation.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/utils.hpp"

namespace autograder {
using namespace std;
namespace fs = std::filesystem;

evaluation::evaluation(const grader_config &config, sandbox::container_engine &engine, const submission &submit, const vector<test_case> &test_cases)
    : engine(engine),
      submit(submit),
      test_cases(test_cases),
      workdir(config.work_root / ("context-" + assert_safe_id(submit.id))),
      compile_stage(config.compiler),
      build_stage(engine, config.runtime_descriptor, config.image_namespace),
      execute_stage(engine, config.sandbox) {
    fs::path lock_path = config.get_lock_root() / fmt::format("submission-{}.lock", submit.id);
    elapsed_time timer;
    lock = lock_file(lock_path, false);
    auto waited = timer.duration<chrono::milliseconds>();
    if (waited.count() > 100)
        LOG(INFO) << "[submission-" << submit.id << "] Waited " << waited.count() << "ms for another evaluation";
}

evaluation::~evaluation() {
    if (!image.empty()) {
        try {
            engine.remove_image(image);
            DLOG(INFO) << "[submission-" << submit.id << "] Removed image " << image;
        } catch (std::exception &e) {
            LOG(ERROR) << "[submission-" << submit.id << "] Image " << image << " leaked: " << e.what();
        }
    }

    error_code ec;
    fs::remove_all(workdir, ec);
    if (ec)
        LOG(ERROR) << "[submission-" << submit.id << "] Working directory " << workdir << " leaked: " << ec.message();
}

void evaluation::prepare() {
    if (!image.empty()) return;

    engine.ping();

    LOG(INFO) << "[submission-" << submit.id << "] Compiling " << submit.source_path;
    compile_stage.compile(submit.source_path, workdir);

    // 构建失败时 docker 会删除中间容器，不会留下带标签的镜像
    image = build_stage.build(submit, workdir, test_cases);
}

vector<string> evaluation::run(const vector<test_case> &cases) {
    prepare();
    return execute_stage.run_all(image, submit.id, cases);
}

bool evaluation::prepared() const {
    return !image.empty();
}

const fs::path &evaluation::get_workdir() const {
    return workdir;
}

const submission &evaluation::get_submission() const {
    return submit;
}

}  // namespace autograder
