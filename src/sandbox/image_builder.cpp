#include "sandbox/image_builder.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace autograder::sandbox {
using namespace std;
namespace fs = std::filesystem;

image_builder::image_builder(container_engine &engine, const fs::path &runtime_descriptor, const string &image_namespace)
    : engine(engine), runtime_descriptor(runtime_descriptor), image_namespace(image_namespace) {}

string image_builder::input_file_name(const string &testcase_id) {
    return fmt::format("input-file-{}.txt", assert_safe_id(testcase_id));
}

string image_builder::image_tag(const string &submission_id) const {
    return fmt::format("{}/submission-{}", image_namespace, assert_safe_id(submission_id));
}

string image_builder::build(const submission &submit, const fs::path &workdir, const vector<test_case> &test_cases) const {
    string tag = image_tag(submit.id);

    try {
        for (auto &tc : test_cases)
            write_file_content(workdir / input_file_name(tc.id), tc.input);
        fs::copy_file(runtime_descriptor, workdir / "Dockerfile", fs::copy_options::overwrite_existing);
    } catch (fs::filesystem_error &e) {
        BOOST_THROW_EXCEPTION(build_failure(fmt::format("unable to prepare build context {}: {}", workdir, e.what())));
    } catch (system_error &e) {
        BOOST_THROW_EXCEPTION(build_failure(fmt::format("unable to prepare build context {}: {}", workdir, e.what())));
    }

    elapsed_time timer;
    LOG(INFO) << "Building image " << tag << " with " << test_cases.size() << " test cases";
    engine.build_image(workdir, tag);
    LOG(INFO) << "Built image " << tag << " in " << timer.duration<chrono::milliseconds>().count() << "ms";
    return tag;
}

}  // namespace autograder::sandbox
