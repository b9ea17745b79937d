#include "sandbox/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "compile/compiler.hpp"
#include "sandbox/image_builder.hpp"

namespace autograder::sandbox {
using namespace std;

executor::executor(container_engine &engine, const sandbox_config &config)
    : engine(engine), config(config) {}

container_spec executor::make_spec(const string &image, const string &submission_id, const test_case &tc) const {
    container_spec spec;
    spec.image = image;
    // 同一个测试点可能被多次评测，加上 uuid 避免容器重名
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    spec.name = fmt::format("submission-{}-testcase-{}-{}", submission_id, tc.id, uuid);
    spec.command = {config.shell, "-c", fmt::format("./{} < {}", compiler::BINARY_NAME, image_builder::input_file_name(tc.id))};
    spec.memory_limit = config.memory_limit * 1024 * 1024;
    spec.cpu_shares = config.cpu_shares;
    spec.cpuset = config.cpuset;
    spec.network_disabled = true;
    spec.read_only_rootfs = true;
    spec.security_opt = {"no-new-privileges"};
    return spec;
}

string executor::run(const string &image, const string &submission_id, const test_case &tc) const {
    string id = engine.create_container(make_spec(image, submission_id, tc));
    defer {
        try {
            engine.remove_container(id);
        } catch (std::exception &e) {
            LOG(ERROR) << "[submission-" << submission_id << "] Container " << id << " leaked: " << e.what();
        }
    };

    elapsed_time timer;
    engine.start_container(id);
    if (!engine.wait_container(id, config.time_limit)) {
        LOG(INFO) << "[submission-" << submission_id << "] Test case " << tc.id << " exceeded "
                  << config.time_limit.count() << "ms, killing container " << id;
        engine.kill_container(id);
    }

    string output = engine.container_logs(id);
    LOG(INFO) << "[submission-" << submission_id << "] Test case " << tc.id << " finished in "
              << timer.duration<chrono::milliseconds>().count() << "ms";
    DLOG(INFO) << "[submission-" << submission_id << "] Test case " << tc.id << " output: " << output;
    return output;
}

vector<string> executor::run_all(const string &image, const string &submission_id, const vector<test_case> &test_cases) const {
    vector<string> outputs(test_cases.size());
    size_t workers = min(max<size_t>(config.parallelism, 1), test_cases.size());

    if (workers <= 1) {
        for (size_t i = 0; i < test_cases.size(); ++i)
            outputs[i] = run(image, submission_id, test_cases[i]);
        return outputs;
    }

    concurrent_queue<size_t> tasks;
    for (size_t i = 0; i < test_cases.size(); ++i) tasks.push(i);

    mutex error_mutex;
    exception_ptr error;
    atomic_bool failed{false};

    auto worker_loop = [&] {
        size_t index;
        // 一旦有测试点出现引擎错误，其他线程不再领取新的测试点
        while (!failed && tasks.try_pop(index)) {
            try {
                outputs[index] = run(image, submission_id, test_cases[index]);
            } catch (std::exception &) {
                lock_guard<mutex> guard(error_mutex);
                if (!error) error = current_exception();
                failed = true;
            }
        }
    };

    vector<thread> threads;
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back(worker_loop);
    for (auto &t : threads) t.join();

    if (error) rethrow_exception(error);
    return outputs;
}

}  // namespace autograder::sandbox
