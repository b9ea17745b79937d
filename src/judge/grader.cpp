#include "judge/grader.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"
#include "judge/evaluation.hpp"

namespace autograder {
using namespace std;

grader::grader(const grader_config &config, sandbox::container_engine &engine, catalog &records, result_store &store)
    : config(config), engine(engine), records(records), cache(store, records) {}

result_cache &grader::get_cache() {
    return cache;
}

submission_results grader::compile_failed(const string &submission_id, const compilation_error &error) {
    LOG(INFO) << "[submission-" << submission_id << "] " << error.what();
    DLOG(INFO) << "[submission-" << submission_id << "] Compiler output: " << error.error_log;
    cache.invalidate_submission(submission_id);
    records.set_compile_state(submission_id, compile_state::FAILED);

    submission_results results;
    results.compiled = compile_state::FAILED;
    return results;
}

submission_results grader::compare(compile_state state, const vector<test_case> &test_cases, const vector<string> &outputs) const {
    submission_results results;
    results.compiled = state;
    for (size_t i = 0; i < test_cases.size(); ++i)
        results.tests.push_back(compare_output(test_cases[i].input, test_cases[i].expected_output, outputs[i]));
    return results;
}

submission_results grader::full_test(const string &submission_id) {
    submission submit = records.get_submission(submission_id);
    vector<test_case> test_cases = records.test_cases_of(submit.assignment_id);

    elapsed_time timer;
    LOG(INFO) << "[submission-" << submit.id << "] Full test started with " << test_cases.size() << " test cases";
    evaluation session(config, engine, submit, test_cases);
    cache.invalidate_submission(submit.id);

    try {
        session.prepare();
    } catch (compilation_error &e) {
        return compile_failed(submit.id, e);
    }

    vector<string> outputs = cache.resolve_all(session, test_cases);
    records.set_compile_state(submit.id, compile_state::COMPILED);

    submission_results results = compare(compile_state::COMPILED, test_cases, outputs);
    LOG(INFO) << "[submission-" << submit.id << "] Full test finished in " << timer.duration<chrono::milliseconds>().count()
              << "ms, passed " << results.passed() << "/" << test_cases.size();
    return results;
}

submission_results grader::test_results(const string &submission_id) {
    submission submit = records.get_submission(submission_id);
    if (submit.compiled == compile_state::FAILED) {
        submission_results results;
        results.compiled = compile_state::FAILED;
        return results;
    }

    vector<test_case> test_cases = records.test_cases_of(submit.assignment_id);
    evaluation session(config, engine, submit, test_cases);

    vector<string> outputs;
    try {
        // 编译状态未知时（源代码刚被替换）必须先确定能否编译，即使所有测试点都有缓存
        if (submit.compiled == compile_state::UNKNOWN)
            session.prepare();
        outputs = cache.resolve_all(session, test_cases);
    } catch (compilation_error &e) {
        return compile_failed(submit.id, e);
    }

    if (submit.compiled != compile_state::COMPILED)
        records.set_compile_state(submit.id, compile_state::COMPILED);
    return compare(compile_state::COMPILED, test_cases, outputs);
}

string grader::grade(const string &submission_id) {
    submission submit = records.get_submission(submission_id);
    size_t total = records.test_cases_of(submit.assignment_id).size();
    return grade_summary(test_results(submission_id), total);
}

}  // namespace autograder
