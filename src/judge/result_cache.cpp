#include "judge/result_cache.hpp"
#include <glog/logging.h>

namespace autograder {
using namespace std;

result_cache::result_cache(result_store &store, catalog &records) : store(store) {
    records.on_test_case_changed([this](const string &testcase_id) { invalidate_test_case(testcase_id); });
    records.on_submission_changed([this](const string &submission_id) { invalidate_submission(submission_id); });
}

optional<string> result_cache::find(const string &submission_id, const string &testcase_id) const {
    return store.find(submission_id, testcase_id);
}

string result_cache::resolve(evaluation &session, const test_case &tc) {
    return resolve_all(session, {tc}).front();
}

vector<string> result_cache::resolve_all(evaluation &session, const vector<test_case> &test_cases) {
    const string &submission_id = session.get_submission().id;
    vector<string> outputs(test_cases.size());
    vector<size_t> missing_index;
    vector<test_case> missing;

    for (size_t i = 0; i < test_cases.size(); ++i) {
        if (auto output = store.find(submission_id, test_cases[i].id)) {
            outputs[i] = *output;
        } else {
            missing_index.push_back(i);
            missing.push_back(test_cases[i]);
        }
    }

    if (missing.empty()) {
        DLOG(INFO) << "[submission-" << submission_id << "] All " << test_cases.size() << " results cached";
        return outputs;
    }

    LOG(INFO) << "[submission-" << submission_id << "] Running " << missing.size() << " of " << test_cases.size() << " test cases";
    vector<string> results = session.run(missing);
    for (size_t i = 0; i < missing.size(); ++i) {
        store.save(submission_id, missing[i].id, results[i]);
        outputs[missing_index[i]] = move(results[i]);
    }
    return outputs;
}

size_t result_cache::invalidate_submission(const string &submission_id) {
    size_t count = store.erase_submission(submission_id);
    if (count > 0)
        LOG(INFO) << "[submission-" << submission_id << "] Invalidated " << count << " cached results";
    return count;
}

size_t result_cache::invalidate_test_case(const string &testcase_id) {
    size_t count = store.erase_test_case(testcase_id);
    if (count > 0)
        LOG(INFO) << "Test case " << testcase_id << ": invalidated " << count << " cached results";
    return count;
}

}  // namespace autograder
