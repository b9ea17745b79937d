#include "model/catalog.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include "common/io_utils.hpp"

namespace autograder {
using namespace std;
using namespace nlohmann;

catalog::~catalog() {}

void catalog::on_test_case_changed(function<void(const string &)> callback) {
    test_case_changed.push_back(callback);
}

void catalog::on_submission_changed(function<void(const string &)> callback) {
    submission_changed.push_back(callback);
}

void catalog::fire_test_case_changed(const string &testcase_id) const {
    for (auto &f : test_case_changed) f(testcase_id);
}

void catalog::fire_submission_changed(const string &submission_id) const {
    for (auto &f : submission_changed) f(submission_id);
}

submission &memory_catalog::find_submission(const string &id) {
    auto it = submissions.find(id);
    if (it == submissions.end())
        throw out_of_range("submission " + id + " does not exist");
    return it->second;
}

vector<test_case>::iterator memory_catalog::find_test_case(const string &id) {
    auto it = find_if(test_cases.begin(), test_cases.end(), [&](const test_case &tc) { return tc.id == id; });
    if (it == test_cases.end())
        throw out_of_range("test case " + id + " does not exist");
    return it;
}

submission memory_catalog::get_submission(const string &id) const {
    lock_guard<mutex> guard(mut);
    auto it = submissions.find(id);
    if (it == submissions.end())
        throw out_of_range("submission " + id + " does not exist");
    return it->second;
}

void memory_catalog::set_compile_state(const string &id, compile_state state) {
    lock_guard<mutex> guard(mut);
    find_submission(id).compiled = state;
}

vector<test_case> memory_catalog::test_cases_of(const string &assignment_id) const {
    lock_guard<mutex> guard(mut);
    vector<test_case> result;
    copy_if(test_cases.begin(), test_cases.end(), back_inserter(result),
            [&](const test_case &tc) { return tc.assignment_id == assignment_id; });
    return result;
}

void memory_catalog::add_submission(const submission &submit) {
    assert_safe_id(submit.id);
    assert_safe_id(submit.assignment_id);
    lock_guard<mutex> guard(mut);
    if (!submissions.emplace(submit.id, submit).second)
        throw invalid_argument("submission " + submit.id + " already exists");
}

void memory_catalog::add_test_case(const test_case &tc) {
    assert_safe_id(tc.id);
    lock_guard<mutex> guard(mut);
    if (any_of(test_cases.begin(), test_cases.end(), [&](const test_case &t) { return t.id == tc.id; }))
        throw invalid_argument("test case " + tc.id + " already exists");
    test_cases.push_back(tc);
}

void memory_catalog::update_test_case(const string &id, const string &input, const string &expected_output) {
    {
        lock_guard<mutex> guard(mut);
        auto it = find_test_case(id);
        if (it->input == input && it->expected_output == expected_output)
            return;  // 内容没有变化，缓存结果仍然有效
        it->input = input;
        it->expected_output = expected_output;
    }
    LOG(INFO) << "Test case " << id << " updated, invalidating cached results";
    fire_test_case_changed(id);
}

void memory_catalog::delete_test_case(const string &id) {
    {
        lock_guard<mutex> guard(mut);
        test_cases.erase(find_test_case(id));
    }
    LOG(INFO) << "Test case " << id << " deleted, invalidating cached results";
    fire_test_case_changed(id);
}

void memory_catalog::replace_source(const string &id, const filesystem::path &source_path) {
    {
        lock_guard<mutex> guard(mut);
        submission &submit = find_submission(id);
        submit.source_path = source_path;
        submit.compiled = compile_state::UNKNOWN;
    }
    LOG(INFO) << "Source of submission " << id << " replaced, invalidating cached results";
    fire_submission_changed(id);
}

void memory_catalog::reassign_submission(const string &id, const string &assignment_id) {
    assert_safe_id(assignment_id);
    {
        lock_guard<mutex> guard(mut);
        submission &submit = find_submission(id);
        if (submit.assignment_id == assignment_id) return;
        submit.assignment_id = assignment_id;
        submit.compiled = compile_state::UNKNOWN;
    }
    LOG(INFO) << "Submission " << id << " moved to assignment " << assignment_id << ", invalidating cached results";
    fire_submission_changed(id);
}

void memory_catalog::delete_submission(const string &id) {
    {
        lock_guard<mutex> guard(mut);
        submissions.erase(id);
    }
    fire_submission_changed(id);
}

void memory_catalog::load(const filesystem::path &path) {
    if (!filesystem::exists(path))
        throw runtime_error("Unable to find catalog file " + path.string());
    ifstream fin(path);
    json j;
    fin >> j;
    if (j.count("test_cases"))
        for (auto &tc : j.at("test_cases"))
            add_test_case(tc.get<test_case>());
    if (j.count("submissions"))
        for (auto &submit : j.at("submissions"))
            add_submission(submit.get<submission>());
}

json memory_catalog::dump() const {
    lock_guard<mutex> guard(mut);
    json j;
    j["test_cases"] = test_cases;
    j["submissions"] = json::array();
    for (auto &[id, submit] : submissions)
        j["submissions"].push_back(submit);
    return j;
}

}  // namespace autograder
