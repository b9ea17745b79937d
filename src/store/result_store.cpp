#include "store/result_store.hpp"

namespace autograder {
using namespace std;

result_store::~result_store() {}

optional<string> memory_result_store::find(const string &submission_id, const string &testcase_id) const {
    lock_guard<mutex> guard(mut);
    auto it = results.find({submission_id, testcase_id});
    if (it == results.end()) return nullopt;
    return it->second;
}

void memory_result_store::save(const string &submission_id, const string &testcase_id, const string &output) {
    lock_guard<mutex> guard(mut);
    results[{submission_id, testcase_id}] = output;
}

size_t memory_result_store::erase_submission(const string &submission_id) {
    lock_guard<mutex> guard(mut);
    // 键按照提交 id 排序，同一个提交的结果是连续的
    auto first = results.lower_bound({submission_id, ""});
    auto last = first;
    size_t count = 0;
    while (last != results.end() && last->first.first == submission_id) ++last, ++count;
    results.erase(first, last);
    return count;
}

size_t memory_result_store::erase_test_case(const string &testcase_id) {
    lock_guard<mutex> guard(mut);
    size_t count = 0;
    for (auto it = results.begin(); it != results.end();) {
        if (it->first.second == testcase_id)
            it = results.erase(it), ++count;
        else
            ++it;
    }
    return count;
}

size_t memory_result_store::size() const {
    lock_guard<mutex> guard(mut);
    return results.size();
}

}  // namespace autograder
