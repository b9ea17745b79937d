#include "store/redis_result_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace autograder {
using namespace std;

redis_result_store::redis_result_store(const redis_config &config)
    : prefix(config.prefix), conn(config) {}

string redis_result_store::submission_key(const string &submission_id) const {
    return fmt::format("{}:submission:{}", prefix, submission_id);
}

string redis_result_store::testcase_key(const string &testcase_id) const {
    return fmt::format("{}:testcase:{}", prefix, testcase_id);
}

string redis_result_store::submissions_key() const {
    return prefix + ":submissions";
}

static vector<string> as_strings(const cpp_redis::reply &reply) {
    vector<string> result;
    if (!reply.is_array()) return result;
    for (auto &element : reply.as_array())
        if (element.is_string()) result.push_back(element.as_string());
    return result;
}

optional<string> redis_result_store::find(const string &submission_id, const string &testcase_id) const {
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(client.hget(submission_key(submission_id), testcase_id));
    });
    if (replies.at(0).is_null()) return nullopt;
    if (!replies.at(0).is_string())
        BOOST_THROW_EXCEPTION(store_error(fmt::format("unexpected reply for {} {}", submission_key(submission_id), testcase_id)));
    return replies.at(0).as_string();
}

void redis_result_store::save(const string &submission_id, const string &testcase_id, const string &output) {
    conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(client.hset(submission_key(submission_id), testcase_id, output));
        futures.push_back(client.sadd(testcase_key(testcase_id), {submission_id}));
        futures.push_back(client.sadd(submissions_key(), {submission_id}));
    });
}

size_t redis_result_store::erase_submission(const string &submission_id) {
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(client.hkeys(submission_key(submission_id)));
    });
    vector<string> testcases = as_strings(replies.at(0));

    conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        for (auto &testcase_id : testcases)
            futures.push_back(client.srem(testcase_key(testcase_id), {submission_id}));
        futures.push_back(client.del({submission_key(submission_id)}));
        futures.push_back(client.srem(submissions_key(), {submission_id}));
    });
    return testcases.size();
}

size_t redis_result_store::erase_test_case(const string &testcase_id) {
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(client.smembers(testcase_key(testcase_id)));
    });
    vector<string> submissions = as_strings(replies.at(0));

    replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        for (auto &submission_id : submissions)
            futures.push_back(client.hdel(submission_key(submission_id), {testcase_id}));
        futures.push_back(client.del({testcase_key(testcase_id)}));
    });

    size_t count = 0;
    // 最后一个结果是 del 的
    for (size_t i = 0; i < submissions.size(); ++i)
        if (replies[i].is_integer()) count += replies[i].as_integer();
    return count;
}

size_t redis_result_store::size() const {
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(client.smembers(submissions_key()));
    });
    vector<string> submissions = as_strings(replies.at(0));
    if (submissions.empty()) return 0;

    replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        for (auto &submission_id : submissions)
            futures.push_back(client.hlen(submission_key(submission_id)));
    });
    size_t count = 0;
    for (auto &reply : replies)
        if (reply.is_integer()) count += reply.as_integer();
    return count;
}

}  // namespace autograder
