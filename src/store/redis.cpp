#include "store/redis.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"

namespace autograder {
using namespace std;

static bool connect_to_server(cpp_redis::client &redis_client, const redis_config &config) {
    LOG(INFO) << "Redis: Setup connection with server " << config.host << ":" << config.port;
    redis_client.connect(config.host, config.port,
                         [](const string &host, size_t port, cpp_redis::connect_state status) {
                             if (status == cpp_redis::connect_state::dropped)
                                 LOG(INFO) << "Redis: client disconnected from " << host << ":" << port;
                         });
    if (!config.password.empty()) {
        auto future = redis_client.auth(config.password);
        redis_client.sync_commit();
        cpp_redis::reply reply = future.get();
        if (reply.is_error())
            LOG(ERROR) << "Redis: Auth failed: " << reply.error();
    }
    if (redis_client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << config.host << ":" << config.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << config.host << ":" << config.port;
        return false;
    }
}

redis_conn::redis_conn(const redis_config &config) : config(config) {}

void redis_conn::reconnect(bool force) {
    int fail = 0;
    if (force) {
        try {
            connect_to_server(redis_client, config);
        } catch (cpp_redis::redis_error &e) {
            LOG(ERROR) << "Redis: " << e.what();
        }
    }
    for (; !redis_client.is_connected() && fail < 5; ++fail) {
        LOG(INFO) << "Redis: Lost connection, trying to reconnect";
        if (fail > 0)
            this_thread::sleep_for(chrono::milliseconds(config.retry_interval));
        try {
            connect_to_server(redis_client, config);
        } catch (cpp_redis::redis_error &e) {
            LOG(ERROR) << "Redis: " << e.what();
        }
    }
    if (!redis_client.is_connected())
        BOOST_THROW_EXCEPTION(store_error("unable to connect to redis server"));
}

vector<cpp_redis::reply> redis_conn::execute(function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> callback) {
    lock_guard<mutex> guard(mut);
    // cpp_redis 的 is_connected 在服务器断开后不一定立刻变化，操作返回错误时强制重连
    reconnect(false);
    string message;
    for (int fail = 0; fail < 5; ++fail) {
        bool reconn = false;
        vector<future<cpp_redis::reply>> futures;
        vector<cpp_redis::reply> replies;
        callback(redis_client, futures);
        redis_client.sync_commit();
        for (auto &f : futures) {  // 阻塞到所有操作完成为止
            cpp_redis::reply r = f.get();
            if (r.is_error()) reconn = true, message = r.error();
            replies.push_back(r);
        }
        if (!reconn) return replies;
        reconnect(true);
    }
    BOOST_THROW_EXCEPTION(store_error("redis: unable to finish execution: " + message));
}

}  // namespace autograder
