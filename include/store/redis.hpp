#pragma once

#include <cpp_redis/cpp_redis>
#include <functional>
#include <future>
#include <mutex>
#include <vector>
#include "config.hpp"

namespace autograder {

/**
 * @brief 表示一个 Redis 连接
 */
struct redis_conn {
    explicit redis_conn(const redis_config &config);

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接并重新执行 callback，
     * 如果重试次数过多则抛出 store_error。
     * 多个线程同时调用时，每次 callback 及其提交是互斥的。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并把 future 放进第二个参数
     * @return 按照 future 顺序排列的执行结果
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback);

    /**
     * @brief 尝试重连
     * @param force 真时强制重连
     */
    void reconnect(bool force = false);

private:
    redis_config config;
    cpp_redis::client redis_client;
    std::mutex mut;
};

}  // namespace autograder
