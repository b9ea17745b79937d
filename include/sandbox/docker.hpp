#pragma once

#include <nlohmann/json.hpp>
#include "config.hpp"
#include "sandbox/engine.hpp"

namespace autograder::sandbox {

/**
 * @brief 一次 HTTP 请求的结果
 */
struct http_response {
    long status = 0;
    std::string body;

    /**
     * @brief 请求是否因为超过时间限制而被中止
     */
    bool timed_out = false;
};

/**
 * @brief 通过 unix socket 访问 Docker Engine REST API 的容器引擎客户端
 * 每次请求都使用独立的 curl easy handle，因此可以被多个线程同时使用。
 */
struct docker_engine : public container_engine {
    explicit docker_engine(const engine_config &config);

    void ping() override;
    void build_image(const std::filesystem::path &context, const std::string &tag) override;
    void remove_image(const std::string &tag) override;
    std::string create_container(const container_spec &spec) override;
    void start_container(const std::string &id) override;
    bool wait_container(const std::string &id, std::chrono::milliseconds timeout) override;
    void kill_container(const std::string &id) override;
    std::string container_logs(const std::string &id) override;
    void remove_container(const std::string &id) override;

    /**
     * @brief 解析容器日志
     * 没有分配 TTY 的容器的日志是多路复用的：每一帧以 8 字节的帧头开始，
     * 第 0 字节为流类型（0 stdin，1 stdout，2 stderr），第 4~7 字节为大端序的帧长度。
     * 该函数按照帧的顺序拼接 stdout 和 stderr 的内容。
     * 如果数据不是多路复用格式，原样返回。
     */
    static std::string demultiplex_logs(const std::string &stream);

    /**
     * @brief 根据 container_spec 生成 POST /containers/create 的请求体
     */
    static nlohmann::json make_create_body(const container_spec &spec);

    /**
     * @brief 从 POST /build 返回的 JSON 进度流中提取错误信息
     * @return 构建过程中的错误信息，没有错误时返回空字符串
     */
    static std::string parse_build_error(const std::string &progress);

private:
    engine_config config;

    http_response request(const std::string &method, const std::string &path,
                          const std::string &body, const std::string &content_type,
                          std::chrono::milliseconds timeout);
};

}  // namespace autograder::sandbox
