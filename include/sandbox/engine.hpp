#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace autograder::sandbox {

/**
 * @brief 创建一个沙箱容器所需的全部参数
 */
struct container_spec {
    /**
     * @brief 容器使用的镜像标签
     */
    std::string image;

    /**
     * @brief 容器名，为空时由容器引擎生成
     */
    std::string name;

    /**
     * @brief 容器的启动命令
     */
    std::vector<std::string> command;

    /**
     * @brief 内存上限，单位为字节
     */
    int64_t memory_limit = 0;

    /**
     * @brief CPU 权重
     */
    int64_t cpu_shares = 0;

    /**
     * @brief 容器允许使用的 CPU 核心，比如 "0" 或者 "0-3"
     */
    std::string cpuset;

    bool network_disabled = true;

    bool read_only_rootfs = true;

    /**
     * @brief 比如 no-new-privileges，禁止容器内的进程提升权限
     */
    std::vector<std::string> security_opt;
};

/**
 * @brief 容器引擎客户端
 * 容器引擎客户端由进程持有一份，并显式地传给评测流程的各个阶段。
 * 实现必须是线程安全的，因为不同提交的评测可能并发地使用同一个客户端。
 *
 * 错误约定：
 * 1. 无法连接到容器引擎时抛出 engine_unavailable；
 * 2. 构建镜像失败时抛出 build_failure；
 * 3. 其他容器引擎返回的错误（镜像不存在、容器不存在等）抛出 engine_error。
 */
struct container_engine {
    virtual ~container_engine();

    /**
     * @brief 检查容器引擎是否可用
     * @throw engine_unavailable 无法连接到容器引擎
     */
    virtual void ping() = 0;

    /**
     * @brief 以 context 文件夹为构建上下文构建镜像
     * @param context 构建上下文，根目录必须包含 Dockerfile
     * @param tag 构建出的镜像的标签
     * @throw build_failure 镜像构建失败
     */
    virtual void build_image(const std::filesystem::path &context, const std::string &tag) = 0;

    /**
     * @brief 删除镜像
     */
    virtual void remove_image(const std::string &tag) = 0;

    /**
     * @brief 创建容器但不启动
     * @return 容器 id
     */
    virtual std::string create_container(const container_spec &spec) = 0;

    virtual void start_container(const std::string &id) = 0;

    /**
     * @brief 等待容器运行结束
     * @param timeout 最多等待的时钟时间
     * @return true 若容器在时间限制内结束，false 若等待超时
     */
    virtual bool wait_container(const std::string &id, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 强制终止容器
     */
    virtual void kill_container(const std::string &id) = 0;

    /**
     * @brief 获取容器的 stdout 和 stderr 合并后的输出
     */
    virtual std::string container_logs(const std::string &id) = 0;

    /**
     * @brief 删除容器，容器仍在运行时强制删除
     */
    virtual void remove_container(const std::string &id) = 0;
};

}  // namespace autograder::sandbox
