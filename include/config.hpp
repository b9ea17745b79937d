#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace autograder {

/**
 * @brief 编译阶段的配置
 */
struct compiler_config {
    /**
     * @brief 编译器路径，通过 PATH 查找
     */
    std::string path = "g++";

    /**
     * @brief 额外的编译参数，放在 -o 之前
     * 示例：["-O2", "-std=c++17"]
     */
    std::vector<std::string> flags;

    /**
     * @brief 编译的时钟时间限制
     * 用于避免模板/宏无限展开、巨大的编译输出拖垮评测机
     */
    std::chrono::milliseconds time_limit{2000};
};

/**
 * @brief 沙箱容器的资源限制
 */
struct sandbox_config {
    /**
     * @brief 内存上限，单位为 MB
     */
    int64_t memory_limit = 500;

    /**
     * @brief 容器的 CPU 权重
     */
    int64_t cpu_shares = 512;

    /**
     * @brief 容器被钉在哪些 CPU 核心上运行
     */
    std::string cpuset = "0";

    /**
     * @brief 单个测试点的时钟时间限制，超时后容器会被强制终止，已经产生的输出照常比较
     */
    std::chrono::milliseconds time_limit{5000};

    /**
     * @brief 同一个提交最多同时运行多少个容器
     * 1 表示严格按照测试点顺序依次运行，能够限制评测机的峰值负载
     */
    size_t parallelism = 1;

    /**
     * @brief 容器内用于重定向标准输入的 shell
     */
    std::string shell = "bash";
};

/**
 * @brief 容器引擎（docker）的连接配置
 */
struct engine_config {
    std::filesystem::path socket = "/var/run/docker.sock";

    std::string api_version = "v1.41";

    /**
     * @brief 除了等待容器结束以外的请求的超时时间，镜像构建可能会比较慢
     */
    std::chrono::milliseconds request_timeout{60000};
};

/**
 * @brief Redis 连接配置
 */
struct redis_config {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password;

    /**
     * @brief 所有键的前缀，用于在同一个 Redis 实例上隔离多个部署
     */
    std::string prefix = "autograder";

    /**
     * @brief 重连间隔，单位为毫秒
     */
    int retry_interval = 1000;
};

/**
 * @brief 结果缓存的存储方式
 */
struct store_config {
    /**
     * @brief 可以为 memory 或者 redis
     */
    std::string type = "memory";

    redis_config redis;
};

/**
 * @brief 评测系统的全部配置
 * 该结构体在 main 中构造一次，之后显式传给各个阶段，评测流程中没有全局状态。
 *
 * WORK_ROOT
 * ├── context-17 // 提交 17 的工作目录（镜像构建上下文）
 * │   ├── student-program // 编译产生的可执行文件
 * │   ├── compile.out // 编译器的输出
 * │   ├── Dockerfile // 运行时描述文件
 * │   ├── input-file-3.txt // 测试点 3 的输入数据
 * │   └── ...
 * └── .locks // 每个提交的评测锁
 *     └── submission-17.lock
 */
struct grader_config {
    /**
     * @brief 所有提交工作目录的根目录
     */
    std::filesystem::path work_root;

    /**
     * @brief 存放每个提交的锁文件的文件夹，为空时使用 work_root/.locks
     */
    std::filesystem::path lock_root;

    /**
     * @brief 运行时描述文件（Dockerfile）的模板路径
     */
    std::filesystem::path runtime_descriptor = "exec/Dockerfile";

    /**
     * @brief 镜像标签的命名空间，镜像标签为 <image_namespace>/submission-<id>
     */
    std::string image_namespace = "autograder";

    compiler_config compiler;

    sandbox_config sandbox;

    engine_config engine;

    store_config store;

    std::filesystem::path get_lock_root() const;
};

void from_json(const nlohmann::json &j, compiler_config &config);
void from_json(const nlohmann::json &j, sandbox_config &config);
void from_json(const nlohmann::json &j, engine_config &config);
void from_json(const nlohmann::json &j, redis_config &config);
void from_json(const nlohmann::json &j, store_config &config);
void from_json(const nlohmann::json &j, grader_config &config);

/**
 * @brief 读取 JSON 配置文件
 * @throw std::runtime_error 配置文件不存在
 * @throw std::invalid_argument 配置项类型错误
 */
grader_config load_config(const std::filesystem::path &config_path);

}  // namespace autograder
