#include "config.hpp"
#include <fstream>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace autograder {
using namespace std;
using namespace nlohmann;

filesystem::path grader_config::get_lock_root() const {
    return lock_root.empty() ? work_root / ".locks" : lock_root;
}

void from_json(const json &j, compiler_config &config) {
    config.path = get_value_def(j, config.path, "path");
    config.flags = get_value_def(j, config.flags, "flags");
    config.time_limit = chrono::milliseconds(get_value_def<int64_t>(j, config.time_limit.count(), "timeLimit"));
}

void from_json(const json &j, sandbox_config &config) {
    config.memory_limit = get_value_def(j, config.memory_limit, "memoryLimit");
    config.cpu_shares = get_value_def(j, config.cpu_shares, "cpuShares");
    config.cpuset = get_value_def(j, config.cpuset, "cpuset");
    config.time_limit = chrono::milliseconds(get_value_def<int64_t>(j, config.time_limit.count(), "timeLimit"));
    config.parallelism = get_value_def(j, config.parallelism, "parallelism");
    config.shell = get_value_def(j, config.shell, "shell");
    if (config.parallelism == 0)
        throw invalid_argument("sandbox.parallelism must be positive");
    if (config.memory_limit <= 0)
        throw invalid_argument("sandbox.memoryLimit must be positive");
}

void from_json(const json &j, engine_config &config) {
    config.socket = get_value_def(j, config.socket.string(), "socket");
    config.api_version = get_value_def(j, config.api_version, "apiVersion");
    config.request_timeout = chrono::milliseconds(get_value_def<int64_t>(j, config.request_timeout.count(), "requestTimeout"));
}

void from_json(const json &j, redis_config &config) {
    j.at("host").get_to(config.host);
    j.at("port").get_to(config.port);
    config.password = get_value_def(j, config.password, "password");
    config.prefix = get_value_def(j, config.prefix, "prefix");
    config.retry_interval = get_value_def(j, config.retry_interval, "retryInterval");
}

void from_json(const json &j, store_config &config) {
    config.type = get_value_def(j, config.type, "type");
    if (config.type == "redis")
        j.at("redis").get_to(config.redis);
    else if (config.type != "memory")
        throw invalid_argument("unrecognized store type " + config.type);
}

void from_json(const json &j, grader_config &config) {
    config.work_root = j.at("workRoot").get<string>();
    config.lock_root = get_value_def(j, config.lock_root.string(), "lockRoot");
    config.runtime_descriptor = get_value_def(j, config.runtime_descriptor.string(), "runtimeDescriptor");
    config.image_namespace = assert_safe_id(get_value_def(j, config.image_namespace, "imageNamespace"));
    if (j.count("compiler")) j.at("compiler").get_to(config.compiler);
    if (j.count("sandbox")) j.at("sandbox").get_to(config.sandbox);
    if (j.count("engine")) j.at("engine").get_to(config.engine);
    if (j.count("store")) j.at("store").get_to(config.store);
}

grader_config load_config(const filesystem::path &config_path) {
    if (!filesystem::exists(config_path))
        throw runtime_error("Unable to find configuration file " + config_path.string());
    ifstream fin(config_path);
    json config;
    fin >> config;
    return config.get<grader_config>();
}

}  // namespace autograder
