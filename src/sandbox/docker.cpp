#include "sandbox/docker.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/throw_exception.hpp>
#include <cctype>
#include <mutex>
#include <sstream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace autograder::sandbox {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static once_flag curl_initialized;

static size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static string url_encode(const string &value) {
    string result;
    for (unsigned char c : value) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            result += c;
        else
            result += fmt::format("%{:02X}", c);
    }
    return result;
}

static bool is_success(long status) {
    return status >= 200 && status < 300;
}

static string describe(const http_response &response) {
    try {
        json j = json::parse(response.body);
        if (j.count("message")) return fmt::format("{} {}", response.status, j.at("message").get<string>());
    } catch (json::exception &) {
        // 返回的不是 JSON，直接使用原文
    }
    return fmt::format("{} {}", response.status, boost::trim_copy(response.body));
}

docker_engine::docker_engine(const engine_config &config) : config(config) {
    call_once(curl_initialized, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

http_response docker_engine::request(const string &method, const string &path,
                                     const string &body, const string &content_type,
                                     chrono::milliseconds timeout) {
    http_response response;
    CURL *curl = curl_easy_init();
    if (!curl)
        BOOST_THROW_EXCEPTION(engine_unavailable("unable to initialize curl"));
    defer { curl_easy_cleanup(curl); };

    struct curl_slist *headers = nullptr;
    defer { curl_slist_free_all(headers); };

    // 通过 unix socket 访问时主机名没有意义
    string url = fmt::format("http://localhost/{}{}", config.api_version, path);
    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, config.socket.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
    }
    if (!content_type.empty())
        headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (timeout.count() > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeout.count());

    CURLcode res = curl_easy_perform(curl);
    switch (res) {
        case CURLE_OK:
            break;
        case CURLE_OPERATION_TIMEDOUT:
            response.timed_out = true;
            return response;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            BOOST_THROW_EXCEPTION(engine_unavailable(fmt::format("unable to reach docker at {}: {}", config.socket, curl_easy_strerror(res))));
        default:
            BOOST_THROW_EXCEPTION(engine_error(fmt::format("{} {} failed: {}", method, path, curl_easy_strerror(res))));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    DLOG(INFO) << "Docker: " << method << " " << path << " -> " << response.status;
    return response;
}

void docker_engine::ping() {
    http_response response = request("GET", "/_ping", "", "", config.request_timeout);
    if (response.timed_out || response.status != 200)
        BOOST_THROW_EXCEPTION(engine_unavailable(fmt::format("docker at {} is not responding", config.socket)));
}

string docker_engine::parse_build_error(const string &progress) {
    // 进度流的每一行都是一个 JSON 对象，比如 {"stream":"Step 1/4 : FROM ubuntu:22.04\n"}，
    // 出错时为 {"errorDetail":{"message":"..."},"error":"..."}
    istringstream lines(progress);
    string line;
    while (getline(lines, line)) {
        boost::trim(line);
        if (line.empty()) continue;
        try {
            json j = json::parse(line);
            if (j.is_object() && j.count("error"))
                return j.at("error").get<string>();
        } catch (json::exception &) {
            LOG(WARNING) << "Docker: unrecognized build progress " << line;
        }
    }
    return "";
}

void docker_engine::build_image(const fs::path &context, const string &tag) {
    // 构建上下文以 tar 格式上传，压缩包放在上下文文件夹的旁边，避免被打包进自身
    fs::path tarball = context.parent_path() / (context.filename().string() + ".tar");
    defer {
        error_code ec;
        fs::remove(tarball, ec);
    };
    int ret = call_process("tar", "-C", context, "-cf", tarball, ".");
    if (ret != 0)
        BOOST_THROW_EXCEPTION(build_failure(fmt::format("unable to archive build context {}, tar exited with {}", context, ret)));

    string body = read_file_content(tarball);
    string path = fmt::format("/build?t={}&rm=1&forcerm=1", url_encode(tag));
    http_response response = request("POST", path, body, "application/x-tar", config.request_timeout);
    if (response.timed_out)
        BOOST_THROW_EXCEPTION(build_failure("image build of " + tag + " timed out"));
    if (!is_success(response.status))
        BOOST_THROW_EXCEPTION(build_failure(fmt::format("image build of {} failed: {}", tag, describe(response))));

    string error = parse_build_error(response.body);
    if (!error.empty())
        BOOST_THROW_EXCEPTION(build_failure(fmt::format("image build of {} failed: {}", tag, error)));
}

void docker_engine::remove_image(const string &tag) {
    http_response response = request("DELETE", fmt::format("/images/{}?force=1", url_encode(tag)), "", "", config.request_timeout);
    if (response.timed_out || !is_success(response.status))
        BOOST_THROW_EXCEPTION(engine_error(fmt::format("unable to remove image {}: {}", tag, describe(response))));
}

json docker_engine::make_create_body(const container_spec &spec) {
    json host_config = {
        {"Memory", spec.memory_limit},
        {"MemorySwap", spec.memory_limit},  // 与 Memory 相同表示不允许使用 swap
        {"CpuShares", spec.cpu_shares},
        {"CpusetCpus", spec.cpuset},
        {"ReadonlyRootfs", spec.read_only_rootfs},
        {"SecurityOpt", spec.security_opt}};
    if (spec.network_disabled)
        host_config["NetworkMode"] = "none";

    return {
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"Tty", false},
        {"OpenStdin", false},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"NetworkDisabled", spec.network_disabled},
        {"HostConfig", host_config}};
}

string docker_engine::create_container(const container_spec &spec) {
    string path = "/containers/create";
    if (!spec.name.empty()) path += "?name=" + url_encode(spec.name);
    http_response response = request("POST", path, make_create_body(spec).dump(), "application/json", config.request_timeout);
    if (response.timed_out || !is_success(response.status))
        BOOST_THROW_EXCEPTION(engine_error(fmt::format("unable to create container from image {}: {}", spec.image, describe(response))));
    try {
        return json::parse(response.body).at("Id").get<string>();
    } catch (json::exception &e) {
        BOOST_THROW_EXCEPTION(engine_error(fmt::format("malformed create response {}: {}", response.body, e.what())));
    }
}

void docker_engine::start_container(const string &id) {
    http_response response = request("POST", fmt::format("/containers/{}/start", id), "", "", config.request_timeout);
    // 304 表示容器已经启动
    if (response.timed_out || (!is_success(response.status) && response.status != 304))
        BOOST_THROW_EXCEPTION(engine_error(fmt::format("unable to start container {}: {}", id, describe(response))));
}

bool docker_engine::wait_container(const string &id, chrono::milliseconds timeout) {
    http_response response = request("POST", fmt::format("/containers/{}/wait", id), "", "", timeout);
    if (response.timed_out) return false;
    if (!is_success(response.status))
        BOOST_THROW_EXCEPTION(engine_error(fmt::format("unable to wait for container {}: {}", id, describe(response))));
    return true;
}

void docker_engine::kill_container(const string &id) {
    http_response response = request("POST", fmt::format("/containers/{}/kill", id), "", "", config.request_timeout);
    if (response.status == 409) {
        // 容器在超时之后、终止之前恰好自己结束了
        DLOG(INFO) << "Docker: container " << id << " is not running";
        return;
    }
    if (response.timed_out || !is_success(response.status))
        BOOST_THROW_EXCEPTION(engine_error(fmt::format("unable to kill container {}: {}", id, describe(response))));
}

string docker_engine::demultiplex_logs(const string &stream) {
    auto is_frame_header = [&](size_t pos) {
        if (pos + 8 > stream.size()) return false;
        unsigned char type = stream[pos];
        return type <= 2 && stream[pos + 1] == 0 && stream[pos + 2] == 0 && stream[pos + 3] == 0;
    };

    if (stream.empty() || !is_frame_header(0))
        return stream;

    string result;
    size_t pos = 0;
    while (pos < stream.size()) {
        if (!is_frame_header(pos)) {
            LOG(WARNING) << "Docker: malformed log frame at offset " << pos;
            break;
        }
        uint32_t length = ((uint32_t)(unsigned char)stream[pos + 4] << 24) |
                          ((uint32_t)(unsigned char)stream[pos + 5] << 16) |
                          ((uint32_t)(unsigned char)stream[pos + 6] << 8) |
                          ((uint32_t)(unsigned char)stream[pos + 7]);
        pos += 8;
        size_t available = min<size_t>(length, stream.size() - pos);
        result.append(stream, pos, available);
        pos += available;
    }
    return result;
}

string docker_engine::container_logs(const string &id) {
    http_response response = request("GET", fmt::format("/containers/{}/logs?stdout=1&stderr=1", id), "", "", config.request_timeout);
    if (response.timed_out || !is_success(response.status))
        BOOST_THROW_EXCEPTION(engine_error(fmt::format("unable to read logs of container {}: {}", id, describe(response))));
    return demultiplex_logs(response.body);
}

void docker_engine::remove_container(const string &id) {
    http_response response = request("DELETE", fmt::format("/containers/{}?force=1&v=1", id), "", "", config.request_timeout);
    if (response.timed_out || !is_success(response.status))
        BOOST_THROW_EXCEPTION(engine_error(fmt::format("unable to remove container {}: {}", id, describe(response))));
}

}  // namespace autograder::sandbox
