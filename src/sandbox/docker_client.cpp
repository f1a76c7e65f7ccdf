#include "sandbox/docker_client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <exception>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "sandbox/frame_assembler.hpp"

namespace runner::sandbox {
using namespace std;
using nlohmann::json;

namespace {

/**
 * @brief CURL 回调共享的传输状态
 */
struct transfer_context {
    CURL *curl;
    string *body;
    const function<void(const char *, size_t)> *on_data;
    const ready_callback *on_headers;
    bool headers_done = false;

    /**
     * @brief 回调中抛出的异常不能穿过 CURL，先保存下来，请求结束后重新抛出
     */
    exception_ptr error;
};

size_t on_write(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto ctx = static_cast<transfer_context *>(userdata);
    size_t length = size * nmemb;
    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    try {
        if (ctx->on_data && *ctx->on_data && status >= 200 && status < 300)
            (*ctx->on_data)(ptr, length);
        else
            ctx->body->append(ptr, length);
    } catch (...) {
        ctx->error = current_exception();
        return 0;
    }
    return length;
}

size_t on_header(char *buffer, size_t size, size_t nitems, void *userdata) {
    auto ctx = static_cast<transfer_context *>(userdata);
    size_t length = size * nitems;
    bool blank_line = (length == 2 && buffer[0] == '\r' && buffer[1] == '\n') || (length == 1 && buffer[0] == '\n');
    if (blank_line && !ctx->headers_done) {
        ctx->headers_done = true;
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        // 错误响应不算就绪，由调用者在请求结束后处理
        if (status < 200 || status >= 300) return length;
        try {
            if (ctx->on_headers && *ctx->on_headers)
                (*ctx->on_headers)();
        } catch (...) {
            ctx->error = current_exception();
            return 0;
        }
    }
    return length;
}

int on_progress(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto cancelled = static_cast<const atomic<bool> *>(clientp);
    return cancelled->load() ? 1 : 0;
}

/**
 * @brief 从守护进程的错误响应中取出错误信息
 * 守护进程的错误响应体形如 {"message": "No such image: runner-python:latest"}
 */
string error_message(const docker_client::response &res) {
    json j = json::parse(res.body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("message") && j["message"].is_string())
        return j["message"].get<string>();
    if (!res.body.empty())
        return res.body;
    return fmt::format("HTTP status {}", res.status);
}

json parse_body(const docker_client::response &res, const string &what) {
    json j = json::parse(res.body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw daemon_error(fmt::format("Malformed response of {}: {}", what, res.body));
    return j;
}

}  // namespace

json build_create_body(const container_spec &spec) {
    auto &profile = spec.profile;
    json host_config = {
        {"Memory", profile.memory_bytes},
        {"MemorySwap", profile.memory_bytes},
        {"CpuQuota", profile.cpu_quota},
        {"CpuPeriod", profile.cpu_period},
        {"NetworkMode", "none"},
        {"Binds", json::array({fmt::format("{}:{}:ro", spec.workspace.string(), profile.workspace_mount)})},
        {"AutoRemove", true}};
    if (!profile.scratch_mount.empty())
        host_config["Tmpfs"] = json::object({{profile.scratch_mount, fmt::format("rw,exec,size={}", profile.scratch_size)}});

    json body = {
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"WorkingDir", profile.workspace_mount},
        {"AttachStdin", false},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"OpenStdin", false},
        {"Tty", false},
        {"NetworkDisabled", true},
        {"HostConfig", host_config}};
    return body;
}

docker_client::docker_client(const string &socket_path, const string &api_version, chrono::milliseconds request_timeout)
    : socket_path(socket_path), api_version(api_version), request_timeout(request_timeout) {}

docker_client docker_client::from_config() {
    return docker_client(DOCKER_SOCKET, DOCKER_API_VERSION);
}

string docker_client::url(const string &path) const {
    if (api_version.empty())
        return "http://localhost" + path;
    return "http://localhost/" + api_version + path;
}

docker_client::response docker_client::perform(const string &method, const string &path, const string &body,
                                               chrono::milliseconds timeout, const stream_options *stream) const {
    CURL *curl = curl_easy_init();
    if (!curl)
        throw daemon_error("Unable to initialize CURL");
    struct curl_slist *headers = nullptr;
    defer {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
    };

    response res;
    transfer_context ctx{curl, &res.body,
                         stream ? &stream->on_data : nullptr,
                         stream ? &stream->on_headers : nullptr};
    string target = url(path);

    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_write);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    if (method == "POST") {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (timeout.count() > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    if (stream && stream->cancelled) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, stream->cancelled);
    }

    VLOG(2) << method << ' ' << target;
    CURLcode code = curl_easy_perform(curl);
    if (ctx.error)
        rethrow_exception(ctx.error);
    if (code != CURLE_OK) {
        if (stream && stream->cancelled && stream->cancelled->load())
            throw daemon_error(fmt::format("{} {} cancelled", method, path));
        throw daemon_error(fmt::format("{} {} failed: {}", method, path, curl_easy_strerror(code)));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);
    VLOG(2) << method << ' ' << target << " -> " << res.status;
    return res;
}

bool docker_client::ping() {
    try {
        response res = perform("GET", "/_ping", "", request_timeout);
        return res.status == 200;
    } catch (daemon_error &ex) {
        LOG(WARNING) << "Docker daemon at " << socket_path << " is unreachable: " << ex.what();
        return false;
    }
}

string docker_client::create_container(const container_spec &spec) {
    string body = build_create_body(spec).dump();
    response res;
    try {
        res = perform("POST", "/containers/create", body, request_timeout);
    } catch (daemon_error &ex) {
        throw sandbox_creation_error(fmt::format("Unable to create container from image {}: {}", spec.image, ex.what()));
    }
    if (res.status != 201)
        throw sandbox_creation_error(fmt::format("Unable to create container from image {}: {}", spec.image, error_message(res)));

    json j = json::parse(res.body, nullptr, false);
    if (j.is_discarded() || !j.contains("Id") || !j["Id"].is_string())
        throw sandbox_creation_error("Malformed container creation response: " + res.body);
    if (j.contains("Warnings") && j["Warnings"].is_array())
        for (auto &warning : j["Warnings"])
            if (warning.is_string())
                LOG(WARNING) << "Docker warning for image " << spec.image << ": " << warning.get<string>();
    return j["Id"].get<string>();
}

void docker_client::start_container(const string &id) {
    response res;
    try {
        res = perform("POST", "/containers/" + id + "/start", "", request_timeout);
    } catch (daemon_error &ex) {
        throw sandbox_creation_error(fmt::format("Unable to start container {}: {}", id, ex.what()));
    }
    // 304 表示容器已经启动
    if (res.status != 204 && res.status != 304)
        throw sandbox_creation_error(fmt::format("Unable to start container {}: {}", id, error_message(res)));
}

void docker_client::attach_output(const string &id, const log_sink &sink, const atomic<bool> &cancelled,
                                  const ready_callback &on_ready) {
    frame_assembler assembler(sink);
    stream_options options;
    options.on_data = [&assembler](const char *data, size_t size) { assembler.feed(data, size); };
    options.on_headers = on_ready;
    options.cancelled = &cancelled;

    response res;
    try {
        res = perform("POST", "/containers/" + id + "/attach?stream=1&stdout=1&stderr=1", "", chrono::milliseconds::zero(), &options);
    } catch (daemon_error &ex) {
        if (!cancelled.load()) throw;
        VLOG(1) << "Detached from container " << id << ": " << ex.what();
        assembler.finish();
        return;
    }
    if (res.status < 200 || res.status >= 300)
        throw daemon_error(fmt::format("Unable to attach to container {}: {}", id, error_message(res)));
    assembler.finish();
}

int docker_client::wait_container(const string &id, const atomic<bool> &cancelled, const ready_callback &on_ready) {
    stream_options options;
    options.on_headers = on_ready;
    options.cancelled = &cancelled;

    response res = perform("POST", "/containers/" + id + "/wait?condition=next-exit", "", chrono::milliseconds::zero(), &options);
    if (res.status != 200)
        throw daemon_error(fmt::format("Unable to wait for container {}: {}", id, error_message(res)));

    json j = parse_body(res, "container wait");
    if (j.contains("Error") && j["Error"].is_object() && j["Error"].contains("Message"))
        LOG(WARNING) << "Container " << id << " exited with error: " << j["Error"]["Message"].dump();
    if (!j.contains("StatusCode") || !j["StatusCode"].is_number_integer())
        throw daemon_error("Container wait response has no status code: " + res.body);
    return j["StatusCode"].get<int>();
}

void docker_client::kill_container(const string &id) {
    response res = perform("POST", "/containers/" + id + "/kill", "", request_timeout);
    if (res.status != 204)
        throw daemon_error(fmt::format("Unable to kill container {}: {}", id, error_message(res)));
}

optional<int> docker_client::inspect_exit_code(const string &id) {
    response res = perform("GET", "/containers/" + id + "/json", "", request_timeout);
    if (res.status == 404)
        return nullopt;
    if (res.status != 200) {
        LOG(WARNING) << "Unable to inspect container " << id << ": " << error_message(res);
        return nullopt;
    }

    json j = parse_body(res, "container inspect");
    if (!j.contains("State") || !j["State"].is_object())
        return nullopt;
    auto &state = j["State"];
    if (state.value("Running", false))
        return nullopt;
    if (!state.contains("ExitCode") || !state["ExitCode"].is_number_integer())
        return nullopt;
    return state["ExitCode"].get<int>();
}

void docker_client::remove_container(const string &id) {
    response res = perform("DELETE", "/containers/" + id + "?force=1", "", request_timeout);
    // 404 表示容器已经不存在，409 表示守护进程正在删除该容器
    if (res.status != 204 && res.status != 404 && res.status != 409)
        throw daemon_error(fmt::format("Unable to remove container {}: {}", id, error_message(res)));
}

}  // namespace runner::sandbox
