#pragma once

#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include "sandbox/container_runtime.hpp"

namespace runner::sandbox {

/**
 * @brief 根据 container_spec 构造 POST /containers/create 的请求体
 * 禁用网络，只读挂载工作目录，限制内存（不允许 swap）与 CPU，容器退出后自动删除
 */
nlohmann::json build_create_body(const container_spec &spec);

/**
 * @brief 通过 UNIX socket 访问 Docker Engine API 的容器运行时
 * 每个请求使用独立的 CURL 句柄，因此可以被多个线程同时使用。
 * 调用前必须已经执行过 curl_global_init
 */
struct docker_client : public container_runtime {
    /**
     * @param socket_path 守护进程的 UNIX socket，比如 /var/run/docker.sock
     * @param api_version API 版本，比如 v1.41，为空时不附加版本前缀
     * @param request_timeout 非阻塞类请求（create、start、kill、inspect、remove、ping）的超时时间
     */
    docker_client(const std::string &socket_path, const std::string &api_version,
                  std::chrono::milliseconds request_timeout = std::chrono::seconds(30));

    /**
     * @brief 使用全局配置 DOCKER_SOCKET 和 DOCKER_API_VERSION 构造
     */
    static docker_client from_config();

    /**
     * @brief 拼接请求的 URL
     * @param path 以 / 开头的 API 路径，比如 /containers/create
     * @return 比如 http://localhost/v1.41/containers/create
     */
    std::string url(const std::string &path) const;

    bool ping() override;
    std::string create_container(const container_spec &spec) override;
    void start_container(const std::string &id) override;
    void attach_output(const std::string &id, const log_sink &sink, const std::atomic<bool> &cancelled,
                       const ready_callback &on_ready) override;
    int wait_container(const std::string &id, const std::atomic<bool> &cancelled,
                       const ready_callback &on_ready) override;
    void kill_container(const std::string &id) override;
    std::optional<int> inspect_exit_code(const std::string &id) override;
    void remove_container(const std::string &id) override;

    /**
     * @brief 一次 HTTP 请求的结果
     */
    struct response {
        long status = 0;
        std::string body;
    };

private:
    /**
     * @brief 长连接请求（attach、wait）的额外参数
     */
    struct stream_options {
        /**
         * @brief 2xx 响应的响应体通过该回调流式交付，此时 response.body 为空
         */
        std::function<void(const char *, std::size_t)> on_data;

        /**
         * @brief 收到完整的响应头时调用
         */
        ready_callback on_headers;

        /**
         * @brief 请求过程中会周期性检查，被置位则中止请求
         */
        const std::atomic<bool> *cancelled = nullptr;
    };

    /**
     * @brief 执行一次 HTTP 请求
     * @param timeout 为 0 时不限制请求时间
     * @param stream 非空时作为长连接请求处理
     * @throw daemon_error CURL 请求失败或者被中止
     */
    response perform(const std::string &method, const std::string &path, const std::string &body,
                     std::chrono::milliseconds timeout, const stream_options *stream = nullptr) const;

    std::string socket_path;
    std::string api_version;
    std::chrono::milliseconds request_timeout;
};

}  // namespace runner::sandbox
