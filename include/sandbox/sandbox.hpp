#pragma once

#include <boost/thread/latch.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "sandbox/container_runtime.hpp"

/**
 * 这个头文件包含单个容器的生命周期管理
 * launch_sandbox 负责创建并启动容器，返回的 sandbox_handle 在析构时保证
 * 容器已经结束（自然退出、被杀死或者被删除），后台线程全部回收
 */
namespace runner::sandbox {

/**
 * @brief 将运行命令包装为 sh -c 的形式
 * 工作目录以只读方式挂载，因此在执行命令前先把工作目录复制到可写的暂存目录，
 * 再在暂存目录中执行命令。profile 没有暂存目录时直接在工作目录中执行
 * @param command 运行方案中的命令，比如 cd src && javac Main.java && java Main
 */
std::vector<std::string> wrap_command(const std::string &command, const confinement_profile &profile);

struct sandbox_handle;

/**
 * @brief 创建并启动一个容器
 * 顺序与 docker run --rm 相同：创建容器，附加输出流并登记 wait 请求，
 * 守护进程接受这两个请求之后才启动容器，避免自动删除与输出流和退出码竞争
 * @param image 镜像名
 * @param command 运行方案中的命令，会经过 wrap_command 包装
 * @param workspace 宿主机上的工作目录
 * @param profile 资源与隔离限制
 * @param ready_timeout 等待守护进程接受 attach 和 wait 请求的最长时间
 * @throw sandbox_creation_error 创建或启动失败，已创建的容器会被删除
 */
std::unique_ptr<sandbox_handle> launch_sandbox(container_runtime &runtime, const std::string &image,
                                               const std::string &command, const std::filesystem::path &workspace,
                                               const confinement_profile &profile,
                                               std::chrono::milliseconds ready_timeout);

/**
 * @brief 表示一个正在运行（或已经结束）的容器，一个任务独占一个
 * 析构时：容器从未启动则强制删除；仍在运行则杀死；最后回收输出线程和 wait 请求
 */
struct sandbox_handle {
    /**
     * @param output_limit 缓存的输出上限（单位为字节），见 confinement_profile::output_limit
     */
    sandbox_handle(container_runtime &runtime, std::string id, std::int64_t output_limit);

    sandbox_handle(const sandbox_handle &) = delete;
    sandbox_handle &operator=(const sandbox_handle &) = delete;

    ~sandbox_handle();

    const std::string &id() const;

    /**
     * @brief 容器退出时就绪，值为 wait 请求返回的退出码
     * wait 请求失败时 get() 会抛出 daemon_error
     */
    std::shared_future<int> completion() const;

    /**
     * @brief 向容器发送 SIGKILL
     * 容器可能已经退出，因此失败是正常情况：错误只记录日志，不会抛出
     * @return 是否成功发送
     */
    bool try_kill() noexcept;

    /**
     * @brief 查询容器的退出码
     * 容器被自动删除之后无法查询，此时使用 wait 请求返回的退出码
     * @return 两者都拿不到时返回 std::nullopt
     */
    std::optional<int> inspect_exit_code();

    /**
     * @brief 输出线程收到的数据块，每块恰好是一帧
     * 输出流关闭后队列会被关闭
     */
    concurrent_queue<std::string> &output_chunks();

    /**
     * @brief 输出流的错误信息，输出流正常关闭时为空
     * 输出超过上限时为 "Output limit exceeded (N bytes)"
     */
    std::optional<std::string> stream_error() const;

    /**
     * @brief 放弃仍未返回的 attach 和 wait 请求
     * 用于容器被杀死之后守护进程迟迟不返回的情况
     */
    void abandon();

private:
    friend std::unique_ptr<sandbox_handle> launch_sandbox(container_runtime &, const std::string &, const std::string &,
                                                          const std::filesystem::path &, const confinement_profile &,
                                                          std::chrono::milliseconds);

    /**
     * @brief 在后台发起 attach 和 wait 请求，等待守护进程接受
     * @throw sandbox_creation_error 守护进程拒绝请求或者超时
     */
    void attach(std::chrono::milliseconds ready_timeout);

    void start();

    /**
     * @brief 输出线程收到一帧时调用，超过输出上限后丢弃并杀死容器
     */
    void collect(std::string chunk);

    container_runtime &runtime;
    std::string container_id;
    std::atomic<bool> cancelled{false};
    concurrent_queue<std::string> chunks;

    /**
     * @brief 只在输出线程中访问
     */
    std::int64_t output_limit;
    std::int64_t output_bytes = 0;
    bool output_truncated = false;

    /**
     * @brief attach 和 wait 请求各计数一次
     */
    boost::latch ready{2};

    std::thread output_thread;
    std::shared_future<int> exit_status;
    bool started = false;

    mutable std::mutex error_mut;
    std::optional<std::string> output_error;
    std::optional<std::string> wait_error;
};

}  // namespace runner::sandbox
