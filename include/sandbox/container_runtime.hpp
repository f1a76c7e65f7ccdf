#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含容器运行时的抽象接口
 * 执行引擎只通过 container_runtime 操作容器，生产环境使用 docker_client，
 * 测试时可以替换为不需要守护进程的实现
 */
namespace runner::sandbox {

/**
 * @brief 每个容器都必须使用的资源与隔离限制
 */
struct confinement_profile {
    /**
     * @brief 内存上限（单位为字节），swap 上限与之相同
     */
    std::int64_t memory_bytes;

    /**
     * @brief 每个 CFS 周期内可用的 CPU 时间（单位为微秒）
     */
    std::int64_t cpu_quota;

    std::int64_t cpu_period;

    /**
     * @brief 工作目录在容器内的只读挂载点，同时是容器的初始工作目录
     */
    std::string workspace_mount;

    /**
     * @brief 容器内可写 tmpfs 的挂载点，为空时不挂载
     */
    std::string scratch_mount;

    /**
     * @brief 可写 tmpfs 的大小（单位为字节）
     */
    std::int64_t scratch_size;

    /**
     * @brief 宿主机上缓存的输出上限（单位为字节，按帧计算）
     * 超过上限时丢弃之后的输出并杀死容器
     */
    std::int64_t output_limit;

    /**
     * @brief 根据全局配置（config.hpp）生成默认的限制
     */
    static confinement_profile from_config();
};

/**
 * @brief 创建容器所需的全部参数
 * 网络总是被禁用，工作目录总是只读挂载，容器退出后总是自动删除
 */
struct container_spec {
    std::string image;

    /**
     * @brief 容器的启动命令，比如 {"sh", "-c", "python main.py"}
     */
    std::vector<std::string> command;

    /**
     * @brief 宿主机上的工作目录
     */
    std::filesystem::path workspace;

    confinement_profile profile;
};

/**
 * @brief 接收日志数据块，每个数据块恰好是一帧（8 字节帧头加数据）
 */
typedef std::function<void(std::string chunk)> log_sink;

/**
 * @brief 守护进程接受了请求（收到响应头）时调用，最多调用一次
 */
typedef std::function<void()> ready_callback;

/**
 * @brief 容器运行时
 * 所有操作都可能阻塞调用线程，但不会阻塞其他任务。实现必须允许多个线程
 * 同时对不同的容器（以及对同一个容器的 wait、kill 和 attach_output）进行操作
 */
struct container_runtime {
    virtual ~container_runtime() = default;

    /**
     * @brief 检查守护进程是否可用
     */
    virtual bool ping() = 0;

    /**
     * @brief 按照 container_spec 创建容器（不启动）
     * @return 容器 id
     * @throw sandbox_creation_error 镜像不存在、资源限制被拒绝或者守护进程无法访问
     */
    virtual std::string create_container(const container_spec &spec) = 0;

    /**
     * @brief 启动已创建的容器
     * @throw sandbox_creation_error 启动失败
     */
    virtual void start_container(const std::string &id) = 0;

    /**
     * @brief 附加到容器的 stdout/stderr 合并输出流，阻塞直到输出流关闭或者 cancelled 被置位
     * 容器退出或者被杀死之后输出流会自然关闭。必须在容器启动之前调用，
     * 在 on_ready 被调用之后再启动容器，否则容器的早期输出可能丢失
     * @param sink 每收到完整的一帧就调用一次
     * @param on_ready 守护进程接受附加请求后调用
     * @throw daemon_error 无法附加到容器
     */
    virtual void attach_output(const std::string &id, const log_sink &sink, const std::atomic<bool> &cancelled,
                               const ready_callback &on_ready) = 0;

    /**
     * @brief 阻塞等待容器的下一次退出
     * 必须在容器启动之前调用：容器退出后会被自动删除，之后再等待将找不到容器
     * @param on_ready 守护进程登记了等待请求后调用
     * @return 容器的退出码
     * @throw daemon_error 请求失败，或者在容器退出前 cancelled 被置位
     */
    virtual int wait_container(const std::string &id, const std::atomic<bool> &cancelled,
                               const ready_callback &on_ready) = 0;

    /**
     * @brief 向容器发送 SIGKILL
     * @throw daemon_error 容器已经退出、已被删除，或者守护进程无法访问
     */
    virtual void kill_container(const std::string &id) = 0;

    /**
     * @brief 查询已退出容器的退出码
     * @return 容器仍在运行、已被自动删除或者状态无法读取时返回 std::nullopt
     */
    virtual std::optional<int> inspect_exit_code(const std::string &id) = 0;

    /**
     * @brief 强制删除容器
     * 自动删除只对运行过的容器生效，创建成功但启动失败的容器需要手动删除
     * @throw daemon_error 删除失败（容器不存在不视为失败）
     */
    virtual void remove_container(const std::string &id) = 0;
};

}  // namespace runner::sandbox
