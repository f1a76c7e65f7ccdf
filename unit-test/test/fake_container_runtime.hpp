#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "execution/stream_demux.hpp"
#include "sandbox/container_runtime.hpp"

/**
 * 测试用的容器运行时，不需要 Docker 守护进程
 * 用法：
 * 1. fake_container_runtime runtime;
 * 2. 修改 runtime.script 描述容器的行为（退出码、输出、是否卡死等）
 * 3. 把 runtime 交给 launch_sandbox 或者 executor
 * 4. 通过 calls() 检查调用顺序
 */
namespace runner::sandbox::mock {

/**
 * @brief 描述 fake 容器的行为，对之后创建的所有容器生效
 */
struct container_script {
    /**
     * @brief 程序自然结束时的退出码
     */
    int exit_code = 0;

    /**
     * @brief 容器启动后依次输出的数据块
     */
    std::vector<std::string> frames;

    /**
     * @brief 程序运行的时间，启动后经过这段时间容器退出
     */
    std::chrono::milliseconds run_time{0};

    /**
     * @brief 为 true 时程序永远不会自己结束，只能被杀死
     */
    bool hang = false;

    bool fail_create = false;
    bool fail_start = false;
    bool fail_attach = false;
    bool fail_wait = false;
    bool fail_kill = false;

    /**
     * @brief 为 true 时 kill 请求被接受，但容器不会退出
     */
    bool ignore_kill = false;

    /**
     * @brief 为 true 时模拟容器退出后立即被自动删除，inspect 查询不到
     */
    bool vanish = false;
};

/**
 * @brief 构造一帧多路复用数据
 */
std::string frame(stream_type type, const std::string &payload);

struct fake_container_runtime : public container_runtime {
    container_script script;
    bool alive = true;

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
     * @brief 按顺序记录的调用，比如 "create"、"start"、"kill"
     */
    std::vector<std::string> calls() const;

    std::size_t count(const std::string &call) const;

    /**
     * @brief 所有 create_container 收到的参数
     */
    std::vector<container_spec> specs() const;

    /**
     * @brief 仍未被删除的容器个数
     */
    std::size_t live_containers() const;

private:
    struct container {
        bool started = false;
        bool killed = false;
        bool exited = false;
        int exit_code = -1;
        std::chrono::steady_clock::time_point started_at;
    };

    void record(const std::string &call);

    /**
     * @brief 根据 script 更新容器状态，需要持有 mut
     * @return 容器是否已经退出
     */
    bool poll_exit(container &c) const;

    /**
     * @brief 阻塞直到容器退出
     * @return 容器退出时为 true，被 cancelled 中止时为 false
     */
    bool wait_exit(const std::string &id, const std::atomic<bool> &cancelled);

    mutable std::mutex mut;
    std::condition_variable cond;
    std::map<std::string, container> containers;
    std::vector<std::string> call_log;
    std::vector<container_spec> spec_log;
    int next_id = 0;
};

}  // namespace runner::sandbox::mock
