#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief Docker 守护进程的 UNIX socket 路径
 * @defaultValue /var/run/docker.sock
 */
extern std::string DOCKER_SOCKET;

/**
 * @brief 请求 Docker Engine API 时使用的 API 版本
 * 为空时不在 URL 中附加版本前缀，由守护进程选择默认版本
 */
extern std::string DOCKER_API_VERSION;

/**
 * @brief 每种语言对应的运行镜像名前缀
 * 镜像名为 IMAGE_PREFIX + 语言镜像后缀，比如 runner-python、runner-cpp
 * 镜像需要事先构建好，本程序不负责拉取或构建镜像
 */
extern std::string IMAGE_PREFIX;

/**
 * @brief 容器的内存上限（单位为字节）
 * 同时作为 MemorySwap 的值，避免通过 swap 突破内存限制
 */
extern std::int64_t MEMORY_LIMIT;

/**
 * @brief CFS 调度周期内容器可用的 CPU 时间（单位为微秒）
 * CPU_QUOTA / CPU_PERIOD 即为容器可用的核心数，默认为 0.5 核
 */
extern std::int64_t CPU_QUOTA;

extern std::int64_t CPU_PERIOD;

/**
 * @brief 工作目录在容器内的只读挂载点
 */
extern std::string WORKSPACE_MOUNT;

/**
 * @brief 容器内可写的 tmpfs 暂存目录
 * 由于工作目录以只读方式挂载，编译型语言需要把源代码复制到这里之后再编译运行
 */
extern std::string SCRATCH_MOUNT;

/**
 * @brief 暂存目录 tmpfs 的大小（单位为字节）
 */
extern std::int64_t SCRATCH_SIZE;

/**
 * @brief 请求未指定时的默认时间限制
 */
extern std::chrono::milliseconds DEFAULT_TIMEOUT;

/**
 * @brief 请求允许的最长时间限制
 * 超过这个值的请求直接被拒绝
 */
extern std::chrono::milliseconds MAX_TIMEOUT;

/**
 * @brief 每个任务在宿主机上缓存的输出上限（单位为字节，按帧计算）
 * 超过上限后丢弃之后的输出并杀死容器，避免一个任务的输出耗尽宿主机内存
 */
extern std::int64_t OUTPUT_LIMIT;

/**
 * @brief 容器结束后等待日志帧到达的时间
 * 在超时竞争结束后统一等待一次，然后才检查容器的退出状态
 */
extern std::chrono::milliseconds LOG_GRACE;

/**
 * @brief 超时杀死容器后，等待 wait 请求返回的最长时间
 * 超过这个时间后直接放弃 wait 请求
 */
extern std::chrono::milliseconds KILL_GRACE;

/**
 * @brief 启动容器前，等待守护进程接受 attach 和 wait 请求的最长时间
 */
extern std::chrono::milliseconds READY_TIMEOUT;

/**
 * @brief 存放工作目录的临时文件夹
 * 每个任务都会在这里创建一个唯一的 code-runner-XXXXXX 目录
 * 默认为空，由 main 在启动时通过 prepare_temp_root 确定
 *
 * TEMP_DIR
 * ├── code-runner-a1B2c3 // 一次执行的工作目录
 * │   ├── main.py
 * │   └── src
 * │       └── util.py
 * └── ...
 */
extern std::filesystem::path TEMP_DIR;

}  // namespace runner
