#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "execution/outcome.hpp"
#include "execution/request.hpp"
#include "sandbox/container_runtime.hpp"

namespace runner {

/**
 * @brief 执行引擎的参数
 */
struct executor_options {
    /**
     * @brief 存放工作目录的文件夹，必须已经存在
     * from_config 使用 TEMP_DIR，需要先经过 prepare_temp_root 确定
     */
    std::filesystem::path temp_dir;

    sandbox::confinement_profile profile;

    /**
     * @brief 镜像名前缀，见 get_image_name
     */
    std::string image_prefix;

    /**
     * @brief 请求允许的最长时间限制，超过时直接返回失败的结果
     */
    std::chrono::milliseconds max_timeout;

    /**
     * @brief 超时竞争结束后，等待日志帧到达的时间
     */
    std::chrono::milliseconds log_grace;

    /**
     * @brief 超时杀死容器后，等待容器退出的最长时间
     */
    std::chrono::milliseconds kill_grace;

    /**
     * @brief 启动容器前等待守护进程接受 attach 和 wait 请求的最长时间
     */
    std::chrono::milliseconds ready_timeout;

    /**
     * @brief 根据全局配置（config.hpp）生成
     */
    static executor_options from_config();
};

/**
 * @brief 执行引擎
 * 每次 execute 都是一个独立的任务：创建工作目录、选择运行方案、启动容器、
 * 收集输出、汇总结果、清理工作目录。任务之间不共享任何可变状态，
 * 因此可以在多个线程中同时调用 execute
 */
struct executor {
    /**
     * @param runtime 容器运行时，生命周期必须长于 executor
     */
    executor(sandbox::container_runtime &runtime, executor_options options);

    /**
     * @brief 执行一次请求
     * 程序失败、超时、镜像不存在等情况都通过返回值报告，不会抛出异常
     */
    execution_outcome execute(const execution_request &request) const;

    /**
     * @brief 执行一次请求
     * @param language 语言名，不区分大小写，不支持的语言直接返回失败的结果
     * @param timeout 时间限制，为空时使用 DEFAULT_TIMEOUT
     */
    execution_outcome execute(const std::string &language, const std::vector<source_file> &files,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

private:
    sandbox::container_runtime &runtime;
    executor_options options;
};

}  // namespace runner
