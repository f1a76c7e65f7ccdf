#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "execution/stream_demux.hpp"

namespace runner {

/**
 * @brief 一次执行的最终结果，调用者总是会拿到一个完整的结果
 */
struct execution_outcome {
    /**
     * @brief 退出码为 0、stderr 为空并且没有发生任何错误（超时、创建失败等）
     */
    bool success = false;

    /**
     * @brief 去掉首尾空白的 stdout
     */
    std::string output;

    /**
     * @brief 去掉首尾空白的 stderr
     * 发生错误时为错误信息，程序以非零值退出且没有任何错误输出时为
     * "Process exited with code <n>"，否则为空时是 std::nullopt
     */
    std::optional<std::string> error;

    /**
     * @brief 程序的退出码，拿不到退出码或者发生错误时为 -1
     */
    int exit_code = -1;
};

/**
 * @brief 汇总容器的输出、退出码和错误信息
 * @param streams 分离后的 stdout 和 stderr
 * @param exit_code 容器的退出码，拿不到时为 std::nullopt（视为 -1）
 * @param supervisory_error 执行过程中发生的错误，比如超时。非空时会覆盖 stderr，
 * 退出码视为 -1，已经收到的 stdout 保留
 */
execution_outcome aggregate(const demuxed_output &streams, std::optional<int> exit_code,
                            const std::optional<std::string> &supervisory_error);

/**
 * @brief 执行之前就失败了（路径非法、语言不支持、镜像不存在等）的结果
 */
execution_outcome failed_outcome(const std::string &message);

/**
 * @brief 将结果转换为 JSON
 * @code{.json}
 * {"success": false, "output": "", "error": "Process exited with code 2", "exitCode": 2}
 * @endcode
 */
nlohmann::json to_json(const execution_outcome &outcome);

}  // namespace runner
