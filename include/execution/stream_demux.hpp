#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "common/concurrent_queue.hpp"

namespace runner {

/**
 * @brief 多路复用日志流中每一帧的流类型（帧头的第一个字节）
 */
enum class stream_type : std::uint8_t {
    STDIN = 0,
    STDOUT = 1,
    STDERR = 2
};

/**
 * @brief 帧头长度
 * 帧头格式为 [类型, 0, 0, 0, 长度(4 字节大端序)]，之后是长度为该值的数据
 */
constexpr std::size_t FRAME_HEADER_SIZE = 8;

/**
 * @brief 分离后的标准输出和标准错误，只追加不重排
 */
struct demuxed_output {
    std::string output;
    std::string error;
};

/**
 * @brief 将一个数据块路由到 stdout 或 stderr
 * 数据块长度超过 8 字节时，第 8 字节之后的数据根据第一个字节路由：
 * 2 为 stderr，其他值均为 stdout。长度不超过 8 字节的数据块视为残缺帧，
 * 原样追加到 stdout，不丢弃数据。
 * 帧头中的长度字段在这里不做检查，每个数据块都被假定恰好是一帧，块与块之间不保存状态
 */
void route_chunk(std::string_view chunk, demuxed_output &streams);

/**
 * @brief 依次路由所有数据块
 */
demuxed_output demultiplex(const std::vector<std::string> &chunks);

/**
 * @brief 取出队列中当前已有的所有数据块并路由，不等待新的数据块
 * @return 取出的数据块个数
 */
std::size_t drain(concurrent_queue<std::string> &chunks, demuxed_output &streams);

}  // namespace runner
