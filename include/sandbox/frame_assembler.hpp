#pragma once

#include <cstddef>
#include <string>
#include "sandbox/container_runtime.hpp"

namespace runner::sandbox {

/**
 * @brief 将 HTTP 响应的原始字节流按帧边界重新切分
 * CURL 每次回调交付的数据块大小是任意的，可能包含半帧或者多帧。
 * 这里根据帧头第 4~7 字节的大端序长度将数据重新组装为完整的帧，
 * 再逐帧交给 sink，保证下游每个数据块恰好对应一帧
 */
struct frame_assembler {
    explicit frame_assembler(log_sink sink);

    /**
     * @brief 追加收到的原始字节，每凑齐一帧就交给 sink
     */
    void feed(const char *data, std::size_t size);

    /**
     * @brief 数据流结束，将残留的不完整数据原样交给 sink，不丢弃数据
     */
    void finish();

    /**
     * @brief 当前缓冲中尚未凑齐一帧的字节数
     */
    std::size_t pending() const;

private:
    log_sink sink;
    std::string buffer;
};

}  // namespace runner::sandbox
