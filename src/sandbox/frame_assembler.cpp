#include "sandbox/frame_assembler.hpp"
#include <glog/logging.h>
#include <cstdint>
#include "execution/stream_demux.hpp"

namespace runner::sandbox {
using namespace std;

static size_t payload_length(const string &buffer, size_t offset) {
    size_t length = 0;
    for (size_t i = 4; i < FRAME_HEADER_SIZE; ++i)
        length = (length << 8) | static_cast<uint8_t>(buffer[offset + i]);
    return length;
}

frame_assembler::frame_assembler(log_sink sink) : sink(move(sink)) {}

void frame_assembler::feed(const char *data, size_t size) {
    buffer.append(data, size);
    size_t offset = 0;
    while (buffer.size() - offset >= FRAME_HEADER_SIZE) {
        size_t length = payload_length(buffer, offset);
        size_t frame_size = FRAME_HEADER_SIZE + length;
        if (buffer.size() - offset < frame_size) break;
        // 只有帧头的空帧直接跳过
        if (length > 0)
            sink(buffer.substr(offset, frame_size));
        offset += frame_size;
    }
    buffer.erase(0, offset);
}

void frame_assembler::finish() {
    if (buffer.empty()) return;
    VLOG(1) << "Log stream closed with " << buffer.size() << " bytes of incomplete frame";
    sink(move(buffer));
    buffer.clear();
}

size_t frame_assembler::pending() const {
    return buffer.size();
}

}  // namespace runner::sandbox
