#include "execution/stream_demux.hpp"

namespace runner {
using namespace std;

void route_chunk(string_view chunk, demuxed_output &streams) {
    if (chunk.size() <= FRAME_HEADER_SIZE) {
        streams.output.append(chunk.data(), chunk.size());
        return;
    }
    auto type = static_cast<uint8_t>(chunk[0]);
    string_view payload = chunk.substr(FRAME_HEADER_SIZE);
    if (type == static_cast<uint8_t>(stream_type::STDERR))
        streams.error.append(payload.data(), payload.size());
    else
        streams.output.append(payload.data(), payload.size());
}

demuxed_output demultiplex(const vector<string> &chunks) {
    demuxed_output streams;
    for (auto &chunk : chunks)
        route_chunk(chunk, streams);
    return streams;
}

size_t drain(concurrent_queue<string> &chunks, demuxed_output &streams) {
    size_t count = 0;
    string chunk;
    while (chunks.try_pop(chunk)) {
        route_chunk(chunk, streams);
        ++count;
    }
    return count;
}

}  // namespace runner
