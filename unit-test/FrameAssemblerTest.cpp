#include "sandbox/frame_assembler.hpp"
#include "gtest/gtest.h"
#include "test/fake_container_runtime.hpp"

using namespace std;
using namespace runner;
using namespace runner::sandbox;
using runner::sandbox::mock::frame;

class FrameAssemblerTest : public ::testing::Test {
protected:
    FrameAssemblerTest() : assembler([this](string chunk) { chunks.push_back(move(chunk)); }) {}

    void feed(const string &data) {
        assembler.feed(data.data(), data.size());
    }

    vector<string> chunks;
    frame_assembler assembler;
};

TEST_F(FrameAssemblerTest, SplitsConcatenatedFrames) {
    string a = frame(stream_type::STDOUT, "first"), b = frame(stream_type::STDERR, "second");
    feed(a + b);
    EXPECT_EQ(chunks, (vector<string>{a, b}));
    EXPECT_EQ(assembler.pending(), 0u);
}

TEST_F(FrameAssemblerTest, JoinsFramesSplitAcrossReads) {
    string a = frame(stream_type::STDOUT, "hello world");
    string b = frame(stream_type::STDERR, "bye");
    string data = a + b;
    for (char c : data)
        feed(string(1, c));
    EXPECT_EQ(chunks, (vector<string>{a, b}));
}

TEST_F(FrameAssemblerTest, HoldsPartialHeader) {
    string a = frame(stream_type::STDOUT, "abc");
    feed(a.substr(0, 5));
    EXPECT_TRUE(chunks.empty());
    EXPECT_EQ(assembler.pending(), 5u);
    feed(a.substr(5));
    EXPECT_EQ(chunks, vector<string>{a});
}

TEST_F(FrameAssemblerTest, SkipsEmptyFrames) {
    string a = frame(stream_type::STDOUT, "");
    string b = frame(stream_type::STDOUT, "x");
    feed(a + b);
    EXPECT_EQ(chunks, vector<string>{b});
}

TEST_F(FrameAssemblerTest, LargeFrame) {
    string payload(70000, 'z');
    string a = frame(stream_type::STDOUT, payload);
    feed(a.substr(0, 16384));
    feed(a.substr(16384, 16384));
    EXPECT_TRUE(chunks.empty());
    feed(a.substr(32768));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].size(), FRAME_HEADER_SIZE + payload.size());
}

TEST_F(FrameAssemblerTest, FinishFlushesTruncatedFrame) {
    string a = frame(stream_type::STDERR, "truncated");
    feed(a.substr(0, 12));
    assembler.finish();
    EXPECT_EQ(chunks, vector<string>{a.substr(0, 12)});
    EXPECT_EQ(assembler.pending(), 0u);
    assembler.finish();
    EXPECT_EQ(chunks.size(), 1u);
}

TEST_F(FrameAssemblerTest, OutputDemultiplexesCleanly) {
    string data = frame(stream_type::STDOUT, "out1 ") + frame(stream_type::STDERR, "err") + frame(stream_type::STDOUT, "out2");
    feed(data.substr(0, 3));
    feed(data.substr(3, 17));
    feed(data.substr(20));
    auto streams = demultiplex(chunks);
    EXPECT_EQ(streams.output, "out1 out2");
    EXPECT_EQ(streams.error, "err");
}
