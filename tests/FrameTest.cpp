#include <gtest/gtest.h>

#include <quicsock/protocol/FrameReader.hpp>
#include "TestUtil.hpp"

using namespace qs;

namespace {

std::vector<uint8_t> frame(std::span<const uint8_t> payload) {
    auto header = encodeFrameHeader(static_cast<uint32_t>(payload.size()));

    std::vector<uint8_t> out(header.begin(), header.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

}

TEST(FrameHeader, BigEndian) {
    auto header = encodeFrameHeader(0x01020304);
    EXPECT_EQ(header[0], 0x01);
    EXPECT_EQ(header[1], 0x02);
    EXPECT_EQ(header[2], 0x03);
    EXPECT_EQ(header[3], 0x04);

    EXPECT_EQ(decodeFrameHeader(header), 0x01020304u);
    EXPECT_EQ(decodeFrameHeader(encodeFrameHeader(0)), 0u);
    EXPECT_TRUE(isTerminalFrame(0));
    EXPECT_FALSE(isTerminalFrame(1));
}

TEST(FrameReader, SingleFrame) {
    FrameReader reader{1024};
    auto payload = test::patternBytes(100);

    auto data = frame(payload);
    EXPECT_EQ(reader.feed(data), data.size());

    std::vector<uint8_t> out;
    ASSERT_EQ(reader.next(out), FrameReader::Status::Frame);
    EXPECT_EQ(out, payload);
    EXPECT_EQ(reader.next(out), FrameReader::Status::NeedMore);
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(FrameReader, ByteByByte) {
    FrameReader reader{1024};
    auto payload = test::patternBytes(37);
    auto data = frame(payload);

    std::vector<uint8_t> out;

    for (size_t i = 0; i < data.size(); i++) {
        EXPECT_EQ(reader.next(out), FrameReader::Status::NeedMore) << "at byte " << i;
        EXPECT_EQ(reader.feed(std::span{&data[i], 1}), 1u);
    }

    ASSERT_EQ(reader.next(out), FrameReader::Status::Frame);
    EXPECT_EQ(out, payload);
}

TEST(FrameReader, BytesNeeded) {
    FrameReader reader{1024};
    EXPECT_EQ(reader.bytesNeeded(), FRAME_HEADER_SIZE);

    auto header = encodeFrameHeader(10);
    reader.feed(std::span{header.data(), 2});
    EXPECT_EQ(reader.bytesNeeded(), 2u);

    reader.feed(std::span{header.data() + 2, 2});
    EXPECT_EQ(reader.bytesNeeded(), 10u);
}

TEST(FrameReader, MultipleFramesThenTerminal) {
    FrameReader reader{64};

    auto a = test::patternBytes(64, 1);
    auto b = test::patternBytes(1, 2);

    std::vector<uint8_t> data = frame(a);
    auto fb = frame(b);
    data.insert(data.end(), fb.begin(), fb.end());
    auto terminal = encodeFrameHeader(0);
    data.insert(data.end(), terminal.begin(), terminal.end());

    // the reader buffer is bounded, so feed in pieces and drain in between
    std::vector<std::vector<uint8_t>> frames;
    size_t offset = 0;
    bool done = false;

    while (!done) {
        offset += reader.feed(std::span{data}.subspan(offset));

        std::vector<uint8_t> out;
        auto status = reader.next(out);
        switch (status) {
            case FrameReader::Status::Frame: frames.push_back(std::move(out)); break;
            case FrameReader::Status::Terminal: done = true; break;
            case FrameReader::Status::NeedMore: ASSERT_LT(offset, data.size()); break;
            case FrameReader::Status::Corrupted: FAIL() << "unexpected corruption";
        }
    }

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0], a);
    EXPECT_EQ(frames[1], b);
}

TEST(FrameReader, OversizedHeaderIsCorruption) {
    FrameReader reader{1024};

    auto header = encodeFrameHeader(1025);
    reader.feed(header);

    std::vector<uint8_t> out;
    EXPECT_EQ(reader.next(out), FrameReader::Status::Corrupted);
    EXPECT_EQ(reader.rejectedLength(), 1025u);
    EXPECT_EQ(reader.bytesNeeded(), 0u);
}

TEST(FrameReader, MaximumLengthAccepted) {
    FrameReader reader{16};
    auto payload = test::patternBytes(16);
    auto data = frame(payload);

    EXPECT_EQ(reader.feed(data), data.size());

    std::vector<uint8_t> out;
    ASSERT_EQ(reader.next(out), FrameReader::Status::Frame);
    EXPECT_EQ(out, payload);
}

TEST(FrameReader, WriteWindowGrowsForFrame) {
    FrameReader reader{100000};

    auto payload = test::patternBytes(50000);
    auto data = frame(payload);
    size_t offset = 0;

    std::vector<uint8_t> out;
    while (reader.next(out) == FrameReader::Status::NeedMore) {
        auto window = reader.writeWindow();
        ASSERT_FALSE(window.empty());

        size_t n = std::min(window.size(), data.size() - offset);
        std::copy_n(data.begin() + offset, n, window.begin());
        reader.advance(n);
        offset += n;
    }

    EXPECT_EQ(offset, data.size());
    EXPECT_EQ(out, payload);
}
