#include <gtest/gtest.h>

#include <quicsock/buffers/CircularByteBuffer.hpp>
#include "TestUtil.hpp"

#include <stdexcept>

using namespace qs;

TEST(CircularByteBuffer, WriteRead) {
    CircularByteBuffer buf;
    EXPECT_TRUE(buf.empty());

    auto data = test::patternBytes(1000);
    buf.write(data);
    EXPECT_EQ(buf.size(), 1000u);

    std::vector<uint8_t> out(1000);
    buf.read(out.data(), out.size());
    EXPECT_EQ(out, data);
    EXPECT_TRUE(buf.empty());
}

TEST(CircularByteBuffer, WrapsAround) {
    CircularByteBuffer buf{16};
    auto data = test::patternBytes(12);

    buf.write(data);
    buf.skip(10);

    // 2 bytes left at offset 10, the next write has to wrap
    auto more = test::patternBytes(12, 7);
    buf.write(more);
    EXPECT_EQ(buf.capacity(), 16u);
    EXPECT_EQ(buf.size(), 14u);

    auto view = buf.peek(14);
    EXPECT_FALSE(view.second.empty());

    auto joined = view.toVector();
    EXPECT_EQ(joined[0], data[10]);
    EXPECT_EQ(joined[1], data[11]);
    EXPECT_TRUE(std::equal(more.begin(), more.end(), joined.begin() + 2));
}

TEST(CircularByteBuffer, GrowKeepsOrder) {
    CircularByteBuffer buf{8};
    auto first = test::patternBytes(6, 1);
    buf.write(first);
    buf.skip(4);

    auto second = test::patternBytes(100, 2);
    buf.write(second);
    EXPECT_GE(buf.capacity(), 102u);

    auto joined = buf.peek(buf.size()).toVector();
    ASSERT_EQ(joined.size(), 102u);
    EXPECT_EQ(joined[0], first[4]);
    EXPECT_EQ(joined[1], first[5]);
    EXPECT_TRUE(std::equal(second.begin(), second.end(), joined.begin() + 2));
}

TEST(CircularByteBuffer, CapacityLimit) {
    CircularByteBuffer buf{4, 32};
    auto data = test::patternBytes(40);

    EXPECT_EQ(buf.writeSome(data), 32u);
    EXPECT_EQ(buf.remainingSpace(), 0u);
    EXPECT_FALSE(buf.reserve(1));
    EXPECT_THROW(buf.write(data.data(), 1), std::length_error);

    buf.skip(8);
    EXPECT_EQ(buf.remainingSpace(), 8u);
    EXPECT_NO_THROW(buf.write(data.data(), 8));
}

TEST(CircularByteBuffer, WriteWindow) {
    CircularByteBuffer buf{16};

    auto window = buf.writeWindow();
    ASSERT_EQ(window.size(), 16u);
    window[0] = 0xab;
    window[1] = 0xcd;
    buf.advanceWrite(2);

    EXPECT_EQ(buf.size(), 2u);
    EXPECT_EQ(buf.writeWindow().size(), 14u);
    EXPECT_THROW(buf.advanceWrite(15), std::out_of_range);

    uint8_t out[2];
    buf.read(out, 2);
    EXPECT_EQ(out[0], 0xab);
    EXPECT_EQ(out[1], 0xcd);
}

TEST(CircularByteBuffer, OutOfRange) {
    CircularByteBuffer buf{16};
    buf.write(test::patternBytes(4));

    EXPECT_THROW(buf.peek(5), std::out_of_range);
    EXPECT_THROW(buf.skip(5), std::out_of_range);
}

TEST(CircularByteBuffer, MoveKeepsContents) {
    CircularByteBuffer src{64, 128};
    auto data = test::patternBytes(40, 3);
    src.write(data);

    CircularByteBuffer moved{std::move(src)};
    EXPECT_EQ(moved.size(), 40u);
    EXPECT_EQ(moved.maxCapacity(), 128u);
    EXPECT_EQ(moved.peek(40).toVector(), data);

    CircularByteBuffer target{8};
    target.write(test::patternBytes(5));
    target = std::move(moved);

    EXPECT_EQ(target.size(), 40u);
    EXPECT_EQ(target.peek(40).toVector(), data);

    std::vector<uint8_t> out(40);
    target.read(out.data(), out.size());
    EXPECT_EQ(out, data);
    EXPECT_TRUE(target.empty());
}
