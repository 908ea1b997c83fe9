#include <quicsock/protocol/FrameReader.hpp>
#include <quicsock/util/assert.hpp>
#include <quicsock/Log.hpp>

#include <algorithm>

static constexpr size_t INITIAL_READER_CAPACITY = 16384;

namespace qs {

FrameReader::FrameReader(size_t maxFrameSize)
    : m_buffer(std::min(INITIAL_READER_CAPACITY, FRAME_HEADER_SIZE + maxFrameSize), FRAME_HEADER_SIZE + maxFrameSize),
      m_maxFrameSize(maxFrameSize) {}

std::optional<uint32_t> FrameReader::peekLength() const {
    if (m_buffer.size() < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }

    std::array<uint8_t, FRAME_HEADER_SIZE> header;
    m_buffer.peek(header.data(), header.size());
    return decodeFrameHeader(header);
}

size_t FrameReader::bytesNeeded() const {
    auto length = this->peekLength();
    if (!length) {
        return FRAME_HEADER_SIZE - m_buffer.size();
    }

    // a corrupt header needs nothing more, next() reports it
    if (*length > m_maxFrameSize) {
        return 0;
    }

    size_t total = FRAME_HEADER_SIZE + *length;
    return total > m_buffer.size() ? total - m_buffer.size() : 0;
}

size_t FrameReader::buffered() const {
    return m_buffer.size();
}

size_t FrameReader::maxFrameSize() const {
    return m_maxFrameSize;
}

uint32_t FrameReader::rejectedLength() const {
    return m_rejectedLength;
}

std::span<uint8_t> FrameReader::writeWindow() {
    size_t needed = this->bytesNeeded();
    size_t free = m_buffer.capacity() - m_buffer.size();

    if (free < needed) {
        // cannot fail, needed is bounded by the header plus the maximum frame size
        bool ok = m_buffer.reserve(needed - free);
        QS_ASSERT(ok);
    }

    return m_buffer.writeWindow();
}

void FrameReader::advance(size_t len) {
    m_buffer.advanceWrite(len);
}

size_t FrameReader::feed(std::span<const uint8_t> data) {
    return m_buffer.writeSome(data);
}

FrameReader::Status FrameReader::next(std::vector<uint8_t>& out) {
    auto length = this->peekLength();
    if (!length) {
        return Status::NeedMore;
    }

    if (*length > m_maxFrameSize) {
        log::warn("Rejecting frame with length {} (maximum is {})", *length, m_maxFrameSize);
        m_rejectedLength = *length;
        return Status::Corrupted;
    }

    if (isTerminalFrame(*length)) {
        m_buffer.skip(FRAME_HEADER_SIZE);
        return Status::Terminal;
    }

    if (m_buffer.size() < FRAME_HEADER_SIZE + *length) {
        return Status::NeedMore;
    }

    m_buffer.skip(FRAME_HEADER_SIZE);
    out = m_buffer.peek(*length).toVector();
    m_buffer.skip(*length);

    return Status::Frame;
}

}
