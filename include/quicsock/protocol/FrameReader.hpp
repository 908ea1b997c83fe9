#pragma once

#include "Frame.hpp"
#include <quicsock/buffers/CircularByteBuffer.hpp>

#include <optional>
#include <vector>

namespace qs {

// Reassembles length-prefixed frames from a byte stream.
// The internal buffer is bounded by `FRAME_HEADER_SIZE + maxFrameSize`, a length header larger than
// `maxFrameSize` is reported as corruption before any memory is reserved for its payload.
class FrameReader {
public:
    enum class Status {
        NeedMore,
        Frame,
        Terminal,
        Corrupted,
    };

    explicit FrameReader(size_t maxFrameSize);

    /// Region to receive more stream bytes into. Never empty while `next()` would return NeedMore.
    std::span<uint8_t> writeWindow();
    void advance(size_t len);

    /// Copies bytes in, returns how many were accepted (bounded by the buffer limit).
    size_t feed(std::span<const uint8_t> data);

    /// Tries to extract the next frame. On `Frame`, the payload is stored in `out`.
    Status next(std::vector<uint8_t>& out);

    /// Bytes still missing to complete the frame currently being assembled.
    size_t bytesNeeded() const;
    /// Bytes buffered and not yet returned as a frame.
    size_t buffered() const;

    size_t maxFrameSize() const;
    /// Length field of the last corrupted header, for diagnostics.
    uint32_t rejectedLength() const;

private:
    CircularByteBuffer m_buffer;
    size_t m_maxFrameSize;
    uint32_t m_rejectedLength = 0;

    std::optional<uint32_t> peekLength() const;
};

}
