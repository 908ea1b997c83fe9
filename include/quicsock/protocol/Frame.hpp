#pragma once

#include "constants.hpp"
#include <array>
#include <span>

namespace qs {

/// Encodes a frame length header (big endian).
inline std::array<uint8_t, FRAME_HEADER_SIZE> encodeFrameHeader(uint32_t length) {
    return {
        (uint8_t)(length >> 24),
        (uint8_t)(length >> 16),
        (uint8_t)(length >> 8),
        (uint8_t)(length),
    };
}

inline uint32_t decodeFrameHeader(std::span<const uint8_t, FRAME_HEADER_SIZE> header) {
    return ((uint32_t)header[0] << 24)
        | ((uint32_t)header[1] << 16)
        | ((uint32_t)header[2] << 8)
        | (uint32_t)header[3];
}

inline bool isTerminalFrame(uint32_t length) {
    return length == 0;
}

}
