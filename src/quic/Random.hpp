#pragma once

#include <concepts>
#include <stddef.h>
#include <stdint.h>

namespace qs {

/// Fills the buffer from the wolfCrypt CSPRNG. Returns false if it is unavailable or fails,
/// the buffer contents are unspecified in that case.
[[nodiscard]] bool secureRandom(uint8_t* dest, size_t len);

/// Fills the buffer with random bytes, falling back to a fast non-cryptographic source
/// if the CSPRNG fails. Only for values that do not need to be unpredictable.
void fillRandom(uint8_t* dest, size_t len);

template <std::integral T>
T fillRandom() {
    T value;
    fillRandom(reinterpret_cast<uint8_t*>(&value), sizeof(T));
    return value;
}

}
