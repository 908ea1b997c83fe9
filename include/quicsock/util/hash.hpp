#pragma once

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <span>

namespace qs {

std::string hexEncode(const uint8_t* data, size_t size);

/// Decodes a hex string into `out`. Accepts upper and lower case digits, and ignores `:` separators
/// (so that fingerprints copied from `openssl x509 -fingerprint` work as is).
/// Returns false if the string is not valid hex or does not decode into exactly `size` bytes.
bool hexDecode(std::string_view hex, uint8_t* out, size_t size);

template <size_t N>
struct Hash {
    uint8_t data[N];

    bool operator==(const Hash& other) const = default;
    bool operator!=(const Hash& other) const = default;
    auto operator<=>(const Hash& other) const = default;

    std::string toString() const {
        return hexEncode(data, N);
    }

    static std::optional<Hash> fromHex(std::string_view hex) {
        Hash out;
        if (!hexDecode(hex, out.data, N)) {
            return std::nullopt;
        }

        return out;
    }
};

Hash<32> sha256Hash(const uint8_t* data, size_t size);
Hash<32> sha256Hash(std::span<const uint8_t> data);
Hash<32> sha256Hash(const std::vector<uint8_t>& data);

/// SHA-256 of a DER encoded certificate.
using Fingerprint = Hash<32>;

}
