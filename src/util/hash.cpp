#include <quicsock/util/hash.hpp>
#include <quicsock/util/assert.hpp>

#include <wolfssl/options.h>
#include <wolfssl/wolfcrypt/hash.h>

namespace qs {

static const char HEX_DIGITS[] = "0123456789abcdef";

std::string hexEncode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(size * 2);

    for (size_t i = 0; i < size; i++) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0f]);
    }

    return out;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool hexDecode(std::string_view hex, uint8_t* out, size_t size) {
    size_t written = 0;
    int high = -1;

    for (char c : hex) {
        if (c == ':') continue;

        int value = hexValue(c);
        if (value < 0) {
            return false;
        }

        if (high == -1) {
            high = value;
            continue;
        }

        if (written == size) {
            return false; // too long
        }

        out[written++] = (uint8_t)((high << 4) | value);
        high = -1;
    }

    return high == -1 && written == size;
}

Hash<32> sha256Hash(const uint8_t* data, size_t size) {
    Hash<32> hash;

    // only fails on invalid arguments
    int ret = wc_Sha256Hash(data, (word32) size, hash.data);
    QS_ASSERT(ret == 0);

    return hash;
}

Hash<32> sha256Hash(std::span<const uint8_t> data) {
    return sha256Hash(data.data(), data.size());
}

Hash<32> sha256Hash(const std::vector<uint8_t>& data) {
    return sha256Hash(data.data(), data.size());
}

}
