#include "Random.hpp"
#include <quicsock/Log.hpp>

#include <wolfssl/options.h>
#include <wolfssl/wolfcrypt/random.h>
#include <arc/util/Random.hpp>

#include <algorithm>
#include <cstring>

namespace qs {

namespace {

// One generator per thread, WC_RNG is not safe to share
class ThreadRng {
public:
    ThreadRng() : m_initCode(wc_InitRng(&m_rng)) {
        if (m_initCode != 0) {
            log::error("wolfCrypt RNG initialization failed (code {})", m_initCode);
        }
    }

    ~ThreadRng() {
        if (m_initCode == 0) {
            wc_FreeRng(&m_rng);
        }
    }

    ThreadRng(const ThreadRng&) = delete;
    ThreadRng& operator=(const ThreadRng&) = delete;

    bool generate(uint8_t* buf, size_t len) {
        if (m_initCode != 0) {
            return false;
        }

        int ret = wc_RNG_GenerateBlock(&m_rng, buf, static_cast<word32>(len));
        if (ret != 0) {
            log::error("wolfCrypt RNG failed to generate {} bytes (code {})", len, ret);
            return false;
        }

        return true;
    }

private:
    WC_RNG m_rng;
    int m_initCode;
};

}

bool secureRandom(uint8_t* dest, size_t len) {
    thread_local ThreadRng rng;
    return rng.generate(dest, len);
}

void fillRandom(uint8_t* dest, size_t len) {
    if (secureRandom(dest, len)) {
        return;
    }

    for (size_t i = 0; i < len; i += sizeof(uint64_t)) {
        uint64_t value = arc::fastRand();
        std::memcpy(dest + i, &value, std::min(sizeof(value), len - i));
    }
}

}
