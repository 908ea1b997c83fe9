#pragma once
#include <stdint.h>
#include <stddef.h>

namespace qs {

// Transfer framing: [u32 big-endian length][payload], length 0 terminates the channel
constexpr inline size_t FRAME_HEADER_SIZE = 4;
constexpr inline size_t DEFAULT_CHUNK_SIZE = 64 * 1024;
constexpr inline size_t DEFAULT_MAX_FRAME_SIZE = 1024 * 1024;
constexpr inline size_t MAX_FRAME_SIZE_LIMIT = 16 * 1024 * 1024;

// ALPN in wire format (length prefixed)
constexpr inline const char ALPN_PROTOCOL[] = "\x09quicsock1";
constexpr inline const char ALPN_PROTOCOL_NAME[] = "quicsock1";

constexpr inline uint32_t QUIC_VERSION = 0x00000001; // NGTCP2_PROTO_VER_V1
constexpr inline int QUIC_TLS_TRANSPORT_VERSION = 0x39;

// Fixed TLS policy, not configurable
constexpr inline const char TLS_CIPHER_SUITES[] = "TLS_AES_128_GCM_SHA256:TLS_AES_256_GCM_SHA384:TLS_CHACHA20_POLY1305_SHA256";
constexpr inline const char TLS_CURVES[] = "X25519:P-256:P-384";

constexpr inline size_t CONNECTION_ID_LENGTH = 18;
constexpr inline size_t MAX_UDP_PAYLOAD = 1500;
constexpr inline size_t RECV_DATAGRAM_SIZE = 2048;

// flow control windows
constexpr inline uint64_t STREAM_WINDOW = 4 * 1024 * 1024;
constexpr inline uint64_t CONNECTION_WINDOW = 16 * 1024 * 1024;

constexpr inline size_t ENDPOINT_BACKLOG = 100;
constexpr inline size_t ENDPOINT_ROUTE_QUEUE = 1024;

// Application error codes, sent in RESET_STREAM / STOP_SENDING / CONNECTION_CLOSE
constexpr inline uint64_t APP_NO_ERROR = 0x0;
constexpr inline uint64_t APP_USER_CANCELLED = 0x1;
constexpr inline uint64_t APP_SESSION_CLOSED = 0x2;
constexpr inline uint64_t APP_FRAME_CORRUPTION = 0x3;
constexpr inline uint64_t APP_REFUSED = 0x4;
constexpr inline uint64_t APP_CHANNEL_DROPPED = 0x5;
constexpr inline uint64_t APP_LOCAL_IO_FAILURE = 0x6;

}
