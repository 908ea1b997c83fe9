#pragma once

#include <quicsock/util/Error.hpp>
#include <qsox/Error.hpp>
#include <arc/util/Result.hpp>

#include <string>
#include <variant>

// Errors produced by the QUIC / TLS transport layer

namespace qs {

QSOX_MAKE_OPAQUE_ERROR_STRUCT(QuicError, int);
QSOX_MAKE_OPAQUE_ERROR_STRUCT(TlsError, unsigned long);
QSOX_MAKE_OPAQUE_ERROR_STRUCT(CryptoError, int);

struct TransportError {
    typedef enum {
        TimedOut,
        IdleTimeout,
        Closed,
        Cancelled,
        CongestionLimited,
        NoBufferSpace,
        InvalidArgument,
        StreamBlocked,
        StreamReset,
        Other,
    } CustomCode;

    struct CustomKind {
        CustomCode code;

        std::string_view message() const;

        bool operator==(const CustomKind& other) const = default;
        bool operator!=(const CustomKind& other) const = default;
    };

    /// The connection was terminated with a CONNECTION_CLOSE frame.
    struct ConnectionClosed {
        uint64_t code = 0;
        bool application = false;
        bool byPeer = false;
        std::string reason;

        std::string message() const;

        bool operator==(const ConnectionClosed& other) const = default;
        bool operator!=(const ConnectionClosed& other) const = default;
    };

    TransportError(const qsox::Error& err) : m_kind(err) {}
    TransportError(QuicError err) : m_kind(std::move(err)) {}
    TransportError(TlsError err) : m_kind(std::move(err)) {}
    TransportError(ConnectionClosed err) : m_kind(std::move(err)) {}
    TransportError(CustomCode code) : m_kind(CustomKind{code}) {}

    bool operator==(const TransportError& other) const = default;
    bool operator!=(const TransportError& other) const = default;

    bool isClosed() const;
    bool isCode(CustomCode code) const;

    std::variant<
        qsox::Error,
        QuicError,
        TlsError,
        ConnectionClosed,
        CustomKind
    > m_kind;

    std::string message() const;
};

template <typename T = void>
using TransportResult = geode::Result<T, TransportError>;

template <typename T = void>
using QuicResult = geode::Result<T, QuicError>;

template <typename T = void>
using TlsResult = geode::Result<T, TlsError>;

// Why a handshake did not produce an established connection.
struct HandshakeError {
    enum class Cause {
        Timeout,
        CertRejected,
        VersionMismatch,
        Cancelled,
        /// Socket failure, or the peer refused the connection for a reason that is none of the above
        Transport,
    };

    Cause cause;
    std::string detail;

    HandshakeError(Cause cause, std::string detail = {}) : cause(cause), detail(std::move(detail)) {}

    std::string_view causeString() const;
    std::string message() const;

    bool operator==(const HandshakeError& other) const = default;
    bool operator!=(const HandshakeError& other) const = default;
};

template <typename T = void>
using HandshakeResult = geode::Result<T, HandshakeError>;

}
