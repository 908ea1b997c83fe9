#include <quicsock/transport/Error.hpp>
#include <fmt/format.h>

#include <ngtcp2/ngtcp2.h>
#include <wolfssl/options.h>
#include <wolfssl/ssl.h>
#include <wolfssl/wolfcrypt/error-crypt.h>

namespace qs {

bool QuicError::ok() const {
    return code == 0;
}

std::string_view QuicError::message() const {
    return ngtcp2_strerror(code);
}

bool TlsError::ok() const {
    return code == WOLFSSL_SUCCESS;
}

std::string_view TlsError::message() const {
    static thread_local char buffer[WOLFSSL_MAX_ERROR_SZ];

    return wolfSSL_ERR_error_string(code, buffer);
}

bool CryptoError::ok() const {
    return code == 0;
}

std::string_view CryptoError::message() const {
    return wc_GetErrorString(code);
}

std::string_view TransportError::CustomKind::message() const {
    switch (code) {
        case CustomCode::TimedOut: return "Operation timed out";
        case CustomCode::IdleTimeout: return "Connection closed after being idle for too long";
        case CustomCode::Closed: return "Operation cannot be performed because the connection is already closed";
        case CustomCode::Cancelled: return "Operation cancelled";
        case CustomCode::CongestionLimited: return "Congestion limited, cannot send data right now";
        case CustomCode::NoBufferSpace: return "No buffer space available";
        case CustomCode::InvalidArgument: return "Invalid argument";
        case CustomCode::StreamBlocked: return "Stream is blocked by flow control";
        case CustomCode::StreamReset: return "Stream was reset";
        case CustomCode::Other: return "Unknown transport error";
    }

    qs::unreachable();
}

std::string TransportError::ConnectionClosed::message() const {
    return fmt::format(
        "{} closed the connection ({} error {:#x}{}{})",
        byPeer ? "peer" : "local endpoint",
        application ? "application" : "transport",
        code,
        reason.empty() ? "" : ": ",
        reason
    );
}

bool TransportError::isClosed() const {
    return std::holds_alternative<ConnectionClosed>(m_kind) || this->isCode(Closed) || this->isCode(IdleTimeout);
}

bool TransportError::isCode(CustomCode code) const {
    return std::holds_alternative<CustomKind>(m_kind) && std::get<CustomKind>(m_kind).code == code;
}

std::string TransportError::message() const {
#define FOR_MSG(t, msg) if (std::holds_alternative<t>(m_kind)) { return fmt::format(msg, std::get<t>(m_kind).message()); } else

    FOR_MSG(qsox::Error, "Socket error: {}")
    FOR_MSG(QuicError, "QUIC error: {}")
    FOR_MSG(TlsError, "TLS error: {}")
    FOR_MSG(ConnectionClosed, "Connection closed: {}")
    FOR_MSG(CustomKind, "{}")
    /* else */ {
        return "Unknown transport error";
    }

#undef FOR_MSG
}

std::string_view HandshakeError::causeString() const {
    switch (cause) {
        case Cause::Timeout: return "timed out";
        case Cause::CertRejected: return "certificate rejected";
        case Cause::VersionMismatch: return "protocol version mismatch";
        case Cause::Cancelled: return "cancelled";
        case Cause::Transport: return "transport failure";
    }

    qs::unreachable();
}

std::string HandshakeError::message() const {
    if (detail.empty()) {
        return fmt::format("Handshake failed: {}", this->causeString());
    }

    return fmt::format("Handshake failed: {} ({})", this->causeString(), detail);
}

}
