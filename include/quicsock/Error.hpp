#pragma once

#include <quicsock/transport/Error.hpp>
#include <quicsock/tls/Error.hpp>

#include <stdint.h>
#include <string>
#include <variant>

namespace qs {

/// Why a channel was aborted. Carried to the peer as the application error code of the stream reset.
enum class AbortReason : uint64_t {
    UserCancelled = 0x1,
    SessionClosed = 0x2,
    FrameCorruption = 0x3,
    /// The peer could not take the channel, its event queue was full
    Refused = 0x4,
    /// The channel was destroyed while still open
    ChannelDropped = 0x5,
    /// Reading or writing the local file failed
    LocalIoFailure = 0x6,
    /// Any code this implementation does not know about
    Unknown = 0xff,
};

uint64_t abortReasonCode(AbortReason reason);
AbortReason abortReasonFromCode(uint64_t code);
std::string_view abortReasonString(AbortReason reason);

struct ChannelAbortedError {
    AbortReason reason;
    /// Whether the abort came from the peer
    bool remote = false;

    std::string message() const;

    bool operator==(const ChannelAbortedError& other) const = default;
    bool operator!=(const ChannelAbortedError& other) const = default;
};

struct StreamReadError {
    TransportError cause;

    std::string message() const;

    bool operator==(const StreamReadError& other) const = default;
    bool operator!=(const StreamReadError& other) const = default;
};

struct StreamWriteError {
    TransportError cause;

    std::string message() const;

    bool operator==(const StreamWriteError& other) const = default;
    bool operator!=(const StreamWriteError& other) const = default;
};

class SessionError {
public:
    typedef enum {
        /// The session is not established, or was closed
        SessionClosed,
        /// `finish` was called twice, or the channel already completed
        ChannelAlreadyClosed,
        /// A frame length header exceeded the maximum frame size
        FrameCorruption,
        /// Chunk size is zero or larger than the maximum frame size
        InvalidChunkSize,
        InvalidArgument,
        /// Operation does not match the direction of the channel
        WrongDirection,
        /// `acceptChannel` was already called by another task, or the event queue is gone
        NotAcceptingChannels,
        EndpointClosed,
    } Code;

    SessionError(Code code) : m_err(code) {}
    SessionError(HandshakeError err) : m_err(std::move(err)) {}
    SessionError(ConfigError err) : m_err(std::move(err)) {}
    SessionError(ChannelAbortedError err) : m_err(std::move(err)) {}
    SessionError(StreamReadError err) : m_err(std::move(err)) {}
    SessionError(StreamWriteError err) : m_err(std::move(err)) {}

    bool isCode() const;
    bool isHandshakeError() const;
    bool isConfigError() const;
    bool isChannelAborted() const;
    bool isStreamReadError() const;
    bool isStreamWriteError() const;

    Code asCode() const;
    const HandshakeError& asHandshakeError() const;
    const ConfigError& asConfigError() const;
    const ChannelAbortedError& asChannelAborted() const;
    const StreamReadError& asStreamReadError() const;
    const StreamWriteError& asStreamWriteError() const;

    /// The transport failure behind a stream read or write error, if any
    const TransportError* transportCause() const;

    bool operator==(const SessionError& other) const = default;
    bool operator!=(const SessionError& other) const = default;
    bool operator==(Code code) const;
    bool operator!=(Code code) const;

    std::string message() const;

private:
    std::variant<
        Code,
        HandshakeError,
        ConfigError,
        ChannelAbortedError,
        StreamReadError,
        StreamWriteError
    > m_err;
};

template <typename T = void>
using SessionResult = geode::Result<T, SessionError>;

}
