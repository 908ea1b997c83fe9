#include <quicsock/Error.hpp>
#include <fmt/format.h>

namespace qs {

uint64_t abortReasonCode(AbortReason reason) {
    return static_cast<uint64_t>(reason);
}

AbortReason abortReasonFromCode(uint64_t code) {
    switch (code) {
        case 0x1: return AbortReason::UserCancelled;
        case 0x2: return AbortReason::SessionClosed;
        case 0x3: return AbortReason::FrameCorruption;
        case 0x4: return AbortReason::Refused;
        case 0x5: return AbortReason::ChannelDropped;
        case 0x6: return AbortReason::LocalIoFailure;
        default: return AbortReason::Unknown;
    }
}

std::string_view abortReasonString(AbortReason reason) {
    using enum AbortReason;

    switch (reason) {
        case UserCancelled: return "cancelled by user";
        case SessionClosed: return "session closed";
        case FrameCorruption: return "frame corruption";
        case Refused: return "refused by peer";
        case ChannelDropped: return "channel dropped";
        case LocalIoFailure: return "local I/O failure";
        case Unknown: return "unknown reason";
    }

    qs::unreachable();
}

std::string ChannelAbortedError::message() const {
    return fmt::format("Channel aborted {}: {}", remote ? "by peer" : "locally", abortReasonString(reason));
}

std::string StreamReadError::message() const {
    return fmt::format("Stream read failed: {}", cause.message());
}

std::string StreamWriteError::message() const {
    return fmt::format("Stream write failed: {}", cause.message());
}

bool SessionError::isCode() const {
    return std::holds_alternative<Code>(m_err);
}

bool SessionError::isHandshakeError() const {
    return std::holds_alternative<HandshakeError>(m_err);
}

bool SessionError::isConfigError() const {
    return std::holds_alternative<ConfigError>(m_err);
}

bool SessionError::isChannelAborted() const {
    return std::holds_alternative<ChannelAbortedError>(m_err);
}

bool SessionError::isStreamReadError() const {
    return std::holds_alternative<StreamReadError>(m_err);
}

bool SessionError::isStreamWriteError() const {
    return std::holds_alternative<StreamWriteError>(m_err);
}

SessionError::Code SessionError::asCode() const {
    return std::get<Code>(m_err);
}

const HandshakeError& SessionError::asHandshakeError() const {
    return std::get<HandshakeError>(m_err);
}

const ConfigError& SessionError::asConfigError() const {
    return std::get<ConfigError>(m_err);
}

const ChannelAbortedError& SessionError::asChannelAborted() const {
    return std::get<ChannelAbortedError>(m_err);
}

const StreamReadError& SessionError::asStreamReadError() const {
    return std::get<StreamReadError>(m_err);
}

const StreamWriteError& SessionError::asStreamWriteError() const {
    return std::get<StreamWriteError>(m_err);
}

const TransportError* SessionError::transportCause() const {
    if (auto err = std::get_if<StreamReadError>(&m_err)) {
        return &err->cause;
    } else if (auto err = std::get_if<StreamWriteError>(&m_err)) {
        return &err->cause;
    }

    return nullptr;
}

bool SessionError::operator==(Code code) const {
    return this->isCode() && this->asCode() == code;
}

bool SessionError::operator!=(Code code) const {
    return !(*this == code);
}

std::string SessionError::message() const {
    if (this->isHandshakeError()) {
        return this->asHandshakeError().message();
    } else if (this->isConfigError()) {
        return this->asConfigError().message();
    } else if (this->isChannelAborted()) {
        return this->asChannelAborted().message();
    } else if (this->isStreamReadError()) {
        return this->asStreamReadError().message();
    } else if (this->isStreamWriteError()) {
        return this->asStreamWriteError().message();
    }

    switch (this->asCode()) {
        case SessionClosed: return "Session is not established or was closed";
        case ChannelAlreadyClosed: return "Channel is already closed";
        case FrameCorruption: return "Received a frame longer than the maximum frame size";
        case InvalidChunkSize: return "Chunk size must be between 1 and the maximum frame size";
        case InvalidArgument: return "Invalid argument";
        case WrongDirection: return "Operation does not match the channel direction";
        case NotAcceptingChannels: return "Session is not accepting incoming channels";
        case EndpointClosed: return "Endpoint was closed";
    }

    qs::unreachable();
}

}
