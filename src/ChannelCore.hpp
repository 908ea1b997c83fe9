#pragma once

#include <quicsock/TransferChannel.hpp>
#include <quicsock/protocol/FrameReader.hpp>
#include "quic/QuicStream.hpp"

#include <asp/sync/Mutex.hpp>

#include <atomic>
#include <memory>

namespace qs {

class Session;
class QuicConnection;

// Shared state of a channel. The `TransferChannel` handle owns it, the session keeps it in
// its registry while the channel is open so that closing the session can abort it.
class ChannelCore {
public:
    ChannelCore(
        std::weak_ptr<Session> session,
        std::shared_ptr<QuicConnection> conn,
        std::shared_ptr<QuicStream> stream,
        Direction direction,
        ChannelOptions options
    );

    ChannelCore(const ChannelCore&) = delete;
    ChannelCore& operator=(const ChannelCore&) = delete;

    int64_t id() const;
    Direction direction() const;
    ChannelState state() const;
    std::optional<ChannelAbortedError> abortInfo() const;
    const ChannelOptions& options() const;
    uint64_t bytesTransferred() const;

    arc::Future<SessionResult<size_t>> write(std::span<const uint8_t> data);
    arc::Future<SessionResult<>> finish();
    arc::Future<SessionResult<std::optional<std::vector<uint8_t>>>> read();

    void abort(AbortReason reason);

    /// Called by the session when it closes. `local` is false when the connection failed on its own,
    /// in which case pending operations report the transport error instead of an abort.
    void onSessionClosed(bool local);

private:
    struct Status {
        ChannelState state = ChannelState::Open;
        std::optional<ChannelAbortedError> abort;
        // the channel ended because the connection failed, not through an abort
        bool transportFailure = false;
    };

    std::weak_ptr<Session> m_session;
    std::shared_ptr<QuicConnection> m_conn;
    std::shared_ptr<QuicStream> m_stream;
    Direction m_direction;
    ChannelOptions m_options;

    asp::Mutex<Status> m_status;
    std::atomic<uint64_t> m_bytes{0};
    std::atomic<bool> m_finishing{false};
    std::optional<FrameReader> m_reader;

    SessionResult<> checkOpen(Direction expected) const;
    SessionError failure(const TransportError& err, bool reading);
    /// Moves to a final state, returns false if the channel was already closed.
    bool transition(ChannelState state, std::optional<ChannelAbortedError> abort = std::nullopt, bool transportFailure = false);
    void corrupted(uint32_t length);
};

}
