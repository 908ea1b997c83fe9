#pragma once

#include "Error.hpp"
#include "Options.hpp"
#include "TransferChannel.hpp"
#include "ChannelRegistry.hpp"
#include "util/compat.hpp"
#include <quicsock/tls/TlsConfig.hpp>

#include <qsox/SocketAddress.hpp>
#include <arc/future/Future.hpp>
#include <arc/sync/Mutex.hpp>
#include <arc/sync/mpsc.hpp>
#include <arc/task/CancellationToken.hpp>
#include <asp/sync/Mutex.hpp>

#include <memory>
#include <optional>

namespace qs {

class Endpoint;
class EndpointState;
class QuicConnection;
class QuicStream;
struct ConnectionEvent;

enum class SessionState {
    Connecting,
    Established,
    Closing,
    Closed,
};

std::string_view sessionStateString(SessionState state);

struct CloseReason {
    enum class Kind {
        /// `close()` was called on this side
        Local,
        /// The peer sent CONNECTION_CLOSE
        PeerClosed,
        IdleTimeout,
        /// The connection failed, `detail` describes how
        TransportFailure,
        /// The handshake was cancelled
        Cancelled,
        /// The endpoint this server session belonged to was closed
        EndpointClosed,
    };

    Kind kind;
    /// Application or transport error code from CONNECTION_CLOSE, if there was one
    uint64_t code = 0;
    std::string detail;

    std::string message() const;

    bool operator==(const CloseReason& other) const = default;
    bool operator!=(const CloseReason& other) const = default;
};

// Session is one QUIC connection to a peer, carrying any number of independent transfer channels.
// A background task drains connection events: channels opened by the peer are queued for `acceptChannel`,
// and connection termination moves the session to `Closed` exactly once.
//
// Channels only keep a weak reference to their session and must not outlive it.
class Session : public std::enable_shared_from_this<Session> {
public:
    using StateCallback = move_only_function<void(SessionState)>;

    /// Connects to a server and waits for the handshake to complete.
    static arc::Future<SessionResult<std::shared_ptr<Session>>> connect(
        const qsox::SocketAddress& address,
        std::shared_ptr<const TlsConfig> tls,
        SessionOptions options = {},
        arc::CancellationToken* cancel = nullptr
    );

    /// Waits for the next client of the endpoint and completes its handshake.
    static arc::Future<SessionResult<std::shared_ptr<Session>>> accept(
        Endpoint& endpoint,
        arc::CancellationToken* cancel = nullptr
    );

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    SessionState state() const;
    bool isEstablished() const;
    /// Set once the session is closed
    std::optional<CloseReason> closeReason() const;
    /// Why the underlying connection terminated, if it did
    std::optional<TransportError> transportError() const;

    qsox::SocketAddress localAddress() const;
    qsox::SocketAddress remoteAddress() const;
    const std::shared_ptr<const TlsConfig>& tlsConfig() const;
    const SessionOptions& options() const;
    /// SHA-256 fingerprint of the certificate the peer presented, if it presented one
    std::optional<Fingerprint> peerFingerprint() const;

    /// Opens a new channel on a fresh stream. Waits if the peer's concurrent channel limit is reached.
    arc::Future<SessionResult<TransferChannel>> openChannel(Direction direction, ChannelOptions options = {});
    arc::Future<SessionResult<TransferChannel>> openChannel(Direction direction, size_t chunkSize);

    /// Waits for the peer to open a channel. Only one task may wait at a time, others queue behind it.
    arc::Future<SessionResult<TransferChannel>> acceptChannel(
        Direction direction,
        ChannelOptions options = {},
        arc::CancellationToken* cancel = nullptr
    );

    /// Number of channels that are open right now.
    size_t channelCount() const;

    /// Starts closing the session, every open channel is aborted with `AbortReason::SessionClosed`.
    /// Repeated calls do nothing.
    void close(std::string reason = "");

    /// Waits until the session is closed.
    arc::Future<> closed();

    /// Invoked on every state change, from whichever task caused it. Invocations never overlap.
    /// The callback may replace or clear itself, a callback replaced while running finishes its current call.
    void setStateCallback(StateCallback callback);

private:
    friend class ChannelCore;

    struct StateData {
        SessionState state = SessionState::Connecting;
        std::optional<CloseReason> reason;
        std::optional<CloseReason> pendingReason;
    };

    std::shared_ptr<const TlsConfig> m_tls;
    SessionOptions m_options;
    std::shared_ptr<QuicConnection> m_conn;
    std::weak_ptr<EndpointState> m_endpoint;

    asp::Mutex<StateData> m_state;
    asp::Mutex<std::shared_ptr<StateCallback>> m_stateCallback;
    // held while a callback runs, never together with m_stateCallback
    asp::Mutex<> m_callbackDispatch;
    asp::Mutex<ChannelRegistry<std::shared_ptr<ChannelCore>>> m_channels;
    arc::CancellationToken m_closedToken;

    arc::mpsc::Sender<std::shared_ptr<QuicStream>> m_incomingTx;
    arc::Mutex<arc::mpsc::Receiver<std::shared_ptr<QuicStream>>> m_incomingRx;

    std::optional<arc::TaskHandle<void>> m_drainTask;

    Session(
        std::shared_ptr<const TlsConfig> tls,
        SessionOptions options,
        arc::mpsc::Sender<std::shared_ptr<QuicStream>> incomingTx,
        arc::mpsc::Receiver<std::shared_ptr<QuicStream>> incomingRx
    );

    static std::shared_ptr<Session> create(std::shared_ptr<const TlsConfig> tls, SessionOptions options);

    static SessionResult<std::shared_ptr<Session>> establish(
        std::shared_ptr<Session> session,
        HandshakeResult<std::shared_ptr<QuicConnection>> result
    );

    static arc::Future<> drainEvents(
        std::weak_ptr<Session> weak,
        std::shared_ptr<QuicConnection> conn,
        arc::mpsc::Receiver<ConnectionEvent> events
    );

    void notifyState(SessionState state);
    void onIncomingStream(std::shared_ptr<QuicStream> stream);
    void finishClose();
    CloseReason closeReasonFrom(const TransportError& err) const;
    void abortAllChannels(bool local);

    SessionResult<TransferChannel> registerChannel(
        std::shared_ptr<QuicStream> stream,
        Direction direction,
        ChannelOptions options
    );
    void unregisterChannel(int64_t streamId);
};

}
