#pragma once

#include "DatagramPath.hpp"
#include "QuicStream.hpp"
#include "../tls/TlsSession.hpp"
#include <quicsock/Options.hpp>

#include <arc/task/CancellationToken.hpp>
#include <arc/sync/Notify.hpp>
#include <arc/sync/mpsc.hpp>
#include <asp/sync/Mutex.hpp>
#include <asp/time/Instant.hpp>
#include <ngtcp2/ngtcp2.h>
#include <ngtcp2/ngtcp2_crypto.h>

#include <unordered_map>
#include <vector>

namespace qs {

inline ngtcp2_tstamp timestamp() {
    return asp::time::Instant::now().rawNanos();
}

enum class QuicRole {
    Client,
    Server,
};

struct ConnectionEvent {
    enum class Kind {
        /// The peer opened a new stream
        StreamOpened,
        /// The connection terminated, `QuicConnection::closeError()` tells why
        Closed,
    };

    Kind kind;
    std::shared_ptr<QuicStream> stream;
};

/// A client Initial packet the endpoint accepted, waiting for `QuicConnection::accept`.
struct IncomingConnection {
    ngtcp2_cid dcid;
    ngtcp2_cid scid;
    uint32_t version;
    std::unique_ptr<DatagramPath> path;
};

class QuicConnection {
public:
    ~QuicConnection();

    QuicConnection(const QuicConnection&) = delete;
    QuicConnection& operator=(const QuicConnection&) = delete;
    QuicConnection(QuicConnection&&) noexcept = delete;
    QuicConnection& operator=(QuicConnection&&) noexcept = delete;

    static arc::Future<HandshakeResult<std::shared_ptr<QuicConnection>>> connect(
        const qsox::SocketAddress& address,
        std::shared_ptr<const TlsConfig> tls,
        const SessionOptions& options,
        arc::CancellationToken* cancel
    );

    static arc::Future<HandshakeResult<std::shared_ptr<QuicConnection>>> accept(
        IncomingConnection incoming,
        std::shared_ptr<const TlsConfig> tls,
        const SessionOptions& options,
        arc::CancellationToken* cancel
    );

    QuicRole role() const;

    /// Takes the event receiver, can only be done once.
    std::optional<arc::mpsc::Receiver<ConnectionEvent>> takeEvents();

    /// Opens a new bidirectional stream, waiting while the peer's stream limit is reached.
    arc::Future<TransportResult<std::shared_ptr<QuicStream>>> openStream();
    std::shared_ptr<QuicStream> getStream(int64_t streamId);
    bool isLocalStream(int64_t streamId) const;

    /// Asks the worker to send CONNECTION_CLOSE with an application error code and terminate.
    void close(uint64_t code, std::string reason);
    bool isClosed() const;
    arc::Future<> waitClosed();
    /// Why the connection terminated. Only meaningful once `isClosed()` is true.
    TransportError closeError() const;

    qsox::SocketAddress localAddress() const;
    qsox::SocketAddress remoteAddress() const;
    std::optional<Fingerprint> peerFingerprint() const;

    void notifyWorker();
    void extendReceiveWindow(int64_t streamId, size_t len);
    void shutdownStream(int64_t streamId, uint64_t code);

    ngtcp2_conn* rawHandle() const;
    ngtcp2_crypto_conn_ref* connRef() const;

private:
    friend class QuicStream;

    QuicConnection(
        QuicRole role,
        std::unique_ptr<DatagramPath> path,
        const SessionOptions& options,
        arc::mpsc::Sender<ConnectionEvent> eventTx,
        arc::mpsc::Receiver<ConnectionEvent> eventRx
    );

    static std::shared_ptr<QuicConnection> create(
        QuicRole role,
        std::unique_ptr<DatagramPath> path,
        const SessionOptions& options
    );

    struct CloseRequest {
        uint64_t code;
        std::string reason;
    };

    QuicRole m_role;
    asp::Mutex<> m_connLock;
    ngtcp2_conn* m_conn = nullptr;
    ngtcp2_crypto_conn_ref m_connRef;
    std::unique_ptr<DatagramPath> m_path;
    std::unique_ptr<TlsSession> m_tls;
    float m_lossSimulation = 0.f;
    size_t m_maxIncomingStreams;

    // guarded by m_connLock, same as the ngtcp2 connection
    std::unordered_map<int64_t, std::shared_ptr<QuicStream>> m_streams;
    std::vector<int64_t> m_refusedStreams;

    arc::mpsc::Sender<ConnectionEvent> m_eventTx;
    std::optional<arc::mpsc::Receiver<ConnectionEvent>> m_eventRx;

    std::optional<arc::TaskHandle<void>> m_workerTask;
    std::atomic<bool> m_handshakeDone{false};
    std::atomic<bool> m_terminated{false};
    asp::Mutex<std::optional<CloseRequest>> m_closeRequest;
    asp::Mutex<std::optional<TransportError>> m_closeError;
    arc::CancellationToken m_closed;
    arc::Notify m_workerNotify;
    arc::Notify m_handshakeNotify;
    arc::Notify m_streamSlotNotify;

    std::atomic<size_t> m_totalBytesSent{0};
    std::atomic<size_t> m_totalBytesReceived{0};

    static ngtcp2_callbacks makeCallbacks(QuicRole role);
    static ngtcp2_settings makeSettings(const SessionOptions& options);
    static ngtcp2_transport_params makeTransportParams(const SessionOptions& options);
    static arc::Future<HandshakeResult<std::shared_ptr<QuicConnection>>> finishHandshake(
        std::shared_ptr<QuicConnection> conn,
        const SessionOptions& options,
        arc::CancellationToken* cancel
    );

    static void startWorker(const std::shared_ptr<QuicConnection>& conn);
    arc::Future<> waitHandshake();
    HandshakeError handshakeErrorFrom(const TransportError& err) const;

    arc::Future<> workerLoop();
    arc::Future<TransportResult<>> workerHandleWrites();
    arc::Future<TransportResult<bool>> sendStreamData(QuicStream& stream);
    arc::Future<TransportResult<>> sendNonStreamPackets();
    arc::Future<TransportResult<>> sendClosePacket(const CloseRequest& req);
    arc::Future<TransportResult<>> sendConnectionError(const ngtcp2_ccerr& ccerr);
    arc::Future<TransportResult<>> sendPacket(const uint8_t* buf, size_t size);
    arc::Future<TransportResult<>> receivePacket();
    TransportResult<> handleExpiry();
    asp::time::Instant expiryInstant();
    void processRefusedStreams();

    /// Records the error, wakes every waiter and releases the path. Only the first call has any effect.
    void terminate(TransportError err);
    TransportError::ConnectionClosed peerCloseReason();

    bool shouldLosePacket() const;

    // ngtcp2 callbacks, invoked with m_connLock held
    void onReceivedData(int64_t streamId, const uint8_t* data, size_t len, bool fin);
    void onAckedData(int64_t streamId, uint64_t offset, uint64_t len);
    void onStreamOpen(int64_t streamId);
    void onStreamClose(int64_t streamId, uint64_t appErrorCode);
    void onStreamReset(int64_t streamId, uint64_t appErrorCode);
    void onStreamStopSending(int64_t streamId, uint64_t appErrorCode);

    auto withLockedConn(auto&& func) {
        auto guard = m_connLock.lock();
        return func();
    }
};

}
