#pragma once

#include "DatagramPath.hpp"
#include "QuicConnection.hpp"
#include <quicsock/Error.hpp>
#include <quicsock/Options.hpp>
#include <quicsock/tls/TlsConfig.hpp>

#include <arc/sync/Mutex.hpp>
#include <arc/sync/mpsc.hpp>
#include <arc/task/CancellationToken.hpp>
#include <arc/net/UdpSocket.hpp>
#include <asp/sync/Mutex.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace qs {

struct Datagram {
    std::vector<uint8_t> data;
};

// All connection ids belonging to one server connection lead to the same route.
struct EndpointRoute {
    arc::mpsc::Sender<Datagram> tx;
    // guarded by the endpoint route lock
    std::vector<std::string> cids;
};

class EndpointState : public std::enable_shared_from_this<EndpointState> {
public:
    static arc::Future<TransportResult<std::shared_ptr<EndpointState>>> bind(
        const qsox::SocketAddress& address,
        std::shared_ptr<const TlsConfig> tls,
        SessionOptions options
    );

    ~EndpointState();

    EndpointState(const EndpointState&) = delete;
    EndpointState& operator=(const EndpointState&) = delete;

    /// Waits for the next client that sent a valid Initial packet.
    arc::Future<SessionResult<IncomingConnection>> nextIncoming(arc::CancellationToken* cancel);

    const qsox::SocketAddress& localAddress() const;
    const std::shared_ptr<const TlsConfig>& tlsConfig() const;
    const SessionOptions& options() const;

    void close();
    bool isClosed() const;
    arc::Future<> waitClosed();
    size_t routeCount() const;

    arc::Future<TransportResult<>> sendTo(const uint8_t* data, size_t len, const qsox::SocketAddress& dest);

    void addRoute(const std::shared_ptr<EndpointRoute>& route, std::string cid);
    void removeRoute(const std::shared_ptr<EndpointRoute>& route, const std::string& cid);
    void removeAllRoutes(const std::shared_ptr<EndpointRoute>& route);

private:
    EndpointState(
        arc::UdpSocket socket,
        qsox::SocketAddress local,
        std::shared_ptr<const TlsConfig> tls,
        SessionOptions options,
        arc::mpsc::Sender<IncomingConnection> incomingTx,
        arc::mpsc::Receiver<IncomingConnection> incomingRx
    );

    arc::UdpSocket m_socket;
    qsox::SocketAddress m_local;
    std::shared_ptr<const TlsConfig> m_tls;
    SessionOptions m_options;

    asp::Mutex<std::unordered_map<std::string, std::shared_ptr<EndpointRoute>>> m_routes;
    arc::mpsc::Sender<IncomingConnection> m_incomingTx;
    arc::Mutex<arc::mpsc::Receiver<IncomingConnection>> m_incomingRx;

    arc::CancellationToken m_closed;
    std::optional<arc::TaskHandle<void>> m_recvTask;

    arc::Future<> receiveLoop();
    arc::Future<> dispatch(const uint8_t* data, size_t len, const qsox::SocketAddress& src);
    arc::Future<> sendVersionNegotiation(const ngtcp2_version_cid& vc, const qsox::SocketAddress& src);
    std::shared_ptr<EndpointRoute> findRoute(const std::string& cid);
};

// Datagram path of a server connection, sending through the shared endpoint socket.
class EndpointPath : public DatagramPath {
public:
    EndpointPath(
        std::weak_ptr<EndpointState> endpoint,
        std::shared_ptr<EndpointRoute> route,
        arc::mpsc::Receiver<Datagram> rx,
        qsox::SocketAddress local,
        qsox::SocketAddress remote
    );
    ~EndpointPath() override;

    arc::Future<TransportResult<>> send(const uint8_t* data, size_t len) override;
    arc::Future<TransportResult<size_t>> receive(uint8_t* buf, size_t len) override;

    qsox::SocketAddress localAddress() const override;
    qsox::SocketAddress remoteAddress() const override;

    void onNewConnectionId(const ngtcp2_cid& cid) override;
    void onRetiredConnectionId(const ngtcp2_cid& cid) override;
    void shutdown() override;

private:
    std::weak_ptr<EndpointState> m_endpoint;
    std::shared_ptr<EndpointRoute> m_route;
    arc::mpsc::Receiver<Datagram> m_rx;
    qsox::SocketAddress m_local;
    qsox::SocketAddress m_remote;
    std::atomic<bool> m_shutdown{false};
};

std::string cidKey(const uint8_t* data, size_t len);

}
