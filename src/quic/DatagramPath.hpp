#pragma once

#include <quicsock/transport/Error.hpp>
#include <qsox/SocketAddress.hpp>
#include <arc/future/Future.hpp>
#include <arc/net/UdpSocket.hpp>
#include <ngtcp2/ngtcp2.h>

#include <memory>

namespace qs {

/// Where a QUIC connection sends and receives its datagrams.
/// A client owns a connected UDP socket, a server connection shares the endpoint socket.
class DatagramPath {
public:
    virtual ~DatagramPath() = default;

    virtual arc::Future<TransportResult<>> send(const uint8_t* data, size_t len) = 0;
    /// Receives a single datagram, returns its size.
    virtual arc::Future<TransportResult<size_t>> receive(uint8_t* buf, size_t len) = 0;

    virtual qsox::SocketAddress localAddress() const = 0;
    virtual qsox::SocketAddress remoteAddress() const = 0;

    /// Connection id lifecycle, used by the endpoint to route datagrams.
    virtual void onNewConnectionId(const ngtcp2_cid&) {}
    virtual void onRetiredConnectionId(const ngtcp2_cid&) {}

    /// Called once when the connection terminates.
    virtual void shutdown() {}
};

class UdpPath : public DatagramPath {
public:
    static arc::Future<TransportResult<std::unique_ptr<UdpPath>>> connect(const qsox::SocketAddress& remote);

    arc::Future<TransportResult<>> send(const uint8_t* data, size_t len) override;
    arc::Future<TransportResult<size_t>> receive(uint8_t* buf, size_t len) override;

    qsox::SocketAddress localAddress() const override;
    qsox::SocketAddress remoteAddress() const override;

private:
    UdpPath(arc::UdpSocket socket, qsox::SocketAddress local, qsox::SocketAddress remote);

    arc::UdpSocket m_socket;
    qsox::SocketAddress m_local;
    qsox::SocketAddress m_remote;
};

}
