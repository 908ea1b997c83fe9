#include "DatagramPath.hpp"
#include <quicsock/Log.hpp>

using namespace arc;

namespace qs {

UdpPath::UdpPath(UdpSocket socket, qsox::SocketAddress local, qsox::SocketAddress remote)
    : m_socket(std::move(socket)), m_local(std::move(local)), m_remote(std::move(remote)) {}

Future<TransportResult<std::unique_ptr<UdpPath>>> UdpPath::connect(const qsox::SocketAddress& remote) {
    auto socket = ARC_CO_UNWRAP(co_await UdpSocket::bindAny(remote.isV6()));
    ARC_CO_UNWRAP(socket.connect(remote));
    auto local = ARC_CO_UNWRAP(socket.localAddress());

    log::debug("QUIC: bound client socket on {}", local.toString());

    co_return Ok(std::unique_ptr<UdpPath>(new UdpPath(std::move(socket), local, remote)));
}

Future<TransportResult<>> UdpPath::send(const uint8_t* data, size_t len) {
    ARC_CO_UNWRAP(co_await m_socket.send(data, len));
    co_return Ok();
}

Future<TransportResult<size_t>> UdpPath::receive(uint8_t* buf, size_t len) {
    size_t bytes = ARC_CO_UNWRAP(co_await m_socket.recv(buf, len));
    co_return Ok(bytes);
}

qsox::SocketAddress UdpPath::localAddress() const {
    return m_local;
}

qsox::SocketAddress UdpPath::remoteAddress() const {
    return m_remote;
}

}
