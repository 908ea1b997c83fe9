#pragma once

#include "Error.hpp"
#include "Options.hpp"
#include <quicsock/tls/TlsConfig.hpp>

#include <qsox/SocketAddress.hpp>
#include <arc/future/Future.hpp>
#include <arc/task/CancellationToken.hpp>

#include <memory>

namespace qs {

class Session;
class EndpointState;

// A UDP socket accepting QUIC connections from any number of clients.
// Datagrams are routed to server sessions by their destination connection id.
class Endpoint {
public:
    /// Binds the socket and starts receiving. `tls` must be a server configuration.
    static arc::Future<TransportResult<std::shared_ptr<Endpoint>>> bind(
        const qsox::SocketAddress& address,
        std::shared_ptr<const TlsConfig> tls,
        SessionOptions options = {}
    );

    /// Closes the endpoint, see `close()`.
    ~Endpoint();

    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;

    /// Same as `Session::accept(*this, cancel)`.
    arc::Future<SessionResult<std::shared_ptr<Session>>> accept(arc::CancellationToken* cancel = nullptr);

    /// The bound address, with the port filled in if port 0 was requested.
    qsox::SocketAddress localAddress() const;
    const std::shared_ptr<const TlsConfig>& tlsConfig() const;
    const SessionOptions& options() const;

    /// Amount of connections currently receiving through this endpoint
    size_t connectionCount() const;

    /// Stops receiving. Pending accepts fail with `EndpointClosed`, and every session of this endpoint
    /// sees its connection fail. Repeated calls do nothing.
    void close();
    bool isClosed() const;

private:
    friend class Session;

    explicit Endpoint(std::shared_ptr<EndpointState> state);

    std::shared_ptr<EndpointState> m_state;
};

}
