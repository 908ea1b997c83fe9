#include "EndpointState.hpp"
#include <quicsock/protocol/constants.hpp>
#include <quicsock/Log.hpp>

#include <arc/future/Select.hpp>
#include <arc/util/Random.hpp>
#include <ngtcp2/ngtcp2.h>

#include <algorithm>
#include <cstring>

using namespace arc;

namespace qs {

std::string cidKey(const uint8_t* data, size_t len) {
    return std::string(reinterpret_cast<const char*>(data), len);
}

EndpointState::EndpointState(
    UdpSocket socket,
    qsox::SocketAddress local,
    std::shared_ptr<const TlsConfig> tls,
    SessionOptions options,
    mpsc::Sender<IncomingConnection> incomingTx,
    mpsc::Receiver<IncomingConnection> incomingRx
)
    : m_socket(std::move(socket)),
      m_local(std::move(local)),
      m_tls(std::move(tls)),
      m_options(std::move(options)),
      m_incomingTx(std::move(incomingTx)),
      m_incomingRx(std::move(incomingRx)) {}

EndpointState::~EndpointState() {
    this->close();
}

Future<TransportResult<std::shared_ptr<EndpointState>>> EndpointState::bind(
    const qsox::SocketAddress& address,
    std::shared_ptr<const TlsConfig> tls,
    SessionOptions options
) {
    if (!tls || !tls->isServer()) {
        log::warn("QUIC: an endpoint needs a server TLS configuration");
        co_return Err(TransportError::InvalidArgument);
    }

    auto socket = ARC_CO_UNWRAP(co_await UdpSocket::bind(address));
    auto local = ARC_CO_UNWRAP(socket.localAddress());

    auto [tx, rx] = mpsc::channel<IncomingConnection>(ENDPOINT_BACKLOG);

    auto state = std::shared_ptr<EndpointState>(new EndpointState(
        std::move(socket), local, std::move(tls), std::move(options), std::move(tx), std::move(rx)
    ));

    state->m_recvTask = arc::spawn([](std::shared_ptr<EndpointState> ptr) -> Future<> {
        co_await arc::select(
            arc::selectee(ptr->m_closed.waitCancelled()),
            arc::selectee(ptr->receiveLoop())
        );

        log::debug("QUIC: endpoint on {} stopped receiving", ptr->m_local.toString());
    }(state));

    log::info("QUIC: endpoint listening on {}", local.toString());

    co_return Ok(std::move(state));
}

// Waits for the receiver lock and then for a connection. Dropping this future gives up either wait.
static Future<std::optional<IncomingConnection>> recvIncoming(arc::Mutex<mpsc::Receiver<IncomingConnection>>& mtx) {
    auto rx = co_await mtx.lock();
    auto res = co_await rx->recv();

    if (res.isOk()) {
        co_return std::move(res).unwrap();
    }

    co_return std::nullopt;
}

Future<SessionResult<IncomingConnection>> EndpointState::nextIncoming(CancellationToken* cancel) {
    if (this->isClosed()) {
        co_return Err(SessionError::EndpointClosed);
    }

    CancellationToken never;
    auto cancelToken = cancel ? cancel : &never;

    std::optional<SessionResult<IncomingConnection>> out;

    // queued acceptors must still see cancellation and closure
    co_await arc::select(
        arc::selectee(recvIncoming(m_incomingRx), [&](std::optional<IncomingConnection> conn) {
            if (conn) {
                out.emplace(Ok(std::move(*conn)));
            } else {
                out.emplace(Err(SessionError::EndpointClosed));
            }
        }),

        arc::selectee(m_closed.waitCancelled(), [&] {
            out.emplace(Err(SessionError::EndpointClosed));
        }),

        arc::selectee(cancelToken->waitCancelled(), [&] {
            out.emplace(Err(HandshakeError(HandshakeError::Cause::Cancelled, "accept cancelled")));
        })
    );

    co_return std::move(*out);
}

const qsox::SocketAddress& EndpointState::localAddress() const {
    return m_local;
}

const std::shared_ptr<const TlsConfig>& EndpointState::tlsConfig() const {
    return m_tls;
}

const SessionOptions& EndpointState::options() const {
    return m_options;
}

void EndpointState::close() {
    if (m_closed.isCancelled()) {
        return;
    }

    log::debug("QUIC: closing endpoint on {}", m_local.toString());
    m_closed.cancel();

    // connections still hold their routes, but nothing will be delivered anymore
    m_routes.lock()->clear();
}

bool EndpointState::isClosed() const {
    return m_closed.isCancelled();
}

Future<> EndpointState::waitClosed() {
    return m_closed.waitCancelled();
}

size_t EndpointState::routeCount() const {
    auto routes = m_routes.lock();

    std::vector<EndpointRoute*> unique;
    for (auto& [_, route] : *routes) {
        if (std::find(unique.begin(), unique.end(), route.get()) == unique.end()) {
            unique.push_back(route.get());
        }
    }

    return unique.size();
}

Future<TransportResult<>> EndpointState::sendTo(const uint8_t* data, size_t len, const qsox::SocketAddress& dest) {
    if (this->isClosed()) {
        co_return Err(TransportError::Closed);
    }

    ARC_CO_UNWRAP(co_await m_socket.sendTo(data, len, dest));
    co_return Ok();
}

void EndpointState::addRoute(const std::shared_ptr<EndpointRoute>& route, std::string cid) {
    if (this->isClosed()) return;

    auto routes = m_routes.lock();
    route->cids.push_back(cid);
    routes->insert_or_assign(std::move(cid), route);
}

void EndpointState::removeRoute(const std::shared_ptr<EndpointRoute>& route, const std::string& cid) {
    auto routes = m_routes.lock();

    auto it = routes->find(cid);
    if (it != routes->end() && it->second == route) {
        routes->erase(it);
    }

    std::erase(route->cids, cid);
}

void EndpointState::removeAllRoutes(const std::shared_ptr<EndpointRoute>& route) {
    auto routes = m_routes.lock();

    for (auto& cid : route->cids) {
        auto it = routes->find(cid);
        if (it != routes->end() && it->second == route) {
            routes->erase(it);
        }
    }

    route->cids.clear();
}

std::shared_ptr<EndpointRoute> EndpointState::findRoute(const std::string& cid) {
    auto routes = m_routes.lock();

    auto it = routes->find(cid);
    return it == routes->end() ? nullptr : it->second;
}

Future<> EndpointState::receiveLoop() {
    uint8_t buf[RECV_DATAGRAM_SIZE];

    while (!this->isClosed()) {
        qsox::SocketAddress src = qsox::SocketAddress::any();

        auto res = co_await m_socket.recvFrom(buf, sizeof(buf), src);
        if (!res) {
            log::warn("QUIC: endpoint failed to receive datagram: {}", res.unwrapErr().message());
            continue;
        }

        co_await this->dispatch(buf, res.unwrap(), src);
    }
}

Future<> EndpointState::dispatch(const uint8_t* data, size_t len, const qsox::SocketAddress& src) {
    ngtcp2_version_cid vc;
    int rv = ngtcp2_pkt_decode_version_cid(&vc, data, len, CONNECTION_ID_LENGTH);

    if (rv == NGTCP2_ERR_VERSION_NEGOTIATION) {
        co_await this->sendVersionNegotiation(vc, src);
        co_return;
    } else if (rv != 0) {
        log::debug("QUIC: dropping undecodable datagram from {} ({} bytes)", src.toString(), len);
        co_return;
    }

    auto key = cidKey(vc.dcid, vc.dcidlen);

    if (auto route = this->findRoute(key)) {
        if (route->tx.trySend(Datagram{std::vector<uint8_t>(data, data + len)}).isErr()) {
            log::debug("QUIC: connection queue full, dropping datagram from {}", src.toString());
        }

        co_return;
    }

    // unknown connection id, only a client Initial may start a new connection
    ngtcp2_pkt_hd hd;
    rv = ngtcp2_accept(&hd, data, len);
    if (rv != 0) {
        log::debug("QUIC: dropping datagram for unknown connection from {}", src.toString());
        co_return;
    }

    auto [tx, rx] = mpsc::channel<Datagram>(ENDPOINT_ROUTE_QUEUE);
    auto route = std::make_shared<EndpointRoute>(EndpointRoute{std::move(tx), {}});

    // the initial packet goes first, retransmits will find the route by the same id
    (void) route->tx.trySend(Datagram{std::vector<uint8_t>(data, data + len)});
    this->addRoute(route, key);

    auto path = std::make_unique<EndpointPath>(
        this->weak_from_this(), route, std::move(rx), m_local, src
    );

    IncomingConnection incoming {
        .dcid = hd.dcid,
        .scid = hd.scid,
        .version = hd.version,
        .path = std::move(path),
    };

    if (m_incomingTx.trySend(std::move(incoming)).isErr()) {
        // the path, if it was not consumed, unregisters the route when destroyed
        log::warn("QUIC: accept backlog full, dropping connection from {}", src.toString());
        this->removeAllRoutes(route);
        co_return;
    }

    log::debug("QUIC: new incoming connection from {}", src.toString());
}

Future<> EndpointState::sendVersionNegotiation(const ngtcp2_version_cid& vc, const qsox::SocketAddress& src) {
    uint8_t buf[MAX_UDP_PAYLOAD];
    uint32_t versions[] = { QUIC_VERSION };

    auto written = ngtcp2_pkt_write_version_negotiation(
        buf, sizeof(buf),
        static_cast<uint8_t>(arc::fastRand()),
        vc.scid, vc.scidlen,
        vc.dcid, vc.dcidlen,
        versions, 1
    );

    if (written < 0) {
        log::warn("QUIC: failed to write version negotiation: {}", QuicError(written).message());
        co_return;
    }

    log::debug("QUIC: sending version negotiation to {} (client version {:#x})", src.toString(), vc.version);

    auto res = co_await this->sendTo(buf, written, src);
    if (!res) {
        log::warn("QUIC: failed to send version negotiation: {}", res.unwrapErr().message());
    }
}

// EndpointPath

EndpointPath::EndpointPath(
    std::weak_ptr<EndpointState> endpoint,
    std::shared_ptr<EndpointRoute> route,
    mpsc::Receiver<Datagram> rx,
    qsox::SocketAddress local,
    qsox::SocketAddress remote
)
    : m_endpoint(std::move(endpoint)),
      m_route(std::move(route)),
      m_rx(std::move(rx)),
      m_local(std::move(local)),
      m_remote(std::move(remote)) {}

EndpointPath::~EndpointPath() {
    this->shutdown();
}

Future<TransportResult<>> EndpointPath::send(const uint8_t* data, size_t len) {
    auto endpoint = m_endpoint.lock();
    if (!endpoint || m_shutdown) {
        co_return Err(TransportError::Closed);
    }

    co_return co_await endpoint->sendTo(data, len, m_remote);
}

Future<TransportResult<size_t>> EndpointPath::receive(uint8_t* buf, size_t len) {
    auto endpoint = m_endpoint.lock();
    if (!endpoint || m_shutdown || endpoint->isClosed()) {
        co_return Err(TransportError::Closed);
    }

    std::optional<TransportResult<size_t>> out;

    co_await arc::select(
        arc::selectee(m_rx.recv(), [&](auto res) {
            if (!res) {
                out.emplace(Err(TransportError::Closed));
                return;
            }

            auto dgram = std::move(res).unwrap();
            size_t size = std::min(len, dgram.data.size());
            std::memcpy(buf, dgram.data.data(), size);
            out.emplace(Ok(size));
        }),

        arc::selectee(endpoint->waitClosed(), [&] {
            out.emplace(Err(TransportError::Closed));
        })
    );

    co_return std::move(*out);
}

qsox::SocketAddress EndpointPath::localAddress() const {
    return m_local;
}

qsox::SocketAddress EndpointPath::remoteAddress() const {
    return m_remote;
}

void EndpointPath::onNewConnectionId(const ngtcp2_cid& cid) {
    if (auto endpoint = m_endpoint.lock()) {
        endpoint->addRoute(m_route, cidKey(cid.data, cid.datalen));
    }
}

void EndpointPath::onRetiredConnectionId(const ngtcp2_cid& cid) {
    if (auto endpoint = m_endpoint.lock()) {
        endpoint->removeRoute(m_route, cidKey(cid.data, cid.datalen));
    }
}

void EndpointPath::shutdown() {
    if (m_shutdown.exchange(true)) {
        return;
    }

    if (auto endpoint = m_endpoint.lock()) {
        endpoint->removeAllRoutes(m_route);
    }
}

}
