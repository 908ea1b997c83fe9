#include <quicsock/Endpoint.hpp>
#include <quicsock/Session.hpp>
#include "quic/EndpointState.hpp"

using namespace arc;

namespace qs {

Endpoint::Endpoint(std::shared_ptr<EndpointState> state) : m_state(std::move(state)) {}

Endpoint::~Endpoint() {
    this->close();
}

Future<TransportResult<std::shared_ptr<Endpoint>>> Endpoint::bind(
    const qsox::SocketAddress& address,
    std::shared_ptr<const TlsConfig> tls,
    SessionOptions options
) {
    auto state = ARC_CO_UNWRAP(co_await EndpointState::bind(address, std::move(tls), std::move(options)));
    co_return Ok(std::shared_ptr<Endpoint>(new Endpoint(std::move(state))));
}

Future<SessionResult<std::shared_ptr<Session>>> Endpoint::accept(CancellationToken* cancel) {
    return Session::accept(*this, cancel);
}

qsox::SocketAddress Endpoint::localAddress() const {
    return m_state->localAddress();
}

const std::shared_ptr<const TlsConfig>& Endpoint::tlsConfig() const {
    return m_state->tlsConfig();
}

const SessionOptions& Endpoint::options() const {
    return m_state->options();
}

size_t Endpoint::connectionCount() const {
    return m_state->routeCount();
}

void Endpoint::close() {
    m_state->close();
}

bool Endpoint::isClosed() const {
    return m_state->isClosed();
}

}
