#include <quicsock/Session.hpp>
#include <quicsock/Endpoint.hpp>
#include <quicsock/util/assert.hpp>
#include <quicsock/Log.hpp>
#include "quic/QuicConnection.hpp"
#include "quic/EndpointState.hpp"
#include "ChannelCore.hpp"

#include <arc/future/Select.hpp>
#include <fmt/format.h>

using namespace arc;

namespace qs {

std::string_view sessionStateString(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "Connecting";
        case SessionState::Established: return "Established";
        case SessionState::Closing: return "Closing";
        case SessionState::Closed: return "Closed";
    }

    qs::unreachable();
}

std::string CloseReason::message() const {
    using enum Kind;

    std::string_view what;
    switch (kind) {
        case Local: what = "closed locally"; break;
        case PeerClosed: what = "closed by peer"; break;
        case IdleTimeout: what = "idle timeout"; break;
        case TransportFailure: what = "transport failure"; break;
        case Cancelled: what = "cancelled"; break;
        case EndpointClosed: what = "endpoint closed"; break;
    }

    if (detail.empty()) {
        return std::string(what);
    }

    return fmt::format("{} ({})", what, detail);
}

static Future<std::shared_ptr<QuicStream>> recvIncoming(arc::Mutex<mpsc::Receiver<std::shared_ptr<QuicStream>>>& mtx) {
    auto rx = co_await mtx.lock();
    auto res = co_await rx->recv();

    if (res.isOk()) {
        co_return std::move(res).unwrap();
    }

    co_return nullptr;
}

static bool validChannelOptions(const ChannelOptions& options) {
    return options.maxFrameSize > 0
        && options.maxFrameSize <= MAX_FRAME_SIZE_LIMIT
        && options.chunkSize > 0
        && options.chunkSize <= options.maxFrameSize;
}

Session::Session(
    std::shared_ptr<const TlsConfig> tls,
    SessionOptions options,
    mpsc::Sender<std::shared_ptr<QuicStream>> incomingTx,
    mpsc::Receiver<std::shared_ptr<QuicStream>> incomingRx
)
    : m_tls(std::move(tls)),
      m_options(std::move(options)),
      m_incomingTx(std::move(incomingTx)),
      m_incomingRx(std::move(incomingRx)) {}

std::shared_ptr<Session> Session::create(std::shared_ptr<const TlsConfig> tls, SessionOptions options) {
    auto [tx, rx] = mpsc::channel<std::shared_ptr<QuicStream>>(std::max<size_t>(1, options.maxIncomingChannels));

    return std::shared_ptr<Session>(new Session(
        std::move(tls), std::move(options), std::move(tx), std::move(rx)
    ));
}

Session::~Session() {
    this->close("session destroyed");

    if (m_drainTask) {
        m_drainTask->abort();
    }
}

Future<SessionResult<std::shared_ptr<Session>>> Session::connect(
    const qsox::SocketAddress& address,
    std::shared_ptr<const TlsConfig> tls,
    SessionOptions options,
    CancellationToken* cancel
) {
    if (!tls || !tls->isClient()) {
        log::warn("Session::connect requires a client TLS configuration");
        co_return Err(SessionError::InvalidArgument);
    }

    auto session = create(tls, std::move(options));

    log::debug("Connecting to {}", address.toString());

    auto res = co_await QuicConnection::connect(address, std::move(tls), session->m_options, cancel);
    co_return establish(std::move(session), std::move(res));
}

Future<SessionResult<std::shared_ptr<Session>>> Session::accept(Endpoint& endpoint, CancellationToken* cancel) {
    auto state = endpoint.m_state;

    auto incoming = ARC_CO_UNWRAP(co_await state->nextIncoming(cancel));

    auto session = create(state->tlsConfig(), state->options());
    session->m_endpoint = state;

    auto res = co_await QuicConnection::accept(std::move(incoming), state->tlsConfig(), session->m_options, cancel);
    co_return establish(std::move(session), std::move(res));
}

SessionResult<std::shared_ptr<Session>> Session::establish(
    std::shared_ptr<Session> session,
    HandshakeResult<std::shared_ptr<QuicConnection>> result
) {
    if (!result) {
        auto err = std::move(result).unwrapErr();

        CloseReason reason = err.cause == HandshakeError::Cause::Cancelled
            ? CloseReason{CloseReason::Kind::Cancelled, 0, {}}
            : CloseReason{CloseReason::Kind::TransportFailure, 0, err.message()};

        {
            auto state = session->m_state.lock();
            state->state = SessionState::Closed;
            state->reason = std::move(reason);
        }

        session->m_closedToken.cancel();
        return Err(std::move(err));
    }

    session->m_conn = std::move(result).unwrap();

    auto events = session->m_conn->takeEvents();
    QS_ASSERT(events.has_value());

    session->m_state.lock()->state = SessionState::Established;

    session->m_drainTask = arc::spawn(drainEvents(session->weak_from_this(), session->m_conn, std::move(*events)));

    log::info("Session with {} established", session->remoteAddress().toString());

    return Ok(std::move(session));
}

Future<> Session::drainEvents(
    std::weak_ptr<Session> weak,
    std::shared_ptr<QuicConnection> conn,
    mpsc::Receiver<ConnectionEvent> events
) {
    while (true) {
        std::optional<ConnectionEvent> event;
        bool closed = false;

        co_await arc::select(
            arc::selectee(events.recv(), [&](auto res) {
                if (res.isOk()) {
                    event = std::move(res).unwrap();
                } else {
                    closed = true;
                }
            }),

            arc::selectee(conn->waitClosed(), [&] {
                closed = true;
            })
        );

        auto self = weak.lock();
        if (!self) {
            co_return;
        }

        if (closed || event->kind == ConnectionEvent::Kind::Closed) {
            self->finishClose();
            co_return;
        }

        self->onIncomingStream(std::move(event->stream));
    }
}

void Session::onIncomingStream(std::shared_ptr<QuicStream> stream) {
    auto stream2 = stream;

    if (!this->isEstablished()) {
        stream2->reset(APP_SESSION_CLOSED);
        return;
    }

    if (m_incomingTx.trySend(std::move(stream)).isErr()) {
        log::warn("Refusing channel {}, too many channels waiting to be accepted", stream2->id());
        stream2->reset(APP_REFUSED);
        return;
    }

    log::debug("Channel {}: opened by peer", stream2->id());
}

void Session::finishClose() {
    CloseReason reason;

    {
        auto state = m_state.lock();
        if (state->state == SessionState::Closed) {
            return;
        }

        if (state->pendingReason) {
            reason = std::move(*state->pendingReason);
        } else {
            reason = this->closeReasonFrom(m_conn->closeError());
        }

        state->state = SessionState::Closed;
        state->reason = reason;
    }

    this->abortAllChannels(reason.kind == CloseReason::Kind::Local);

    log::info("Session with {} closed: {}", this->remoteAddress().toString(), reason.message());

    this->notifyState(SessionState::Closed);
    m_closedToken.cancel();
}

CloseReason Session::closeReasonFrom(const TransportError& err) const {
    using Kind = CloseReason::Kind;

    if (auto closed = std::get_if<TransportError::ConnectionClosed>(&err.m_kind)) {
        if (closed->byPeer) {
            return CloseReason{Kind::PeerClosed, closed->code, closed->reason};
        } else if (closed->application) {
            return CloseReason{Kind::Local, closed->code, closed->reason};
        } else {
            return CloseReason{Kind::TransportFailure, closed->code, closed->message()};
        }
    }

    if (err.isCode(TransportError::IdleTimeout)) {
        return CloseReason{Kind::IdleTimeout, 0, {}};
    } else if (err.isCode(TransportError::Cancelled)) {
        return CloseReason{Kind::Cancelled, 0, {}};
    }

    if (m_conn->role() == QuicRole::Server && err.isCode(TransportError::Closed)) {
        auto endpoint = m_endpoint.lock();
        if (!endpoint || endpoint->isClosed()) {
            return CloseReason{Kind::EndpointClosed, 0, {}};
        }
    }

    return CloseReason{Kind::TransportFailure, 0, err.message()};
}

void Session::abortAllChannels(bool local) {
    // drained under the lock, aborted outside of it since channels unregister themselves
    auto channels = m_channels.lock()->drain();

    if (!channels.empty()) {
        log::debug("Aborting {} open channel(s)", channels.size());
    }

    for (auto& channel : channels) {
        channel->onSessionClosed(local);
    }
}

void Session::notifyState(SessionState state) {
    log::debug("Session state changed to {}", sessionStateString(state));

    auto dispatch = m_callbackDispatch.lock();

    // the slot is not locked during the call, so the callback can replace itself
    auto callback = *m_stateCallback.lock();
    if (callback && *callback) {
        (*callback)(state);
    }
}

SessionState Session::state() const {
    return m_state.lock()->state;
}

bool Session::isEstablished() const {
    return this->state() == SessionState::Established;
}

std::optional<CloseReason> Session::closeReason() const {
    return m_state.lock()->reason;
}

std::optional<TransportError> Session::transportError() const {
    if (!m_conn || !m_conn->isClosed()) {
        return std::nullopt;
    }

    return m_conn->closeError();
}

qsox::SocketAddress Session::localAddress() const {
    return m_conn->localAddress();
}

qsox::SocketAddress Session::remoteAddress() const {
    return m_conn->remoteAddress();
}

const std::shared_ptr<const TlsConfig>& Session::tlsConfig() const {
    return m_tls;
}

const SessionOptions& Session::options() const {
    return m_options;
}

std::optional<Fingerprint> Session::peerFingerprint() const {
    return m_conn ? m_conn->peerFingerprint() : std::nullopt;
}

Future<SessionResult<TransferChannel>> Session::openChannel(Direction direction, ChannelOptions options) {
    if (!validChannelOptions(options)) {
        co_return Err(SessionError::InvalidChunkSize);
    }

    if (!this->isEstablished()) {
        co_return Err(SessionError::SessionClosed);
    }

    auto res = co_await m_conn->openStream();
    if (!res) {
        if (!this->isEstablished() || m_conn->isClosed()) {
            co_return Err(SessionError::SessionClosed);
        }

        co_return Err(StreamWriteError{std::move(res).unwrapErr()});
    }

    co_return this->registerChannel(std::move(res).unwrap(), direction, std::move(options));
}

Future<SessionResult<TransferChannel>> Session::openChannel(Direction direction, size_t chunkSize) {
    return this->openChannel(direction, ChannelOptions { .chunkSize = chunkSize });
}

Future<SessionResult<TransferChannel>> Session::acceptChannel(
    Direction direction,
    ChannelOptions options,
    CancellationToken* cancel
) {
    if (!validChannelOptions(options)) {
        co_return Err(SessionError::InvalidChunkSize);
    }

    if (!this->isEstablished()) {
        co_return Err(SessionError::SessionClosed);
    }

    CancellationToken never;
    auto cancelToken = cancel ? cancel : &never;

    std::optional<SessionResult<std::shared_ptr<QuicStream>>> out;

    // the receiver lock is taken inside the select, so that callers queued behind another acceptor can still be cancelled
    co_await arc::select(
        arc::selectee(recvIncoming(m_incomingRx), [&](std::shared_ptr<QuicStream> stream) {
            if (stream) {
                out.emplace(Ok(std::move(stream)));
            } else {
                out.emplace(Err(SessionError::NotAcceptingChannels));
            }
        }),

        arc::selectee(m_closedToken.waitCancelled(), [&] {
            out.emplace(Err(SessionError::SessionClosed));
        }),

        arc::selectee(cancelToken->waitCancelled(), [&] {
            out.emplace(Err(ChannelAbortedError{AbortReason::UserCancelled, false}));
        })
    );

    auto stream = ARC_CO_UNWRAP(std::move(*out));
    co_return this->registerChannel(std::move(stream), direction, std::move(options));
}

SessionResult<TransferChannel> Session::registerChannel(
    std::shared_ptr<QuicStream> stream,
    Direction direction,
    ChannelOptions options
) {
    int64_t id = stream->id();
    auto core = std::make_shared<ChannelCore>(this->weak_from_this(), m_conn, stream, direction, std::move(options));

    if (!m_channels.lock()->insert(id, core)) {
        log::error("Channel {}: stream id is already registered", id);
        stream->reset(APP_REFUSED);
        return Err(SessionError::InvalidArgument);
    }

    // close() sets the state before draining the registry, so either it saw this channel or we see the new state
    if (!this->isEstablished()) {
        m_channels.lock()->remove(id);
        stream->reset(APP_SESSION_CLOSED);
        return Err(SessionError::SessionClosed);
    }

    if (direction == Direction::Receive) {
        // only the sender writes, close our half right away
        stream->finish();
    }

    log::debug(
        "Channel {}: registered ({}, chunk size {}, max frame size {})",
        id, direction == Direction::Send ? "send" : "receive", core->options().chunkSize, core->options().maxFrameSize
    );

    return Ok(TransferChannel(std::move(core)));
}

void Session::unregisterChannel(int64_t streamId) {
    m_channels.lock()->remove(streamId);
}

size_t Session::channelCount() const {
    return m_channels.lock()->size();
}

void Session::close(std::string reason) {
    {
        auto state = m_state.lock();
        if (state->state == SessionState::Closing || state->state == SessionState::Closed) {
            return;
        }

        state->state = SessionState::Closing;
        state->pendingReason = CloseReason{CloseReason::Kind::Local, APP_NO_ERROR, reason};
    }

    log::debug("Closing session: {}", reason.empty() ? "no reason given" : reason);

    this->notifyState(SessionState::Closing);
    this->abortAllChannels(true);

    if (m_conn) {
        m_conn->close(APP_NO_ERROR, std::move(reason));
    }
}

Future<> Session::closed() {
    return m_closedToken.waitCancelled();
}

void Session::setStateCallback(StateCallback callback) {
    auto fn = callback ? std::make_shared<StateCallback>(std::move(callback)) : nullptr;
    *m_stateCallback.lock() = std::move(fn);
}

}
