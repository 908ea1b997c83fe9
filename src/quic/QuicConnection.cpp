#include "QuicConnection.hpp"
#include "Random.hpp"
#include <quicsock/protocol/constants.hpp>
#include <quicsock/util/assert.hpp>
#include <quicsock/util/rng.hpp>
#include <quicsock/Log.hpp>

#include <ngtcp2/ngtcp2.h>
#include <ngtcp2/ngtcp2_crypto.h>
#include <wolfssl/options.h>
#include <wolfssl/ssl.h>
#include <wolfssl/wolfcrypt/logging.h>
#include <arc/time/Timeout.hpp>
#include <arc/future/Select.hpp>
#include <asp/time/Instant.hpp>

#include <algorithm>
#include <cstdarg>
#include <cstdio>

using namespace asp::time;
using namespace arc;

static void logQuic(const char* format, va_list args) {
    va_list argsCopy;
    va_copy(argsCopy, args);

    int len = std::vsnprintf(nullptr, 0, format, argsCopy);
    va_end(argsCopy);

    std::string buffer(len, '\0');
    std::vsnprintf(buffer.data(), buffer.size() + 1, format, args);

    qs::log::debug("(ngtcp2) {}", buffer);
}

static void logPrintfCallback(void*, const char* format, ...) {
#ifdef QUICSOCK_DEBUG
    va_list args;
    va_start(args, format);

    logQuic(format, args);

    va_end(args);
#endif
}

static void initPathStorage(
    ngtcp2_path_storage& storage,
    const qsox::SocketAddress& local,
    const qsox::SocketAddress& remote
) {
    ngtcp2_path_storage_zero(&storage);

    if (local.isV4()) {
        local.toV4().toSockAddr(storage.local_addrbuf.in);
    } else {
        local.toV6().toSockAddr(storage.local_addrbuf.in6);
    }

    if (remote.isV4()) {
        remote.toV4().toSockAddr(storage.remote_addrbuf.in);
    } else {
        remote.toV6().toSockAddr(storage.remote_addrbuf.in6);
    }

    storage.path.local.addr = (ngtcp2_sockaddr*)&storage.local_addrbuf;
    storage.path.local.addrlen = local.isV6() ? sizeof(storage.local_addrbuf.in6) : sizeof(storage.local_addrbuf.in);

    storage.path.remote.addr = (ngtcp2_sockaddr*)&storage.remote_addrbuf;
    storage.path.remote.addrlen = remote.isV6() ? sizeof(storage.remote_addrbuf.in6) : sizeof(storage.remote_addrbuf.in);
}

static void applyDebugOptions(const qs::SessionDebugOptions& debug) {
    if (debug.verboseSsl) {
        wolfSSL_SetLoggingCb([](int logLevel, const char* logMessage) {
            qs::log::debug("(wolfSSL) {}", logMessage);
        });

        wolfSSL_Debugging_ON();
    } else {
        wolfSSL_Debugging_OFF();
    }
}

namespace qs {

static bool isCongestionRelatedError(const TransportError& err) {
    if (std::holds_alternative<QuicError>(err.m_kind)) {
        auto& quicErr = std::get<QuicError>(err.m_kind);
        return quicErr.code == NGTCP2_ERR_STREAM_DATA_BLOCKED ||
               quicErr.code == NGTCP2_ERR_FLOW_CONTROL;
    }

    return err.isCode(TransportError::NoBufferSpace) || err.isCode(TransportError::CongestionLimited);
}

static bool isCertificateAlert(uint8_t alert) {
    // bad_certificate through certificate_unknown, unknown_ca, access_denied and certificate_required
    return (alert >= 42 && alert <= 49) || alert == 116;
}

static bool isVersionAlert(uint8_t alert) {
    // protocol_version, no_application_protocol
    return alert == 70 || alert == 120;
}

QuicConnection::QuicConnection(
    QuicRole role,
    std::unique_ptr<DatagramPath> path,
    const SessionOptions& options,
    mpsc::Sender<ConnectionEvent> eventTx,
    mpsc::Receiver<ConnectionEvent> eventRx
)
    : m_role(role),
      m_connRef(ngtcp2_crypto_conn_ref {
        .get_conn = [](ngtcp2_crypto_conn_ref* ref) -> ngtcp2_conn* {
            auto* conn = static_cast<QuicConnection*>(ref->user_data);
            return conn->rawHandle();
        },
        .user_data = this,
      }),
      m_path(std::move(path)),
      m_lossSimulation(options.debug.packetLossSimulation),
      m_maxIncomingStreams(options.maxIncomingChannels),
      m_eventTx(std::move(eventTx)),
      m_eventRx(std::move(eventRx))
{
}

QuicConnection::~QuicConnection() {
    if (m_conn) {
        ngtcp2_conn_del(m_conn);
    }

    log::debug(
        "QUIC: connection destroyed (sent {} bytes, received {} bytes)",
        m_totalBytesSent.load(), m_totalBytesReceived.load()
    );
}

std::shared_ptr<QuicConnection> QuicConnection::create(
    QuicRole role,
    std::unique_ptr<DatagramPath> path,
    const SessionOptions& options
) {
    auto [tx, rx] = arc::mpsc::channel<ConnectionEvent>(std::max<size_t>(1, options.eventQueueCapacity));

    return std::shared_ptr<QuicConnection>(new QuicConnection(
        role, std::move(path), options, std::move(tx), std::move(rx)
    ));
}

QuicRole QuicConnection::role() const {
    return m_role;
}

ngtcp2_conn* QuicConnection::rawHandle() const {
    return m_conn;
}

ngtcp2_crypto_conn_ref* QuicConnection::connRef() const {
    return const_cast<ngtcp2_crypto_conn_ref*>(&m_connRef);
}

ngtcp2_settings QuicConnection::makeSettings(const SessionOptions& options) {
    ngtcp2_settings settings;
    ngtcp2_settings_default(&settings);
    settings.log_printf = options.debug.verboseQuic ? &logPrintfCallback : nullptr;
    settings.cc_algo = NGTCP2_CC_ALGO_CUBIC;
    settings.initial_ts = timestamp();
    settings.handshake_timeout = options.handshakeTimeout.nanos();
    settings.initial_pkt_num = fillRandom<decltype(settings.initial_pkt_num)>();
    if (settings.initial_pkt_num > INT32_MAX) {
        settings.initial_pkt_num -= INT32_MAX;
    }

    return settings;
}

ngtcp2_transport_params QuicConnection::makeTransportParams(const SessionOptions& options) {
    ngtcp2_transport_params params;
    ngtcp2_transport_params_default(&params);
    params.initial_max_stream_data_bidi_local = STREAM_WINDOW;
    params.initial_max_stream_data_bidi_remote = STREAM_WINDOW;
    params.initial_max_stream_data_uni = 0;
    params.initial_max_data = CONNECTION_WINDOW;
    params.initial_max_streams_bidi = options.maxIncomingChannels;
    params.initial_max_streams_uni = 0; // channels are always bidirectional streams
    params.max_idle_timeout = options.idleTimeout.nanos();
    params.active_connection_id_limit = 4;
    params.grease_quic_bit = 1;

    return params;
}

ngtcp2_callbacks QuicConnection::makeCallbacks(QuicRole role) {
    ngtcp2_callbacks callbacks{};

    if (role == QuicRole::Client) {
        callbacks.client_initial = &ngtcp2_crypto_client_initial_cb;
        callbacks.recv_retry = &ngtcp2_crypto_recv_retry_cb;
    } else {
        callbacks.recv_client_initial = &ngtcp2_crypto_recv_client_initial_cb;
    }

    callbacks.recv_crypto_data = &ngtcp2_crypto_recv_crypto_data_cb;
    callbacks.encrypt = &ngtcp2_crypto_encrypt_cb;
    callbacks.decrypt = &ngtcp2_crypto_decrypt_cb;
    callbacks.hp_mask = &ngtcp2_crypto_hp_mask_cb;
    callbacks.update_key = &ngtcp2_crypto_update_key_cb;
    callbacks.delete_crypto_aead_ctx = &ngtcp2_crypto_delete_crypto_aead_ctx_cb;
    callbacks.delete_crypto_cipher_ctx = &ngtcp2_crypto_delete_crypto_cipher_ctx_cb;
    callbacks.get_path_challenge_data = &ngtcp2_crypto_get_path_challenge_data_cb;
    callbacks.version_negotiation = &ngtcp2_crypto_version_negotiation_cb;

    callbacks.handshake_completed = [](ngtcp2_conn*, void* user_data) {
        auto qc = static_cast<QuicConnection*>(user_data);
        log::debug("QUIC: handshake completed");

        // the client waits for HANDSHAKE_DONE, see handshake_confirmed
        if (qc->m_role == QuicRole::Server) {
            qc->m_handshakeDone.store(true, std::memory_order::release);
            qc->m_handshakeNotify.notifyOne();
        }

        return 0;
    };

    callbacks.handshake_confirmed = [](ngtcp2_conn*, void* user_data) {
        auto qc = static_cast<QuicConnection*>(user_data);
        log::debug("QUIC: handshake confirmed");

        qc->m_handshakeDone.store(true, std::memory_order::release);
        qc->m_handshakeNotify.notifyOne();
        return 0;
    };

    callbacks.recv_stream_data = [](ngtcp2_conn*, uint32_t flags, int64_t stream_id, uint64_t offset, const uint8_t* data, size_t datalen, void* user_data, void*) {
        auto qc = static_cast<QuicConnection*>(user_data);
        qc->onReceivedData(stream_id, data, datalen, (flags & NGTCP2_STREAM_DATA_FLAG_FIN) != 0);
        return 0;
    };

    callbacks.acked_stream_data_offset = [](ngtcp2_conn*, int64_t stream_id, uint64_t offset, uint64_t datalen, void* user_data, void*) {
        auto qc = static_cast<QuicConnection*>(user_data);
        qc->onAckedData(stream_id, offset, datalen);
        return 0;
    };

    callbacks.stream_open = [](ngtcp2_conn*, int64_t stream_id, void* user_data) {
        auto qc = static_cast<QuicConnection*>(user_data);
        qc->onStreamOpen(stream_id);
        return 0;
    };

    callbacks.stream_close = [](ngtcp2_conn*, uint32_t flags, int64_t stream_id, uint64_t app_error_code, void* user_data, void*) {
        auto qc = static_cast<QuicConnection*>(user_data);
        bool hasCode = (flags & NGTCP2_STREAM_CLOSE_FLAG_APP_ERROR_CODE_SET) != 0;
        qc->onStreamClose(stream_id, hasCode ? app_error_code : APP_NO_ERROR);
        return 0;
    };

    callbacks.stream_reset = [](ngtcp2_conn*, int64_t stream_id, uint64_t final_size, uint64_t app_error_code, void* user_data, void*) {
        auto qc = static_cast<QuicConnection*>(user_data);
        log::debug("QUIC stream {}: received reset (final size: {}, error code: {})", stream_id, final_size, app_error_code);
        qc->onStreamReset(stream_id, app_error_code);
        return 0;
    };

    callbacks.stream_stop_sending = [](ngtcp2_conn*, int64_t stream_id, uint64_t app_error_code, void* user_data, void*) {
        auto qc = static_cast<QuicConnection*>(user_data);
        log::debug("QUIC stream {}: received stop sending (error code: {})", stream_id, app_error_code);
        qc->onStreamStopSending(stream_id, app_error_code);
        return 0;
    };

    callbacks.extend_max_local_streams_bidi = [](ngtcp2_conn*, uint64_t max_streams, void* user_data) {
        auto qc = static_cast<QuicConnection*>(user_data);
        qc->m_streamSlotNotify.notifyOne();
        return 0;
    };

    callbacks.rand = [](uint8_t* dest, size_t destlen, const ngtcp2_rand_ctx*) {
        fillRandom(dest, destlen);
    };

    callbacks.get_new_connection_id = [](ngtcp2_conn*, ngtcp2_cid* cid, uint8_t* token, size_t cidlen, void* user_data) {
        auto qc = static_cast<QuicConnection*>(user_data);

        if (!secureRandom(cid->data, cidlen) || !secureRandom(token, NGTCP2_STATELESS_RESET_TOKENLEN)) {
            return NGTCP2_ERR_CALLBACK_FAILURE;
        }

        cid->datalen = cidlen;

        qc->m_path->onNewConnectionId(*cid);
        return 0;
    };

    callbacks.remove_connection_id = [](ngtcp2_conn*, const ngtcp2_cid* cid, void* user_data) {
        auto qc = static_cast<QuicConnection*>(user_data);
        qc->m_path->onRetiredConnectionId(*cid);
        return 0;
    };

    return callbacks;
}

Future<HandshakeResult<std::shared_ptr<QuicConnection>>> QuicConnection::connect(
    const qsox::SocketAddress& address,
    std::shared_ptr<const TlsConfig> tls,
    const SessionOptions& options,
    CancellationToken* cancel
) {
    using Cause = HandshakeError::Cause;
    QS_ASSERT(tls && tls->isClient());

    applyDebugOptions(options.debug);

    auto pathRes = co_await UdpPath::connect(address);
    if (!pathRes) {
        co_return Err(HandshakeError(Cause::Transport, pathRes.unwrapErr().message()));
    }

    auto ret = create(QuicRole::Client, std::move(pathRes).unwrap(), options);

    auto settings = makeSettings(options);
    auto params = makeTransportParams(options);
    auto callbacks = makeCallbacks(QuicRole::Client);

    // Initialize connection IDs
    ngtcp2_cid scid, dcid;
    scid.datalen = CONNECTION_ID_LENGTH;
    dcid.datalen = CONNECTION_ID_LENGTH;
    if (!secureRandom(scid.data, scid.datalen) || !secureRandom(dcid.data, dcid.datalen)) {
        co_return Err(HandshakeError(Cause::Transport, "failed to generate connection ids"));
    }

    ngtcp2_path_storage path;
    initPathStorage(path, ret->m_path->localAddress(), address);

    QuicError err = ngtcp2_conn_client_new(
        &ret->m_conn, &dcid, &scid, &path.path, QUIC_VERSION, &callbacks, &settings, &params, nullptr, ret.get()
    );

    if (!err.ok()) {
        co_return Err(HandshakeError(Cause::Transport, std::string(err.message())));
    }

    auto tlsRes = TlsSession::create(std::move(tls), ret->connRef(), options.serverName);
    if (!tlsRes) {
        co_return Err(HandshakeError(Cause::Transport, std::string(tlsRes.unwrapErr().message())));
    }

    ret->m_tls = std::move(tlsRes).unwrap();

    ngtcp2_conn_set_tls_native_handle(ret->m_conn, ret->m_tls->nativeHandle());
    ngtcp2_conn_set_keep_alive_timeout(ret->m_conn, options.keepAlive.nanos());

    log::debug("QUIC: connecting to {}", address.toString());

    co_return co_await finishHandshake(std::move(ret), options, cancel);
}

Future<HandshakeResult<std::shared_ptr<QuicConnection>>> QuicConnection::accept(
    IncomingConnection incoming,
    std::shared_ptr<const TlsConfig> tls,
    const SessionOptions& options,
    CancellationToken* cancel
) {
    using Cause = HandshakeError::Cause;
    QS_ASSERT(tls && tls->isServer());

    applyDebugOptions(options.debug);

    auto ret = create(QuicRole::Server, std::move(incoming.path), options);

    auto settings = makeSettings(options);
    auto params = makeTransportParams(options);
    auto callbacks = makeCallbacks(QuicRole::Server);

    params.original_dcid = incoming.dcid;
    params.original_dcid_present = 1;
    params.stateless_reset_token_present = 1;

    ngtcp2_cid scid;
    scid.datalen = CONNECTION_ID_LENGTH;

    if (!secureRandom(params.stateless_reset_token, NGTCP2_STATELESS_RESET_TOKENLEN) || !secureRandom(scid.data, scid.datalen)) {
        co_return Err(HandshakeError(Cause::Transport, "failed to generate connection ids"));
    }

    ngtcp2_path_storage path;
    initPathStorage(path, ret->m_path->localAddress(), ret->m_path->remoteAddress());

    QuicError err = ngtcp2_conn_server_new(
        &ret->m_conn, &incoming.scid, &scid, &path.path, incoming.version, &callbacks, &settings, &params, nullptr, ret.get()
    );

    if (!err.ok()) {
        ret->m_path->shutdown();
        co_return Err(HandshakeError(Cause::Transport, std::string(err.message())));
    }

    ret->m_path->onNewConnectionId(scid);

    auto tlsRes = TlsSession::create(std::move(tls), ret->connRef(), "");
    if (!tlsRes) {
        ret->m_path->shutdown();
        co_return Err(HandshakeError(Cause::Transport, std::string(tlsRes.unwrapErr().message())));
    }

    ret->m_tls = std::move(tlsRes).unwrap();

    ngtcp2_conn_set_tls_native_handle(ret->m_conn, ret->m_tls->nativeHandle());
    ngtcp2_conn_set_keep_alive_timeout(ret->m_conn, options.keepAlive.nanos());

    log::debug("QUIC: accepting connection from {}", ret->m_path->remoteAddress().toString());

    co_return co_await finishHandshake(std::move(ret), options, cancel);
}

Future<HandshakeResult<std::shared_ptr<QuicConnection>>> QuicConnection::finishHandshake(
    std::shared_ptr<QuicConnection> conn,
    const SessionOptions& options,
    CancellationToken* cancel
) {
    enum class Outcome { Done, TimedOut, Closed, Cancelled };

    startWorker(conn);

    CancellationToken never;
    auto cancelToken = cancel ? cancel : &never;
    auto deadline = Instant::now() + options.handshakeTimeout;
    Outcome outcome = Outcome::Closed;

    co_await arc::select(
        arc::selectee(
            arc::timeoutAt(deadline, conn->waitHandshake()),
            [&](auto res) { outcome = res ? Outcome::Done : Outcome::TimedOut; }
        ),
        arc::selectee(conn->waitClosed(), [&] { outcome = Outcome::Closed; }),
        arc::selectee(cancelToken->waitCancelled(), [&] { outcome = Outcome::Cancelled; })
    );

    switch (outcome) {
        case Outcome::Done: {
            log::info("QUIC: connection to {} established", conn->remoteAddress().toString());
            co_return Ok(std::move(conn));
        }

        case Outcome::TimedOut: {
            conn->terminate(TransportError::TimedOut);
        } break;

        case Outcome::Cancelled: {
            conn->terminate(TransportError::Cancelled);
        } break;

        case Outcome::Closed: break;
    }

    auto err = conn->handshakeErrorFrom(conn->closeError());
    log::warn("QUIC: {}", err.message());

    co_return Err(std::move(err));
}

void QuicConnection::startWorker(const std::shared_ptr<QuicConnection>& conn) {
    conn->m_workerTask = arc::spawn([](std::shared_ptr<QuicConnection> ptr) -> arc::Future<> {
        // run until terminated or the worker exits on its own
        co_await arc::select(
            arc::selectee(ptr->m_closed.waitCancelled()),
            arc::selectee(ptr->workerLoop())
        );

        // no-op unless the worker returned without recording a reason
        ptr->terminate(TransportError::Closed);
    }(conn));
}

Future<> QuicConnection::waitHandshake() {
    while (!m_handshakeDone.load(std::memory_order::acquire)) {
        co_await m_handshakeNotify.notified();
    }
}

HandshakeError QuicConnection::handshakeErrorFrom(const TransportError& err) const {
    using Cause = HandshakeError::Cause;

    if (m_tls && m_tls->certificateRejected()) {
        return HandshakeError(Cause::CertRejected, m_tls->rejectionReason());
    }

    if (err.isCode(TransportError::TimedOut)) {
        return HandshakeError(Cause::Timeout);
    } else if (err.isCode(TransportError::Cancelled)) {
        return HandshakeError(Cause::Cancelled);
    }

    if (auto qerr = std::get_if<QuicError>(&err.m_kind)) {
        if (qerr->code == NGTCP2_ERR_RECV_VERSION_NEGOTIATION) {
            return HandshakeError(Cause::VersionMismatch, "server does not support QUIC version 1");
        } else if (qerr->code == NGTCP2_ERR_HANDSHAKE_TIMEOUT) {
            return HandshakeError(Cause::Timeout);
        }
    }

    if (auto closed = std::get_if<TransportError::ConnectionClosed>(&err.m_kind)) {
        if (!closed->application && (closed->code & 0xff00) == NGTCP2_CRYPTO_ERROR) {
            uint8_t alert = closed->code & 0xff;
            auto detail = fmt::format("TLS alert {} {}", alert, closed->byPeer ? "from peer" : "sent to peer");

            if (isCertificateAlert(alert)) {
                return HandshakeError(Cause::CertRejected, std::move(detail));
            } else if (isVersionAlert(alert)) {
                return HandshakeError(Cause::VersionMismatch, std::move(detail));
            }
        }
    }

    return HandshakeError(Cause::Transport, err.message());
}

Future<> QuicConnection::workerLoop() {
    while (true) {
        auto req = std::exchange(*m_closeRequest.lock(), std::nullopt);
        if (req) {
            auto res = co_await this->sendClosePacket(*req);
            if (!res) {
                log::warn("QUIC: failed to send close packet: {}", res.unwrapErr().message());
            }

            this->terminate(TransportError::ConnectionClosed {
                .code = req->code,
                .application = true,
                .byPeer = false,
                .reason = std::move(req->reason),
            });
            co_return;
        }

        this->processRefusedStreams();

        auto res = co_await this->workerHandleWrites();
        if (!res) {
            auto err = std::move(res).unwrapErr();
            log::error("QUIC: fatal error when sending data: {}", err.message());
            this->terminate(std::move(err));
            co_return;
        }

        std::optional<TransportError> recvError;

        co_await arc::select(
            arc::selectee(arc::timeoutAt(this->expiryInstant(), m_workerNotify.notified())),

            arc::selectee(this->receivePacket(), [&](TransportResult<> res) {
                if (!res) {
                    recvError = std::move(res).unwrapErr();
                }
            })
        );

        if (recvError) {
            this->terminate(std::move(*recvError));
            co_return;
        }

        auto eres = this->handleExpiry();
        if (!eres) {
            this->terminate(std::move(eres).unwrapErr());
            co_return;
        }
    }
}

Future<TransportResult<>> QuicConnection::workerHandleWrites() {
    std::vector<std::shared_ptr<QuicStream>> pending;

    this->withLockedConn([&] {
        for (auto& [id, stream] : m_streams) {
            if (stream->hasPendingSend()) {
                pending.push_back(stream);
            }
        }
    });

    bool congestion = false;

    for (auto& stream : pending) {
        while (!congestion) {
            auto res = co_await this->sendStreamData(*stream);
            if (res) {
                if (!res.unwrap()) break;
                continue;
            }

            auto err = std::move(res).unwrapErr();
            if (err.isCode(TransportError::StreamBlocked)) {
                // this stream is out of flow control credit, others may still have some
                break;
            } else if (isCongestionRelatedError(err)) {
                congestion = true;
            } else {
                co_return Err(std::move(err));
            }
        }

        if (congestion) break;
    }

    // acks and control frames
    co_return co_await this->sendNonStreamPackets();
}

Future<TransportResult<bool>> QuicConnection::sendStreamData(QuicStream& stream) {
    uint8_t outBuf[MAX_UDP_PAYLOAD];
    ngtcp2_ssize written;
    ngtcp2_ssize streamDataWritten = -1;

    {
        auto connGuard = m_connLock.lock();

        if (!stream.hasPendingSend()) {
            co_return Ok(false);
        }

        auto [wrp, bufLock] = stream.peekUnsentData();
        bool fin = stream.m_finRequested.load();

        ngtcp2_vec vecs[2];
        size_t vecCount = 0;

        if (wrp.first.size() > 0) {
            vecs[vecCount++] = ngtcp2_vec{const_cast<uint8_t*>(wrp.first.data()), wrp.first.size()};
        }

        if (wrp.second.size() > 0) {
            vecs[vecCount++] = ngtcp2_vec{const_cast<uint8_t*>(wrp.second.data()), wrp.second.size()};
        }

        ngtcp2_pkt_info pi{};
        written = ngtcp2_conn_writev_stream(
            m_conn,
            nullptr,
            &pi,
            outBuf,
            sizeof(outBuf),
            &streamDataWritten,
            fin ? NGTCP2_WRITE_STREAM_FLAG_FIN : NGTCP2_WRITE_STREAM_FLAG_NONE,
            stream.m_streamId,
            vecs,
            vecCount,
            timestamp()
        );

        if (written < 0) {
            switch (written) {
                case NGTCP2_ERR_STREAM_DATA_BLOCKED: {
                    co_return Err(TransportError::StreamBlocked);
                }

                case NGTCP2_ERR_STREAM_SHUT_WR:
                case NGTCP2_ERR_STREAM_NOT_FOUND: {
                    log::debug("QUIC stream {}: cannot send anymore, write side is shut", stream.m_streamId);
                    bufLock.unlock();
                    stream.onSendShut();
                    co_return Ok(false);
                }

                default: {
                    QuicError err(written);
                    log::warn("QUIC stream {}: failed to write stream data: {}", stream.m_streamId, err.message());
                    co_return Err(err);
                }
            }
        } else if (written == 0) {
            co_return Err(TransportError::CongestionLimited);
        }

        // ngtcp2 keeps pointing into the buffer until the data is acked, so account for it while still locked
        if (streamDataWritten > 0) {
            stream.advanceSentData(streamDataWritten);
        }

        if (fin && streamDataWritten >= 0 && static_cast<size_t>(streamDataWritten) == wrp.size()) {
            log::debug("QUIC stream {}: FIN sent", stream.m_streamId);
            stream.m_finSent = true;
        }
    }

    ARC_CO_UNWRAP(co_await this->sendPacket(outBuf, written));

    // ngtcp2 may have written only non-stream data, in which case this stream made no progress
    co_return Ok(streamDataWritten > 0);
}

Future<TransportResult<>> QuicConnection::sendNonStreamPackets() {
    uint8_t buf[MAX_UDP_PAYLOAD];

    while (true) {
        auto written = this->withLockedConn([&] {
            ngtcp2_pkt_info pi{};
            return ngtcp2_conn_write_pkt(m_conn, nullptr, &pi, buf, sizeof(buf), timestamp());
        });

        if (written < 0) {
            QuicError err(written);
            log::warn("QUIC: failed to write packet: {}", err.message());
            co_return Err(err);
        } else if (written == 0) {
            co_return Ok();
        }

        ARC_CO_UNWRAP(co_await this->sendPacket(buf, written));
    }
}

Future<TransportResult<>> QuicConnection::sendClosePacket(const CloseRequest& req) {
    ngtcp2_ccerr ccerr;
    ngtcp2_ccerr_default(&ccerr);
    ngtcp2_ccerr_set_application_error(
        &ccerr, req.code, reinterpret_cast<const uint8_t*>(req.reason.data()), req.reason.size()
    );

    log::debug("QUIC: sending close packet (code {}, reason '{}')", req.code, req.reason);
    co_return co_await this->sendConnectionError(ccerr);
}

Future<TransportResult<>> QuicConnection::sendConnectionError(const ngtcp2_ccerr& ccerr) {
    uint8_t buf[MAX_UDP_PAYLOAD];

    auto written = this->withLockedConn([&]() -> ngtcp2_ssize {
        if (ngtcp2_conn_in_closing_period(m_conn) || ngtcp2_conn_in_draining_period(m_conn)) {
            return 0;
        }

        ngtcp2_path_storage ps;
        ngtcp2_path_storage_zero(&ps);
        ngtcp2_pkt_info pi{};

        return ngtcp2_conn_write_connection_close(m_conn, &ps.path, &pi, buf, sizeof(buf), &ccerr, timestamp());
    });

    if (written < 0) {
        co_return Err(QuicError(written));
    } else if (written == 0) {
        co_return Ok();
    }

    co_return co_await this->sendPacket(buf, written);
}

Future<TransportResult<>> QuicConnection::sendPacket(const uint8_t* buf, size_t size) {
    if (!this->shouldLosePacket()) {
        ARC_CO_UNWRAP(co_await m_path->send(buf, size));
    }

    this->withLockedConn([&]() {
        ngtcp2_conn_update_pkt_tx_time(m_conn, timestamp());
    });

    m_totalBytesSent.fetch_add(size, std::memory_order::relaxed);

    co_return Ok();
}

Future<TransportResult<>> QuicConnection::receivePacket() {
    uint8_t buf[RECV_DATAGRAM_SIZE];

    size_t bytes = ARC_CO_UNWRAP(co_await m_path->receive(buf, sizeof(buf)));
    m_totalBytesReceived.fetch_add(bytes, std::memory_order::relaxed);

    ngtcp2_path_storage path;
    initPathStorage(path, m_path->localAddress(), m_path->remoteAddress());

    QuicError res = this->withLockedConn([&] {
        ngtcp2_pkt_info pi{};
        return ngtcp2_conn_read_pkt(m_conn, &path.path, &pi, buf, bytes, timestamp());
    });

    if (res.ok()) co_return Ok();

    switch (res.code) {
        case NGTCP2_ERR_DRAINING: {
            auto reason = this->withLockedConn([&] { return this->peerCloseReason(); });
            log::debug("QUIC: peer closed the connection: {}", reason.message());
            co_return Err(std::move(reason));
        }

        case NGTCP2_ERR_DROP_CONN: {
            log::debug("QUIC: dropping connection silently");
            co_return Err(TransportError::Closed);
        }

        case NGTCP2_ERR_RECV_VERSION_NEGOTIATION: {
            log::warn("QUIC: received version negotiation, server does not support our version");
            co_return Err(res);
        }

        case NGTCP2_ERR_CRYPTO: {
            uint8_t alert = this->withLockedConn([&] { return ngtcp2_conn_get_tls_alert(m_conn); });
            log::warn("QUIC: TLS handshake failed (alert {}), last TLS error: {}", alert, lastTlsError().message());

            ngtcp2_ccerr ccerr;
            ngtcp2_ccerr_default(&ccerr);
            ngtcp2_ccerr_set_tls_alert(&ccerr, alert, nullptr, 0);

            auto sres = co_await this->sendConnectionError(ccerr);
            if (!sres) {
                log::warn("QUIC: failed to send close packet: {}", sres.unwrapErr().message());
            }

            co_return Err(TransportError::ConnectionClosed {
                .code = ccerr.error_code,
                .application = false,
                .byPeer = false,
                .reason = "TLS handshake failure",
            });
        }

        default: {
            log::warn("QUIC: failed to read the packet: {}", res.message());

            ngtcp2_ccerr ccerr;
            ngtcp2_ccerr_default(&ccerr);
            ngtcp2_ccerr_set_liberr(&ccerr, res.code, nullptr, 0);

            auto sres = co_await this->sendConnectionError(ccerr);
            if (!sres) {
                log::warn("QUIC: failed to send close packet: {}", sres.unwrapErr().message());
            }

            co_return Err(res);
        }
    }
}

TransportError::ConnectionClosed QuicConnection::peerCloseReason() {
    auto ccerr = ngtcp2_conn_get_ccerr(m_conn);

    return TransportError::ConnectionClosed {
        .code = ccerr->error_code,
        .application = ccerr->type == NGTCP2_CCERR_TYPE_APPLICATION,
        .byPeer = true,
        .reason = std::string(reinterpret_cast<const char*>(ccerr->reason), ccerr->reasonlen),
    };
}

Instant QuicConnection::expiryInstant() {
    auto expiry = this->withLockedConn([&] { return ngtcp2_conn_get_expiry(m_conn); });

    if (expiry == UINT64_MAX) {
        return Instant::farFuture();
    }

    return Instant::fromRawNanos(expiry);
}

TransportResult<> QuicConnection::handleExpiry() {
    auto guard = m_connLock.lock();
    auto now = timestamp();

    if (ngtcp2_conn_get_expiry(m_conn) > now) {
        return Ok();
    }

    int code = ngtcp2_conn_handle_expiry(m_conn, now);
    switch (code) {
        case 0: return Ok();
        case NGTCP2_ERR_IDLE_CLOSE: {
            log::info("QUIC: connection idle for too long, closing");
            return Err(TransportError::IdleTimeout);
        }
        case NGTCP2_ERR_HANDSHAKE_TIMEOUT: return Err(TransportError::TimedOut);
        default: return Err(QuicError(code));
    }
}

void QuicConnection::processRefusedStreams() {
    this->withLockedConn([&] {
        for (int64_t id : m_refusedStreams) {
            log::warn("QUIC stream {}: refusing, the event queue is full", id);

            int rv = ngtcp2_conn_shutdown_stream(m_conn, 0, id, APP_REFUSED);
            if (rv != 0) {
                log::debug("QUIC stream {}: failed to refuse: {}", id, QuicError(rv).message());
            }

            m_streams.erase(id);
        }

        m_refusedStreams.clear();
    });
}

void QuicConnection::terminate(TransportError err) {
    if (m_terminated.exchange(true)) {
        return;
    }

    log::debug("QUIC: connection terminated: {}", err.message());

    *m_closeError.lock() = std::move(err);
    m_closed.cancel();

    if (m_eventTx.trySend(ConnectionEvent{ConnectionEvent::Kind::Closed, nullptr}).isErr()) {
        log::debug("QUIC: event queue full, close event not delivered");
    }

    m_path->shutdown();
}

std::optional<mpsc::Receiver<ConnectionEvent>> QuicConnection::takeEvents() {
    return std::exchange(m_eventRx, std::nullopt);
}

Future<TransportResult<std::shared_ptr<QuicStream>>> QuicConnection::openStream() {
    while (true) {
        if (this->isClosed()) {
            co_return Err(this->closeError());
        }

        std::shared_ptr<QuicStream> stream;

        QuicError err = this->withLockedConn([&] {
            int64_t id = -1;
            int rv = ngtcp2_conn_open_bidi_stream(m_conn, &id, nullptr);

            if (rv == 0) {
                QS_ASSERT(id != -1);
                stream = std::make_shared<QuicStream>(this, id);
                m_streams.emplace(id, stream);
            }

            return rv;
        });

        if (err.ok()) {
            log::debug("QUIC stream {}: opened", stream->id());

            // pass the wakeup on, another opener may be able to proceed too
            m_streamSlotNotify.notifyOne();
            co_return Ok(std::move(stream));
        }

        if (err.code != NGTCP2_ERR_STREAM_ID_BLOCKED) {
            co_return Err(err);
        }

        log::debug("QUIC: stream limit reached, waiting for the peer to allow more");

        co_await arc::select(
            arc::selectee(m_streamSlotNotify.notified()),
            arc::selectee(this->waitClosed())
        );
    }
}

std::shared_ptr<QuicStream> QuicConnection::getStream(int64_t streamId) {
    return this->withLockedConn([&]() -> std::shared_ptr<QuicStream> {
        auto it = m_streams.find(streamId);
        return it == m_streams.end() ? nullptr : it->second;
    });
}

bool QuicConnection::isLocalStream(int64_t streamId) const {
    // bit 0 of a stream id is set for server initiated streams
    bool serverInitiated = (streamId & 0x1) != 0;
    return serverInitiated == (m_role == QuicRole::Server);
}

void QuicConnection::close(uint64_t code, std::string reason) {
    if (this->isClosed()) {
        return;
    }

    {
        auto req = m_closeRequest.lock();
        if (req->has_value()) {
            return;
        }

        *req = CloseRequest{code, std::move(reason)};
    }

    m_workerNotify.notifyOne();
}

bool QuicConnection::isClosed() const {
    return m_closed.isCancelled();
}

Future<> QuicConnection::waitClosed() {
    return m_closed.waitCancelled();
}

TransportError QuicConnection::closeError() const {
    auto err = m_closeError.lock();
    if (err->has_value()) {
        return **err;
    }

    return TransportError::Closed;
}

qsox::SocketAddress QuicConnection::localAddress() const {
    return m_path->localAddress();
}

qsox::SocketAddress QuicConnection::remoteAddress() const {
    return m_path->remoteAddress();
}

std::optional<Fingerprint> QuicConnection::peerFingerprint() const {
    return m_tls ? m_tls->peerFingerprint() : std::nullopt;
}

void QuicConnection::notifyWorker() {
    m_workerNotify.notifyOne();
}

void QuicConnection::extendReceiveWindow(int64_t streamId, size_t len) {
    if (this->isClosed()) {
        return;
    }

    this->withLockedConn([&] {
        int rv = ngtcp2_conn_extend_max_stream_offset(m_conn, streamId, len);
        if (rv != 0) {
            log::debug("QUIC stream {}: failed to extend flow control window: {}", streamId, QuicError(rv).message());
        }

        ngtcp2_conn_extend_max_offset(m_conn, len);
    });

    // the peer only learns about the new window once we send a packet
    this->notifyWorker();
}

void QuicConnection::shutdownStream(int64_t streamId, uint64_t code) {
    if (this->isClosed()) {
        return;
    }

    this->withLockedConn([&] {
        int rv = ngtcp2_conn_shutdown_stream(m_conn, 0, streamId, code);
        if (rv != 0) {
            log::debug("QUIC stream {}: failed to shut down: {}", streamId, QuicError(rv).message());
        }
    });

    this->notifyWorker();
}

void QuicConnection::onReceivedData(int64_t streamId, const uint8_t* data, size_t len, bool fin) {
    auto it = m_streams.find(streamId);
    if (it == m_streams.end()) {
        log::debug("Received data for unknown QUIC stream {}", streamId);
        return;
    }

    it->second->onReceivedData(data, len, fin);
}

void QuicConnection::onAckedData(int64_t streamId, uint64_t offset, uint64_t len) {
    auto it = m_streams.find(streamId);
    if (it == m_streams.end()) {
        log::debug("Received ack for unknown QUIC stream {}", streamId);
        return;
    }

    it->second->onAck(offset, len);
}

void QuicConnection::onStreamOpen(int64_t streamId) {
    auto stream = std::make_shared<QuicStream>(this, streamId);
    m_streams.emplace(streamId, stream);

    log::debug("QUIC stream {}: opened by peer", streamId);

    if (m_eventTx.trySend(ConnectionEvent{ConnectionEvent::Kind::StreamOpened, stream}).isErr()) {
        // ngtcp2 must not be re-entered from a callback, the worker resets it after this packet
        m_refusedStreams.push_back(streamId);
    }
}

void QuicConnection::onStreamClose(int64_t streamId, uint64_t appErrorCode) {
    log::debug("QUIC stream {}: closed (error code: {})", streamId, appErrorCode);

    auto it = m_streams.find(streamId);
    if (it != m_streams.end()) {
        it->second->onClosed();
        m_streams.erase(it);
    }

    if (!this->isLocalStream(streamId)) {
        // let the peer open another one in its place
        ngtcp2_conn_extend_max_streams_bidi(m_conn, 1);
    }
}

void QuicConnection::onStreamReset(int64_t streamId, uint64_t appErrorCode) {
    auto it = m_streams.find(streamId);
    if (it != m_streams.end()) {
        it->second->onPeerReset(appErrorCode);
    }
}

void QuicConnection::onStreamStopSending(int64_t streamId, uint64_t appErrorCode) {
    auto it = m_streams.find(streamId);
    if (it != m_streams.end()) {
        it->second->onPeerReset(appErrorCode);
    }
}

bool QuicConnection::shouldLosePacket() const {
    float sim = std::clamp(m_lossSimulation, 0.0f, 1.0f);

    if (qs::randomChance(sim)) {
        log::debug("QUIC: purposefully dropping packet due to loss simulation");
        return true;
    }

    return false;
}

}
