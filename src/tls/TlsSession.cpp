#include "TlsSession.hpp"
#include <quicsock/protocol/constants.hpp>
#include <quicsock/Log.hpp>

#include <wolfssl/options.h>
#include <wolfssl/ssl.h>
#include <ngtcp2/ngtcp2_crypto.h>

#include <chrono>

namespace qs {

TlsSession::TlsSession(std::shared_ptr<const TlsConfig> config, WOLFSSL* ssl)
    : m_config(std::move(config)), m_ssl(ssl) {}

TlsSession::~TlsSession() {}

TlsResult<std::unique_ptr<TlsSession>> TlsSession::create(
    std::shared_ptr<const TlsConfig> config,
    ngtcp2_crypto_conn_ref* connRef,
    std::string_view serverName
) {
    auto ssl = wolfSSL_new(config->handle());
    if (!ssl) {
        return Err(lastTlsError());
    }

    bool client = config->isClient();

    // raii guard
    std::unique_ptr<TlsSession> session(new TlsSession(std::move(config), ssl));

    GEODE_UNWRAP(tlsWrap(wolfSSL_set_app_data(ssl, connRef)));
    wolfSSL_SetCertCbCtx(ssl, session.get());

    if (client) {
        wolfSSL_set_connect_state(ssl);

        GEODE_UNWRAP(tlsWrap(wolfSSL_set_alpn_protos(
            ssl,
            reinterpret_cast<const unsigned char*>(ALPN_PROTOCOL),
            sizeof(ALPN_PROTOCOL) - 1
        )));

        if (!serverName.empty()) {
            GEODE_UNWRAP(tlsWrap(wolfSSL_UseSNI(
                ssl, WOLFSSL_SNI_HOST_NAME, serverName.data(), static_cast<unsigned short>(serverName.size())
            )));

            // hostname verification only makes sense when the chain itself is verified
            auto kind = session->m_config->trust().kind();
            if (kind == TrustPolicy::Kind::CertificateAuthorities || kind == TrustPolicy::Kind::SystemRoots) {
                std::string name{serverName};
                GEODE_UNWRAP(tlsWrap(wolfSSL_check_domain_name(ssl, name.c_str())));
            }
        }
    } else {
        wolfSSL_set_accept_state(ssl);
    }

    // use quic v1
    wolfSSL_set_quic_transport_version(ssl, QUIC_TLS_TRANSPORT_VERSION);

    return Ok(std::move(session));
}

WOLFSSL* TlsSession::nativeHandle() const {
    return m_ssl.get();
}

const TlsConfig& TlsSession::config() const {
    return *m_config;
}

bool TlsSession::certificateRejected() const {
    return m_certRejected;
}

const std::string& TlsSession::rejectionReason() const {
    return m_rejectionReason;
}

std::optional<Fingerprint> TlsSession::peerFingerprint() const {
    return m_peerFingerprint;
}

void TlsSession::reject(std::string reason) {
    log::warn("TLS: rejecting peer certificate: {}", reason);

    if (!m_certRejected) {
        m_certRejected = true;
        m_rejectionReason = std::move(reason);
    }
}

int TlsSession::verifyCallback(int preverify, WOLFSSL_X509_STORE_CTX* store) {
    auto session = static_cast<TlsSession*>(store->userCtx);
    if (!session) {
        return preverify;
    }

    if (!store->certs || store->totalCerts < 1) {
        session->reject("peer sent no certificate");
        return 0;
    }

    // certs[0] is always the peer's leaf, regardless of which chain element is being verified
    auto& leaf = store->certs[0];
    auto fp = sha256Hash(leaf.buffer, leaf.length);
    session->m_peerFingerprint = fp;

    if (!session->m_config->trust().matches(fp)) {
        session->reject(fmt::format("fingerprint {} is not trusted", fp.toString()));
        return 0;
    }

    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    auto dates = checkCertificateDates({leaf.buffer, leaf.length}, now);
    if (!dates) {
        session->reject(dates.unwrapErr().message());
        return 0;
    }

    return 1;
}

}
