#include <quicsock/tls/TlsConfig.hpp>
#include <quicsock/protocol/constants.hpp>
#include <quicsock/Log.hpp>
#include "TlsSession.hpp"

#include <wolfssl/options.h>
#include <wolfssl/ssl.h>
#include <ngtcp2/ngtcp2_crypto_wolfssl.h>

#include <cstring>

namespace qs {

static int alpnSelectCallback(
    WOLFSSL*,
    const unsigned char** out,
    unsigned char* outlen,
    const unsigned char* in,
    unsigned int inlen,
    void*
) {
    constexpr size_t nameLen = sizeof(ALPN_PROTOCOL_NAME) - 1;

    for (unsigned int i = 0; i < inlen;) {
        unsigned int len = in[i];
        if (i + 1 + len > inlen) {
            break;
        }

        if (len == nameLen && std::memcmp(in + i + 1, ALPN_PROTOCOL_NAME, nameLen) == 0) {
            *out = in + i + 1;
            *outlen = static_cast<unsigned char>(len);
            return SSL_TLSEXT_ERR_OK;
        }

        i += 1 + len;
    }

    log::warn("TLS: client did not offer the {} protocol", ALPN_PROTOCOL_NAME);
    return SSL_TLSEXT_ERR_ALERT_FATAL;
}

static bool looksLikePem(const std::vector<uint8_t>& data) {
    std::string_view sv{reinterpret_cast<const char*>(data.data()), data.size()};
    return sv.find("-----BEGIN") != std::string_view::npos;
}

TlsConfig::TlsConfig(TlsRole role, WOLFSSL_CTX* ctx, std::optional<Identity> identity, TrustPolicy trust)
    : m_role(role),
      m_ctx(ctx),
      m_identity(std::move(identity)),
      m_trust(std::move(trust)) {}

TlsConfig::~TlsConfig() {}

ConfigResult<std::shared_ptr<const TlsConfig>> TlsConfig::buildClient(std::optional<Identity> identity, TrustPolicy trust) {
    return build(TlsRole::Client, std::move(identity), std::move(trust));
}

ConfigResult<std::shared_ptr<const TlsConfig>> TlsConfig::buildServer(std::optional<Identity> identity, TrustPolicy trust) {
    if (!identity) {
        return Err(ConfigError::MissingIdentity);
    }

    return build(TlsRole::Server, std::move(identity), std::move(trust));
}

ConfigResult<std::shared_ptr<const TlsConfig>> TlsConfig::build(
    TlsRole role,
    std::optional<Identity> identity,
    TrustPolicy trust
) {
    GEODE_UNWRAP(trust.validate());

    bool client = role == TlsRole::Client;
    auto ctx = wolfSSL_CTX_new(client ? wolfTLSv1_3_client_method() : wolfTLSv1_3_server_method());

    if (!ctx) {
        return Err(lastTlsError());
    }

    // raii guard from here on
    std::shared_ptr<TlsConfig> config(new TlsConfig(role, ctx, std::move(identity), std::move(trust)));

    int rc = client
        ? ngtcp2_crypto_wolfssl_configure_client_context(ctx)
        : ngtcp2_crypto_wolfssl_configure_server_context(ctx);

    if (rc != 0) { // this can never fail really
        return Err(lastTlsError());
    }

    GEODE_UNWRAP(tlsWrap(wolfSSL_CTX_SetMinVersion(ctx, WOLFSSL_TLSV1_3)));
    GEODE_UNWRAP(tlsWrap(wolfSSL_CTX_set_cipher_list(ctx, TLS_CIPHER_SUITES)));
    GEODE_UNWRAP(tlsWrap(wolfSSL_CTX_set1_curves_list(ctx, TLS_CURVES)));

    if (!client) {
        wolfSSL_CTX_set_alpn_select_cb(ctx, &alpnSelectCallback, nullptr);
    }

    GEODE_UNWRAP(config->loadIdentity());
    GEODE_UNWRAP(config->configureTrust());

    log::debug(
        "TLS: built {} configuration (trust: {}, identity: {})",
        client ? "client" : "server",
        config->m_trust.describe(),
        config->m_identity ? config->m_identity->subjectName() : std::string{"none"}
    );

    return Ok(std::move(config));
}

ConfigResult<> TlsConfig::loadIdentity() {
    if (!m_identity) {
        return Ok();
    }

    auto pem = m_identity->certificatePem();
    auto& key = m_identity->privateKeyDer();

    GEODE_UNWRAP(tlsWrap(wolfSSL_CTX_use_certificate_chain_buffer(
        m_ctx.get(),
        reinterpret_cast<const unsigned char*>(pem.data()),
        static_cast<long>(pem.size())
    )));

    GEODE_UNWRAP(tlsWrap(wolfSSL_CTX_use_PrivateKey_buffer(
        m_ctx.get(),
        key.data(),
        static_cast<long>(key.size()),
        WOLFSSL_FILETYPE_ASN1
    )));

    return Ok();
}

ConfigResult<> TlsConfig::configureTrust() {
    auto ctx = m_ctx.get();

    int peerMode = WOLFSSL_VERIFY_PEER;
    if (m_role == TlsRole::Server) {
        peerMode |= WOLFSSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    }

    switch (m_trust.kind()) {
        case TrustPolicy::Kind::Any: {
            if (m_role == TlsRole::Client) {
                log::info("TLS: skipping certificate verification (trusting any peer)");
            }

            wolfSSL_CTX_set_verify(ctx, WOLFSSL_VERIFY_NONE, nullptr);
        } break;

        case TrustPolicy::Kind::Fingerprints: {
            // self-signed certificates fail chain verification, the callback overrides that if the fingerprint is pinned
            wolfSSL_CTX_set_verify(ctx, peerMode, &TlsSession::verifyCallback);
        } break;

        case TrustPolicy::Kind::CertificateAuthorities: {
            for (auto& ca : m_trust.certificateAuthorityList()) {
                int rc = wolfSSL_CTX_load_verify_buffer(
                    ctx,
                    ca.data(),
                    static_cast<long>(ca.size()),
                    looksLikePem(ca) ? WOLFSSL_FILETYPE_PEM : WOLFSSL_FILETYPE_ASN1
                );

                if (rc != WOLFSSL_SUCCESS) {
                    return Err(CertError(
                        CertError::Kind::Format,
                        fmt::format("invalid CA certificate: {}", lastTlsError().message())
                    ));
                }
            }

            log::debug("TLS: loaded {} CA certificate(s)", m_trust.certificateAuthorityList().size());
            wolfSSL_CTX_set_verify(ctx, peerMode, nullptr);
        } break;

        case TrustPolicy::Kind::SystemRoots: {
            log::info("TLS: loading system certificates");
            GEODE_UNWRAP(tlsWrap(wolfSSL_CTX_set_default_verify_paths(ctx)));
            wolfSSL_CTX_set_verify(ctx, peerMode, nullptr);
        } break;
    }

    return Ok();
}

TlsRole TlsConfig::role() const {
    return m_role;
}

bool TlsConfig::isClient() const {
    return m_role == TlsRole::Client;
}

bool TlsConfig::isServer() const {
    return m_role == TlsRole::Server;
}

const std::optional<Identity>& TlsConfig::identity() const {
    return m_identity;
}

const TrustPolicy& TlsConfig::trust() const {
    return m_trust;
}

WOLFSSL_CTX* TlsConfig::handle() const {
    return m_ctx.get();
}

}
