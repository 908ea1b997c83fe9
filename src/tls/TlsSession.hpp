#pragma once

#include <quicsock/tls/TlsConfig.hpp>

#include <optional>
#include <string>
#include <string_view>

struct ngtcp2_crypto_conn_ref;
struct WOLFSSL_X509_STORE_CTX;

namespace qs {

/// Per-connection TLS state. The address must stay stable for the lifetime of the connection,
/// wolfSSL hands it back to the certificate verification callback.
class TlsSession {
public:
    ~TlsSession();

    TlsSession(const TlsSession&) = delete;
    TlsSession& operator=(const TlsSession&) = delete;

    static TlsResult<std::unique_ptr<TlsSession>> create(
        std::shared_ptr<const TlsConfig> config,
        ngtcp2_crypto_conn_ref* connRef,
        std::string_view serverName
    );

    WOLFSSL* nativeHandle() const;
    const TlsConfig& config() const;

    /// True if our own verification rejected the peer certificate
    bool certificateRejected() const;
    const std::string& rejectionReason() const;
    std::optional<Fingerprint> peerFingerprint() const;

    static int verifyCallback(int preverify, WOLFSSL_X509_STORE_CTX* store);

private:
    TlsSession(std::shared_ptr<const TlsConfig> config, WOLFSSL* ssl);

    std::shared_ptr<const TlsConfig> m_config;
    std::unique_ptr<WOLFSSL, WolfsslDeleter> m_ssl;
    bool m_certRejected = false;
    std::string m_rejectionReason;
    std::optional<Fingerprint> m_peerFingerprint;

    void reject(std::string reason);
};

}
