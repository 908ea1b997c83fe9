#pragma once

#include "Identity.hpp"
#include "TrustPolicy.hpp"

#include <memory>
#include <optional>

namespace qs {

enum class TlsRole {
    Client,
    Server,
};

/// Immutable TLS 1.3 configuration for QUIC sessions. Shared between every session created from it.
/// The minimum protocol version, cipher suites and ALPN id are fixed.
class TlsConfig {
public:
    ~TlsConfig();

    TlsConfig(const TlsConfig&) = delete;
    TlsConfig& operator=(const TlsConfig&) = delete;

    /// `identity` is only needed when the server requires client certificates.
    static ConfigResult<std::shared_ptr<const TlsConfig>> buildClient(
        std::optional<Identity> identity,
        TrustPolicy trust
    );

    /// `trust` decides which client certificates are accepted. `TrustPolicy::any()` does not request one.
    static ConfigResult<std::shared_ptr<const TlsConfig>> buildServer(
        std::optional<Identity> identity,
        TrustPolicy trust
    );

    TlsRole role() const;
    bool isClient() const;
    bool isServer() const;

    const std::optional<Identity>& identity() const;
    const TrustPolicy& trust() const;

    WOLFSSL_CTX* handle() const;

private:
    TlsConfig(TlsRole role, WOLFSSL_CTX* ctx, std::optional<Identity> identity, TrustPolicy trust);

    static ConfigResult<std::shared_ptr<const TlsConfig>> build(
        TlsRole role,
        std::optional<Identity> identity,
        TrustPolicy trust
    );

    TlsRole m_role;
    std::unique_ptr<WOLFSSL_CTX, WolfsslCtxDeleter> m_ctx;
    std::optional<Identity> m_identity;
    TrustPolicy m_trust;

    ConfigResult<> configureTrust();
    ConfigResult<> loadIdentity();
};

}
