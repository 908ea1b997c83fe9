#pragma once

#include <quicsock/transport/Error.hpp>

#include <string>
#include <variant>

struct WOLFSSL_CTX;
struct WOLFSSL;

namespace qs {

/// Error produced while generating, loading or validating a certificate.
struct CertError {
    enum class Kind {
        /// Key or certificate generation failed (no entropy, invalid subject, bad validity period)
        Generation,
        /// The certificate or key bytes could not be parsed as PEM or DER
        Format,
        /// The private key does not belong to the certificate
        KeyMismatch,
        Expired,
        NotYetValid,
    };

    Kind kind;
    /// wolfCrypt error code, 0 if the failure did not come from the crypto backend
    int backendCode = 0;
    std::string detail;

    CertError(Kind kind, std::string detail = {}, int backendCode = 0)
        : kind(kind), backendCode(backendCode), detail(std::move(detail)) {}

    std::string message() const;

    bool operator==(const CertError& other) const = default;
    bool operator!=(const CertError& other) const = default;
};

template <typename T = void>
using CertResult = geode::Result<T, CertError>;

class ConfigError {
public:
    typedef enum {
        /// A TrustSpecific policy was given an empty fingerprint or CA set
        TrustPolicy,
        /// A server configuration was requested without an identity
        MissingIdentity,
    } Code;

    ConfigError(Code code) : m_err(code) {}
    ConfigError(TlsError err) : m_err(std::move(err)) {}
    ConfigError(CertError err) : m_err(std::move(err)) {}

    bool isCode() const;
    bool isTlsError() const;
    bool isCertError() const;

    Code asCode() const;
    const TlsError& asTlsError() const;
    const CertError& asCertError() const;

    bool operator==(const ConfigError& other) const = default;
    bool operator!=(const ConfigError& other) const = default;
    bool operator==(Code code) const;
    bool operator!=(Code code) const;

    std::string message() const;

private:
    std::variant<Code, TlsError, CertError> m_err;
};

template <typename T = void>
using ConfigResult = geode::Result<T, ConfigError>;

struct WolfsslCtxDeleter {
    void operator()(WOLFSSL_CTX* ctx) const;
};
struct WolfsslDeleter {
    void operator()(WOLFSSL* ssl) const;
};

TlsError lastTlsError();
TlsResult<> tlsWrap(int rcode);

}
