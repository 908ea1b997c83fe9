#include <quicsock/tls/Error.hpp>
#include <fmt/format.h>

#include <wolfssl/options.h>
#include <wolfssl/ssl.h>

namespace qs {

void WolfsslCtxDeleter::operator()(WOLFSSL_CTX* ctx) const {
    wolfSSL_CTX_free(ctx);
}
void WolfsslDeleter::operator()(WOLFSSL* ssl) const {
    wolfSSL_free(ssl);
}

TlsError lastTlsError() {
    return TlsError(wolfSSL_ERR_get_error());
}

TlsResult<> tlsWrap(int rcode) {
    if (rcode == WOLFSSL_SUCCESS) {
        return Ok();
    } else {
        return Err(lastTlsError());
    }
}

static std::string_view certKindString(CertError::Kind kind) {
    using enum CertError::Kind;

    switch (kind) {
        case Generation: return "certificate generation failed";
        case Format: return "invalid certificate or key format";
        case KeyMismatch: return "private key does not match the certificate";
        case Expired: return "certificate has expired";
        case NotYetValid: return "certificate is not yet valid";
    }

    qs::unreachable();
}

std::string CertError::message() const {
    std::string out{certKindString(kind)};

    if (!detail.empty()) {
        out += fmt::format(": {}", detail);
    }

    if (backendCode != 0) {
        out += fmt::format(" (wolfCrypt: {})", CryptoError(backendCode).message());
    }

    return out;
}

bool ConfigError::isCode() const {
    return std::holds_alternative<Code>(m_err);
}

bool ConfigError::isTlsError() const {
    return std::holds_alternative<TlsError>(m_err);
}

bool ConfigError::isCertError() const {
    return std::holds_alternative<CertError>(m_err);
}

ConfigError::Code ConfigError::asCode() const {
    return std::get<Code>(m_err);
}

const TlsError& ConfigError::asTlsError() const {
    return std::get<TlsError>(m_err);
}

const CertError& ConfigError::asCertError() const {
    return std::get<CertError>(m_err);
}

bool ConfigError::operator==(Code code) const {
    return this->isCode() && this->asCode() == code;
}

bool ConfigError::operator!=(Code code) const {
    return !(*this == code);
}

std::string ConfigError::message() const {
    if (this->isTlsError()) {
        return fmt::format("TLS error: {}", this->asTlsError().message());
    } else if (this->isCertError()) {
        return fmt::format("Certificate error: {}", this->asCertError().message());
    }

    switch (this->asCode()) {
        case TrustPolicy: return "Trust policy must name at least one fingerprint or CA certificate";
        case MissingIdentity: return "Server configuration requires a certificate identity";
    }

    qs::unreachable();
}

}
