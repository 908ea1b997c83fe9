#pragma once

#include "Error.hpp"
#include <quicsock/util/hash.hpp>
#include <quicsock/util/compat.hpp>
#include <asp/time/Duration.hpp>

#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qs {

using CertTime = std::chrono::sys_seconds;

/// Source of entropy for key and serial number generation.
/// Must fill the whole buffer and return true, or return false on failure.
using RandomSource = move_only_function<bool(uint8_t*, size_t)>;

/// A certificate chain (leaf first) together with the private key of the leaf.
class Identity {
public:
    enum class KeyFormat {
        Pkcs8,
        Sec1Ec,
        Pkcs1Rsa,
    };

    Identity(const Identity&) = default;
    Identity& operator=(const Identity&) = default;
    Identity(Identity&&) noexcept = default;
    Identity& operator=(Identity&&) noexcept = default;

    /// Generates a new ECDSA P-256 key and a self-signed certificate for `subject`,
    /// valid from now (rounded down to the second) until now + `validity`.
    /// The subject is also added as a DNS subjectAltName.
    /// If `random` is set, the private key and the serial number are derived from it.
    static CertResult<Identity> generateSelfSigned(
        std::string_view subject,
        const asp::time::Duration& validity,
        RandomSource random = {}
    );

    /// Loads a certificate (or a chain of them, leaf first) and its private key.
    /// Both may be PEM or DER, PEM is detected by its `-----BEGIN` armor.
    static CertResult<Identity> loadFromBytes(std::span<const uint8_t> cert, std::span<const uint8_t> key);

    const std::vector<uint8_t>& certificateDer() const;
    const std::vector<std::vector<uint8_t>>& chain() const;
    const std::vector<uint8_t>& privateKeyDer() const;
    KeyFormat keyFormat() const;

    /// PEM encoding of the whole chain
    std::string certificatePem() const;
    std::string privateKeyPem() const;

    const Fingerprint& fingerprint() const;
    const std::string& subjectName() const;
    CertTime notBefore() const;
    CertTime notAfter() const;

    /// Succeeds if `notBefore <= at <= notAfter`.
    CertResult<> checkValidity(CertTime at) const;
    CertResult<> checkValidity() const;

private:
    Identity() = default;

    std::vector<std::vector<uint8_t>> m_chain;
    std::vector<uint8_t> m_key;
    KeyFormat m_keyFormat = KeyFormat::Sec1Ec;
    Fingerprint m_fingerprint{};
    std::string m_subject;
    CertTime m_notBefore{};
    CertTime m_notAfter{};
};

/// Checks the validity window of an arbitrary DER certificate.
CertResult<> checkCertificateDates(std::span<const uint8_t> der, CertTime at);

}
