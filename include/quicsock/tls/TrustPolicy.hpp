#pragma once

#include "Error.hpp"
#include <quicsock/util/hash.hpp>

#include <vector>

namespace qs {

/// Decides which peer certificates are accepted during the handshake.
class TrustPolicy {
public:
    enum class Kind {
        /// Accept any certificate. No authentication of the peer, only encryption.
        Any,
        /// Accept only a leaf certificate whose SHA-256 fingerprint is in the set
        Fingerprints,
        /// Accept certificates that chain up to one of the given CAs
        CertificateAuthorities,
        /// Accept certificates that chain up to the system root store
        SystemRoots,
    };

    static TrustPolicy any();
    static TrustPolicy fingerprint(const Fingerprint& fp);
    static TrustPolicy fingerprints(std::vector<Fingerprint> fps);
    /// Each entry is one CA certificate (or bundle), PEM or DER.
    static TrustPolicy certificateAuthorities(std::vector<std::vector<uint8_t>> cas);
    static TrustPolicy systemRoots();

    Kind kind() const;
    bool isAny() const;
    bool isSpecific() const;

    const std::vector<Fingerprint>& pinnedFingerprints() const;
    const std::vector<std::vector<uint8_t>>& certificateAuthorityList() const;

    /// True if the policy accepts any certificate or pins this fingerprint.
    bool matches(const Fingerprint& fp) const;

    /// Fails with `ConfigError::TrustPolicy` if a specific policy has nothing to trust.
    ConfigResult<> validate() const;

    std::string describe() const;

private:
    TrustPolicy(Kind kind) : m_kind(kind) {}

    Kind m_kind;
    std::vector<Fingerprint> m_fingerprints;
    std::vector<std::vector<uint8_t>> m_cas;
};

}
