#include <quicsock/tls/TrustPolicy.hpp>
#include <fmt/format.h>

#include <algorithm>

namespace qs {

TrustPolicy TrustPolicy::any() {
    return TrustPolicy(Kind::Any);
}

TrustPolicy TrustPolicy::fingerprint(const Fingerprint& fp) {
    return fingerprints({fp});
}

TrustPolicy TrustPolicy::fingerprints(std::vector<Fingerprint> fps) {
    TrustPolicy p(Kind::Fingerprints);
    p.m_fingerprints = std::move(fps);
    return p;
}

TrustPolicy TrustPolicy::certificateAuthorities(std::vector<std::vector<uint8_t>> cas) {
    TrustPolicy p(Kind::CertificateAuthorities);
    p.m_cas = std::move(cas);
    return p;
}

TrustPolicy TrustPolicy::systemRoots() {
    return TrustPolicy(Kind::SystemRoots);
}

TrustPolicy::Kind TrustPolicy::kind() const {
    return m_kind;
}

bool TrustPolicy::isAny() const {
    return m_kind == Kind::Any;
}

bool TrustPolicy::isSpecific() const {
    return m_kind != Kind::Any;
}

const std::vector<Fingerprint>& TrustPolicy::pinnedFingerprints() const {
    return m_fingerprints;
}

const std::vector<std::vector<uint8_t>>& TrustPolicy::certificateAuthorityList() const {
    return m_cas;
}

bool TrustPolicy::matches(const Fingerprint& fp) const {
    if (m_kind == Kind::Any) {
        return true;
    }

    return std::find(m_fingerprints.begin(), m_fingerprints.end(), fp) != m_fingerprints.end();
}

ConfigResult<> TrustPolicy::validate() const {
    switch (m_kind) {
        case Kind::Fingerprints: {
            if (m_fingerprints.empty()) {
                return Err(ConfigError::TrustPolicy);
            }
        } break;

        case Kind::CertificateAuthorities: {
            bool empty = m_cas.empty() || std::any_of(m_cas.begin(), m_cas.end(), [](auto& ca) { return ca.empty(); });
            if (empty) {
                return Err(ConfigError::TrustPolicy);
            }
        } break;

        default: break;
    }

    return Ok();
}

std::string TrustPolicy::describe() const {
    switch (m_kind) {
        case Kind::Any: return "any certificate";
        case Kind::Fingerprints: return fmt::format("{} pinned fingerprint(s)", m_fingerprints.size());
        case Kind::CertificateAuthorities: return fmt::format("{} certificate authorities", m_cas.size());
        case Kind::SystemRoots: return "system root store";
    }

    qs::unreachable();
}

}
