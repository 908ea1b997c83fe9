#include <quicsock/tls/Identity.hpp>
#include <quicsock/util/assert.hpp>
#include <quicsock/Log.hpp>
#include <fmt/chrono.h>

#include <wolfssl/options.h>
#include <wolfssl/ssl.h>
#include <wolfssl/wolfcrypt/settings.h>
#include <wolfssl/wolfcrypt/asn_public.h>
#include <wolfssl/wolfcrypt/ecc.h>
#include <wolfssl/wolfcrypt/rsa.h>
#include <wolfssl/wolfcrypt/random.h>
#include <wolfssl/wolfcrypt/error-crypt.h>

#include <algorithm>
#include <cstring>
#include <ctime>
#include <memory>

#if !defined(WOLFSSL_CERT_GEN) || !defined(WOLFSSL_ALT_NAMES)
# error "quicsock requires wolfSSL built with certificate generation and alt names (--enable-certgen --enable-altnames)"
#endif

using namespace std::chrono;
using Kind = qs::CertError::Kind;

namespace {

struct WolfRng {
    WC_RNG rng;
    int initCode;

    WolfRng() {
        initCode = wc_InitRng(&rng);
    }

    ~WolfRng() {
        if (initCode == 0) {
            wc_FreeRng(&rng);
        }
    }

    WolfRng(const WolfRng&) = delete;
    WolfRng& operator=(const WolfRng&) = delete;
};

struct EccKey {
    ecc_key key;

    EccKey() {
        wc_ecc_init(&key);
    }

    ~EccKey() {
        wc_ecc_free(&key);
    }

    void reset() {
        wc_ecc_free(&key);
        wc_ecc_init(&key);
    }

    EccKey(const EccKey&) = delete;
    EccKey& operator=(const EccKey&) = delete;
};

}

namespace qs {

// Certificate dates are ASN.1 UTCTime for years 1950 to 2049 and GeneralizedTime otherwise,
// stored with their tag and length as wolfSSL expects them in `Cert::beforeDate`.
static int encodeAsnTime(CertTime time, uint8_t* out, size_t outSize) {
    auto days = floor<std::chrono::days>(time);
    year_month_day ymd{days};
    hh_mm_ss hms{time - days};

    int yr = static_cast<int>(ymd.year());
    unsigned mo = static_cast<unsigned>(ymd.month());
    unsigned dy = static_cast<unsigned>(ymd.day());
    auto hr = hms.hours().count();
    auto mi = hms.minutes().count();
    auto se = hms.seconds().count();

    std::string body;
    uint8_t tag;

    if (yr >= 1950 && yr < 2050) {
        tag = 0x17;
        body = fmt::format("{:02}{:02}{:02}{:02}{:02}{:02}Z", yr % 100, mo, dy, hr, mi, se);
    } else {
        tag = 0x18;
        body = fmt::format("{:04}{:02}{:02}{:02}{:02}{:02}Z", yr, mo, dy, hr, mi, se);
    }

    if (body.size() + 2 > outSize) {
        return -1;
    }

    out[0] = tag;
    out[1] = static_cast<uint8_t>(body.size());
    std::memcpy(out + 2, body.data(), body.size());

    return static_cast<int>(body.size() + 2);
}

static CertTime fromTm(const struct tm& tm) {
    sys_days date = year{tm.tm_year + 1900} / month{static_cast<unsigned>(tm.tm_mon + 1)} / day{static_cast<unsigned>(tm.tm_mday)};
    return CertTime{date + hours{tm.tm_hour} + minutes{tm.tm_min} + seconds{tm.tm_sec}};
}

static bool isPem(std::span<const uint8_t> data) {
    std::string_view sv{reinterpret_cast<const char*>(data.data()), data.size()};
    return sv.find("-----BEGIN") != std::string_view::npos;
}

static CertResult<std::vector<std::vector<uint8_t>>> parseCertificates(std::span<const uint8_t> data) {
    if (data.empty()) {
        return Err(CertError(Kind::Format, "certificate is empty"));
    }

    std::vector<std::vector<uint8_t>> out;

    if (!isPem(data)) {
        out.emplace_back(data.begin(), data.end());
        return Ok(std::move(out));
    }

    constexpr std::string_view BEGIN = "-----BEGIN CERTIFICATE-----";
    constexpr std::string_view END = "-----END CERTIFICATE-----";

    std::string_view pem{reinterpret_cast<const char*>(data.data()), data.size()};
    size_t pos = 0;

    while ((pos = pem.find(BEGIN, pos)) != std::string_view::npos) {
        size_t end = pem.find(END, pos);
        if (end == std::string_view::npos) {
            return Err(CertError(Kind::Format, "unterminated PEM certificate block"));
        }

        end += END.size();
        auto block = pem.substr(pos, end - pos);

        std::vector<uint8_t> der(block.size());
        int ret = wc_CertPemToDer(
            reinterpret_cast<const unsigned char*>(block.data()), static_cast<int>(block.size()),
            der.data(), static_cast<int>(der.size()),
            CERT_TYPE
        );

        if (ret <= 0) {
            return Err(CertError(Kind::Format, "invalid PEM certificate", ret));
        }

        der.resize(ret);
        out.push_back(std::move(der));
        pos = end;
    }

    if (out.empty()) {
        return Err(CertError(Kind::Format, "no CERTIFICATE block found in PEM data"));
    }

    return Ok(std::move(out));
}

static CertResult<std::vector<uint8_t>> parseKey(std::span<const uint8_t> data) {
    if (data.empty()) {
        return Err(CertError(Kind::Format, "private key is empty"));
    }

    if (!isPem(data)) {
        return Ok(std::vector<uint8_t>(data.begin(), data.end()));
    }

    std::vector<uint8_t> der(data.size());
    int ret = wc_KeyPemToDer(
        data.data(), static_cast<int>(data.size()),
        der.data(), static_cast<int>(der.size()),
        nullptr
    );

    if (ret <= 0) {
        return Err(CertError(Kind::Format, "invalid PEM private key", ret));
    }

    der.resize(ret);
    return Ok(std::move(der));
}

static CertResult<Identity::KeyFormat> classifyKey(std::vector<uint8_t> der) {
    word32 start = 0;
    bool pkcs8 = wc_GetPkcs8TraditionalOffset(der.data(), &start, static_cast<word32>(der.size())) >= 0;
    if (!pkcs8) {
        start = 0;
    }

    int ret;
    {
        EccKey ecc;
        word32 idx = start;
        ret = wc_EccPrivateKeyDecode(der.data(), &idx, &ecc.key, static_cast<word32>(der.size()));
    }

    if (ret == 0) {
        return Ok(pkcs8 ? Identity::KeyFormat::Pkcs8 : Identity::KeyFormat::Sec1Ec);
    }

#ifndef NO_RSA
    RsaKey rsa;
    if (wc_InitRsaKey(&rsa, nullptr) == 0) {
        word32 idx = start;
        ret = wc_RsaPrivateKeyDecode(der.data(), &idx, &rsa, static_cast<word32>(der.size()));
        wc_FreeRsaKey(&rsa);

        if (ret == 0) {
            return Ok(pkcs8 ? Identity::KeyFormat::Pkcs8 : Identity::KeyFormat::Pkcs1Rsa);
        }
    }
#endif

    return Err(CertError(Kind::Format, "unsupported or malformed private key", ret));
}

struct CertInfo {
    std::string subject;
    CertTime notBefore;
    CertTime notAfter;
};

static CertResult<CertInfo> readCertificateInfo(std::span<const uint8_t> der) {
    Cert cert;
    int ret = wc_InitCert(&cert);
    if (ret != 0) {
        return Err(CertError(Kind::Format, "failed to initialize certificate", ret));
    }

    ret = wc_SetSubjectBuffer(&cert, der.data(), static_cast<int>(der.size()));
    if (ret != 0) {
        return Err(CertError(Kind::Format, "could not parse the certificate", ret));
    }

    ret = wc_SetDatesBuffer(&cert, der.data(), static_cast<int>(der.size()));
    if (ret != 0) {
        return Err(CertError(Kind::Format, "could not read the certificate validity", ret));
    }

    struct tm before{}, after{};
    ret = wc_GetCertDates(&cert, &before, &after);
    if (ret != 0) {
        return Err(CertError(Kind::Format, "could not read the certificate validity", ret));
    }

    return Ok(CertInfo {
        .subject = std::string(cert.subject.commonName),
        .notBefore = fromTm(before),
        .notAfter = fromTm(after),
    });
}

static CertResult<> validityAt(CertTime notBefore, CertTime notAfter, CertTime at) {
    if (at < notBefore) {
        return Err(CertError(Kind::NotYetValid, fmt::format("valid from {:%F %T} UTC", notBefore)));
    }

    if (at > notAfter) {
        return Err(CertError(Kind::Expired, fmt::format("expired at {:%F %T} UTC", notAfter)));
    }

    return Ok();
}

static CertResult<> checkKeyMatches(const std::vector<uint8_t>& cert, const std::vector<uint8_t>& key) {
    std::unique_ptr<WOLFSSL_CTX, WolfsslCtxDeleter> ctx(wolfSSL_CTX_new(wolfTLSv1_3_server_method()));
    if (!ctx) {
        return Err(CertError(Kind::Format, fmt::format("failed to create TLS context: {}", lastTlsError().message())));
    }

    if (wolfSSL_CTX_use_certificate_buffer(ctx.get(), cert.data(), static_cast<long>(cert.size()), WOLFSSL_FILETYPE_ASN1) != WOLFSSL_SUCCESS) {
        return Err(CertError(Kind::Format, fmt::format("certificate rejected: {}", lastTlsError().message())));
    }

    // newer wolfSSL versions already compare the key against the certificate here
    if (wolfSSL_CTX_use_PrivateKey_buffer(ctx.get(), key.data(), static_cast<long>(key.size()), WOLFSSL_FILETYPE_ASN1) != WOLFSSL_SUCCESS) {
        return Err(CertError(Kind::KeyMismatch));
    }

    if (wolfSSL_CTX_check_private_key(ctx.get()) != WOLFSSL_SUCCESS) {
        return Err(CertError(Kind::KeyMismatch));
    }

    return Ok();
}

CertResult<> checkCertificateDates(std::span<const uint8_t> der, CertTime at) {
    auto info = GEODE_UNWRAP(readCertificateInfo(der));
    return validityAt(info.notBefore, info.notAfter, at);
}

CertResult<Identity> Identity::generateSelfSigned(
    std::string_view subject,
    const asp::time::Duration& validity,
    RandomSource random
) {
    if (subject.empty() || subject.size() >= CTC_NAME_SIZE) {
        return Err(CertError(Kind::Generation, fmt::format("subject must be between 1 and {} characters", CTC_NAME_SIZE - 1)));
    }

    if (validity.millis() < 1000) {
        return Err(CertError(Kind::Generation, "validity period must be at least one second"));
    }

    // certificate times have second precision, round outwards so the whole requested window is covered
    auto now = system_clock::now();
    auto notBefore = floor<seconds>(now);
    auto notAfter = ceil<seconds>(now + milliseconds(validity.millis()));
    auto validSecs = (notAfter - notBefore).count();

    if (year_month_day{floor<days>(notAfter)}.year() > year{9999}) {
        return Err(CertError(Kind::Generation, "validity period is too long"));
    }

    WolfRng rng;
    if (rng.initCode != 0) {
        return Err(CertError(Kind::Generation, "failed to initialize the system RNG", rng.initCode));
    }

    EccKey key;
    int ret = 0;

    if (random) {
        // derive the private scalar from the caller's source, retry if it falls outside the curve order
        bool ok = false;

        for (int attempt = 0; attempt < 8 && !ok; attempt++) {
            uint8_t scalar[32];
            if (!random(scalar, sizeof(scalar))) {
                return Err(CertError(Kind::Generation, "random source failed to produce key material"));
            }

            key.reset();
            ret = wc_ecc_import_private_key_ex(scalar, sizeof(scalar), nullptr, 0, &key.key, ECC_SECP256R1);
            if (ret == 0) ret = wc_ecc_make_pub_ex(&key.key, nullptr, &rng.rng);
            if (ret == 0) ret = wc_ecc_check_key(&key.key);

            std::memset(scalar, 0, sizeof(scalar));
            ok = ret == 0;
        }

        if (!ok) {
            return Err(CertError(Kind::Generation, "random source did not produce a valid P-256 key", ret));
        }
    } else {
        ret = wc_ecc_make_key_ex(&rng.rng, 32, &key.key, ECC_SECP256R1);
        if (ret != 0) {
            return Err(CertError(Kind::Generation, "failed to generate a P-256 key", ret));
        }
    }

    uint8_t serial[16];
    bool serialOk = random
        ? random(serial, sizeof(serial))
        : wc_RNG_GenerateBlock(&rng.rng, serial, sizeof(serial)) == 0;

    if (!serialOk) {
        return Err(CertError(Kind::Generation, "failed to generate a serial number"));
    }

    // positive and without a leading zero byte
    serial[0] &= 0x7f;
    if (serial[0] == 0) {
        serial[0] = 0x01;
    }

    Cert cert;
    ret = wc_InitCert(&cert);
    if (ret != 0) {
        return Err(CertError(Kind::Generation, "failed to initialize certificate", ret));
    }

    cert.sigType = CTC_SHA256wECDSA;
    cert.isCA = 0;
    cert.daysValid = static_cast<int>(std::max<int64_t>(1, validSecs / 86400));
    std::memcpy(cert.serial, serial, sizeof(serial));
    cert.serialSz = sizeof(serial);

    std::memcpy(cert.subject.commonName, subject.data(), subject.size());
    cert.subject.commonName[subject.size()] = '\0';

    cert.beforeDateSz = encodeAsnTime(CertTime{notBefore}, cert.beforeDate, sizeof(cert.beforeDate));
    cert.afterDateSz = encodeAsnTime(CertTime{notAfter}, cert.afterDate, sizeof(cert.afterDate));
    if (cert.beforeDateSz < 0 || cert.afterDateSz < 0) {
        return Err(CertError(Kind::Generation, "failed to encode the validity period"));
    }

    // subjectAltName: SEQUENCE { [2] dNSName }
    size_t nameLen = subject.size();
    cert.altNames[0] = 0x30;
    cert.altNames[1] = static_cast<uint8_t>(nameLen + 2);
    cert.altNames[2] = 0x82;
    cert.altNames[3] = static_cast<uint8_t>(nameLen);
    std::memcpy(cert.altNames + 4, subject.data(), nameLen);
    cert.altNamesSz = static_cast<int>(nameLen + 4);

    std::vector<uint8_t> der(4096);

    ret = wc_MakeCert(&cert, der.data(), static_cast<word32>(der.size()), nullptr, &key.key, &rng.rng);
    if (ret < 0) {
        return Err(CertError(Kind::Generation, "failed to encode the certificate", ret));
    }

    ret = wc_SignCert(cert.bodySz, cert.sigType, der.data(), static_cast<word32>(der.size()), nullptr, &key.key, &rng.rng);
    if (ret < 0) {
        return Err(CertError(Kind::Generation, "failed to sign the certificate", ret));
    }

    der.resize(ret);

    std::vector<uint8_t> keyDer(512);
    ret = wc_EccKeyToDer(&key.key, keyDer.data(), static_cast<word32>(keyDer.size()));
    if (ret < 0) {
        return Err(CertError(Kind::Generation, "failed to encode the private key", ret));
    }

    keyDer.resize(ret);

    Identity id;
    id.m_fingerprint = sha256Hash(der);
    id.m_chain.push_back(std::move(der));
    id.m_key = std::move(keyDer);
    id.m_keyFormat = KeyFormat::Sec1Ec;
    id.m_subject = std::string(subject);
    id.m_notBefore = CertTime{notBefore};
    id.m_notAfter = CertTime{notAfter};

    log::debug("Generated self-signed certificate for '{}' (fingerprint {})", id.m_subject, id.m_fingerprint.toString());

    return Ok(std::move(id));
}

CertResult<Identity> Identity::loadFromBytes(std::span<const uint8_t> cert, std::span<const uint8_t> key) {
    Identity id;
    id.m_chain = GEODE_UNWRAP(parseCertificates(cert));
    id.m_key = GEODE_UNWRAP(parseKey(key));
    id.m_keyFormat = GEODE_UNWRAP(classifyKey(id.m_key));

    auto& leaf = id.m_chain.front();
    auto info = GEODE_UNWRAP(readCertificateInfo(leaf));
    GEODE_UNWRAP(checkKeyMatches(leaf, id.m_key));

    id.m_fingerprint = sha256Hash(leaf);
    id.m_subject = std::move(info.subject);
    id.m_notBefore = info.notBefore;
    id.m_notAfter = info.notAfter;

    return Ok(std::move(id));
}

const std::vector<uint8_t>& Identity::certificateDer() const {
    return m_chain.front();
}

const std::vector<std::vector<uint8_t>>& Identity::chain() const {
    return m_chain;
}

const std::vector<uint8_t>& Identity::privateKeyDer() const {
    return m_key;
}

Identity::KeyFormat Identity::keyFormat() const {
    return m_keyFormat;
}

static std::string derToPem(const std::vector<uint8_t>& der, int type) {
    std::string out(der.size() * 2 + 128, '\0');

    int ret = wc_DerToPem(
        der.data(), static_cast<word32>(der.size()),
        reinterpret_cast<byte*>(out.data()), static_cast<word32>(out.size()),
        type
    );

    // both inputs were already validated when the identity was built
    QS_ASSERT(ret > 0);

    out.resize(ret);
    return out;
}

std::string Identity::certificatePem() const {
    std::string out;

    for (auto& cert : m_chain) {
        out += derToPem(cert, CERT_TYPE);
    }

    return out;
}

std::string Identity::privateKeyPem() const {
    switch (m_keyFormat) {
        case KeyFormat::Pkcs8: return derToPem(m_key, PKCS8_PRIVATEKEY_TYPE);
        case KeyFormat::Sec1Ec: return derToPem(m_key, ECC_PRIVATEKEY_TYPE);
        case KeyFormat::Pkcs1Rsa: return derToPem(m_key, PRIVATEKEY_TYPE);
    }

    qs::unreachable();
}

const Fingerprint& Identity::fingerprint() const {
    return m_fingerprint;
}

const std::string& Identity::subjectName() const {
    return m_subject;
}

CertTime Identity::notBefore() const {
    return m_notBefore;
}

CertTime Identity::notAfter() const {
    return m_notAfter;
}

CertResult<> Identity::checkValidity(CertTime at) const {
    return validityAt(m_notBefore, m_notAfter, at);
}

CertResult<> Identity::checkValidity() const {
    return this->checkValidity(floor<seconds>(system_clock::now()));
}

}
