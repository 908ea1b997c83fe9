#include <gtest/gtest.h>

#include <quicsock/tls/Identity.hpp>
#include <asp/time/Duration.hpp>

using namespace qs;
using asp::time::Duration;

namespace {

std::span<const uint8_t> bytesOf(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

Identity generate(std::string_view subject = "localhost", Duration validity = Duration::fromSecs(3600)) {
    auto res = Identity::generateSelfSigned(subject, validity);
    EXPECT_TRUE(res.isOk()) << res.unwrapErr().message();
    return std::move(res).unwrap();
}

}

TEST(Identity, GenerateSelfSigned) {
    auto id = generate();

    EXPECT_EQ(id.subjectName(), "localhost");
    EXPECT_EQ(id.chain().size(), 1u);
    EXPECT_FALSE(id.privateKeyDer().empty());
    EXPECT_EQ(id.keyFormat(), Identity::KeyFormat::Sec1Ec);
    EXPECT_EQ(id.fingerprint(), sha256Hash(id.certificateDer()));
    EXPECT_GE(id.notAfter() - id.notBefore(), std::chrono::seconds{3600});
    EXPECT_LE(id.notAfter() - id.notBefore(), std::chrono::seconds{3601});
    EXPECT_TRUE(id.checkValidity().isOk());
}

TEST(Identity, FreshKeysEveryTime) {
    auto a = generate();
    auto b = generate();

    EXPECT_NE(a.fingerprint(), b.fingerprint());
    EXPECT_NE(a.privateKeyDer(), b.privateKeyDer());
}

TEST(Identity, ValidityBoundary) {
    auto id = generate("boundary", Duration::fromSecs(60));

    EXPECT_TRUE(id.checkValidity(id.notBefore()).isOk());
    EXPECT_TRUE(id.checkValidity(id.notAfter()).isOk());

    auto early = id.checkValidity(id.notBefore() - std::chrono::seconds{1});
    ASSERT_TRUE(early.isErr());
    EXPECT_EQ(early.unwrapErr().kind, CertError::Kind::NotYetValid);

    auto late = id.checkValidity(id.notAfter() + std::chrono::seconds{1});
    ASSERT_TRUE(late.isErr());
    EXPECT_EQ(late.unwrapErr().kind, CertError::Kind::Expired);

    EXPECT_TRUE(checkCertificateDates(id.certificateDer(), id.notAfter()).isOk());
    EXPECT_TRUE(checkCertificateDates(id.certificateDer(), id.notAfter() + std::chrono::seconds{1}).isErr());
}

TEST(Identity, ValidityCoversRequestedWindow) {
    using namespace std::chrono;

    for (auto validity : {Duration::fromSecs(60), Duration::fromMillis(1500)}) {
        auto before = system_clock::now();
        auto id = generate("window", validity);
        auto after = system_clock::now();

        auto requested = milliseconds(validity.millis());

        // valid until at least now + validity, and never a full second beyond it
        EXPECT_GE(id.notAfter(), before + requested);
        EXPECT_LE(id.notAfter(), ceil<seconds>(after + requested));
        EXPECT_LE(id.notBefore(), before);

        EXPECT_TRUE(id.checkValidity(floor<seconds>(after + requested) - seconds{1}).isOk());
        EXPECT_TRUE(id.checkValidity(ceil<seconds>(after + requested) + seconds{1}).isErr());
    }
}

TEST(Identity, InvalidParameters) {
    auto empty = Identity::generateSelfSigned("", Duration::fromSecs(60));
    ASSERT_TRUE(empty.isErr());
    EXPECT_EQ(empty.unwrapErr().kind, CertError::Kind::Generation);

    auto zero = Identity::generateSelfSigned("localhost", Duration::fromMillis(500));
    ASSERT_TRUE(zero.isErr());
    EXPECT_EQ(zero.unwrapErr().kind, CertError::Kind::Generation);
}

TEST(Identity, FailingRandomSource) {
    auto res = Identity::generateSelfSigned("localhost", Duration::fromSecs(60), [](uint8_t*, size_t) {
        return false;
    });

    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr().kind, CertError::Kind::Generation);
}

TEST(Identity, PemRoundTrip) {
    auto id = generate();

    auto certPem = id.certificatePem();
    auto keyPem = id.privateKeyPem();
    EXPECT_TRUE(certPem.starts_with("-----BEGIN CERTIFICATE-----"));

    auto loaded = Identity::loadFromBytes(bytesOf(certPem), bytesOf(keyPem));
    ASSERT_TRUE(loaded.isOk()) << loaded.unwrapErr().message();

    auto& l = loaded.unwrap();
    EXPECT_EQ(l.fingerprint(), id.fingerprint());
    EXPECT_EQ(l.subjectName(), "localhost");
    EXPECT_EQ(l.notBefore(), id.notBefore());
    EXPECT_EQ(l.notAfter(), id.notAfter());

    // DER works as well
    auto der = Identity::loadFromBytes(id.certificateDer(), id.privateKeyDer());
    ASSERT_TRUE(der.isOk()) << der.unwrapErr().message();
    EXPECT_EQ(der.unwrap().fingerprint(), id.fingerprint());
}

TEST(Identity, KeyMismatch) {
    auto a = generate();
    auto b = generate();

    auto res = Identity::loadFromBytes(a.certificateDer(), b.privateKeyDer());
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr().kind, CertError::Kind::KeyMismatch);
}

TEST(Identity, FormatErrors) {
    auto id = generate();
    std::string garbage = "definitely not a certificate";

    auto badCert = Identity::loadFromBytes(bytesOf(garbage), id.privateKeyDer());
    ASSERT_TRUE(badCert.isErr());
    EXPECT_EQ(badCert.unwrapErr().kind, CertError::Kind::Format);

    auto badKey = Identity::loadFromBytes(id.certificateDer(), bytesOf(garbage));
    ASSERT_TRUE(badKey.isErr());
    EXPECT_EQ(badKey.unwrapErr().kind, CertError::Kind::Format);

    auto emptyCert = Identity::loadFromBytes({}, id.privateKeyDer());
    ASSERT_TRUE(emptyCert.isErr());
    EXPECT_EQ(emptyCert.unwrapErr().kind, CertError::Kind::Format);

    std::string truncated = "-----BEGIN CERTIFICATE-----\nMIIB\n";
    auto unterminated = Identity::loadFromBytes(bytesOf(truncated), id.privateKeyDer());
    ASSERT_TRUE(unterminated.isErr());
    EXPECT_EQ(unterminated.unwrapErr().kind, CertError::Kind::Format);
}

TEST(Fingerprint, HexRoundTrip) {
    auto id = generate();
    auto hex = id.fingerprint().toString();

    EXPECT_EQ(hex.size(), 64u);

    auto parsed = Fingerprint::fromHex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id.fingerprint());

    EXPECT_FALSE(Fingerprint::fromHex("abcd").has_value());
    EXPECT_FALSE(Fingerprint::fromHex(std::string(64, 'z')).has_value());
}

TEST(Fingerprint, ColonSeparated) {
    std::string hex = "AB:CD";
    for (int i = 0; i < 30; i++) hex += ":00";

    auto parsed = Fingerprint::fromHex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->data[0], 0xab);
    EXPECT_EQ(parsed->data[1], 0xcd);
    EXPECT_EQ(parsed->data[31], 0x00);
}
