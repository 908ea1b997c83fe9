#include <gtest/gtest.h>

#include <quicsock/tls/TlsConfig.hpp>
#include <asp/time/Duration.hpp>

using namespace qs;

namespace {

Identity makeIdentity() {
    auto res = Identity::generateSelfSigned("localhost", asp::time::Duration::fromSecs(600));
    EXPECT_TRUE(res.isOk());
    return std::move(res).unwrap();
}

}

TEST(TlsConfig, ServerRequiresIdentity) {
    auto res = TlsConfig::buildServer(std::nullopt, TrustPolicy::any());
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), ConfigError::MissingIdentity);
}

TEST(TlsConfig, EmptyPinnedSet) {
    auto res = TlsConfig::buildClient(std::nullopt, TrustPolicy::fingerprints({}));
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), ConfigError::TrustPolicy);
}

TEST(TlsConfig, EmptyCaSet) {
    auto res = TlsConfig::buildClient(std::nullopt, TrustPolicy::certificateAuthorities({}));
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), ConfigError::TrustPolicy);

    auto res2 = TlsConfig::buildClient(std::nullopt, TrustPolicy::certificateAuthorities({std::vector<uint8_t>{}}));
    ASSERT_TRUE(res2.isErr());
    EXPECT_EQ(res2.unwrapErr(), ConfigError::TrustPolicy);
}

TEST(TlsConfig, InvalidCa) {
    std::vector<uint8_t> garbage = {0x30, 0x03, 0x01, 0x02, 0x03};

    auto res = TlsConfig::buildClient(std::nullopt, TrustPolicy::certificateAuthorities({garbage}));
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isCertError());
    EXPECT_EQ(res.unwrapErr().asCertError().kind, CertError::Kind::Format);
}

TEST(TlsConfig, BuildClientAndServer) {
    auto id = makeIdentity();

    auto client = TlsConfig::buildClient(std::nullopt, TrustPolicy::fingerprint(id.fingerprint()));
    ASSERT_TRUE(client.isOk()) << client.unwrapErr().message();
    EXPECT_TRUE(client.unwrap()->isClient());
    EXPECT_EQ(client.unwrap()->trust().kind(), TrustPolicy::Kind::Fingerprints);
    EXPECT_NE(client.unwrap()->handle(), nullptr);

    auto server = TlsConfig::buildServer(id, TrustPolicy::any());
    ASSERT_TRUE(server.isOk()) << server.unwrapErr().message();
    EXPECT_TRUE(server.unwrap()->isServer());
    ASSERT_TRUE(server.unwrap()->identity().has_value());
    EXPECT_EQ(server.unwrap()->identity()->fingerprint(), id.fingerprint());
}

TEST(TrustPolicy, Matches) {
    auto a = makeIdentity();
    auto b = makeIdentity();

    EXPECT_TRUE(TrustPolicy::any().matches(a.fingerprint()));
    EXPECT_TRUE(TrustPolicy::any().isAny());

    auto pinned = TrustPolicy::fingerprint(a.fingerprint());
    EXPECT_TRUE(pinned.isSpecific());
    EXPECT_TRUE(pinned.matches(a.fingerprint()));
    EXPECT_FALSE(pinned.matches(b.fingerprint()));

    auto both = TrustPolicy::fingerprints({a.fingerprint(), b.fingerprint()});
    EXPECT_TRUE(both.matches(b.fingerprint()));
    EXPECT_EQ(both.pinnedFingerprints().size(), 2u);
}
