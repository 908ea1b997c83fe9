#include "TestUtil.hpp"

#include <asp/sync/Mutex.hpp>

#include <chrono>
#include <thread>

using namespace qs;
using namespace qs::test;
using asp::time::Duration;

class SessionTest : public LoopbackTest {};

TEST_F(SessionTest, Handshake) {
    this->connectPair();

    EXPECT_EQ(m_client->state(), SessionState::Established);
    EXPECT_EQ(m_server->state(), SessionState::Established);

    auto fp = m_client->peerFingerprint();
    ASSERT_TRUE(fp.has_value());
    EXPECT_EQ(*fp, m_identity->fingerprint());

    // anonymous client
    EXPECT_FALSE(m_server->peerFingerprint().has_value());

    EXPECT_EQ(m_server->remoteAddress().port(), m_client->localAddress().port());
    EXPECT_EQ(m_endpoint->connectionCount(), 1u);
}

TEST_F(SessionTest, PinnedFingerprint) {
    this->connectPair(TrustPolicy::fingerprint(m_identity->fingerprint()));
    EXPECT_TRUE(m_client->isEstablished());
}

TEST_F(SessionTest, FingerprintMismatch) {
    auto other = Identity::generateSelfSigned("localhost", Duration::fromSecs(60));
    ASSERT_TRUE(other.isOk());

    auto server = startOn(m_endpoint->accept());
    auto res = blockOn(Session::connect(
        m_endpoint->localAddress(),
        this->clientTls(TrustPolicy::fingerprint(other.unwrap().fingerprint())),
        testOptions()
    ));

    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isHandshakeError()) << res.unwrapErr().message();
    EXPECT_EQ(res.unwrapErr().asHandshakeError().cause, HandshakeError::Cause::CertRejected);

    // the server sees the alert and gives up as well
    EXPECT_TRUE(server.get().isErr());
}

TEST_F(SessionTest, ServerPinsClientIdentity) {
    auto clientId = Identity::generateSelfSigned("client", Duration::fromSecs(60));
    ASSERT_TRUE(clientId.isOk());
    auto clientFp = clientId.unwrap().fingerprint();

    auto serverTls = TlsConfig::buildServer(*m_identity, TrustPolicy::fingerprint(clientFp));
    ASSERT_TRUE(serverTls.isOk());
    auto pinned = blockOn(Endpoint::bind(loopbackAddress(), std::move(serverTls).unwrap(), testOptions()));
    ASSERT_TRUE(pinned.isOk());
    auto endpoint = std::move(pinned).unwrap();

    auto clientTls = TlsConfig::buildClient(std::move(clientId).unwrap(), TrustPolicy::any());
    ASSERT_TRUE(clientTls.isOk());

    auto server = startOn(endpoint->accept());
    auto client = blockOn(Session::connect(endpoint->localAddress(), std::move(clientTls).unwrap(), testOptions()));
    ASSERT_TRUE(client.isOk()) << client.unwrapErr().message();

    auto sres = server.get();
    ASSERT_TRUE(sres.isOk()) << sres.unwrapErr().message();

    auto fp = sres.unwrap()->peerFingerprint();
    ASSERT_TRUE(fp.has_value());
    EXPECT_EQ(*fp, clientFp);

    client.unwrap()->close();
    sres.unwrap()->close();
    endpoint->close();
}

TEST_F(SessionTest, ServerRejectsUnpinnedClient) {
    auto pinnedId = Identity::generateSelfSigned("expected", Duration::fromSecs(60));
    auto clientId = Identity::generateSelfSigned("intruder", Duration::fromSecs(60));
    ASSERT_TRUE(pinnedId.isOk());
    ASSERT_TRUE(clientId.isOk());

    auto serverTls = TlsConfig::buildServer(*m_identity, TrustPolicy::fingerprint(pinnedId.unwrap().fingerprint()));
    ASSERT_TRUE(serverTls.isOk());
    auto pinned = blockOn(Endpoint::bind(loopbackAddress(), std::move(serverTls).unwrap(), testOptions()));
    ASSERT_TRUE(pinned.isOk());
    auto endpoint = std::move(pinned).unwrap();

    auto clientTls = TlsConfig::buildClient(std::move(clientId).unwrap(), TrustPolicy::any());
    ASSERT_TRUE(clientTls.isOk());

    auto server = startOn(endpoint->accept());
    auto res = blockOn(Session::connect(endpoint->localAddress(), std::move(clientTls).unwrap(), testOptions()));

    // the client only counts as connected after HANDSHAKE_DONE, which the server never sends
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isHandshakeError()) << res.unwrapErr().message();
    EXPECT_EQ(res.unwrapErr().asHandshakeError().cause, HandshakeError::Cause::CertRejected);

    auto sres = server.get();
    ASSERT_TRUE(sres.isErr());
    ASSERT_TRUE(sres.unwrapErr().isHandshakeError()) << sres.unwrapErr().message();
    EXPECT_EQ(sres.unwrapErr().asHandshakeError().cause, HandshakeError::Cause::CertRejected);

    endpoint->close();
}

TEST_F(SessionTest, HandshakeTimeout) {
    // a second endpoint that never accepts anything
    auto tls = TlsConfig::buildServer(*m_identity, TrustPolicy::any());
    ASSERT_TRUE(tls.isOk());
    auto silent = blockOn(Endpoint::bind(loopbackAddress(), std::move(tls).unwrap()));
    ASSERT_TRUE(silent.isOk());

    auto options = testOptions();
    options.handshakeTimeout = Duration::fromMillis(500);

    auto res = blockOn(Session::connect(silent.unwrap()->localAddress(), this->clientTls(), options));
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isHandshakeError()) << res.unwrapErr().message();
    EXPECT_EQ(res.unwrapErr().asHandshakeError().cause, HandshakeError::Cause::Timeout);
}

TEST_F(SessionTest, CancelledConnect) {
    arc::CancellationToken cancel;
    cancel.cancel();

    auto res = blockOn(Session::connect(m_endpoint->localAddress(), this->clientTls(), testOptions(), &cancel));
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isHandshakeError());
    EXPECT_EQ(res.unwrapErr().asHandshakeError().cause, HandshakeError::Cause::Cancelled);
}

TEST_F(SessionTest, ConnectRequiresClientConfig) {
    auto res = blockOn(Session::connect(m_endpoint->localAddress(), m_endpoint->tlsConfig(), testOptions()));
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), SessionError::InvalidArgument);
}

TEST_F(SessionTest, CloseIsIdempotent) {
    this->connectPair();

    asp::Mutex<std::vector<SessionState>> states;
    m_client->setStateCallback([&](SessionState state) {
        states.lock()->push_back(state);
    });

    m_client->close("done");
    m_client->close("again");
    blockOn(m_client->closed());

    EXPECT_EQ(m_client->state(), SessionState::Closed);
    ASSERT_TRUE(m_client->closeReason().has_value());
    EXPECT_EQ(m_client->closeReason()->kind, CloseReason::Kind::Local);
    EXPECT_EQ(m_client->closeReason()->detail, "done");

    std::vector<SessionState> expected{SessionState::Closing, SessionState::Closed};
    EXPECT_EQ(*states.lock(), expected);

    // the peer learns about it through CONNECTION_CLOSE
    blockOn(m_server->closed());
    ASSERT_TRUE(m_server->closeReason().has_value());
    EXPECT_EQ(m_server->closeReason()->kind, CloseReason::Kind::PeerClosed);
    EXPECT_EQ(m_server->closeReason()->detail, "done");

    m_client->setStateCallback({});
}

TEST_F(SessionTest, CallbackClearsItself) {
    this->connectPair();

    auto session = m_client.get();
    asp::Mutex<std::vector<SessionState>> states;

    m_client->setStateCallback([&, session](SessionState state) {
        states.lock()->push_back(state);

        if (state == SessionState::Closed) {
            session->setStateCallback({});
        }
    });

    m_client->close();
    blockOn(m_client->closed());

    std::vector<SessionState> expected{SessionState::Closing, SessionState::Closed};
    EXPECT_EQ(*states.lock(), expected);
}

TEST_F(SessionTest, CallbackReplacesItself) {
    this->connectPair();

    auto session = m_client.get();
    asp::Mutex<std::vector<SessionState>> first, second;

    m_client->setStateCallback([&, session](SessionState state) {
        first.lock()->push_back(state);

        session->setStateCallback([&](SessionState state) {
            second.lock()->push_back(state);
        });
    });

    m_client->close();
    blockOn(m_client->closed());

    EXPECT_EQ(*first.lock(), std::vector{SessionState::Closing});
    EXPECT_EQ(*second.lock(), std::vector{SessionState::Closed});

    m_client->setStateCallback({});
}

TEST_F(SessionTest, OpenChannelAfterClose) {
    this->connectPair();
    m_client->close();

    auto res = blockOn(m_client->openChannel(Direction::Send));
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), SessionError::SessionClosed);

    auto res2 = blockOn(m_client->acceptChannel(Direction::Receive));
    ASSERT_TRUE(res2.isErr());
    EXPECT_EQ(res2.unwrapErr(), SessionError::SessionClosed);
}

TEST_F(SessionTest, InvalidChunkSize) {
    this->connectPair();

    auto zero = blockOn(m_client->openChannel(Direction::Send, 0));
    ASSERT_TRUE(zero.isErr());
    EXPECT_EQ(zero.unwrapErr(), SessionError::InvalidChunkSize);

    auto tooLarge = blockOn(m_client->openChannel(Direction::Send, ChannelOptions {
        .chunkSize = 2048,
        .maxFrameSize = 1024,
    }));
    ASSERT_TRUE(tooLarge.isErr());
    EXPECT_EQ(tooLarge.unwrapErr(), SessionError::InvalidChunkSize);

    auto overLimit = blockOn(m_client->openChannel(Direction::Send, ChannelOptions {
        .maxFrameSize = MAX_FRAME_SIZE_LIMIT + 1,
    }));
    ASSERT_TRUE(overLimit.isErr());
    EXPECT_EQ(overLimit.unwrapErr(), SessionError::InvalidChunkSize);
}

TEST_F(SessionTest, CloseAbortsChannels) {
    this->connectPair();

    auto res = blockOn(m_client->openChannel(Direction::Send));
    ASSERT_TRUE(res.isOk());
    auto channel = std::move(res).unwrap();
    EXPECT_EQ(m_client->channelCount(), 1u);

    m_client->close();

    EXPECT_EQ(channel.state(), ChannelState::Aborted);
    EXPECT_EQ(m_client->channelCount(), 0u);

    auto info = channel.abortInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->reason, AbortReason::SessionClosed);
    EXPECT_FALSE(info->remote);

    std::vector<uint8_t> data(16, 0x42);
    auto wres = blockOn(channel.write(data));
    ASSERT_TRUE(wres.isErr());
    ASSERT_TRUE(wres.unwrapErr().isChannelAborted());
    EXPECT_EQ(wres.unwrapErr().asChannelAborted().reason, AbortReason::SessionClosed);
}

TEST_F(SessionTest, WrongDirection) {
    this->connectPair();

    auto channel = blockOn(m_client->openChannel(Direction::Send)).unwrap();

    auto res = blockOn(channel.read());
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), SessionError::WrongDirection);
}

TEST_F(SessionTest, ReceiverOpensChannel) {
    this->connectPair();

    // the receiving side opens the stream, the peer only learns about it through our FIN
    auto accepted = startOn(m_server->acceptChannel(Direction::Send));
    auto receiver = blockOn(m_client->openChannel(Direction::Receive)).unwrap();

    auto sres = accepted.get();
    ASSERT_TRUE(sres.isOk()) << sres.unwrapErr().message();
    auto sender = std::move(sres).unwrap();
    EXPECT_EQ(sender.id(), receiver.id());

    auto data = patternBytes(5000);
    auto received = startOn(receiver.readToEnd());

    ASSERT_TRUE(blockOn(sender.write(data)).isOk());
    ASSERT_TRUE(blockOn(sender.finish()).isOk());

    auto out = received.get();
    ASSERT_TRUE(out.isOk()) << out.unwrapErr().message();
    EXPECT_EQ(out.unwrap(), data);
    EXPECT_EQ(receiver.state(), ChannelState::Completed);
    EXPECT_EQ(sender.state(), ChannelState::Completed);
}

TEST_F(SessionTest, ConcurrentChannels) {
    this->connectPair();

    auto a = patternBytes(100000, 1);
    auto b = patternBytes(70000, 2);

    auto first = blockOn(m_client->openChannel(Direction::Send, 1000)).unwrap();
    auto second = blockOn(m_client->openChannel(Direction::Send, 3000)).unwrap();

    // interleave writes on both channels before the peer accepts anything
    ASSERT_TRUE(blockOn(first.write(std::span{a}.first(50000))).isOk());
    ASSERT_TRUE(blockOn(second.write(b)).isOk());
    ASSERT_TRUE(blockOn(first.write(std::span{a}.subspan(50000))).isOk());

    auto finished = startOn([](TransferChannel& x, TransferChannel& y) -> arc::Future<bool> {
        bool ok = (co_await x.finish()).isOk();
        ok = (co_await y.finish()).isOk() && ok;
        co_return ok;
    }(first, second));

    auto r1 = blockOn(m_server->acceptChannel(Direction::Receive)).unwrap();
    auto r2 = blockOn(m_server->acceptChannel(Direction::Receive)).unwrap();

    auto d1 = blockOn(r1.readToEnd()).unwrap();
    auto d2 = blockOn(r2.readToEnd()).unwrap();

    // accept order follows stream arrival, match them by id
    if (r1.id() != first.id()) {
        std::swap(d1, d2);
    }

    EXPECT_EQ(d1, a);
    EXPECT_EQ(d2, b);
    EXPECT_TRUE(finished.get());
}

TEST_F(SessionTest, EndpointClose) {
    this->connectPair();

    m_endpoint->close();
    EXPECT_TRUE(m_endpoint->isClosed());

    blockOn(m_server->closed());
    ASSERT_TRUE(m_server->closeReason().has_value());
    EXPECT_EQ(m_server->closeReason()->kind, CloseReason::Kind::EndpointClosed);

    auto res = blockOn(m_endpoint->accept());
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), SessionError::EndpointClosed);
}

TEST_F(SessionTest, CancelQueuedAcceptChannel) {
    this->connectPair();

    // the first acceptor holds the incoming queue, the second waits behind it
    auto first = startOn(m_server->acceptChannel(Direction::Receive));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    arc::CancellationToken cancel;
    auto second = startOn(m_server->acceptChannel(Direction::Receive, ChannelOptions{}, &cancel));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    cancel.cancel();
    ASSERT_EQ(second.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    auto sres = second.get();
    ASSERT_TRUE(sres.isErr());
    ASSERT_TRUE(sres.unwrapErr().isChannelAborted()) << sres.unwrapErr().message();
    EXPECT_EQ(sres.unwrapErr().asChannelAborted().reason, AbortReason::UserCancelled);

    // the first acceptor still gets the next channel
    auto sender = blockOn(m_client->openChannel(Direction::Send)).unwrap();
    auto data = patternBytes(300);
    ASSERT_TRUE(blockOn(sender.write(data)).isOk());
    auto finished = startOn(sender.finish());

    auto fres = first.get();
    ASSERT_TRUE(fres.isOk()) << fres.unwrapErr().message();
    auto receiver = std::move(fres).unwrap();

    auto out = blockOn(receiver.readToEnd());
    ASSERT_TRUE(out.isOk());
    EXPECT_EQ(out.unwrap(), data);
    EXPECT_TRUE(finished.get().isOk());
}

TEST_F(SessionTest, CancelQueuedEndpointAccept) {
    auto first = startOn(m_endpoint->accept());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    arc::CancellationToken cancel;
    auto second = startOn(m_endpoint->accept(&cancel));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    cancel.cancel();
    ASSERT_EQ(second.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    auto res = second.get();
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isHandshakeError()) << res.unwrapErr().message();
    EXPECT_EQ(res.unwrapErr().asHandshakeError().cause, HandshakeError::Cause::Cancelled);

    m_endpoint->close();

    auto fres = first.get();
    ASSERT_TRUE(fres.isErr());
    EXPECT_EQ(fres.unwrapErr(), SessionError::EndpointClosed);
}
