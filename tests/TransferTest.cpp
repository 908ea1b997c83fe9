#include "TestUtil.hpp"

#include <quicsock/Transfer.hpp>
#include <asp/sync/Mutex.hpp>

#include <filesystem>
#include <fstream>
#include <random>

using namespace qs;
using namespace qs::test;

namespace {

arc::Future<SessionResult<>> writeAndFinish(TransferChannel& channel, std::span<const uint8_t> data) {
    ARC_CO_UNWRAP(co_await channel.write(data));
    co_return co_await channel.finish();
}

void writeFile(const std::filesystem::path& path, std::span<const uint8_t> data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()), data.size());
}

std::vector<uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

}

class TransferTest : public LoopbackTest {
protected:
    std::filesystem::path m_dir;

    void SetUp() override {
        LoopbackTest::SetUp();
        this->connectPair();

        auto info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = std::filesystem::temp_directory_path() / fmt::format("quicsock-test-{}-{}", info->name(), std::random_device{}());
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);

        LoopbackTest::TearDown();
    }

    /// Client sends `data` with the given chunk size, the server receives it.
    std::vector<uint8_t> roundTrip(std::span<const uint8_t> data, size_t chunkSize) {
        auto sender = blockOn(m_client->openChannel(Direction::Send, ChannelOptions {
            .chunkSize = chunkSize,
            .totalLength = data.size(),
        }));
        EXPECT_TRUE(sender.isOk());

        auto channel = std::move(sender).unwrap();
        auto sent = startOn(writeAndFinish(channel, data));

        auto receiver = blockOn(m_server->acceptChannel(Direction::Receive)).unwrap();
        auto received = blockOn(receiver.readToEnd());
        EXPECT_TRUE(received.isOk()) << received.unwrapErr().message();

        auto sres = sent.get();
        EXPECT_TRUE(sres.isOk()) << sres.unwrapErr().message();

        EXPECT_EQ(channel.state(), ChannelState::Completed);
        EXPECT_EQ(receiver.state(), ChannelState::Completed);
        EXPECT_EQ(channel.bytesTransferred(), data.size());
        EXPECT_EQ(receiver.bytesTransferred(), data.size());
        EXPECT_EQ(channel.progress().fraction(), 1.0);

        return std::move(received).unwrap();
    }
};

TEST_F(TransferTest, RoundTripChunkSizes) {
    auto data = patternBytes(20011);

    for (size_t chunk : {1, 3, 100, 4096, 20011, 65536}) {
        SCOPED_TRACE(fmt::format("chunk size {}", chunk));
        EXPECT_EQ(this->roundTrip(data, chunk), data);
    }
}

TEST_F(TransferTest, EmptyTransfer) {
    EXPECT_TRUE(this->roundTrip({}, 4096).empty());
}

TEST_F(TransferTest, TenMegabytes) {
    auto data = patternBytes(10 * 1024 * 1024, 42);
    auto out = this->roundTrip(data, 4096);

    ASSERT_EQ(out.size(), data.size());
    EXPECT_TRUE(out == data);
}

TEST_F(TransferTest, FinishTwice) {
    auto data = patternBytes(1000);
    auto channel = blockOn(m_client->openChannel(Direction::Send)).unwrap();

    ASSERT_TRUE(blockOn(writeAndFinish(channel, data)).isOk());

    auto again = blockOn(channel.finish());
    ASSERT_TRUE(again.isErr());
    EXPECT_EQ(again.unwrapErr(), SessionError::ChannelAlreadyClosed);

    auto write = blockOn(channel.write(data));
    ASSERT_TRUE(write.isErr());
    EXPECT_EQ(write.unwrapErr(), SessionError::ChannelAlreadyClosed);

    // what was sent before is intact
    auto receiver = blockOn(m_server->acceptChannel(Direction::Receive)).unwrap();
    auto out = blockOn(receiver.readToEnd());
    ASSERT_TRUE(out.isOk());
    EXPECT_EQ(out.unwrap(), data);

    auto readAgain = blockOn(receiver.read());
    ASSERT_TRUE(readAgain.isErr());
    EXPECT_EQ(readAgain.unwrapErr(), SessionError::ChannelAlreadyClosed);
}

TEST_F(TransferTest, OversizedLengthHeader) {
    auto sender = blockOn(m_client->openChannel(Direction::Send, ChannelOptions {
        .chunkSize = 4096,
    })).unwrap();

    auto data = patternBytes(4096);
    ASSERT_TRUE(blockOn(sender.write(data)).isOk());

    auto receiver = blockOn(m_server->acceptChannel(Direction::Receive, ChannelOptions {
        .chunkSize = 1024,
        .maxFrameSize = 1024,
    })).unwrap();

    auto res = blockOn(receiver.read());
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), SessionError::FrameCorruption);
    EXPECT_EQ(receiver.state(), ChannelState::Aborted);
    EXPECT_EQ(receiver.bytesTransferred(), 0u);

    // the sender is told why
    auto fin = blockOn(sender.finish());
    ASSERT_TRUE(fin.isErr());
    ASSERT_TRUE(fin.unwrapErr().isChannelAborted()) << fin.unwrapErr().message();
    EXPECT_EQ(fin.unwrapErr().asChannelAborted().reason, AbortReason::FrameCorruption);
    EXPECT_TRUE(fin.unwrapErr().asChannelAborted().remote);
}

TEST_F(TransferTest, SenderAbortUnblocksReader) {
    auto sender = blockOn(m_client->openChannel(Direction::Send)).unwrap();
    auto data = patternBytes(10);
    ASSERT_TRUE(blockOn(sender.write(data)).isOk());

    auto receiver = blockOn(m_server->acceptChannel(Direction::Receive)).unwrap();
    auto first = blockOn(receiver.read());
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(first.unwrap().has_value());

    auto pending = startOn(receiver.read());
    sender.abort(AbortReason::UserCancelled);
    EXPECT_EQ(sender.state(), ChannelState::Aborted);

    auto res = pending.get();
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isChannelAborted()) << res.unwrapErr().message();
    EXPECT_EQ(res.unwrapErr().asChannelAborted().reason, AbortReason::UserCancelled);
    EXPECT_TRUE(res.unwrapErr().asChannelAborted().remote);

    ASSERT_TRUE(receiver.abortInfo().has_value());
    EXPECT_TRUE(receiver.abortInfo()->remote);
}

TEST_F(TransferTest, ReceiverAbortUnblocksWriter) {
    auto sender = blockOn(m_client->openChannel(Direction::Send)).unwrap();
    ASSERT_TRUE(blockOn(sender.write(patternBytes(10))).isOk());

    auto receiver = blockOn(m_server->acceptChannel(Direction::Receive)).unwrap();

    // far more than the stream window, so the write blocks until the peer reads
    auto big = patternBytes(32 * 1024 * 1024);
    auto pending = startOn(sender.write(big));

    receiver.abort(AbortReason::Refused);

    auto res = pending.get();
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isChannelAborted()) << res.unwrapErr().message();
    EXPECT_EQ(res.unwrapErr().asChannelAborted().reason, AbortReason::Refused);
    EXPECT_TRUE(res.unwrapErr().asChannelAborted().remote);

    // aborting twice does nothing
    receiver.abort(AbortReason::UserCancelled);
    EXPECT_EQ(receiver.abortInfo()->reason, AbortReason::Refused);
}

TEST_F(TransferTest, DroppedChannelAborts) {
    std::optional<TransferChannel> sender = blockOn(m_client->openChannel(Direction::Send)).unwrap();
    ASSERT_TRUE(blockOn(sender->write(patternBytes(10))).isOk());

    auto receiver = blockOn(m_server->acceptChannel(Direction::Receive)).unwrap();

    sender.reset();
    EXPECT_EQ(m_client->channelCount(), 0u);

    auto res = blockOn(receiver.readToEnd());
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isChannelAborted());
    EXPECT_EQ(res.unwrapErr().asChannelAborted().reason, AbortReason::ChannelDropped);
}

TEST_F(TransferTest, PeerCloseMidTransfer) {
    auto sender = blockOn(m_client->openChannel(Direction::Send)).unwrap();
    ASSERT_TRUE(blockOn(sender.write(patternBytes(10))).isOk());
    auto receiver = blockOn(m_server->acceptChannel(Direction::Receive)).unwrap();

    asp::Mutex<size_t> closedCount{0};
    m_client->setStateCallback([&](SessionState state) {
        if (state == SessionState::Closed) {
            (*closedCount.lock())++;
        }
    });

    auto big = patternBytes(32 * 1024 * 1024);
    auto pending = startOn(sender.write(big));

    m_server->close("forced");

    auto res = pending.get();
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isStreamWriteError()) << res.unwrapErr().message();
    EXPECT_TRUE(res.unwrapErr().asStreamWriteError().cause.isClosed());

    blockOn(m_client->closed());
    EXPECT_EQ(m_client->state(), SessionState::Closed);
    EXPECT_EQ(m_client->closeReason()->kind, CloseReason::Kind::PeerClosed);
    EXPECT_EQ(sender.state(), ChannelState::Aborted);

    // closing an already closed session does not notify again
    m_client->close();
    EXPECT_EQ(*closedCount.lock(), 1u);

    m_client->setStateCallback({});
}

TEST_F(TransferTest, TransportFailureMidTransfer) {
    auto sender = blockOn(m_client->openChannel(Direction::Send)).unwrap();
    ASSERT_TRUE(blockOn(sender.write(patternBytes(10))).isOk());

    auto receiver = blockOn(m_server->acceptChannel(Direction::Receive)).unwrap();
    ASSERT_TRUE(blockOn(receiver.read()).isOk());

    auto pending = startOn(receiver.read());

    // takes the socket away from the server session
    m_endpoint->close();

    auto res = pending.get();
    ASSERT_TRUE(res.isErr());
    ASSERT_TRUE(res.unwrapErr().isStreamReadError()) << res.unwrapErr().message();

    blockOn(m_server->closed());
    EXPECT_EQ(m_server->closeReason()->kind, CloseReason::Kind::EndpointClosed);
    EXPECT_EQ(receiver.state(), ChannelState::Aborted);
}

TEST_F(TransferTest, SendReceiveFile) {
    auto data = patternBytes(1024 * 1024 + 123, 9);
    auto src = m_dir / "source.bin";
    auto dst = m_dir / "dest.bin";
    writeFile(src, data);

    asp::Mutex<std::vector<TransferProgress>> progress;

    auto received = startOn(receiveFile(*m_server, dst));
    auto sent = blockOn(sendFile(*m_client, src, TransferOptions {
        .chunkSize = 16 * 1024,
        .onProgress = [&](const TransferProgress& p) { progress.lock()->push_back(p); },
    }));

    ASSERT_TRUE(sent.isOk()) << sent.unwrapErr().message();
    EXPECT_EQ(sent.unwrap().bytesTransferred, data.size());

    auto rres = received.get();
    ASSERT_TRUE(rres.isOk()) << rres.unwrapErr().message();
    EXPECT_EQ(rres.unwrap().bytesTransferred, data.size());

    EXPECT_EQ(readFile(dst), data);

    auto p = progress.lock();
    ASSERT_FALSE(p->empty());
    EXPECT_EQ(p->back().bytesTransferred, data.size());
    EXPECT_EQ(p->back().fraction(), 1.0);
    EXPECT_EQ(p->back().totalBytes, data.size());
}

TEST_F(TransferTest, SendBytes) {
    auto data = patternBytes(300000);

    auto received = startOn(receiveBytes(*m_client));
    auto sent = blockOn(sendBytes(*m_server, data));

    ASSERT_TRUE(sent.isOk()) << sent.unwrapErr().message();
    EXPECT_EQ(sent.unwrap().bytesTransferred, data.size());

    auto out = received.get();
    ASSERT_TRUE(out.isOk()) << out.unwrapErr().message();
    EXPECT_EQ(out.unwrap(), data);
}

TEST_F(TransferTest, MissingSourceFile) {
    auto res = blockOn(sendFile(*m_client, m_dir / "does-not-exist"));
    ASSERT_TRUE(res.isErr());
    EXPECT_TRUE(res.unwrapErr().isFileError());
    EXPECT_EQ(res.unwrapErr().bytesTransferred(), 0u);
    EXPECT_EQ(m_client->channelCount(), 0u);
}

TEST_F(TransferTest, CancelLeavesTruncatedFile) {
    auto data = patternBytes(8 * 1024 * 1024, 3);
    auto src = m_dir / "source.bin";
    auto dst = m_dir / "dest.bin";
    writeFile(src, data);

    arc::CancellationToken cancel;

    auto received = startOn(receiveFile(*m_server, dst, TransferOptions {
        .cancel = &cancel,
        .onProgress = [&](const TransferProgress& p) {
            if (p.bytesTransferred >= 1024 * 1024) {
                cancel.cancel();
            }
        },
    }));

    auto sent = blockOn(sendFile(*m_client, src, TransferOptions { .chunkSize = 32 * 1024 }));

    auto rres = received.get();
    ASSERT_TRUE(rres.isErr());
    EXPECT_TRUE(rres.unwrapErr().isCancelled()) << rres.unwrapErr().message();

    uint64_t got = rres.unwrapErr().bytesTransferred();
    EXPECT_GE(got, 1024u * 1024u);
    EXPECT_LT(got, data.size());

    // the partial file is kept, and holds exactly what was reported
    ASSERT_TRUE(std::filesystem::exists(dst));
    EXPECT_EQ(std::filesystem::file_size(dst), got);

    auto partial = readFile(dst);
    EXPECT_TRUE(std::equal(partial.begin(), partial.end(), data.begin()));

    // the sender sees the abort
    ASSERT_TRUE(sent.isErr());
    ASSERT_TRUE(sent.unwrapErr().isSessionError());
    ASSERT_TRUE(sent.unwrapErr().asSessionError().isChannelAborted()) << sent.unwrapErr().message();
    EXPECT_EQ(sent.unwrapErr().asSessionError().asChannelAborted().reason, AbortReason::UserCancelled);
    EXPECT_TRUE(sent.unwrapErr().asSessionError().asChannelAborted().remote);
    EXPECT_FALSE(sent.unwrapErr().isCancelled());
}

TEST_F(TransferTest, ReceiveBytesLimit) {
    auto data = patternBytes(5000);

    auto received = startOn(receiveBytes(*m_server, TransferOptions {
        .chunkSize = 256,
        .maxBytes = 1000,
    }));
    auto sent = startOn(sendBytes(*m_client, data, TransferOptions { .chunkSize = 256 }));

    auto out = received.get();
    ASSERT_TRUE(out.isErr());
    ASSERT_TRUE(out.unwrapErr().isSessionError());
    EXPECT_EQ(out.unwrapErr().asSessionError(), SessionError::InvalidArgument);
    EXPECT_LE(out.unwrapErr().bytesTransferred(), 1000u);

    // the sender may or may not finish before the abort reaches it
    sent.get();
}

TEST_F(TransferTest, ReceiveBytesAtLimit) {
    auto data = patternBytes(1000);

    auto received = startOn(receiveBytes(*m_server, TransferOptions { .maxBytes = data.size() }));
    ASSERT_TRUE(blockOn(sendBytes(*m_client, data)).isOk());

    auto out = received.get();
    ASSERT_TRUE(out.isOk()) << out.unwrapErr().message();
    EXPECT_EQ(out.unwrap(), data);
}

TEST_F(TransferTest, WriteFailureAbortsWithIoReason) {
    // every write to /dev/full fails with ENOSPC
    std::filesystem::path full = "/dev/full";
    if (!std::filesystem::exists(full)) {
        GTEST_SKIP() << "/dev/full is not available";
    }

    auto received = startOn(receiveFile(*m_server, full));

    // far more than the stream window, the sender is still writing when the receiver gives up
    auto data = patternBytes(32 * 1024 * 1024);
    auto sent = blockOn(sendBytes(*m_client, data));

    auto rres = received.get();
    ASSERT_TRUE(rres.isErr());
    EXPECT_TRUE(rres.unwrapErr().isFileError()) << rres.unwrapErr().message();
    EXPECT_FALSE(rres.unwrapErr().isCancelled());

    ASSERT_TRUE(sent.isErr());
    ASSERT_TRUE(sent.unwrapErr().isSessionError());
    ASSERT_TRUE(sent.unwrapErr().asSessionError().isChannelAborted()) << sent.unwrapErr().message();
    EXPECT_EQ(sent.unwrapErr().asSessionError().asChannelAborted().reason, AbortReason::LocalIoFailure);
    EXPECT_TRUE(sent.unwrapErr().asSessionError().asChannelAborted().remote);

    EXPECT_EQ(abortReasonFromCode(abortReasonCode(AbortReason::LocalIoFailure)), AbortReason::LocalIoFailure);
}
