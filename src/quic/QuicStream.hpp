#pragma once

#include <stdint.h>
#include <quicsock/transport/Error.hpp>
#include <quicsock/buffers/CircularByteBuffer.hpp>
#include <arc/future/Future.hpp>
#include <arc/sync/Notify.hpp>
#include <asp/sync/Mutex.hpp>

#include <atomic>
#include <optional>
#include <span>

namespace qs {

class QuicConnection;

/// A bidirectional QUIC stream. Bytes written are buffered until the connection worker
/// hands them to ngtcp2, and stay in the buffer until the peer acknowledges them.
class QuicStream {
public:
    QuicStream(QuicConnection* conn, int64_t id);
    ~QuicStream();

    QuicStream(const QuicStream&) = delete;
    QuicStream& operator=(const QuicStream&) = delete;

    int64_t id() const;
    /// Whether this side opened the stream
    bool isLocal() const;

    /// Returns amount of buffered bytes that have not been read by the application yet.
    size_t unreadBytes() const;
    /// Returns amount of bytes that have been written to the buffer but not yet sent.
    size_t unflushedBytes() const;
    /// Returns amount of bytes that have been sent but not yet acknowledged.
    size_t unackedBytes() const;

    /// Buffers as much of `data` as fits, waiting until at least one byte can be buffered.
    arc::Future<TransportResult<size_t>> write(std::span<const uint8_t> data);
    arc::Future<TransportResult<>> writeAll(std::span<const uint8_t> data);

    /// Reads up to `len` bytes. Returns 0 once the peer finished the stream and everything was read.
    arc::Future<TransportResult<size_t>> read(uint8_t* buf, size_t len);

    /// Requests a FIN after all buffered data. Further writes fail.
    void finish();
    /// Waits until the FIN was sent and all data was acknowledged.
    arc::Future<TransportResult<>> flush();

    /// Abruptly terminates both directions of the stream with an application error code.
    void reset(uint64_t code);

    bool finRequested() const;
    bool finSent() const;
    bool finReceived() const;
    bool isReset() const;
    std::optional<uint64_t> peerResetCode() const;

private:
    friend class QuicConnection;

    QuicConnection* m_conn = nullptr;
    int64_t m_streamId = -1;
    arc::Notify m_writableNotify, m_readableNotify;

    asp::Mutex<CircularByteBuffer> m_sendBuffer;
    asp::Mutex<CircularByteBuffer> m_recvBuffer;
    uint64_t m_ackOffset = 0;
    std::atomic<uint64_t> m_unackedBytes = 0;
    std::atomic<uint64_t> m_streamOffset = 0;

    std::atomic<bool> m_finRequested{false};
    std::atomic<bool> m_finSent{false};
    std::atomic<bool> m_finReceived{false};
    std::atomic<bool> m_sendShut{false};
    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_localReset{false};
    std::atomic<bool> m_peerReset{false};
    std::atomic<uint64_t> m_peerResetCode{0};

    size_t sendCapacity(const CircularByteBuffer& sendBuffer) const;
    size_t writeSome(std::span<const uint8_t> data);
    size_t readSome(uint8_t* buf, size_t len);
    TransportResult<> checkWritable() const;

    // called by the connection, with the connection lock held
    bool hasPendingSend() const;
    std::pair<CircularByteBuffer::WrappedRead, asp::MutexGuard<CircularByteBuffer>> peekUnsentData();
    void advanceSentData(size_t len);
    void onReceivedData(const uint8_t* data, size_t len, bool fin);
    void onAck(uint64_t offset, uint64_t ackedBytes);
    void onPeerReset(uint64_t code);
    void onSendShut();
    void onClosed();
    void wakeAll();
};

}
