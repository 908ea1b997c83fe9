#include "QuicStream.hpp"
#include "QuicConnection.hpp"
#include <quicsock/protocol/constants.hpp>
#include <quicsock/util/assert.hpp>
#include <quicsock/Log.hpp>

#include <arc/future/Select.hpp>

using namespace arc;

static const size_t INITIAL_BUFFER_SIZE = 256 * 1024; // 256 KiB
static const size_t MAX_SEND_BUFFER_SIZE = 1024 * 1024 * 16; // 16 MiB

namespace qs {

QuicStream::QuicStream(QuicConnection* conn, int64_t id)
    : m_conn(conn),
      m_streamId(id),
      m_sendBuffer(INITIAL_BUFFER_SIZE, MAX_SEND_BUFFER_SIZE),
      // the peer can never have more than the stream window in flight
      m_recvBuffer(16384, STREAM_WINDOW) {}

QuicStream::~QuicStream() {}

int64_t QuicStream::id() const {
    return m_streamId;
}

bool QuicStream::isLocal() const {
    return m_conn->isLocalStream(m_streamId);
}

size_t QuicStream::unreadBytes() const {
    return m_recvBuffer.lock()->size();
}

size_t QuicStream::unflushedBytes() const {
    return m_sendBuffer.lock()->size() - m_unackedBytes;
}

size_t QuicStream::unackedBytes() const {
    return m_unackedBytes;
}

size_t QuicStream::sendCapacity(const CircularByteBuffer& sendBuffer) const {
    // we cannot grow the buffer if there is data in flight, ngtcp2 still points into it
    size_t limit = m_unackedBytes > 0 ? sendBuffer.capacity() : sendBuffer.maxCapacity();
    return limit - sendBuffer.size();
}

size_t QuicStream::writeSome(std::span<const uint8_t> data) {
    auto sndbuf = m_sendBuffer.lock();
    size_t maxWrite = this->sendCapacity(*sndbuf);

    if (maxWrite == 0) {
        return 0;
    }

    size_t toWrite = std::min<size_t>(data.size(), maxWrite);
    sndbuf->write(data.data(), toWrite);

    log::debug(
        "QUIC stream {}: buffered {} bytes (buffer capacity: {}, free space: {})",
        m_streamId, toWrite, sndbuf->capacity(), maxWrite - toWrite
    );

    return toWrite;
}

size_t QuicStream::readSome(uint8_t* buf, size_t len) {
    auto recvbuf = m_recvBuffer.lock();

    size_t toRead = std::min<size_t>(len, recvbuf->size());
    if (toRead == 0) {
        return 0;
    }

    recvbuf->read(buf, toRead);
    return toRead;
}

TransportResult<> QuicStream::checkWritable() const {
    if (m_peerReset || m_localReset || m_sendShut) {
        return Err(TransportError::StreamReset);
    }

    if (m_finRequested) {
        return Err(TransportError::Closed);
    }

    if (m_conn->isClosed()) {
        return Err(m_conn->closeError());
    }

    return Ok();
}

Future<TransportResult<size_t>> QuicStream::write(std::span<const uint8_t> data) {
    if (data.empty()) {
        co_return Ok(0);
    }

    while (true) {
        ARC_CO_UNWRAP(this->checkWritable());

        size_t written = this->writeSome(data);
        if (written > 0) {
            m_conn->notifyWorker();
            co_return Ok(written);
        }

        // wait for acks to free up space
        co_await arc::select(
            arc::selectee(m_writableNotify.notified()),
            arc::selectee(m_conn->waitClosed())
        );
    }
}

Future<TransportResult<>> QuicStream::writeAll(std::span<const uint8_t> data) {
    while (!data.empty()) {
        size_t bytes = ARC_CO_UNWRAP(co_await this->write(data));
        data = data.subspan(bytes);
    }

    co_return Ok();
}

Future<TransportResult<size_t>> QuicStream::read(uint8_t* buf, size_t len) {
    if (len == 0) {
        co_return Ok(0);
    }

    while (true) {
        if (m_peerReset || m_localReset) {
            co_return Err(TransportError::StreamReset);
        }

        // load the fin flag first, data is always stored before the flag is set
        bool fin = m_finReceived.load(std::memory_order::acquire);

        size_t read = this->readSome(buf, len);
        if (read > 0) {
            m_conn->extendReceiveWindow(m_streamId, read);
            co_return Ok(read);
        }

        if (fin) {
            co_return Ok(0);
        }

        if (m_conn->isClosed()) {
            co_return Err(m_conn->closeError());
        }

        co_await arc::select(
            arc::selectee(m_readableNotify.notified()),
            arc::selectee(m_conn->waitClosed())
        );
    }
}

void QuicStream::finish() {
    if (m_finRequested.exchange(true)) {
        return;
    }

    log::debug("QUIC stream {}: FIN requested", m_streamId);
    m_conn->notifyWorker();
}

Future<TransportResult<>> QuicStream::flush() {
    while (true) {
        if (m_peerReset || m_localReset || m_sendShut) {
            co_return Err(TransportError::StreamReset);
        }

        bool drained = m_sendBuffer.lock()->empty();
        if (drained && (!m_finRequested || m_finSent)) {
            co_return Ok();
        }

        if (m_conn->isClosed()) {
            co_return Err(m_conn->closeError());
        }

        co_await arc::select(
            arc::selectee(m_writableNotify.notified()),
            arc::selectee(m_conn->waitClosed())
        );
    }
}

void QuicStream::reset(uint64_t code) {
    if (m_localReset.exchange(true)) {
        return;
    }

    log::debug("QUIC stream {}: resetting with code {}", m_streamId, code);

    m_conn->shutdownStream(m_streamId, code);
    this->wakeAll();
}

bool QuicStream::finRequested() const {
    return m_finRequested;
}

bool QuicStream::finSent() const {
    return m_finSent;
}

bool QuicStream::finReceived() const {
    return m_finReceived;
}

bool QuicStream::isReset() const {
    return m_localReset || m_peerReset;
}

std::optional<uint64_t> QuicStream::peerResetCode() const {
    if (!m_peerReset.load(std::memory_order::acquire)) {
        return std::nullopt;
    }

    return m_peerResetCode.load();
}

bool QuicStream::hasPendingSend() const {
    if (m_localReset || m_peerReset || m_sendShut || m_finSent) {
        return false;
    }

    return this->unflushedBytes() > 0 || m_finRequested;
}

std::pair<CircularByteBuffer::WrappedRead, asp::MutexGuard<CircularByteBuffer>> QuicStream::peekUnsentData() {
    auto sndbuf = m_sendBuffer.lock();
    auto wrp = sndbuf->peek(sndbuf->size());
    wrp.skip(m_unackedBytes);
    return {wrp, std::move(sndbuf)};
}

void QuicStream::advanceSentData(size_t len) {
    m_unackedBytes += len;
    m_streamOffset += len;
}

void QuicStream::onReceivedData(const uint8_t* data, size_t len, bool fin) {
    if (len > 0) {
        auto recvbuf = m_recvBuffer.lock();

        log::debug("QUIC stream {}: received {} stream bytes", m_streamId, len);

        size_t written = recvbuf->writeSome({data, len});
        if (written < len) {
            // flow control makes this impossible for a well behaved peer
            log::warn("QUIC stream {}: receive buffer full, dropped {} bytes", m_streamId, len - written);
        }
    }

    if (fin) {
        log::debug("QUIC stream {}: received FIN", m_streamId);
        m_finReceived.store(true, std::memory_order::release);
    }

    m_readableNotify.notifyOne();
}

void QuicStream::onAck(uint64_t offset, uint64_t ackedBytes) {
    auto sndbuf = m_sendBuffer.lock();

    // ngtcp2 guarantees there are no gaps in the acked bytes.
    // once we receive an ack, it's safe to skip these bytes
    sndbuf->skip(ackedBytes);

    auto unacked = m_unackedBytes -= ackedBytes;
    m_ackOffset = offset + ackedBytes;

    QS_DEBUG_ASSERT(m_ackOffset <= m_streamOffset);
    QS_DEBUG_ASSERT(unacked == m_streamOffset - m_ackOffset);

    log::debug(
        "QUIC stream {}: acknowledged {} bytes @ offset {} (unacked: {}, unsent: {})",
        m_streamId, ackedBytes, offset, unacked, sndbuf->size() - unacked
    );

    // some send capacity may have freed up, notify any waiters
    m_writableNotify.notifyOne();
}

void QuicStream::onPeerReset(uint64_t code) {
    if (m_peerReset.load()) {
        return;
    }

    m_peerResetCode.store(code);
    m_peerReset.store(true, std::memory_order::release);

    log::debug("QUIC stream {}: reset by peer (error code: {})", m_streamId, code);
    this->wakeAll();
}

void QuicStream::onSendShut() {
    m_sendShut = true;
    this->wakeAll();
}

void QuicStream::onClosed() {
    m_closed = true;
    this->wakeAll();
}

void QuicStream::wakeAll() {
    m_readableNotify.notifyOne();
    m_writableNotify.notifyOne();
}

}
