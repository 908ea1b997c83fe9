#include "ChannelCore.hpp"
#include <quicsock/Session.hpp>
#include <quicsock/protocol/Frame.hpp>
#include <quicsock/Log.hpp>
#include "quic/QuicConnection.hpp"

#include <algorithm>

using namespace arc;

namespace qs {

std::optional<double> ChannelProgress::fraction() const {
    if (!totalLength) {
        return std::nullopt;
    }

    if (*totalLength == 0) {
        return 1.0;
    }

    return std::min(1.0, (double) bytesTransferred / (double) *totalLength);
}

ChannelCore::ChannelCore(
    std::weak_ptr<Session> session,
    std::shared_ptr<QuicConnection> conn,
    std::shared_ptr<QuicStream> stream,
    Direction direction,
    ChannelOptions options
)
    : m_session(std::move(session)),
      m_conn(std::move(conn)),
      m_stream(std::move(stream)),
      m_direction(direction),
      m_options(std::move(options))
{
    if (m_direction == Direction::Receive) {
        m_reader.emplace(m_options.maxFrameSize);
    }
}

int64_t ChannelCore::id() const {
    return m_stream->id();
}

Direction ChannelCore::direction() const {
    return m_direction;
}

ChannelState ChannelCore::state() const {
    return m_status.lock()->state;
}

std::optional<ChannelAbortedError> ChannelCore::abortInfo() const {
    return m_status.lock()->abort;
}

const ChannelOptions& ChannelCore::options() const {
    return m_options;
}

uint64_t ChannelCore::bytesTransferred() const {
    return m_bytes.load(std::memory_order::relaxed);
}

SessionResult<> ChannelCore::checkOpen(Direction expected) const {
    if (m_direction != expected) {
        return Err(SessionError::WrongDirection);
    }

    auto status = m_status.lock();

    switch (status->state) {
        case ChannelState::Open: return Ok();
        case ChannelState::Completed: return Err(SessionError::ChannelAlreadyClosed);
        case ChannelState::Aborted: break;
    }

    if (status->transportFailure) {
        auto cause = m_conn->closeError();
        if (expected == Direction::Receive) {
            return Err(StreamReadError{std::move(cause)});
        } else {
            return Err(StreamWriteError{std::move(cause)});
        }
    }

    return Err(*status->abort);
}

bool ChannelCore::transition(ChannelState state, std::optional<ChannelAbortedError> abort, bool transportFailure) {
    {
        auto status = m_status.lock();
        if (status->state != ChannelState::Open) {
            return false;
        }

        status->state = state;
        status->abort = std::move(abort);
        status->transportFailure = transportFailure;
    }

    if (auto session = m_session.lock()) {
        session->unregisterChannel(this->id());
    }

    return true;
}

SessionError ChannelCore::failure(const TransportError& err, bool reading) {
    {
        auto status = m_status.lock();
        if (status->abort && !status->transportFailure) {
            return *status->abort;
        }
    }

    if (auto code = m_stream->peerResetCode()) {
        ChannelAbortedError aborted{abortReasonFromCode(*code), true};
        log::debug("Channel {}: aborted by peer ({})", this->id(), abortReasonString(aborted.reason));

        this->transition(ChannelState::Aborted, aborted);
        return aborted;
    }

    log::warn("Channel {}: {} failed: {}", this->id(), reading ? "read" : "write", err.message());
    this->transition(ChannelState::Aborted, ChannelAbortedError{AbortReason::SessionClosed, err.isClosed()}, true);

    if (reading) {
        return StreamReadError{err};
    } else {
        return StreamWriteError{err};
    }
}

Future<SessionResult<size_t>> ChannelCore::write(std::span<const uint8_t> data) {
    ARC_CO_UNWRAP(this->checkOpen(Direction::Send));

    if (m_finishing.load()) {
        co_return Err(SessionError::ChannelAlreadyClosed);
    }

    // empty frames are terminal, so there is nothing to send
    if (data.empty()) {
        co_return Ok(0);
    }

    size_t written = 0;

    while (written < data.size()) {
        size_t len = std::min(m_options.chunkSize, data.size() - written);
        auto header = encodeFrameHeader(static_cast<uint32_t>(len));

        auto res = co_await m_stream->writeAll(header);
        if (res) {
            res = co_await m_stream->writeAll(data.subspan(written, len));
        }

        if (!res) {
            co_return Err(this->failure(res.unwrapErr(), false));
        }

        written += len;
        m_bytes.fetch_add(len, std::memory_order::relaxed);
    }

    co_return Ok(written);
}

Future<SessionResult<>> ChannelCore::finish() {
    ARC_CO_UNWRAP(this->checkOpen(Direction::Send));

    if (m_finishing.exchange(true)) {
        co_return Err(SessionError::ChannelAlreadyClosed);
    }

    auto header = encodeFrameHeader(0);
    auto res = co_await m_stream->writeAll(header);
    if (!res) {
        co_return Err(this->failure(res.unwrapErr(), false));
    }

    m_stream->finish();

    // wait for the peer to acknowledge everything, an abort from either side interrupts this
    res = co_await m_stream->flush();
    if (!res) {
        co_return Err(this->failure(res.unwrapErr(), false));
    }

    if (!this->transition(ChannelState::Completed)) {
        // aborted right as the last ack arrived
        co_return this->checkOpen(Direction::Send);
    }

    log::debug("Channel {}: completed, sent {} bytes", this->id(), this->bytesTransferred());

    co_return Ok();
}

Future<SessionResult<std::optional<std::vector<uint8_t>>>> ChannelCore::read() {
    ARC_CO_UNWRAP(this->checkOpen(Direction::Receive));

    std::vector<uint8_t> chunk;

    while (true) {
        switch (m_reader->next(chunk)) {
            case FrameReader::Status::Frame: {
                m_bytes.fetch_add(chunk.size(), std::memory_order::relaxed);
                co_return Ok(std::optional{std::move(chunk)});
            }

            case FrameReader::Status::Terminal: {
                this->transition(ChannelState::Completed);
                log::debug("Channel {}: completed, received {} bytes", this->id(), this->bytesTransferred());
                co_return Ok(std::optional<std::vector<uint8_t>>{});
            }

            case FrameReader::Status::Corrupted: {
                this->corrupted(m_reader->rejectedLength());
                co_return Err(SessionError::FrameCorruption);
            }

            case FrameReader::Status::NeedMore: break;
        }

        auto window = m_reader->writeWindow();
        auto res = co_await m_stream->read(window.data(), window.size());
        if (!res) {
            co_return Err(this->failure(res.unwrapErr(), true));
        }

        size_t bytes = res.unwrap();

        if (bytes == 0) {
            // stream finished without a terminal frame
            if (m_reader->buffered() == 0) {
                this->transition(ChannelState::Completed);
                co_return Ok(std::optional<std::vector<uint8_t>>{});
            }

            log::warn("Channel {}: stream ended in the middle of a frame ({} bytes buffered)", this->id(), m_reader->buffered());
            this->abort(AbortReason::FrameCorruption);
            co_return Err(SessionError::FrameCorruption);
        }

        m_reader->advance(bytes);
    }
}

void ChannelCore::corrupted(uint32_t length) {
    log::warn(
        "Channel {}: frame length {} exceeds the maximum of {}, aborting",
        this->id(), length, m_options.maxFrameSize
    );

    this->abort(AbortReason::FrameCorruption);
}

void ChannelCore::abort(AbortReason reason) {
    if (!this->transition(ChannelState::Aborted, ChannelAbortedError{reason, false})) {
        return;
    }

    log::debug("Channel {}: aborting ({})", this->id(), abortReasonString(reason));
    m_stream->reset(abortReasonCode(reason));
}

void ChannelCore::onSessionClosed(bool local) {
    if (local) {
        this->transition(ChannelState::Aborted, ChannelAbortedError{AbortReason::SessionClosed, false});
    } else {
        this->transition(ChannelState::Aborted, ChannelAbortedError{AbortReason::SessionClosed, true}, true);
    }
}

// TransferChannel

TransferChannel::TransferChannel(std::shared_ptr<ChannelCore> core) : m_core(std::move(core)) {}

TransferChannel::TransferChannel(TransferChannel&& other) noexcept = default;

TransferChannel& TransferChannel::operator=(TransferChannel&& other) noexcept {
    if (this != &other) {
        if (m_core) {
            m_core->abort(AbortReason::ChannelDropped);
        }

        m_core = std::move(other.m_core);
    }

    return *this;
}

TransferChannel::~TransferChannel() {
    if (m_core && m_core->state() == ChannelState::Open) {
        m_core->abort(AbortReason::ChannelDropped);
    }
}

int64_t TransferChannel::id() const {
    return m_core->id();
}

Direction TransferChannel::direction() const {
    return m_core->direction();
}

ChannelState TransferChannel::state() const {
    return m_core->state();
}

bool TransferChannel::isOpen() const {
    return this->state() == ChannelState::Open;
}

std::optional<ChannelAbortedError> TransferChannel::abortInfo() const {
    return m_core->abortInfo();
}

size_t TransferChannel::chunkSize() const {
    return m_core->options().chunkSize;
}

size_t TransferChannel::maxFrameSize() const {
    return m_core->options().maxFrameSize;
}

uint64_t TransferChannel::bytesTransferred() const {
    return m_core->bytesTransferred();
}

ChannelProgress TransferChannel::progress() const {
    return ChannelProgress {
        .bytesTransferred = m_core->bytesTransferred(),
        .totalLength = m_core->options().totalLength,
    };
}

Future<SessionResult<size_t>> TransferChannel::write(std::span<const uint8_t> data) {
    return m_core->write(data);
}

Future<SessionResult<>> TransferChannel::finish() {
    return m_core->finish();
}

Future<SessionResult<std::optional<std::vector<uint8_t>>>> TransferChannel::read() {
    return m_core->read();
}

Future<SessionResult<std::vector<uint8_t>>> TransferChannel::readToEnd(size_t limit) {
    std::vector<uint8_t> out;

    while (true) {
        auto chunk = ARC_CO_UNWRAP(co_await m_core->read());
        if (!chunk) {
            co_return Ok(std::move(out));
        }

        if (out.size() + chunk->size() > limit) {
            m_core->abort(AbortReason::UserCancelled);
            co_return Err(SessionError::InvalidArgument);
        }

        out.insert(out.end(), chunk->begin(), chunk->end());
    }
}

void TransferChannel::abort(AbortReason reason) {
    m_core->abort(reason);
}

}
