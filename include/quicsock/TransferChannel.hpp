#pragma once

#include "Error.hpp"
#include <quicsock/protocol/constants.hpp>
#include <arc/future/Future.hpp>

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace qs {

class ChannelCore;

enum class Direction {
    Send,
    Receive,
};

enum class ChannelState {
    Open,
    Completed,
    Aborted,
};

struct ChannelOptions {
    /// Payload size of every frame written, the last frame of a write may be shorter
    size_t chunkSize = DEFAULT_CHUNK_SIZE;
    /// Largest frame accepted when reading, longer length headers abort the channel
    size_t maxFrameSize = DEFAULT_MAX_FRAME_SIZE;
    /// Declared total length, only used for progress reporting
    std::optional<uint64_t> totalLength;
};

struct ChannelProgress {
    uint64_t bytesTransferred = 0;
    std::optional<uint64_t> totalLength;

    /// Fraction in [0, 1], if the total length was declared.
    std::optional<double> fraction() const;
};

// One logical transfer over a dedicated bidirectional QUIC stream.
// Data is sent as frames of `[u32 big endian length][payload]`, a zero length frame ends the transfer.
// The receiving side closes its own half of the stream right away, only the sender writes.
class TransferChannel {
public:
    TransferChannel(TransferChannel&& other) noexcept;
    TransferChannel& operator=(TransferChannel&& other) noexcept;
    /// Aborts the channel with `AbortReason::ChannelDropped` if it is still open.
    ~TransferChannel();

    TransferChannel(const TransferChannel&) = delete;
    TransferChannel& operator=(const TransferChannel&) = delete;

    int64_t id() const;
    Direction direction() const;
    ChannelState state() const;
    bool isOpen() const;
    /// Set once the channel is aborted
    std::optional<ChannelAbortedError> abortInfo() const;

    size_t chunkSize() const;
    size_t maxFrameSize() const;

    uint64_t bytesTransferred() const;
    ChannelProgress progress() const;

    /// Splits `data` into frames of `chunkSize` bytes and writes them, waiting while the stream window is full.
    /// Returns the amount of payload bytes written, which is always the whole input on success.
    arc::Future<SessionResult<size_t>> write(std::span<const uint8_t> data);

    /// Writes the terminal frame and waits until the peer acknowledged everything.
    arc::Future<SessionResult<>> finish();

    /// Returns the next chunk, or `std::nullopt` once the sender finished the transfer.
    arc::Future<SessionResult<std::optional<std::vector<uint8_t>>>> read();

    /// Reads every remaining chunk. Fails with `InvalidArgument` if more than `limit` bytes arrive.
    arc::Future<SessionResult<std::vector<uint8_t>>> readToEnd(size_t limit = SIZE_MAX);

    /// Resets the stream in both directions, the peer's pending operation fails with `ChannelAbortedError`.
    /// Does nothing if the channel is no longer open.
    void abort(AbortReason reason);

private:
    friend class Session;

    explicit TransferChannel(std::shared_ptr<ChannelCore> core);

    std::shared_ptr<ChannelCore> m_core;
};

}
