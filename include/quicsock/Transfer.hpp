#pragma once

#include "Session.hpp"
#include "util/compat.hpp"

#include <arc/future/Future.hpp>
#include <arc/task/CancellationToken.hpp>
#include <asp/time/Duration.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <variant>
#include <vector>

namespace qs {

struct TransferProgress {
    uint64_t bytesTransferred = 0;
    std::optional<uint64_t> totalBytes;
    asp::time::Duration elapsed;

    std::optional<double> fraction() const;
    /// Average speed since the transfer started
    double bytesPerSecond() const;
};

struct TransferOptions {
    size_t chunkSize = DEFAULT_CHUNK_SIZE;
    size_t maxFrameSize = DEFAULT_MAX_FRAME_SIZE;
    /// Checked between chunks. Cancelling aborts the channel with `AbortReason::UserCancelled`.
    arc::CancellationToken* cancel = nullptr;
    /// Upper bound for `receiveBytes`. Once more arrives the channel is aborted and the call fails with `InvalidArgument`.
    size_t maxBytes = SIZE_MAX;
    /// Called after every chunk
    move_only_function<void(const TransferProgress&)> onProgress;
};

struct TransferStats {
    uint64_t bytesTransferred = 0;
    asp::time::Duration elapsed;
};

struct FileError {
    std::filesystem::path path;
    std::string message;

    std::string describe() const;

    bool operator==(const FileError& other) const = default;
    bool operator!=(const FileError& other) const = default;
};

// A failed transfer, with the exact amount of bytes that made it through before the failure.
// For `receiveFile`, this is also the size of the partial file left behind.
class TransferError {
public:
    TransferError(SessionError err, uint64_t bytesTransferred = 0);
    TransferError(FileError err, uint64_t bytesTransferred = 0);

    bool isSessionError() const;
    bool isFileError() const;
    const SessionError& asSessionError() const;
    const FileError& asFileError() const;

    /// Whether the transfer was cancelled through the cancellation token
    bool isCancelled() const;
    uint64_t bytesTransferred() const;

    std::string message() const;

private:
    std::variant<SessionError, FileError> m_err;
    uint64_t m_bytes;
};

template <typename T = void>
using TransferResult = geode::Result<T, TransferError>;

/// Opens a sending channel and streams the file through it.
arc::Future<TransferResult<TransferStats>> sendFile(
    Session& session,
    const std::filesystem::path& path,
    TransferOptions options = {}
);

/// Accepts the next channel from the peer and writes everything it carries to `path`, truncating the file first.
/// On failure the partial file is kept.
arc::Future<TransferResult<TransferStats>> receiveFile(
    Session& session,
    const std::filesystem::path& path,
    TransferOptions options = {}
);

arc::Future<TransferResult<TransferStats>> sendBytes(
    Session& session,
    std::span<const uint8_t> data,
    TransferOptions options = {}
);

arc::Future<TransferResult<std::vector<uint8_t>>> receiveBytes(
    Session& session,
    TransferOptions options = {}
);

}
