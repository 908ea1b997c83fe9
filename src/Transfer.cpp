#include <quicsock/Transfer.hpp>
#include <quicsock/Log.hpp>

#include <arc/future/Select.hpp>
#include <arc/prelude.hpp>
#include <asp/time/Instant.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <system_error>

using namespace arc;
using namespace asp::time;

namespace qs {

// file reads are done in blocks of at least this size, then split into chunks
static constexpr size_t MIN_FILE_BLOCK = 256 * 1024;

std::optional<double> TransferProgress::fraction() const {
    if (!totalBytes) {
        return std::nullopt;
    }

    if (*totalBytes == 0) {
        return 1.0;
    }

    return std::min(1.0, (double) bytesTransferred / (double) *totalBytes);
}

double TransferProgress::bytesPerSecond() const {
    double secs = (double) elapsed.nanos() / 1'000'000'000.0;
    if (secs <= 0.0) {
        return 0.0;
    }

    return (double) bytesTransferred / secs;
}

std::string FileError::describe() const {
    return fmt::format("{}: {}", path.string(), message);
}

TransferError::TransferError(SessionError err, uint64_t bytesTransferred)
    : m_err(std::move(err)), m_bytes(bytesTransferred) {}

TransferError::TransferError(FileError err, uint64_t bytesTransferred)
    : m_err(std::move(err)), m_bytes(bytesTransferred) {}

bool TransferError::isSessionError() const {
    return std::holds_alternative<SessionError>(m_err);
}

bool TransferError::isFileError() const {
    return std::holds_alternative<FileError>(m_err);
}

const SessionError& TransferError::asSessionError() const {
    return std::get<SessionError>(m_err);
}

const FileError& TransferError::asFileError() const {
    return std::get<FileError>(m_err);
}

bool TransferError::isCancelled() const {
    if (!this->isSessionError()) {
        return false;
    }

    auto& err = this->asSessionError();
    return err.isChannelAborted()
        && err.asChannelAborted().reason == AbortReason::UserCancelled
        && !err.asChannelAborted().remote;
}

uint64_t TransferError::bytesTransferred() const {
    return m_bytes;
}

std::string TransferError::message() const {
    std::string msg = this->isSessionError() ? this->asSessionError().message() : this->asFileError().describe();
    return fmt::format("{} (after {} bytes)", msg, m_bytes);
}

namespace {

FileError fileError(const std::filesystem::path& path, std::string_view what) {
    return FileError {
        .path = path,
        .message = fmt::format("{}: {}", what, std::strerror(errno)),
    };
}

struct Reporter {
    TransferOptions& options;
    std::optional<uint64_t> total;
    Instant startedAt = Instant::now();

    TransferProgress progress(uint64_t bytes) const {
        return TransferProgress {
            .bytesTransferred = bytes,
            .totalBytes = total,
            .elapsed = startedAt.elapsed(),
        };
    }

    void report(uint64_t bytes) {
        if (options.onProgress) {
            options.onProgress(this->progress(bytes));
        }
    }

    TransferStats stats(uint64_t bytes) const {
        return TransferStats {
            .bytesTransferred = bytes,
            .elapsed = startedAt.elapsed(),
        };
    }
};

SessionError cancelled(TransferChannel& channel) {
    channel.abort(AbortReason::UserCancelled);
    return ChannelAbortedError{AbortReason::UserCancelled, false};
}

bool isCancelled(const TransferOptions& options) {
    return options.cancel && options.cancel->isCancelled();
}

/// Writes data to the channel, or aborts it if the transfer gets cancelled first.
Future<SessionResult<>> writeChunk(TransferChannel& channel, std::span<const uint8_t> data, const TransferOptions& options) {
    if (!options.cancel) {
        ARC_CO_UNWRAP(co_await channel.write(data));
        co_return Ok();
    }

    std::optional<SessionResult<>> out;

    co_await arc::select(
        arc::selectee(channel.write(data), [&](auto res) {
            if (res) {
                out.emplace(Ok());
            } else {
                out.emplace(Err(std::move(res).unwrapErr()));
            }
        }),

        arc::selectee(options.cancel->waitCancelled(), [&] {
            out.emplace(Err(cancelled(channel)));
        })
    );

    co_return std::move(*out);
}

Future<SessionResult<std::optional<std::vector<uint8_t>>>> readChunk(TransferChannel& channel, const TransferOptions& options) {
    if (!options.cancel) {
        co_return co_await channel.read();
    }

    std::optional<SessionResult<std::optional<std::vector<uint8_t>>>> out;

    co_await arc::select(
        arc::selectee(channel.read(), [&](auto res) {
            out.emplace(std::move(res));
        }),

        arc::selectee(options.cancel->waitCancelled(), [&] {
            out.emplace(Err(cancelled(channel)));
        })
    );

    co_return std::move(*out);
}

Future<SessionResult<>> finishChannel(TransferChannel& channel, const TransferOptions& options) {
    if (!options.cancel) {
        co_return co_await channel.finish();
    }

    std::optional<SessionResult<>> out;

    co_await arc::select(
        arc::selectee(channel.finish(), [&](auto res) {
            out.emplace(std::move(res));
        }),

        arc::selectee(options.cancel->waitCancelled(), [&] {
            out.emplace(Err(cancelled(channel)));
        })
    );

    co_return std::move(*out);
}

ChannelOptions channelOptions(const TransferOptions& options, std::optional<uint64_t> total) {
    return ChannelOptions {
        .chunkSize = options.chunkSize,
        .maxFrameSize = options.maxFrameSize,
        .totalLength = total,
    };
}

}

Future<TransferResult<TransferStats>> sendFile(
    Session& session,
    const std::filesystem::path& path,
    TransferOptions options
) {
    std::error_code ec;
    uint64_t fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        co_return Err(FileError{path, ec.message()});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        co_return Err(fileError(path, "failed to open for reading"));
    }

    auto channel = ARC_CO_UNWRAP(co_await session.openChannel(Direction::Send, channelOptions(options, fileSize)));

    log::info("Sending {} ({} bytes) on channel {}", path.string(), fileSize, channel.id());

    Reporter reporter{options, fileSize};
    std::vector<uint8_t> block(std::max(options.chunkSize, MIN_FILE_BLOCK));
    uint64_t sent = 0;

    while (true) {
        if (isCancelled(options)) {
            co_return Err(TransferError{cancelled(channel), sent});
        }

        auto readRes = co_await arc::spawnBlocking<geode::Result<size_t, FileError>>([&]() -> geode::Result<size_t, FileError> {
            file.read(reinterpret_cast<char*>(block.data()), block.size());
            if (file.bad()) {
                return Err(fileError(path, "read failed"));
            }

            return Ok(static_cast<size_t>(file.gcount()));
        });

        if (!readRes) {
            channel.abort(AbortReason::LocalIoFailure);
            co_return Err(TransferError{std::move(readRes).unwrapErr(), sent});
        }

        size_t len = readRes.unwrap();
        if (len == 0) {
            break;
        }

        // split the block so that progress is reported per chunk
        for (size_t off = 0; off < len; off += options.chunkSize) {
            size_t n = std::min(options.chunkSize, len - off);

            auto res = co_await writeChunk(channel, std::span{block.data() + off, n}, options);
            if (!res) {
                co_return Err(TransferError{std::move(res).unwrapErr(), sent});
            }

            sent += n;
            reporter.report(sent);
        }
    }

    auto res = co_await finishChannel(channel, options);
    if (!res) {
        co_return Err(TransferError{std::move(res).unwrapErr(), sent});
    }

    auto stats = reporter.stats(sent);
    log::info("Sent {} bytes in {}ms", sent, stats.elapsed.millis());

    co_return Ok(stats);
}

Future<TransferResult<TransferStats>> receiveFile(
    Session& session,
    const std::filesystem::path& path,
    TransferOptions options
) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        co_return Err(fileError(path, "failed to open for writing"));
    }

    auto channel = ARC_CO_UNWRAP(co_await session.acceptChannel(Direction::Receive, channelOptions(options, std::nullopt), options.cancel));

    log::info("Receiving into {} on channel {}", path.string(), channel.id());

    Reporter reporter{options, std::nullopt};
    uint64_t received = 0;

    while (true) {
        if (isCancelled(options)) {
            co_return Err(TransferError{cancelled(channel), received});
        }

        auto res = co_await readChunk(channel, options);
        if (!res) {
            co_return Err(TransferError{std::move(res).unwrapErr(), received});
        }

        auto chunk = std::move(res).unwrap();
        if (!chunk) {
            break;
        }

        // every chunk hits the file before the next one is read, so `received` matches the file size on failure
        auto writeRes = co_await arc::spawnBlocking<geode::Result<void, FileError>>([&]() -> geode::Result<void, FileError> {
            file.write(reinterpret_cast<const char*>(chunk->data()), chunk->size());
            file.flush();

            if (!file) {
                return Err(fileError(path, "write failed"));
            }

            return Ok();
        });

        if (!writeRes) {
            channel.abort(AbortReason::LocalIoFailure);
            co_return Err(TransferError{std::move(writeRes).unwrapErr(), received});
        }

        received += chunk->size();
        reporter.report(received);
    }

    file.close();
    if (file.fail()) {
        co_return Err(TransferError{fileError(path, "failed to close"), received});
    }

    auto stats = reporter.stats(received);
    log::info("Received {} bytes in {}ms", received, stats.elapsed.millis());

    co_return Ok(stats);
}

Future<TransferResult<TransferStats>> sendBytes(
    Session& session,
    std::span<const uint8_t> data,
    TransferOptions options
) {
    auto channel = ARC_CO_UNWRAP(co_await session.openChannel(Direction::Send, channelOptions(options, data.size())));

    Reporter reporter{options, data.size()};
    uint64_t sent = 0;

    while (sent < data.size()) {
        if (isCancelled(options)) {
            co_return Err(TransferError{cancelled(channel), sent});
        }

        size_t n = std::min<size_t>(options.chunkSize, data.size() - sent);

        auto res = co_await writeChunk(channel, data.subspan(sent, n), options);
        if (!res) {
            co_return Err(TransferError{std::move(res).unwrapErr(), sent});
        }

        sent += n;
        reporter.report(sent);
    }

    auto res = co_await finishChannel(channel, options);
    if (!res) {
        co_return Err(TransferError{std::move(res).unwrapErr(), sent});
    }

    co_return Ok(reporter.stats(sent));
}

Future<TransferResult<std::vector<uint8_t>>> receiveBytes(
    Session& session,
    TransferOptions options
) {
    auto channel = ARC_CO_UNWRAP(co_await session.acceptChannel(Direction::Receive, channelOptions(options, std::nullopt), options.cancel));

    Reporter reporter{options, std::nullopt};
    std::vector<uint8_t> out;

    while (true) {
        if (isCancelled(options)) {
            co_return Err(TransferError{cancelled(channel), out.size()});
        }

        auto res = co_await readChunk(channel, options);
        if (!res) {
            co_return Err(TransferError{std::move(res).unwrapErr(), out.size()});
        }

        auto chunk = std::move(res).unwrap();
        if (!chunk) {
            break;
        }

        if (out.size() + chunk->size() > options.maxBytes) {
            log::warn("Channel {}: peer sent more than {} bytes, aborting", channel.id(), options.maxBytes);
            channel.abort(AbortReason::UserCancelled);
            co_return Err(TransferError{SessionError::InvalidArgument, out.size()});
        }

        out.insert(out.end(), chunk->begin(), chunk->end());
        reporter.report(out.size());
    }

    co_return Ok(std::move(out));
}

}
