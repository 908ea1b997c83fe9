#include <iostream>
#include <charconv>
#include <cstdlib>

#include <arc/prelude.hpp>
#include <arc/time/Timeout.hpp>
#include <quicsock/Endpoint.hpp>
#include <quicsock/Session.hpp>
#include <quicsock/Transfer.hpp>
#include <quicsock/Log.hpp>
#include <asp/time.hpp>

#include <wolfssl/options.h>
#include <wolfssl/wolfcrypt/random.h>

using namespace qs;
using namespace asp::time;
using namespace arc;

static constexpr size_t TOKEN_SIZE = 16;
static const Duration TOKEN_TIMEOUT = Duration::fromSecs(10);

static std::string formatBytes(double bytes) {
    static constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < std::size(units)) {
        bytes /= 1024.0;
        unit++;
    }

    if (unit == 0) {
        return fmt::format("{} {}", (uint64_t) bytes, units[unit]);
    }

    return fmt::format("{:.2f} {}", bytes, units[unit]);
}

static std::optional<qsox::SocketAddress> parseAddress(std::string_view str) {
    auto colonPos = str.rfind(':');
    if (colonPos == std::string_view::npos) {
        return std::nullopt;
    }

    auto portStr = str.substr(colonPos + 1);
    auto host = str.substr(0, colonPos);

    uint16_t port;
    if (std::from_chars(portStr.data(), portStr.data() + portStr.size(), port).ec != std::errc()) {
        return std::nullopt;
    }

    if (host.starts_with('[') && host.ends_with(']')) {
        host.remove_prefix(1);
        host.remove_suffix(1);
    }

    if (auto address = qsox::IpAddress::parse(std::string(host))) {
        return qsox::SocketAddress{*address, port};
    }

    return std::nullopt;
}

static std::optional<std::string> generateToken() {
    WC_RNG rng;
    if (wc_InitRng(&rng) != 0) {
        return std::nullopt;
    }

    uint8_t data[TOKEN_SIZE];
    int ret = wc_RNG_GenerateBlock(&rng, data, sizeof(data));
    wc_FreeRng(&rng);

    if (ret != 0) {
        return std::nullopt;
    }

    return hexEncode(data, sizeof(data));
}

// Prints progress at most a few times per second, and always on the last chunk.
static move_only_function<void(const TransferProgress&)> progressPrinter() {
    return [lastPrint = std::optional<Instant>{}](const TransferProgress& p) mutable {
        bool done = p.totalBytes && p.bytesTransferred >= *p.totalBytes;
        if (!done && lastPrint && lastPrint->elapsed() < Duration::fromMillis(250)) {
            return;
        }

        lastPrint = Instant::now();

        auto speed = formatBytes(p.bytesPerSecond());
        if (auto fraction = p.fraction()) {
            fmt::print(
                "\r{} / {} ({:.1f}%), {}/s    ",
                formatBytes((double) p.bytesTransferred), formatBytes((double) *p.totalBytes), *fraction * 100.0, speed
            );
        } else {
            fmt::print("\r{}, {}/s    ", formatBytes((double) p.bytesTransferred), speed);
        }

        std::fflush(stdout);
    };
}

static void printStats(const TransferStats& stats) {
    double secs = (double) stats.elapsed.millis() / 1000.0;
    double speed = secs > 0.0 ? (double) stats.bytesTransferred / secs : 0.0;

    fmt::println("\nTransferred {} in {:.2f}s ({}/s)", formatBytes((double) stats.bytesTransferred), secs, formatBytes(speed));
}

static arc::Future<int> runSend(const qsox::SocketAddress& address, const std::filesystem::path& file, CancellationToken& cancel) {
    auto identity = Identity::generateSelfSigned("localhost", Duration::fromSecs(24 * 60 * 60));
    if (!identity) {
        std::cerr << "Failed to generate a certificate: " << identity.unwrapErr().message() << std::endl;
        co_return 1;
    }

    auto fingerprint = identity.unwrap().fingerprint();

    auto tls = TlsConfig::buildServer(std::move(identity).unwrap(), TrustPolicy::any());
    if (!tls) {
        std::cerr << "Failed to create TLS config: " << tls.unwrapErr().message() << std::endl;
        co_return 1;
    }

    auto endpoint = co_await Endpoint::bind(address, std::move(tls).unwrap());
    if (!endpoint) {
        std::cerr << "Failed to bind to " << address.toString() << ": " << endpoint.unwrapErr().message() << std::endl;
        co_return 1;
    }

    auto token = generateToken();
    if (!token) {
        std::cerr << "Failed to generate a token" << std::endl;
        co_return 1;
    }

    fmt::println("Listening on {}", endpoint.unwrap()->localAddress().toString());
    fmt::println("Token: {}", *token);
    fmt::println("Fingerprint: {}", fingerprint.toString());

    while (true) {
        auto sres = co_await endpoint.unwrap()->accept(&cancel);
        if (!sres) {
            std::cerr << "Failed to accept a receiver: " << sres.unwrapErr().message() << std::endl;

            if (cancel.isCancelled() || endpoint.unwrap()->isClosed()) {
                co_return 1;
            }

            continue;
        }

        auto session = std::move(sres).unwrap();
        fmt::println("Receiver connected from {}", session->remoteAddress().toString());

        // the token is sent hex encoded
        auto tres = co_await arc::timeout(TOKEN_TIMEOUT, receiveBytes(*session, TransferOptions {
            .chunkSize = TOKEN_SIZE * 2,
            .maxFrameSize = 1024,
            .cancel = &cancel,
            .maxBytes = TOKEN_SIZE * 2,
        }));

        if (!tres) {
            std::cerr << "Receiver did not send a token in time, disconnecting" << std::endl;
            session->close("token timeout");
            continue;
        }

        auto received = std::move(tres).unwrap();
        if (!received) {
            std::cerr << "Failed to receive the token: " << received.unwrapErr().message() << std::endl;
            session->close("token not received");
            continue;
        }

        auto& got = received.unwrap();
        if (std::string_view{reinterpret_cast<const char*>(got.data()), got.size()} != *token) {
            std::cerr << "Receiver sent an invalid token, disconnecting" << std::endl;
            session->close("invalid token");
            continue;
        }

        auto res = co_await sendFile(*session, file, TransferOptions {
            .cancel = &cancel,
            .onProgress = progressPrinter(),
        });

        if (!res) {
            std::cerr << "\nTransfer failed: " << res.unwrapErr().message() << std::endl;
            session->close("transfer failed");
            co_return 1;
        }

        printStats(res.unwrap());

        session->close();
        co_await session->closed();
        co_return 0;
    }
}

static arc::Future<int> runReceive(
    const qsox::SocketAddress& address,
    std::string_view token,
    const std::filesystem::path& dest,
    std::optional<Fingerprint> fingerprint,
    CancellationToken& cancel
) {
    auto tls = TlsConfig::buildClient(std::nullopt, fingerprint ? TrustPolicy::fingerprint(*fingerprint) : TrustPolicy::any());
    if (!tls) {
        std::cerr << "Failed to create TLS config: " << tls.unwrapErr().message() << std::endl;
        co_return 1;
    }

    if (!fingerprint) {
        log::warn("No fingerprint given, the sender's certificate will not be verified");
    }

    auto sres = co_await Session::connect(address, std::move(tls).unwrap(), {}, &cancel);
    if (!sres) {
        std::cerr << "Failed to connect: " << sres.unwrapErr().message() << std::endl;
        co_return 1;
    }

    auto session = std::move(sres).unwrap();
    if (auto fp = session->peerFingerprint()) {
        fmt::println("Connected to {} ({})", address.toString(), fp->toString());
    }

    auto tokenRes = co_await sendBytes(
        *session,
        std::span{reinterpret_cast<const uint8_t*>(token.data()), token.size()},
        TransferOptions { .cancel = &cancel }
    );

    if (!tokenRes) {
        std::cerr << "Failed to send the token: " << tokenRes.unwrapErr().message() << std::endl;
        co_return 1;
    }

    auto res = co_await receiveFile(*session, dest, TransferOptions {
        .cancel = &cancel,
        .onProgress = progressPrinter(),
    });

    if (!res) {
        std::cerr << "\nTransfer failed: " << res.unwrapErr().message() << std::endl;
        co_return 1;
    }

    printStats(res.unwrap());

    session->close();
    co_await session->closed();

    co_return 0;
}

static void printUsage(const char* name) {
    std::cerr << "Usage:\n"
              << "  " << name << " send <bind-addr> <file>\n"
              << "  " << name << " receive <addr> <token> <dest> [fingerprint]" << std::endl;
}

arc::Future<int> amain(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        co_return 1;
    }

    static Instant start = Instant::now();

    qs::log::setMinLevel(std::getenv("QUICSOCK_DEBUG_LOG") ? qs::log::Level::Debug : qs::log::Level::Info);
    qs::log::setLogFunction([&](qs::log::Level level, const std::string& message) {
        fmt::println(stderr, "[{:.6f}] [{}] {}", start.elapsed().seconds<double>(), qs::log::levelToString(level), message);
    });

    CancellationToken cancel;

    auto ctrlc = arc::spawn([](CancellationToken* cancel) -> arc::Future<> {
        co_await arc::ctrl_c();
        fmt::println(stderr, "\nCancelling");
        cancel->cancel();
    }(&cancel));

    std::string_view mode = argv[1];
    int code = 1;

    if (mode == "send" && argc == 4) {
        auto address = parseAddress(argv[2]);
        if (!address) {
            std::cerr << "Invalid address: " << argv[2] << std::endl;
            co_return 1;
        }

        code = co_await runSend(*address, argv[3], cancel);
    } else if (mode == "receive" && (argc == 5 || argc == 6)) {
        auto address = parseAddress(argv[2]);
        if (!address) {
            std::cerr << "Invalid address: " << argv[2] << std::endl;
            co_return 1;
        }

        std::optional<Fingerprint> fingerprint;
        if (argc == 6) {
            fingerprint = Fingerprint::fromHex(argv[5]);
            if (!fingerprint) {
                std::cerr << "Invalid fingerprint: " << argv[5] << std::endl;
                co_return 1;
            }
        }

        code = co_await runReceive(*address, argv[3], argv[4], fingerprint, cancel);
    } else {
        printUsage(argv[0]);
    }

    ctrlc.abort();

    co_return code;
}

ARC_DEFINE_MAIN_NT(amain, 1);
