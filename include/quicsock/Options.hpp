#pragma once

#include <asp/time/Duration.hpp>

#include <stddef.h>
#include <string>

namespace qs {

// Various debug options for a session. Note that some of those do nothing in Release builds.
struct SessionDebugOptions {
    // Print verbose wolfSSL debug output
    bool verboseSsl = false;
    // Print verbose ngtcp2 debug output (requires QUICSOCK_DEBUG)
    bool verboseQuic = false;
    // Simulate packet loss, 0.0f means no packet loss, 1.0f means 100% packet loss
    float packetLossSimulation = 0.0f;
};

struct SessionOptions {
    /// Deadline for the whole handshake, starting from the first sent packet
    asp::time::Duration handshakeTimeout = asp::time::Duration::fromSecs(10);
    /// Connection is closed if nothing is received for this long
    asp::time::Duration idleTimeout = asp::time::Duration::fromSecs(30);
    /// Interval of PING frames sent on an otherwise idle connection
    asp::time::Duration keepAlive = asp::time::Duration::fromSecs(10);
    /// SNI and hostname verification target (client only)
    std::string serverName = "localhost";
    /// Maximum number of concurrently open channels the peer may initiate
    size_t maxIncomingChannels = 100;
    /// Capacity of the connection event queue
    size_t eventQueueCapacity = 64;

    SessionDebugOptions debug;
};

}
