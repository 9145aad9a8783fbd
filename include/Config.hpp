#ifndef LANCHAT_CONFIG_HPP
#define LANCHAT_CONFIG_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

#include "Types.hpp"
#include "Peer.hpp"

namespace lanchat {

    /**
     * Startup configuration of a chat node. Durations are milliseconds so
     * tests can run the timers fast.
     */
    struct NodeConfig {
        std::string displayName;
        std::chrono::milliseconds heartbeatInterval = DEFAULT_HEARTBEAT_INTERVAL;
        std::chrono::milliseconds peerTimeout = DEFAULT_PEER_TIMEOUT;
        std::chrono::milliseconds sweepInterval{0};   // 0 = same as heartbeatInterval
        std::chrono::milliseconds announceInterval = DEFAULT_ANNOUNCE_INTERVAL;

        std::string bindAddress = DEFAULT_BIND_ADDRESS;
        uint16_t listenPort = 0;                       // 0 = ephemeral
        uint16_t discoveryPort = DEFAULT_DISCOVERY_PORT; // 0 = no discovery socket
        std::string broadcastAddress = DEFAULT_BROADCAST_ADDRESS; // empty = no broadcast
        std::vector<Endpoint> bootstrapPeers;

        bool forwardChat = true;
        bool sharePeerList = true;

        size_t seenCapacity = DEFAULT_SEEN_CAPACITY;
        std::chrono::milliseconds seenMaxAge = DEFAULT_SEEN_MAX_AGE;

        /** sweepInterval with the 0 default resolved. */
        std::chrono::milliseconds effectiveSweepInterval() const;

        /** Throws std::invalid_argument describing the first bad field. */
        void validate() const;
    };

    struct CommandLineOptions {
        NodeConfig node;
        bool showHelp = false;
    };

    /**
     * Parses the chat command line (argv[0] excluded). Throws std::invalid_argument
     * for unknown flags, missing values and malformed numbers or endpoints.
     * A missing username becomes Identity::defaultDisplayName(); longer names are
     * cut to at most MAX_DISPLAY_NAME_LENGTH bytes on a character boundary.
     */
    CommandLineOptions parseArguments(const std::vector<std::string>& args);

    std::string usage(const std::string& program);

} // namespace lanchat

#endif // LANCHAT_CONFIG_HPP
