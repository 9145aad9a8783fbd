#pragma once
#ifndef LANCHAT_DISCOVERY_HPP
#define LANCHAT_DISCOVERY_HPP

#include "Message.hpp"
#include "Peer.hpp"
#include "PeerRegistry.hpp"
#include "Transport.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <utility>

namespace lanchat {

    struct DiscoveryOptions {
        std::string broadcastAddress = DEFAULT_BROADCAST_ADDRESS; // empty disables broadcast
        uint16_t discoveryPort = DEFAULT_DISCOVERY_PORT;
        uint16_t localPort = 0;        // also broadcast here when no discovery socket is bound
        bool broadcastToLocalPort = false;
        std::vector<Endpoint> bootstrapPeers;
        bool sharePeerList = true;
        std::chrono::milliseconds announceInterval = DEFAULT_ANNOUNCE_INTERVAL;
    };

    /**
     * Hello / Welcome handshake plus peer-list gossip.
     *
     * A Hello is answered with a unicast Welcome (and, optionally, a PeerList of
     * everyone else we know). A PeerList is answered with Hellos to the listed
     * peers we have not met yet; they only enter the registry once they reply.
     */
    class DiscoveryService {
        public:
            DiscoveryService(boost::asio::io_context& ctx, Transport& transport, PeerRegistry& registry,
                             NodeIdentity self, DiscoveryOptions options);

            /**
             * Sends the first announcement and arms the re-announce timer.
             */
            void start();

            void stop();

            /**
             * Broadcasts a Hello to the discovery channel and unicasts it to every
             * bootstrap peer.
             */
            void announce();

            void handleHello(const Message& msg, const Endpoint& from);
            void handleWelcome(const Message& msg, const Endpoint& from);
            void handlePeerList(const Message& msg, const Endpoint& from);

            /**
             * Splits the peers into as many PEER_LIST payloads as needed to keep
             * each datagram under the size ceiling. Entries are "peerIdHex@host:port".
             */
            static std::vector<std::string> encodePeerList(const std::vector<PeerInfo>& peers, size_t budget);

            /**
             * Parses a PEER_LIST payload, skipping malformed entries.
             */
            static std::vector<std::pair<PeerId, Endpoint>> parsePeerList(const std::string& payload);

            uint64_t hellosSent() const { return helloCount.load(); }

        private:
            void scheduleAnnounce();
            void sendControl(MessageKind kind, const Endpoint& to);
            void sendPeerList(const Endpoint& to, const PeerId& exclude);
            void registerSender(const Message& msg, const Endpoint& from);

            boost::asio::steady_timer announceTimer;
            Transport& transport;
            PeerRegistry& registry;
            NodeIdentity self;
            DiscoveryOptions opts;
            std::atomic<bool> running{false};
            std::atomic<uint64_t> helloCount{0};
    };

} // namespace lanchat

#endif // LANCHAT_DISCOVERY_HPP
