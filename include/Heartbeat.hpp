#pragma once
#ifndef LANCHAT_HEARTBEAT_HPP
#define LANCHAT_HEARTBEAT_HPP

#include "Message.hpp"
#include "Peer.hpp"
#include "PeerRegistry.hpp"
#include "Transport.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <vector>

namespace lanchat {

    struct HeartbeatOptions {
        std::chrono::milliseconds heartbeatInterval = DEFAULT_HEARTBEAT_INTERVAL;
        std::chrono::milliseconds peerTimeout = DEFAULT_PEER_TIMEOUT;
        std::chrono::milliseconds sweepInterval = DEFAULT_HEARTBEAT_INTERVAL;
    };

    /**
     * Liveness: a Heartbeat to every known peer each interval, and a separate
     * sweep that evicts peers silent for longer than the timeout.
     */
    class HeartbeatService {
        public:
            HeartbeatService(boost::asio::io_context& ctx, Transport& transport, PeerRegistry& registry,
                             NodeIdentity self, HeartbeatOptions options);

            void start();
            void stop();

            /**
             * One round of heartbeats to the current registry snapshot.
             */
            void sendHeartbeats();

            /**
             * Refreshes the sender; an unknown or re-addressed sender is upserted,
             * so late joiners are discovered through their heartbeats.
             */
            void handleHeartbeat(const Message& msg, const Endpoint& from);

            /**
             * Evicts stale peers. Returns the removed records.
             */
            std::vector<PeerInfo> sweep(Clock::time_point now = Clock::now());

            uint64_t evictedCount() const { return evicted.load(); }

        private:
            void scheduleHeartbeat();
            void scheduleSweep();

            boost::asio::steady_timer heartbeatTimer;
            boost::asio::steady_timer sweepTimer;
            Transport& transport;
            PeerRegistry& registry;
            NodeIdentity self;
            HeartbeatOptions opts;
            std::atomic<bool> running{false};
            std::atomic<uint64_t> evicted{0};
    };

} // namespace lanchat

#endif // LANCHAT_HEARTBEAT_HPP
