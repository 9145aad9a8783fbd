#include "Heartbeat.hpp"
#include "Identity.hpp"
#include <iostream>

namespace lanchat {

    HeartbeatService::HeartbeatService(boost::asio::io_context& ctx, Transport& t, PeerRegistry& r,
                                       NodeIdentity identity, HeartbeatOptions options)
        : heartbeatTimer(ctx), sweepTimer(ctx), transport(t), registry(r),
          self(move(identity)), opts(options) {}


    void HeartbeatService::start() {
        if (running.exchange(true)) return;
        scheduleHeartbeat();
        scheduleSweep();
    }

    void HeartbeatService::stop() {
        running = false;
        heartbeatTimer.cancel();
        sweepTimer.cancel();
    }

    void HeartbeatService::scheduleHeartbeat() {
        heartbeatTimer.expires_after(opts.heartbeatInterval);
        heartbeatTimer.async_wait([this](const boost::system::error_code& ec) {
            if (!ec && running.load()) {
                sendHeartbeats();
                scheduleHeartbeat();
            }
        });
    }

    void HeartbeatService::scheduleSweep() {
        sweepTimer.expires_after(opts.sweepInterval);
        sweepTimer.async_wait([this](const boost::system::error_code& ec) {
            if (!ec && running.load()) {
                sweep();
                scheduleSweep();
            }
        });
    }

    void HeartbeatService::sendHeartbeats() {
        const auto peers = registry.list();
        if (peers.empty()) return;

        // one message per round, every peer gets the same id
        vector<uint8_t> datagram;
        try {
            datagram = encodeMessage(makeMessage(MessageKind::HEARTBEAT, self));
        } catch (const std::exception& e) {
            std::cerr << "Error: cannot encode HEARTBEAT: " << e.what() << std::endl;
            return;
        }

        for (const auto& peer : peers) {
            transport.send(datagram, peer.endpoint);
        }
    }

    void HeartbeatService::handleHeartbeat(const Message& msg, const Endpoint& from) {
        const auto now = Clock::now();
        const auto known = registry.find(msg.sender);

        if (known && known->endpoint == from) {
            registry.touch(msg.sender, now);
            return;
        }

        PeerInfo peer;
        peer.id = msg.sender;
        peer.endpoint = from;
        peer.displayName = msg.senderName;
        peer.lastSeen = now;

        logMembershipChange(registry.upsert(peer), peer, "HEARTBEAT");
    }

    std::vector<PeerInfo> HeartbeatService::sweep(Clock::time_point now) {
        auto removed = registry.evict(now, opts.peerTimeout);

        for (const auto& peer : removed) {
            ++evicted;
            std::cout << "### Peer timed out and was removed: " << peer.displayName
                      << " [" << Identity::shortHex(peer.id) << "]" << std::endl;
        }

        return removed;
    }

} // namespace lanchat
