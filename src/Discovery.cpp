#include "Discovery.hpp"
#include "Identity.hpp"
#include "Utils.hpp"
#include <iostream>

namespace lanchat {

    DiscoveryService::DiscoveryService(boost::asio::io_context& ctx, Transport& t, PeerRegistry& r,
                                       NodeIdentity identity, DiscoveryOptions options)
        : announceTimer(ctx), transport(t), registry(r), self(move(identity)), opts(move(options)) {}

    void DiscoveryService::start() {
        if (running.exchange(true)) return;
        announce();
        scheduleAnnounce();
    }

    void DiscoveryService::stop() {
        running = false;
        announceTimer.cancel();
    }

    void DiscoveryService::scheduleAnnounce() {
        announceTimer.expires_after(opts.announceInterval);
        announceTimer.async_wait([this](const boost::system::error_code& ec) {
            if (!ec && running.load()) {
                announce();
                scheduleAnnounce();
            }
        });
    }

    void DiscoveryService::announce() {
        if (!opts.broadcastAddress.empty()) {
            if (opts.discoveryPort != 0) {
                sendControl(MessageKind::HELLO, Endpoint{opts.broadcastAddress, opts.discoveryPort});
            }
            // peers that could not bind the shared port only hear us on their own port
            if (opts.broadcastToLocalPort && opts.localPort != 0 && opts.localPort != opts.discoveryPort) {
                sendControl(MessageKind::HELLO, Endpoint{opts.broadcastAddress, opts.localPort});
            }
        }

        for (const auto& peer : opts.bootstrapPeers) {
            sendControl(MessageKind::HELLO, peer);
        }
    }

    void DiscoveryService::sendControl(MessageKind kind, const Endpoint& to) {
        try {
            transport.send(encodeMessage(makeMessage(kind, self)), to);
            if (kind == MessageKind::HELLO) ++helloCount;
        } catch (const std::exception& e) {
            std::cerr << "Error: cannot encode " << messageKindToString(kind) << ": " << e.what() << std::endl;
        }
    }

    void DiscoveryService::registerSender(const Message& msg, const Endpoint& from) {
        PeerInfo peer;
        peer.id = msg.sender;
        peer.endpoint = from;
        peer.displayName = msg.senderName;
        peer.lastSeen = Clock::now();

        // same address, new id: the process there restarted
        auto previous = registry.findByEndpoint(from);
        if (previous && previous->id != peer.id && registry.remove(previous->id)) {
            std::cout << "### Peer " << previous->displayName << " [" << Identity::shortHex(previous->id)
                      << "] replaced by a new instance at " << from.key() << std::endl;
        }

        logMembershipChange(registry.upsert(peer), peer, messageKindToString(msg.kind));
    }

    void DiscoveryService::handleHello(const Message& msg, const Endpoint& from) {
        registerSender(msg, from);
        sendControl(MessageKind::WELCOME, from);
        if (opts.sharePeerList) sendPeerList(from, msg.sender);
    }

    void DiscoveryService::handleWelcome(const Message& msg, const Endpoint& from) {
        registerSender(msg, from);
    }

    void DiscoveryService::handlePeerList(const Message& msg, const Endpoint& from) {
        registry.touch(msg.sender, Clock::now());

        size_t introduced = 0;
        for (const auto& entry : parsePeerList(msg.payload)) {
            if (entry.first == self.id || registry.contains(entry.first)) continue;
            if (entry.second == from) continue;

            sendControl(MessageKind::HELLO, entry.second);
            ++introduced;
        }

        if (introduced > 0) {
            std::cout << "### " << msg.senderName << " introduced " << introduced
                      << " peer(s), saying hello" << std::endl;
        }
    }

    void DiscoveryService::sendPeerList(const Endpoint& to, const PeerId& exclude) {
        std::vector<PeerInfo> others;
        for (auto& peer : registry.list()) {
            if (peer.id != exclude) others.push_back(std::move(peer));
        }
        if (others.empty()) return;

        const size_t budget = MAX_DATAGRAM_SIZE - MIN_DATAGRAM_SIZE - self.displayName.size();
        for (auto& payload : encodePeerList(others, budget)) {
            try {
                transport.send(encodeMessage(makeMessage(MessageKind::PEER_LIST, self, std::move(payload))), to);
            } catch (const std::exception& e) {
                std::cerr << "Error: cannot encode PEER_LIST: " << e.what() << std::endl;
            }
        }
    }

    std::vector<std::string> DiscoveryService::encodePeerList(const std::vector<PeerInfo>& peers, size_t budget) {
        std::vector<std::string> payloads;
        std::string current;

        for (const auto& peer : peers) {
            const std::string entry = Identity::toHex(peer.id) + "@" + peer.endpoint.key();
            if (entry.size() > budget) continue;

            const size_t needed = current.empty() ? entry.size() : current.size() + 1 + entry.size();
            if (needed > budget) {
                payloads.push_back(std::move(current));
                current.clear();
            }
            if (!current.empty()) current.push_back(',');
            current += entry;
        }

        if (!current.empty()) payloads.push_back(std::move(current));
        return payloads;
    }

    std::vector<std::pair<PeerId, Endpoint>> DiscoveryService::parsePeerList(const std::string& payload) {
        std::vector<std::pair<PeerId, Endpoint>> entries;

        for (const auto& item : split(payload, ',')) {
            const size_t at = item.find('@');
            if (at == std::string::npos) continue;

            PeerId id{};
            Endpoint endpoint;
            if (!Identity::fromHex(item.substr(0, at), id)) continue;
            if (!parseEndpoint(item.substr(at + 1), endpoint)) continue;

            entries.emplace_back(id, endpoint);
        }

        return entries;
    }

} // namespace lanchat
