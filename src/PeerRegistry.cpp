#include "PeerRegistry.hpp"

#include <algorithm>
#include <mutex>
#include <iostream>

namespace lanchat {

    UpsertResult PeerRegistry::upsert(const PeerInfo& p) {
        std::unique_lock<std::shared_mutex> lk(mtx);
        auto it = peers.find(p.id);

        if (it == peers.end()) {
            peers.emplace(p.id, p);
            return UpsertResult::Inserted;
        }

        PeerInfo& existing = it->second;
        const bool moved = existing.endpoint != p.endpoint;

        existing.endpoint = p.endpoint;
        if (!p.displayName.empty()) existing.displayName = p.displayName;
        existing.lastSeen = std::max(existing.lastSeen, p.lastSeen);

        return moved ? UpsertResult::AddressChanged : UpsertResult::Refreshed;
    }

    bool PeerRegistry::touch(const PeerId& id, Clock::time_point timestamp) {
        std::unique_lock<std::shared_mutex> lk(mtx);
        auto it = peers.find(id);

        if (it == peers.end()) return false;

        it->second.lastSeen = std::max(it->second.lastSeen, timestamp);
        return true;
    }

    std::vector<PeerInfo> PeerRegistry::list() const {
        std::shared_lock<std::shared_mutex> lk(mtx);
        std::vector<PeerInfo> out;

        out.reserve(peers.size());

        for (auto const& kv : peers) out.push_back(kv.second);

        return out;
    }

    std::vector<PeerInfo> PeerRegistry::evict(Clock::time_point now, std::chrono::milliseconds timeout) {
        std::unique_lock<std::shared_mutex> lk(mtx);
        std::vector<PeerInfo> removed;

        for (auto it = peers.begin(); it != peers.end();) {
            if (now - it->second.lastSeen > timeout) {
                removed.push_back(it->second);
                it = peers.erase(it);
            } else {
                ++it;
            }
        }

        return removed;
    }

    bool PeerRegistry::remove(const PeerId& id) {
        std::unique_lock<std::shared_mutex> lk(mtx);
        return peers.erase(id) > 0;
    }

    std::optional<PeerInfo> PeerRegistry::find(const PeerId& id) const {
        std::shared_lock<std::shared_mutex> lk(mtx);
        auto it = peers.find(id);

        if (it == peers.end()) return std::nullopt;
        return it->second;
    }

    std::optional<PeerInfo> PeerRegistry::findByEndpoint(const Endpoint& endpoint) const {
        std::shared_lock<std::shared_mutex> lk(mtx);

        for (auto const& kv : peers) {
            if (kv.second.endpoint == endpoint) return kv.second;
        }

        return std::nullopt;
    }

    bool PeerRegistry::contains(const PeerId& id) const {
        std::shared_lock<std::shared_mutex> lk(mtx);
        return peers.count(id) > 0;
    }

    size_t PeerRegistry::size() const {
        std::shared_lock<std::shared_mutex> lk(mtx);
        return peers.size();
    }

    void PeerRegistry::clear() {
        std::unique_lock<std::shared_mutex> lk(mtx);
        peers.clear();
    }

    void logMembershipChange(UpsertResult result, const PeerInfo& peer, const std::string& via) {
        switch (result) {
            case UpsertResult::Inserted:
                std::cout << "### New peer discovered via " << via << ": " << peer.displayName
                          << " (" << peer.endpoint.key() << ")" << std::endl;
                break;
            case UpsertResult::AddressChanged:
                std::cout << "### Peer " << peer.displayName << " [" << Identity::shortHex(peer.id)
                          << "] now at " << peer.endpoint.key() << std::endl;
                break;
            case UpsertResult::Refreshed:
                break;
        }
    }

} // namespace lanchat
