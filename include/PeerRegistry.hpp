#ifndef LANCHAT_PEER_REGISTRY_HPP
#define LANCHAT_PEER_REGISTRY_HPP

#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <vector>
#include <string>
#include <chrono>
#include <cstdint>

#include "Peer.hpp"
#include "Identity.hpp"

namespace lanchat {

    enum class UpsertResult {
        Inserted,       // id was unknown
        Refreshed,      // same endpoint, lastSeen / name updated
        AddressChanged  // same id re-announced from a different endpoint
    };

    /**
     * Membership table, keyed by PeerId. All operations are atomic per call:
     * writers take the lock exclusively, readers share it, and list() hands
     * out a copy so callers can iterate while other threads mutate.
     */
    class PeerRegistry {
        public:
            PeerRegistry() = default;
            ~PeerRegistry() = default;

            PeerRegistry(const PeerRegistry&) = delete;
            PeerRegistry& operator=(const PeerRegistry&) = delete;

            /**
             * Inserts the peer or refreshes the record with the same id.
             * The endpoint and display name are overwritten; lastSeen only moves forward.
             */
            UpsertResult upsert(const PeerInfo& peer);

            /**
             * Refreshes lastSeen only. Returns false if the id is unknown.
             */
            bool touch(const PeerId& id, Clock::time_point timestamp);

            /**
             * Snapshot of every known peer.
             */
            std::vector<PeerInfo> list() const;

            /**
             * Removes every peer whose lastSeen is older than now - timeout.
             * Returns the removed records.
             */
            std::vector<PeerInfo> evict(Clock::time_point now, std::chrono::milliseconds timeout);

            /**
             * Removes a peer by id.
             */
            bool remove(const PeerId& id);

            std::optional<PeerInfo> find(const PeerId& id) const;

            /**
             * Looks a peer up by the address it talks from.
             */
            std::optional<PeerInfo> findByEndpoint(const Endpoint& endpoint) const;

            bool contains(const PeerId& id) const;

            size_t size() const;

            void clear();

        private:
            mutable std::shared_mutex mtx;
            std::unordered_map<PeerId, PeerInfo, IdHash> peers;
    };

    /**
     * Prints a "###" membership line for new or re-addressed peers; plain
     * refreshes are silent.
     */
    void logMembershipChange(UpsertResult result, const PeerInfo& peer, const std::string& via);

} // namespace lanchat

#endif // LANCHAT_PEER_REGISTRY_HPP
