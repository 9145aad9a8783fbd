#pragma once
#ifndef LANCHAT_PEER_HPP
#define LANCHAT_PEER_HPP

#include <string>
#include <cstdint>

#include "Types.hpp"

using namespace std;

namespace lanchat {

    struct Endpoint {
        string host;   // ip literal
        uint16_t port = 0;

        string key() const {
            return host + ":" + to_string(port);
        }

        bool isValid() const {
            return !host.empty() && port > 0;
        }

        bool operator==(const Endpoint& other) const {
            return host == other.host && port == other.port;
        }
        bool operator!=(const Endpoint& other) const { return !(*this == other); }
    };

    struct PeerInfo {
        PeerId id{};
        Endpoint endpoint;
        string displayName;
        Clock::time_point lastSeen = Clock::now();
    };

    /** Who this process is on the wire. Fixed for the process lifetime. */
    struct NodeIdentity {
        PeerId id{};
        string displayName;
    };

} // namespace lanchat

#endif // LANCHAT_PEER_HPP
