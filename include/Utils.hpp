#ifndef LANCHAT_UTILS_HPP
#define LANCHAT_UTILS_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <optional>

#include "Peer.hpp"

namespace lanchat {

    // ============================================================================
    // Tiempo
    // ============================================================================

    /** Wall-clock milliseconds since the Unix epoch, as carried on the wire. */
    uint64_t nowMillis();

    /** Local "HH:MM:SS" for a wire timestamp. */
    std::string formatTimestamp(uint64_t millis);

    // ============================================================================
    // Red
    // ============================================================================

    /**
     * First non-loopback IPv4 interface address, falling back to IPv6.
     * Empty when the host has no usable interface.
     */
    std::optional<std::string> detectLocalAddress();

    /**
     * Parses "host:port". The host must be an IP literal; "[v6]:port" is accepted.
     */
    bool parseEndpoint(const std::string& text, Endpoint& out);

    // ============================================================================
    // Cadenas
    // ============================================================================
    std::vector<std::string> split(const std::string& s, char delim);
    std::string trim(const std::string& s);

} // namespace lanchat

#endif // LANCHAT_UTILS_HPP
