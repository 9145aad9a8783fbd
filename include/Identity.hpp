#pragma once
#ifndef LANCHAT_IDENTITY_HPP
#define LANCHAT_IDENTITY_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <functional>

#include "Types.hpp"

namespace lanchat {

    /**
     * @class Identity
     * @brief Generación de identificadores aleatorios con libsodium
     *
     * PeerIds and MessageIds are 128 random bits, so collisions between
     * processes on one LAN are not a practical concern.
     */
    class Identity {
    public:
        /**
         * @brief Initialises libsodium. Safe to call more than once.
         * @return true if the random generator is usable
         */
        static bool initialize();

        /** @brief Fresh id for this process. Throws runtime_error if libsodium is unusable. */
        static PeerId newPeerId();

        /** @brief Fresh id for an outgoing message. */
        static MessageId newMessageId();

        /** @brief Fills the buffer with random bytes. */
        static bool randomBytes(uint8_t* buffer, size_t size);

        /** @brief Lowercase hex of the whole id (32 characters). */
        static std::string toHex(const std::array<uint8_t, ID_SIZE>& id);

        /** @brief First 8 hex characters, for log lines. */
        static std::string shortHex(const std::array<uint8_t, ID_SIZE>& id);

        /**
         * @brief Parses 32 hex characters (either case) into an id
         * @return false if the string has the wrong length or a non-hex character
         */
        static bool fromHex(const std::string& hex, std::array<uint8_t, ID_SIZE>& out);

        /** @brief "user-" followed by two random bytes in hex. */
        static std::string defaultDisplayName();
    };

    /** Hash for PeerId / MessageId keys in unordered containers. */
    struct IdHash {
        size_t operator()(const std::array<uint8_t, ID_SIZE>& id) const noexcept;
    };

} // namespace lanchat

#endif // LANCHAT_IDENTITY_HPP
