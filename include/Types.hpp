#pragma once
#ifndef LANCHAT_TYPES_HPP
#define LANCHAT_TYPES_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

// ============================================================
//  CONFIGURACIÓN DEL PROTOCOLO
// ============================================================

namespace lanchat {

    inline constexpr uint32_t NETWORK_MAGIC    = 0x4C43484D; // "LCHM"
    inline constexpr uint8_t  PROTOCOL_VERSION = 1;

    // ==== IDENTIFICADORES ====
    inline constexpr size_t ID_SIZE = 16; // 128-bit peer / message ids

    using PeerId    = std::array<uint8_t, ID_SIZE>;
    using MessageId = std::array<uint8_t, ID_SIZE>;

    // ==== LÍMITES DEL DATAGRAMA ====
    // Kept well under the 1472-byte Ethernet UDP payload so nothing fragments.
    inline constexpr size_t MAX_DATAGRAM_SIZE = 1200;
    // magic + version + kind + messageId + senderId + timestamp
    inline constexpr size_t MESSAGE_HEADER_SIZE = 4 + 1 + 1 + ID_SIZE + ID_SIZE + 8;
    inline constexpr size_t NAME_LENGTH_SIZE    = 1;
    inline constexpr size_t PAYLOAD_LENGTH_SIZE = 2;
    inline constexpr size_t CHECKSUM_SIZE       = 4; // CRC32
    inline constexpr size_t MIN_DATAGRAM_SIZE =
        MESSAGE_HEADER_SIZE + NAME_LENGTH_SIZE + PAYLOAD_LENGTH_SIZE + CHECKSUM_SIZE;
    inline constexpr size_t MAX_NAME_LENGTH = 255;

    // ==== PUERTOS ====
    inline constexpr uint16_t DEFAULT_DISCOVERY_PORT = 9487;
    inline constexpr const char* DEFAULT_BROADCAST_ADDRESS = "255.255.255.255";
    inline constexpr const char* DEFAULT_BIND_ADDRESS = "0.0.0.0";

    // ==== TEMPORIZADORES ====
    inline constexpr std::chrono::milliseconds DEFAULT_HEARTBEAT_INTERVAL{15000};
    inline constexpr std::chrono::milliseconds DEFAULT_PEER_TIMEOUT{60000};
    inline constexpr std::chrono::milliseconds DEFAULT_ANNOUNCE_INTERVAL{900000};

    // ==== CACHE DE MENSAJES VISTOS ====
    inline constexpr size_t DEFAULT_SEEN_CAPACITY = 4096;
    inline constexpr std::chrono::milliseconds DEFAULT_SEEN_MAX_AGE{600000};

    // ==== NOMBRES ====
    inline constexpr size_t MAX_DISPLAY_NAME_LENGTH = 12;

    using Clock = std::chrono::steady_clock;

} // namespace lanchat

#endif // LANCHAT_TYPES_HPP
