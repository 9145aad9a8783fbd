#pragma once
#ifndef LANCHAT_MESSAGE_HPP
#define LANCHAT_MESSAGE_HPP

#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>

#include "Types.hpp"
#include "Peer.hpp"

using namespace std;

namespace lanchat {

    // ============================================================
    //  TIPOS DE MENSAJE
    // ============================================================
    enum class MessageKind : uint8_t {
        HELLO     = 1,
        WELCOME   = 2,
        HEARTBEAT = 3,
        CHAT      = 4,
        PEER_LIST = 5
    };

    // ============================================================
    //  ESTRUCTURA DEL MENSAJE
    // ============================================================
    struct Message {
        MessageId id{};
        PeerId sender{};
        string senderName;
        uint64_t timestamp = 0; // ms since the Unix epoch
        MessageKind kind = MessageKind::HEARTBEAT;
        string payload; // empty except for CHAT and PEER_LIST

        bool operator==(const Message& other) const;
        bool operator!=(const Message& other) const { return !(*this == other); }
    };

    // ============================================================
    //  ERRORES
    // ============================================================
    enum class DecodeError : uint8_t {
        None = 0,
        TooShort,
        TooLarge,
        BadMagic,
        BadVersion,
        UnknownKind,
        BadLength,
        BadChecksum,
        UnexpectedPayload
    };

    class MessageTooLarge : public length_error {
    public:
        explicit MessageTooLarge(const string& what) : length_error(what) {}
    };

    // ============================================================
    //  FUNCIONES
    // ============================================================

    /** Serializa un Message a bytes en formato de red:
     * [magic(4)] [version(1)] [kind(1)] [messageId(16)] [senderId(16)] [timestamp(8)]
     * [nameLen(1)] [name] [payloadLen(2)] [payload] [crc32(4)]
     * Integers are big-endian. Throws MessageTooLarge when the result would not
     * fit in MAX_DATAGRAM_SIZE, invalid_argument when a control message carries
     * a payload.
     */
    vector<uint8_t> encodeMessage(const Message& msg);

    /** Builds a message from this node with a fresh id and the current time. */
    Message makeMessage(MessageKind kind, const NodeIdentity& self, string payload = string());

    /** Size encodeMessage() would produce, without building the buffer. */
    size_t encodedSize(const Message& msg);

    /** Parsea un datagrama completo y valida magic, versión, tipo, longitudes y CRC32.
     *  outMsg is only written on success. Never throws.
     */
    DecodeError decodeMessage(const vector<uint8_t>& buf, Message& outMsg);
    DecodeError decodeMessage(const uint8_t* data, size_t length, Message& outMsg);

    /** True for the kinds that are allowed to carry a payload. */
    bool kindCarriesPayload(MessageKind kind);

    /** Calcula el CRC32 de un buffer */
    uint32_t crc32_buf(const void* data, size_t len);

    uint32_t hton32(uint32_t value);
    uint32_t ntoh32(uint32_t value);
    uint64_t hton64(uint64_t value);
    uint64_t ntoh64(uint64_t value);

    /** Convierte un MessageKind en string (útil para logs) */
    string messageKindToString(MessageKind kind);
    string decodeErrorToString(DecodeError error);

} // namespace lanchat

#endif // LANCHAT_MESSAGE_HPP
