#include "Message.hpp"
#include "Identity.hpp"
#include "Utils.hpp"

#include <cstring>
#include <boost/endian/conversion.hpp>
#include <zlib.h>

namespace lanchat {

    // ------------------------------------------------------------
    // Endianness
    // ------------------------------------------------------------
    uint32_t hton32(uint32_t value) { return boost::endian::native_to_big(value); }
    uint32_t ntoh32(uint32_t value) { return boost::endian::big_to_native(value); }
    uint64_t hton64(uint64_t value) { return boost::endian::native_to_big(value); }
    uint64_t ntoh64(uint64_t value) { return boost::endian::big_to_native(value); }

    namespace {

        template <typename T>
        void appendRaw(vector<uint8_t>& buffer, T value) {
            const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&value);
            buffer.insert(buffer.end(), bytes, bytes + sizeof(T));
        }

        template <typename T>
        T readRaw(const uint8_t* data) {
            T value;
            memcpy(&value, data, sizeof(T));
            return value;
        }

        bool isKnownKind(uint8_t raw) {
            return raw >= static_cast<uint8_t>(MessageKind::HELLO) &&
                   raw <= static_cast<uint8_t>(MessageKind::PEER_LIST);
        }
    }

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32_buf(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    bool Message::operator==(const Message& other) const {
        return id == other.id &&
               sender == other.sender &&
               senderName == other.senderName &&
               timestamp == other.timestamp &&
               kind == other.kind &&
               payload == other.payload;
    }

    bool kindCarriesPayload(MessageKind kind) {
        switch (kind) {
            case MessageKind::CHAT:
            case MessageKind::PEER_LIST:
                return true;
            case MessageKind::HELLO:
            case MessageKind::WELCOME:
            case MessageKind::HEARTBEAT:
                return false;
        }
        return false;
    }

    Message makeMessage(MessageKind kind, const NodeIdentity& self, string payload) {
        Message message;
        message.id = Identity::newMessageId();
        message.sender = self.id;
        message.senderName = self.displayName;
        message.timestamp = nowMillis();
        message.kind = kind;
        message.payload = move(payload);
        return message;
    }

    size_t encodedSize(const Message& msg) {
        return MIN_DATAGRAM_SIZE + msg.senderName.size() + msg.payload.size();
    }

    // ------------------------------------------------------------
    // SERIALIZACIÓN
    // ------------------------------------------------------------
    vector<uint8_t> encodeMessage(const Message& message) {
        if (message.senderName.size() > MAX_NAME_LENGTH) {
            throw MessageTooLarge("sender name exceeds " + to_string(MAX_NAME_LENGTH) + " bytes");
        }
        if (!message.payload.empty() && !kindCarriesPayload(message.kind)) {
            throw invalid_argument(messageKindToString(message.kind) + " message cannot carry a payload");
        }

        const size_t totalLength = encodedSize(message);
        if (totalLength > MAX_DATAGRAM_SIZE) {
            throw MessageTooLarge("encoded message is " + to_string(totalLength) +
                                  " bytes, limit is " + to_string(MAX_DATAGRAM_SIZE));
        }

        vector<uint8_t> buffer;
        buffer.reserve(totalLength);

        appendRaw(buffer, hton32(NETWORK_MAGIC));
        buffer.push_back(PROTOCOL_VERSION);
        buffer.push_back(static_cast<uint8_t>(message.kind));
        buffer.insert(buffer.end(), message.id.begin(), message.id.end());
        buffer.insert(buffer.end(), message.sender.begin(), message.sender.end());
        appendRaw(buffer, hton64(message.timestamp));

        buffer.push_back(static_cast<uint8_t>(message.senderName.size()));
        buffer.insert(buffer.end(), message.senderName.begin(), message.senderName.end());

        appendRaw(buffer, boost::endian::native_to_big(static_cast<uint16_t>(message.payload.size())));
        buffer.insert(buffer.end(), message.payload.begin(), message.payload.end());

        // checksum CRC32 sobre TODO lo anterior
        appendRaw(buffer, hton32(crc32_buf(buffer.data(), buffer.size())));

        return buffer;
    }

    // ------------------------------------------------------------
    // PARSEO
    // ------------------------------------------------------------
    DecodeError decodeMessage(const vector<uint8_t>& buffer, Message& outputMessage) {
        return decodeMessage(buffer.data(), buffer.size(), outputMessage);
    }

    DecodeError decodeMessage(const uint8_t* data, size_t length, Message& outputMessage) {
        if (data == nullptr || length < MIN_DATAGRAM_SIZE) return DecodeError::TooShort;
        if (length > MAX_DATAGRAM_SIZE) return DecodeError::TooLarge;

        size_t position = 0;
        if (ntoh32(readRaw<uint32_t>(data)) != NETWORK_MAGIC) return DecodeError::BadMagic;
        position += 4;

        if (data[position++] != PROTOCOL_VERSION) return DecodeError::BadVersion;

        const uint8_t rawKind = data[position++];
        if (!isKnownKind(rawKind)) return DecodeError::UnknownKind;

        Message message;
        message.kind = static_cast<MessageKind>(rawKind);

        memcpy(message.id.data(), data + position, ID_SIZE);
        position += ID_SIZE;
        memcpy(message.sender.data(), data + position, ID_SIZE);
        position += ID_SIZE;
        message.timestamp = ntoh64(readRaw<uint64_t>(data + position));
        position += 8;

        const size_t nameLength = data[position++];
        // room for the name, the payload length and the checksum
        if (position + nameLength + PAYLOAD_LENGTH_SIZE + CHECKSUM_SIZE > length) {
            return DecodeError::BadLength;
        }
        message.senderName.assign(reinterpret_cast<const char*>(data + position), nameLength);
        position += nameLength;

        const size_t payloadLength = boost::endian::big_to_native(readRaw<uint16_t>(data + position));
        position += PAYLOAD_LENGTH_SIZE;
        if (position + payloadLength + CHECKSUM_SIZE != length) return DecodeError::BadLength;
        message.payload.assign(reinterpret_cast<const char*>(data + position), payloadLength);
        position += payloadLength;

        const uint32_t receivedChecksum = ntoh32(readRaw<uint32_t>(data + position));
        if (crc32_buf(data, position) != receivedChecksum) return DecodeError::BadChecksum;

        if (!message.payload.empty() && !kindCarriesPayload(message.kind)) {
            return DecodeError::UnexpectedPayload;
        }

        outputMessage = move(message);
        return DecodeError::None;
    }

    // ------------------------------------------------------------
    // UTILIDAD: conversiones a string
    // ------------------------------------------------------------
    string messageKindToString(MessageKind kind) {
        switch (kind) {
            case MessageKind::HELLO:     return "HELLO";
            case MessageKind::WELCOME:   return "WELCOME";
            case MessageKind::HEARTBEAT: return "HEARTBEAT";
            case MessageKind::CHAT:      return "CHAT";
            case MessageKind::PEER_LIST: return "PEER_LIST";
        }
        return "UNKNOWN";
    }

    string decodeErrorToString(DecodeError error) {
        switch (error) {
            case DecodeError::None:              return "none";
            case DecodeError::TooShort:          return "datagram too short";
            case DecodeError::TooLarge:          return "datagram too large";
            case DecodeError::BadMagic:          return "bad magic";
            case DecodeError::BadVersion:        return "unsupported protocol version";
            case DecodeError::UnknownKind:       return "unknown message kind";
            case DecodeError::BadLength:         return "length fields do not match datagram";
            case DecodeError::BadChecksum:       return "checksum mismatch";
            case DecodeError::UnexpectedPayload: return "payload on a control message";
        }
        return "unknown error";
    }

} // namespace lanchat
