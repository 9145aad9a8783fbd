#include "Identity.hpp"

#include <sodium.h>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace lanchat {

    namespace {
        const char HEX_DIGITS[] = "0123456789abcdef";

        int hexValue(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        template <typename Id>
        Id randomId() {
            Id id{};
            if (!Identity::randomBytes(id.data(), id.size())) {
                throw std::runtime_error("libsodium random generator unavailable");
            }
            return id;
        }
    }

    bool Identity::initialize() {
        if (sodium_init() < 0) {
            std::cerr << "Error: Failed to initialize libsodium" << std::endl;
            return false;
        }
        return true;
    }

    bool Identity::randomBytes(uint8_t* buffer, size_t size) {
        if (buffer == nullptr) {
            std::cerr << "Error: Null buffer provided to randomBytes" << std::endl;
            return false;
        }
        if (size == 0) return true;

        // sodium_init() is idempotent; returns 1 when already initialised
        if (sodium_init() < 0) {
            std::cerr << "Error: libsodium not initialized in randomBytes" << std::endl;
            return false;
        }

        randombytes_buf(buffer, size);
        return true;
    }

    PeerId Identity::newPeerId() { return randomId<PeerId>(); }

    MessageId Identity::newMessageId() { return randomId<MessageId>(); }

    std::string Identity::toHex(const std::array<uint8_t, ID_SIZE>& id) {
        std::string out;
        out.reserve(ID_SIZE * 2);
        for (uint8_t byte : id) {
            out.push_back(HEX_DIGITS[byte >> 4]);
            out.push_back(HEX_DIGITS[byte & 0x0F]);
        }
        return out;
    }

    std::string Identity::shortHex(const std::array<uint8_t, ID_SIZE>& id) {
        return toHex(id).substr(0, 8);
    }

    bool Identity::fromHex(const std::string& hex, std::array<uint8_t, ID_SIZE>& out) {
        if (hex.size() != ID_SIZE * 2) return false;

        std::array<uint8_t, ID_SIZE> parsed{};
        for (size_t i = 0; i < ID_SIZE; ++i) {
            const int high = hexValue(hex[2 * i]);
            const int low = hexValue(hex[2 * i + 1]);
            if (high < 0 || low < 0) return false;
            parsed[i] = static_cast<uint8_t>((high << 4) | low);
        }
        out = parsed;
        return true;
    }

    std::string Identity::defaultDisplayName() {
        uint8_t bytes[2] = {0, 0};
        if (!randomBytes(bytes, sizeof(bytes))) {
            throw std::runtime_error("libsodium random generator unavailable");
        }
        std::string name = "user-";
        for (uint8_t byte : bytes) {
            name.push_back(HEX_DIGITS[byte >> 4]);
            name.push_back(HEX_DIGITS[byte & 0x0F]);
        }
        return name;
    }

    size_t IdHash::operator()(const std::array<uint8_t, ID_SIZE>& id) const noexcept {
        // ids are uniformly random, the leading bytes are already a good hash
        size_t value;
        std::memcpy(&value, id.data(), sizeof(value));
        return value;
    }

} // namespace lanchat
