#ifndef LANCHAT_TEST_RECORDING_TRANSPORT_HPP
#define LANCHAT_TEST_RECORDING_TRANSPORT_HPP

#include <gtest/gtest.h>
#include "Transport.hpp"
#include "Message.hpp"
#include "Identity.hpp"
#include <mutex>
#include <vector>

namespace lanchat {

    /**
     * In-memory Transport for service tests. Records every datagram instead
     * of putting it on the network.
     */
    class RecordingTransport : public Transport {
        public:
            struct Sent {
                vector<uint8_t> bytes;
                Endpoint to;

                Message decoded() const {
                    Message msg;
                    EXPECT_EQ(decodeMessage(bytes, msg), DecodeError::None);
                    return msg;
                }
            };

            void send(const vector<uint8_t>& data, const Endpoint& destination) override {
                std::lock_guard<std::mutex> lk(mtx);
                sent.push_back(Sent{data, destination});
            }

            void setReceiveHandler(ReceiveCallback cb) override { onReceive = move(cb); }

            std::vector<Sent> all() const {
                std::lock_guard<std::mutex> lk(mtx);
                return sent;
            }

            std::vector<Sent> ofKind(MessageKind kind) const {
                std::vector<Sent> out;
                for (auto& s : all()) {
                    if (s.decoded().kind == kind) out.push_back(s);
                }
                return out;
            }

            void clear() {
                std::lock_guard<std::mutex> lk(mtx);
                sent.clear();
            }

        private:
            mutable std::mutex mtx;
            std::vector<Sent> sent;
            ReceiveCallback onReceive;
    };

    // -----------------------
    // HELPER FUNCTIONS
    // -----------------------
    inline NodeIdentity makeIdentity(const std::string& name) {
        return NodeIdentity{Identity::newPeerId(), name};
    }

    inline PeerInfo makePeerInfo(const NodeIdentity& who, const std::string& host, uint16_t port) {
        PeerInfo p;
        p.id = who.id;
        p.displayName = who.displayName;
        p.endpoint = Endpoint{host, port};
        p.lastSeen = Clock::now();
        return p;
    }

} // namespace lanchat

#endif // LANCHAT_TEST_RECORDING_TRANSPORT_HPP
