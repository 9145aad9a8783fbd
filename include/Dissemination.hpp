#pragma once
#ifndef LANCHAT_DISSEMINATION_HPP
#define LANCHAT_DISSEMINATION_HPP

#include "Message.hpp"
#include "Peer.hpp"
#include "PeerRegistry.hpp"
#include "SeenCache.hpp"
#include "Transport.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace lanchat {

    struct DisseminationOptions {
        bool forwardChat = true; // relay first-seen chats to every other peer
    };

    /**
     * Chat fan-out. Local text goes to every known peer; inbound chats are
     * shown once per message id and, when forwarding is on, relayed so the
     * message reaches peers the author does not know directly.
     */
    class DisseminationEngine {
        public:
            using DisplayCallback = std::function<void(const std::string& senderName,
                                                       const std::string& text,
                                                       uint64_t timestamp)>;

            DisseminationEngine(Transport& transport, PeerRegistry& registry, SeenCache& seen,
                                NodeIdentity self, DisseminationOptions options = DisseminationOptions());

            void setDisplayHandler(DisplayCallback cb);

            /**
             * Sends a chat line from this node. Returns false for empty text or
             * a message that does not fit in one datagram.
             */
            bool submit(const std::string& text);

            void handleChat(const Message& msg, const Endpoint& from);

            uint64_t displayedCount() const { return displayed.load(); }
            uint64_t duplicateCount() const { return duplicates.load(); }
            uint64_t forwardedCount() const { return forwarded.load(); }

        private:
            void display(const Message& msg);

            Transport& transport;
            PeerRegistry& registry;
            SeenCache& seen;
            NodeIdentity self;
            DisseminationOptions opts;

            std::mutex displayMtx;
            DisplayCallback onDisplay;

            std::atomic<uint64_t> displayed{0};
            std::atomic<uint64_t> duplicates{0};
            std::atomic<uint64_t> forwarded{0};
    };

} // namespace lanchat

#endif // LANCHAT_DISSEMINATION_HPP
