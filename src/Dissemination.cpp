#include "Dissemination.hpp"
#include <iostream>

namespace lanchat {

    DisseminationEngine::DisseminationEngine(Transport& t, PeerRegistry& r, SeenCache& s,
                                             NodeIdentity identity, DisseminationOptions options)
        : transport(t), registry(r), seen(s), self(move(identity)), opts(options) {}

    void DisseminationEngine::setDisplayHandler(DisplayCallback cb) {
        std::lock_guard<std::mutex> lk(displayMtx);
        onDisplay = move(cb);
    }

    void DisseminationEngine::display(const Message& msg) {
        ++displayed;

        // the handler may call submit(), so it runs without displayMtx held
        DisplayCallback handler;
        {
            std::lock_guard<std::mutex> lk(displayMtx);
            handler = onDisplay;
        }
        if (handler) handler(msg.senderName, msg.payload, msg.timestamp);
    }

    bool DisseminationEngine::submit(const std::string& text) {
        if (text.empty()) return false;

        Message msg = makeMessage(MessageKind::CHAT, self, text);
        vector<uint8_t> datagram;
        try {
            datagram = encodeMessage(msg);
        } catch (const MessageTooLarge& e) {
            std::cerr << "Error: message not sent: " << e.what() << std::endl;
            return false;
        }

        // our own id, so a relayed copy coming back is dropped
        seen.insert(msg.id);
        display(msg);

        for (const auto& peer : registry.list()) {
            transport.send(datagram, peer.endpoint);
        }
        return true;
    }

    void DisseminationEngine::handleChat(const Message& msg, const Endpoint& from) {
        if (!seen.insert(msg.id)) {
            ++duplicates;
            return;
        }

        display(msg);

        // the relay is alive even if it is not the author
        if (auto relay = registry.findByEndpoint(from)) {
            registry.touch(relay->id, Clock::now());
        }

        if (!opts.forwardChat) return;

        vector<uint8_t> datagram;
        try {
            datagram = encodeMessage(msg);
        } catch (const std::exception& e) {
            std::cerr << "Error: cannot re-encode CHAT for forwarding: " << e.what() << std::endl;
            return;
        }

        for (const auto& peer : registry.list()) {
            if (peer.endpoint == from || peer.id == msg.sender) continue;
            transport.send(datagram, peer.endpoint);
            ++forwarded;
        }
    }

} // namespace lanchat
