#include "ChatNode.hpp"
#include "Identity.hpp"
#include <iostream>

namespace lanchat {

    namespace {

        NodeConfig validated(NodeConfig config) {
            config.validate();
            return config;
        }

        TransportOptions transportOptions(const NodeConfig& cfg) {
            TransportOptions opts;
            opts.bindAddress = cfg.bindAddress;
            opts.listenPort = cfg.listenPort;
            opts.discoveryPort = cfg.discoveryPort;
            return opts;
        }

        HeartbeatOptions heartbeatOptions(const NodeConfig& cfg) {
            HeartbeatOptions opts;
            opts.heartbeatInterval = cfg.heartbeatInterval;
            opts.peerTimeout = cfg.peerTimeout;
            opts.sweepInterval = cfg.effectiveSweepInterval();
            return opts;
        }
    }

    ChatNode::ChatNode(NodeConfig config)
        : io(),
          workGuard(boost::asio::make_work_guard(io)),
          cfg(validated(move(config))),
          self{Identity::newPeerId(), cfg.displayName},
          transport(io, transportOptions(cfg)),
          seen(cfg.seenCapacity, cfg.seenMaxAge),
          heartbeat(io, transport, registry, self, heartbeatOptions(cfg)),
          dissemination(transport, registry, seen, self, DisseminationOptions{cfg.forwardChat}) {}

    ChatNode::~ChatNode() {
        stop();
    }

    void ChatNode::start() {
        std::lock_guard<std::mutex> lk(lifecycleMtx);
        if (started) return;

        transport.open(); // BindError propagates, nothing is running yet
        started = true;

        DiscoveryOptions discoveryOpts;
        discoveryOpts.broadcastAddress = cfg.broadcastAddress;
        discoveryOpts.discoveryPort = cfg.discoveryPort;
        discoveryOpts.localPort = transport.localPort();
        discoveryOpts.broadcastToLocalPort = !transport.hasDiscoverySocket();
        discoveryOpts.bootstrapPeers = cfg.bootstrapPeers;
        discoveryOpts.sharePeerList = cfg.sharePeerList;
        discoveryOpts.announceInterval = cfg.announceInterval;
        discovery = std::make_unique<DiscoveryService>(io, transport, registry, self, discoveryOpts);

        transport.setReceiveHandler([this](const vector<uint8_t>& datagram, const Endpoint& from) {
            onDatagram(datagram, from);
        });
        transport.startReceiving();

        heartbeat.start();
        discovery->start();

        running.store(true);

        // Ejecutar io_context en hilo en segundo plano
        ioThread = std::thread([this] {
            try {
                io.run();
            } catch (const std::exception& e) {
                std::cerr << "Error: ChatNode io context: " << e.what() << std::endl;
            }
        });
    }

    void ChatNode::stop() {
        std::lock_guard<std::mutex> lk(lifecycleMtx);
        if (!running.exchange(false)) return;

        // services and sockets belong to the io thread
        boost::asio::post(io, [this]() {
            heartbeat.stop();
            if (discovery) discovery->stop();
            transport.close();
            registry.clear();
            seen.clear();
        });
        workGuard.reset();

        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    bool ChatNode::submit(const std::string& text) {
        return dissemination.submit(text);
    }

    void ChatNode::announce() {
        if (!running.load() || !discovery || !transport.isOpen()) return;
        boost::asio::post(io, [this]() { discovery->announce(); });
    }

    void ChatNode::setDisplayHandler(DisplayCallback cb) {
        dissemination.setDisplayHandler(move(cb));
    }

    std::vector<PeerInfo> ChatNode::peers() const {
        return registry.list();
    }

    uint16_t ChatNode::localPort() const {
        return transport.localPort();
    }

    bool ChatNode::hasDiscoverySocket() const {
        return transport.hasDiscoverySocket();
    }

    NodeStats ChatNode::stats() const {
        NodeStats s;
        s.datagramsReceived = received.load();
        s.malformedDropped = malformed.load();
        s.chatsDisplayed = dissemination.displayedCount();
        s.duplicatesSuppressed = dissemination.duplicateCount();
        s.chatsForwarded = dissemination.forwardedCount();
        s.peersEvicted = heartbeat.evictedCount();
        s.hellosSent = discovery ? discovery->hellosSent() : 0;
        s.peerCount = registry.size();
        s.seenSize = seen.size();
        return s;
    }

    void ChatNode::onDatagram(const vector<uint8_t>& datagram, const Endpoint& from) {
        ++received;

        Message msg;
        const DecodeError err = decodeMessage(datagram, msg);
        if (err != DecodeError::None) {
            ++malformed;
            std::cerr << "Warning: dropped datagram from " << from.key() << ": "
                      << decodeErrorToString(err) << std::endl;
            return;
        }

        // our own broadcasts come back on the shared port
        if (msg.sender == self.id) return;

        dispatch(msg, from);
    }

    void ChatNode::dispatch(const Message& msg, const Endpoint& from) {
        switch (msg.kind) {
            case MessageKind::HELLO:
                discovery->handleHello(msg, from);
                break;
            case MessageKind::WELCOME:
                discovery->handleWelcome(msg, from);
                break;
            case MessageKind::PEER_LIST:
                discovery->handlePeerList(msg, from);
                break;
            case MessageKind::HEARTBEAT:
                heartbeat.handleHeartbeat(msg, from);
                break;
            case MessageKind::CHAT:
                dissemination.handleChat(msg, from);
                break;
        }
    }

} // namespace lanchat
