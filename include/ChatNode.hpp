#ifndef LANCHAT_CHAT_NODE_HPP
#define LANCHAT_CHAT_NODE_HPP

#include "Config.hpp"
#include "Discovery.hpp"
#include "Dissemination.hpp"
#include "Heartbeat.hpp"
#include "Message.hpp"
#include "PeerRegistry.hpp"
#include "SeenCache.hpp"
#include "Transport.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace lanchat {

    // Estadísticas del nodo
    struct NodeStats {
        uint64_t datagramsReceived = 0;
        uint64_t malformedDropped = 0;
        uint64_t chatsDisplayed = 0;
        uint64_t duplicatesSuppressed = 0;
        uint64_t chatsForwarded = 0;
        uint64_t peersEvicted = 0;
        uint64_t hellosSent = 0;
        size_t peerCount = 0;
        size_t seenSize = 0;
    };

    /**
     * One chat participant: owns the sockets, the registry and seen cache, and
     * the three protocol services, all driven by a single io thread.
     */
    class ChatNode {
        public:
            using DisplayCallback = DisseminationEngine::DisplayCallback;

            /**
             * Throws std::invalid_argument if the configuration is inconsistent.
             */
            explicit ChatNode(NodeConfig config);
            ~ChatNode();

            ChatNode(const ChatNode&) = delete;
            ChatNode& operator=(const ChatNode&) = delete;

            /**
             * Binds the sockets, announces this node and starts the timers.
             * Throws BindError when the data socket cannot be bound. A node is
             * started at most once.
             */
            void start();

            /**
             * Cancels the timers, closes the sockets and joins the io thread.
             * Known peers and seen ids are forgotten.
             */
            void stop();

            bool submit(const std::string& text);

            /**
             * Re-sends the discovery Hello right away.
             */
            void announce();

            void setDisplayHandler(DisplayCallback cb);

            std::vector<PeerInfo> peers() const;
            const NodeIdentity& identity() const { return self; }
            const NodeConfig& config() const { return cfg; }
            uint16_t localPort() const;
            bool hasDiscoverySocket() const;
            bool isRunning() const { return running.load(); }

            NodeStats stats() const;

        private:
            void onDatagram(const vector<uint8_t>& datagram, const Endpoint& from);
            void dispatch(const Message& msg, const Endpoint& from);

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;

            NodeConfig cfg;
            NodeIdentity self;

            UdpTransport transport;
            PeerRegistry registry;
            SeenCache seen;
            HeartbeatService heartbeat;
            DisseminationEngine dissemination;
            std::unique_ptr<DiscoveryService> discovery; // needs the bound port

            std::atomic<uint64_t> received{0};
            std::atomic<uint64_t> malformed{0};

            // thread for io
            std::thread ioThread;
            std::mutex lifecycleMtx;
            std::atomic<bool> running{false};
            bool started = false;
    };

} // namespace lanchat

#endif // LANCHAT_CHAT_NODE_HPP
