#pragma once
#ifndef LANCHAT_TRANSPORT_HPP
#define LANCHAT_TRANSPORT_HPP

#include "Peer.hpp"
#include "Types.hpp"
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <vector>
#include <array>
#include <atomic>
#include <stdexcept>

using namespace std;

namespace lanchat {
using udp = boost::asio::ip::udp;

/**
 * Thrown when the data socket cannot be opened or bound. Fatal for the node.
 */
class BindError : public runtime_error {
public:
    explicit BindError(const string& what) : runtime_error(what) {}
};

/**
 * Datagram channel the protocol services talk through. Sends are fire-and-forget;
 * inbound datagrams are pushed to the receive handler.
 */
class Transport {
public:
    using ReceiveCallback = function<void(const vector<uint8_t>&, const Endpoint&)>;

    virtual ~Transport() = default;

    /**
     * Queues one datagram for the destination. Never blocks on the network and
     * never retries; failures are logged and dropped.
     */
    virtual void send(const vector<uint8_t>& data, const Endpoint& destination) = 0;

    /**
     * Sets the function invoked for every datagram received.
     */
    virtual void setReceiveHandler(ReceiveCallback cb) = 0;
};

struct TransportOptions {
    string bindAddress = DEFAULT_BIND_ADDRESS;
    uint16_t listenPort = 0;      // 0 picks an ephemeral port
    uint16_t discoveryPort = 0;   // 0 disables the shared discovery socket
};

class UdpTransport : public Transport {
public:
    /**
     * The UdpTransport constructor only stores the options; sockets are
     * created by open().
     *
     * @param ctx The io_context that runs every receive and send completion.
     */
    UdpTransport(boost::asio::io_context& ctx, TransportOptions options);

    /**
     * The UdpTransport destructor closes both sockets, ignoring errors.
     */
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    /**
     * Binds the data socket (broadcast enabled) and, when a discovery port is
     * configured, the shared discovery socket with SO_REUSEADDR.
     *
     * Throws BindError when the data socket cannot be bound. A discovery
     * socket that cannot be bound is logged and skipped.
     */
    void open();

    /**
     * Starts the asynchronous read loops on both sockets.
     */
    void startReceiving();

    /**
     * Closes both sockets, cancelling pending reads. Must run on the io thread
     * or after the io thread has stopped.
     */
    void close();

    void send(const vector<uint8_t>& data, const Endpoint& destination) override;

    void setReceiveHandler(ReceiveCallback cb) override;

    /**
     * Port the data socket is bound to; meaningful after open().
     */
    uint16_t localPort() const;

    bool hasDiscoverySocket() const;

    bool isOpen() const;

private:
    struct Channel {
        explicit Channel(boost::asio::io_context& ctx) : sock(ctx) {}

        udp::socket sock;
        udp::endpoint remote;
        array<uint8_t, MAX_DATAGRAM_SIZE + 1> buffer{};
    };

    /**
     * Reads one datagram from the channel and re-arms itself until the
     * socket is closed.
     */
    void asyncReceive(Channel& channel);

    void bindDiscoverySocket();

    boost::asio::io_context& io;
    TransportOptions opts;
    Channel data;
    Channel discovery;
    ReceiveCallback onReceive;
    atomic<bool> opened{false};
    uint16_t boundPort = 0;
};

} // namespace lanchat

#endif // LANCHAT_TRANSPORT_HPP
