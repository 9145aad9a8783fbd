#include "Transport.hpp"
#include <iostream>

namespace lanchat {

    UdpTransport::UdpTransport(boost::asio::io_context& ctx, TransportOptions options)
        : io(ctx), opts(move(options)), data(ctx), discovery(ctx) {}

    UdpTransport::~UdpTransport() {
        boost::system::error_code ec;
        data.sock.close(ec);
        discovery.sock.close(ec);
    }

    void UdpTransport::setReceiveHandler(ReceiveCallback cb) { onReceive = move(cb); }

    uint16_t UdpTransport::localPort() const { return boundPort; }

    bool UdpTransport::hasDiscoverySocket() const { return discovery.sock.is_open(); }

    bool UdpTransport::isOpen() const { return opened.load(); }

    void UdpTransport::open() {
        boost::system::error_code ec;
        const auto address = boost::asio::ip::make_address(opts.bindAddress, ec);
        if (ec) {
            throw BindError("invalid bind address " + opts.bindAddress + ": " + ec.message());
        }

        const udp::endpoint local(address, opts.listenPort);
        data.sock.open(local.protocol(), ec);
        if (ec) throw BindError("cannot open UDP socket: " + ec.message());

        data.sock.set_option(boost::asio::socket_base::broadcast(true), ec);
        if (ec) {
            cerr << "Warning: broadcast not available on data socket: " << ec.message() << endl;
        }

        data.sock.bind(local, ec);
        if (ec) {
            boost::system::error_code ignored;
            data.sock.close(ignored);
            throw BindError("cannot bind " + local.address().to_string() + ":" +
                            to_string(opts.listenPort) + ": " + ec.message());
        }
        boundPort = data.sock.local_endpoint().port();

        if (opts.discoveryPort != 0) bindDiscoverySocket();

        opened = true;
    }

    void UdpTransport::bindDiscoverySocket() {
        boost::system::error_code ec;
        const auto address = boost::asio::ip::make_address(opts.bindAddress, ec);
        const udp::endpoint local(address, opts.discoveryPort);

        discovery.sock.open(local.protocol(), ec);
        if (!ec) discovery.sock.set_option(udp::socket::reuse_address(true), ec);
        if (!ec) discovery.sock.bind(local, ec);

        if (ec) {
            // the node still works through its data port, only broadcast reach suffers
            cerr << "Warning: discovery port " << opts.discoveryPort
                 << " unavailable (" << ec.message() << "), continuing without it" << endl;
            boost::system::error_code ignored;
            discovery.sock.close(ignored);
        }
    }

    void UdpTransport::startReceiving() {
        if (data.sock.is_open()) asyncReceive(data);
        if (discovery.sock.is_open()) asyncReceive(discovery);
    }

    void UdpTransport::asyncReceive(Channel& channel) {
        channel.sock.async_receive_from(boost::asio::buffer(channel.buffer), channel.remote,
            [this, &channel](const boost::system::error_code& ec, size_t bytes) {
                if (ec == boost::asio::error::operation_aborted || !channel.sock.is_open()) {
                    return;
                }
                if (!ec && onReceive) {
                    vector<uint8_t> datagram(channel.buffer.begin(), channel.buffer.begin() + bytes);
                    Endpoint source{channel.remote.address().to_string(), channel.remote.port()};
                    onReceive(datagram, source);
                } else if (ec) {
                    // e.g. ICMP port unreachable surfacing as connection_refused
                    cerr << "Warning: receive failed: " << ec.message() << endl;
                }
                asyncReceive(channel);
            });
    }

    void UdpTransport::send(const vector<uint8_t>& payload, const Endpoint& destination) {
        boost::system::error_code ec;
        const auto address = boost::asio::ip::make_address(destination.host, ec);
        if (ec || destination.port == 0) {
            cerr << "Warning: cannot send to " << destination.key() << ": invalid address" << endl;
            return;
        }

        auto buffer = make_shared<vector<uint8_t>>(payload);
        const udp::endpoint target(address, destination.port);

        // socket operations stay on the io thread
        boost::asio::post(io, [this, buffer, target]() {
            if (!data.sock.is_open()) return;
            data.sock.async_send_to(boost::asio::buffer(*buffer), target,
                [buffer, target](const boost::system::error_code& sendError, size_t) {
                    if (sendError && sendError != boost::asio::error::operation_aborted) {
                        cerr << "Warning: send to " << target.address().to_string() << ":"
                             << target.port() << " failed: " << sendError.message() << endl;
                    }
                });
        });
    }

    void UdpTransport::close() {
        opened = false;
        boost::system::error_code ec;
        data.sock.close(ec);
        discovery.sock.close(ec);
    }

} // namespace lanchat
