#include "Config.hpp"
#include "Identity.hpp"
#include "Utils.hpp"

#include <sstream>
#include <stdexcept>

namespace lanchat {

    namespace {

        unsigned long parseNumber(const std::string& flag, const std::string& value, unsigned long max) {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
            }
            unsigned long number = 0;
            try {
                number = std::stoul(value);
            } catch (const std::out_of_range&) {
                throw std::invalid_argument(flag + " value out of range: " + value);
            }
            if (number > max) throw std::invalid_argument(flag + " value out of range: " + value);
            return number;
        }

        uint16_t parsePort(const std::string& flag, const std::string& value) {
            return static_cast<uint16_t>(parseNumber(flag, value, 65535));
        }

        std::chrono::milliseconds parseSeconds(const std::string& flag, const std::string& value) {
            const unsigned long seconds = parseNumber(flag, value, 86400);
            if (seconds == 0) throw std::invalid_argument(flag + " must be at least 1 second");
            return std::chrono::seconds(seconds);
        }
    }

    std::chrono::milliseconds NodeConfig::effectiveSweepInterval() const {
        return sweepInterval.count() > 0 ? sweepInterval : heartbeatInterval;
    }

    void NodeConfig::validate() const {
        if (displayName.empty()) {
            throw std::invalid_argument("display name must not be empty");
        }
        if (displayName.size() > MAX_NAME_LENGTH) {
            throw std::invalid_argument("display name longer than " + std::to_string(MAX_NAME_LENGTH) + " bytes");
        }
        if (heartbeatInterval.count() <= 0) {
            throw std::invalid_argument("heartbeat interval must be positive");
        }
        if (peerTimeout <= heartbeatInterval) {
            throw std::invalid_argument("peer timeout must be longer than the heartbeat interval");
        }
        if (sweepInterval.count() < 0 || (sweepInterval.count() > 0 && sweepInterval < heartbeatInterval)) {
            throw std::invalid_argument("sweep interval must not be shorter than the heartbeat interval");
        }
        if (announceInterval.count() <= 0) {
            throw std::invalid_argument("announce interval must be positive");
        }
        if (seenCapacity == 0) {
            throw std::invalid_argument("seen cache capacity must be positive");
        }
        if (seenMaxAge.count() <= 0) {
            throw std::invalid_argument("seen cache max age must be positive");
        }
        for (const auto& peer : bootstrapPeers) {
            if (!peer.isValid()) throw std::invalid_argument("invalid bootstrap peer " + peer.key());
        }
    }

    CommandLineOptions parseArguments(const std::vector<std::string>& args) {
        CommandLineOptions options;
        NodeConfig& config = options.node;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];

            auto value = [&]() -> const std::string& {
                if (i + 1 >= args.size()) throw std::invalid_argument(flag + " requires a value");
                return args[++i];
            };

            if (flag == "-h" || flag == "--help") {
                options.showHelp = true;
            } else if (flag == "-u" || flag == "--username") {
                config.displayName = trim(value());
            } else if (flag == "-r" || flag == "--receive-port") {
                config.listenPort = parsePort(flag, value());
            } else if (flag == "-d" || flag == "--discovery-port") {
                config.discoveryPort = parsePort(flag, value());
            } else if (flag == "-i" || flag == "--heartbeat-interval") {
                config.heartbeatInterval = parseSeconds(flag, value());
            } else if (flag == "-t" || flag == "--peer-timeout") {
                config.peerTimeout = parseSeconds(flag, value());
            } else if (flag == "-p" || flag == "--peer") {
                Endpoint peer;
                const std::string& text = value();
                if (!parseEndpoint(text, peer)) {
                    throw std::invalid_argument("--peer expects ip:port, got '" + text + "'");
                }
                config.bootstrapPeers.push_back(peer);
            } else if (flag == "--broadcast") {
                config.broadcastAddress = value();
            } else if (flag == "--no-forward") {
                config.forwardChat = false;
            } else if (flag == "--no-peer-list") {
                config.sharePeerList = false;
            } else {
                throw std::invalid_argument("unknown option " + flag);
            }
        }

        if (config.displayName.empty()) {
            config.displayName = Identity::defaultDisplayName();
        } else if (config.displayName.size() > MAX_DISPLAY_NAME_LENGTH) {
            // never leave half of a UTF-8 sequence at the end
            size_t cut = MAX_DISPLAY_NAME_LENGTH;
            while (cut > 0 && (static_cast<unsigned char>(config.displayName[cut]) & 0xC0) == 0x80) --cut;
            config.displayName.resize(cut);
        }

        return options;
    }

    std::string usage(const std::string& program) {
        std::ostringstream out;
        out << "Usage: " << program << " [options]\n"
            << "  -u, --username <name>          display name (max " << MAX_DISPLAY_NAME_LENGTH << " chars)\n"
            << "  -r, --receive-port <port>      data port (random if not specified)\n"
            << "  -d, --discovery-port <port>    shared discovery port (default " << DEFAULT_DISCOVERY_PORT << ", 0 disables)\n"
            << "  -i, --heartbeat-interval <s>   seconds between heartbeats (default 15)\n"
            << "  -t, --peer-timeout <s>         seconds of silence before a peer is dropped (default 60)\n"
            << "  -p, --peer <ip:port>           bootstrap peer, repeatable\n"
            << "      --broadcast <addr>         broadcast address (default " << DEFAULT_BROADCAST_ADDRESS << ")\n"
            << "      --no-forward               deliver chats directly only, never re-forward\n"
            << "      --no-peer-list             do not share peer lists with newcomers\n"
            << "  -h, --help                     show this help\n";
        return out.str();
    }

} // namespace lanchat
