#include "Utils.hpp"

#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <cstring>
#include <boost/asio/ip/address.hpp>

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>

namespace lanchat {

    uint64_t nowMillis() {
        const auto since = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since).count());
    }

    std::string formatTimestamp(uint64_t millis) {
        const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream out;
        out << std::put_time(&local, "%H:%M:%S");
        return out.str();
    }

    std::optional<std::string> detectLocalAddress() {
        ifaddrs* interfaces = nullptr;
        if (getifaddrs(&interfaces) != 0) return std::nullopt;

        std::optional<std::string> ipv4;
        std::optional<std::string> ipv6;
        char text[INET6_ADDRSTRLEN];

        for (ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
            if (it->ifa_addr == nullptr) continue;
            if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) continue;

            if (it->ifa_addr->sa_family == AF_INET && !ipv4) {
                auto* in = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
                if (inet_ntop(AF_INET, &in->sin_addr, text, sizeof(text))) ipv4 = std::string(text);
            } else if (it->ifa_addr->sa_family == AF_INET6 && !ipv6) {
                auto* in6 = reinterpret_cast<sockaddr_in6*>(it->ifa_addr);
                if (inet_ntop(AF_INET6, &in6->sin6_addr, text, sizeof(text))) ipv6 = std::string(text);
            }
        }

        freeifaddrs(interfaces);
        return ipv4 ? ipv4 : ipv6;
    }

    bool parseEndpoint(const std::string& text, Endpoint& out) {
        const std::string input = trim(text);
        std::string host;
        std::string portText;

        if (!input.empty() && input.front() == '[') {
            const size_t close = input.find(']');
            if (close == std::string::npos || close + 1 >= input.size() || input[close + 1] != ':') {
                return false;
            }
            host = input.substr(1, close - 1);
            portText = input.substr(close + 2);
        } else {
            const size_t colon = input.rfind(':');
            if (colon == std::string::npos) return false;
            host = input.substr(0, colon);
            portText = input.substr(colon + 1);
        }

        if (host.empty() || portText.empty() || portText.size() > 5) return false;
        for (char c : portText) {
            if (c < '0' || c > '9') return false;
        }
        const unsigned long port = std::stoul(portText);
        if (port == 0 || port > 65535) return false;

        boost::system::error_code ec;
        boost::asio::ip::make_address(host, ec);
        if (ec) return false;

        out.host = host;
        out.port = static_cast<uint16_t>(port);
        return true;
    }

    std::vector<std::string> split(const std::string& s, char delim) {
        std::vector<std::string> parts;
        std::string item;
        std::istringstream in(s);
        while (std::getline(in, item, delim)) parts.push_back(item);
        return parts;
    }

    std::string trim(const std::string& s) {
        const char* whitespace = " \t\r\n";
        const size_t first = s.find_first_not_of(whitespace);
        if (first == std::string::npos) return "";
        const size_t last = s.find_last_not_of(whitespace);
        return s.substr(first, last - first + 1);
    }

} // namespace lanchat
