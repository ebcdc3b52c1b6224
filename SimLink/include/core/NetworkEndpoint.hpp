#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace SimLink {
    namespace Networking {

        struct NetworkEndpoint {
            std::string ipAddress;
            uint16_t port;

            NetworkEndpoint(const std::string& ip = "", uint16_t p = 0)
                : ipAddress(ip), port(p) {
            }

            NetworkEndpoint(const sockaddr_in& addr) {
                char ipStr[INET_ADDRSTRLEN] = { 0 };
                inet_ntop(AF_INET, &(addr.sin_addr), ipStr, INET_ADDRSTRLEN);
                ipAddress = ipStr;
                port = ntohs(addr.sin_port);
            }

            // Parses "a.b.c.d:port".
            static bool Parse(const std::string& text, NetworkEndpoint& out) {
                const auto colon = text.rfind(':');
                if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) return false;

                const std::string host = text.substr(0, colon);
                in_addr probe{};
                if (inet_pton(AF_INET, host.c_str(), &probe) != 1) return false;

                unsigned long value = 0;
                for (std::size_t i = colon + 1; i < text.size(); ++i) {
                    const char c = text[i];
                    if (c < '0' || c > '9') return false;
                    value = value * 10 + static_cast<unsigned long>(c - '0');
                    if (value > 65535) return false;
                }
                out = NetworkEndpoint(host, static_cast<uint16_t>(value));
                return true;
            }

            std::string ToString() const {
                return ipAddress + ":" + std::to_string(port);
            }

            bool operator<(const NetworkEndpoint& other) const {
                if (ipAddress < other.ipAddress) {
                    return true;
                }
                if (ipAddress > other.ipAddress) {
                    return false;
                }
                return port < other.port;
            }

            // False if ipAddress is not a dotted IPv4 address.
            bool ToSockAddr(sockaddr_in& addr) const {
                addr = {};
                addr.sin_family = AF_INET;
                addr.sin_port = htons(port);
                return inet_pton(AF_INET, ipAddress.c_str(), &addr.sin_addr) == 1;
            }

            bool operator==(const NetworkEndpoint& other) const {
                return ipAddress == other.ipAddress && port == other.port;
            }
        };

    } // namespace Networking
} // namespace SimLink
