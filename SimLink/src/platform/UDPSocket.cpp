// File: UDPSocket.cpp
#include "../../include/platform/UDPSocket.hpp"
#include "../../include/core/INetworkIOEvents.hpp"
#include "../../include/core/Logger.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace SimLink {
    namespace Networking {

        UDPSocket::UDPSocket(EventLoop& loop, std::size_t receiveBufferSize)
            : m_loop(loop)
            , m_receiveBuffer(receiveBufferSize ? receiveBufferSize : DEFAULT_UDP_BUFFER_SIZE) {
        }

        UDPSocket::~UDPSocket() {
            Stop();
        }

        bool UDPSocket::Init(const std::string& listenIp, uint16_t listenPort, INetworkIOEvents* eventHandler) {
            if (m_socket >= 0) {
                SL_NETWORK_WARN("UDPSocket::Init called twice");
                return false;
            }
            if (!eventHandler) {
                SL_NETWORK_ERROR("UDPSocket::Init: no event handler");
                return false;
            }
            m_eventHandler = eventHandler;

            NetworkEndpoint local(listenIp.empty() ? "0.0.0.0" : listenIp, listenPort);
            sockaddr_in addr{};
            if (!local.ToSockAddr(addr)) {
                SL_NETWORK_ERROR("UDPSocket::Init: invalid bind address {}", local.ToString());
                return false;
            }

            m_socket = ::socket(AF_INET, SOCK_DGRAM, 0);
            if (m_socket < 0) {
                SL_NETWORK_ERROR("socket() failed: {}", std::strerror(errno));
                return false;
            }

            const int flags = ::fcntl(m_socket, F_GETFL, 0);
            if (flags < 0 || ::fcntl(m_socket, F_SETFL, flags | O_NONBLOCK) < 0) {
                SL_NETWORK_ERROR("fcntl(O_NONBLOCK) failed: {}", std::strerror(errno));
                CloseSocket();
                return false;
            }

            if (::bind(m_socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
                SL_NETWORK_ERROR("bind({}) failed: {}", local.ToString(), std::strerror(errno));
                CloseSocket();
                return false;
            }

            SL_NETWORK_DEBUG("UDPSocket bound to {}:{}", local.ipAddress, GetLocalPort());
            return true;
        }

        bool UDPSocket::Start() {
            if (m_socket < 0) {
                SL_NETWORK_ERROR("UDPSocket::Start before Init");
                return false;
            }
            if (m_isRunning.load()) return true;

            if (!m_loop.AddReader(m_socket, [this]() { OnReadable(); })) {
                SL_NETWORK_ERROR("UDPSocket::Start: event loop refused fd {}", m_socket);
                return false;
            }
            m_isRunning.store(true);
            return true;
        }

        void UDPSocket::Stop() {
            if (m_isRunning.exchange(false)) {
                m_loop.RemoveReader(m_socket);
            }
            CloseSocket();
        }

        void UDPSocket::CloseSocket() {
            if (m_socket >= 0) {
                ::close(m_socket);
                m_socket = -1;
            }
        }

        bool UDPSocket::SendData(const NetworkEndpoint& recipient, const uint8_t* data, uint32_t size) {
            if (m_socket < 0) {
                SL_NETWORK_WARN("SendData on closed socket ({} bytes to {})", size, recipient.ToString());
                return false;
            }

            sockaddr_in addr{};
            if (!recipient.ToSockAddr(addr)) {
                SL_NETWORK_ERROR("SendData: invalid recipient {}", recipient.ToString());
                return false;
            }

            const ssize_t sent = ::sendto(m_socket, data, size, 0, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
            if (sent < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    // Kernel buffer full; the reliability layer resends reliable packets.
                    SL_NETWORK_WARN("sendto {} would block; {} bytes dropped", recipient.ToString(), size);
                    return true;
                }
                SL_NETWORK_ERROR("sendto {} failed: {}", recipient.ToString(), std::strerror(errno));
                return false;
            }
            return true;
        }

        bool UDPSocket::IsRunning() const {
            return m_isRunning.load();
        }

        uint16_t UDPSocket::GetLocalPort() const {
            if (m_socket < 0) return 0;
            sockaddr_in addr{};
            socklen_t len = sizeof(addr);
            if (::getsockname(m_socket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
            return ntohs(addr.sin_port);
        }

        void UDPSocket::OnReadable() {
            // Drain until EAGAIN; a callback may Stop() this socket mid-loop.
            while (m_isRunning.load() && m_socket >= 0) {
                sockaddr_in from{};
                socklen_t fromLen = sizeof(from);
                // MSG_TRUNC makes recvfrom report the full datagram length.
                const ssize_t r = ::recvfrom(m_socket, m_receiveBuffer.data(), m_receiveBuffer.size(), MSG_TRUNC,
                    reinterpret_cast<sockaddr*>(&from), &fromLen);

                if (r < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) return;
                    if (errno == EINTR) continue;
                    const int err = errno;
                    SL_NETWORK_ERROR("recvfrom failed: {}", std::strerror(err));
                    if (m_eventHandler) m_eventHandler->OnNetworkError("recvfrom failed", err);
                    return;
                }

                if (static_cast<std::size_t>(r) > m_receiveBuffer.size()) {
                    SL_NETWORK_WARN("Dropping {} byte datagram from {}; receive buffer holds {}",
                        r, NetworkEndpoint(from).ToString(), m_receiveBuffer.size());
                    continue;
                }

                if (m_eventHandler) {
                    m_eventHandler->OnRawDataReceived(NetworkEndpoint(from), m_receiveBuffer.data(),
                        static_cast<uint32_t>(r));
                }
            }
        }

    } // namespace Networking
} // namespace SimLink
