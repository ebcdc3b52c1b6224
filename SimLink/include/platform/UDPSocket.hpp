// File: UDPSocket.hpp
// Description: Non-blocking POSIX UDP socket driven by an EventLoop. Implements INetworkIO.

#pragma once

#include <string>
#include <vector>
#include <atomic>
#include <cstddef>

#include "../core/INetworkIO.hpp"
#include "../core/NetworkEndpoint.hpp"
#include "../core/EventLoop.hpp"


const std::size_t DEFAULT_UDP_BUFFER_SIZE = 4096;

namespace SimLink {
    namespace Networking {


        class UDPSocket : public INetworkIO {
        public:

            explicit UDPSocket(EventLoop& loop, std::size_t receiveBufferSize = DEFAULT_UDP_BUFFER_SIZE);

            ~UDPSocket() override;

            UDPSocket(const UDPSocket&) = delete;
            UDPSocket& operator=(const UDPSocket&) = delete;


            bool Init(const std::string& listenIp, uint16_t listenPort, INetworkIOEvents* eventHandler) override;

            // Registers the socket with the loop; datagrams are delivered from the loop thread.
            bool Start() override;

            void Stop() override;

            bool SendData(const NetworkEndpoint& recipient, const uint8_t* data, uint32_t size) override;

            bool IsRunning() const override;

            // Port chosen by the kernel when bound to port 0.
            uint16_t GetLocalPort() const;

        private:
            void OnReadable();
            void CloseSocket();

            EventLoop& m_loop;
            INetworkIOEvents* m_eventHandler{ nullptr };

            int m_socket{ -1 };
            std::vector<uint8_t> m_receiveBuffer;
            std::atomic<bool> m_isRunning{ false };
        };

    } // namespace Networking
} // namespace SimLink
