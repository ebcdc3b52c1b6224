// File: INetworkIO.hpp
#pragma once

#include "NetworkEndpoint.hpp"
#include <string>
#include <cstdint>

namespace SimLink {
    namespace Networking {

        class INetworkIOEvents; // Forward declaration

        /**
         * @brief Datagram transport owned by one Circuit.
         *
         * Received datagrams and transport errors are reported through the
         * INetworkIOEvents handler passed to Init, always on the loop thread.
         */
        class INetworkIO {
        public:
            virtual ~INetworkIO() = default;

            // Binds the local socket. Port 0 picks an ephemeral port.
            virtual bool Init(const std::string& listenIp, uint16_t listenPort, INetworkIOEvents* eventHandler) = 0;

            // Begins delivering datagrams to the handler.
            virtual bool Start() = 0;

            // Idempotent. No handler calls after it returns.
            virtual void Stop() = 0;

            // False only for failures the circuit cannot recover from.
            virtual bool SendData(const NetworkEndpoint& recipient, const uint8_t* data, uint32_t size) = 0;

            virtual bool IsRunning() const = 0;
        };

    } // namespace Networking
} // namespace SimLink
