// File: INetworkIOEvents.hpp
#pragma once

#include "NetworkEndpoint.hpp"
#include <cstdint>
#include <string>

namespace SimLink {
    namespace Networking {

        class INetworkIOEvents {
        public:
            virtual ~INetworkIOEvents() = default;

            virtual void OnRawDataReceived(const NetworkEndpoint& sender,
                const uint8_t* data,
                uint32_t size) = 0;

            /**
             * @brief Called when the transport hits an error it cannot recover from.
             * @param errorMessage A description of the error.
             * @param errorCode errno value, or 0.
             */
            virtual void OnNetworkError(const std::string& errorMessage, int errorCode = 0) = 0;
        };

    } // namespace Networking
} // namespace SimLink
