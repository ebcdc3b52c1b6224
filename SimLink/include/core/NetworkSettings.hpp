// File: NetworkSettings.hpp
#pragma once

#include "ReliableConnectionState.hpp"
#include "Messages.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace SimLink::Networking {

    // Identity of the logged-in agent, handed over by the login layer.
    struct SessionContext {
        Types::Uuid agentId;
        Types::Uuid sessionId;
    };

    struct NetworkSettings {
        // --- Reliability ---
        Protocol::ReliabilitySettings reliability;

        // --- Handshake ---
        std::chrono::milliseconds handshakeTimeout{ 5000 };
        int                       maxHandshakeAttempts{ 3 };

        // --- Liveness ---
        std::chrono::milliseconds simulatorTimeout{ 30000 };  // inbound silence once Active
        std::chrono::milliseconds pingInterval{ 2200 };
        bool                      sendPings{ true };

        // --- Loop ---
        std::chrono::milliseconds tickInterval{ 50 };
        std::size_t               backgroundThreads{ 2 };

        // --- Datagram limits ---
        std::size_t maxPacketSize{ Protocol::MAX_PACKET_SIZE };
        std::size_t receiveBufferSize{ 4096 };
        std::size_t maxDecodedSize{ 8192 };

        // --- Local bind ---
        std::string bindAddress{ "0.0.0.0" };

        // --- Session flow ---
        bool                            sendThrottleOnConnect{ true };
        bool                            requestEconomyData{ true };
        Protocol::Messages::ThrottleRates throttle{ 100000.0f, 100000.0f, 20000.0f, 20000.0f,
                                                    310000.0f, 310000.0f, 140000.0f };

        // Logs the first offending field and returns false if the settings cannot work.
        bool Validate() const;
    };

} // namespace SimLink::Networking
