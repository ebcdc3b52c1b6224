// File: Circuit.hpp

#pragma once

#include "INetworkIO.hpp"
#include "INetworkIOEvents.hpp"
#include "Messages.hpp"
#include "NetworkEndpoint.hpp"
#include "NetworkSettings.hpp"
#include "Packet.hpp"
#include "UDPReliabilityProtocol.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SimLink::Networking {

    enum class CircuitState : uint8_t {
        Disconnected = 0,
        Connecting,
        AwaitingHandshakeConfirm,
        Active,
        Disconnecting
    };

    enum class DisconnectReason : uint8_t {
        None = 0,
        Requested,
        Logout,
        ConnectionFailed,
        SocketError,
        TimedOut,
        RemoteClosed
    };

    enum class SendResult : uint8_t {
        Ok = 0,
        NotReady,           // handshake not finished
        NotConnected,       // circuit closed or closing
        NotCurrentCircuit,  // agent movement on a child circuit
        TooLarge,
        SocketError,
        NoCircuit
    };

    const char* ToString(CircuitState state);
    const char* ToString(DisconnectReason reason);
    const char* ToString(SendResult result);

    struct CircuitStats {
        uint64_t packetsIn{ 0 };
        uint64_t packetsOut{ 0 };
        uint64_t bytesIn{ 0 };
        uint64_t bytesOut{ 0 };
        uint64_t resentPackets{ 0 };
        uint64_t duplicatesReceived{ 0 };
        uint64_t malformedDropped{ 0 };
        uint64_t unknownDropped{ 0 };
        uint64_t acksSent{ 0 };
        uint64_t acksReceived{ 0 };
        uint64_t deliveryFailures{ 0 };
        std::optional<std::chrono::milliseconds> lastPingRoundTrip;
    };

    /**
     * @class Circuit
     * @brief One UDP session with one simulator.
     *
     * Owns its socket, frames packets through PacketCodec and keeps the reliability
     * bookkeeping for this peer. Drives the handshake:
     * Disconnected -> Connecting -> AwaitingHandshakeConfirm -> Active -> Disconnecting -> Disconnected.
     * All methods run on the event loop thread.
     */
    class Circuit : public INetworkIOEvents {
    public:
        using Clock = Protocol::Clock;
        using ClockFunc = std::function<Clock::time_point()>;
        using PacketCallback = std::function<void(Circuit&, const Protocol::Packet&)>;
        using StateCallback = std::function<void(Circuit&, CircuitState)>;
        using ClosedCallback = std::function<void(Circuit&, DisconnectReason)>;
        using DeliveryFailureCallback = std::function<void(Circuit&, const Protocol::ReliablePacket&)>;

        Circuit(const NetworkEndpoint& endpoint,
            uint32_t circuitCode,
            const SessionContext& session,
            const NetworkSettings& settings,
            std::unique_ptr<INetworkIO> io);
        ~Circuit() override;

        Circuit(const Circuit&) = delete;
        Circuit& operator=(const Circuit&) = delete;

        // --- Configuration ---
        void SetPacketCallback(PacketCallback cb);
        void SetStateCallback(StateCallback cb);
        void SetClosedCallback(ClosedCallback cb);
        void SetDeliveryFailureCallback(DeliveryFailureCallback cb);
        void SetClock(ClockFunc clock);

        // The current circuit completes agent movement during its handshake.
        void SetCurrent(bool isCurrent);
        bool IsCurrent() const { return m_isCurrent; }

        // --- Lifecycle ---
        // Binds the socket and sends UseCircuitCode. False (and closed with SocketError) on failure.
        bool Connect();
        // Sends CloseCircuit if Active, then tears down.
        void Disconnect(DisconnectReason reason);

        // --- Traffic ---
        SendResult Send(Protocol::Packet packet);
        // Resends, ack flushing, handshake retry, pings and idle timeout.
        void Update(Clock::time_point now);

        // --- State Queries ---
        bool IsActive() const { return m_state == CircuitState::Active; }
        CircuitState GetState() const { return m_state; }
        DisconnectReason GetDisconnectReason() const { return m_disconnectReason; }
        const NetworkEndpoint& GetEndpoint() const { return m_endpoint; }
        uint32_t GetCircuitCode() const { return m_circuitCode; }
        const std::optional<Protocol::Messages::RegionHandshakeInfo>& GetRegionInfo() const { return m_regionInfo; }
        CircuitStats GetStats() const;
        const Protocol::ReliableConnectionState& GetReliabilityState() const { return m_reliability; }

        static bool IsHandshakeMessage(Protocol::MessageType type);

        // --- INetworkIOEvents ---
        void OnRawDataReceived(const NetworkEndpoint& sender, const uint8_t* data, uint32_t size) override;
        void OnNetworkError(const std::string& errorMessage, int errorCode) override;

    private:
        // --- Pipeline ---
        void HandleRawPacket(const uint8_t* data, uint32_t size);
        bool HandleInternal(const Protocol::Packet& packet, Clock::time_point now);
        SendResult SendInternal(Protocol::Packet& packet);
        bool Transmit(std::vector<uint8_t>& wire, bool piggybackAcks);
        void FlushAcks(Clock::time_point now);

        // --- Handshake / session ---
        SendResult SendUseCircuitCode();
        void OnRegionHandshake(const Protocol::Packet& packet);
        void OnAgentMovementComplete(const Protocol::Packet& packet);
        void BecomeActive(Clock::time_point now);
        void SendPing(Clock::time_point now);

        // --- Teardown ---
        void OnDeliveryFailure(const Protocol::ReliablePacket& packet);
        void Close(DisconnectReason reason, bool notifyPeer);
        void SetState(CircuitState state);

        Clock::time_point Now() const;

        // --- Connection State ---
        NetworkEndpoint                   m_endpoint;
        uint32_t                          m_circuitCode;
        SessionContext                    m_session;
        NetworkSettings                   m_settings;
        std::unique_ptr<INetworkIO>       m_io;
        Protocol::ReliableConnectionState m_reliability;

        CircuitState     m_state{ CircuitState::Disconnected };
        DisconnectReason m_disconnectReason{ DisconnectReason::None };
        bool             m_isCurrent{ false };
        bool             m_closing{ false };

        // Handshake
        int               m_handshakeAttempts{ 0 };
        Clock::time_point m_lastHandshakeAttempt{};
        bool              m_regionHandshakeReplied{ false };
        std::optional<Protocol::Messages::RegionHandshakeInfo> m_regionInfo;

        // Ping
        uint8_t                          m_pingId{ 0 };
        std::optional<uint8_t>           m_outstandingPing;
        Clock::time_point                m_lastPingSent{};
        uint32_t                         m_throttleGeneration{ 0 };

        CircuitStats m_stats;
        ClockFunc    m_clock;

        // --- Callbacks ---
        PacketCallback          m_packetCallback;
        StateCallback           m_stateCallback;
        ClosedCallback          m_closedCallback;
        DeliveryFailureCallback m_deliveryFailureCallback;
    };

} // namespace SimLink::Networking
