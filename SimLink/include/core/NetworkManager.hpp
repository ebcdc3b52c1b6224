// File: NetworkManager.hpp
#pragma once

#include "Circuit.hpp"
#include "EventLoop.hpp"
#include "INetworkIO.hpp"
#include "MessageTypes.hpp"
#include "NetworkEndpoint.hpp"
#include "NetworkSettings.hpp"
#include "Packet.hpp"
#include "ThreadPool.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace SimLink::Networking {

    enum class NetworkEventType : uint8_t {
        CircuitConnected = 0,
        CircuitDisconnected,
        ConnectionFailed,
        DeliveryFailed,
        SessionDisconnected
    };

    const char* ToString(NetworkEventType type);

    struct NetworkEvent {
        NetworkEventType          type{ NetworkEventType::CircuitConnected };
        std::shared_ptr<Circuit>  circuit;
        DisconnectReason          reason{ DisconnectReason::None };
        Protocol::SequenceNumber  sequence{ 0 };                          // DeliveryFailed only
        Protocol::MessageType     message{ Protocol::MessageType::Invalid }; // DeliveryFailed only
    };

    /**
     * @class NetworkManager
     * @brief Owns every circuit of the session and routes decoded packets to handlers.
     *
     * One circuit is "current" (the region the agent stands in) and only it carries
     * agent movement traffic. The others are child circuits kept for neighbor visibility.
     * Everything except RunInBackground's worker half runs on the EventLoop thread.
     */
    class NetworkManager {
    public:
        using Clock = Protocol::Clock;
        using ClockFunc = Circuit::ClockFunc;
        using HandlerId = uint64_t;
        using ListenerId = uint64_t;
        using PacketHandler = std::function<void(Circuit&, const Protocol::Packet&)>;
        using EventListener = std::function<void(const NetworkEvent&)>;
        using SocketFactory = std::function<std::unique_ptr<INetworkIO>()>;

        // Without a factory every circuit gets a UDPSocket on `loop`.
        NetworkManager(EventLoop& loop, NetworkSettings settings, SessionContext session,
            SocketFactory socketFactory = {});
        ~NetworkManager();

        NetworkManager(const NetworkManager&) = delete;
        NetworkManager& operator=(const NetworkManager&) = delete;

        // --- Circuits ---
        // Creates the circuit and starts its handshake. Null if the socket could not be opened.
        std::shared_ptr<Circuit> Connect(const NetworkEndpoint& endpoint, uint32_t circuitCode, bool makeCurrent = true);
        void Disconnect(const std::shared_ptr<Circuit>& circuit, DisconnectReason reason = DisconnectReason::Requested);

        bool SetCurrentCircuit(const std::shared_ptr<Circuit>& circuit);
        std::shared_ptr<Circuit> GetCurrentCircuit() const { return m_currentCircuit; }
        std::shared_ptr<Circuit> FindCircuit(const NetworkEndpoint& endpoint) const;
        std::vector<std::shared_ptr<Circuit>> GetCircuits() const { return m_circuits; }

        // --- Traffic ---
        // Sends on `circuit`, or on the current circuit when null.
        SendResult Send(Protocol::Packet packet, Circuit* circuit = nullptr);
        SendResult Logout();

        // --- Dispatch ---
        HandlerId RegisterHandler(Protocol::MessageType type, PacketHandler handler);
        bool UnregisterHandler(Protocol::MessageType type, HandlerId id);

        ListenerId AddEventListener(EventListener listener);
        bool RemoveEventListener(ListenerId id);

        // --- Driving ---
        // Schedules Update on the loop every tickInterval.
        bool Start();
        void Update(Clock::time_point now);
        // Disconnects every circuit and stops background work.
        void Shutdown();

        // Runs `work` on the thread pool, then `done` on the loop thread.
        void RunInBackground(std::function<void()> work, std::function<void()> done = {});

        void SetClock(ClockFunc clock) { m_clock = std::move(clock); }
        const NetworkSettings& GetSettings() const { return m_settings; }
        const SessionContext& GetSession() const { return m_session; }

    private:
        struct HandlerEntry {
            HandlerId     id;
            PacketHandler handler;
        };
        using HandlerList = std::vector<HandlerEntry>;

        struct ListenerEntry {
            ListenerId    id;
            EventListener listener;
        };
        using ListenerList = std::vector<ListenerEntry>;

        void Dispatch(Circuit& circuit, const Protocol::Packet& packet);
        void Emit(const NetworkEvent& event);

        void OnCircuitState(Circuit& circuit, CircuitState state);
        void OnCircuitClosed(Circuit& circuit, DisconnectReason reason);
        void OnDeliveryFailed(Circuit& circuit, const Protocol::ReliablePacket& packet);

        std::shared_ptr<Circuit> Lookup(const Circuit* circuit) const;
        void ReapClosedCircuits();
        Clock::time_point Now() const;

        EventLoop&      m_loop;
        NetworkSettings m_settings;
        SessionContext  m_session;
        SocketFactory   m_socketFactory;
        ClockFunc       m_clock;

        std::vector<std::shared_ptr<Circuit>> m_circuits;
        std::shared_ptr<Circuit>              m_currentCircuit;
        // Closed circuits stay alive until no socket callback can be on their stack.
        std::vector<std::shared_ptr<Circuit>> m_graveyard;
        bool                                  m_sessionDisconnectedRaised{ false };

        // Copy-on-write: dispatch iterates a snapshot, registration swaps in a new list.
        std::unordered_map<Protocol::MessageType, std::shared_ptr<const HandlerList>> m_handlers;
        std::shared_ptr<const ListenerList> m_listeners;
        HandlerId  m_nextHandlerId{ 1 };
        ListenerId m_nextListenerId{ 1 };

        std::unique_ptr<Threading::TaskThreadPool> m_workers;
        EventLoop::TimerId m_tickTimer{ 0 };

        // Tasks posted to the loop check this before touching the manager.
        std::shared_ptr<bool> m_aliveToken;
    };

} // namespace SimLink::Networking
