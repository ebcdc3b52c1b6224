// File: NetworkManager.cpp

#include "../../include/core/NetworkManager.hpp"
#include "../../include/core/Logger.hpp"
#include "../../include/platform/UDPSocket.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

using namespace SimLink::Protocol;

namespace SimLink::Networking {

    const char* ToString(NetworkEventType type) {
        switch (type) {
        case NetworkEventType::CircuitConnected:    return "CircuitConnected";
        case NetworkEventType::CircuitDisconnected: return "CircuitDisconnected";
        case NetworkEventType::ConnectionFailed:    return "ConnectionFailed";
        case NetworkEventType::DeliveryFailed:      return "DeliveryFailed";
        case NetworkEventType::SessionDisconnected: return "SessionDisconnected";
        }
        return "Unknown";
    }

    NetworkManager::NetworkManager(EventLoop& loop, NetworkSettings settings, SessionContext session,
        SocketFactory socketFactory)
        : m_loop(loop)
        , m_settings(std::move(settings))
        , m_session(session)
        , m_socketFactory(std::move(socketFactory))
        , m_listeners(std::make_shared<const ListenerList>())
        , m_aliveToken(std::make_shared<bool>(true))
    {
        if (!m_settings.Validate()) {
            throw std::invalid_argument("NetworkManager: invalid NetworkSettings");
        }
        if (!m_socketFactory) {
            const std::size_t bufferSize = m_settings.receiveBufferSize;
            m_socketFactory = [&loop, bufferSize]() -> std::unique_ptr<INetworkIO> {
                return std::make_unique<UDPSocket>(loop, bufferSize);
            };
        }
        SL_NETWORK_DEBUG("NetworkManager created for agent {}", m_session.agentId.ToString());
    }

    NetworkManager::~NetworkManager() {
        Shutdown();
    }

    NetworkManager::Clock::time_point NetworkManager::Now() const {
        return m_clock ? m_clock() : Clock::now();
    }

    // ---------------- Circuits ----------------

    std::shared_ptr<Circuit> NetworkManager::Connect(const NetworkEndpoint& endpoint, uint32_t circuitCode, bool makeCurrent) {
        if (auto existing = FindCircuit(endpoint)) {
            SL_NETWORK_WARN("Circuit to {} already exists", endpoint.ToString());
            if (makeCurrent) SetCurrentCircuit(existing);
            return existing;
        }

        std::unique_ptr<INetworkIO> io = m_socketFactory();
        if (!io) {
            SL_NETWORK_ERROR("No transport available for {}", endpoint.ToString());
            return nullptr;
        }

        auto circuit = std::make_shared<Circuit>(endpoint, circuitCode, m_session, m_settings, std::move(io));
        if (m_clock) circuit->SetClock(m_clock);

        circuit->SetPacketCallback([this](Circuit& c, const Packet& packet) { Dispatch(c, packet); });
        circuit->SetStateCallback([this](Circuit& c, CircuitState state) { OnCircuitState(c, state); });
        circuit->SetClosedCallback([this](Circuit& c, DisconnectReason reason) { OnCircuitClosed(c, reason); });
        circuit->SetDeliveryFailureCallback([this](Circuit& c, const ReliablePacket& p) { OnDeliveryFailed(c, p); });

        m_circuits.push_back(circuit);
        if (makeCurrent || !m_currentCircuit) {
            SetCurrentCircuit(circuit);
        }

        SL_NETWORK_INFO("Connecting to {} (circuit code {}, {})", endpoint.ToString(), circuitCode,
            circuit->IsCurrent() ? "current" : "child");

        if (!circuit->Connect()) {
            // OnCircuitClosed already moved it to the graveyard when the socket failed.
            return nullptr;
        }
        return circuit;
    }

    void NetworkManager::Disconnect(const std::shared_ptr<Circuit>& circuit, DisconnectReason reason) {
        if (!circuit) return;
        circuit->Disconnect(reason);
    }

    bool NetworkManager::SetCurrentCircuit(const std::shared_ptr<Circuit>& circuit) {
        if (!circuit || std::find(m_circuits.begin(), m_circuits.end(), circuit) == m_circuits.end()) {
            return false;
        }
        if (m_currentCircuit == circuit) return true;

        if (m_currentCircuit) m_currentCircuit->SetCurrent(false);
        m_currentCircuit = circuit;
        m_currentCircuit->SetCurrent(true);
        m_sessionDisconnectedRaised = false;
        SL_NETWORK_INFO("Current circuit is now {}", circuit->GetEndpoint().ToString());
        return true;
    }

    std::shared_ptr<Circuit> NetworkManager::FindCircuit(const NetworkEndpoint& endpoint) const {
        for (const auto& circuit : m_circuits) {
            if (circuit->GetEndpoint() == endpoint) return circuit;
        }
        return nullptr;
    }

    std::shared_ptr<Circuit> NetworkManager::Lookup(const Circuit* circuit) const {
        for (const auto& c : m_circuits) {
            if (c.get() == circuit) return c;
        }
        return nullptr;
    }

    // ---------------- Traffic ----------------

    SendResult NetworkManager::Send(Packet packet, Circuit* circuit) {
        if (!circuit) circuit = m_currentCircuit.get();
        if (!circuit) return SendResult::NoCircuit;

        const MessageInfo* info = MessageTable::Find(packet.type);
        if (info && info->agentMovement && !circuit->IsCurrent()) {
            SL_NETWORK_DEBUG("{} refused on child circuit {}", info->name, circuit->GetEndpoint().ToString());
            return SendResult::NotCurrentCircuit;
        }
        return circuit->Send(std::move(packet));
    }

    SendResult NetworkManager::Logout() {
        if (!m_currentCircuit) return SendResult::NoCircuit;
        SL_NETWORK_INFO("Requesting logout");
        return Send(Packet::Make(MessageType::LogoutRequest,
            Messages::BuildLogoutRequest(m_session.agentId, m_session.sessionId), true));
    }

    // ---------------- Dispatch ----------------

    NetworkManager::HandlerId NetworkManager::RegisterHandler(MessageType type, PacketHandler handler) {
        const HandlerId id = m_nextHandlerId++;
        auto updated = std::make_shared<HandlerList>();
        auto it = m_handlers.find(type);
        if (it != m_handlers.end() && it->second) {
            *updated = *it->second;
        }
        updated->push_back(HandlerEntry{ id, std::move(handler) });
        m_handlers[type] = std::move(updated);
        return id;
    }

    bool NetworkManager::UnregisterHandler(MessageType type, HandlerId id) {
        auto it = m_handlers.find(type);
        if (it == m_handlers.end() || !it->second) return false;

        auto updated = std::make_shared<HandlerList>(*it->second);
        auto entry = std::find_if(updated->begin(), updated->end(),
            [id](const HandlerEntry& e) { return e.id == id; });
        if (entry == updated->end()) return false;

        updated->erase(entry);
        if (updated->empty()) {
            m_handlers.erase(it);
        }
        else {
            it->second = std::move(updated);
        }
        return true;
    }

    NetworkManager::ListenerId NetworkManager::AddEventListener(EventListener listener) {
        const ListenerId id = m_nextListenerId++;
        auto updated = std::make_shared<ListenerList>(*m_listeners);
        updated->push_back(ListenerEntry{ id, std::move(listener) });
        m_listeners = std::move(updated);
        return id;
    }

    bool NetworkManager::RemoveEventListener(ListenerId id) {
        auto updated = std::make_shared<ListenerList>(*m_listeners);
        auto entry = std::find_if(updated->begin(), updated->end(),
            [id](const ListenerEntry& e) { return e.id == id; });
        if (entry == updated->end()) return false;
        updated->erase(entry);
        m_listeners = std::move(updated);
        return true;
    }

    void NetworkManager::Dispatch(Circuit& circuit, const Packet& packet) {
        auto it = m_handlers.find(packet.type);
        if (it != m_handlers.end()) {
            // Holding the snapshot keeps it valid while handlers register or unregister.
            const std::shared_ptr<const HandlerList> snapshot = it->second;
            for (const HandlerEntry& entry : *snapshot) {
                try {
                    entry.handler(circuit, packet);
                }
                catch (const std::exception& e) {
                    SL_NETWORK_ERROR("Handler {} for {} threw: {}", entry.id, MessageTable::NameOf(packet.type), e.what());
                }
                if (circuit.GetState() == CircuitState::Disconnected) break;
            }
        }

        if (packet.type == MessageType::LogoutReply) {
            SL_NETWORK_INFO("Logout confirmed by {}", circuit.GetEndpoint().ToString());
            const auto circuits = m_circuits;
            for (const auto& c : circuits) {
                c->Disconnect(DisconnectReason::Logout);
            }
        }
    }

    void NetworkManager::Emit(const NetworkEvent& event) {
        const std::shared_ptr<const ListenerList> snapshot = m_listeners;
        for (const ListenerEntry& entry : *snapshot) {
            try {
                entry.listener(event);
            }
            catch (const std::exception& e) {
                SL_NETWORK_ERROR("Event listener {} threw on {}: {}", entry.id, ToString(event.type), e.what());
            }
        }
    }

    // ---------------- Circuit callbacks ----------------

    void NetworkManager::OnCircuitState(Circuit& circuit, CircuitState state) {
        if (state != CircuitState::Active) return;

        NetworkEvent event;
        event.type = NetworkEventType::CircuitConnected;
        event.circuit = Lookup(&circuit);
        Emit(event);
    }

    void NetworkManager::OnCircuitClosed(Circuit& circuit, DisconnectReason reason) {
        std::shared_ptr<Circuit> closed = Lookup(&circuit);
        if (!closed) return;

        m_circuits.erase(std::remove(m_circuits.begin(), m_circuits.end(), closed), m_circuits.end());
        m_graveyard.push_back(closed);

        std::weak_ptr<bool> alive = m_aliveToken;
        m_loop.Post([this, alive]() {
            if (alive.lock()) ReapClosedCircuits();
        });

        const bool wasCurrent = (m_currentCircuit == closed);
        if (wasCurrent) {
            m_currentCircuit.reset();
        }

        NetworkEvent event;
        event.type = (reason == DisconnectReason::ConnectionFailed)
            ? NetworkEventType::ConnectionFailed
            : NetworkEventType::CircuitDisconnected;
        event.circuit = closed;
        event.reason = reason;
        Emit(event);

        if ((wasCurrent || m_circuits.empty()) && !m_sessionDisconnectedRaised) {
            m_sessionDisconnectedRaised = true;
            SL_NETWORK_WARN("Session disconnected ({})", ToString(reason));
            NetworkEvent session;
            session.type = NetworkEventType::SessionDisconnected;
            session.circuit = closed;
            session.reason = reason;
            Emit(session);
        }
    }

    void NetworkManager::OnDeliveryFailed(Circuit& circuit, const ReliablePacket& packet) {
        NetworkEvent event;
        event.type = NetworkEventType::DeliveryFailed;
        event.circuit = Lookup(&circuit);
        event.sequence = packet.sequenceNumber;
        event.message = packet.messageType;
        Emit(event);
    }

    void NetworkManager::ReapClosedCircuits() {
        if (!m_graveyard.empty()) {
            SL_NETWORK_TRACE("Releasing {} closed circuit(s)", m_graveyard.size());
            m_graveyard.clear();
        }
    }

    // ---------------- Driving ----------------

    bool NetworkManager::Start() {
        if (m_tickTimer != 0) return true;
        if (!m_loop.IsValid()) {
            SL_NETWORK_ERROR("NetworkManager::Start: event loop is not usable");
            return false;
        }
        m_tickTimer = m_loop.ScheduleRepeating(m_settings.tickInterval, [this]() { Update(Now()); });
        return true;
    }

    void NetworkManager::Update(Clock::time_point now) {
        ReapClosedCircuits();

        const auto circuits = m_circuits;
        for (const auto& circuit : circuits) {
            circuit->Update(now);
        }
    }

    void NetworkManager::Shutdown() {
        if (m_tickTimer != 0) {
            m_loop.CancelTimer(m_tickTimer);
            m_tickTimer = 0;
        }

        const auto circuits = m_circuits;
        for (const auto& circuit : circuits) {
            circuit->Disconnect(DisconnectReason::Requested);
        }
        m_circuits.clear();
        m_currentCircuit.reset();

        if (m_workers) {
            const std::size_t dropped = m_workers->clearQueue();
            if (dropped > 0) {
                SL_NETWORK_DEBUG("Dropped {} queued background task(s)", dropped);
            }
            m_workers->stop();
            m_workers.reset();
        }
        ReapClosedCircuits();
    }

    void NetworkManager::RunInBackground(std::function<void()> work, std::function<void()> done) {
        if (!m_workers) {
            m_workers = std::make_unique<Threading::TaskThreadPool>(m_settings.backgroundThreads);
        }

        std::weak_ptr<bool> alive = m_aliveToken;
        EventLoop* loop = &m_loop;
        // The future is not kept: completion is reported through `done`.
        std::future<void> pending = m_workers->enqueue(
            [work = std::move(work), done = std::move(done), alive, loop]() {
                try {
                    work();
                }
                catch (const std::exception& e) {
                    SL_NETWORK_ERROR("Background task threw: {}", e.what());
                }
                if (done && alive.lock()) {
                    loop->Post([done, alive]() {
                        if (alive.lock()) done();
                    });
                }
            });
        (void)pending;
    }

} // namespace SimLink::Networking
