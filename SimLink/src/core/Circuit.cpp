// File: Circuit.cpp

#include "../../include/core/Circuit.hpp"
#include "../../include/core/PacketCodec.hpp"
#include "../../include/core/Logger.hpp"

#include <algorithm>
#include <exception>

using namespace SimLink::Protocol;

namespace SimLink::Networking {

    const char* ToString(CircuitState state) {
        switch (state) {
        case CircuitState::Disconnected:             return "Disconnected";
        case CircuitState::Connecting:               return "Connecting";
        case CircuitState::AwaitingHandshakeConfirm: return "AwaitingHandshakeConfirm";
        case CircuitState::Active:                   return "Active";
        case CircuitState::Disconnecting:            return "Disconnecting";
        }
        return "Unknown";
    }

    const char* ToString(DisconnectReason reason) {
        switch (reason) {
        case DisconnectReason::None:             return "None";
        case DisconnectReason::Requested:        return "Requested";
        case DisconnectReason::Logout:           return "Logout";
        case DisconnectReason::ConnectionFailed: return "ConnectionFailed";
        case DisconnectReason::SocketError:      return "SocketError";
        case DisconnectReason::TimedOut:         return "TimedOut";
        case DisconnectReason::RemoteClosed:     return "RemoteClosed";
        }
        return "Unknown";
    }

    const char* ToString(SendResult result) {
        switch (result) {
        case SendResult::Ok:                return "Ok";
        case SendResult::NotReady:          return "NotReady";
        case SendResult::NotConnected:      return "NotConnected";
        case SendResult::NotCurrentCircuit: return "NotCurrentCircuit";
        case SendResult::TooLarge:          return "TooLarge";
        case SendResult::SocketError:       return "SocketError";
        case SendResult::NoCircuit:         return "NoCircuit";
        }
        return "Unknown";
    }

    Circuit::Circuit(const NetworkEndpoint& endpoint,
        uint32_t circuitCode,
        const SessionContext& session,
        const NetworkSettings& settings,
        std::unique_ptr<INetworkIO> io)
        : m_endpoint(endpoint)
        , m_circuitCode(circuitCode)
        , m_session(session)
        , m_settings(settings)
        , m_io(std::move(io))
        , m_reliability(settings.reliability)
    {
        SL_NETWORK_DEBUG("Circuit ctor: endpoint={} code={}", m_endpoint.ToString(), m_circuitCode);
    }

    Circuit::~Circuit() {
        if (m_io) m_io->Stop();
    }

    void Circuit::SetPacketCallback(PacketCallback cb) { m_packetCallback = std::move(cb); }
    void Circuit::SetStateCallback(StateCallback cb) { m_stateCallback = std::move(cb); }
    void Circuit::SetClosedCallback(ClosedCallback cb) { m_closedCallback = std::move(cb); }
    void Circuit::SetDeliveryFailureCallback(DeliveryFailureCallback cb) { m_deliveryFailureCallback = std::move(cb); }
    void Circuit::SetClock(ClockFunc clock) { m_clock = std::move(clock); }
    void Circuit::SetCurrent(bool isCurrent) { m_isCurrent = isCurrent; }

    Circuit::Clock::time_point Circuit::Now() const {
        return m_clock ? m_clock() : Clock::now();
    }

    bool Circuit::IsHandshakeMessage(MessageType type) {
        return type == MessageType::UseCircuitCode
            || type == MessageType::RegionHandshakeReply
            || type == MessageType::CompleteAgentMovement;
    }

    CircuitStats Circuit::GetStats() const {
        CircuitStats stats = m_stats;
        std::lock_guard<std::mutex> lock(m_reliability.internalStateMutex);
        stats.resentPackets = m_reliability.packetsResent;
        stats.duplicatesReceived = m_reliability.duplicatesReceived;
        stats.acksReceived = m_reliability.acksReceived;
        stats.deliveryFailures = m_reliability.deliveryFailures;
        return stats;
    }

    // ---------------- Lifecycle ----------------

    bool Circuit::Connect() {
        if (m_state != CircuitState::Disconnected) {
            SL_NETWORK_WARN("[{}] Connect ignored in state {}", m_endpoint.ToString(), ToString(m_state));
            return false;
        }
        if (!m_io) {
            SL_NETWORK_ERROR("[{}] Connect: no transport", m_endpoint.ToString());
            return false;
        }

        m_disconnectReason = DisconnectReason::None;
        m_regionHandshakeReplied = false;
        m_regionInfo.reset();
        m_outstandingPing.reset();
        m_stats = CircuitStats{};
        SetState(CircuitState::Connecting);

        if (!m_io->Init(m_settings.bindAddress, 0, this) || !m_io->Start()) {
            SL_NETWORK_ERROR("[{}] Socket setup failed", m_endpoint.ToString());
            Close(DisconnectReason::SocketError, false);
            return false;
        }

        const auto now = Now();
        m_reliability.lastPacketReceivedTime = now;
        m_reliability.lastPacketSentTime = now;

        if (SendUseCircuitCode() != SendResult::Ok) {
            // Transmit failure has already closed the circuit.
            return false;
        }

        m_handshakeAttempts = 1;
        m_lastHandshakeAttempt = now;
        SetState(CircuitState::AwaitingHandshakeConfirm);
        return true;
    }

    void Circuit::Disconnect(DisconnectReason reason) {
        Close(reason, true);
    }

    void Circuit::Close(DisconnectReason reason, bool notifyPeer) {
        if (m_state == CircuitState::Disconnected || m_closing) return;
        m_closing = true;

        const bool wasActive = (m_state == CircuitState::Active);
        SetState(CircuitState::Disconnecting);

        if (notifyPeer && wasActive && m_io && m_io->IsRunning()) {
            Packet close = Packet::Make(MessageType::CloseCircuit, {}, false);
            const SendResult result = SendInternal(close);
            if (result != SendResult::Ok) {
                SL_NETWORK_DEBUG("[{}] CloseCircuit not sent: {}", m_endpoint.ToString(), ToString(result));
            }
        }

        // The peer is being abandoned: pending resends and owed acks go with it.
        UDPReliabilityProtocol::Reset(m_reliability);
        if (m_io) m_io->Stop();

        m_disconnectReason = reason;
        m_closing = false;
        SetState(CircuitState::Disconnected);
        SL_NETWORK_INFO("[{}] Circuit closed: {}", m_endpoint.ToString(), ToString(reason));

        if (m_closedCallback) {
            m_closedCallback(*this, reason);
        }
    }

    void Circuit::SetState(CircuitState state) {
        if (m_state == state) return;
        SL_NETWORK_DEBUG("[{}] {} -> {}", m_endpoint.ToString(), ToString(m_state), ToString(state));
        m_state = state;
        if (m_stateCallback) {
            m_stateCallback(*this, state);
        }
    }

    // ---------------- Send path ----------------

    SendResult Circuit::Send(Packet packet) {
        if (m_state == CircuitState::Disconnected || m_state == CircuitState::Disconnecting) {
            return SendResult::NotConnected;
        }
        if (m_state != CircuitState::Active && !IsHandshakeMessage(packet.type)) {
            SL_NETWORK_DEBUG("[{}] {} rejected: circuit not ready ({})",
                m_endpoint.ToString(), MessageTable::NameOf(packet.type), ToString(m_state));
            return SendResult::NotReady;
        }
        return SendInternal(packet);
    }

    SendResult Circuit::SendInternal(Packet& packet) {
        packet.header.flags &= static_cast<uint8_t>(~(FLAG_ACK | FLAG_RESENT));
        packet.header.sequence = 0;

        std::vector<uint8_t> wire;
        if (!PacketCodec::Encode(packet, wire, m_settings.maxPacketSize)) {
            SL_NETWORK_WARN("[{}] {} could not be encoded ({} body bytes)",
                m_endpoint.ToString(), MessageTable::NameOf(packet.type), packet.body.size());
            return SendResult::TooLarge;
        }

        // Sequence numbers are assigned only once the datagram is known to fit.
        packet.header.sequence = UDPReliabilityProtocol::NextSequenceNumber(m_reliability);
        be_write32(wire.data() + 1, packet.header.sequence);

        if (packet.IsReliable()) {
            UDPReliabilityProtocol::TrackReliable(m_reliability, packet.header.sequence, packet.type, wire, Now());
        }

        SL_NETWORK_TRACE("[{}] OUT {} seq={} len={}{}", m_endpoint.ToString(), MessageTable::NameOf(packet.type),
            packet.header.sequence, wire.size(), packet.IsReliable() ? " reliable" : "");

        if (!Transmit(wire, packet.type != MessageType::PacketAck)) {
            return SendResult::SocketError;
        }
        return SendResult::Ok;
    }

    bool Circuit::Transmit(std::vector<uint8_t>& wire, bool piggybackAcks) {
        if (piggybackAcks && UDPReliabilityProtocol::HasPendingAcks(m_reliability)
            && wire.size() + APPENDED_ACK_SIZE + 1 <= m_settings.maxPacketSize)
        {
            const std::size_t room = (m_settings.maxPacketSize - wire.size() - 1) / APPENDED_ACK_SIZE;
            const std::size_t limit = std::min(room, m_settings.reliability.maxPiggybackAcks);
            const std::vector<SequenceNumber> acks = UDPReliabilityProtocol::TakePendingAcks(m_reliability, limit, Now());
            m_stats.acksSent += PacketCodec::AppendAcks(wire, acks, m_settings.maxPacketSize);
        }

        if (!m_io->SendData(m_endpoint, wire.data(), static_cast<uint32_t>(wire.size()))) {
            SL_NETWORK_ERROR("[{}] Send of {} bytes failed", m_endpoint.ToString(), wire.size());
            Close(DisconnectReason::SocketError, false);
            return false;
        }

        ++m_stats.packetsOut;
        m_stats.bytesOut += wire.size();
        return true;
    }

    void Circuit::FlushAcks(Clock::time_point now) {
        while (m_state != CircuitState::Disconnected && UDPReliabilityProtocol::ShouldFlushAcks(m_reliability, now)) {
            const std::vector<SequenceNumber> acks = UDPReliabilityProtocol::TakePendingAcks(m_reliability, MAX_APPENDED_ACKS, now);
            if (acks.empty()) return;

            Packet ack = Packet::Make(MessageType::PacketAck, Messages::BuildPacketAck(acks), false);
            if (SendInternal(ack) != SendResult::Ok) return;
            m_stats.acksSent += acks.size();
        }
    }

    // ---------------- Receive path ----------------

    void Circuit::OnRawDataReceived(const NetworkEndpoint& sender, const uint8_t* data, uint32_t size) {
        if (!(sender == m_endpoint)) {
            SL_NETWORK_DEBUG("[{}] Dropping {} bytes from unexpected sender {}",
                m_endpoint.ToString(), size, sender.ToString());
            return;
        }
        try {
            HandleRawPacket(data, size);
        }
        catch (const std::exception& e) {
            SL_NETWORK_ERROR("[{}] Exception while handling packet: {}", m_endpoint.ToString(), e.what());
        }
    }

    void Circuit::OnNetworkError(const std::string& errorMessage, int errorCode) {
        SL_NETWORK_ERROR("[{}] Transport error: {} ({})", m_endpoint.ToString(), errorMessage, errorCode);
        Close(DisconnectReason::SocketError, false);
    }

    void Circuit::HandleRawPacket(const uint8_t* data, uint32_t size) {
        if (m_state == CircuitState::Disconnected || m_state == CircuitState::Disconnecting) return;

        const auto now = Now();
        ++m_stats.packetsIn;
        m_stats.bytesIn += size;

        Packet packet;
        const DecodeStatus status = PacketCodec::Decode(data, size, packet, m_settings.maxDecodedSize);
        if (status != DecodeStatus::Ok && status != DecodeStatus::UnknownMessage) {
            ++m_stats.malformedDropped;
            SL_NETWORK_WARN("[{}] Malformed datagram ({} bytes): {}", m_endpoint.ToString(), size, ToString(status));
            return;
        }

        UDPReliabilityProtocol::ProcessAcks(m_reliability, packet.appendedAcks);
        const InboundVerdict verdict = UDPReliabilityProtocol::ProcessIncoming(m_reliability, packet.header, now);

        if (status == DecodeStatus::UnknownMessage) {
            ++m_stats.unknownDropped;
            SL_NETWORK_DEBUG("[{}] Unrecognized message in seq {}, dropped", m_endpoint.ToString(), packet.header.sequence);
            return;
        }
        if (verdict == InboundVerdict::Duplicate) {
            SL_NETWORK_TRACE("[{}] Duplicate seq {} ({}) suppressed", m_endpoint.ToString(),
                packet.header.sequence, MessageTable::NameOf(packet.type));
            return;
        }

        SL_NETWORK_TRACE("[{}] IN {} seq={} len={}", m_endpoint.ToString(), MessageTable::NameOf(packet.type),
            packet.header.sequence, size);

        if (HandleInternal(packet, now)) return;
        if (m_state == CircuitState::Disconnected || m_state == CircuitState::Disconnecting) return;

        if (m_packetCallback) {
            m_packetCallback(*this, packet);
        }

        if (packet.type == MessageType::DisableSimulator) {
            Close(DisconnectReason::RemoteClosed, false);
        }
    }

    // Returns true when the packet belongs to the transport and must not reach handlers.
    bool Circuit::HandleInternal(const Packet& packet, Clock::time_point now) {
        switch (packet.type) {
        case MessageType::PacketAck: {
            std::vector<SequenceNumber> acks;
            if (!Messages::TryParsePacketAck(packet.body.data(), packet.body.size(), acks)) {
                ++m_stats.malformedDropped;
                SL_NETWORK_WARN("[{}] Truncated PacketAck", m_endpoint.ToString());
                return true;
            }
            UDPReliabilityProtocol::ProcessAcks(m_reliability, acks);
            return true;
        }
        case MessageType::StartPingCheck: {
            uint8_t pingId = 0;
            SequenceNumber oldest = 0;
            if (Messages::TryParseStartPingCheck(packet.body.data(), packet.body.size(), pingId, oldest)) {
                Packet reply = Packet::Make(MessageType::CompletePingCheck, Messages::BuildCompletePingCheck(pingId), false);
                const SendResult result = SendInternal(reply);
                if (result != SendResult::Ok) {
                    SL_NETWORK_DEBUG("[{}] CompletePingCheck not sent: {}", m_endpoint.ToString(), ToString(result));
                }
            }
            return true;
        }
        case MessageType::CompletePingCheck: {
            uint8_t pingId = 0;
            if (Messages::TryParseCompletePingCheck(packet.body.data(), packet.body.size(), pingId)
                && m_outstandingPing && *m_outstandingPing == pingId)
            {
                m_stats.lastPingRoundTrip = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastPingSent);
                m_outstandingPing.reset();
            }
            return true;
        }
        case MessageType::CloseCircuit:
            SL_NETWORK_INFO("[{}] Simulator closed the circuit", m_endpoint.ToString());
            Close(DisconnectReason::RemoteClosed, false);
            return true;
        case MessageType::RegionHandshake:
            OnRegionHandshake(packet);
            return false;
        case MessageType::AgentMovementComplete:
            OnAgentMovementComplete(packet);
            return false;
        default:
            return false;
        }
    }

    // ---------------- Handshake ----------------

    SendResult Circuit::SendUseCircuitCode() {
        Packet packet = Packet::Make(MessageType::UseCircuitCode,
            Messages::BuildUseCircuitCode(m_circuitCode, m_session.sessionId, m_session.agentId), true);
        SL_NETWORK_INFO("[{}] UseCircuitCode {} (attempt {})", m_endpoint.ToString(), m_circuitCode, m_handshakeAttempts + 1);
        return SendInternal(packet);
    }

    void Circuit::OnRegionHandshake(const Packet& packet) {
        Messages::RegionHandshakeInfo info;
        if (!Messages::TryParseRegionHandshake(packet.body.data(), packet.body.size(), info)) {
            SL_NETWORK_WARN("[{}] RegionHandshake could not be parsed", m_endpoint.ToString());
            return;
        }
        m_regionInfo = info;
        SL_NETWORK_INFO("[{}] RegionHandshake from '{}' (region {})",
            m_endpoint.ToString(), info.simName, info.regionId.ToString());

        Packet reply = Packet::Make(MessageType::RegionHandshakeReply,
            Messages::BuildRegionHandshakeReply(m_session.agentId, m_session.sessionId), true);
        if (SendInternal(reply) != SendResult::Ok) return;
        m_regionHandshakeReplied = true;

        if (m_state != CircuitState::AwaitingHandshakeConfirm) return;

        if (m_isCurrent) {
            Packet move = Packet::Make(MessageType::CompleteAgentMovement,
                Messages::BuildCompleteAgentMovement(m_session.agentId, m_session.sessionId, m_circuitCode), true);
            if (SendInternal(move) != SendResult::Ok) return;
        }
        else {
            BecomeActive(Now());
        }
    }

    void Circuit::OnAgentMovementComplete(const Packet& packet) {
        Messages::AgentMovementCompleteInfo info;
        if (!Messages::TryParseAgentMovementComplete(packet.body.data(), packet.body.size(), info)) {
            SL_NETWORK_WARN("[{}] AgentMovementComplete could not be parsed", m_endpoint.ToString());
            return;
        }
        if (m_state == CircuitState::AwaitingHandshakeConfirm && m_isCurrent) {
            SL_NETWORK_INFO("[{}] Agent movement complete at <{:.1f}, {:.1f}, {:.1f}>",
                m_endpoint.ToString(), info.position.x, info.position.y, info.position.z);
            BecomeActive(Now());
        }
    }

    void Circuit::BecomeActive(Clock::time_point now) {
        SetState(CircuitState::Active);
        m_lastPingSent = now;
        SL_NETWORK_INFO("[{}] Circuit active ({})", m_endpoint.ToString(), m_isCurrent ? "current" : "child");

        if (!m_isCurrent) return;

        if (m_settings.sendThrottleOnConnect) {
            Packet throttle = Packet::Make(MessageType::AgentThrottle,
                Messages::BuildAgentThrottle(m_session.agentId, m_session.sessionId, m_circuitCode,
                    m_throttleGeneration++, m_settings.throttle), true);
            if (SendInternal(throttle) != SendResult::Ok) return;
        }
        if (m_settings.requestEconomyData) {
            Packet economy = Packet::Make(MessageType::EconomyDataRequest, {}, true);
            const SendResult result = SendInternal(economy);
            if (result != SendResult::Ok) {
                SL_NETWORK_DEBUG("[{}] EconomyDataRequest not sent: {}", m_endpoint.ToString(), ToString(result));
            }
        }
    }

    void Circuit::SendPing(Clock::time_point now) {
        const SequenceNumber oldest = UDPReliabilityProtocol::OldestUnacknowledged(m_reliability).value_or(0);
        const uint8_t pingId = ++m_pingId;
        Packet ping = Packet::Make(MessageType::StartPingCheck, Messages::BuildStartPingCheck(pingId, oldest), false);
        m_lastPingSent = now;
        if (SendInternal(ping) == SendResult::Ok) {
            m_outstandingPing = pingId;
        }
    }

    // ---------------- Timers ----------------

    void Circuit::Update(Clock::time_point now) {
        if (m_state == CircuitState::Disconnected || m_state == CircuitState::Disconnecting) return;

        UDPReliabilityProtocol::ProcessRetransmissions(m_reliability, now,
            [this](const ReliablePacket& packet) {
                if (m_state == CircuitState::Disconnected) return;
                std::vector<uint8_t> wire = packet.data;
                if (Transmit(wire, true)) {
                    SL_NETWORK_TRACE("[{}] RESENT seq={}", m_endpoint.ToString(), packet.sequenceNumber);
                }
            },
            [this](const ReliablePacket& packet) { OnDeliveryFailure(packet); });
        if (m_state == CircuitState::Disconnected) return;

        FlushAcks(now);
        if (m_state == CircuitState::Disconnected) return;

        if (m_state == CircuitState::AwaitingHandshakeConfirm
            && now - m_lastHandshakeAttempt >= m_settings.handshakeTimeout)
        {
            if (m_handshakeAttempts >= m_settings.maxHandshakeAttempts) {
                SL_NETWORK_WARN("[{}] No handshake confirmation after {} attempt(s)", m_endpoint.ToString(), m_handshakeAttempts);
                Close(DisconnectReason::ConnectionFailed, false);
                return;
            }
            m_lastHandshakeAttempt = now;
            if (!m_regionHandshakeReplied) {
                if (SendUseCircuitCode() != SendResult::Ok) return;
            }
            ++m_handshakeAttempts;
        }

        if (m_state == CircuitState::Active) {
            if (UDPReliabilityProtocol::IsConnectionTimedOut(m_reliability, now, m_settings.simulatorTimeout)) {
                SL_NETWORK_WARN("[{}] No traffic for {} ms", m_endpoint.ToString(), m_settings.simulatorTimeout.count());
                Close(DisconnectReason::TimedOut, false);
                return;
            }
            if (m_settings.sendPings && now - m_lastPingSent >= m_settings.pingInterval) {
                SendPing(now);
            }
        }
    }

    void Circuit::OnDeliveryFailure(const ReliablePacket& packet) {
        if (m_state == CircuitState::Disconnected) return;

        if (IsHandshakeMessage(packet.messageType) && m_state != CircuitState::Active) {
            SL_NETWORK_WARN("[{}] Handshake packet {} was never acknowledged",
                m_endpoint.ToString(), MessageTable::NameOf(packet.messageType));
            Close(DisconnectReason::ConnectionFailed, false);
            return;
        }

        SL_NETWORK_WARN("[{}] Delivery failed for seq {} ({})", m_endpoint.ToString(),
            packet.sequenceNumber, MessageTable::NameOf(packet.messageType));
        if (m_deliveryFailureCallback) {
            m_deliveryFailureCallback(*this, packet);
        }
    }

} // namespace SimLink::Networking
