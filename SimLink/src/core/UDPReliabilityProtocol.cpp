#include "../../include/core/UDPReliabilityProtocol.hpp"
#include "../../include/core/PacketCodec.hpp"
#include "../../include/core/Logger.hpp"

#include <algorithm>
#include <mutex>

namespace SimLink::Protocol {

    // ----------------- Outbound -----------------
    SequenceNumber UDPReliabilityProtocol::NextSequenceNumber(ReliableConnectionState& state) {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        return ++state.lastOutgoingSequenceNumber;  // wraps at 2^32
    }

    void UDPReliabilityProtocol::TrackReliable(ReliableConnectionState& state, SequenceNumber seq, MessageType type,
        const std::vector<uint8_t>& wire, Clock::time_point now)
    {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        state.unacknowledgedSentPackets.emplace_back(seq, type, wire, now);
        state.lastPacketSentTime = now;
    }

    std::size_t UDPReliabilityProtocol::ProcessAcks(ReliableConnectionState& state, const std::vector<SequenceNumber>& acks) {
        if (acks.empty()) return 0;

        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        std::size_t removed = 0;
        for (SequenceNumber ack : acks) {
            auto it = std::find_if(state.unacknowledgedSentPackets.begin(), state.unacknowledgedSentPackets.end(),
                [ack](const ReliablePacket& p) { return p.sequenceNumber == ack; });
            if (it != state.unacknowledgedSentPackets.end()) {
                state.unacknowledgedSentPackets.erase(it);
                ++removed;
            }
            else {
                SL_NETWORK_TRACE("Ack for unknown or already acknowledged seq {}", ack);
            }
        }
        state.acksReceived += acks.size();
        return removed;
    }

    void UDPReliabilityProtocol::ProcessRetransmissions(ReliableConnectionState& state, Clock::time_point now,
        const ResendFunc& resend, const FailureFunc& onFailure)
    {
        std::vector<ReliablePacket> toResend;
        std::vector<ReliablePacket> expired;
        {
            std::lock_guard<std::mutex> lock(state.internalStateMutex);
            for (auto it = state.unacknowledgedSentPackets.begin(); it != state.unacknowledgedSentPackets.end(); ) {
                if (now - it->timeSent < state.settings.resendTimeout) {
                    ++it;
                    continue;
                }

                if (it->retries >= state.settings.maxResendCount) {
                    SL_NETWORK_WARN("Seq {} ({}) dropped after {} resends",
                        it->sequenceNumber, MessageTable::NameOf(it->messageType), it->retries);
                    ++state.deliveryFailures;
                    expired.push_back(std::move(*it));
                    it = state.unacknowledgedSentPackets.erase(it);
                    continue;
                }

                ++it->retries;
                it->timeSent = now;
                PacketCodec::MarkResent(it->data);
                ++state.packetsResent;
                toResend.push_back(*it);
                ++it;
            }
        }

        for (const auto& packet : toResend) {
            SL_NETWORK_DEBUG("Resending seq {} ({}), attempt {}",
                packet.sequenceNumber, MessageTable::NameOf(packet.messageType), packet.retries);
            if (resend) resend(packet);
        }
        for (const auto& packet : expired) {
            if (onFailure) onFailure(packet);
        }
    }

    std::optional<SequenceNumber> UDPReliabilityProtocol::OldestUnacknowledged(const ReliableConnectionState& state) {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        if (state.unacknowledgedSentPackets.empty()) return std::nullopt;
        return state.unacknowledgedSentPackets.front().sequenceNumber;
    }

    std::size_t UDPReliabilityProtocol::UnacknowledgedCount(const ReliableConnectionState& state) {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        return state.unacknowledgedSentPackets.size();
    }

    // ----------------- Inbound -----------------
    InboundVerdict UDPReliabilityProtocol::ProcessIncoming(ReliableConnectionState& state, const PacketHeader& header,
        Clock::time_point now)
    {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        state.lastPacketReceivedTime = now;

        if (header.IsReliable()) {
            // The peer may have missed our earlier ack, so duplicates are acked again.
            const bool alreadyQueued = std::find(state.pendingAcks.begin(), state.pendingAcks.end(),
                header.sequence) != state.pendingAcks.end();
            if (!alreadyQueued) {
                if (state.pendingAcks.empty()) state.oldestPendingAckTime = now;
                state.pendingAcks.push_back(header.sequence);
            }
        }

        if (!state.receivedSequences.Insert(header.sequence)) {
            ++state.duplicatesReceived;
            return InboundVerdict::Duplicate;
        }
        return InboundVerdict::New;
    }

    // ----------------- Acks owed -----------------
    std::vector<SequenceNumber> UDPReliabilityProtocol::TakePendingAcks(ReliableConnectionState& state, std::size_t max,
        Clock::time_point now)
    {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        const std::size_t count = std::min({ max, state.pendingAcks.size(), MAX_APPENDED_ACKS });
        const auto end = state.pendingAcks.begin() + static_cast<std::ptrdiff_t>(count);
        std::vector<SequenceNumber> acks(state.pendingAcks.begin(), end);
        state.pendingAcks.erase(state.pendingAcks.begin(), end);
        // Leftovers start a fresh flush interval.
        if (!state.pendingAcks.empty()) state.oldestPendingAckTime = now;
        return acks;
    }

    bool UDPReliabilityProtocol::HasPendingAcks(const ReliableConnectionState& state) {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        return !state.pendingAcks.empty();
    }

    bool UDPReliabilityProtocol::ShouldFlushAcks(const ReliableConnectionState& state, Clock::time_point now) {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        if (state.pendingAcks.empty()) return false;
        if (state.pendingAcks.size() >= state.settings.pendingAckFlushThreshold) return true;
        return now - state.oldestPendingAckTime >= state.settings.ackFlushInterval;
    }

    // ----------------- Lifetime -----------------
    bool UDPReliabilityProtocol::IsConnectionTimedOut(const ReliableConnectionState& state, Clock::time_point now,
        std::chrono::milliseconds timeout)
    {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        return now - state.lastPacketReceivedTime > timeout;
    }

    void UDPReliabilityProtocol::Reset(ReliableConnectionState& state) {
        std::lock_guard<std::mutex> lock(state.internalStateMutex);
        if (!state.unacknowledgedSentPackets.empty()) {
            SL_NETWORK_DEBUG("Discarding {} unacknowledged packet(s)", state.unacknowledgedSentPackets.size());
        }
        state.unacknowledgedSentPackets.clear();
        state.pendingAcks.clear();
        state.receivedSequences.Clear();
    }

} // namespace SimLink::Protocol
