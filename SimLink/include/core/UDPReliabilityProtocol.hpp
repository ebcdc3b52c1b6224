#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "ReliableConnectionState.hpp"
#include "protocols.hpp"

namespace SimLink::Protocol {

    enum class InboundVerdict : uint8_t {
        New = 0,
        Duplicate = 1
    };

    /**
     * @class UDPReliabilityProtocol
     * @brief Stateless operations over a ReliableConnectionState.
     *
     * Covers outbound sequence assignment and resend tracking, inbound duplicate
     * suppression, and the queue of acknowledgements owed to the peer.
     */
    class UDPReliabilityProtocol {
    public:
        using ResendFunc = std::function<void(const ReliablePacket&)>;
        using FailureFunc = std::function<void(const ReliablePacket&)>;

        // ---- Outbound --------------------------------------------------------
        static SequenceNumber NextSequenceNumber(ReliableConnectionState& state);

        static void TrackReliable(ReliableConnectionState& state, SequenceNumber seq, MessageType type,
            const std::vector<uint8_t>& wire, Clock::time_point now);

        // Removes acknowledged entries. Returns how many were outstanding.
        static std::size_t ProcessAcks(ReliableConnectionState& state, const std::vector<SequenceNumber>& acks);

        /**
         * @brief Resends entries older than the resend timeout and expires exhausted ones.
         * @param resend Invoked with the entry after its RESENT flag and retry count are updated.
         * @param onFailure Invoked with entries removed after maxResendCount resends.
         * Callbacks run after the state lock is released.
         */
        static void ProcessRetransmissions(ReliableConnectionState& state, Clock::time_point now,
            const ResendFunc& resend, const FailureFunc& onFailure);

        static std::optional<SequenceNumber> OldestUnacknowledged(const ReliableConnectionState& state);
        static std::size_t UnacknowledgedCount(const ReliableConnectionState& state);

        // ---- Inbound ---------------------------------------------------------
        // Records the sequence number and, for reliable packets, queues an ack (duplicates included).
        static InboundVerdict ProcessIncoming(ReliableConnectionState& state, const PacketHeader& header,
            Clock::time_point now);

        // ---- Acknowledgements owed ----------------------------------------------
        // Removes up to `max` acks (at most 255); any left behind are timed from `now`.
        static std::vector<SequenceNumber> TakePendingAcks(ReliableConnectionState& state, std::size_t max,
            Clock::time_point now);
        static bool HasPendingAcks(const ReliableConnectionState& state);
        static bool ShouldFlushAcks(const ReliableConnectionState& state, Clock::time_point now);

        // ---- Lifetime ----------------------------------------------------------
        static bool IsConnectionTimedOut(const ReliableConnectionState& state, Clock::time_point now,
            std::chrono::milliseconds timeout);

        // Drops every pending entry, seen sequence and owed ack.
        static void Reset(ReliableConnectionState& state);
    };

} // namespace SimLink::Protocol
