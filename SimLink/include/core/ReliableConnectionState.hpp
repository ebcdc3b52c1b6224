#pragma once

#include "protocols.hpp"
#include "MessageTypes.hpp"

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <deque>
#include <list>
#include <mutex>
#include <unordered_set>
#include <utility>
#include <vector>

namespace SimLink::Protocol {

    using Clock = std::chrono::steady_clock;

    // =========================
    // Reliability tuning (all configurable)
    // =========================
    struct ReliabilitySettings {
        std::chrono::milliseconds resendTimeout{ 4000 };
        int                       maxResendCount{ 3 };
        std::chrono::milliseconds ackFlushInterval{ 50 };
        std::size_t               pendingAckFlushThreshold{ 10 };  // flush early once this many are queued
        std::size_t               maxPiggybackAcks{ 10 };          // per outbound datagram, capped at 255
        std::size_t               seenWindowSize{ 1000 };
    };

    // One reliable datagram awaiting acknowledgement.
    struct ReliablePacket {
        SequenceNumber       sequenceNumber{ 0 };
        MessageType          messageType{ MessageType::Invalid };
        std::vector<uint8_t> data;  // encoded datagram without appended acks
        Clock::time_point    timeSent{};
        int                  retries{ 0 };

        ReliablePacket() = default;

        ReliablePacket(SequenceNumber seq, MessageType type, std::vector<uint8_t> wire, Clock::time_point sent)
            : sequenceNumber(seq), messageType(type), data(std::move(wire)), timeSent(sent), retries(0) {
        }
    };

    // Bounded FIFO set of recently received sequence numbers.
    class SeenWindow {
    public:
        explicit SeenWindow(std::size_t capacity = 1000) : m_capacity(capacity ? capacity : 1) {}

        bool Contains(SequenceNumber seq) const { return m_members.count(seq) != 0; }

        // Returns false if `seq` was already present.
        bool Insert(SequenceNumber seq) {
            if (!m_members.insert(seq).second) return false;
            m_order.push_back(seq);
            while (m_order.size() > m_capacity) {
                m_members.erase(m_order.front());
                m_order.pop_front();
            }
            return true;
        }

        void Clear() {
            m_order.clear();
            m_members.clear();
        }

        std::size_t Size() const { return m_order.size(); }
        std::size_t Capacity() const { return m_capacity; }

    private:
        std::deque<SequenceNumber>         m_order;
        std::unordered_set<SequenceNumber> m_members;
        std::size_t                        m_capacity;
    };

    struct ReliableConnectionState {
        explicit ReliableConnectionState(const ReliabilitySettings& s = ReliabilitySettings{})
            : settings(s), receivedSequences(s.seenWindowSize) {
        }

        ReliabilitySettings settings;

        // --- Sequence management ---
        SequenceNumber lastOutgoingSequenceNumber{ 0 };

        // --- Reliability tracking ---
        std::list<ReliablePacket>  unacknowledgedSentPackets;
        SeenWindow                 receivedSequences;
        std::deque<SequenceNumber> pendingAcks;
        Clock::time_point          oldestPendingAckTime{};

        // --- Timing ---
        Clock::time_point lastPacketReceivedTime{ Clock::now() };
        Clock::time_point lastPacketSentTime{ Clock::now() };

        // --- Counters ---
        uint64_t packetsResent{ 0 };
        uint64_t duplicatesReceived{ 0 };
        uint64_t deliveryFailures{ 0 };
        uint64_t acksReceived{ 0 };

        // --- Thread safety ---
        mutable std::mutex internalStateMutex;
    };

} // namespace SimLink::Protocol
