// File: MessageTypes.hpp
#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace SimLink::Protocol {

    // Frequency class decides how many bytes the identifier takes on the wire.
    enum class Frequency : uint8_t {
        High = 0,    // 1 byte:  nn
        Medium = 1,  // 2 bytes: FF nn
        Low = 2,     // 4 bytes: FF FF nn nn
        Fixed = 3    // 4 bytes: FF FF FF nn
    };

    enum class MessageType : uint16_t {
        Invalid = 0,

        // High
        StartPingCheck,
        CompletePingCheck,
        AgentUpdate,
        AgentAnimation,
        LayerData,
        ObjectUpdate,
        ObjectUpdateCompressed,
        ObjectUpdateCached,
        ImprovedTerseObjectUpdate,
        KillObject,
        AvatarAnimation,

        // Medium
        ObjectAdd,
        RequestMultipleObjects,
        CoarseLocationUpdate,
        ObjectProperties,
        ObjectPropertiesFamily,

        // Low
        TestMessage,
        UseCircuitCode,
        EconomyDataRequest,
        ChatFromViewer,
        AgentThrottle,
        ChatFromSimulator,
        SimStats,
        RegionHandshake,
        RegionHandshakeReply,
        EnableSimulator,
        DisableSimulator,
        CompleteAgentMovement,
        AgentMovementComplete,
        LogoutRequest,
        LogoutReply,
        ImprovedInstantMessage,

        // Fixed
        PacketAck,
        OpenCircuit,
        CloseCircuit
    };

    struct MessageInfo {
        MessageType  type;
        const char*  name;
        Frequency    frequency;
        uint16_t     number;         // Fixed messages keep the full 0xFFnn value
        bool         zeroCoded;      // default encoding for outbound packets
        std::size_t  minBodySize;    // shortest body a well-formed instance can have
        bool         agentMovement;  // only allowed on the current circuit
    };

    enum class MessageIdStatus : uint8_t {
        Ok = 0,
        TooShort = 1,
        Unknown = 2
    };

    /**
     * @class MessageTable
     * @brief Closed lookup table between wire identifiers and known messages.
     *
     * Every identifier the client understands is listed exactly once. Anything
     * else decodes as MessageIdStatus::Unknown and is dropped by the caller.
     */
    class MessageTable {
    public:
        static const MessageInfo* Find(MessageType type);
        static const MessageInfo* Find(Frequency frequency, uint16_t number);

        static const char* NameOf(MessageType type);
        static std::size_t IdWireSize(Frequency frequency);

        // Appends the identifier bytes for `type`. Returns false for Invalid or unlisted types.
        static bool WriteId(MessageType type, std::vector<uint8_t>& out);

        // Reads the identifier at `data`. On Ok, `outType` and `outConsumed` are set.
        // On Unknown, `outConsumed` still reports the identifier width that was read.
        static MessageIdStatus ReadId(const uint8_t* data, std::size_t len,
            MessageType& outType, std::size_t& outConsumed);
    };

} // namespace SimLink::Protocol
