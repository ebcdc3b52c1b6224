#pragma once

#include "protocols.hpp"
#include "Types.hpp"

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Bodies of the messages the transport itself sends or consumes.
// Integers and floats are little-endian; UUIDs are 16 raw bytes.
namespace SimLink::Protocol::Messages {

    // Flags sent back in RegionHandshakeReply.
    constexpr uint32_t REGION_HANDSHAKE_REPLY_FLAGS = 0x7;

    // Throttle categories, in wire order.
    constexpr std::size_t THROTTLE_CATEGORIES = 7;  // resend, land, wind, cloud, task, texture, asset
    using ThrottleRates = std::array<float, THROTTLE_CATEGORIES>;

    // --- PacketAck: [count u8][seq u32 * count] ---
    std::vector<uint8_t> BuildPacketAck(const std::vector<SequenceNumber>& sequences);
    bool TryParsePacketAck(const uint8_t* data, std::size_t size, std::vector<SequenceNumber>& out);

    // --- Ping: [pingId u8][oldestUnacked u32] / [pingId u8] ---
    std::vector<uint8_t> BuildStartPingCheck(uint8_t pingId, SequenceNumber oldestUnacked);
    bool TryParseStartPingCheck(const uint8_t* data, std::size_t size, uint8_t& pingId, SequenceNumber& oldestUnacked);
    std::vector<uint8_t> BuildCompletePingCheck(uint8_t pingId);
    bool TryParseCompletePingCheck(const uint8_t* data, std::size_t size, uint8_t& pingId);

    // --- UseCircuitCode: [circuitCode u32][sessionId][agentId] ---
    struct UseCircuitCodeInfo {
        uint32_t    circuitCode{ 0 };
        Types::Uuid sessionId;
        Types::Uuid agentId;
    };
    std::vector<uint8_t> BuildUseCircuitCode(uint32_t circuitCode, const Types::Uuid& sessionId, const Types::Uuid& agentId);
    bool TryParseUseCircuitCode(const uint8_t* data, std::size_t size, UseCircuitCodeInfo& out);

    // --- RegionHandshake (simulator -> viewer) ---
    struct RegionHandshakeInfo {
        uint32_t    regionFlags{ 0 };
        uint8_t     simAccess{ 0 };
        std::string simName;
        Types::Uuid simOwner;
        bool        isEstateManager{ false };
        float       waterHeight{ 0.0f };
        float       billableFactor{ 0.0f };
        Types::Uuid cacheId;
        Types::Uuid regionId;  // zero when the simulator omits the second block
    };
    std::vector<uint8_t> BuildRegionHandshake(const RegionHandshakeInfo& info);
    bool TryParseRegionHandshake(const uint8_t* data, std::size_t size, RegionHandshakeInfo& out);

    // --- RegionHandshakeReply: [agentId][sessionId][flags u32] ---
    std::vector<uint8_t> BuildRegionHandshakeReply(const Types::Uuid& agentId, const Types::Uuid& sessionId,
        uint32_t flags = REGION_HANDSHAKE_REPLY_FLAGS);

    // --- CompleteAgentMovement: [agentId][sessionId][circuitCode u32] ---
    std::vector<uint8_t> BuildCompleteAgentMovement(const Types::Uuid& agentId, const Types::Uuid& sessionId,
        uint32_t circuitCode);

    // --- AgentMovementComplete (simulator -> viewer) ---
    struct AgentMovementCompleteInfo {
        Types::Uuid    agentId;
        Types::Uuid    sessionId;
        Types::Vector3 position;
        Types::Vector3 lookAt;
        uint64_t       regionHandle{ 0 };
        uint32_t       timestamp{ 0 };
    };
    std::vector<uint8_t> BuildAgentMovementComplete(const AgentMovementCompleteInfo& info);
    bool TryParseAgentMovementComplete(const uint8_t* data, std::size_t size, AgentMovementCompleteInfo& out);

    // --- AgentThrottle: [agentId][sessionId][circuitCode u32][genCounter u32][len u8][rates f32 * 7] ---
    std::vector<uint8_t> BuildAgentThrottle(const Types::Uuid& agentId, const Types::Uuid& sessionId,
        uint32_t circuitCode, uint32_t genCounter, const ThrottleRates& rates);

    // --- LogoutRequest: [agentId][sessionId] ---
    std::vector<uint8_t> BuildLogoutRequest(const Types::Uuid& agentId, const Types::Uuid& sessionId);

} // namespace SimLink::Protocol::Messages
