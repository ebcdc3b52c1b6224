// File: MessageTypes.cpp
#include "../../include/core/MessageTypes.hpp"
#include "../../include/core/protocols.hpp"

#include <array>

namespace SimLink::Protocol {

    namespace {
        constexpr uint8_t EXTENDED_ID = 0xFF;

        using F = Frequency;
        using M = MessageType;

        constexpr std::array<MessageInfo, 35> kMessages{ {
            // type                          name                          freq        number  zero   min  move
            { M::StartPingCheck,            "StartPingCheck",            F::High,    1,      false, 5,   false },
            { M::CompletePingCheck,         "CompletePingCheck",         F::High,    2,      false, 1,   false },
            { M::AgentUpdate,               "AgentUpdate",               F::High,    4,      true,  0,   true  },
            { M::AgentAnimation,            "AgentAnimation",            F::High,    5,      false, 0,   true  },
            { M::LayerData,                 "LayerData",                 F::High,    11,     false, 0,   false },
            { M::ObjectUpdate,              "ObjectUpdate",              F::High,    12,     true,  0,   false },
            { M::ObjectUpdateCompressed,    "ObjectUpdateCompressed",    F::High,    13,     false, 0,   false },
            { M::ObjectUpdateCached,        "ObjectUpdateCached",        F::High,    14,     false, 0,   false },
            { M::ImprovedTerseObjectUpdate, "ImprovedTerseObjectUpdate", F::High,    15,     false, 11,  false },
            { M::KillObject,                "KillObject",                F::High,    16,     false, 1,   false },
            { M::AvatarAnimation,           "AvatarAnimation",           F::High,    20,     false, 0,   false },

            { M::ObjectAdd,                 "ObjectAdd",                 F::Medium,  1,      true,  0,   false },
            { M::RequestMultipleObjects,    "RequestMultipleObjects",    F::Medium,  3,      true,  0,   false },
            { M::CoarseLocationUpdate,      "CoarseLocationUpdate",      F::Medium,  6,      false, 0,   false },
            { M::ObjectProperties,          "ObjectProperties",          F::Medium,  9,      true,  0,   false },
            { M::ObjectPropertiesFamily,    "ObjectPropertiesFamily",    F::Medium,  10,     true,  0,   false },

            { M::TestMessage,               "TestMessage",               F::Low,     1,      true,  0,   false },
            { M::UseCircuitCode,            "UseCircuitCode",            F::Low,     3,      false, 36,  false },
            { M::EconomyDataRequest,        "EconomyDataRequest",        F::Low,     24,     false, 0,   false },
            { M::ChatFromViewer,            "ChatFromViewer",            F::Low,     80,     true,  0,   false },
            { M::AgentThrottle,             "AgentThrottle",             F::Low,     81,     true,  0,   false },
            { M::ChatFromSimulator,         "ChatFromSimulator",         F::Low,     139,    false, 0,   false },
            { M::SimStats,                  "SimStats",                  F::Low,     140,    false, 0,   false },
            { M::RegionHandshake,           "RegionHandshake",           F::Low,     148,    true,  207, false },
            { M::RegionHandshakeReply,      "RegionHandshakeReply",      F::Low,     149,    true,  36,  false },
            { M::EnableSimulator,           "EnableSimulator",           F::Low,     151,    false, 0,   false },
            { M::DisableSimulator,          "DisableSimulator",          F::Low,     152,    false, 0,   false },
            { M::CompleteAgentMovement,     "CompleteAgentMovement",     F::Low,     249,    false, 36,  false },
            { M::AgentMovementComplete,     "AgentMovementComplete",     F::Low,     250,    false, 68,  false },
            { M::LogoutRequest,             "LogoutRequest",             F::Low,     252,    false, 32,  false },
            { M::LogoutReply,               "LogoutReply",               F::Low,     253,    true,  32,  false },
            { M::ImprovedInstantMessage,    "ImprovedInstantMessage",    F::Low,     254,    true,  0,   false },

            { M::PacketAck,                 "PacketAck",                 F::Fixed,   0xFFFB, false, 1,   false },
            { M::OpenCircuit,               "OpenCircuit",               F::Fixed,   0xFFFC, false, 6,   false },
            { M::CloseCircuit,              "CloseCircuit",              F::Fixed,   0xFFFD, false, 0,   false },
        } };
    }

    const MessageInfo* MessageTable::Find(MessageType type) {
        for (const auto& info : kMessages) {
            if (info.type == type) return &info;
        }
        return nullptr;
    }

    const MessageInfo* MessageTable::Find(Frequency frequency, uint16_t number) {
        for (const auto& info : kMessages) {
            if (info.frequency == frequency && info.number == number) return &info;
        }
        return nullptr;
    }

    const char* MessageTable::NameOf(MessageType type) {
        const MessageInfo* info = Find(type);
        return info ? info->name : "Invalid";
    }

    std::size_t MessageTable::IdWireSize(Frequency frequency) {
        switch (frequency) {
        case Frequency::High:   return 1;
        case Frequency::Medium: return 2;
        case Frequency::Low:
        case Frequency::Fixed:  return 4;
        }
        return 0;
    }

    bool MessageTable::WriteId(MessageType type, std::vector<uint8_t>& out) {
        const MessageInfo* info = Find(type);
        if (!info) return false;

        switch (info->frequency) {
        case Frequency::High:
            out.push_back(static_cast<uint8_t>(info->number));
            break;
        case Frequency::Medium:
            out.push_back(EXTENDED_ID);
            out.push_back(static_cast<uint8_t>(info->number));
            break;
        case Frequency::Low:
        case Frequency::Fixed: {
            out.push_back(EXTENDED_ID);
            out.push_back(EXTENDED_ID);
            uint8_t num[2];
            be_write16(num, info->number);
            out.push_back(num[0]);
            out.push_back(num[1]);
            break;
        }
        }
        return true;
    }

    MessageIdStatus MessageTable::ReadId(const uint8_t* data, std::size_t len,
        MessageType& outType, std::size_t& outConsumed)
    {
        outType = MessageType::Invalid;
        outConsumed = 0;
        if (len < 1) return MessageIdStatus::TooShort;

        Frequency frequency = Frequency::High;
        uint16_t number = 0;

        if (data[0] != EXTENDED_ID) {
            number = data[0];
            outConsumed = 1;
        }
        else {
            if (len < 2) return MessageIdStatus::TooShort;
            if (data[1] != EXTENDED_ID) {
                frequency = Frequency::Medium;
                number = data[1];
                outConsumed = 2;
            }
            else {
                if (len < 4) return MessageIdStatus::TooShort;
                number = be_read16(data + 2);
                frequency = ((number & 0xFF00) == 0xFF00) ? Frequency::Fixed : Frequency::Low;
                outConsumed = 4;
            }
        }

        const MessageInfo* info = Find(frequency, number);
        if (!info) return MessageIdStatus::Unknown;
        outType = info->type;
        return MessageIdStatus::Ok;
    }

} // namespace SimLink::Protocol
