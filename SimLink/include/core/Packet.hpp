// File: Packet.hpp
#pragma once

#include "protocols.hpp"
#include "MessageTypes.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace SimLink::Protocol {

    // One decoded (or to-be-encoded) datagram.
    struct Packet {
        PacketHeader                header;
        MessageType                 type{ MessageType::Invalid };
        std::vector<uint8_t>        body;          // plain body bytes following the identifier
        std::vector<SequenceNumber> appendedAcks;  // acks carried at the tail of the datagram

        bool IsReliable() const { return header.IsReliable(); }

        // Builds an outbound packet, opting into zero-coding when the message is usually sparse.
        static Packet Make(MessageType type, std::vector<uint8_t> body, bool reliable) {
            Packet p;
            p.type = type;
            p.body = std::move(body);
            if (reliable) p.header.flags |= FLAG_RELIABLE;
            const MessageInfo* info = MessageTable::Find(type);
            if (info && info->zeroCoded) p.header.flags |= FLAG_ZEROCODED;
            return p;
        }
    };

} // namespace SimLink::Protocol
