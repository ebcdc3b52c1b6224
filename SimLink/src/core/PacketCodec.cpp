#include "../../include/core/PacketCodec.hpp"

#include <algorithm>

namespace SimLink::Protocol {

    const char* ToString(DecodeStatus status) {
        switch (status) {
        case DecodeStatus::Ok:              return "Ok";
        case DecodeStatus::TooShort:        return "TooShort";
        case DecodeStatus::BadAppendedAcks: return "BadAppendedAcks";
        case DecodeStatus::BadZeroCoding:   return "BadZeroCoding";
        case DecodeStatus::UnknownMessage:  return "UnknownMessage";
        case DecodeStatus::BodyTooShort:    return "BodyTooShort";
        case DecodeStatus::TooLarge:        return "TooLarge";
        }
        return "Unknown";
    }

    DecodeStatus PacketCodec::Decode(const uint8_t* data, std::size_t size, Packet& outPacket,
        std::size_t maxDecoded)
    {
        outPacket = Packet{};

        auto [header, err] = parse_header(data, size);
        if (err != ParseError::None) return DecodeStatus::TooShort;
        outPacket.header = std::move(header);

        const std::size_t payloadStart = outPacket.header.WireSize();
        std::size_t payloadEnd = size;

        // 1. Strip appended acks from the tail
        if (outPacket.header.HasAppendedAcks()) {
            if (payloadEnd <= payloadStart) return DecodeStatus::BadAppendedAcks;
            const std::size_t count = data[payloadEnd - 1];
            const std::size_t ackBytes = count * APPENDED_ACK_SIZE + 1;
            if (payloadEnd - payloadStart < ackBytes) return DecodeStatus::BadAppendedAcks;

            const uint8_t* ackPtr = data + payloadEnd - ackBytes;
            outPacket.appendedAcks.reserve(count);
            for (std::size_t i = 0; i < count; ++i) {
                outPacket.appendedAcks.push_back(be_read32(ackPtr + i * APPENDED_ACK_SIZE));
            }
            payloadEnd -= ackBytes;
        }

        // 2. Undo zero-coding over identifier + body
        const uint8_t* payload = data + payloadStart;
        std::size_t payloadLen = payloadEnd - payloadStart;
        std::vector<uint8_t> decoded;
        if (outPacket.header.IsZeroCoded()) {
            if (!ZeroCoding::Decode(payload, payloadLen, decoded, maxDecoded)) {
                return DecodeStatus::BadZeroCoding;
            }
            payload = decoded.data();
            payloadLen = decoded.size();
        }
        else if (payloadLen > maxDecoded) {
            return DecodeStatus::TooLarge;
        }

        // 3. Identifier
        MessageType type = MessageType::Invalid;
        std::size_t idLen = 0;
        switch (MessageTable::ReadId(payload, payloadLen, type, idLen)) {
        case MessageIdStatus::TooShort: return DecodeStatus::TooShort;
        case MessageIdStatus::Unknown:  return DecodeStatus::UnknownMessage;
        case MessageIdStatus::Ok:       break;
        }
        outPacket.type = type;
        outPacket.body.assign(payload + idLen, payload + payloadLen);

        const MessageInfo* info = MessageTable::Find(type);
        if (info && outPacket.body.size() < info->minBodySize) {
            return DecodeStatus::BodyTooShort;
        }
        return DecodeStatus::Ok;
    }

    bool PacketCodec::Encode(const Packet& packet, std::vector<uint8_t>& out, std::size_t maxSize) {
        out.clear();

        std::vector<uint8_t> plain;
        plain.reserve(4 + packet.body.size());
        if (!MessageTable::WriteId(packet.type, plain)) return false;
        plain.insert(plain.end(), packet.body.begin(), packet.body.end());

        PacketHeader header = packet.header;
        header.flags &= static_cast<uint8_t>(~FLAG_ACK);

        std::vector<uint8_t> coded;
        if (header.IsZeroCoded()) {
            ZeroCoding::Encode(plain.data(), plain.size(), coded);
            if (coded.size() >= plain.size()) {
                header.flags &= static_cast<uint8_t>(~FLAG_ZEROCODED);
                coded.clear();
            }
        }
        const std::vector<uint8_t>& payload = header.IsZeroCoded() ? coded : plain;

        if (header.WireSize() + payload.size() > maxSize) return false;
        if (!serialize_header(header, out)) return false;
        out.insert(out.end(), payload.begin(), payload.end());
        return true;
    }

    std::size_t PacketCodec::AppendAcks(std::vector<uint8_t>& wire, const std::vector<SequenceNumber>& acks,
        std::size_t maxSize)
    {
        if (acks.empty() || wire.size() < HEADER_WIRE_SIZE) return 0;
        if (wire.size() + APPENDED_ACK_SIZE + 1 > maxSize) return 0;

        const std::size_t room = (maxSize - wire.size() - 1) / APPENDED_ACK_SIZE;
        const std::size_t count = std::min({ acks.size(), room, MAX_APPENDED_ACKS });

        const std::size_t base = wire.size();
        wire.resize(base + count * APPENDED_ACK_SIZE + 1);
        for (std::size_t i = 0; i < count; ++i) {
            be_write32(wire.data() + base + i * APPENDED_ACK_SIZE, acks[i]);
        }
        wire.back() = static_cast<uint8_t>(count);
        wire[0] |= FLAG_ACK;
        return count;
    }

    void PacketCodec::MarkResent(std::vector<uint8_t>& wire) {
        if (!wire.empty()) wire[0] |= FLAG_RESENT;
    }

} // namespace SimLink::Protocol
