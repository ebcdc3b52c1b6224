#pragma once

#include "Packet.hpp"
#include "ZeroCoding.hpp"

#include <cstdint>
#include <cstddef>
#include <vector>

namespace SimLink::Protocol {

    enum class DecodeStatus : uint8_t {
        Ok = 0,
        TooShort,         // header, extra header or identifier truncated
        BadAppendedAcks,  // ack count larger than the datagram
        BadZeroCoding,
        UnknownMessage,   // header valid, identifier not in the table
        BodyTooShort,     // known message with a body below its minimum
        TooLarge
    };

    const char* ToString(DecodeStatus status);

    /**
     * @class PacketCodec
     * @brief Stateless framing of datagrams: header, identifier, zero-coding and appended acks.
     *
     * Wire layout: [flags][sequence be32][extraLen][extra...][id+body, zero-coded if flagged][acks be32...][ackCount]
     */
    class PacketCodec {
    public:
        /**
         * @brief Decodes one datagram.
         * @param data Raw datagram bytes.
         * @param size Datagram length.
         * @param outPacket Receives the header, appended acks, message type and plain body.
         * @param maxDecoded Upper bound for the zero-decoded payload.
         * @return Ok, or the reason the datagram cannot be delivered. For UnknownMessage and
         *         BodyTooShort the header and appended acks in `outPacket` are still valid.
         */
        static DecodeStatus Decode(const uint8_t* data, std::size_t size, Packet& outPacket,
            std::size_t maxDecoded = ZeroCoding::DEFAULT_MAX_DECODED);

        /**
         * @brief Encodes a packet without appended acks.
         * @param packet Header flags, sequence, type and body. FLAG_ZEROCODED is an opt-in and is
         *        cleared in the output when coding would not shrink the payload.
         * @param out Receives the datagram (cleared first).
         * @param maxSize Datagram cap.
         * @return False for an unknown type or a datagram larger than `maxSize`.
         */
        static bool Encode(const Packet& packet, std::vector<uint8_t>& out,
            std::size_t maxSize = MAX_PACKET_SIZE);

        // Appends as many acks as fit under `maxSize` (and at most 255), sets FLAG_ACK.
        // Returns the number appended.
        static std::size_t AppendAcks(std::vector<uint8_t>& wire, const std::vector<SequenceNumber>& acks,
            std::size_t maxSize = MAX_PACKET_SIZE);

        static void MarkResent(std::vector<uint8_t>& wire);
    };

} // namespace SimLink::Protocol
