#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <utility>
#include <vector>

namespace SimLink::Protocol {

    // =========================
    // Protocol constants
    // =========================
    constexpr std::size_t HEADER_WIRE_SIZE = 6;     // flags(1) + sequence(4) + extra length(1)
    constexpr std::size_t MAX_PACKET_SIZE = 1200;   // outbound datagram cap
    constexpr std::size_t MAX_APPENDED_ACKS = 255;  // count travels in one byte
    constexpr std::size_t APPENDED_ACK_SIZE = 4;

    // Flag bits carried in header byte 0
    constexpr uint8_t FLAG_ZEROCODED = 0x80;
    constexpr uint8_t FLAG_RELIABLE = 0x40;
    constexpr uint8_t FLAG_RESENT = 0x20;
    constexpr uint8_t FLAG_ACK = 0x10;  // appended acks present

    // =========================
    // Core types
    // =========================
    using SequenceNumber = uint32_t;

    struct PacketHeader {
        uint8_t              flags{ 0 };
        SequenceNumber       sequence{ 0 };
        std::vector<uint8_t> extra;  // opaque extra-header bytes

        bool IsReliable() const { return (flags & FLAG_RELIABLE) != 0; }
        bool IsResent() const { return (flags & FLAG_RESENT) != 0; }
        bool HasAppendedAcks() const { return (flags & FLAG_ACK) != 0; }
        bool IsZeroCoded() const { return (flags & FLAG_ZEROCODED) != 0; }

        std::size_t WireSize() const { return HEADER_WIRE_SIZE + extra.size(); }

        bool operator==(const PacketHeader&) const = default;
    };

    enum class ParseError : uint8_t {
        None = 0,
        TooShort = 1,
        ExtraTruncated = 2
    };

    static_assert(sizeof(SequenceNumber) == 4, "SequenceNumber must be 4 bytes");

    // =========================
    // Big-endian (network order) helpers
    // =========================
    inline void be_write16(uint8_t* p, uint16_t v) {
        p[0] = static_cast<uint8_t>((v >> 8) & 0xFF);
        p[1] = static_cast<uint8_t>(v & 0xFF);
    }
    inline void be_write32(uint8_t* p, uint32_t v) {
        p[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
        p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
        p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
        p[3] = static_cast<uint8_t>(v & 0xFF);
    }
    inline uint16_t be_read16(const uint8_t* p) {
        return static_cast<uint16_t>((uint16_t(p[0]) << 8) | uint16_t(p[1]));
    }
    inline uint32_t be_read32(const uint8_t* p) {
        return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    }

    // =========================
    // Little-endian helpers (message bodies)
    // =========================
    inline void le_write16(uint8_t* p, uint16_t v) {
        p[0] = static_cast<uint8_t>(v & 0xFF);
        p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    }
    inline void le_write32(uint8_t* p, uint32_t v) {
        p[0] = static_cast<uint8_t>(v & 0xFF);
        p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
        p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
        p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
    }
    inline void le_write64(uint8_t* p, uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            p[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
        }
    }
    inline uint16_t le_read16(const uint8_t* p) {
        return static_cast<uint16_t>(uint16_t(p[0]) | (uint16_t(p[1]) << 8));
    }
    inline uint32_t le_read32(const uint8_t* p) {
        return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
    }
    inline uint64_t le_read64(const uint8_t* p) {
        uint64_t v = 0;
        for (int i = 7; i >= 0; --i) {
            v = (v << 8) | uint64_t(p[i]);
        }
        return v;
    }
    inline void le_write_float(uint8_t* p, float f) {
        uint32_t bits = 0;
        std::memcpy(&bits, &f, sizeof(bits));
        le_write32(p, bits);
    }
    inline float le_read_float(const uint8_t* p) {
        const uint32_t bits = le_read32(p);
        float f = 0.0f;
        std::memcpy(&f, &bits, sizeof(f));
        return f;
    }

    // =========================
    // Header serialization: [flags][seq be32][extraLen][extra...]
    // =========================
    inline bool serialize_header(const PacketHeader& h, std::vector<uint8_t>& out) {
        if (h.extra.size() > 0xFF) return false;
        const std::size_t base = out.size();
        out.resize(base + h.WireSize());
        uint8_t* p = out.data() + base;
        p[0] = h.flags;
        be_write32(p + 1, h.sequence);
        p[5] = static_cast<uint8_t>(h.extra.size());
        if (!h.extra.empty()) {
            std::memcpy(p + HEADER_WIRE_SIZE, h.extra.data(), h.extra.size());
        }
        return true;
    }

    inline std::pair<PacketHeader, ParseError> parse_header(const uint8_t* data, std::size_t len) {
        PacketHeader h{};
        if (len < HEADER_WIRE_SIZE) return { h, ParseError::TooShort };

        h.flags = data[0];
        h.sequence = be_read32(data + 1);
        const std::size_t extraLen = data[5];
        if (len < HEADER_WIRE_SIZE + extraLen) return { h, ParseError::ExtraTruncated };
        h.extra.assign(data + HEADER_WIRE_SIZE, data + HEADER_WIRE_SIZE + extraLen);
        return { h, ParseError::None };
    }

} // namespace SimLink::Protocol
