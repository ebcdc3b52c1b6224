// File: BitPacking.cpp
#include "../../include/core/BitPacking.hpp"

namespace SimLink::Protocol {

    bool ReadBits(const uint8_t* buffer, std::size_t size, std::size_t bitOffset, unsigned bits, uint32_t& out) {
        if (bits == 0 || bits > 32) return false;
        if (bitOffset + bits > size * 8) return false;

        uint32_t value = 0;
        std::size_t pos = bitOffset;
        unsigned remaining = bits;
        while (remaining > 0) {
            const std::size_t byteIndex = pos / 8;
            const unsigned bitInByte = static_cast<unsigned>(pos % 8);
            const unsigned available = 8 - bitInByte;
            const unsigned take = remaining < available ? remaining : available;

            const unsigned shift = available - take;
            const uint32_t chunk = (static_cast<uint32_t>(buffer[byteIndex]) >> shift) & ((1u << take) - 1u);
            value = (value << take) | chunk;

            pos += take;
            remaining -= take;
        }
        out = value;
        return true;
    }

    bool BitReader::Read(unsigned bits, uint32_t& out) {
        if (!ReadBits(m_buffer, m_size, m_bitPos, bits, out)) return false;
        m_bitPos += bits;
        return true;
    }

    bool BitReader::Skip(std::size_t bits) {
        if (bits > BitsRemaining()) return false;
        m_bitPos += bits;
        return true;
    }

    void BitWriter::Write(uint32_t value, unsigned bits) {
        for (unsigned i = bits; i > 0; --i) {
            const uint32_t bit = (value >> (i - 1)) & 1u;
            if (m_bitPos % 8 == 0) m_bytes.push_back(0);
            if (bit) {
                m_bytes.back() |= static_cast<uint8_t>(0x80u >> (m_bitPos % 8));
            }
            ++m_bitPos;
        }
    }

} // namespace SimLink::Protocol
