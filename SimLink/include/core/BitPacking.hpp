// File: BitPacking.hpp
#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace SimLink::Protocol {

    /**
     * @brief Reads `bits` bits (1..32), most significant bit first, starting `bitOffset` bits into `buffer`.
     * @return False if the field runs past `size` bytes or `bits` is out of range. `out` is untouched then.
     */
    bool ReadBits(const uint8_t* buffer, std::size_t size, std::size_t bitOffset, unsigned bits, uint32_t& out);

    // Sequential MSB-first reader over a borrowed buffer.
    class BitReader {
    public:
        BitReader(const uint8_t* buffer, std::size_t size) : m_buffer(buffer), m_size(size) {}

        bool Read(unsigned bits, uint32_t& out);
        bool Skip(std::size_t bits);

        std::size_t BitPosition() const { return m_bitPos; }
        std::size_t BitsRemaining() const { return m_size * 8 - m_bitPos; }

    private:
        const uint8_t* m_buffer;
        std::size_t    m_size;
        std::size_t    m_bitPos{ 0 };
    };

    // MSB-first writer; the last byte is zero-padded.
    class BitWriter {
    public:
        void Write(uint32_t value, unsigned bits);

        std::size_t BitCount() const { return m_bitPos; }
        const std::vector<uint8_t>& Bytes() const { return m_bytes; }

    private:
        std::vector<uint8_t> m_bytes;
        std::size_t          m_bitPos{ 0 };
    };

} // namespace SimLink::Protocol
