// File: Types.cpp
#include "../../include/core/Types.hpp"
#include "../../include/core/Logger.hpp"

#include <sodium.h>

#include <cstring>
#include <stdexcept>

namespace SimLink::Types {

    namespace {
        int HexValue(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    }

    Uuid Uuid::Random() {
        if (sodium_init() < 0) {
            SL_NETWORK_CRITICAL("libsodium initialisation failed");
            throw std::runtime_error("sodium_init failed");
        }

        std::array<uint8_t, WIRE_SIZE> bytes{};
        randombytes_buf(bytes.data(), bytes.size());
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
        return Uuid(bytes);
    }

    bool Uuid::Parse(const std::string& text, Uuid& out) {
        if (text.size() != 36) return false;

        std::array<uint8_t, WIRE_SIZE> bytes{};
        std::size_t byteIndex = 0;
        for (std::size_t i = 0; i < text.size();) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (text[i] != '-') return false;
                ++i;
                continue;
            }
            const int hi = HexValue(text[i]);
            const int lo = HexValue(text[i + 1]);
            if (hi < 0 || lo < 0) return false;
            bytes[byteIndex++] = static_cast<uint8_t>((hi << 4) | lo);
            i += 2;
        }
        out = Uuid(bytes);
        return true;
    }

    Uuid Uuid::FromBytes(const uint8_t* p) {
        std::array<uint8_t, WIRE_SIZE> bytes{};
        std::memcpy(bytes.data(), p, WIRE_SIZE);
        return Uuid(bytes);
    }

    void Uuid::WriteTo(uint8_t* p) const {
        std::memcpy(p, m_bytes.data(), WIRE_SIZE);
    }

    std::string Uuid::ToString() const {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string s;
        s.reserve(36);
        for (std::size_t i = 0; i < WIRE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) s.push_back('-');
            s.push_back(kHex[m_bytes[i] >> 4]);
            s.push_back(kHex[m_bytes[i] & 0x0F]);
        }
        return s;
    }

    bool Uuid::IsZero() const {
        for (uint8_t b : m_bytes) {
            if (b != 0) return false;
        }
        return true;
    }

} // namespace SimLink::Types
