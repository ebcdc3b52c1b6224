// File: Types.hpp
#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

namespace SimLink::Types {

    struct Vector3 {
        float x{ 0.0f };
        float y{ 0.0f };
        float z{ 0.0f };

        bool operator==(const Vector3&) const = default;
    };

    struct Quaternion {
        float x{ 0.0f };
        float y{ 0.0f };
        float z{ 0.0f };
        float w{ 1.0f };

        float Length() const {
            return std::sqrt(x * x + y * y + z * z + w * w);
        }

        // Zero-length input yields identity.
        Quaternion Normalized() const {
            const float len = Length();
            if (len <= 0.0f) return Quaternion{};
            return Quaternion{ x / len, y / len, z / len, w / len };
        }
    };

    // 128-bit identifier; travels as 16 raw bytes.
    class Uuid {
    public:
        static constexpr std::size_t WIRE_SIZE = 16;

        Uuid() { m_bytes.fill(0); }
        explicit Uuid(const std::array<uint8_t, WIRE_SIZE>& bytes) : m_bytes(bytes) {}

        // Random version 4 UUID. Requires libsodium to initialise.
        static Uuid Random();

        // Accepts the 36-character hyphenated form.
        static bool Parse(const std::string& text, Uuid& out);

        static Uuid FromBytes(const uint8_t* p);
        void WriteTo(uint8_t* p) const;

        std::string ToString() const;
        bool IsZero() const;

        const std::array<uint8_t, WIRE_SIZE>& Bytes() const { return m_bytes; }

        bool operator==(const Uuid&) const = default;

    private:
        std::array<uint8_t, WIRE_SIZE> m_bytes;
    };

} // namespace SimLink::Types
