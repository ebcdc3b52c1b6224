// File: Quantization.hpp
#pragma once

#include "BitPacking.hpp"
#include "Types.hpp"

#include <array>
#include <cstdint>
#include <cstddef>

namespace SimLink::Protocol {

    // How one scalar is packed on the wire.
    struct QuantizedFieldSpec {
        uint8_t bits;
        double  min;
        double  max;
        bool    isSigned;
    };

    struct QuantizedVectorSpec {
        std::array<QuantizedFieldSpec, 3> axes;
    };

    enum class QuantizedVectorKind : uint8_t {
        AvatarPosition = 0,
        PrimPosition,
        PrimTersePosition,
        AttachmentPosition,
        AvatarTersePosition,
        Velocity,
        Acceleration,
        AngularVelocity,
        Count
    };

    constexpr double REGION_WIDTH = 256.0;
    constexpr double REGION_MAX_HEIGHT = 4096.0;
    constexpr double PI = 3.14159265358979323846;

    constexpr QuantizedFieldSpec ROTATION_COMPONENT{ 16, -1.0, 1.0, true };
    constexpr double ROTATION_SCALE = 32767.0;

    namespace detail {
        constexpr QuantizedVectorSpec Uniform(QuantizedFieldSpec f) { return { { f, f, f } }; }
        constexpr QuantizedVectorSpec RegionPosition(uint8_t bits) {
            return { { QuantizedFieldSpec{ bits, 0.0, REGION_WIDTH, false },
                       QuantizedFieldSpec{ bits, 0.0, REGION_WIDTH, false },
                       QuantizedFieldSpec{ bits, 0.0, REGION_MAX_HEIGHT, false } } };
        }
    }

    // Indexed by QuantizedVectorKind.
    constexpr std::array<QuantizedVectorSpec, static_cast<std::size_t>(QuantizedVectorKind::Count)> kVectorSpecs{ {
        detail::RegionPosition(16),                                   // AvatarPosition
        detail::RegionPosition(16),                                   // PrimPosition
        detail::RegionPosition(16),                                   // PrimTersePosition
        detail::Uniform({ 8, -10.0, 9.921875, true }),                // AttachmentPosition
        detail::Uniform({ 8, -4.0, 4.0, true }),                      // AvatarTersePosition
        detail::Uniform({ 8, -64.0, 64.0, true }),                    // Velocity
        detail::Uniform({ 8, -64.0, 64.0, true }),                    // Acceleration
        detail::Uniform({ 12, -PI, PI, true }),                       // AngularVelocity
    } };

    constexpr const QuantizedVectorSpec& VectorSpec(QuantizedVectorKind kind) {
        return kVectorSpecs[static_cast<std::size_t>(kind)];
    }

    class Quantization {
    public:
        // min + raw / (2^bits - 1) * (max - min)
        static double Dequantize(uint32_t raw, unsigned bits, double min, double max);

        // Nearest raw value in [0, 2^bits - 1]; input is clamped to [min, max].
        static uint32_t Quantize(double value, unsigned bits, double min, double max);

        // Two's-complement interpretation of the low `bits` bits.
        static int32_t SignExtend(uint32_t raw, unsigned bits);

        // Signed specs scale the sign-extended value s itself: min + s / (2^bits - 1) * (max - min).
        // QuantizeField inverts that, clamping s to [-2^(bits-1), 2^(bits-1) - 1].
        static double DequantizeField(uint32_t raw, const QuantizedFieldSpec& spec);
        static uint32_t QuantizeField(double value, const QuantizedFieldSpec& spec);

        static double StepSize(const QuantizedFieldSpec& spec);

        static bool ReadVector3(BitReader& reader, QuantizedVectorKind kind, Types::Vector3& out);
        static void WriteVector3(BitWriter& writer, QuantizedVectorKind kind, const Types::Vector3& v);

        /**
         * @brief Rebuilds a unit quaternion from its packed X, Y, Z components.
         *
         * Components are signed 16-bit values over 32767. If x²+y²+z² exceeds 1 the vector part is
         * renormalised and W becomes 0; otherwise W = sqrt(1 - x²-y²-z²). The result is normalised.
         */
        static Types::Quaternion UnpackQuaternion(int16_t x, int16_t y, int16_t z);
        static std::array<int16_t, 3> PackQuaternion(const Types::Quaternion& q);

        static bool ReadQuaternion(BitReader& reader, Types::Quaternion& out);
        static void WriteQuaternion(BitWriter& writer, const Types::Quaternion& q);
    };

} // namespace SimLink::Protocol
