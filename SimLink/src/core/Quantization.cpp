// File: Quantization.cpp
#include "../../include/core/Quantization.hpp"

#include <algorithm>
#include <cmath>

namespace SimLink::Protocol {

    namespace {
        double MaxRaw(unsigned bits) {
            return std::ldexp(1.0, static_cast<int>(bits)) - 1.0;
        }

        uint32_t SignedOffset(unsigned bits) {
            return 1u << (bits - 1);
        }

        uint32_t Mask(unsigned bits) {
            return bits >= 32 ? 0xFFFFFFFFu : ((1u << bits) - 1u);
        }

        int16_t ToComponent(float v) {
            const double clamped = std::clamp(static_cast<double>(v), -1.0, 1.0);
            return static_cast<int16_t>(std::lround(clamped * ROTATION_SCALE));
        }
    }

    double Quantization::Dequantize(uint32_t raw, unsigned bits, double min, double max) {
        return min + (static_cast<double>(raw) / MaxRaw(bits)) * (max - min);
    }

    uint32_t Quantization::Quantize(double value, unsigned bits, double min, double max) {
        if (max <= min) return 0;
        const double clamped = std::clamp(value, min, max);
        const double scaled = (clamped - min) / (max - min) * MaxRaw(bits);
        const double rounded = std::floor(scaled + 0.5);
        return static_cast<uint32_t>(std::min(rounded, MaxRaw(bits)));
    }

    int32_t Quantization::SignExtend(uint32_t raw, unsigned bits) {
        if (bits >= 32) return static_cast<int32_t>(raw);
        raw &= Mask(bits);
        if (raw & SignedOffset(bits)) {
            return static_cast<int32_t>(static_cast<int64_t>(raw) - (int64_t(1) << bits));
        }
        return static_cast<int32_t>(raw);
    }

    double Quantization::DequantizeField(uint32_t raw, const QuantizedFieldSpec& spec) {
        if (!spec.isSigned) {
            return Dequantize(raw, spec.bits, spec.min, spec.max);
        }
        // The two's-complement value scales directly, so s = 0 lands on min.
        const int32_t s = SignExtend(raw, spec.bits);
        return spec.min + (static_cast<double>(s) / MaxRaw(spec.bits)) * (spec.max - spec.min);
    }

    uint32_t Quantization::QuantizeField(double value, const QuantizedFieldSpec& spec) {
        if (!spec.isSigned) {
            return Quantize(value, spec.bits, spec.min, spec.max);
        }
        if (spec.max <= spec.min) return 0;
        const double lowest = -static_cast<double>(SignedOffset(spec.bits));
        const double highest = static_cast<double>(SignedOffset(spec.bits)) - 1.0;
        const double scaled = (value - spec.min) / (spec.max - spec.min) * MaxRaw(spec.bits);
        const double s = std::clamp(std::floor(scaled + 0.5), lowest, highest);
        return static_cast<uint32_t>(static_cast<int64_t>(s)) & Mask(spec.bits);
    }

    double Quantization::StepSize(const QuantizedFieldSpec& spec) {
        return (spec.max - spec.min) / MaxRaw(spec.bits);
    }

    bool Quantization::ReadVector3(BitReader& reader, QuantizedVectorKind kind, Types::Vector3& out) {
        const QuantizedVectorSpec& spec = VectorSpec(kind);
        std::array<double, 3> v{};
        for (std::size_t i = 0; i < 3; ++i) {
            uint32_t raw = 0;
            if (!reader.Read(spec.axes[i].bits, raw)) return false;
            v[i] = DequantizeField(raw, spec.axes[i]);
        }
        out = Types::Vector3{ static_cast<float>(v[0]), static_cast<float>(v[1]), static_cast<float>(v[2]) };
        return true;
    }

    void Quantization::WriteVector3(BitWriter& writer, QuantizedVectorKind kind, const Types::Vector3& v) {
        const QuantizedVectorSpec& spec = VectorSpec(kind);
        const std::array<double, 3> comps{ v.x, v.y, v.z };
        for (std::size_t i = 0; i < 3; ++i) {
            writer.Write(QuantizeField(comps[i], spec.axes[i]), spec.axes[i].bits);
        }
    }

    Types::Quaternion Quantization::UnpackQuaternion(int16_t x, int16_t y, int16_t z) {
        double qx = x / ROTATION_SCALE;
        double qy = y / ROTATION_SCALE;
        double qz = z / ROTATION_SCALE;

        double w = 0.0;
        const double sum = qx * qx + qy * qy + qz * qz;
        if (sum > 1.0) {
            const double len = std::sqrt(sum);
            qx /= len;
            qy /= len;
            qz /= len;
        }
        else {
            w = std::sqrt(std::max(0.0, 1.0 - sum));
        }

        Types::Quaternion q{ static_cast<float>(qx), static_cast<float>(qy),
                             static_cast<float>(qz), static_cast<float>(w) };
        return q.Normalized();
    }

    std::array<int16_t, 3> Quantization::PackQuaternion(const Types::Quaternion& q) {
        Types::Quaternion n = q.Normalized();
        // W is rebuilt as non-negative; q and -q are the same rotation.
        if (n.w < 0.0f) {
            n = Types::Quaternion{ -n.x, -n.y, -n.z, -n.w };
        }
        return { ToComponent(n.x), ToComponent(n.y), ToComponent(n.z) };
    }

    bool Quantization::ReadQuaternion(BitReader& reader, Types::Quaternion& out) {
        std::array<int16_t, 3> comps{};
        for (auto& c : comps) {
            uint32_t raw = 0;
            if (!reader.Read(ROTATION_COMPONENT.bits, raw)) return false;
            c = static_cast<int16_t>(SignExtend(raw, ROTATION_COMPONENT.bits));
        }
        out = UnpackQuaternion(comps[0], comps[1], comps[2]);
        return true;
    }

    void Quantization::WriteQuaternion(BitWriter& writer, const Types::Quaternion& q) {
        for (int16_t c : PackQuaternion(q)) {
            writer.Write(static_cast<uint16_t>(c), ROTATION_COMPONENT.bits);
        }
    }

} // namespace SimLink::Protocol
