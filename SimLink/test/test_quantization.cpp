#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <vector>

#include "../include/core/BitPacking.hpp"
#include "../include/core/Quantization.hpp"

using namespace SimLink::Protocol;
using SimLink::Types::Quaternion;
using SimLink::Types::Vector3;

// ---------- Bit packing ----------

TEST(BitPacking, ReadsMsbFirstAcrossBytes) {
    const uint8_t buf[] = { 0b10110011, 0b01010101 };
    uint32_t v = 0;
    ASSERT_TRUE(ReadBits(buf, sizeof(buf), 0, 3, v));
    EXPECT_EQ(v, 0b101u);
    ASSERT_TRUE(ReadBits(buf, sizeof(buf), 3, 7, v));
    EXPECT_EQ(v, 0b1001101u);
    ASSERT_TRUE(ReadBits(buf, sizeof(buf), 0, 16, v));
    EXPECT_EQ(v, 0xB355u);
}

TEST(BitPacking, RefusesOutOfRange) {
    const uint8_t buf[] = { 0xFF, 0xFF };
    uint32_t v = 123;
    EXPECT_FALSE(ReadBits(buf, sizeof(buf), 10, 7, v));
    EXPECT_FALSE(ReadBits(buf, sizeof(buf), 0, 0, v));
    EXPECT_FALSE(ReadBits(buf, sizeof(buf), 0, 33, v));
    EXPECT_EQ(v, 123u);
}

TEST(BitPacking, WriterFeedsReader) {
    BitWriter w;
    w.Write(0b101, 3);
    w.Write(0xABC, 12);
    w.Write(0xDEADBEEF, 32);
    w.Write(1, 1);
    EXPECT_EQ(w.BitCount(), 48u);
    ASSERT_EQ(w.Bytes().size(), 6u);

    BitReader r(w.Bytes().data(), w.Bytes().size());
    uint32_t v = 0;
    ASSERT_TRUE(r.Read(3, v));  EXPECT_EQ(v, 0b101u);
    ASSERT_TRUE(r.Read(12, v)); EXPECT_EQ(v, 0xABCu);
    ASSERT_TRUE(r.Read(32, v)); EXPECT_EQ(v, 0xDEADBEEFu);
    ASSERT_TRUE(r.Read(1, v));  EXPECT_EQ(v, 1u);
    EXPECT_EQ(r.BitsRemaining(), 0u);
    EXPECT_FALSE(r.Read(1, v));
}

// ---------- Scalar quantization ----------

TEST(Quantization, DequantizeEndpoints) {
    EXPECT_DOUBLE_EQ(Quantization::Dequantize(0, 16, 0.0, 256.0), 0.0);
    EXPECT_DOUBLE_EQ(Quantization::Dequantize(0xFFFF, 16, 0.0, 256.0), 256.0);
    EXPECT_DOUBLE_EQ(Quantization::Dequantize(0, 8, -64.0, 64.0), -64.0);
    EXPECT_DOUBLE_EQ(Quantization::Dequantize(255, 8, -64.0, 64.0), 64.0);
}

TEST(Quantization, RawSurvivesEveryWidth) {
    for (unsigned bits = 1; bits <= 32; ++bits) {
        const uint32_t maxRaw = bits == 32 ? 0xFFFFFFFFu : ((1u << bits) - 1u);
        for (uint32_t raw : { 0u, maxRaw / 3u, maxRaw / 2u, maxRaw }) {
            const double value = Quantization::Dequantize(raw, bits, -10.0, 30.0);
            EXPECT_EQ(Quantization::Quantize(value, bits, -10.0, 30.0), raw) << "bits=" << bits;
        }
    }
}

TEST(Quantization, QuantizeClampsAndRounds) {
    EXPECT_EQ(Quantization::Quantize(-5.0, 8, 0.0, 255.0), 0u);
    EXPECT_EQ(Quantization::Quantize(999.0, 8, 0.0, 255.0), 255u);
    EXPECT_EQ(Quantization::Quantize(10.4, 8, 0.0, 255.0), 10u);
    EXPECT_EQ(Quantization::Quantize(10.6, 8, 0.0, 255.0), 11u);
}

TEST(Quantization, SignExtend) {
    EXPECT_EQ(Quantization::SignExtend(0xFF, 8), -1);
    EXPECT_EQ(Quantization::SignExtend(0x80, 8), -128);
    EXPECT_EQ(Quantization::SignExtend(0x7F, 8), 127);
    EXPECT_EQ(Quantization::SignExtend(0x800, 12), -2048);
    EXPECT_EQ(Quantization::SignExtend(0x7FFF, 16), 32767);
}

TEST(Quantization, SignedFieldsScaleTheSignExtendedValue) {
    const QuantizedFieldSpec velocity = VectorSpec(QuantizedVectorKind::Velocity).axes[0];
    EXPECT_DOUBLE_EQ(Quantization::DequantizeField(0x00, velocity), -64.0);                         // s = 0
    EXPECT_NEAR(Quantization::DequantizeField(0x7F, velocity), -64.0 + 127.0 / 255.0 * 128.0, 1e-9); // s = 127
    EXPECT_NEAR(Quantization::DequantizeField(0xFF, velocity), -64.0 - 128.0 / 255.0, 1e-9);         // s = -1
    EXPECT_NEAR(Quantization::DequantizeField(0x80, velocity), -64.0 - 128.0 * 128.0 / 255.0, 1e-9); // s = -128

    EXPECT_NEAR(Quantization::DequantizeField(0x7F, velocity), -0.250980, 1e-6);
    EXPECT_NEAR(Quantization::DequantizeField(0xFF, velocity), -64.501961, 1e-6);

    EXPECT_EQ(Quantization::QuantizeField(-64.0, velocity), 0x00u);
    EXPECT_EQ(Quantization::QuantizeField(-0.25098, velocity), 0x7Fu);
    EXPECT_EQ(Quantization::QuantizeField(-64.501961, velocity), 0xFFu);
}

TEST(Quantization, SignedQuantizeInvertsDequantize) {
    for (QuantizedVectorKind kind : { QuantizedVectorKind::Velocity, QuantizedVectorKind::AttachmentPosition,
                                      QuantizedVectorKind::AvatarTersePosition, QuantizedVectorKind::AngularVelocity }) {
        const QuantizedFieldSpec spec = VectorSpec(kind).axes[0];
        ASSERT_TRUE(spec.isSigned);
        const uint32_t count = 1u << spec.bits;
        for (uint32_t raw = 0; raw < count; ++raw) {
            const double value = Quantization::DequantizeField(raw, spec);
            EXPECT_EQ(Quantization::QuantizeField(value, spec), raw) << "bits=" << spec.bits << " raw=" << raw;
        }
    }
}

TEST(Quantization, SignedQuantizeSaturates) {
    const QuantizedFieldSpec velocity = VectorSpec(QuantizedVectorKind::Velocity).axes[0];
    EXPECT_EQ(Quantization::QuantizeField(50.0, velocity), 0x7Fu);
    EXPECT_EQ(Quantization::QuantizeField(-1000.0, velocity), 0x80u);
}

TEST(Quantization, VectorTables) {
    const QuantizedVectorSpec& pos = VectorSpec(QuantizedVectorKind::AvatarPosition);
    EXPECT_EQ(pos.axes[0].bits, 16);
    EXPECT_DOUBLE_EQ(pos.axes[1].max, 256.0);
    EXPECT_DOUBLE_EQ(pos.axes[2].max, 4096.0);
    EXPECT_FALSE(pos.axes[2].isSigned);

    const QuantizedVectorSpec& angular = VectorSpec(QuantizedVectorKind::AngularVelocity);
    EXPECT_EQ(angular.axes[0].bits, 12);
    EXPECT_TRUE(angular.axes[0].isSigned);
    EXPECT_NEAR(angular.axes[0].max, 3.14159265, 1e-8);
}

TEST(Quantization, Vector3WithinOneStep) {
    const Vector3 in{ 128.3f, 17.9f, 2000.5f };
    BitWriter w;
    Quantization::WriteVector3(w, QuantizedVectorKind::PrimPosition, in);
    EXPECT_EQ(w.BitCount(), 48u);

    BitReader r(w.Bytes().data(), w.Bytes().size());
    Vector3 out;
    ASSERT_TRUE(Quantization::ReadVector3(r, QuantizedVectorKind::PrimPosition, out));
    const QuantizedVectorSpec& spec = VectorSpec(QuantizedVectorKind::PrimPosition);
    EXPECT_NEAR(out.x, in.x, Quantization::StepSize(spec.axes[0]));
    EXPECT_NEAR(out.y, in.y, Quantization::StepSize(spec.axes[1]));
    EXPECT_NEAR(out.z, in.z, Quantization::StepSize(spec.axes[2]));
}

TEST(Quantization, ReadVector3FailsOnShortInput) {
    const uint8_t buf[] = { 0x01, 0x02, 0x03 };
    BitReader r(buf, sizeof(buf));
    Vector3 out;
    EXPECT_TRUE(Quantization::ReadVector3(r, QuantizedVectorKind::Velocity, out));
    EXPECT_FALSE(Quantization::ReadVector3(r, QuantizedVectorKind::Velocity, out));
}

// ---------- Quaternions ----------

TEST(Quaternion, RebuildsW) {
    const Quaternion q = Quantization::UnpackQuaternion(16384, 16384, 0);
    EXPECT_NEAR(q.x, 0.5f, 1e-3f);
    EXPECT_NEAR(q.y, 0.5f, 1e-3f);
    EXPECT_NEAR(q.z, 0.0f, 1e-6f);
    EXPECT_NEAR(q.w, 0.70710678f, 1e-3f);
    EXPECT_NEAR(q.Length(), 1.0f, 1e-5f);
}

TEST(Quaternion, RenormalizesOversizedVectorPart) {
    const Quaternion q = Quantization::UnpackQuaternion(32767, 32767, 0);
    EXPECT_NEAR(q.x, 0.70710678f, 1e-5f);
    EXPECT_NEAR(q.y, 0.70710678f, 1e-5f);
    EXPECT_FLOAT_EQ(q.w, 0.0f);
    EXPECT_NEAR(q.Length(), 1.0f, 1e-5f);
}

TEST(Quaternion, PackFlipsNegativeW) {
    const Quaternion negW{ 0.0f, 0.0f, 0.6f, -0.8f };
    const auto packed = Quantization::PackQuaternion(negW);
    EXPECT_EQ(packed[2], static_cast<int16_t>(std::lround(-0.6 * 32767.0)));

    const Quaternion back = Quantization::UnpackQuaternion(packed[0], packed[1], packed[2]);
    EXPECT_NEAR(back.z, -0.6f, 1e-4f);
    EXPECT_NEAR(back.w, 0.8f, 1e-4f);
}

TEST(Quaternion, BitStreamKeepsRotation) {
    const Quaternion in = Quaternion{ 0.1f, -0.3f, 0.2f, 0.9f }.Normalized();
    BitWriter w;
    Quantization::WriteQuaternion(w, in);
    EXPECT_EQ(w.BitCount(), 48u);

    BitReader r(w.Bytes().data(), w.Bytes().size());
    Quaternion out;
    ASSERT_TRUE(Quantization::ReadQuaternion(r, out));
    EXPECT_NEAR(out.x, in.x, 1e-4f);
    EXPECT_NEAR(out.y, in.y, 1e-4f);
    EXPECT_NEAR(out.z, in.z, 1e-4f);
    EXPECT_NEAR(out.w, in.w, 1e-4f);
}
