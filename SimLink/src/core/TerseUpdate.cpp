// File: TerseUpdate.cpp
#include "../../include/core/TerseUpdate.hpp"
#include "../../include/core/protocols.hpp"

namespace SimLink::Protocol {

    namespace {
        constexpr std::size_t UPDATE_HEADER_SIZE = 8 + 2 + 1;
        constexpr std::size_t OBJECT_HEADER_SIZE = 4 + 1 + 1;

        bool ReadOptionalVector(BitReader& reader, bool present, QuantizedVectorKind kind,
            std::optional<Types::Vector3>& out)
        {
            if (!present) return true;
            Types::Vector3 v;
            if (!Quantization::ReadVector3(reader, kind, v)) return false;
            out = v;
            return true;
        }

        bool ReadRotation(BitReader& reader, std::optional<Types::Quaternion>& out) {
            Types::Quaternion q;
            if (!Quantization::ReadQuaternion(reader, q)) return false;
            out = q;
            return true;
        }

        QuantizedVectorKind PositionKind(const TerseObjectUpdate& u) {
            if (u.isAttachment) return QuantizedVectorKind::AttachmentPosition;
            return u.kind == TerseUpdateKind::Avatar ? QuantizedVectorKind::AvatarPosition
                                                     : QuantizedVectorKind::PrimPosition;
        }
    }

    bool TerseUpdateCodec::DecodeObjectData(const uint8_t* data, std::size_t size, TerseObjectUpdate& inOut) {
        BitReader reader(data, size);

        switch (inOut.kind) {
        case TerseUpdateKind::Avatar:
        case TerseUpdateKind::Prim: {
            uint32_t flags = 0;
            if (!reader.Read(8, flags)) return false;
            inOut.isAttachment = (flags & TERSE_IS_ATTACHMENT) != 0;

            if (flags & TERSE_HAS_PARENT) {
                // Byte-aligned little-endian, straight after the flags byte.
                uint32_t parent = 0;
                for (unsigned shift = 0; shift < 32; shift += 8) {
                    uint32_t byte = 0;
                    if (!reader.Read(8, byte)) return false;
                    parent |= byte << shift;
                }
                inOut.parentId = parent;
            }
            if (!ReadOptionalVector(reader, flags & TERSE_HAS_POSITION, PositionKind(inOut), inOut.position)) return false;
            if (!ReadOptionalVector(reader, flags & TERSE_HAS_VELOCITY, QuantizedVectorKind::Velocity, inOut.velocity)) return false;
            if (!ReadOptionalVector(reader, flags & TERSE_HAS_ACCELERATION, QuantizedVectorKind::Acceleration, inOut.acceleration)) return false;
            if ((flags & TERSE_HAS_ROTATION) && !ReadRotation(reader, inOut.rotation)) return false;
            return ReadOptionalVector(reader, flags & TERSE_HAS_ANGULAR_VELOCITY,
                QuantizedVectorKind::AngularVelocity, inOut.angularVelocity);
        }
        case TerseUpdateKind::AvatarTerse:
            return ReadOptionalVector(reader, true, QuantizedVectorKind::AvatarTersePosition, inOut.position)
                && ReadRotation(reader, inOut.rotation);
        case TerseUpdateKind::PrimTerse:
            return ReadOptionalVector(reader, true, QuantizedVectorKind::PrimTersePosition, inOut.position)
                && ReadRotation(reader, inOut.rotation);
        }
        return false;
    }

    std::vector<uint8_t> TerseUpdateCodec::EncodeObjectData(const TerseObjectUpdate& u) {
        BitWriter writer;
        const Types::Vector3 zero{};
        const Types::Quaternion identity{};

        switch (u.kind) {
        case TerseUpdateKind::Avatar:
        case TerseUpdateKind::Prim: {
            uint8_t flags = 0;
            if (u.position) flags |= TERSE_HAS_POSITION;
            if (u.velocity) flags |= TERSE_HAS_VELOCITY;
            if (u.acceleration) flags |= TERSE_HAS_ACCELERATION;
            if (u.rotation) flags |= TERSE_HAS_ROTATION;
            if (u.parentId) flags |= TERSE_HAS_PARENT;
            if (u.angularVelocity) flags |= TERSE_HAS_ANGULAR_VELOCITY;
            if (u.isAttachment) flags |= TERSE_IS_ATTACHMENT;
            writer.Write(flags, 8);

            if (u.parentId) {
                for (unsigned shift = 0; shift < 32; shift += 8) writer.Write((*u.parentId >> shift) & 0xFFu, 8);
            }
            if (u.position) Quantization::WriteVector3(writer, PositionKind(u), *u.position);
            if (u.velocity) Quantization::WriteVector3(writer, QuantizedVectorKind::Velocity, *u.velocity);
            if (u.acceleration) Quantization::WriteVector3(writer, QuantizedVectorKind::Acceleration, *u.acceleration);
            if (u.rotation) Quantization::WriteQuaternion(writer, *u.rotation);
            if (u.angularVelocity) Quantization::WriteVector3(writer, QuantizedVectorKind::AngularVelocity, *u.angularVelocity);
            break;
        }
        case TerseUpdateKind::AvatarTerse:
            Quantization::WriteVector3(writer, QuantizedVectorKind::AvatarTersePosition, u.position.value_or(zero));
            Quantization::WriteQuaternion(writer, u.rotation.value_or(identity));
            break;
        case TerseUpdateKind::PrimTerse:
            Quantization::WriteVector3(writer, QuantizedVectorKind::PrimTersePosition, u.position.value_or(zero));
            Quantization::WriteQuaternion(writer, u.rotation.value_or(identity));
            break;
        }
        return writer.Bytes();
    }

    bool TerseUpdateCodec::Decode(const uint8_t* body, std::size_t size, ImprovedTerseObjectUpdate& out) {
        out = ImprovedTerseObjectUpdate{};
        if (size < UPDATE_HEADER_SIZE) return false;

        out.regionHandle = le_read64(body);
        out.timeDilation = le_read16(body + 8);
        const std::size_t count = body[10];

        std::size_t pos = UPDATE_HEADER_SIZE;
        out.objects.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            if (size - pos < OBJECT_HEADER_SIZE) return false;

            TerseObjectUpdate obj;
            obj.localId = le_read32(body + pos);
            const uint8_t kind = body[pos + 4];
            const std::size_t dataLen = body[pos + 5];
            pos += OBJECT_HEADER_SIZE;

            if (kind > static_cast<uint8_t>(TerseUpdateKind::PrimTerse)) return false;
            if (size - pos < dataLen) return false;
            obj.kind = static_cast<TerseUpdateKind>(kind);

            if (!DecodeObjectData(body + pos, dataLen, obj)) return false;
            pos += dataLen;
            out.objects.push_back(std::move(obj));
        }
        return true;
    }

    bool TerseUpdateCodec::Encode(const ImprovedTerseObjectUpdate& update, std::vector<uint8_t>& out) {
        if (update.objects.size() > 0xFF) return false;

        out.assign(UPDATE_HEADER_SIZE, 0);
        le_write64(out.data(), update.regionHandle);
        le_write16(out.data() + 8, update.timeDilation);
        out[10] = static_cast<uint8_t>(update.objects.size());

        for (const auto& obj : update.objects) {
            const std::vector<uint8_t> data = EncodeObjectData(obj);
            if (data.size() > 0xFF) return false;

            const std::size_t base = out.size();
            out.resize(base + OBJECT_HEADER_SIZE);
            le_write32(out.data() + base, obj.localId);
            out[base + 4] = static_cast<uint8_t>(obj.kind);
            out[base + 5] = static_cast<uint8_t>(data.size());
            out.insert(out.end(), data.begin(), data.end());
        }
        return true;
    }

} // namespace SimLink::Protocol
