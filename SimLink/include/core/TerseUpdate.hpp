// File: TerseUpdate.hpp
#pragma once

#include "Quantization.hpp"
#include "Types.hpp"

#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

namespace SimLink::Protocol {

    enum class TerseUpdateKind : uint8_t {
        Avatar = 0,
        Prim = 1,
        AvatarTerse = 2,
        PrimTerse = 3
    };

    // Presence bits of the flags byte carried by Avatar and Prim updates.
    constexpr uint8_t TERSE_HAS_POSITION = 0x01;
    constexpr uint8_t TERSE_HAS_VELOCITY = 0x02;
    constexpr uint8_t TERSE_HAS_ACCELERATION = 0x04;
    constexpr uint8_t TERSE_HAS_ROTATION = 0x08;
    constexpr uint8_t TERSE_HAS_PARENT = 0x10;
    constexpr uint8_t TERSE_HAS_ANGULAR_VELOCITY = 0x20;
    constexpr uint8_t TERSE_IS_ATTACHMENT = 0x40;

    struct TerseObjectUpdate {
        uint32_t        localId{ 0 };
        TerseUpdateKind kind{ TerseUpdateKind::Prim };
        bool            isAttachment{ false };

        std::optional<Types::Vector3>    position;
        std::optional<Types::Vector3>    velocity;
        std::optional<Types::Vector3>    acceleration;
        std::optional<Types::Quaternion> rotation;
        std::optional<uint32_t>          parentId;
        std::optional<Types::Vector3>    angularVelocity;
    };

    struct ImprovedTerseObjectUpdate {
        uint64_t                       regionHandle{ 0 };
        uint16_t                       timeDilation{ 0 };
        std::vector<TerseObjectUpdate> objects;
    };

    /**
     * @class TerseUpdateCodec
     * @brief Bit-packed object motion carried by ImprovedTerseObjectUpdate.
     *
     * Body: [regionHandle u64][timeDilation u16][count u8] then per object
     * [localId u32][kind u8][dataLen u8][bit-packed data]. Integers are little-endian.
     *
     * Avatar/Prim data: flags byte, parent id (u32 LE), position, velocity, acceleration,
     * rotation, angular velocity, each present only when its flag is set.
     * AvatarTerse/PrimTerse data: position then rotation, always both.
     */
    class TerseUpdateCodec {
    public:
        static bool Decode(const uint8_t* body, std::size_t size, ImprovedTerseObjectUpdate& out);
        static bool Encode(const ImprovedTerseObjectUpdate& update, std::vector<uint8_t>& out);

        static bool DecodeObjectData(const uint8_t* data, std::size_t size, TerseObjectUpdate& inOut);
        static std::vector<uint8_t> EncodeObjectData(const TerseObjectUpdate& update);
    };

} // namespace SimLink::Protocol
