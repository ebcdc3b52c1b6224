#include "../../include/core/Messages.hpp"

#include <utility>

namespace {
    using SimLink::Types::Uuid;

    // Append-only little-endian body builder.
    class BodyWriter {
    public:
        BodyWriter& U8(uint8_t v) { m_buf.push_back(v); return *this; }
        BodyWriter& U16(uint16_t v) { Grow(2); SimLink::Protocol::le_write16(Tail(2), v); return *this; }
        BodyWriter& U32(uint32_t v) { Grow(4); SimLink::Protocol::le_write32(Tail(4), v); return *this; }
        BodyWriter& U64(uint64_t v) { Grow(8); SimLink::Protocol::le_write64(Tail(8), v); return *this; }
        BodyWriter& F32(float v) { Grow(4); SimLink::Protocol::le_write_float(Tail(4), v); return *this; }
        BodyWriter& Id(const Uuid& id) { Grow(Uuid::WIRE_SIZE); id.WriteTo(Tail(Uuid::WIRE_SIZE)); return *this; }
        BodyWriter& Vec(const SimLink::Types::Vector3& v) { return F32(v.x).F32(v.y).F32(v.z); }
        BodyWriter& Zeros(std::size_t n) { m_buf.insert(m_buf.end(), n, 0); return *this; }

        std::vector<uint8_t> Take() { return std::move(m_buf); }

    private:
        void Grow(std::size_t n) { m_buf.resize(m_buf.size() + n); }
        uint8_t* Tail(std::size_t n) { return m_buf.data() + m_buf.size() - n; }

        std::vector<uint8_t> m_buf;
    };

    // Bounds-checked little-endian body reader.
    class BodyReader {
    public:
        BodyReader(const uint8_t* data, std::size_t size) : m_data(data), m_size(size) {}

        bool U8(uint8_t& v) { if (!Has(1)) return false; v = m_data[m_pos++]; return true; }
        bool U16(uint16_t& v) { if (!Has(2)) return false; v = SimLink::Protocol::le_read16(m_data + m_pos); m_pos += 2; return true; }
        bool U32(uint32_t& v) { if (!Has(4)) return false; v = SimLink::Protocol::le_read32(m_data + m_pos); m_pos += 4; return true; }
        bool U64(uint64_t& v) { if (!Has(8)) return false; v = SimLink::Protocol::le_read64(m_data + m_pos); m_pos += 8; return true; }
        bool F32(float& v) { if (!Has(4)) return false; v = SimLink::Protocol::le_read_float(m_data + m_pos); m_pos += 4; return true; }
        bool Id(Uuid& id) { if (!Has(Uuid::WIRE_SIZE)) return false; id = Uuid::FromBytes(m_data + m_pos); m_pos += Uuid::WIRE_SIZE; return true; }
        bool Vec(SimLink::Types::Vector3& v) { return F32(v.x) && F32(v.y) && F32(v.z); }
        bool Skip(std::size_t n) { if (!Has(n)) return false; m_pos += n; return true; }
        bool Bytes(std::size_t n, std::string& out) {
            if (!Has(n)) return false;
            out.assign(reinterpret_cast<const char*>(m_data + m_pos), n);
            m_pos += n;
            return true;
        }

        std::size_t Remaining() const { return m_size - m_pos; }

    private:
        bool Has(std::size_t n) const { return m_size - m_pos >= n; }

        const uint8_t* m_data;
        std::size_t    m_size;
        std::size_t    m_pos{ 0 };
    };

    // RegionHandshake blocks after SimName: owner, estate flag, water, billable, cache id,
    // terrain base/detail ids (4 + 4), terrain start heights and ranges (4 + 4 floats).
    constexpr std::size_t TERRAIN_BLOCK_SIZE = 8 * Uuid::WIRE_SIZE + 8 * 4;
}

namespace SimLink::Protocol::Messages {

    std::vector<uint8_t> BuildPacketAck(const std::vector<SequenceNumber>& sequences) {
        BodyWriter w;
        const std::size_t count = sequences.size() > MAX_APPENDED_ACKS ? MAX_APPENDED_ACKS : sequences.size();
        w.U8(static_cast<uint8_t>(count));
        for (std::size_t i = 0; i < count; ++i) {
            w.U32(sequences[i]);
        }
        return w.Take();
    }

    bool TryParsePacketAck(const uint8_t* data, std::size_t size, std::vector<SequenceNumber>& out) {
        BodyReader r(data, size);
        uint8_t count = 0;
        if (!r.U8(count)) return false;
        out.clear();
        out.reserve(count);
        for (uint8_t i = 0; i < count; ++i) {
            uint32_t seq = 0;
            if (!r.U32(seq)) return false;
            out.push_back(seq);
        }
        return true;
    }

    std::vector<uint8_t> BuildStartPingCheck(uint8_t pingId, SequenceNumber oldestUnacked) {
        return BodyWriter().U8(pingId).U32(oldestUnacked).Take();
    }

    bool TryParseStartPingCheck(const uint8_t* data, std::size_t size, uint8_t& pingId, SequenceNumber& oldestUnacked) {
        BodyReader r(data, size);
        return r.U8(pingId) && r.U32(oldestUnacked);
    }

    std::vector<uint8_t> BuildCompletePingCheck(uint8_t pingId) {
        return BodyWriter().U8(pingId).Take();
    }

    bool TryParseCompletePingCheck(const uint8_t* data, std::size_t size, uint8_t& pingId) {
        BodyReader r(data, size);
        return r.U8(pingId);
    }

    std::vector<uint8_t> BuildUseCircuitCode(uint32_t circuitCode, const Types::Uuid& sessionId, const Types::Uuid& agentId) {
        return BodyWriter().U32(circuitCode).Id(sessionId).Id(agentId).Take();
    }

    bool TryParseUseCircuitCode(const uint8_t* data, std::size_t size, UseCircuitCodeInfo& out) {
        BodyReader r(data, size);
        return r.U32(out.circuitCode) && r.Id(out.sessionId) && r.Id(out.agentId);
    }

    std::vector<uint8_t> BuildRegionHandshake(const RegionHandshakeInfo& info) {
        const std::size_t nameLen = info.simName.size() > 0xFF ? 0xFF : info.simName.size();
        BodyWriter w;
        w.U32(info.regionFlags).U8(info.simAccess).U8(static_cast<uint8_t>(nameLen));
        for (std::size_t i = 0; i < nameLen; ++i) {
            w.U8(static_cast<uint8_t>(info.simName[i]));
        }
        w.Id(info.simOwner).U8(info.isEstateManager ? 1 : 0)
            .F32(info.waterHeight).F32(info.billableFactor)
            .Id(info.cacheId).Zeros(TERRAIN_BLOCK_SIZE)
            .Id(info.regionId);
        return w.Take();
    }

    bool TryParseRegionHandshake(const uint8_t* data, std::size_t size, RegionHandshakeInfo& out) {
        BodyReader r(data, size);
        uint8_t nameLen = 0;
        uint8_t estate = 0;
        if (!(r.U32(out.regionFlags) && r.U8(out.simAccess) && r.U8(nameLen) && r.Bytes(nameLen, out.simName))) {
            return false;
        }
        // Names are often sent NUL-terminated.
        while (!out.simName.empty() && out.simName.back() == '\0') {
            out.simName.pop_back();
        }
        if (!(r.Id(out.simOwner) && r.U8(estate) && r.F32(out.waterHeight) && r.F32(out.billableFactor)
            && r.Id(out.cacheId) && r.Skip(TERRAIN_BLOCK_SIZE))) {
            return false;
        }
        out.isEstateManager = estate != 0;
        out.regionId = Types::Uuid();
        if (r.Remaining() >= Types::Uuid::WIRE_SIZE && !r.Id(out.regionId)) {
            return false;
        }
        return true;
    }

    std::vector<uint8_t> BuildRegionHandshakeReply(const Types::Uuid& agentId, const Types::Uuid& sessionId, uint32_t flags) {
        return BodyWriter().Id(agentId).Id(sessionId).U32(flags).Take();
    }

    std::vector<uint8_t> BuildCompleteAgentMovement(const Types::Uuid& agentId, const Types::Uuid& sessionId,
        uint32_t circuitCode)
    {
        return BodyWriter().Id(agentId).Id(sessionId).U32(circuitCode).Take();
    }

    std::vector<uint8_t> BuildAgentMovementComplete(const AgentMovementCompleteInfo& info) {
        return BodyWriter().Id(info.agentId).Id(info.sessionId)
            .Vec(info.position).Vec(info.lookAt).U64(info.regionHandle).U32(info.timestamp)
            .U16(0)  // empty channel version
            .Take();
    }

    bool TryParseAgentMovementComplete(const uint8_t* data, std::size_t size, AgentMovementCompleteInfo& out) {
        BodyReader r(data, size);
        return r.Id(out.agentId) && r.Id(out.sessionId)
            && r.Vec(out.position) && r.Vec(out.lookAt)
            && r.U64(out.regionHandle) && r.U32(out.timestamp);
    }

    std::vector<uint8_t> BuildAgentThrottle(const Types::Uuid& agentId, const Types::Uuid& sessionId,
        uint32_t circuitCode, uint32_t genCounter, const ThrottleRates& rates)
    {
        BodyWriter w;
        w.Id(agentId).Id(sessionId).U32(circuitCode).U32(genCounter)
            .U8(static_cast<uint8_t>(THROTTLE_CATEGORIES * 4));
        for (float rate : rates) {
            w.F32(rate);
        }
        return w.Take();
    }

    std::vector<uint8_t> BuildLogoutRequest(const Types::Uuid& agentId, const Types::Uuid& sessionId) {
        return BodyWriter().Id(agentId).Id(sessionId).Take();
    }

} // namespace SimLink::Protocol::Messages
