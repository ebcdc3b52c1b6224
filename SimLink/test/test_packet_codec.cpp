#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "../include/core/MessageTypes.hpp"
#include "../include/core/Messages.hpp"
#include "../include/core/PacketCodec.hpp"
#include "../include/core/protocols.hpp"

using namespace SimLink::Protocol;

// ---------- Header ----------

TEST(PacketHeader, SerializeParse) {
    PacketHeader h;
    h.flags = FLAG_RELIABLE | FLAG_RESENT;
    h.sequence = 0x01020304;
    h.extra = { 0xAB, 0xCD };

    std::vector<uint8_t> wire;
    ASSERT_TRUE(serialize_header(h, wire));
    EXPECT_EQ(wire, (std::vector<uint8_t>{ 0x60, 0x01, 0x02, 0x03, 0x04, 0x02, 0xAB, 0xCD }));

    auto [parsed, err] = parse_header(wire.data(), wire.size());
    EXPECT_EQ(err, ParseError::None);
    EXPECT_EQ(parsed, h);
    EXPECT_TRUE(parsed.IsReliable());
    EXPECT_TRUE(parsed.IsResent());
    EXPECT_FALSE(parsed.HasAppendedAcks());
}

TEST(PacketHeader, RejectsTruncation) {
    const std::vector<uint8_t> shortWire{ 0x40, 0, 0, 0, 1 };
    EXPECT_EQ(parse_header(shortWire.data(), shortWire.size()).second, ParseError::TooShort);

    const std::vector<uint8_t> extraCut{ 0x40, 0, 0, 0, 1, 3, 0xAA };
    EXPECT_EQ(parse_header(extraCut.data(), extraCut.size()).second, ParseError::ExtraTruncated);
}

// ---------- Message identifiers ----------

TEST(MessageTable, IdentifierWidths) {
    std::vector<uint8_t> id;
    ASSERT_TRUE(MessageTable::WriteId(MessageType::StartPingCheck, id));
    EXPECT_EQ(id, (std::vector<uint8_t>{ 0x01 }));

    id.clear();
    ASSERT_TRUE(MessageTable::WriteId(MessageType::CoarseLocationUpdate, id));
    EXPECT_EQ(id, (std::vector<uint8_t>{ 0xFF, 0x06 }));

    id.clear();
    ASSERT_TRUE(MessageTable::WriteId(MessageType::RegionHandshake, id));
    EXPECT_EQ(id, (std::vector<uint8_t>{ 0xFF, 0xFF, 0x00, 148 }));

    id.clear();
    ASSERT_TRUE(MessageTable::WriteId(MessageType::PacketAck, id));
    EXPECT_EQ(id, (std::vector<uint8_t>{ 0xFF, 0xFF, 0xFF, 0xFB }));
}

TEST(MessageTable, ReadIdClassifiesFrequency) {
    MessageType type = MessageType::Invalid;
    std::size_t consumed = 0;

    const uint8_t fixed[] = { 0xFF, 0xFF, 0xFF, 0xFD };
    ASSERT_EQ(MessageTable::ReadId(fixed, sizeof(fixed), type, consumed), MessageIdStatus::Ok);
    EXPECT_EQ(type, MessageType::CloseCircuit);
    EXPECT_EQ(consumed, 4u);

    const uint8_t medium[] = { 0xFF, 0x0A };
    ASSERT_EQ(MessageTable::ReadId(medium, sizeof(medium), type, consumed), MessageIdStatus::Ok);
    EXPECT_EQ(type, MessageType::ObjectPropertiesFamily);
    EXPECT_EQ(consumed, 2u);

    const uint8_t truncated[] = { 0xFF, 0xFF, 0x00 };
    EXPECT_EQ(MessageTable::ReadId(truncated, sizeof(truncated), type, consumed), MessageIdStatus::TooShort);

    const uint8_t unknown[] = { 0xFF, 0xFF, 0x01, 0x00 };
    EXPECT_EQ(MessageTable::ReadId(unknown, sizeof(unknown), type, consumed), MessageIdStatus::Unknown);
}

// ---------- Decode ----------

TEST(PacketCodec, DecodesHighFrequencyPacket) {
    const std::vector<uint8_t> wire{ 0x00, 0x00, 0x00, 0x00, 0x09, 0x00, 0x01, 0x07, 0x02, 0x00, 0x00, 0x00 };
    Packet p;
    ASSERT_EQ(PacketCodec::Decode(wire.data(), wire.size(), p), DecodeStatus::Ok);
    EXPECT_EQ(p.type, MessageType::StartPingCheck);
    EXPECT_EQ(p.header.sequence, 9u);
    EXPECT_FALSE(p.IsReliable());

    uint8_t pingId = 0;
    SequenceNumber oldest = 0;
    ASSERT_TRUE(Messages::TryParseStartPingCheck(p.body.data(), p.body.size(), pingId, oldest));
    EXPECT_EQ(pingId, 7);
    EXPECT_EQ(oldest, 2u);
}

TEST(PacketCodec, SkipsExtraHeader) {
    const std::vector<uint8_t> wire{ 0x00, 0x00, 0x00, 0x00, 0x01, 0x02, 0xEE, 0xEE, 0x02, 0x05 };
    Packet p;
    ASSERT_EQ(PacketCodec::Decode(wire.data(), wire.size(), p), DecodeStatus::Ok);
    EXPECT_EQ(p.type, MessageType::CompletePingCheck);
    EXPECT_EQ(p.header.extra, (std::vector<uint8_t>{ 0xEE, 0xEE }));
    EXPECT_EQ(p.body, (std::vector<uint8_t>{ 0x05 }));
}

TEST(PacketCodec, UnknownMessageKeepsHeaderAndAcks) {
    std::vector<uint8_t> wire{ FLAG_RELIABLE, 0x00, 0x00, 0x00, 0x2A, 0x00, 0xFF, 0xFF, 0x01, 0x00, 0x99 };
    ASSERT_EQ(PacketCodec::AppendAcks(wire, { 3 }), 1u);

    Packet p;
    ASSERT_EQ(PacketCodec::Decode(wire.data(), wire.size(), p), DecodeStatus::UnknownMessage);
    EXPECT_EQ(p.header.sequence, 42u);
    EXPECT_TRUE(p.IsReliable());
    EXPECT_EQ(p.appendedAcks, (std::vector<SequenceNumber>{ 3 }));
}

TEST(PacketCodec, RejectsMalformedDatagrams) {
    Packet p;
    const std::vector<uint8_t> tiny{ 0x00, 0x00, 0x00 };
    EXPECT_EQ(PacketCodec::Decode(tiny.data(), tiny.size(), p), DecodeStatus::TooShort);

    const std::vector<uint8_t> noId{ 0x00, 0x00, 0x00, 0x00, 0x01, 0x00 };
    EXPECT_EQ(PacketCodec::Decode(noId.data(), noId.size(), p), DecodeStatus::TooShort);

    const std::vector<uint8_t> badAcks{ FLAG_ACK, 0x00, 0x00, 0x00, 0x01, 0x00, 0x02, 0x05, 0x09 };
    EXPECT_EQ(PacketCodec::Decode(badAcks.data(), badAcks.size(), p), DecodeStatus::BadAppendedAcks);

    const std::vector<uint8_t> badZero{ FLAG_ZEROCODED, 0x00, 0x00, 0x00, 0x01, 0x00, 0x02, 0x00 };
    EXPECT_EQ(PacketCodec::Decode(badZero.data(), badZero.size(), p), DecodeStatus::BadZeroCoding);

    // UseCircuitCode needs 36 body bytes.
    std::vector<uint8_t> shortBody{ 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0xFF, 0xFF, 0x00, 0x03 };
    shortBody.resize(shortBody.size() + 10, 0x11);
    EXPECT_EQ(PacketCodec::Decode(shortBody.data(), shortBody.size(), p), DecodeStatus::BodyTooShort);
}

// ---------- Encode ----------

TEST(PacketCodec, EncodeDecode) {
    Packet out = Packet::Make(MessageType::ChatFromSimulator, { 1, 2, 3, 4 }, true);
    out.header.sequence = 77;

    std::vector<uint8_t> wire;
    ASSERT_TRUE(PacketCodec::Encode(out, wire));
    EXPECT_EQ(wire.size(), HEADER_WIRE_SIZE + 4 + 4);

    Packet in;
    ASSERT_EQ(PacketCodec::Decode(wire.data(), wire.size(), in), DecodeStatus::Ok);
    EXPECT_EQ(in.type, MessageType::ChatFromSimulator);
    EXPECT_EQ(in.header.sequence, 77u);
    EXPECT_TRUE(in.IsReliable());
    EXPECT_EQ(in.body, out.body);
}

TEST(PacketCodec, ZeroCodingIsOptInAndOnlyWhenSmaller) {
    Packet sparse = Packet::Make(MessageType::ChatFromViewer, std::vector<uint8_t>(100, 0), false);
    ASSERT_TRUE(sparse.header.IsZeroCoded());

    std::vector<uint8_t> wire;
    ASSERT_TRUE(PacketCodec::Encode(sparse, wire));
    EXPECT_TRUE(wire[0] & FLAG_ZEROCODED);
    EXPECT_LT(wire.size(), HEADER_WIRE_SIZE + 4 + 100);

    Packet in;
    ASSERT_EQ(PacketCodec::Decode(wire.data(), wire.size(), in), DecodeStatus::Ok);
    EXPECT_EQ(in.body, sparse.body);

    Packet dense = Packet::Make(MessageType::ChatFromViewer, { 1, 2, 3, 4, 5 }, false);
    ASSERT_TRUE(PacketCodec::Encode(dense, wire));
    EXPECT_FALSE(wire[0] & FLAG_ZEROCODED);
    ASSERT_EQ(PacketCodec::Decode(wire.data(), wire.size(), in), DecodeStatus::Ok);
    EXPECT_EQ(in.body, dense.body);

    // Not opted in: sent raw even though it would shrink.
    Packet plain = Packet::Make(MessageType::ChatFromSimulator, std::vector<uint8_t>(50, 0), false);
    ASSERT_TRUE(PacketCodec::Encode(plain, wire));
    EXPECT_FALSE(wire[0] & FLAG_ZEROCODED);
    EXPECT_EQ(wire.size(), HEADER_WIRE_SIZE + 4 + 50);
}

TEST(PacketCodec, EncodeRejectsOversizeAndUnknown) {
    std::vector<uint8_t> wire;
    Packet big = Packet::Make(MessageType::ChatFromSimulator, std::vector<uint8_t>(MAX_PACKET_SIZE, 0x11), false);
    EXPECT_FALSE(PacketCodec::Encode(big, wire));

    Packet invalid;
    EXPECT_FALSE(PacketCodec::Encode(invalid, wire));
}

TEST(PacketCodec, AppendedAcksBypassZeroCoding) {
    Packet sparse = Packet::Make(MessageType::ChatFromViewer, std::vector<uint8_t>(40, 0), true);
    std::vector<uint8_t> wire;
    ASSERT_TRUE(PacketCodec::Encode(sparse, wire));
    ASSERT_EQ(PacketCodec::AppendAcks(wire, { 0x00000100, 5, 6 }), 3u);
    EXPECT_EQ(wire.back(), 3);

    Packet in;
    ASSERT_EQ(PacketCodec::Decode(wire.data(), wire.size(), in), DecodeStatus::Ok);
    EXPECT_TRUE(in.header.HasAppendedAcks());
    EXPECT_EQ(in.appendedAcks, (std::vector<SequenceNumber>{ 0x100, 5, 6 }));
    EXPECT_EQ(in.body, sparse.body);
}

TEST(PacketCodec, AppendAcksRespectsSizeCap) {
    Packet p = Packet::Make(MessageType::ChatFromSimulator, std::vector<uint8_t>(10, 1), false);
    std::vector<uint8_t> wire;
    ASSERT_TRUE(PacketCodec::Encode(p, wire));
    const std::size_t base = wire.size();

    std::vector<SequenceNumber> acks(400);
    for (std::size_t i = 0; i < acks.size(); ++i) acks[i] = static_cast<SequenceNumber>(i + 1);

    // Room for two acks plus the count byte.
    std::vector<uint8_t> tight = wire;
    EXPECT_EQ(PacketCodec::AppendAcks(tight, acks, base + 9), 2u);
    EXPECT_EQ(tight.size(), base + 9);

    // Never more than 255 regardless of room.
    std::vector<uint8_t> roomy = wire;
    EXPECT_EQ(PacketCodec::AppendAcks(roomy, acks, 4096), MAX_APPENDED_ACKS);

    std::vector<uint8_t> full = wire;
    EXPECT_EQ(PacketCodec::AppendAcks(full, acks, base + 4), 0u);
    EXPECT_EQ(full, wire);
}

TEST(PacketCodec, MarkResentSetsFlagOnly) {
    std::vector<uint8_t> wire{ FLAG_RELIABLE, 0, 0, 0, 1, 0, 0x01 };
    PacketCodec::MarkResent(wire);
    EXPECT_EQ(wire[0], FLAG_RELIABLE | FLAG_RESENT);
}
