#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "mytftp/codec.hpp"

using namespace TftpWire;
using namespace TftpWire::MyTftp;

namespace {
    ByteView viewOf(const Blob& bytes) {
        return {bytes.data(), bytes.size()};
    }

    std::expected<Packet, PacketError> decodeBlob(const Blob& bytes) {
        return decode(viewOf(bytes));
    }

    Blob dataPacketOf(std::size_t payload_size) {
        Blob raw {0, 3, 0, 42};
        raw.insert(raw.end(), payload_size, 69);

        return raw;
    }
}

TEST(Decode, ReadRequest) {
    const Blob raw {0, 1, 67, 68, 69, 0, 111, 99, 116, 101, 116, 0};
    const auto result = decodeBlob(raw);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), (Packet {RrqPayload {"CDE", DataMode::octet}}));
}

TEST(Decode, WriteRequest) {
    const Blob raw {0, 2, 67, 68, 69, 0, 111, 99, 116, 101, 116, 0};
    const auto result = decodeBlob(raw);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), (Packet {WrqPayload {"CDE", DataMode::octet}}));
}

TEST(Decode, Data) {
    const Blob raw {0, 3, 0, 42, 67, 68, 69};
    const auto result = decodeBlob(raw);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), (Packet {DataPayload {42, {67, 68, 69}}}));
}

TEST(Decode, EmptyDataPayload) {
    const Blob raw {0, 3, 0, 7};
    const auto result = decodeBlob(raw);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), (Packet {DataPayload {7, {}}}));
}

TEST(Decode, Ack) {
    const Blob raw {0, 4, 0, 42};
    const auto result = decodeBlob(raw);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), (Packet {AckPayload {42}}));
}

TEST(Decode, Error) {
    const Blob raw {0, 5, 0, 2, 67, 68, 69, 0};
    const auto result = decodeBlob(raw);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), (Packet {ErrorPayload {ErrorCode::access_violation, "CDE"}}));
}

TEST(Decode, DataAtMaximumLength) {
    const auto result = decodeBlob(dataPacketOf(512));

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(std::holds_alternative<DataPayload>(result.value()));
    EXPECT_EQ(std::get<DataPayload>(result.value()).data.size(), 512UL);
}

TEST(Decode, DataOverMaximumLength) {
    const auto result = decodeBlob(dataPacketOf(513));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), (PacketError {InvalidPacketLength {512}}));
}

TEST(Decode, AckWithTrailingByte) {
    const Blob raw {0, 4, 0, 42, 0};
    const auto result = decodeBlob(raw);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), (PacketError {InvalidPacketLength {4}}));
}

TEST(Decode, InvalidOpcodes) {
    const Blob zero_raw {0, 0, 67, 68, 69, 0};
    const Blob six_raw {0, 6, 67, 68, 69, 0, 111, 99, 116, 101, 116, 0};
    const Blob short_raw {5};
    const Blob empty_raw {};

    for (const auto& raw : {zero_raw, six_raw, short_raw, empty_raw}) {
        const auto result = decodeBlob(raw);

        ASSERT_FALSE(result.has_value());
        EXPECT_TRUE(std::holds_alternative<InvalidOpcode>(result.error()));
    }
}

TEST(Decode, InvalidMode) {
    const Blob raw {0, 1, 67, 68, 69, 0, 67, 0};
    const auto result = decodeBlob(raw);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<InvalidPacket>(result.error()));
}

TEST(Decode, TruncatedFieldsAreInvalidPacket) {
    const Blob no_filename_null {0, 1, 67, 68, 69};
    const Blob no_mode {0, 2, 67, 68, 69, 0};
    const Blob short_block {0, 3, 0};
    const Blob short_ack {0, 4};
    const Blob bad_errcode {0, 5, 0, 9, 67, 0};
    const Blob no_msg_null {0, 5, 0, 1, 67};

    for (const auto& raw : {no_filename_null, no_mode, short_block, short_ack, bad_errcode, no_msg_null}) {
        const auto result = decodeBlob(raw);

        ASSERT_FALSE(result.has_value());
        EXPECT_TRUE(std::holds_alternative<InvalidPacket>(result.error()));
    }
}

TEST(Decode, InvalidUtf8Filename) {
    const Blob raw {0, 1, 0xC3, 0x28, 0, 111, 99, 116, 101, 116, 0};
    const auto result = decodeBlob(raw);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<InvalidPacket>(result.error()));
}

TEST(Decode, IgnoresTrailingBytesAfterTextFields) {
    const Blob rrq_raw {0, 1, 67, 0, 109, 97, 105, 108, 0, 1, 2, 3};
    const Blob err_raw {0, 5, 0, 1, 67, 0, 99};

    const auto rrq_res = decodeBlob(rrq_raw);
    const auto err_res = decodeBlob(err_raw);

    ASSERT_TRUE(rrq_res.has_value());
    EXPECT_EQ(rrq_res.value(), (Packet {RrqPayload {"C", DataMode::mail}}));
    ASSERT_TRUE(err_res.has_value());
    EXPECT_EQ(err_res.value(), (Packet {ErrorPayload {ErrorCode::file_not_found, "C"}}));
}

TEST(Decode, IsDeterministic) {
    const Blob raw {0, 5, 0, 2, 67, 68, 69, 0};

    EXPECT_EQ(decodeBlob(raw), decodeBlob(raw));
}

TEST(Decode, AcceptsFixedBuffer) {
    MyBuf::FixedBuffer<tftp_u8, Constants::max_datagram_size> buffer;

    for (const tftp_u8 octet : {0, 4, 1, 0}) {
        ASSERT_TRUE(buffer.appendOctet(octet));
    }

    const auto result = decode(buffer);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), (Packet {AckPayload {256}}));
}

TEST(Encode, ProtocolVectors) {
    EXPECT_EQ(encode(RrqPayload {"CDE", DataMode::octet}), (Blob {0, 1, 67, 68, 69, 0, 111, 99, 116, 101, 116, 0}));
    EXPECT_EQ(encode(WrqPayload {"CDE", DataMode::octet}), (Blob {0, 2, 67, 68, 69, 0, 111, 99, 116, 101, 116, 0}));
    EXPECT_EQ(encode(DataPayload {42, {67, 68, 69}}), (Blob {0, 3, 0, 42, 67, 68, 69}));
    EXPECT_EQ(encode(AckPayload {42}), (Blob {0, 4, 0, 42}));
    EXPECT_EQ(encode(ErrorPayload {ErrorCode::access_violation, "CDE"}), (Blob {0, 5, 0, 2, 67, 68, 69, 0}));
}

TEST(Encode, NetasciiAndHighBlockNumbers) {
    EXPECT_EQ(encode(RrqPayload {"a", DataMode::netascii}), (Blob {0, 1, 'a', 0, 'n', 'e', 't', 'a', 's', 'c', 'i', 'i', 0}));
    EXPECT_EQ(encode(AckPayload {0xFFFF}), (Blob {0, 4, 0xFF, 0xFF}));
}

TEST(Encode, DoesNotEnforceDataLimit) {
    const DataPayload oversized {1, Blob(600, 0xAA)};

    EXPECT_EQ(encode(oversized).size(), 604UL);
}

TEST(Encode, SizeMatchesOutput) {
    const std::vector<Packet> packets = {
        RrqPayload {"boot.img", DataMode::octet},
        WrqPayload {"", DataMode::mail},
        DataPayload {9, Blob(512, 1)},
        AckPayload {0},
        ErrorPayload {ErrorCode::disk_full, "full"}
    };

    for (const auto& packet : packets) {
        EXPECT_EQ(encodedSize(packet), encode(packet).size());
    }
}

TEST(Codec, RoundTripsValidPackets) {
    const std::vector<Packet> packets = {
        RrqPayload {"CDE", DataMode::octet},
        RrqPayload {"\xC3\xA9t\xC3\xA9.bin", DataMode::netascii},
        WrqPayload {"", DataMode::mail},
        DataPayload {0, {}},
        DataPayload {65535, Blob(512, 0)},
        AckPayload {1},
        ErrorPayload {ErrorCode::not_defined, ""},
        ErrorPayload {ErrorCode::no_such_user, "who?"}
    };

    for (const auto& packet : packets) {
        const auto bytes = encode(packet);
        const auto result = decodeBlob(bytes);

        ASSERT_TRUE(result.has_value()) << toString(result.error());
        EXPECT_EQ(result.value(), packet);
    }
}

TEST(Codec, OpcodeOfEachAlternative) {
    EXPECT_EQ(opcodeOf(RrqPayload {"a", DataMode::octet}), Opcode::rrq);
    EXPECT_EQ(opcodeOf(WrqPayload {"a", DataMode::octet}), Opcode::wrq);
    EXPECT_EQ(opcodeOf(DataPayload {1, {}}), Opcode::data);
    EXPECT_EQ(opcodeOf(AckPayload {1}), Opcode::ack);
    EXPECT_EQ(opcodeOf(ErrorPayload {ErrorCode::disk_full, ""}), Opcode::err);
}

TEST(EncodeInto, WritesIntoFixedBuffer) {
    MyBuf::FixedBuffer<tftp_u8, Constants::max_datagram_size> buffer;
    const Packet packet = ErrorPayload {ErrorCode::access_violation, "CDE"};

    ASSERT_TRUE(encodeInto(buffer, packet));

    const Blob expected {0, 5, 0, 2, 67, 68, 69, 0};
    EXPECT_TRUE(makeView(buffer) == viewOf(expected));
    EXPECT_EQ(decode(buffer), packet);
}

TEST(EncodeInto, FullDataBlockFitsDatagram) {
    MyBuf::FixedBuffer<tftp_u8, Constants::max_datagram_size> buffer;
    const Packet packet = DataPayload {3, Blob(512, 0x55)};

    ASSERT_TRUE(encodeInto(buffer, packet));
    EXPECT_TRUE(buffer.isFull());
}

TEST(EncodeInto, RejectsOversizedPacket) {
    MyBuf::FixedBuffer<tftp_u8, 8> buffer;
    ASSERT_TRUE(buffer.appendOctet(1));

    EXPECT_FALSE(encodeInto(buffer, RrqPayload {"too-long-name", DataMode::octet}));
    EXPECT_TRUE(buffer.isEmpty());

    EXPECT_TRUE(encodeInto(buffer, AckPayload {5}));
    EXPECT_EQ(buffer.getLength(), 4UL);
}

TEST(PacketError, RendersEachKind) {
    EXPECT_EQ(toString(InvalidPacket {"bad"}), "InvalidPacket: bad");
    EXPECT_EQ(toString(InvalidOpcode {"bad"}), "InvalidOpcode: bad");
    EXPECT_EQ(toString(InvalidPacketLength {512}), "InvalidPacketLength: Expected 512 bytes");
}
