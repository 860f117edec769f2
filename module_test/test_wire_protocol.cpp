/*-------------------------------------------------------------------------
 *
 * test_wire_protocol.cpp
 *      Unit tests for opcodes, option and flag bits, fixed headers and
 *      the little-endian writer/reader.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CMemoryStream.hpp"
#include "CWireError.hpp"
#include "protocol/CBsonType.hpp"
#include "protocol/CDocumentWireProtocol.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace DocWire
{
namespace Test
{

TEST(OpcodeCodecTest, WireValues)
{
    EXPECT_EQ(opcodeToWire(CDocumentOpCode::OP_REPLY), 1);
    EXPECT_EQ(opcodeToWire(CDocumentOpCode::OP_MSG), 1000);
    EXPECT_EQ(opcodeToWire(CDocumentOpCode::OP_UPDATE), 2001);
    EXPECT_EQ(opcodeToWire(CDocumentOpCode::OP_INSERT), 2002);
    EXPECT_EQ(opcodeToWire(CDocumentOpCode::OP_GET_BY_OID), 2003);
    EXPECT_EQ(opcodeToWire(CDocumentOpCode::OP_QUERY), 2004);
    EXPECT_EQ(opcodeToWire(CDocumentOpCode::OP_GET_MORE), 2005);
    EXPECT_EQ(opcodeToWire(CDocumentOpCode::OP_DELETE), 2006);
    EXPECT_EQ(opcodeToWire(CDocumentOpCode::OP_KILL_CURSORS), 2007);
}

TEST(OpcodeCodecTest, DecodeInvertsEncode)
{
    const CDocumentOpCode all[] = {
        CDocumentOpCode::OP_REPLY,      CDocumentOpCode::OP_MSG,
        CDocumentOpCode::OP_UPDATE,     CDocumentOpCode::OP_INSERT,
        CDocumentOpCode::OP_GET_BY_OID, CDocumentOpCode::OP_QUERY,
        CDocumentOpCode::OP_GET_MORE,   CDocumentOpCode::OP_DELETE,
        CDocumentOpCode::OP_KILL_CURSORS};

    for (CDocumentOpCode opcode : all)
        EXPECT_EQ(wireToOpcode(opcodeToWire(opcode)), opcode)
            << opcodeName(opcode);
}

TEST(OpcodeCodecTest, UnknownValueThrows)
{
    for (int32_t value : {0, 2, 999, 2000, 2008, 2013, -1})
    {
        try
        {
            wireToOpcode(value);
            FAIL() << "expected CUnknownOpcodeError for " << value;
        }
        catch (const CUnknownOpcodeError& e)
        {
            EXPECT_EQ(e.value(), value);
            EXPECT_EQ(e.kind(), CWireErrorKind::UnknownOpcode);
        }
    }
}

TEST(OpcodeCodecTest, Names)
{
    EXPECT_STREQ(opcodeName(CDocumentOpCode::OP_QUERY), "OP_QUERY");
    EXPECT_STREQ(opcodeName(CDocumentOpCode::OP_KILL_CURSORS),
                 "OP_KILL_CURSORS");
}

TEST(FlagCodecTest, QueryOptionBits)
{
    EXPECT_EQ(queryOptionBit(CQueryOption::TailableCursor), 2);
    EXPECT_EQ(queryOptionBit(CQueryOption::SlaveOK), 4);
    EXPECT_EQ(queryOptionBit(CQueryOption::OpLogReplay), 8);
    EXPECT_EQ(queryOptionBit(CQueryOption::NoCursorTimeout), 16);
}

TEST(FlagCodecTest, UpdateFlagBits)
{
    EXPECT_EQ(updateFlagBit(CUpdateFlag::Upsert), 1);
    EXPECT_EQ(updateFlagBit(CUpdateFlag::Multiupdate), 2);
}

TEST(FlagCodecTest, EncodeSets)
{
    EXPECT_EQ(encodeQueryOptions({}), 0);
    EXPECT_EQ(encodeUpdateFlags({}), 0);
    EXPECT_EQ(encodeQueryOptions({CQueryOption::SlaveOK,
                                  CQueryOption::NoCursorTimeout}),
              20);
    EXPECT_EQ(encodeUpdateFlags({CUpdateFlag::Upsert, CUpdateFlag::Multiupdate}),
              3);
}

TEST(FlagCodecTest, DuplicatesCollapse)
{
    EXPECT_EQ(encodeQueryOptions({CQueryOption::TailableCursor,
                                  CQueryOption::TailableCursor}),
              2);
    EXPECT_EQ(encodeUpdateFlags({CUpdateFlag::Multiupdate,
                                 CUpdateFlag::Multiupdate}),
              2);
}

TEST(ReplyFlagsTest, Describe)
{
    EXPECT_EQ(describeReplyFlags(0), "NONE");
    EXPECT_EQ(describeReplyFlags(2), "QUERY_FAILURE");
    EXPECT_EQ(describeReplyFlags(3), "CURSOR_NOT_FOUND|QUERY_FAILURE");
    EXPECT_EQ(describeReplyFlags(8 | 0x40), "AWAIT_CAPABLE|0x40");
}

TEST(MessageHeaderTest, SerializeLittleEndian)
{
    CDocumentMessageHeader header;
    header.messageLength = 0x01020304;
    header.requestID = -2;
    header.responseTo = 0;
    header.opCode = 2004;

    std::vector<uint8_t> bytes = header.serialize();
    ASSERT_EQ(bytes.size(), MESSAGE_HEADER_SIZE);
    EXPECT_EQ(bytes[0], 0x04);
    EXPECT_EQ(bytes[3], 0x01);
    EXPECT_EQ(bytes[4], 0xfe);
    EXPECT_EQ(bytes[7], 0xff);
    EXPECT_EQ(getInt32(bytes, 12), 2004);

    CDocumentMessageHeader decoded;
    ASSERT_TRUE(decoded.deserialize(bytes.data(), bytes.size()));
    EXPECT_EQ(decoded.messageLength, header.messageLength);
    EXPECT_EQ(decoded.requestID, -2);
    EXPECT_EQ(decoded.opCode, 2004);
}

TEST(MessageHeaderTest, RejectsWrongSize)
{
    std::vector<uint8_t> bytes(15, 0);
    CDocumentMessageHeader header;
    EXPECT_FALSE(header.deserialize(bytes.data(), bytes.size()));
    EXPECT_FALSE(header.deserialize(nullptr, MESSAGE_HEADER_SIZE));
}

TEST(ReplyHeaderTest, DecodesFields)
{
    std::vector<uint8_t> bytes;
    putInt32(bytes, 0);
    putInt64(bytes, 0x1122334455667788LL);
    putInt32(bytes, 5);
    putInt32(bytes, 2);

    CDocumentReplyHeader reply;
    ASSERT_TRUE(reply.deserialize(bytes.data(), bytes.size()));
    EXPECT_EQ(reply.responseFlags, 0);
    EXPECT_EQ(reply.cursorID, 0x1122334455667788LL);
    EXPECT_EQ(reply.startingFrom, 5);
    EXPECT_EQ(reply.numberReturned, 2);
    EXPECT_EQ(reply.serialize(), bytes);
}

TEST(WireWriterTest, CStringRejectsEmbeddedNul)
{
    CWireWriter writer;
    EXPECT_THROW(writer.appendCString(std::string("a\0b", 3)),
                 std::invalid_argument);
    EXPECT_EQ(writer.size(), 0u);
}

TEST(WireWriterTest, FieldsAppendInOrder)
{
    CWireWriter writer;
    writer.appendInt32(7);
    writer.appendCString("db.c");
    writer.appendInt64(-1);

    std::vector<uint8_t> out = writer.release();
    ASSERT_EQ(out.size(), 4u + 5u + 8u);
    EXPECT_EQ(getInt32(out, 0), 7);
    EXPECT_EQ(std::string(out.begin() + 4, out.begin() + 8), "db.c");
    EXPECT_EQ(out[8], 0x00);
    for (size_t i = 9; i < out.size(); ++i)
        EXPECT_EQ(out[i], 0xff);
    EXPECT_EQ(writer.size(), 0u);
}

TEST(WireReaderTest, ReadsBackAndStopsAtEnd)
{
    CWireWriter writer;
    writer.appendInt32(-5);
    writer.appendCString("users");
    writer.appendInt64(42);
    const std::vector<uint8_t>& data = writer.data();

    CWireReader reader(data.data(), data.size());
    int32_t i32 = 0;
    int64_t i64 = 0;
    std::string s;

    ASSERT_TRUE(reader.readInt32(i32));
    ASSERT_TRUE(reader.readCString(s));
    ASSERT_TRUE(reader.readInt64(i64));
    EXPECT_EQ(i32, -5);
    EXPECT_EQ(s, "users");
    EXPECT_EQ(i64, 42);
    EXPECT_EQ(reader.remaining(), 0u);
    EXPECT_FALSE(reader.readInt32(i32));
}

TEST(WireReaderTest, UnterminatedCString)
{
    const uint8_t data[] = {'a', 'b', 'c'};
    CWireReader reader(data, sizeof(data));
    std::string s;
    EXPECT_FALSE(reader.readCString(s));
    EXPECT_EQ(reader.offset(), 0u);
}

} /* namespace Test */
} /* namespace DocWire */
