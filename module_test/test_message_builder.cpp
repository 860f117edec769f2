/*-------------------------------------------------------------------------
 *
 * test_message_builder.cpp
 *      Byte layout of request bodies and envelopes.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CMemoryStream.hpp"
#include "protocol/CBsonType.hpp"
#include "protocol/CMessageBuilder.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace DocWire
{
namespace Test
{

class MessageBuilderTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        selector.addString("name", "alice");
        document.addString("name", "bob");
        document.addInt32("age", 41);
        update.addInt32("age", 42);
    }

    static std::vector<uint8_t> bytesOf(const CBsonType& doc)
    {
        return doc.getDocument();
    }

    /* Expect the bytes of doc at offset; returns the offset after it */
    static size_t expectDocumentAt(const std::vector<uint8_t>& body,
                                   size_t offset, const CBsonType& doc)
    {
        std::vector<uint8_t> expected = bytesOf(doc);
        EXPECT_LE(offset + expected.size(), body.size());
        if (offset + expected.size() > body.size())
            return body.size();
        EXPECT_EQ(std::vector<uint8_t>(body.begin() + offset,
                                       body.begin() + offset + expected.size()),
                  expected);
        return offset + expected.size();
    }

    CBsonType selector;
    CBsonType document;
    CBsonType update;
};

TEST_F(MessageBuilderTest, CollectionNameIsCString)
{
    std::vector<uint8_t> body =
        CMessageBuilder::buildInsertBody("users", document);

    const uint8_t expected[] = {'u', 's', 'e', 'r', 's', 0x00};
    ASSERT_GE(body.size(), 4u + sizeof(expected));
    EXPECT_EQ(getInt32(body, 0), 0);
    for (size_t i = 0; i < sizeof(expected); ++i)
        EXPECT_EQ(body[4 + i], expected[i]) << "at " << i;
}

TEST_F(MessageBuilderTest, DeleteBody)
{
    std::vector<uint8_t> body =
        CMessageBuilder::buildDeleteBody("db.users", selector);

    EXPECT_EQ(getInt32(body, 0), 0);
    size_t offset = 4 + std::string("db.users").size() + 1;
    EXPECT_EQ(getInt32(body, offset), 0);
    offset = expectDocumentAt(body, offset + 4, selector);
    EXPECT_EQ(offset, body.size());
}

TEST_F(MessageBuilderTest, InsertBody)
{
    std::vector<uint8_t> body = CMessageBuilder::buildInsertBody("c", document);

    size_t offset = expectDocumentAt(body, 4 + 2, document);
    EXPECT_EQ(offset, body.size());
}

TEST_F(MessageBuilderTest, InsertManyKeepsOrder)
{
    std::vector<CBsonType> documents = {document, selector, update};
    std::vector<uint8_t> body =
        CMessageBuilder::buildInsertManyBody("c", documents);

    size_t offset = 4 + 2;
    for (const auto& doc : documents)
        offset = expectDocumentAt(body, offset, doc);
    EXPECT_EQ(offset, body.size());
}

TEST_F(MessageBuilderTest, InsertManyEmpty)
{
    std::vector<uint8_t> body = CMessageBuilder::buildInsertManyBody("c", {});

    /* Reserved int32 and the collection name only */
    ASSERT_EQ(body.size(), 6u);
    EXPECT_EQ(getInt32(body, 0), 0);
    EXPECT_EQ(body[4], 'c');
    EXPECT_EQ(body[5], 0x00);

    std::vector<uint8_t> message =
        CMessageBuilder::packMessage(CDocumentOpCode::OP_INSERT, 5, body);
    EXPECT_EQ(getInt32(message, 0), 22);
}

TEST_F(MessageBuilderTest, UpdateBody)
{
    std::vector<uint8_t> body = CMessageBuilder::buildUpdateBody(
        "c", {CUpdateFlag::Upsert, CUpdateFlag::Multiupdate}, selector, update);

    EXPECT_EQ(getInt32(body, 0), 0);
    EXPECT_EQ(getInt32(body, 6), 3);
    size_t offset = expectDocumentAt(body, 10, selector);
    offset = expectDocumentAt(body, offset, update);
    EXPECT_EQ(offset, body.size());
}

TEST_F(MessageBuilderTest, UpdateWithoutFlags)
{
    std::vector<uint8_t> body =
        CMessageBuilder::buildUpdateBody("c", {}, selector, update);
    EXPECT_EQ(getInt32(body, 6), 0);
}

TEST_F(MessageBuilderTest, QueryBodyWithoutFieldSelector)
{
    std::vector<uint8_t> body = CMessageBuilder::buildQueryBody(
        "c", {CQueryOption::SlaveOK}, 10, -1, selector, std::nullopt);

    EXPECT_EQ(getInt32(body, 0), 4);
    EXPECT_EQ(getInt32(body, 6), 10);
    EXPECT_EQ(getInt32(body, 10), -1);
    size_t offset = expectDocumentAt(body, 14, selector);
    EXPECT_EQ(offset, body.size());
}

TEST_F(MessageBuilderTest, QueryBodyWithFieldSelector)
{
    CBsonType fields;
    fields.addInt32("name", 1);

    std::vector<uint8_t> body = CMessageBuilder::buildQueryBody(
        "c", {}, 0, 0, selector, fields);

    EXPECT_EQ(getInt32(body, 0), 0);
    size_t offset = expectDocumentAt(body, 14, selector);
    offset = expectDocumentAt(body, offset, fields);
    EXPECT_EQ(offset, body.size());
}

TEST_F(MessageBuilderTest, EmbeddedNulInCollectionThrows)
{
    EXPECT_THROW(CMessageBuilder::buildInsertBody(std::string("a\0b", 3),
                                                  document),
                 std::invalid_argument);
}

TEST_F(MessageBuilderTest, PackMessageHeader)
{
    std::vector<uint8_t> body = CMessageBuilder::buildDeleteBody("c", selector);
    std::vector<uint8_t> message =
        CMessageBuilder::packMessage(CDocumentOpCode::OP_DELETE, 1234, body);

    ASSERT_EQ(message.size(), MESSAGE_HEADER_SIZE + body.size());
    EXPECT_EQ(getInt32(message, 0), static_cast<int32_t>(message.size()));
    EXPECT_EQ(getInt32(message, 4), 1234);
    EXPECT_EQ(getInt32(message, 8), 0);
    EXPECT_EQ(getInt32(message, 12), 2006);
    EXPECT_EQ(std::vector<uint8_t>(message.begin() + MESSAGE_HEADER_SIZE,
                                   message.end()),
              body);
}

TEST_F(MessageBuilderTest, PackEmptyBody)
{
    std::vector<uint8_t> message =
        CMessageBuilder::packMessage(CDocumentOpCode::OP_QUERY, -7, {});
    ASSERT_EQ(message.size(), MESSAGE_HEADER_SIZE);
    EXPECT_EQ(getInt32(message, 0), 16);
    EXPECT_EQ(getInt32(message, 4), -7);
}

} /* namespace Test */
} /* namespace DocWire */
