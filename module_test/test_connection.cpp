/*-------------------------------------------------------------------------
 *
 * test_connection.cpp
 *      Connection session and public operations over an in-memory
 *      stream.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CMemoryStream.hpp"
#include "CWireError.hpp"
#include "client/CConnection.hpp"
#include "client/CDocumentOperations.hpp"
#include "protocol/CMessageBuilder.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace DocWire
{
namespace Test
{

class ConnectionTest : public ::testing::Test
{
  protected:
    static constexpr uint64_t kSeed = 2024;

    void SetUp() override
    {
        auto owned = std::make_unique<CMemoryStream>();
        stream = owned.get();
        conn = std::make_unique<CConnection>(std::move(owned), nullptr, kSeed);

        selector.addString("name", "alice");
        document.addString("name", "alice");
        document.addInt32("age", 30);
    }

    /* The request id the connection will use for its n-th message */
    static int32_t idAt(int n)
    {
        CRequestIdGenerator gen(kSeed);
        int32_t id = 0;
        for (int i = 0; i <= n; ++i)
            id = gen.next();
        return id;
    }

    CMemoryStream* stream = nullptr;
    std::unique_ptr<CConnection> conn;
    CBsonType selector;
    CBsonType document;
};

TEST_F(ConnectionTest, NullStreamRejected)
{
    EXPECT_THROW(CConnection(nullptr), CTransportError);
}

TEST_F(ConnectionTest, SendFramesOneWrite)
{
    std::vector<uint8_t> body = CMessageBuilder::buildInsertBody("c", document);
    int32_t id = conn->sendMessage(CDocumentOpCode::OP_INSERT, body);

    EXPECT_EQ(id, idAt(0));
    EXPECT_EQ(stream->writeCalls(), 1u);
    EXPECT_EQ(stream->written(),
              CMessageBuilder::packMessage(CDocumentOpCode::OP_INSERT, id, body));
}

TEST_F(ConnectionTest, SequentialIdsFollowGenerator)
{
    std::vector<uint8_t> body = CMessageBuilder::buildDeleteBody("c", selector);

    EXPECT_EQ(conn->sendMessage(CDocumentOpCode::OP_DELETE, body), idAt(0));
    EXPECT_EQ(conn->sendMessage(CDocumentOpCode::OP_DELETE, body), idAt(1));
    EXPECT_EQ(conn->sendMessage(CDocumentOpCode::OP_DELETE, body), idAt(2));
}

TEST_F(ConnectionTest, InsertWritesInsertOpcode)
{
    RequestID id = insert(*conn, "db.users", document);

    const auto& out = stream->written();
    EXPECT_EQ(getInt32(out, 0), static_cast<int32_t>(out.size()));
    EXPECT_EQ(getInt32(out, 4), id);
    EXPECT_EQ(getInt32(out, 8), 0);
    EXPECT_EQ(getInt32(out, 12), 2002);
}

TEST_F(ConnectionTest, InsertManyEmptyStillSends)
{
    insertMany(*conn, "c", {});
    EXPECT_EQ(stream->written().size(), 22u);
    EXPECT_EQ(getInt32(stream->written(), 0), 22);
}

TEST_F(ConnectionTest, DeleteAndRemoveAgree)
{
    RequestID a = deleteDocuments(*conn, "c", selector);
    std::vector<uint8_t> first = stream->written();
    RequestID b = DocWire::remove(*conn, "c", selector);
    std::vector<uint8_t> both = stream->written();

    ASSERT_EQ(both.size(), first.size() * 2);
    std::vector<uint8_t> second(both.begin() + static_cast<long>(first.size()),
                                both.end());
    EXPECT_EQ(getInt32(second, 12), 2006);
    EXPECT_EQ(getInt32(first, 4), a);
    EXPECT_EQ(getInt32(second, 4), b);
    /* Bodies match, only the request id differs */
    EXPECT_EQ(std::vector<uint8_t>(first.begin() + 16, first.end()),
              std::vector<uint8_t>(second.begin() + 16, second.end()));
}

TEST_F(ConnectionTest, UpdateCarriesFlags)
{
    CBsonType change;
    change.addInt32("age", 31);

    update(*conn, "c", {CUpdateFlag::Multiupdate}, selector, change);
    EXPECT_EQ(getInt32(stream->written(), 12), 2001);
    /* header | reserved | "c\0" | flags */
    EXPECT_EQ(getInt32(stream->written(), 16 + 4 + 2), 2);
}

TEST_F(ConnectionTest, QueryReturnsDocuments)
{
    stream->feed(makeReply(idAt(0), 0, 0,
                           {document.getDocument(), selector.getDocument()}));

    std::vector<CBsonType> docs = query(*conn, "c", {}, 0, 0, selector);

    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0], document);
    EXPECT_EQ(docs[1], selector);
    EXPECT_EQ(getInt32(stream->written(), 12), 2004);
    EXPECT_FALSE(conn->isBroken());
}

TEST_F(ConnectionTest, QueryFailureFlagBreaksConnection)
{
    stream->feed(makeReply(idAt(0), 2, 0, {}));

    EXPECT_THROW(query(*conn, "c", {}, 0, 0, selector), CProtocolError);
    EXPECT_TRUE(conn->isBroken());
    EXPECT_THROW(insert(*conn, "c", document), CTransportError);
}

TEST_F(ConnectionTest, MismatchedReplyBreaksConnection)
{
    stream->feed(makeReply(idAt(0) + 1, 0, 0, {}));

    try
    {
        query(*conn, "c", {}, 0, 0, selector);
        FAIL() << "mismatched reply was accepted";
    }
    catch (const CProtocolError& e)
    {
        EXPECT_EQ(e.kind(), CWireErrorKind::ResponseToMismatch);
    }
    EXPECT_TRUE(conn->isBroken());
}

TEST_F(ConnectionTest, WriteFailureBreaksConnection)
{
    stream->failWrites(std::make_error_code(std::errc::broken_pipe));

    try
    {
        insert(*conn, "c", document);
        FAIL() << "write error was swallowed";
    }
    catch (const CTransportError& e)
    {
        EXPECT_EQ(e.code(), std::make_error_code(std::errc::broken_pipe));
    }
    EXPECT_TRUE(conn->isBroken());
}

TEST_F(ConnectionTest, ReadFailureSurfacesAsTransport)
{
    stream->failReads(std::make_error_code(std::errc::timed_out));
    EXPECT_THROW(query(*conn, "c", {}, 0, 0, selector), CTransportError);
    EXPECT_TRUE(conn->isBroken());
}

TEST_F(ConnectionTest, ForeignExceptionOnReadBreaksConnection)
{
    stream->throwOnRead(true);

    EXPECT_THROW(query(*conn, "c", {}, 0, 0, selector), std::runtime_error);
    EXPECT_TRUE(conn->isBroken());

    stream->throwOnRead(false);
    EXPECT_THROW(query(*conn, "c", {}, 0, 0, selector), CTransportError);
}

TEST_F(ConnectionTest, ForeignExceptionOnWriteBreaksConnection)
{
    stream->throwOnWrite(true);

    EXPECT_THROW(insert(*conn, "c", document), std::runtime_error);
    EXPECT_TRUE(conn->isBroken());

    stream->throwOnWrite(false);
    EXPECT_THROW(insert(*conn, "c", document), CTransportError);
    EXPECT_TRUE(stream->written().empty());
}

TEST_F(ConnectionTest, HugeDocumentCountBreaksConnection)
{
    auto reply = makeReply(idAt(0), 0, 0, {});
    reply[32] = 0xff;
    reply[33] = 0xff;
    reply[34] = 0xff;
    reply[35] = 0x7f;
    stream->feed(reply);

    try
    {
        query(*conn, "c", {}, 0, 0, selector);
        FAIL() << "impossible document count was accepted";
    }
    catch (const CProtocolError& e)
    {
        EXPECT_EQ(e.kind(), CWireErrorKind::DocumentRegion);
    }
    EXPECT_TRUE(conn->isBroken());
}

TEST_F(ConnectionTest, ClosedConnectionRefusesSend)
{
    conn->close();
    EXPECT_FALSE(conn->isOpen());
    EXPECT_THROW(insert(*conn, "c", document), CTransportError);
    EXPECT_TRUE(stream->written().empty());
}

TEST_F(ConnectionTest, MoveKeepsSession)
{
    CConnection moved(std::move(*conn));
    EXPECT_TRUE(moved.isOpen());
    EXPECT_EQ(moved.peerName(), "memory");
    EXPECT_EQ(insert(moved, "c", document), idAt(0));
}

} /* namespace Test */
} /* namespace DocWire */
