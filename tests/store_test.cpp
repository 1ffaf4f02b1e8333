#include "store.hpp"
#include "temp_env.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using lodestone::InvalidProperty;
using lodestone::InvalidType;
using lodestone::Store;
using lodestone::Transaction;
using lodestone::TransactionClosed;
using lodestone::TransactionConflict;
using lodestone::Value;
using lodestone::Vertex;
using lodestone::VertexId;
using lodestone::VertexQuery;

class StoreTest : public ::testing::Test
{
protected:
  lodestone::test::TempEnv tmp;
  std::unique_ptr<Store> store = std::make_unique<Store>(*tmp.env, lodestone::StoreOptions{4});

  void reopen()
  {
    store.reset();
    tmp.reopen();
    store = std::make_unique<Store>(*tmp.env, lodestone::StoreOptions{4});
  }

  VertexId createCommitted(const std::string &type)
  {
    auto tx = store->begin();
    VertexId id = tx.createVertex(type);
    tx.commit();
    return id;
  }
};

TEST_F(StoreTest, CreateThenGetInSameTransaction)
{
  auto tx = store->begin();
  VertexId id = tx.createVertex("foo");
  auto vertices = tx.getVertices(VertexQuery::vertices({id}));
  ASSERT_EQ(vertices.size(), 1u);
  EXPECT_EQ(vertices[0].id, id);
  EXPECT_EQ(vertices[0].type, "foo");
  EXPECT_TRUE(vertices[0].properties.empty());
}

TEST_F(StoreTest, InvalidTypeIsRejected)
{
  auto tx = store->begin();
  EXPECT_THROW(tx.createVertex(""), InvalidType);
  EXPECT_THROW(tx.createVertex("white space"), InvalidType);
  EXPECT_THROW(tx.createVertex(std::string(256, 't')), InvalidType);
  EXPECT_EQ(tx.vertexCount(), 0u);
}

TEST_F(StoreTest, IdsAreDistinctWithinAndAcrossTransactions)
{
  std::set<VertexId> ids;
  for (int round = 0; round < 3; ++round)
  {
    auto tx = store->begin();
    for (int i = 0; i < 10; ++i)
      ids.insert(tx.createVertex("foo"));
    if (round == 1)
      tx.rollback();
    else
      tx.commit();
  }
  EXPECT_EQ(ids.size(), 30u);
}

TEST_F(StoreTest, UnknownIdYieldsEmptyResult)
{
  auto tx = store->begin();
  EXPECT_TRUE(tx.getVertices(VertexQuery::vertices({12345})).empty());
  EXPECT_TRUE(tx.getVertices(VertexQuery::vertices({})).empty());
}

TEST_F(StoreTest, MissingIdsAreOmittedAndDuplicatesCollapsed)
{
  VertexId a = createCommitted("foo");
  VertexId b = createCommitted("bar");
  auto tx = store->begin();
  auto got = tx.getVertices(VertexQuery::vertices({a, 999, b, a}));
  ASSERT_EQ(got.size(), 2u);
  std::set<VertexId> ids{got[0].id, got[1].id};
  EXPECT_EQ(ids, (std::set<VertexId>{a, b}));
}

TEST_F(StoreTest, RollbackDiscardsCreatedVertex)
{
  VertexId id = 0;
  {
    auto tx = store->begin();
    id = tx.createVertex("foo");
    tx.rollback();
    EXPECT_EQ(tx.state(), Transaction::State::RolledBack);
  }
  auto tx = store->begin();
  EXPECT_TRUE(tx.getVertices(VertexQuery::vertices({id})).empty());
}

TEST_F(StoreTest, DroppingOpenTransactionRollsBack)
{
  VertexId id = 0;
  {
    auto tx = store->begin();
    id = tx.createVertex("foo");
  }
  auto tx = store->begin();
  EXPECT_TRUE(tx.getVertices(VertexQuery::vertices({id})).empty());
  EXPECT_EQ(tx.vertexCount(), 0u);
}

TEST_F(StoreTest, CommitMakesVertexVisibleToLaterTransactions)
{
  VertexId id = createCommitted("foo");
  auto tx = store->begin();
  auto got = tx.getVertices(VertexQuery::vertices({id}));
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].type, "foo");
}

TEST_F(StoreTest, ClosedTransactionRejectsOperations)
{
  auto tx = store->begin();
  VertexId id = tx.createVertex("foo");
  tx.commit();
  EXPECT_EQ(tx.state(), Transaction::State::Committed);

  EXPECT_THROW(tx.createVertex("foo"), TransactionClosed);
  EXPECT_THROW(tx.getVertices(VertexQuery::vertices({id})), TransactionClosed);
  EXPECT_THROW(tx.deleteVertex(id), TransactionClosed);
  EXPECT_THROW(tx.setVertexProperty(id, "k", int64_t(1)), TransactionClosed);
  EXPECT_THROW(tx.getVertexProperty(id, "k"), TransactionClosed);
  EXPECT_THROW(tx.deleteVertexProperty(id, "k"), TransactionClosed);
  EXPECT_THROW(tx.vertexCount(), TransactionClosed);
  EXPECT_THROW(tx.commit(), TransactionClosed);

  auto rolled = store->begin();
  rolled.rollback();
  EXPECT_EQ(rolled.state(), Transaction::State::RolledBack);
  EXPECT_THROW(rolled.createVertex("foo"), TransactionClosed);
  EXPECT_THROW(rolled.getVertices(VertexQuery::all()), TransactionClosed);
  EXPECT_THROW(rolled.deleteVertex(id), TransactionClosed);
  EXPECT_THROW(rolled.setVertexProperty(id, "k", int64_t(1)), TransactionClosed);
  EXPECT_THROW(rolled.getVertexProperty(id, "k"), TransactionClosed);
  EXPECT_THROW(rolled.deleteVertexProperty(id, "k"), TransactionClosed);
  EXPECT_THROW(rolled.vertexCount(), TransactionClosed);
  EXPECT_THROW(rolled.commit(), TransactionClosed);
  rolled.rollback();
  EXPECT_EQ(rolled.state(), Transaction::State::RolledBack);
}

TEST_F(StoreTest, DeleteRemovesAndIsIdempotent)
{
  VertexId id = createCommitted("foo");
  {
    auto tx = store->begin();
    tx.deleteVertex(id);
    EXPECT_TRUE(tx.getVertices(VertexQuery::vertices({id})).empty());
    tx.deleteVertex(id);
    tx.deleteVertex(424242);
    tx.commit();
  }
  auto tx = store->begin();
  EXPECT_TRUE(tx.getVertices(VertexQuery::vertices({id})).empty());
  EXPECT_EQ(tx.vertexCount(), 0u);
}

TEST_F(StoreTest, DeletedIdIsNeverReissued)
{
  VertexId id = createCommitted("foo");
  {
    auto tx = store->begin();
    tx.deleteVertex(id);
    tx.commit();
  }
  reopen();
  auto tx = store->begin();
  for (int i = 0; i < 20; ++i)
    EXPECT_NE(tx.createVertex("foo"), id);
}

TEST_F(StoreTest, CreateAndDeleteInSameTransactionLeavesNothing)
{
  auto tx = store->begin();
  VertexId id = tx.createVertex("foo");
  tx.deleteVertex(id);
  EXPECT_EQ(tx.vertexCount(), 0u);
  tx.commit();

  auto check = store->begin();
  EXPECT_TRUE(check.getVertices(VertexQuery::vertices({id})).empty());
}

TEST_F(StoreTest, PropertiesRoundThroughCommit)
{
  VertexId id = createCommitted("person");
  {
    auto tx = store->begin();
    EXPECT_TRUE(tx.setVertexProperty(id, "name", std::string("ada")));
    EXPECT_TRUE(tx.setVertexProperty(id, "age", int64_t(36)));
    EXPECT_TRUE(tx.setVertexProperty(id, "tmp", true));
    EXPECT_TRUE(tx.deleteVertexProperty(id, "tmp"));
    EXPECT_FALSE(tx.deleteVertexProperty(id, "tmp"));
    EXPECT_FALSE(tx.setVertexProperty(999, "name", std::string("nobody")));
    EXPECT_THROW(tx.setVertexProperty(id, "", int64_t(0)), InvalidProperty);
    tx.commit();
  }
  auto tx = store->begin();
  auto name = tx.getVertexProperty(id, "name");
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(std::get<std::string>(*name), "ada");
  EXPECT_EQ(std::get<int64_t>(*tx.getVertexProperty(id, "age")), 36);
  EXPECT_FALSE(tx.getVertexProperty(id, "tmp").has_value());
  EXPECT_FALSE(tx.getVertexProperty(999, "name").has_value());

  auto got = tx.getVertices(VertexQuery::vertices({id}));
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].properties.size(), 2u);
}

TEST_F(StoreTest, RangeQueryMergesOwnWritesInIdOrder)
{
  VertexId a = createCommitted("a");
  VertexId b = createCommitted("b");
  VertexId c = createCommitted("c");

  auto tx = store->begin();
  tx.deleteVertex(b);
  tx.setVertexProperty(c, "seen", true);
  VertexId d = tx.createVertex("d");

  auto all = tx.getVertices(VertexQuery::all());
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].id, a);
  EXPECT_EQ(all[1].id, c);
  EXPECT_EQ(all[1].properties.count("seen"), 1u);
  EXPECT_EQ(all[2].id, d);

  auto tail = tx.getVertices(VertexQuery::all(b, 1));
  ASSERT_EQ(tail.size(), 1u);
  EXPECT_EQ(tail[0].id, c);

  EXPECT_EQ(tx.vertexCount(), 3u);
}

TEST_F(StoreTest, CommittedDataSurvivesReopen)
{
  VertexId id = createCommitted("foo");
  {
    auto tx = store->begin();
    tx.setVertexProperty(id, "weight", 1.5);
    tx.commit();
  }
  reopen();
  auto tx = store->begin();
  auto got = tx.getVertices(VertexQuery::vertices({id}));
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].type, "foo");
  EXPECT_DOUBLE_EQ(std::get<double>(got[0].properties.at("weight")), 1.5);
  EXPECT_GT(tx.createVertex("foo"), id);
}

TEST_F(StoreTest, SnapshotIsolationHidesConcurrentWrites)
{
  auto t1 = store->begin();
  auto t2 = store->begin();
  VertexId id = t1.createVertex("foo");

  EXPECT_TRUE(t2.getVertices(VertexQuery::vertices({id})).empty());
  t1.commit();
  // t2 still reads from the snapshot it started with
  EXPECT_TRUE(t2.getVertices(VertexQuery::vertices({id})).empty());
  EXPECT_EQ(t2.vertexCount(), 0u);

  auto t3 = store->begin();
  EXPECT_EQ(t3.getVertices(VertexQuery::vertices({id})).size(), 1u);
}

TEST_F(StoreTest, CommitSequenceAdvancesOnlyForWrites)
{
  uint64_t before = store->lastCommitSeq();
  {
    auto tx = store->begin();
    tx.vertexCount();
    tx.commit();
  }
  EXPECT_EQ(store->lastCommitSeq(), before);
  createCommitted("foo");
  EXPECT_EQ(store->lastCommitSeq(), before + 1);
}

TEST_F(StoreTest, TransactionRecordsSequenceAtBegin)
{
  createCommitted("foo");
  auto early = store->begin();
  EXPECT_EQ(early.snapshotSeq(), store->lastCommitSeq());
  createCommitted("bar");
  EXPECT_EQ(early.snapshotSeq() + 1, store->lastCommitSeq());
  auto late = store->begin();
  EXPECT_EQ(late.snapshotSeq(), store->lastCommitSeq());
}

TEST_F(StoreTest, ConcurrentUpdateOfSameVertexConflicts)
{
  VertexId id = createCommitted("foo");

  auto t1 = store->begin();
  auto t2 = store->begin();
  t1.setVertexProperty(id, "who", std::string("t1"));
  t2.setVertexProperty(id, "who", std::string("t2"));
  t1.commit();
  EXPECT_THROW(t2.commit(), TransactionConflict);
  EXPECT_EQ(t2.state(), Transaction::State::RolledBack);

  auto check = store->begin();
  EXPECT_EQ(std::get<std::string>(*check.getVertexProperty(id, "who")), "t1");
}

TEST_F(StoreTest, UpdateOfConcurrentlyDeletedVertexConflicts)
{
  VertexId id = createCommitted("foo");

  auto deleter = store->begin();
  auto writer = store->begin();
  deleter.deleteVertex(id);
  writer.setVertexProperty(id, "k", int64_t(1));
  deleter.commit();
  EXPECT_THROW(writer.commit(), TransactionConflict);

  auto check = store->begin();
  EXPECT_TRUE(check.getVertices(VertexQuery::vertices({id})).empty());
}

TEST_F(StoreTest, ConcurrentDeletesOfSameVertexBothCommit)
{
  VertexId id = createCommitted("foo");
  auto t1 = store->begin();
  auto t2 = store->begin();
  t1.deleteVertex(id);
  t2.deleteVertex(id);
  t1.commit();
  EXPECT_NO_THROW(t2.commit());
}

TEST_F(StoreTest, FailedCommitLeavesStoreUnchanged)
{
  VertexId id = createCommitted("foo");
  auto t1 = store->begin();
  auto t2 = store->begin();
  t1.setVertexProperty(id, "k", int64_t(1));
  t2.setVertexProperty(id, "k", int64_t(2));
  VertexId extra = t2.createVertex("bar");
  t1.commit();
  uint64_t seq = store->lastCommitSeq();
  EXPECT_THROW(t2.commit(), TransactionConflict);

  EXPECT_EQ(store->lastCommitSeq(), seq);
  auto check = store->begin();
  EXPECT_TRUE(check.getVertices(VertexQuery::vertices({extra})).empty());
  EXPECT_EQ(check.vertexCount(), 1u);
}

TEST_F(StoreTest, MovedTransactionKeepsItsWrites)
{
  auto tx = store->begin();
  VertexId id = tx.createVertex("foo");
  Transaction moved(std::move(tx));
  EXPECT_THROW(tx.createVertex("foo"), TransactionClosed);
  moved.commit();

  auto check = store->begin();
  EXPECT_EQ(check.getVertices(VertexQuery::vertices({id})).size(), 1u);
}
