#pragma once
#include "env.hpp"
#include "types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lodestone
{

  class Store;

  // A unit of snapshot-isolated work against a Store. Reads come from the
  // LMDB snapshot taken at Store::begin() overlaid with this transaction's
  // own buffered writes; writes reach the store only on commit().
  //
  // Every operation throws TransactionClosed once the transaction has been
  // committed or rolled back. Destroying an open transaction rolls it back.
  class Transaction
  {
  public:
    enum class State : uint8_t
    {
      Open,
      Committed,
      RolledBack
    };

    ~Transaction() noexcept;
    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;
    Transaction(Transaction &&other) noexcept;
    Transaction &operator=(Transaction &&) = delete;

    // Throws InvalidType if the label is not 1..255 of [A-Za-z0-9_-].
    VertexId createVertex(const std::string &type);

    // Ids that are not visible are left out of the result. A range query
    // returns vertices in ascending id order.
    std::vector<Vertex> getVertices(const VertexQuery &query);

    // No-op if the vertex is not visible.
    void deleteVertex(VertexId id);

    // Return false when no vertex with that id is visible.
    bool setVertexProperty(VertexId id, const std::string &key, Value value);
    bool deleteVertexProperty(VertexId id, const std::string &key);
    std::optional<Value> getVertexProperty(VertexId id, const std::string &key);

    uint64_t vertexCount();

    // Throws TransactionConflict if a vertex this transaction modified was
    // rewritten or deleted by a commit after this transaction began; the
    // transaction is rolled back in that case.
    void commit();
    void rollback() noexcept;

    State state() const { return state_; }
    uint64_t snapshotSeq() const { return snapshotSeq_; }

  private:
    friend class Store;
    Transaction(Store &store, Txn snapshot, uint64_t snapshotSeq);

    void ensureOpen() const;
    std::optional<Vertex> readSnapshot(VertexId id) const;
    std::optional<Vertex> lookup(VertexId id) const;
    Vertex *stage(VertexId id);
    void scanRange(const VertexQuery::Range &range, std::vector<Vertex> &out) const;

    Store &store_;
    Txn snapshot_;
    uint64_t snapshotSeq_{0};
    State state_{State::Open};
    std::map<VertexId, std::optional<Vertex>> writes_; // nullopt marks a delete
    std::set<VertexId> fromSnapshot_;                  // written ids that exist in the snapshot
  };

} // namespace lodestone
