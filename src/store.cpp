#include "store.hpp"
#include "encode.hpp"
#include "meta.hpp"
#include "record.hpp"
#include <lmdb.h>
#include <kj/debug.h>
#include <string>
#include <utility>

namespace lodestone
{

  Store::Store(Env &e, StoreOptions options) : env_(e), ids_(e, options.idBlockSize)
  {
    Txn tx(env_.raw(), true);
    ensure_schema_version(tx, env_);
    tx.commit();
  }

  Transaction Store::begin()
  {
    Txn snapshot(env_.raw(), false);
    uint64_t seq = read_u64_or(snapshot.get(), env_.meta(), key_meta_commit_seq(), 0);
    return Transaction(*this, std::move(snapshot), seq);
  }

  uint64_t Store::lastCommitSeq()
  {
    Txn tx(env_.raw(), false);
    return read_u64_or(tx.get(), env_.meta(), key_meta_commit_seq(), 0);
  }

  VertexId Store::nextVertexId()
  {
    return ids_.next();
  }

  // First-committer-wins: every buffered write to a vertex that existed in
  // the writer's snapshot must still find that vertex at a version no newer
  // than the snapshot.
  void Store::commit(const Transaction &t)
  {
    std::lock_guard<std::mutex> lock(commitMutex_);
    Txn tx(env_.raw(), true);

    for (VertexId id : t.fromSnapshot_)
    {
      const auto &write = t.writes_.at(id);
      auto key = key_vertex_be(id);
      MDB_val v{};
      if (!mdb_get_val(tx.get(), env_.vertices(), key, v))
      {
        if (write)
        {
          KJ_LOG(WARNING, "commit conflict: vertex deleted concurrently", id, t.snapshotSeq_);
          throw TransactionConflict("vertex " + std::to_string(id) + " was deleted by a concurrent transaction");
        }
        continue;
      }
      auto current = decode_vertex_record(id, std::string_view(static_cast<const char *>(v.mv_data), v.mv_size));
      if (current.version > t.snapshotSeq_)
      {
        KJ_LOG(WARNING, "commit conflict: vertex rewritten concurrently", id, current.version, t.snapshotSeq_);
        throw TransactionConflict("vertex " + std::to_string(id) + " was modified by a concurrent transaction");
      }
    }

    uint64_t seq = read_u64_or(tx.get(), env_.meta(), key_meta_commit_seq(), 0) + 1;
    for (const auto &[id, write] : t.writes_)
    {
      auto key = key_vertex_be(id);
      MDB_val k{key.size(), key.data()};
      if (write)
      {
        auto bytes = encode_vertex_record(*write, seq);
        MDB_val v{bytes.size(), bytes.data()};
        int rc = mdb_put(tx.get(), env_.vertices(), &k, &v, 0);
        if (rc)
          throw MdbError(mdb_strerror(rc));
      }
      else
      {
        int rc = mdb_del(tx.get(), env_.vertices(), &k, nullptr);
        if (rc != 0 && rc != MDB_NOTFOUND)
          throw MdbError(mdb_strerror(rc));
      }
    }
    write_u64(tx.get(), env_.meta(), key_meta_commit_seq(), seq);
    tx.commit();
  }

} // namespace lodestone
