#include "transaction.hpp"
#include "encode.hpp"
#include "meta.hpp"
#include "record.hpp"
#include "store.hpp"
#include <lmdb.h>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace lodestone
{

  namespace
  {

    class Cursor
    {
    public:
      Cursor(MDB_txn *tx, DbHandle dbi)
      {
        int rc = mdb_cursor_open(tx, dbi, &cur_);
        if (rc)
          throw MdbError(mdb_strerror(rc));
      }
      ~Cursor() noexcept { mdb_cursor_close(cur_); }
      Cursor(const Cursor &) = delete;
      Cursor &operator=(const Cursor &) = delete;

      MDB_cursor *get() const { return cur_; }

    private:
      MDB_cursor *cur_{};
    };

    std::string_view as_view(const MDB_val &v)
    {
      return std::string_view(static_cast<const char *>(v.mv_data), v.mv_size);
    }

  } // namespace

  Transaction::Transaction(Store &store, Txn snapshot, uint64_t snapshotSeq)
      : store_(store), snapshot_(std::move(snapshot)), snapshotSeq_(snapshotSeq) {}

  Transaction::~Transaction() noexcept
  {
    rollback();
  }

  Transaction::Transaction(Transaction &&other) noexcept
      : store_(other.store_),
        snapshot_(std::move(other.snapshot_)),
        snapshotSeq_(other.snapshotSeq_),
        state_(other.state_),
        writes_(std::move(other.writes_)),
        fromSnapshot_(std::move(other.fromSnapshot_))
  {
    other.state_ = State::RolledBack;
  }

  void Transaction::ensureOpen() const
  {
    if (state_ != State::Open)
      throw TransactionClosed(state_ == State::Committed ? "transaction already committed" : "transaction already rolled back");
  }

  std::optional<Vertex> Transaction::readSnapshot(VertexId id) const
  {
    auto key = key_vertex_be(id);
    MDB_val v{};
    if (!mdb_get_val(snapshot_.get(), store_.env_.vertices(), key, v))
      return std::nullopt;
    return decode_vertex_record(id, as_view(v)).vertex;
  }

  std::optional<Vertex> Transaction::lookup(VertexId id) const
  {
    auto it = writes_.find(id);
    if (it != writes_.end())
      return it->second;
    return readSnapshot(id);
  }

  Vertex *Transaction::stage(VertexId id)
  {
    auto it = writes_.find(id);
    if (it != writes_.end())
      return it->second ? &*it->second : nullptr;
    auto existing = readSnapshot(id);
    if (!existing)
      return nullptr;
    fromSnapshot_.insert(id);
    auto &slot = writes_[id];
    slot = std::move(existing);
    return &*slot;
  }

  VertexId Transaction::createVertex(const std::string &type)
  {
    ensureOpen();
    if (!isValidType(type))
      throw InvalidType("invalid vertex type: '" + type + "'");
    VertexId id = store_.nextVertexId();
    writes_[id] = Vertex{id, type, {}};
    return id;
  }

  std::vector<Vertex> Transaction::getVertices(const VertexQuery &query)
  {
    ensureOpen();
    std::vector<Vertex> out;
    if (auto *byIds = std::get_if<VertexQuery::ByIds>(&query.selector()))
    {
      std::unordered_set<VertexId> seen;
      out.reserve(byIds->ids.size());
      for (VertexId id : byIds->ids)
      {
        if (!seen.insert(id).second)
          continue;
        if (auto v = lookup(id))
          out.push_back(std::move(*v));
      }
      return out;
    }
    scanRange(std::get<VertexQuery::Range>(query.selector()), out);
    return out;
  }

  // Merges the snapshot cursor with the ordered write buffer; a buffered
  // write shadows the snapshot record with the same id.
  void Transaction::scanRange(const VertexQuery::Range &range, std::vector<Vertex> &out) const
  {
    Cursor cur(snapshot_.get(), store_.env_.vertices());
    auto start = key_vertex_be(range.from);
    MDB_val k{start.size(), start.data()}, v{};
    int rc = mdb_cursor_get(cur.get(), &k, &v, MDB_SET_RANGE);
    auto wit = writes_.lower_bound(range.from);

    while (range.limit == 0 || out.size() < range.limit)
    {
      if (rc != 0 && rc != MDB_NOTFOUND)
        throw MdbError(mdb_strerror(rc));
      bool haveSnap = rc == 0;
      bool haveWrite = wit != writes_.end();
      if (!haveSnap && !haveWrite)
        break;

      VertexId snapId = haveSnap ? vertex_id_from_key(as_view(k)) : 0;
      if (haveWrite && (!haveSnap || wit->first <= snapId))
      {
        if (haveSnap && wit->first == snapId)
          rc = mdb_cursor_get(cur.get(), &k, &v, MDB_NEXT);
        if (wit->second)
          out.push_back(*wit->second);
        ++wit;
        continue;
      }
      out.push_back(decode_vertex_record(snapId, as_view(v)).vertex);
      rc = mdb_cursor_get(cur.get(), &k, &v, MDB_NEXT);
    }
  }

  void Transaction::deleteVertex(VertexId id)
  {
    ensureOpen();
    auto it = writes_.find(id);
    if (it != writes_.end())
    {
      if (fromSnapshot_.count(id))
        it->second.reset();
      else
        writes_.erase(it);
      return;
    }
    if (readSnapshot(id))
    {
      fromSnapshot_.insert(id);
      writes_[id] = std::nullopt;
    }
  }

  bool Transaction::setVertexProperty(VertexId id, const std::string &key, Value value)
  {
    ensureOpen();
    if (key.empty())
      throw InvalidProperty("property key must not be empty");
    Vertex *v = stage(id);
    if (!v)
      return false;
    v->properties[key] = std::move(value);
    return true;
  }

  bool Transaction::deleteVertexProperty(VertexId id, const std::string &key)
  {
    ensureOpen();
    auto visible = lookup(id);
    if (!visible || !visible->properties.count(key))
      return false;
    stage(id)->properties.erase(key);
    return true;
  }

  std::optional<Value> Transaction::getVertexProperty(VertexId id, const std::string &key)
  {
    ensureOpen();
    auto v = lookup(id);
    if (!v)
      return std::nullopt;
    auto it = v->properties.find(key);
    if (it == v->properties.end())
      return std::nullopt;
    return it->second;
  }

  uint64_t Transaction::vertexCount()
  {
    ensureOpen();
    MDB_stat st{};
    int rc = mdb_stat(snapshot_.get(), store_.env_.vertices(), &st);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    uint64_t count = st.ms_entries;
    for (const auto &[id, write] : writes_)
    {
      bool existed = fromSnapshot_.count(id) != 0;
      if (write && !existed)
        ++count;
      else if (!write && existed)
        --count;
    }
    return count;
  }

  void Transaction::commit()
  {
    ensureOpen();
    try
    {
      if (!writes_.empty())
        store_.commit(*this);
    }
    catch (...)
    {
      rollback();
      throw;
    }
    state_ = State::Committed;
    snapshot_.abort();
    writes_.clear();
    fromSnapshot_.clear();
  }

  void Transaction::rollback() noexcept
  {
    if (state_ != State::Open)
      return;
    state_ = State::RolledBack;
    snapshot_.abort();
    writes_.clear();
    fromSnapshot_.clear();
  }

} // namespace lodestone
