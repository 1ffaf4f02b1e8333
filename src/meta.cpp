#include "meta.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <cstring>
#include <string>

namespace lodestone
{

  bool mdb_get_val(MDB_txn *tx, DbHandle dbi, std::string_view key, MDB_val &out)
  {
    MDB_val k{key.size(), const_cast<char *>(key.data())};
    int rc = mdb_get(tx, dbi, &k, &out);
    if (rc == MDB_NOTFOUND)
      return false;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return true;
  }

  uint64_t read_u64_or(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t fallback)
  {
    MDB_val v{};
    if (!mdb_get_val(tx, dbi, key, v))
      return fallback;
    if (v.mv_size != 8)
      throw MdbError("corrupt meta value");
    return read_be64(static_cast<const unsigned char *>(v.mv_data));
  }

  void write_u64(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t value)
  {
    std::string bytes;
    bytes.reserve(8);
    put_be64(bytes, value);
    MDB_val k{key.size(), const_cast<char *>(key.data())};
    MDB_val v{bytes.size(), bytes.data()};
    int rc = mdb_put(tx, dbi, &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  void ensure_schema_version(Txn &tx, Env &env)
  {
    auto key = key_meta_schema_version();
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env.meta(), key, v))
    {
      std::string bytes;
      put_be32(bytes, kSchemaVersion);
      MDB_val k{key.size(), key.data()};
      MDB_val nv{bytes.size(), bytes.data()};
      int rc = mdb_put(tx.get(), env.meta(), &k, &nv, 0);
      if (rc)
        throw MdbError(mdb_strerror(rc));
      return;
    }
    if (v.mv_size != 4 || read_be32(static_cast<const unsigned char *>(v.mv_data)) != kSchemaVersion)
      throw MdbError("unsupported schema version");
  }

} // namespace lodestone
