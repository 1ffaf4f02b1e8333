#pragma once
#include "env.hpp"
#include <cstdint>
#include <string_view>

struct MDB_val;

namespace lodestone
{

  // Small helpers over mdb_get/mdb_put shared by the store and the id
  // generator. All of them throw MdbError on any LMDB failure other than
  // a missing key. read_u64_or also throws when the stored value is not
  // eight bytes.

  bool mdb_get_val(MDB_txn *tx, DbHandle dbi, std::string_view key, MDB_val &out);
  uint64_t read_u64_or(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t fallback);
  void write_u64(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t value);

  constexpr uint32_t kSchemaVersion = 1;

  // Writes the schema version on first use; throws MdbError if the data
  // directory was written with a different one.
  void ensure_schema_version(Txn &tx, Env &env);

} // namespace lodestone
