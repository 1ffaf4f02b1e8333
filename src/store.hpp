#pragma once
#include "env.hpp"
#include "id_generator.hpp"
#include "transaction.hpp"
#include "types.hpp"
#include <cstdint>
#include <mutex>

namespace lodestone
{

  struct StoreOptions
  {
    uint32_t idBlockSize{1024}; // ids reserved per write to the meta bucket
  };

  class Store
  {
  public:
    explicit Store(Env &e, StoreOptions options = {});
    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    // Takes an LMDB read snapshot; the returned transaction must not
    // outlive the store.
    Transaction begin();

    // Sequence number of the most recent successful commit.
    uint64_t lastCommitSeq();

  private:
    friend class Transaction;

    VertexId nextVertexId();
    void commit(const Transaction &t);

    Env &env_;
    IdGenerator ids_;
    std::mutex commitMutex_;
  };

} // namespace lodestone
