#pragma once
#include "env.hpp"
#include "types.hpp"
#include <cstdint>
#include <mutex>

namespace lodestone
{

  // Hands out vertex ids from blocks reserved in the meta bucket. The
  // persisted ceiling only ever grows, so an id is never issued twice for
  // the lifetime of the data directory, even when the process dies with
  // part of a block unused.
  class IdGenerator
  {
  public:
    IdGenerator(Env &e, uint32_t blockSize);

    // Must not be called while the calling thread holds a write Txn.
    VertexId next();

  private:
    void reserveBlock();

    Env &env_;
    uint32_t blockSize_;
    std::mutex mu_;
    VertexId next_{1};
    VertexId ceiling_{0}; // last id of the reserved block, inclusive
  };

} // namespace lodestone
