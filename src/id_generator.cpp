#include "id_generator.hpp"
#include "encode.hpp"
#include "meta.hpp"
#include <kj/debug.h>
#include <algorithm>
#include <limits>

namespace lodestone
{

  IdGenerator::IdGenerator(Env &e, uint32_t blockSize) : env_(e), blockSize_(std::max<uint32_t>(blockSize, 1)) {}

  VertexId IdGenerator::next()
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (next_ > ceiling_ || next_ == 0)
      reserveBlock();
    return next_++;
  }

  void IdGenerator::reserveBlock()
  {
    Txn tx(env_.raw(), true);
    ensure_schema_version(tx, env_);
    auto key = key_meta_vertex_id_ceiling();
    uint64_t current = read_u64_or(tx.get(), env_.meta(), key, 0);
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    if (current == kMax)
    {
      KJ_FAIL_ASSERT("vertex id space exhausted");
    }
    uint64_t grant = std::min<uint64_t>(blockSize_, kMax - current);
    write_u64(tx.get(), env_.meta(), key, current + grant);
    tx.commit();

    next_ = current + 1;
    ceiling_ = current + grant;
    KJ_LOG(INFO, "reserved vertex id block", next_, ceiling_);
  }

} // namespace lodestone
