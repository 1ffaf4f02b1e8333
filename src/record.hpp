#pragma once
#include "types.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace lodestone
{

  // A vertex as stored in the `vertices` bucket, plus the commit sequence
  // number of the transaction that last wrote it.
  struct VertexRecord
  {
    Vertex vertex{};
    uint64_t version{0};
  };

  // Layout: <u8 format>|<u64 version>|<u8 typeLen><type>|<u32 count>{<u32 keyLen><key><value>}
  std::string encode_vertex_record(const Vertex &v, uint64_t version);

  // Throws MdbError on malformed input.
  VertexRecord decode_vertex_record(VertexId id, std::string_view bytes);

} // namespace lodestone
