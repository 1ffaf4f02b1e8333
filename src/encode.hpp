#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace lodestone
{

  inline void put_be64(std::string &s, uint64_t x)
  {
    for (int i = 7; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }
  inline void put_be32(std::string &s, uint32_t x)
  {
    for (int i = 3; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }

  inline uint64_t read_be64(const unsigned char *p)
  {
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i)
      x = (x << 8) | p[i];
    return x;
  }
  inline uint32_t read_be32(const unsigned char *p)
  {
    uint32_t x = 0;
    for (int i = 0; i < 4; ++i)
      x = (x << 8) | p[i];
    return x;
  }

  // vertices: <u64 vertexId>, big-endian so cursor order is id order
  inline std::string key_vertex_be(uint64_t vertexId)
  {
    std::string k;
    k.reserve(8);
    put_be64(k, vertexId);
    return k;
  }

  inline uint64_t vertex_id_from_key(std::string_view key)
  {
    if (key.size() != 8)
      return 0;
    return read_be64(reinterpret_cast<const unsigned char *>(key.data()));
  }

  // meta bucket string keys
  inline std::string key_meta_schema_version() { return std::string("schemaVersion"); }
  inline std::string key_meta_vertex_id_ceiling() { return std::string("vertexIdCeiling"); }
  inline std::string key_meta_commit_seq() { return std::string("commitSeq"); }

} // namespace lodestone
