#include "record.hpp"
#include "encode.hpp"
#include "env.hpp"
#include <cstring>

namespace lodestone
{

  namespace
  {

    constexpr uint8_t kRecordFormat = 1;

    enum class ValueTag : uint8_t
    {
      I64 = 0,
      F64 = 1,
      Bool = 2,
      Text = 3,
      Null = 4
    };

    void encode_value(std::string &out, const Value &v)
    {
      if (std::holds_alternative<int64_t>(v))
      {
        out.push_back(char(ValueTag::I64));
        put_be64(out, static_cast<uint64_t>(std::get<int64_t>(v)));
        return;
      }
      if (std::holds_alternative<double>(v))
      {
        out.push_back(char(ValueTag::F64));
        double d = std::get<double>(v);
        static_assert(sizeof(double) == 8, "double not 8 bytes");
        uint64_t ux;
        std::memcpy(&ux, &d, 8);
        put_be64(out, ux);
        return;
      }
      if (std::holds_alternative<bool>(v))
      {
        out.push_back(char(ValueTag::Bool));
        out.push_back(std::get<bool>(v) ? 1 : 0);
        return;
      }
      if (std::holds_alternative<std::string>(v))
      {
        out.push_back(char(ValueTag::Text));
        const auto &s = std::get<std::string>(v);
        put_be32(out, static_cast<uint32_t>(s.size()));
        out.append(s);
        return;
      }
      out.push_back(char(ValueTag::Null));
    }

    const unsigned char *decode_value(const unsigned char *p, const unsigned char *end, Value &out)
    {
      if (p >= end)
        throw MdbError("corrupt value: empty");
      auto tag = static_cast<ValueTag>(*p++);
      switch (tag)
      {
      case ValueTag::I64:
      {
        if (end - p < 8)
          throw MdbError("corrupt i64");
        out = static_cast<int64_t>(read_be64(p));
        return p + 8;
      }
      case ValueTag::F64:
      {
        if (end - p < 8)
          throw MdbError("corrupt f64");
        uint64_t ux = read_be64(p);
        double d;
        std::memcpy(&d, &ux, 8);
        out = d;
        return p + 8;
      }
      case ValueTag::Bool:
      {
        if (end - p < 1)
          throw MdbError("corrupt bool");
        out = (*p != 0);
        return p + 1;
      }
      case ValueTag::Text:
      {
        if (end - p < 4)
          throw MdbError("corrupt text length");
        uint32_t len = read_be32(p);
        p += 4;
        if (static_cast<size_t>(end - p) < len)
          throw MdbError("corrupt text payload");
        out = std::string(reinterpret_cast<const char *>(p), len);
        return p + len;
      }
      case ValueTag::Null:
        out = std::monostate{};
        return p;
      }
      throw MdbError("corrupt value: unknown tag");
    }

  } // namespace

  std::string encode_vertex_record(const Vertex &v, uint64_t version)
  {
    std::string out;
    out.reserve(1 + 8 + 1 + v.type.size() + 4 + v.properties.size() * 16);
    out.push_back(char(kRecordFormat));
    put_be64(out, version);
    out.push_back(char(static_cast<uint8_t>(v.type.size())));
    out.append(v.type);
    put_be32(out, static_cast<uint32_t>(v.properties.size()));
    for (const auto &[key, val] : v.properties)
    {
      put_be32(out, static_cast<uint32_t>(key.size()));
      out.append(key);
      encode_value(out, val);
    }
    return out;
  }

  VertexRecord decode_vertex_record(VertexId id, std::string_view bytes)
  {
    const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
    const unsigned char *end = p + bytes.size();

    if (end - p < 1 + 8 + 1)
      throw MdbError("corrupt vertex record: short header");
    if (*p++ != kRecordFormat)
      throw MdbError("corrupt vertex record: unknown format");

    VertexRecord rec{};
    rec.vertex.id = id;
    rec.version = read_be64(p);
    p += 8;

    uint8_t typeLen = *p++;
    if (end - p < typeLen)
      throw MdbError("corrupt vertex record: type");
    rec.vertex.type.assign(reinterpret_cast<const char *>(p), typeLen);
    p += typeLen;

    if (end - p < 4)
      throw MdbError("corrupt vertex record: property count");
    uint32_t count = read_be32(p);
    p += 4;
    for (uint32_t i = 0; i < count; ++i)
    {
      if (end - p < 4)
        throw MdbError("corrupt vertex record: key length");
      uint32_t keyLen = read_be32(p);
      p += 4;
      if (static_cast<size_t>(end - p) < keyLen)
        throw MdbError("corrupt vertex record: key");
      std::string key(reinterpret_cast<const char *>(p), keyLen);
      p += keyLen;
      Value val{};
      p = decode_value(p, end, val);
      rec.vertex.properties.emplace(std::move(key), std::move(val));
    }
    if (p != end)
      throw MdbError("corrupt vertex record: trailing bytes");
    return rec;
  }

} // namespace lodestone
