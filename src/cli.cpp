#include "cli.hpp"
#include "transaction.hpp"
#include <charconv>
#include <cstdlib>
#include <limits>

namespace lodestone
{
  namespace cli
  {

    bool parseUint64(kj::StringPtr s, uint64_t &out)
    {
      out = 0;
      if (s.size() == 0)
        return false;
      const char *b = s.begin();
      const char *e = s.end();
      auto res = std::from_chars(b, e, out);
      return res.ec == std::errc{} && res.ptr == e;
    }

    Value parseValue(kj::StringPtr s)
    {
      if (s == "true")
        return true;
      if (s == "false")
        return false;
      if (s == "null")
        return std::monostate{};
      int64_t i64{};
      auto ri = std::from_chars(s.begin(), s.end(), i64);
      if (s.size() > 0 && ri.ec == std::errc{} && ri.ptr == s.end())
        return i64;
      char *endp = nullptr;
      double d = std::strtod(s.cStr(), &endp);
      if (s.size() > 0 && endp && *endp == '\0')
        return d;
      return std::string(s.cStr());
    }

    void printValue(std::ostream &os, const Value &v)
    {
      if (std::holds_alternative<int64_t>(v))
        os << std::get<int64_t>(v);
      else if (std::holds_alternative<double>(v))
        os << std::get<double>(v);
      else if (std::holds_alternative<bool>(v))
        os << (std::get<bool>(v) ? "true" : "false");
      else if (std::holds_alternative<std::string>(v))
        os << '"' << std::get<std::string>(v) << '"';
      else
        os << "null";
    }

    void printVertex(std::ostream &os, const Vertex &v)
    {
      os << v.id << "\t" << v.type;
      for (const auto &[key, val] : v.properties)
      {
        os << "\t" << key << "=";
        printValue(os, val);
      }
      os << "\n";
    }

    std::optional<VertexQuery> listQuery(uint64_t from, uint64_t limit)
    {
      if (limit > std::numeric_limits<uint32_t>::max())
        return std::nullopt;
      return VertexQuery::all(from, uint32_t(limit));
    }

    uint64_t countVertices(Transaction &tx, const std::optional<std::string> &type,
                           const MapReduceOptions &options)
    {
      if (!type)
        return tx.vertexCount();
      const std::string wanted = *type;
      auto total = runMapReduce(
          tx,
          [wanted](const Vertex &v) -> Value
          { return int64_t(v.type == wanted ? 1 : 0); },
          [](const Value &a, const Value &b) -> Value
          { return std::get<int64_t>(a) + std::get<int64_t>(b); },
          options);
      // null when the transaction sees no vertices at all
      if (std::holds_alternative<int64_t>(total))
        return uint64_t(std::get<int64_t>(total));
      return 0;
    }

  } // namespace cli
} // namespace lodestone
