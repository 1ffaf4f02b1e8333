#include "types.hpp"

namespace lodestone
{

  bool isValidType(std::string_view type)
  {
    if (type.empty() || type.size() > kMaxTypeLength)
      return false;
    for (char c : type)
    {
      bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
      if (!ok)
        return false;
    }
    return true;
  }

  VertexQuery VertexQuery::vertices(std::vector<VertexId> ids)
  {
    return VertexQuery(ByIds{std::move(ids)});
  }

  VertexQuery VertexQuery::all(VertexId from, uint32_t limit)
  {
    return VertexQuery(Range{from, limit});
  }

} // namespace lodestone
