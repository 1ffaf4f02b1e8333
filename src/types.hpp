#pragma once
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lodestone
{

  using VertexId = uint64_t;

  using Value = std::variant<int64_t, double, bool, std::string, std::monostate>;

  using PropertyMap = std::map<std::string, Value>;

  struct Vertex
  {
    VertexId id{0};
    std::string type{};
    PropertyMap properties{};
  };

  inline bool operator==(const Vertex &a, const Vertex &b)
  {
    return a.id == b.id && a.type == b.type && a.properties == b.properties;
  }

  // -------------------- errors ---------------------------

  struct InvalidType : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  struct InvalidProperty : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  struct TransactionClosed : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  struct TransactionConflict : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  constexpr size_t kMaxTypeLength = 255;

  // Letters, digits, '-' and '_', 1..255 bytes.
  bool isValidType(std::string_view type);

  // -------------------- queries ---------------------------

  class VertexQuery
  {
  public:
    struct ByIds
    {
      std::vector<VertexId> ids{};
    };
    struct Range
    {
      VertexId from{0};
      uint32_t limit{0}; // 0 -> unlimited
    };

    static VertexQuery vertices(std::vector<VertexId> ids);
    static VertexQuery all(VertexId from = 0, uint32_t limit = 0);

    const std::variant<ByIds, Range> &selector() const { return selector_; }

  private:
    explicit VertexQuery(std::variant<ByIds, Range> selector) : selector_(std::move(selector)) {}

    std::variant<ByIds, Range> selector_;
  };

} // namespace lodestone
