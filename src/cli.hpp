#pragma once
#include "mapreduce.hpp"
#include "types.hpp"
#include <kj/string.h>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace lodestone
{

  class Transaction;

  // Argument parsing and output formatting behind the lodestone command.
  namespace cli
  {

    // Accepts only a full decimal number.
    bool parseUint64(kj::StringPtr s, uint64_t &out);

    // "true"/"false", "null", then integer, then double, else text.
    Value parseValue(kj::StringPtr s);

    void printValue(std::ostream &os, const Value &v);

    // id, type, then key=value per property, tab separated.
    void printVertex(std::ostream &os, const Vertex &v);

    // Returns nullopt when limit does not fit a range query.
    std::optional<VertexQuery> listQuery(uint64_t from, uint64_t limit);

    // Counts the vertices visible to tx. With a type, counting goes
    // through runMapReduce.
    uint64_t countVertices(Transaction &tx, const std::optional<std::string> &type,
                           const MapReduceOptions &options = {});

  } // namespace cli
} // namespace lodestone
