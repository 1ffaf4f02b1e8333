#include "cli.hpp"
#include "env.hpp"
#include "store.hpp"
#include <kj/main.h>
#include <kj/debug.h>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using lodestone::cli::parseUint64;
using lodestone::cli::printVertex;

class LodestoneApp
{
public:
  explicit LodestoneApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "Lodestone transactional vertex store")
        .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'d', "data"}, KJ_BIND_METHOD(*this, optData),
                          "dir", "data directory for LMDB (default: data)")
        .addOptionWithArg({'m', "map-size"}, KJ_BIND_METHOD(*this, optMapSize),
                          "bytes", "LMDB map size in bytes (default: 16GiB)")
        .addSubCommand("create", KJ_BIND_METHOD(*this, getCreateMain), "create a vertex and print its id")
        .addSubCommand("get", KJ_BIND_METHOD(*this, getGetMain), "print vertices by id")
        .addSubCommand("list", KJ_BIND_METHOD(*this, getListMain), "print vertices in id order")
        .addSubCommand("delete", KJ_BIND_METHOD(*this, getDeleteMain), "delete vertices by id")
        .addSubCommand("set", KJ_BIND_METHOD(*this, getSetMain), "set a vertex property")
        .addSubCommand("count", KJ_BIND_METHOD(*this, getCountMain), "count vertices, optionally of one type")
        .build();
  }

private:
  kj::ProcessContext &context_;
  kj::String dataDir_ = kj::heapString("data");
  size_t mapSizeBytes_ = size_t(16ull << 30);

  std::vector<uint64_t> ids_;
  std::vector<std::string> args_;

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optData(kj::StringPtr value)
  {
    dataDir_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optMapSize(kj::StringPtr value)
  {
    uint64_t n = 0;
    if (!parseUint64(value, n) || n == 0)
      return "map size must be a positive integer";
    mapSizeBytes_ = size_t(n);
    return true;
  }

  kj::MainBuilder::Validity addId(kj::StringPtr value)
  {
    uint64_t id = 0;
    if (!parseUint64(value, id))
      return "not a vertex id";
    ids_.push_back(id);
    return true;
  }

  kj::MainBuilder::Validity addArg(kj::StringPtr value)
  {
    args_.emplace_back(value.cStr());
    return true;
  }

  kj::MainFunc getCreateMain()
  {
    return kj::MainBuilder(context_, "0.1", "Creates a vertex of the given type.")
        .expectArg("type", KJ_BIND_METHOD(*this, addArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runCreate))
        .build();
  }

  kj::MainFunc getGetMain()
  {
    return kj::MainBuilder(context_, "0.1", "Prints the vertices with the given ids; missing ids are skipped.")
        .expectOneOrMoreArgs("id", KJ_BIND_METHOD(*this, addId))
        .callAfterParsing(KJ_BIND_METHOD(*this, runGet))
        .build();
  }

  kj::MainFunc getListMain()
  {
    return kj::MainBuilder(context_, "0.1", "Prints vertices with id >= from, at most limit of them (0 = all).")
        .expectOptionalArg("from", KJ_BIND_METHOD(*this, addId))
        .expectOptionalArg("limit", KJ_BIND_METHOD(*this, addId))
        .callAfterParsing(KJ_BIND_METHOD(*this, runList))
        .build();
  }

  kj::MainFunc getDeleteMain()
  {
    return kj::MainBuilder(context_, "0.1", "Deletes the vertices with the given ids.")
        .expectOneOrMoreArgs("id", KJ_BIND_METHOD(*this, addId))
        .callAfterParsing(KJ_BIND_METHOD(*this, runDelete))
        .build();
  }

  kj::MainFunc getSetMain()
  {
    return kj::MainBuilder(context_, "0.1", "Sets a property; value is parsed as bool, null, integer, double, else text.")
        .expectArg("id", KJ_BIND_METHOD(*this, addId))
        .expectArg("key", KJ_BIND_METHOD(*this, addArg))
        .expectArg("value", KJ_BIND_METHOD(*this, addArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runSet))
        .build();
  }

  kj::MainFunc getCountMain()
  {
    return kj::MainBuilder(context_, "0.1", "Prints the number of vertices, or of vertices with the given type.")
        .expectOptionalArg("type", KJ_BIND_METHOD(*this, addArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runCount))
        .build();
  }

  template <typename Fn>
  kj::MainBuilder::Validity withStore(Fn &&fn)
  {
    try
    {
      std::filesystem::create_directories(std::filesystem::path(dataDir_.cStr()));
      lodestone::Env env(std::filesystem::path(dataDir_.cStr()), mapSizeBytes_);
      lodestone::Store store(env);
      auto tx = store.begin();
      fn(tx);
      tx.commit();
    }
    catch (const lodestone::InvalidType &e)
    {
      return kj::MainBuilder::Validity(kj::str(e.what()));
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }

  kj::MainBuilder::Validity runCreate()
  {
    return withStore([this](lodestone::Transaction &tx)
                     { std::cout << tx.createVertex(args_.at(0)) << "\n"; });
  }

  kj::MainBuilder::Validity runGet()
  {
    return withStore([this](lodestone::Transaction &tx)
                     {
      for (const auto &v : tx.getVertices(lodestone::VertexQuery::vertices(ids_)))
        printVertex(std::cout, v); });
  }

  kj::MainBuilder::Validity runList()
  {
    uint64_t from = ids_.size() > 0 ? ids_[0] : 0;
    uint64_t limit = ids_.size() > 1 ? ids_[1] : 0;
    auto query = lodestone::cli::listQuery(from, limit);
    if (!query)
      return "limit too large";
    return withStore([&](lodestone::Transaction &tx)
                     {
      for (const auto &v : tx.getVertices(*query))
        printVertex(std::cout, v); });
  }

  kj::MainBuilder::Validity runDelete()
  {
    return withStore([this](lodestone::Transaction &tx)
                     {
      for (uint64_t id : ids_)
        tx.deleteVertex(id); });
  }

  kj::MainBuilder::Validity runSet()
  {
    uint64_t id = ids_.at(0);
    lodestone::Value value = lodestone::cli::parseValue(kj::StringPtr(args_.at(1).c_str()));
    return withStore([&](lodestone::Transaction &tx)
                     {
      if (!tx.setVertexProperty(id, args_.at(0), value))
        KJ_LOG(WARNING, "no such vertex", id); });
  }

  kj::MainBuilder::Validity runCount()
  {
    std::optional<std::string> type;
    if (!args_.empty())
      type = args_[0];
    return withStore([&](lodestone::Transaction &tx)
                     { std::cout << lodestone::cli::countVertices(tx, type) << "\n"; });
  }
};

KJ_MAIN(LodestoneApp);
