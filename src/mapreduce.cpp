#include "mapreduce.hpp"
#include "transaction.hpp"
#include <kj/debug.h>
#include <kj/exception.h>
#include <algorithm>
#include <system_error>
#include <utility>

namespace lodestone
{

  namespace
  {

    std::string describe(const std::exception_ptr &e)
    {
      try
      {
        std::rethrow_exception(e);
      }
      catch (const std::exception &ex)
      {
        return ex.what();
      }
      catch (const kj::Exception &ex)
      {
        return ex.getDescription().cStr();
      }
      catch (...)
      {
        return "unknown exception";
      }
    }

  } // namespace

  MapReduceError::MapReduceError(Kind kind, const std::string &what, std::exception_ptr cause)
      : std::runtime_error(what), kind_(kind), cause_(std::move(cause)) {}

  MapReducePool::MapReducePool(MapFn map, ReduceFn reduce, const MapReduceOptions &options)
      : map_(std::move(map)),
        reduce_(std::move(reduce)),
        capacity_(std::max<size_t>(options.queueCapacity, 1)),
        reportInterval_(std::max(options.reportInterval, std::chrono::milliseconds(1)))
  {
    unsigned n = std::max(options.workers, 1u);
    workers_.reserve(n);
    try
    {
      for (unsigned i = 0; i < n; ++i)
        workers_.emplace_back([this]()
                              { workerLoop(); });
    }
    catch (const std::system_error &)
    {
      auto cause = std::current_exception();
      KJ_LOG(ERROR, "map-reduce worker setup failed", workers_.size(), n);
      stopWorkers();
      throw MapReduceError(MapReduceError::Kind::WorkerSetup, "worker setup: " + describe(cause), cause);
    }
  }

  MapReducePool::~MapReducePool() noexcept
  {
    stopWorkers();
  }

  bool MapReducePool::addVertex(Vertex v)
  {
    std::unique_lock<std::mutex> lock(mu_);
    spaceAvailable_.wait(lock, [this]()
                         { return queue_.size() < capacity_ || failure_ || stopping_; });
    if (failure_ || stopping_)
      return false;
    queue_.emplace_back(std::move(v));
    ++pending_;
    ++progress_;
    workAvailable_.notify_one();
    return true;
  }

  Value MapReducePool::join()
  {
    {
      std::unique_lock<std::mutex> lock(mu_);
      while (!idle_.wait_for(lock, reportInterval_, [this]()
                             { return pending_ == 0 || failure_; }))
        KJ_LOG(INFO, "map-reduce report", progress_, pending_);
      KJ_LOG(INFO, "map-reduce winding down", progress_, pending_);
    }
    stopWorkers();
    if (failure_)
    {
      KJ_LOG(ERROR, "map-reduce aborted after a failed task");
      std::rethrow_exception(failure_);
    }
    if (!carry_)
      return std::monostate{};
    return std::move(*carry_);
  }

  uint64_t MapReducePool::progress() const
  {
    std::lock_guard<std::mutex> lock(mu_);
    return progress_;
  }

  void MapReducePool::stopWorkers() noexcept
  {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopping_ = true;
    }
    workAvailable_.notify_all();
    spaceAvailable_.notify_all();
    for (auto &t : workers_)
    {
      if (t.joinable())
        t.join();
    }
  }

  // Each finished task either parks its value in carry_ or pairs it with
  // the parked value as a new reduce task, so the pool converges to a
  // single value once pending_ reaches zero.
  void MapReducePool::workerLoop()
  {
    for (;;)
    {
      Task task;
      {
        std::unique_lock<std::mutex> lock(mu_);
        workAvailable_.wait(lock, [this]()
                            { return !queue_.empty() || stopping_ || failure_; });
        if (stopping_ || failure_)
          return;
        task = std::move(queue_.front());
        queue_.pop_front();
        spaceAvailable_.notify_one();
      }

      Value result;
      bool mapping = std::holds_alternative<Vertex>(task);
      try
      {
        if (mapping)
          result = map_(std::get<Vertex>(task));
        else
        {
          auto &r = std::get<Reduce>(task);
          result = reduce_(r.first, r.second);
        }
      }
      catch (...)
      {
        auto cause = std::current_exception();
        auto error = mapping
                         ? MapReduceError(MapReduceError::Kind::MapCall, "map call: " + describe(cause), cause)
                         : MapReduceError(MapReduceError::Kind::ReduceCall, "reduce call: " + describe(cause), cause);
        std::lock_guard<std::mutex> lock(mu_);
        if (!failure_)
          failure_ = std::make_exception_ptr(std::move(error));
        idle_.notify_all();
        spaceAvailable_.notify_all();
        workAvailable_.notify_all();
        return;
      }

      std::lock_guard<std::mutex> lock(mu_);
      if (carry_)
      {
        queue_.emplace_back(Reduce{std::move(*carry_), std::move(result)});
        carry_.reset();
        ++pending_;
        workAvailable_.notify_one();
      }
      else
      {
        carry_ = std::move(result);
      }
      if (--pending_ == 0)
        idle_.notify_all();
    }
  }

  Value runMapReduce(Transaction &tx, MapFn map, ReduceFn reduce, const MapReduceOptions &options)
  {
    MapReducePool pool(std::move(map), std::move(reduce), options);
    uint32_t batch = std::max<uint32_t>(options.scanBatch, 1);
    VertexId from = 0;
    for (;;)
    {
      auto vertices = tx.getVertices(VertexQuery::all(from, batch));
      for (auto &v : vertices)
      {
        if (!pool.addVertex(v))
          return pool.join();
      }
      if (vertices.size() < batch)
        break;
      from = vertices.back().id + 1;
    }
    return pool.join();
  }

} // namespace lodestone
