#pragma once
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace lodestone
{

  class Transaction;

  using MapFn = std::function<Value(const Vertex &)>;
  // Must be associative and commutative; pairs are folded in completion order.
  using ReduceFn = std::function<Value(const Value &, const Value &)>;

  struct MapReduceOptions
  {
    unsigned workers{4};
    size_t queueCapacity{1000};
    uint32_t scanBatch{512};
    std::chrono::milliseconds reportInterval{std::chrono::seconds(30)};
  };

  // Raised by MapReducePool::join() and runMapReduce(). cause() holds the
  // exception thrown by the map or reduce callable, or by thread creation.
  class MapReduceError : public std::runtime_error
  {
  public:
    enum class Kind : uint8_t
    {
      WorkerSetup,
      MapCall,
      ReduceCall
    };

    MapReduceError(Kind kind, const std::string &what, std::exception_ptr cause);

    Kind kind() const { return kind_; }
    std::exception_ptr cause() const { return cause_; }

  private:
    Kind kind_;
    std::exception_ptr cause_;
  };

  class MapReducePool
  {
  public:
    MapReducePool(MapFn map, ReduceFn reduce, const MapReduceOptions &options = {});
    ~MapReducePool() noexcept;
    MapReducePool(const MapReducePool &) = delete;
    MapReducePool &operator=(const MapReducePool &) = delete;

    // Blocks while the queue is full. Returns false once a map or reduce
    // call has failed; the failure is reported by join().
    bool addVertex(Vertex v);

    // Waits for every queued task and returns the folded value, or null
    // (std::monostate) if no vertex was added. Throws MapReduceError for the
    // first map or reduce call that failed. Logs progress every
    // reportInterval while it waits.
    Value join();

    // Number of vertices handed to addVertex() so far.
    uint64_t progress() const;

  private:
    struct Reduce
    {
      Value first;
      Value second;
    };
    using Task = std::variant<Vertex, Reduce>;

    void workerLoop();
    void stopWorkers() noexcept;

    MapFn map_;
    ReduceFn reduce_;
    size_t capacity_;
    std::chrono::milliseconds reportInterval_;

    mutable std::mutex mu_;
    std::condition_variable workAvailable_;
    std::condition_variable spaceAvailable_;
    std::condition_variable idle_;
    std::deque<Task> queue_;
    size_t pending_{0}; // queued or running tasks
    uint64_t progress_{0};
    std::optional<Value> carry_;
    std::exception_ptr failure_;
    bool stopping_{false};

    std::vector<std::thread> workers_;
  };

  // Maps every vertex visible to tx and folds the results.
  Value runMapReduce(Transaction &tx, MapFn map, ReduceFn reduce, const MapReduceOptions &options = {});

} // namespace lodestone
