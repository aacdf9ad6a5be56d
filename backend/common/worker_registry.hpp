#pragma once
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace common {

// One thread per long-running task, for work that would otherwise hold a pool
// worker for minutes. Finished threads are reaped on the next spawn; the
// destructor waits for whatever is still running.
class WorkerRegistry {
public:
  WorkerRegistry() = default;
  ~WorkerRegistry();

  WorkerRegistry(const WorkerRegistry&) = delete;
  WorkerRegistry& operator=(const WorkerRegistry&) = delete;

  // Throws std::runtime_error once the registry is shutting down.
  void spawn(std::function<void()> task);

  size_t running() const;

private:
  struct Worker {
    std::shared_ptr<std::atomic_bool> done;
    std::jthread thread;
  };

  void reapFinished();

  mutable std::mutex _mtx;
  std::list<Worker> _workers;
  bool _stop{false};
};

} // namespace common
