#include "worker_registry.hpp"
#include <iostream>
#include <stdexcept>

namespace common {

WorkerRegistry::~WorkerRegistry() {
  std::list<Worker> workers;
  {
    std::lock_guard<std::mutex> lock{_mtx};
    _stop = true;
    workers.swap(_workers);
  }
  // jthread joins on destruction, outside the lock
  workers.clear();
}

void WorkerRegistry::spawn(std::function<void()> task) {
  std::lock_guard<std::mutex> lock{_mtx};
  if (_stop) {
    throw std::runtime_error("WorkerRegistry is stopped");
  }
  reapFinished();

  auto done = std::make_shared<std::atomic_bool>(false);
  std::jthread thread([task = std::move(task), done]() {
    try {
      task();
    } catch (const std::exception& e) {
      std::cerr << "[workers] Task failed: " << e.what() << std::endl;
    }
    done->store(true, std::memory_order_release);
  });
  _workers.push_back(Worker{std::move(done), std::move(thread)});
}

size_t WorkerRegistry::running() const {
  std::lock_guard<std::mutex> lock{_mtx};
  size_t count = 0;
  for (const auto& worker : _workers) {
    if (!worker.done->load(std::memory_order_acquire)) {
      ++count;
    }
  }
  return count;
}

void WorkerRegistry::reapFinished() {
  _workers.remove_if([](const Worker& worker) {
    return worker.done->load(std::memory_order_acquire);
  });
}

} // namespace common
