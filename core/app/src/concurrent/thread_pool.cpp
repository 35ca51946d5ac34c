#include "oms/concurrent/thread_pool.hpp"

namespace oms {

ThreadPool::ThreadPool(std::size_t num_threads) {
  if (num_threads == 0) {
    num_threads = 1;
  }
  workers_.reserve(num_threads);
  for (std::size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this] { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() { shutdown(); }

// -----------------------------------------------------------------------------
// shutdown(): drain queued tasks, then join
// -----------------------------------------------------------------------------
void ThreadPool::shutdown() {
  tasks_.close();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

// -----------------------------------------------------------------------------
// workerLoop(): packaged_task stores any exception in its future, so a task
// never unwinds through the worker.
// -----------------------------------------------------------------------------
void ThreadPool::workerLoop() {
  while (auto task = tasks_.wait_pop()) {
    (*task)();
  }
}

}  // namespace oms
