#pragma once

#include "oms/concurrent/thread_safe_queue.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace oms {

// -----------------------------------------------------------------------------
// ThreadPool
// -----------------------------------------------------------------------------
//
// @brief  Fixed set of worker threads executing queued tasks. Each enqueue()
//         returns a std::future carrying the task's result or exception.
//
// @details
// The ExecutionDispatcher submits one task per venue route and waits on the
// futures with a deadline. A task whose caller stopped waiting keeps running
// to completion on its worker; nothing is cancelled mid-call.
//
// shutdown() closes the queue, lets the workers finish everything already
// queued, and joins them. The destructor calls shutdown().
//
// Thread model:
//   enqueue() is safe from any thread. Tasks run on the pool's workers.
// -----------------------------------------------------------------------------
class ThreadPool {
 public:
  explicit ThreadPool(std::size_t num_threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // Throws std::runtime_error after shutdown().
  template <typename F, typename... Args>
  auto enqueue(F&& f, Args&&... args)
      -> std::future<std::invoke_result_t<F, Args...>>;

  void shutdown();

  std::size_t size() const { return workers_.size(); }

 private:
  void workerLoop();

  ThreadSafeQueue<std::function<void()>> tasks_;
  std::vector<std::thread> workers_;
};

template <typename F, typename... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {
  using ReturnType = std::invoke_result_t<F, Args...>;

  auto task = std::make_shared<std::packaged_task<ReturnType()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));
  std::future<ReturnType> result = task->get_future();

  if (!tasks_.push([task]() { (*task)(); })) {
    throw std::runtime_error("enqueue on stopped ThreadPool");
  }
  return result;
}

}  // namespace oms
