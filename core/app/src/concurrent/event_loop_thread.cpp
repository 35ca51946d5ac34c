#include "oms/concurrent/event_loop_thread.hpp"

namespace oms {

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable() || queue_.closed()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  queue_.close();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void EventLoopThread::run() {
  while (auto event = queue_.wait_pop()) {
    bus_.publish(*event);
  }
}

}  // namespace oms
