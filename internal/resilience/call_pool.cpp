#include "call_pool.hpp"

#include <stdexcept>
#include <utility>

namespace jobstore::resilience {

CallPool::CallPool(std::size_t threads) {
  if (threads == 0) {
    throw std::invalid_argument("call pool needs at least one thread");
  }
  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&CallPool::Run, this);
  }
}

CallPool::~CallPool() {
  Shutdown();
}

void CallPool::Submit(std::function<void()> task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw std::logic_error("call pool is shut down");
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

void CallPool::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
  }
  cv_.notify_all();

  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void CallPool::Run() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop();
    }
    // tasks report their own outcome through a promise
    task();
  }
}

} // namespace jobstore::resilience
