#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace jobstore::resilience {

/*
  CallPool

  Fixed set of threads draining a FIFO of store calls. Shutdown runs
  whatever is still queued, then joins; the destructor calls it.
*/
class CallPool {
 public:
  explicit CallPool(std::size_t threads);
  ~CallPool();

  CallPool(const CallPool&)            = delete;
  CallPool& operator=(const CallPool&) = delete;

  // Throws std::logic_error after Shutdown.
  void Submit(std::function<void()> task);

  void Shutdown();

  std::size_t Size() const {
    return threads_.size();
  }

 private:
  void Run();

  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::queue<std::function<void()>> queue_;
  bool                              shutdown_ = false;
  std::vector<std::thread>          threads_;
};

} // namespace jobstore::resilience
