#ifndef COORDINATOR_WORKER_POOL_HPP
#define COORDINATOR_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>

namespace coordinator {

// Concurrency ceiling for runs. Callers beyond the ceiling queue and are
// admitted in arrival order.
class WorkerPool {
 public:
  // Held for the duration of one run.
  class Slot {
   public:
    ~Slot() { pool_->Release(); }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot(Slot&&) = delete;
    Slot& operator=(Slot&&) = delete;

   private:
    friend class WorkerPool;
    explicit Slot(WorkerPool* pool) : pool_(pool) {}
    WorkerPool* pool_;
  };

  // 0 means one worker per hardware thread.
  explicit WorkerPool(size_t max_workers);

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Blocks until the caller is at the head of the queue and a worker is
  // free. Returns nullptr if cancelled is set while waiting.
  std::unique_ptr<Slot> Acquire(const std::atomic<bool>* cancelled);

  size_t MaxWorkers() const { return max_workers_; }
  size_t Running() const;
  size_t Queued() const;

 private:
  void Release();

  size_t max_workers_;
  size_t running_ = 0;
  uint64_t next_ticket_ = 0;
  std::list<uint64_t> queue_;
  mutable std::mutex mutex_;
  std::condition_variable changed_;
};

}  // namespace coordinator

#endif
