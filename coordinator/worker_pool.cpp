#include "coordinator/worker_pool.hpp"

#include <chrono>
#include <thread>

namespace coordinator {

namespace {
// Cancellation is a plain flag, so queued callers look at it periodically.
const constexpr auto kCancelPollInterval = std::chrono::milliseconds(10);
}  // namespace

WorkerPool::WorkerPool(size_t max_workers) : max_workers_(max_workers) {
  if (max_workers_ == 0) max_workers_ = std::thread::hardware_concurrency();
  if (max_workers_ == 0) max_workers_ = 1;
}

std::unique_ptr<WorkerPool::Slot> WorkerPool::Acquire(
    const std::atomic<bool>* cancelled) {
  std::unique_lock<std::mutex> lck(mutex_);
  if (cancelled != nullptr && cancelled->load()) return nullptr;
  uint64_t ticket = next_ticket_++;
  auto position = queue_.insert(queue_.end(), ticket);
  while (queue_.front() != ticket || running_ >= max_workers_) {
    if (cancelled != nullptr && cancelled->load()) {
      queue_.erase(position);
      changed_.notify_all();
      return nullptr;
    }
    changed_.wait_for(lck, kCancelPollInterval);
  }
  queue_.pop_front();
  running_++;
  // The next in line may also fit.
  changed_.notify_all();
  return std::unique_ptr<Slot>(new Slot(this));
}

void WorkerPool::Release() {
  std::lock_guard<std::mutex> lck(mutex_);
  running_--;
  changed_.notify_all();
}

size_t WorkerPool::Running() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return running_;
}

size_t WorkerPool::Queued() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return queue_.size();
}

}  // namespace coordinator
