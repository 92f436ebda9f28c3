#ifndef COORDINATOR_CANCELLATION_HPP
#define COORDINATOR_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace coordinator {

// Lets a caller stop a run it started, e.g. when its client disconnects.
// Copies share the same flag. Cancelling a queued run keeps it from starting;
// cancelling a running one kills it the same way a timeout does.
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() const { flag_->store(true); }
  bool IsCancelled() const { return flag_->load(); }
  const std::atomic<bool>* Flag() const { return flag_.get(); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace coordinator

#endif
