#pragma once

#include <atomic>
#include <memory>

namespace adr {

// Copies share one flag. Checked by the orchestrator between stages.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() const { flag_->store(true); }
  bool IsCancelled() const { return flag_->load(); }
  std::atomic<bool> *Flag() const { return flag_.get(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace adr
