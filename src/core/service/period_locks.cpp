#include "core/service/period_locks.hpp"

namespace tally {

PeriodLocks::Guard PeriodLocks::try_acquire(std::string_view period_id) {
  return Guard{mutex_for(period_id), std::try_to_lock};
}

PeriodLocks::Guard PeriodLocks::acquire_for(std::string_view period_id, std::chrono::milliseconds timeout) {
  return Guard{mutex_for(period_id), timeout};
}

std::timed_mutex& PeriodLocks::mutex_for(std::string_view period_id) {
  std::lock_guard lock(registry_mutex_);
  auto& slot = locks_[std::string{period_id}];
  if (!slot) {
    slot = std::make_unique<std::timed_mutex>();
  }
  return *slot;
}

}  // namespace tally
