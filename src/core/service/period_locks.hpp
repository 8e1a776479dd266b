#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tally {

// One timed mutex per period. Locks for different periods never contend.
class PeriodLocks {
public:
  using Guard = std::unique_lock<std::timed_mutex>;

  // Returns an unowned guard if the period is already locked.
  Guard try_acquire(std::string_view period_id);
  Guard acquire_for(std::string_view period_id, std::chrono::milliseconds timeout);

private:
  std::timed_mutex& mutex_for(std::string_view period_id);

  std::mutex registry_mutex_;
  std::unordered_map<std::string, std::unique_ptr<std::timed_mutex>> locks_;
};

}  // namespace tally
