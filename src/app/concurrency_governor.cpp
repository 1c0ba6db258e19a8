#include <aeroinspect/app/concurrency_governor.hpp>
#include <algorithm>

namespace aeroinspect::app {

ConcurrencyGovernor::Permit::~Permit() {
  if (governor_ != nullptr) {
    governor_->release();
  }
}

ConcurrencyGovernor::ConcurrencyGovernor(std::size_t limit) : limit_(std::max<std::size_t>(limit, 1)) {}

ConcurrencyGovernor::Permit ConcurrencyGovernor::acquire() {
  std::unique_lock lock(mutex_);
  const std::uint64_t ticket = next_ticket_++;
  cv_.wait(lock, [&] { return ticket == next_admit_ && in_flight_ < limit_; });
  ++next_admit_;
  ++in_flight_;
  // The next ticket holder may also fit under the limit.
  cv_.notify_all();
  return Permit(this);
}

void ConcurrencyGovernor::release() {
  {
    std::lock_guard lock(mutex_);
    --in_flight_;
  }
  cv_.notify_all();
}

std::size_t ConcurrencyGovernor::in_flight() const {
  std::lock_guard lock(mutex_);
  return in_flight_;
}

std::size_t ConcurrencyGovernor::waiting() const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(next_ticket_ - next_admit_);
}

}  // namespace aeroinspect::app
