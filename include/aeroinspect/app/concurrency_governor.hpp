#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace aeroinspect::app {

/// System-wide FIFO counting semaphore bounding how many inspection jobs run at once.
///
/// acquire() blocks until a slot is free *and* every earlier caller has been admitted, so
/// submissions start in arrival order. The returned Permit releases its slot on destruction.
class ConcurrencyGovernor {
 public:
  class Permit {
   public:
    Permit(Permit&& other) noexcept : governor_(other.governor_) { other.governor_ = nullptr; }
    Permit& operator=(Permit&&) = delete;
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    ~Permit();

   private:
    friend class ConcurrencyGovernor;
    explicit Permit(ConcurrencyGovernor* governor) noexcept : governor_(governor) {}

    ConcurrencyGovernor* governor_;
  };

  /// \p limit 0 is treated as 1.
  explicit ConcurrencyGovernor(std::size_t limit = 5);

  ConcurrencyGovernor(const ConcurrencyGovernor&) = delete;
  ConcurrencyGovernor& operator=(const ConcurrencyGovernor&) = delete;

  [[nodiscard]] Permit acquire();

  [[nodiscard]] std::size_t limit() const noexcept { return limit_; }
  [[nodiscard]] std::size_t in_flight() const;
  [[nodiscard]] std::size_t waiting() const;

 private:
  void release();

  const std::size_t limit_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t in_flight_{0};
  std::uint64_t next_ticket_{0};
  std::uint64_t next_admit_{0};
};

}  // namespace aeroinspect::app
