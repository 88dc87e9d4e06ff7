#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>

namespace chunkkeeper {

using SystemClock = std::chrono::system_clock;
using TimePoint = SystemClock::time_point;
using Millis = std::chrono::milliseconds;

/// Wall-clock source shared by the ledger, collector and scheduler.
class Clock {
public:
  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
};

class RealClock : public Clock {
public:
  TimePoint now() const override { return SystemClock::now(); }
};

/// Clock that only moves when told to. Used to step over grace periods.
class ManualClock : public Clock {
public:
  explicit ManualClock(TimePoint start = SystemClock::now()) : now_(start) {}

  TimePoint now() const override {
    std::lock_guard<std::mutex> lk(mutex_);
    return now_;
  }

  void advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lk(mutex_);
    now_ += delta;
  }

  void set(TimePoint t) {
    std::lock_guard<std::mutex> lk(mutex_);
    now_ = t;
  }

private:
  mutable std::mutex mutex_;
  TimePoint now_;
};

/// Timestamps are persisted as milliseconds since the Unix epoch.
inline std::int64_t toEpochMillis(TimePoint t) {
  return std::chrono::duration_cast<Millis>(t.time_since_epoch()).count();
}

inline TimePoint fromEpochMillis(std::int64_t ms) {
  return TimePoint(std::chrono::duration_cast<SystemClock::duration>(Millis(ms)));
}

} // namespace chunkkeeper
