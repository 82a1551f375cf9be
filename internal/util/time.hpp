#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace narrative::util {

/*
  Time utilities. Components never read the wall clock directly; they
  take a TimeSource so tests can pin "now".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr uint64_t kMillisPerDay = 24ULL * 60 * 60 * 1000;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// YYYYMMDD in UTC.
std::string FormatDate(uint64_t unix_ms);

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual uint64_t NowMs() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  uint64_t NowMs() const override;
};

class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(uint64_t now_ms) : now_ms_(now_ms) {
  }

  uint64_t NowMs() const override {
    return now_ms_.load();
  }

  void Set(uint64_t now_ms) {
    now_ms_.store(now_ms);
  }

  void Advance(uint64_t delta_ms) {
    now_ms_.fetch_add(delta_ms);
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

} // namespace narrative::util
