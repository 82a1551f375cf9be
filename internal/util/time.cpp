#include "time.hpp"

#include <ctime>

namespace narrative::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatDate(uint64_t unix_ms) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  char buffer[16];
  const auto written = std::strftime(buffer, sizeof(buffer), "%Y%m%d", &utc);
  return std::string(buffer, written);
}

uint64_t SystemTimeSource::NowMs() const {
  return ToUnixMillis(Now());
}

} // namespace narrative::util
