#include "time.hpp"

namespace cms::util {

int64_t UnixSeconds(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

int64_t NowUnixSeconds() {
  return UnixSeconds(Clock::now());
}

} // namespace cms::util
