#pragma once

#include <chrono>
#include <cstdint>

namespace cms::util {

// Notification and question timestamps are whole Unix seconds.
using Clock = std::chrono::system_clock;

int64_t UnixSeconds(Clock::time_point tp);

int64_t NowUnixSeconds();

} // namespace cms::util
