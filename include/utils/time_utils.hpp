#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <cstdint>
#include <functional>

namespace rendezvous {

// Milliseconds since the Unix epoch. Components take a Clock so tests can drive time by hand.
using Clock = std::function<int64_t()>;

int64_t nowMillis();
Clock systemClock();

// RFC 3339 UTC with milliseconds, e.g. 2025-09-12T14:59:01.234Z
std::string formatIsoTimestamp(int64_t epoch_ms);

} // namespace rendezvous

#endif // TIME_UTILS_HPP
