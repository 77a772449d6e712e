#include "time.hpp"

namespace taskengine::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t CutoffMillis(uint64_t now_ms, uint64_t age_ms) {
  return now_ms > age_ms ? now_ms - age_ms : 0;
}

} // namespace taskengine::util
