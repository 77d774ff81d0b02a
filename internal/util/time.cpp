#include "time.hpp"

namespace txcluster::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

Deadline::Deadline(std::chrono::milliseconds budget) : expires_at_(std::chrono::steady_clock::now() + budget) {
}

bool Deadline::Expired() const {
  return expires_at_ && std::chrono::steady_clock::now() >= *expires_at_;
}

} // namespace txcluster::util
