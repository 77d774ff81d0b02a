#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "google/protobuf/duration.pb.h"

namespace txcluster::util {

/*
  Time utilities: single place to control clock source later.

  Wall-clock time is used for record keeping only; deadlines run on the
  steady clock so they are immune to clock adjustments.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMs();

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

class Deadline {
 public:
  // no budget: never expires
  Deadline() = default;

  explicit Deadline(std::chrono::milliseconds budget);

  bool Expired() const;

  bool Bounded() const {
    return expires_at_.has_value();
  }

 private:
  std::optional<std::chrono::steady_clock::time_point> expires_at_;
};

} // namespace txcluster::util
