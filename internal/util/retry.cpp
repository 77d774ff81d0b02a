#include "retry.hpp"

#include <algorithm>
#include <string>

namespace txcluster::util {

void ThrowIfError(const db::Result& result, std::string_view what) {
  if (result) {
    return;
  }

  std::string msg = std::string(what) + ": " + db::ErrorCodeName(result.code);
  if (!result.message.empty()) {
    msg += " (" + result.message + ")";
  }

  switch (result.code) {
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
      throw StorageIOError(msg, true);
    case db::ErrorCode::Full:
      throw CapacityExceededError(msg);
    default:
      throw StorageIOError(msg, false);
  }
}

std::chrono::milliseconds BackoffFor(const RetryPolicy& policy, uint32_t attempt) {
  auto backoff = policy.initial_backoff;
  for (uint32_t i = 1; i < attempt && backoff < policy.max_backoff; ++i) {
    backoff *= 2;
  }
  return std::min(backoff, policy.max_backoff);
}

} // namespace txcluster::util
