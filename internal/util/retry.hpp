#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace txcluster::util {

struct RetryPolicy {
  uint32_t                  max_attempts    = 5;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(10);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(1000);
};

/*
  Converts a repository Result into the exception taxonomy:

    Busy, IOError   -> StorageIOError (transient)
    Full            -> CapacityExceededError
    anything else   -> StorageIOError (not transient)
*/
void ThrowIfError(const db::Result& result, std::string_view what);

// Backoff before attempt `attempt + 1` (attempt counts from 1).
std::chrono::milliseconds BackoffFor(const RetryPolicy& policy, uint32_t attempt);

/*
  Runs fn until it returns without throwing a transient StorageIOError, at
  most policy.max_attempts times. Non-transient errors and capacity errors
  propagate immediately. fn must be safe to re-run: every call opens its own
  transaction.
*/
template <typename Fn>
auto WithRetry(const RetryPolicy& policy, std::string_view what, Fn&& fn) -> decltype(fn()) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const StorageIOError& e) {
      if (!e.Transient() || attempt >= policy.max_attempts) {
        throw;
      }
      auto backoff = BackoffFor(policy, attempt);
      TXCLUSTER_LOG_WARN("transient storage failure, retrying",
                         {observability::StringField("op", what),
                          observability::IntField("attempt", attempt),
                          observability::IntField("backoff_ms", backoff.count()),
                          observability::StringField("error", e.what())});
      std::this_thread::sleep_for(backoff);
    }
  }
}

// One retried unit of work: Begin, fn(tx), Commit. A failed attempt is
// rolled back by the transaction's destructor before the next one starts.
template <typename Fn>
auto InTransaction(db::Repository& repo, const RetryPolicy& policy, std::string_view what, Fn&& fn)
    -> decltype(fn(std::declval<db::Transaction&>())) {
  return WithRetry(policy, what, [&] {
    auto tx = repo.Begin();
    if constexpr (std::is_void_v<decltype(fn(*tx))>) {
      fn(*tx);
      tx->Commit();
    } else {
      auto out = fn(*tx);
      tx->Commit();
      return out;
    }
  });
}

} // namespace txcluster::util
