#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace txcluster::ingest {

/*
  One parsed input record. Ids are already namespaced ("C:..", "M:..").
*/
struct InteractionRecord {
  std::string            cardholder_id;
  std::string            merchant_id;
  uint64_t               weight = 1;
  std::optional<int64_t> timestamp;
};

} // namespace txcluster::ingest
