#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace txcluster::util {

/*
  Namespaced entity ids.

  Cardholders are "C:<raw>", merchants "M:<raw>". Ids compare bytewise;
  every "C:" id sorts before every "M:" id, which gives the canonical
  enumeration order used by seeding and propagation.
*/

enum class Side : uint8_t {
  kCardholder = 0,
  kMerchant   = 1,
};

inline constexpr std::string_view kCardholderPrefix = "C:";
inline constexpr std::string_view kMerchantPrefix   = "M:";

std::string_view Prefix(Side side);
Side             Opposite(Side side);
const char*      SideName(Side side);

// Returns std::nullopt if raw is empty or contains separators/control chars.
std::optional<std::string> MakeEntityId(Side side, std::string_view raw);

// Side of a namespaced id; throws std::invalid_argument on unknown prefix.
Side SideOf(std::string_view entity_id);

std::string_view RawId(std::string_view entity_id);

// Stable across processes and platforms (FNV-1a 64).
uint64_t StableHash(std::string_view value);

std::size_t PartitionOf(std::string_view entity_id, std::size_t partitions);

} // namespace txcluster::util
