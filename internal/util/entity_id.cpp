#include "entity_id.hpp"

#include <stdexcept>

namespace txcluster::util {

namespace {

bool IsValidRawChar(unsigned char c) {
  return c > 0x20 && c != 0x7F && c != ',';
}

} // namespace

std::string_view Prefix(Side side) {
  return side == Side::kCardholder ? kCardholderPrefix : kMerchantPrefix;
}

Side Opposite(Side side) {
  return side == Side::kCardholder ? Side::kMerchant : Side::kCardholder;
}

const char* SideName(Side side) {
  return side == Side::kCardholder ? "cardholder" : "merchant";
}

std::optional<std::string> MakeEntityId(Side side, std::string_view raw) {
  if (raw.empty()) return std::nullopt;
  for (char c : raw) {
    if (!IsValidRawChar(static_cast<unsigned char>(c))) return std::nullopt;
  }

  std::string id;
  id.reserve(raw.size() + 2);
  id.append(Prefix(side));
  id.append(raw);
  return id;
}

Side SideOf(std::string_view entity_id) {
  if (entity_id.starts_with(kCardholderPrefix)) return Side::kCardholder;
  if (entity_id.starts_with(kMerchantPrefix)) return Side::kMerchant;
  throw std::invalid_argument("entity id has no namespace prefix: " + std::string(entity_id));
}

std::string_view RawId(std::string_view entity_id) {
  (void)SideOf(entity_id);
  return entity_id.substr(2);
}

uint64_t StableHash(std::string_view value) {
  uint64_t hash = 14695981039346656037ULL;
  for (char c : value) {
    hash ^= static_cast<unsigned char>(c);
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::size_t PartitionOf(std::string_view entity_id, std::size_t partitions) {
  if (partitions <= 1) return 0;
  return static_cast<std::size_t>(StableHash(entity_id) % partitions);
}

} // namespace txcluster::util
