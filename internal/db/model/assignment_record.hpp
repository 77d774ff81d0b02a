#pragma once

#include <cstdint>
#include <string>

namespace txcluster::db::model {

enum class Role : int {
  kPrimary   = 0,
  kDuplicate = 1,
};

inline const char* RoleName(Role role) {
  return role == Role::kPrimary ? "primary" : "duplicate";
}

/*
  One (entity, cluster, role) row of an assignment snapshot.

  Rows of one entity are ordered primary first, then duplicates by
  ascending cluster id. Weight is the vote weight the entity gave the
  cluster when the row was produced (0 for seed rows).
*/
struct AssignmentRecord {
  std::string entity_id;
  std::string cluster_id;
  Role        role   = Role::kPrimary;
  uint64_t    weight = 0;

  bool operator==(const AssignmentRecord&) const = default;
};

} // namespace txcluster::db::model
