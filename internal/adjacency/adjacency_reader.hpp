#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/entity_id.hpp"
#include "internal/util/retry.hpp"

namespace txcluster::adjacency {

// A page of entities of one side, in ascending id order.
struct AdjacencyPage {
  std::vector<db::model::AdjacencyRecord> records;

  // id of the last entity, the cursor for the next page ("" when empty)
  std::string last_id;
};

/*
  Read side of the frozen adjacency: paging and point lookups, each in its
  own short retried transaction.
*/
class AdjacencyReader {
 public:
  AdjacencyReader(std::shared_ptr<db::Repository> repo, util::RetryPolicy retry);

  AdjacencyPage ReadPage(util::Side side, const std::string& after, uint64_t limit) const;

  std::vector<db::model::AdjacencyRecord> Lookup(util::Side side, const std::vector<std::string>& entity_ids) const;

  uint64_t Count(util::Side side) const;

  // Calls fn(page) for every page of `page_size` entities of `side`.
  template <typename Fn>
  void ForEachPage(util::Side side, uint64_t page_size, Fn&& fn) const {
    std::string after;
    for (;;) {
      auto page = ReadPage(side, after, page_size);
      if (page.records.empty()) return;
      after = page.last_id;
      fn(page);
      if (page.records.size() < page_size) return;
    }
  }

 private:
  std::shared_ptr<db::Repository> repo_;
  util::RetryPolicy               retry_;
};

} // namespace txcluster::adjacency
