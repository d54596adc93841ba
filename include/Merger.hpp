#pragma once

#include "types.hpp"
#include <cstddef>
#include <vector>

namespace plsync {

/**
 * Merger folds collected items into one sequence with at most one record
 * per canonical key. The two rules are deliberately different and each
 * policy uses exactly one of them.
 *
 * Output is ordered by timestamp descending, items without a timestamp
 * last; equal timestamps keep the order in which keys were first seen.
 */
class Merger {
public:
  static constexpr size_t kDefaultCap = 50;

  // Earliest timestamp wins the record and its attribution. A present
  // timestamp always beats an absent one.
  static std::vector<MergeRecord>
  earliestWins(const std::vector<CollectedItem> &collected);

  // Sort everything newest first, then keep the first occurrence of each
  // key. Attribution follows the most recent event. cap == 0 means no cap.
  static std::vector<MergeRecord>
  latestRated(const std::vector<CollectedItem> &collected,
              size_t cap = kDefaultCap);

  // First occurrence per key, input order preserved
  static std::vector<MergeRecord>
  dedupe(const std::vector<CollectedItem> &collected);

  static std::vector<Item> itemsOf(const std::vector<MergeRecord> &records);
};

} // namespace plsync
