#include "Merger.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <set>

namespace plsync {

namespace {

bool newerFirst(const std::optional<int64_t> &a,
                const std::optional<int64_t> &b) {
  if (a && b)
    return *a > *b;
  return a.has_value() && !b.has_value();
}

MergeRecord toRecord(const CollectedItem &c) {
  MergeRecord r;
  r.item = c.item;
  r.timestamp = c.timestamp;
  r.replica = c.replica;
  return r;
}

} // namespace

std::vector<MergeRecord>
Merger::earliestWins(const std::vector<CollectedItem> &collected) {
  std::vector<MergeRecord> records;
  std::map<std::string, size_t> byKey;

  for (const auto &c : collected) {
    auto it = byKey.find(c.item.key);
    if (it == byKey.end()) {
      byKey[c.item.key] = records.size();
      records.push_back(toRecord(c));
      continue;
    }
    auto &existing = records[it->second];
    if (c.timestamp && (!existing.timestamp || *c.timestamp < *existing.timestamp)) {
      existing.timestamp = c.timestamp;
      existing.replica = c.replica;
    }
  }

  std::stable_sort(records.begin(), records.end(),
                   [](const MergeRecord &a, const MergeRecord &b) {
                     return newerFirst(a.timestamp, b.timestamp);
                   });
  std::cout << "[Merger] " << collected.size() << " collected -> "
            << records.size() << " unique (earliest wins)" << std::endl;
  return records;
}

std::vector<MergeRecord>
Merger::latestRated(const std::vector<CollectedItem> &collected, size_t cap) {
  std::vector<CollectedItem> sorted = collected;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const CollectedItem &a, const CollectedItem &b) {
                     return newerFirst(a.timestamp, b.timestamp);
                   });

  std::vector<MergeRecord> records;
  std::set<std::string> seen;
  for (const auto &c : sorted) {
    if (cap != 0 && records.size() >= cap)
      break;
    if (!seen.insert(c.item.key).second)
      continue;
    records.push_back(toRecord(c));
  }
  std::cout << "[Merger] " << collected.size() << " collected -> "
            << records.size() << " unique (latest rated, cap " << cap << ")"
            << std::endl;
  return records;
}

std::vector<MergeRecord>
Merger::dedupe(const std::vector<CollectedItem> &collected) {
  std::vector<MergeRecord> records;
  std::set<std::string> seen;
  for (const auto &c : collected) {
    if (seen.insert(c.item.key).second)
      records.push_back(toRecord(c));
  }
  return records;
}

std::vector<Item> Merger::itemsOf(const std::vector<MergeRecord> &records) {
  std::vector<Item> items;
  items.reserve(records.size());
  for (const auto &r : records) {
    Item item = r.item;
    item.timestamp = r.timestamp;
    items.push_back(item);
  }
  return items;
}

} // namespace plsync
