#pragma once

#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "common/Types.hpp"

namespace kes::core {

/// Last-observed state of every watched resource, keyed by UID.
/// Iterates in first-observed order; replacing an entry keeps its position.
/// Not thread-safe: owned by a single ChangeEventStream.
/// Class abbreviation: tst
class TrackedStateTable {
 public:
  TrackedStateTable();
  ~TrackedStateTable();

  TrackedStateTable(const TrackedStateTable&) = delete;
  TrackedStateTable& operator=(const TrackedStateTable&) = delete;

  /// Returns nullptr when sUid is not tracked.
  const common::CustomResource* find(const std::string& sUid) const;

  /// Insert a new entry at the end, or replace an existing one in place.
  void upsert(common::CustomResource crResource);

  /// Remove and return the entry, or nullopt when sUid is not tracked.
  std::optional<common::CustomResource> erase(const std::string& sUid);

  /// UIDs tracked here but absent from vSnapshot, in table order.
  std::vector<std::string> uidsAbsentFrom(
      const std::vector<common::CustomResource>& vSnapshot) const;

  /// All tracked UIDs in table order.
  std::vector<std::string> uids() const;

  size_t size() const { return _lEntries.size(); }
  bool empty() const { return _lEntries.empty(); }

 private:
  std::list<common::CustomResource> _lEntries;
  std::unordered_map<std::string, std::list<common::CustomResource>::iterator> _mIndex;
};

}  // namespace kes::core
