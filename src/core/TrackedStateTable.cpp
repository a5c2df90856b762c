#include "core/TrackedStateTable.hpp"

#include <iterator>

namespace kes::core {

TrackedStateTable::TrackedStateTable() = default;
TrackedStateTable::~TrackedStateTable() = default;

const common::CustomResource* TrackedStateTable::find(const std::string& sUid) const {
  auto it = _mIndex.find(sUid);
  if (it == _mIndex.end()) {
    return nullptr;
  }
  return &*it->second;
}

void TrackedStateTable::upsert(common::CustomResource crResource) {
  auto it = _mIndex.find(crResource.sUid);
  if (it != _mIndex.end()) {
    *it->second = std::move(crResource);
    return;
  }

  std::string sUid = crResource.sUid;
  _lEntries.push_back(std::move(crResource));
  _mIndex.emplace(std::move(sUid), std::prev(_lEntries.end()));
}

std::optional<common::CustomResource> TrackedStateTable::erase(const std::string& sUid) {
  auto it = _mIndex.find(sUid);
  if (it == _mIndex.end()) {
    return std::nullopt;
  }

  common::CustomResource crRemoved = std::move(*it->second);
  _lEntries.erase(it->second);
  _mIndex.erase(it);
  return crRemoved;
}

std::vector<std::string> TrackedStateTable::uidsAbsentFrom(
    const std::vector<common::CustomResource>& vSnapshot) const {
  std::unordered_set<std::string> setPresent;
  setPresent.reserve(vSnapshot.size());
  for (const auto& crResource : vSnapshot) {
    setPresent.insert(crResource.sUid);
  }

  std::vector<std::string> vAbsent;
  for (const auto& crEntry : _lEntries) {
    if (setPresent.find(crEntry.sUid) == setPresent.end()) {
      vAbsent.push_back(crEntry.sUid);
    }
  }
  return vAbsent;
}

std::vector<std::string> TrackedStateTable::uids() const {
  std::vector<std::string> vUids;
  vUids.reserve(_lEntries.size());
  for (const auto& crEntry : _lEntries) {
    vUids.push_back(crEntry.sUid);
  }
  return vUids;
}

}  // namespace kes::core
