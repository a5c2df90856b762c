#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kes::common {

/// Identifies the custom resource collection to poll.
/// Class abbreviation: rd
struct ResourceDescriptor {
  std::string sGroup;
  std::string sVersion;
  std::string sPlural;
  std::optional<std::string> oNamespace;  // unset = cluster-wide
};

/// One custom object as returned by the fetch capability.
/// jObject is the full object, passed through unmodified.
/// Class abbreviation: cr
struct CustomResource {
  std::string sUid;
  std::string sResourceVersion;
  std::string sLocator;
  nlohmann::json jObject;
};

/// Change event kind.
enum class ChangeType { Added, Modified, Deleted };

/// Watch-style wire name of a change type ("ADDED", "MODIFIED", "DELETED").
inline const char* changeTypeName(ChangeType ctType) {
  switch (ctType) {
    case ChangeType::Added:
      return "ADDED";
    case ChangeType::Modified:
      return "MODIFIED";
    case ChangeType::Deleted:
      return "DELETED";
  }
  return "UNKNOWN";
}

/// A single emitted change.
/// Class abbreviation: ce
struct ChangeEvent {
  ChangeType type;
  CustomResource crResource;
};

/// Counters describing the polling loop, safe to read from other threads.
/// Class abbreviation: ps
struct PollStats {
  uint64_t uCyclesCompleted = 0;
  uint64_t uFetchFailures = 0;
  uint64_t uConsecutiveFailures = 0;
  uint64_t uTrackedCount = 0;
  std::optional<std::chrono::system_clock::time_point> oLastSuccessAt;
};

}  // namespace kes::common
