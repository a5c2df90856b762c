#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/Types.hpp"
#include "core/TrackedStateTable.hpp"
#include "kube/IResourceClient.hpp"

namespace kes::core {

/// Pull-driven sequence of change events synthesized from periodic snapshots.
///
/// Each call to next() advances the poll loop just far enough to produce one
/// event: fetch, diff against the tracked table, hand out DELETED events in
/// table order, then ADDED/MODIFIED events in snapshot order, then wait one
/// interval and fetch again. The table is updated as each event is handed out.
/// Fetch failures are logged and the cycle is skipped; they never reach the
/// caller. The first fetch happens on the first call to next().
///
/// A stream is driven by one thread at a time. stats() may be called from any thread.
/// Class abbreviation: ces
class ChangeEventStream {
 public:
  ChangeEventStream(kube::IResourceClient& rcClient, common::ResourceDescriptor rdDescriptor,
                    std::chrono::milliseconds durInterval,
                    std::shared_ptr<spdlog::logger> spLog);
  ~ChangeEventStream();

  ChangeEventStream(const ChangeEventStream&) = delete;
  ChangeEventStream& operator=(const ChangeEventStream&) = delete;

  /// Block until the next event is available.
  /// Returns nullopt only once stToken has been stopped.
  std::optional<common::ChangeEvent> next(std::stop_token stToken = {});

  const TrackedStateTable& trackedState() const { return _tstTable; }
  const common::ResourceDescriptor& descriptor() const { return _rdDescriptor; }
  std::chrono::milliseconds interval() const { return _durInterval; }

  common::PollStats stats() const;

 private:
  /// Pending work of the cycle currently being emitted.
  struct Cycle {
    std::vector<std::string> vDeletedUids;
    size_t uDeletedPos = 0;
    std::vector<common::CustomResource> vSnapshot;
    size_t uSnapshotPos = 0;
  };

  /// Fetch a snapshot and start a cycle. On failure, logs and leaves no cycle.
  void beginCycle();

  /// Next event of the current cycle, or nullopt when the cycle is drained.
  std::optional<common::ChangeEvent> advanceCycle();

  /// Sleep one interval. Returns false if stToken was stopped.
  bool waitInterval(const std::stop_token& stToken);

  kube::IResourceClient& _rcClient;
  common::ResourceDescriptor _rdDescriptor;
  std::chrono::milliseconds _durInterval;
  std::shared_ptr<spdlog::logger> _spLog;

  TrackedStateTable _tstTable;
  std::optional<Cycle> _oCycle;
  bool _bStarted = false;

  std::mutex _mtxWait;
  std::condition_variable_any _cvWait;

  std::atomic<uint64_t> _uCyclesCompleted{0};
  std::atomic<uint64_t> _uFetchFailures{0};
  std::atomic<uint64_t> _uConsecutiveFailures{0};
  std::atomic<uint64_t> _uTrackedCount{0};
  std::atomic<int64_t> _iLastSuccessMs{-1};  // ms since epoch, -1 = never
};

/// Entry point of the change detector.
class ChangeDetector {
 public:
  /// Open a change stream over the collection described by rdDescriptor.
  /// rcClient must outlive the stream. Throws ConfigError if durInterval is not positive.
  static std::unique_ptr<ChangeEventStream> openChangeStream(
      kube::IResourceClient& rcClient, common::ResourceDescriptor rdDescriptor,
      std::chrono::milliseconds durInterval, std::shared_ptr<spdlog::logger> spLog);
};

}  // namespace kes::core
