#include "core/ChangeDetector.hpp"

#include "common/Errors.hpp"

namespace kes::core {

namespace {

std::string describe(const common::ResourceDescriptor& rdDescriptor) {
  std::string sName = rdDescriptor.sPlural + "." + rdDescriptor.sGroup + "/" +
                      rdDescriptor.sVersion;
  if (rdDescriptor.oNamespace) {
    sName += " in namespace " + *rdDescriptor.oNamespace;
  }
  return sName;
}

}  // namespace

ChangeEventStream::ChangeEventStream(kube::IResourceClient& rcClient,
                                     common::ResourceDescriptor rdDescriptor,
                                     std::chrono::milliseconds durInterval,
                                     std::shared_ptr<spdlog::logger> spLog)
    : _rcClient(rcClient),
      _rdDescriptor(std::move(rdDescriptor)),
      _durInterval(durInterval),
      _spLog(std::move(spLog)) {}

ChangeEventStream::~ChangeEventStream() = default;

std::optional<common::ChangeEvent> ChangeEventStream::next(std::stop_token stToken) {
  while (!stToken.stop_requested()) {
    if (_oCycle) {
      auto oEvent = advanceCycle();
      if (oEvent) {
        return oEvent;
      }
      _oCycle.reset();
      _uCyclesCompleted.fetch_add(1);
    }

    // First cycle starts immediately; every later one waits an interval
    if (_bStarted && !waitInterval(stToken)) {
      break;
    }
    _bStarted = true;
    beginCycle();
  }
  return std::nullopt;
}

void ChangeEventStream::beginCycle() {
  std::vector<common::CustomResource> vSnapshot;
  try {
    vSnapshot = _rcClient.listResources(_rdDescriptor);
  } catch (const common::FetchError& ex) {
    _uFetchFailures.fetch_add(1);
    _uConsecutiveFailures.fetch_add(1);
    _spLog->warn("Failed to fetch {}: {} (code={}, status={})", describe(_rdDescriptor),
                 ex.what(), ex._sErrorCode, ex._iHttpStatus);
    return;
  } catch (const std::exception& ex) {
    _uFetchFailures.fetch_add(1);
    _uConsecutiveFailures.fetch_add(1);
    _spLog->warn("Failed to fetch {}: {}", describe(_rdDescriptor), ex.what());
    return;
  }

  _uConsecutiveFailures.store(0);
  _iLastSuccessMs.store(std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count());

  Cycle cyc;
  cyc.vDeletedUids = _tstTable.uidsAbsentFrom(vSnapshot);
  cyc.vSnapshot = std::move(vSnapshot);
  _oCycle = std::move(cyc);
}

std::optional<common::ChangeEvent> ChangeEventStream::advanceCycle() {
  Cycle& cyc = *_oCycle;

  // Deletions strictly before additions/modifications
  while (cyc.uDeletedPos < cyc.vDeletedUids.size()) {
    const std::string& sUid = cyc.vDeletedUids[cyc.uDeletedPos++];
    auto oRemoved = _tstTable.erase(sUid);
    if (!oRemoved) {
      continue;
    }
    _uTrackedCount.store(_tstTable.size());
    _spLog->info("deleted {}", oRemoved->sLocator);
    return common::ChangeEvent{common::ChangeType::Deleted, std::move(*oRemoved)};
  }

  while (cyc.uSnapshotPos < cyc.vSnapshot.size()) {
    common::CustomResource& crResource = cyc.vSnapshot[cyc.uSnapshotPos++];
    const common::CustomResource* pExisting = _tstTable.find(crResource.sUid);

    if (pExisting == nullptr) {
      _spLog->info("added {}", crResource.sLocator);
      _tstTable.upsert(crResource);
      _uTrackedCount.store(_tstTable.size());
      return common::ChangeEvent{common::ChangeType::Added, std::move(crResource)};
    }

    if (pExisting->sResourceVersion != crResource.sResourceVersion) {
      _spLog->info("modified {}", crResource.sLocator);
      _tstTable.upsert(crResource);
      return common::ChangeEvent{common::ChangeType::Modified, std::move(crResource)};
    }

    _spLog->debug("no change detected for {}", crResource.sLocator);
  }

  return std::nullopt;
}

bool ChangeEventStream::waitInterval(const std::stop_token& stToken) {
  std::unique_lock<std::mutex> lock(_mtxWait);
  _cvWait.wait_for(lock, stToken, _durInterval, [] { return false; });
  return !stToken.stop_requested();
}

common::PollStats ChangeEventStream::stats() const {
  common::PollStats psStats;
  psStats.uCyclesCompleted = _uCyclesCompleted.load();
  psStats.uFetchFailures = _uFetchFailures.load();
  psStats.uConsecutiveFailures = _uConsecutiveFailures.load();
  psStats.uTrackedCount = _uTrackedCount.load();

  const int64_t iLastSuccessMs = _iLastSuccessMs.load();
  if (iLastSuccessMs >= 0) {
    psStats.oLastSuccessAt =
        std::chrono::system_clock::time_point(std::chrono::milliseconds(iLastSuccessMs));
  }
  return psStats;
}

std::unique_ptr<ChangeEventStream> ChangeDetector::openChangeStream(
    kube::IResourceClient& rcClient, common::ResourceDescriptor rdDescriptor,
    std::chrono::milliseconds durInterval, std::shared_ptr<spdlog::logger> spLog) {
  if (durInterval.count() <= 0) {
    throw common::ConfigError("invalid_interval",
                              "Polling interval must be positive (got " +
                                  std::to_string(durInterval.count()) + "ms)");
  }
  return std::make_unique<ChangeEventStream>(rcClient, std::move(rdDescriptor), durInterval,
                                             std::move(spLog));
}

}  // namespace kes::core
