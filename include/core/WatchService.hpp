#pragma once

#include <mutex>
#include <thread>

#include "core/ChangeDetector.hpp"
#include "core/IEventSink.hpp"

namespace kes::core {

/// Drains a ChangeEventStream on a background thread into an IEventSink.
/// The stream is driven by this thread only while the service runs.
/// Class abbreviation: ws
class WatchService {
 public:
  WatchService(ChangeEventStream& cesStream, IEventSink& esSink);
  ~WatchService();

  WatchService(const WatchService&) = delete;
  WatchService& operator=(const WatchService&) = delete;

  void start();

  /// Interrupts a pull waiting between cycles; a pull inside a fetch
  /// returns once the fetch completes or times out.
  void stop();

  bool running() const;

 private:
  ChangeEventStream& _cesStream;
  IEventSink& _esSink;
  std::jthread _thread;
  mutable std::mutex _mtx;
  bool _bRunning = false;
};

}  // namespace kes::core
