#include "core/WatchService.hpp"

#include "common/Logger.hpp"

namespace kes::core {

WatchService::WatchService(ChangeEventStream& cesStream, IEventSink& esSink)
    : _cesStream(cesStream), _esSink(esSink) {}

WatchService::~WatchService() {
  stop();
}

void WatchService::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  _thread = std::jthread([this](std::stop_token stToken) {
    auto spLog = kes::common::Logger::get();

    while (!stToken.stop_requested()) {
      auto oEvent = _cesStream.next(stToken);
      if (!oEvent) {
        break;  // stop requested
      }

      try {
        _esSink.publish(*oEvent);
      } catch (const std::exception& ex) {
        spLog->error("WatchService: failed to publish {} event for {}: {}",
                     common::changeTypeName(oEvent->type), oEvent->crResource.sLocator,
                     ex.what());
      }
    }
  });
}

void WatchService::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
  }

  // condition_variable_any wakes the stream's interval wait on stop
  _thread.request_stop();

  if (_thread.joinable()) {
    _thread.join();
  }
}

bool WatchService::running() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _bRunning;
}

}  // namespace kes::core
