#pragma once

#include <mutex>
#include <ostream>

#include <nlohmann/json.hpp>

#include "core/IEventSink.hpp"

namespace kes::core {

/// Writes each event as one compact JSON line: {"type":"ADDED","object":{...}}
/// Class abbreviation: jles
class JsonLinesEventSink : public IEventSink {
 public:
  explicit JsonLinesEventSink(std::ostream& osOut);
  ~JsonLinesEventSink() override;

  void publish(const common::ChangeEvent& ceEvent) override;

  /// Watch-style JSON document for one event.
  static nlohmann::json toJson(const common::ChangeEvent& ceEvent);

 private:
  std::ostream& _osOut;
  std::mutex _mtx;
};

}  // namespace kes::core
