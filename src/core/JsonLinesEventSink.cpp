#include "core/JsonLinesEventSink.hpp"

#include <stdexcept>

namespace kes::core {

JsonLinesEventSink::JsonLinesEventSink(std::ostream& osOut) : _osOut(osOut) {}

JsonLinesEventSink::~JsonLinesEventSink() = default;

nlohmann::json JsonLinesEventSink::toJson(const common::ChangeEvent& ceEvent) {
  return nlohmann::json{
      {"type", common::changeTypeName(ceEvent.type)},
      {"object", ceEvent.crResource.jObject},
  };
}

void JsonLinesEventSink::publish(const common::ChangeEvent& ceEvent) {
  const std::string sLine = toJson(ceEvent).dump();

  std::lock_guard<std::mutex> lock(_mtx);
  // Reset state left by an earlier failed write
  _osOut.clear();
  _osOut << sLine << '\n';
  _osOut.flush();
  if (!_osOut) {
    throw std::runtime_error("Failed to write event for " + ceEvent.crResource.sLocator);
  }
}

}  // namespace kes::core
