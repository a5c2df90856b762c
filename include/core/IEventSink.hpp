#pragma once

#include "common/Types.hpp"

namespace kes::core {

/// Receives change events drained from a ChangeEventStream.
class IEventSink {
 public:
  virtual ~IEventSink() = default;

  virtual void publish(const common::ChangeEvent& ceEvent) = 0;
};

}  // namespace kes::core
