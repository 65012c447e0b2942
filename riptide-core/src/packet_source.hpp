#pragma once

#include "metrics.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace riptide {

// Raised by pull() when no capture is configured or running.
class SourceUnavailable : public std::runtime_error {
public:
  explicit SourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

class PacketSource {
public:
  virtual ~PacketSource() = default;

  // Waits up to `timeout` for the next normalized packet; std::nullopt means
  // nothing arrived in time.
  virtual std::optional<PacketEvent> pull(std::chrono::milliseconds timeout) = 0;
};

}
