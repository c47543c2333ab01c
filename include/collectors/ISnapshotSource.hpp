#pragma once
#include <optional>
#include "model/Snapshot.hpp"

namespace memfo::collectors {

// Anything that can produce one memory reading on demand. The sampler
// drives a source on its own thread; tests substitute a scripted one.
class ISnapshotSource {
public:
  virtual ~ISnapshotSource() = default;

  // One reading, or std::nullopt when the source is unavailable this time.
  // A failed read is transient: the caller keeps polling.
  [[nodiscard]] virtual std::optional<memfo::model::RawReading> sample() = 0;

  // Optional: human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace memfo::collectors
