#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace memfo::model {

using WallClock = std::chrono::system_clock;

struct RawField {
  std::string name;
  int64_t value{};
  bool kb{true}; // false for plain counts (e.g. HugePages_Total)
};

// One reading straight from a source, fields in source order
struct RawReading {
  double mono_s{};                 // seconds since run start
  WallClock::time_point wall{};
  std::vector<RawField> fields;
};

// One timestamped reading of all tracked fields. Values are index-aligned
// with the FieldRegistry; nullopt means the field was absent in that reading.
struct Snapshot {
  uint64_t seq{};
  double mono_s{};
  WallClock::time_point wall{};
  std::vector<std::optional<int64_t>> values;

  std::optional<int64_t> value(size_t idx) const {
    if (idx >= values.size()) return std::nullopt;
    return values[idx];
  }
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

} // namespace memfo::model
