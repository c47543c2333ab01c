#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "model/Snapshot.hpp"

namespace memfo::app {

// Stable field schema for a run, frozen from the first reading.
// Later readings are mapped onto it: a missing field is absent (nullopt),
// never 0; a field the first reading did not have is dropped.
class FieldRegistry {
public:
  [[nodiscard]] std::vector<std::optional<int64_t>> normalize(const memfo::model::RawReading& r);

  const std::vector<std::string>& names() const { return names_; }
  // True when the field is a kilobyte quantity rather than a plain count
  bool is_kb(size_t idx) const { return idx < kb_.size() && kb_[idx]; }
  size_t size() const { return names_.size(); }
  bool frozen() const { return frozen_; }

private:
  bool frozen_{false};
  std::vector<std::string> names_;
  std::vector<bool> kb_;
  std::unordered_map<std::string, size_t> index_;
  std::unordered_set<std::string> ignored_;
};

} // namespace memfo::app
