#include "app/FieldRegistry.hpp"

#include <cstdio>

namespace memfo::app {

std::vector<std::optional<int64_t>> FieldRegistry::normalize(const memfo::model::RawReading& r) {
  if (!frozen_) {
    for (const auto& f : r.fields) {
      if (index_.count(f.name)) continue;
      index_.emplace(f.name, names_.size());
      names_.push_back(f.name);
      kb_.push_back(f.kb);
    }
    frozen_ = true;
  }
  std::vector<std::optional<int64_t>> out(names_.size());
  for (const auto& f : r.fields) {
    auto it = index_.find(f.name);
    if (it == index_.end()) {
      if (ignored_.insert(f.name).second) {
        std::fprintf(stderr, "memfo: FieldRegistry: ignoring field '%s' not present at startup\n", f.name.c_str());
      }
      continue;
    }
    out[it->second] = f.value;
  }
  return out;
}

} // namespace memfo::app
