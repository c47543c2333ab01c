#include "app/FieldSelector.hpp"

#include <algorithm>

namespace memfo::app {

void FieldSelector::pin(const std::string& name) {
  hidden_.erase(name);
  pinned_.insert(name);
}

void FieldSelector::hide(const std::string& name) {
  pinned_.erase(name);
  hidden_.insert(name);
}

FieldSelector::Layout FieldSelector::layout(const std::vector<std::string>& names) const {
  Layout out;
  for (const auto& n : names) {
    if (is_pinned(n)) out.pinned.push_back(n);
    else if (!is_hidden(n)) out.normal.push_back(n);
  }
  return out;
}

void FieldSelector::load(const memfo::util::TomlReader& toml) {
  pinned_.clear();
  hidden_.clear();
  for (const auto& k : toml.keys("pinned")) {
    if (toml.get_bool("pinned", k, false)) pinned_.insert(k);
  }
  for (const auto& k : toml.keys("hidden")) {
    if (toml.get_bool("hidden", k, false) && !is_pinned(k)) hidden_.insert(k);
  }
}

void FieldSelector::store(memfo::util::TomlReader& toml) {
  // Sorted so the file does not churn between saves
  std::vector<std::string> p(pinned_.begin(), pinned_.end());
  std::vector<std::string> h(hidden_.begin(), hidden_.end());
  std::sort(p.begin(), p.end());
  std::sort(h.begin(), h.end());
  toml.clear_section("pinned");
  toml.clear_section("hidden");
  for (const auto& n : p) toml.set("pinned", n, true);
  for (const auto& n : h) toml.set("hidden", n, true);
}

FieldSelector FieldSelector::defaults() {
  FieldSelector f;
  f.pin("MemTotal");
  f.pin("MemAvailable");
  f.hide("KernelStack");
  f.hide("Active(file)");
  return f;
}

} // namespace memfo::app
