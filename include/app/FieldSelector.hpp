#pragma once
#include <string>
#include <unordered_set>
#include <vector>
#include "util/TomlReader.hpp"

namespace memfo::app {

// Which fields to show and where: pinned rows stay on top, hidden rows are
// skipped, everything else scrolls in the normal group. Pinning a field
// un-hides it and hiding a field un-pins it.
class FieldSelector {
public:
  struct Layout {
    std::vector<std::string> pinned;
    std::vector<std::string> normal;
  };

  void pin(const std::string& name);
  void hide(const std::string& name);

  bool is_pinned(const std::string& name) const { return pinned_.count(name) != 0; }
  bool is_hidden(const std::string& name) const { return hidden_.count(name) != 0; }

  // Partition in registry order
  [[nodiscard]] Layout layout(const std::vector<std::string>& names) const;

  // [pinned] / [hidden] sections, one "Field = true" line per entry
  void load(const memfo::util::TomlReader& toml);
  void store(memfo::util::TomlReader& toml);

  // Defaults written to a fresh config file
  static FieldSelector defaults();

private:
  std::unordered_set<std::string> pinned_;
  std::unordered_set<std::string> hidden_;
};

} // namespace memfo::app
