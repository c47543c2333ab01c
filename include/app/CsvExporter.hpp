#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "model/Snapshot.hpp"

namespace memfo::app {

// Full-history dump: header "wall_time,mono_s,<fields...>", one row per
// snapshot oldest first, wall time as ISO-8601 UTC, absent values empty.
// Values are written as stored (kB fields in kB).
class CsvExporter {
public:
  [[nodiscard]] static std::string render(const std::vector<std::string>& names,
                                          const std::vector<memfo::model::SnapshotPtr>& snapshots);

  // Returns false (and logs) when the file cannot be written
  [[nodiscard]] static bool write(const std::filesystem::path& path,
                                  const std::vector<std::string>& names,
                                  const std::vector<memfo::model::SnapshotPtr>& snapshots);
};

} // namespace memfo::app
