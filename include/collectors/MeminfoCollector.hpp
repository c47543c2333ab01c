#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <vector>
#include "collectors/ISnapshotSource.hpp"

namespace memfo::collectors {

// Reads every "Name: value [kB]" line of /proc/meminfo. Lines of any other
// shape are skipped. VmallocTotal is a fixed, huge address-space size and
// is left out unless asked for.
class MeminfoCollector : public ISnapshotSource {
public:
  using MonoClock = std::chrono::steady_clock;

  explicit MeminfoCollector(MonoClock::time_point run_start = MonoClock::now(),
                            bool include_vmalloc_total = false,
                            std::string path = "/proc/meminfo");

  [[nodiscard]] std::optional<memfo::model::RawReading> sample() override;
  [[nodiscard]] const char* name() const override { return "meminfo"; }

  // Parses meminfo text into fields, in file order
  [[nodiscard]] static std::vector<memfo::model::RawField> parse(std::string_view text, bool include_vmalloc_total);

private:
  MonoClock::time_point run_start_;
  bool include_vmalloc_total_;
  std::string path_;
};

} // namespace memfo::collectors
