#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "app/HistoryStore.hpp"
#include "model/Bucket.hpp"

namespace memfo::app {

// Fixed(width) buckets aligned to run start, or Adaptive buckets that spread
// the whole retained history over the column count.
struct IntervalMode {
  bool adaptive{true};
  double width_s{0.0}; // Fixed only

  static IntervalMode Adaptive() { return IntervalMode{true, 0.0}; }
  static IntervalMode Fixed(double width_s) { return IntervalMode{false, width_s}; }

  bool operator==(const IntervalMode&) const = default;
};

// Display presets: Var, 5s, 15s, 30s, 1m, 5m, 15m, 1h
[[nodiscard]] const std::vector<std::pair<std::string, IntervalMode>>& interval_presets();
[[nodiscard]] std::optional<IntervalMode> parse_interval_preset(std::string_view name);
[[nodiscard]] std::string interval_preset_name(const IntervalMode& mode);
// Cycles to the following preset, wrapping 1h -> Var
[[nodiscard]] IntervalMode next_interval_preset(const IntervalMode& mode);

class IntervalModel {
public:
  explicit IntervalModel(double run_start_s = 0.0, IntervalMode mode = IntervalMode::Adaptive(),
                         int column_count = 8);

  // Pure state change; buckets are recomputed on the next query
  void set_mode(IntervalMode mode);
  void set_column_count(int n) { column_count_ = n < 1 ? 1 : n; }

  const IntervalMode& mode() const { return mode_; }
  double run_start_s() const { return run_start_s_; }
  int column_count() const { return column_count_; }

  // Ordered bucket spans from the earliest snapshot's bucket to the bucket
  // containing now. Empty history yields no buckets.
  [[nodiscard]] std::vector<memfo::model::BucketBounds> compute_bounds(const HistoryStore& history, double now_s) const;

  // Fixed mode boundary arithmetic: a pure function of (run_start, width, t)
  [[nodiscard]] static long long fixed_index(double run_start_s, double width_s, double t_s);
  [[nodiscard]] static memfo::model::BucketBounds fixed_bounds(double run_start_s, double width_s, long long k);

private:
  std::vector<memfo::model::BucketBounds> fixed(double earliest_s, double span_end_s) const;
  std::vector<memfo::model::BucketBounds> adaptive(double earliest_s, double span_end_s) const;

  double run_start_s_;
  IntervalMode mode_;
  int column_count_;
};

} // namespace memfo::app
