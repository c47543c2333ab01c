#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "app/BucketAggregator.hpp"
#include "app/FieldRegistry.hpp"
#include "app/HistoryStore.hpp"
#include "app/IntervalModel.hpp"
#include "app/ViewWindow.hpp"
#include "model/Bucket.hpp"

namespace memfo::app {

// Horizontal navigation: < > step one bucket, { } jump ~1/8 of the buckets,
// [ jumps to the oldest data, ] returns to the live edge.
enum class ScrollCommand { StepBack, StepForward, PageBack, PageForward, Oldest, Live };

[[nodiscard]] std::optional<ScrollCommand> scroll_command_from_key(char c);

struct MonitorOptions {
  size_t max_samples = HistoryStore::kDefaultMaxSamples;
  RetentionPolicy policy = RetentionPolicy::Ring;
  double sample_interval_s = 1.0;
  IntervalMode mode = IntervalMode::Adaptive();
  int column_count = 8;
  bool delta = false;
  double run_start_s = 0.0;
};

// Owns the history and the view state; the only object the sampling thread
// and the display side share. Every public call takes the same mutex, and
// ingest() publishes a fully built snapshot.
class Monitor {
public:
  explicit Monitor(MonitorOptions opts = {});
  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  // Normalizes and appends a reading. Returns false when it was discarded
  // (not newer than the last stored snapshot).
  bool ingest(const memfo::model::RawReading& r);

  // Columns to show at 'now'. Re-clamps the scroll cursor as a side effect.
  [[nodiscard]] memfo::model::DisplayFrame display_frame(double now_s);
  [[nodiscard]] std::vector<memfo::model::Bucket> buckets(double now_s) const;
  [[nodiscard]] std::vector<memfo::model::SnapshotPtr> dump_all() const;

  void set_interval_mode(IntervalMode mode);
  void set_delta_mode(bool on);
  void set_column_count(int n);
  // Returns the resulting scroll offset
  int scroll(ScrollCommand cmd, double now_s);

  [[nodiscard]] IntervalMode interval_mode() const;
  [[nodiscard]] bool delta_mode() const;
  [[nodiscard]] int column_count() const;
  [[nodiscard]] bool is_live() const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] uint64_t seq() const;
  [[nodiscard]] uint64_t discarded() const;
  [[nodiscard]] std::vector<std::string> field_names() const;
  [[nodiscard]] std::vector<bool> field_kb() const;
  double run_start_s() const { return run_start_s_; }

private:
  std::vector<memfo::model::Bucket> buckets_locked(double now_s) const;
  void follow_anchor_locked(const std::vector<memfo::model::Bucket>& all);
  void set_anchor_locked(const std::vector<memfo::model::Bucket>& all);

  mutable std::mutex mu_;
  const double run_start_s_;
  FieldRegistry registry_;
  HistoryStore history_;
  IntervalModel intervals_;
  ViewWindow view_;
  bool delta_{false};
  uint64_t seq_{0};
  uint64_t discarded_{0};
  // Fixed mode while scrolled: start of the rightmost visible bucket, so the
  // frozen columns stay put as new buckets open at the live edge
  std::optional<double> anchor_start_s_;
};

} // namespace memfo::app
