#pragma once
#include <cstddef>
#include <deque>
#include <vector>
#include "model/Snapshot.hpp"

namespace memfo::app {

enum class RetentionPolicy {
  Ring,    // drop the oldest snapshot on overflow
  Compact  // thin old history and widen spacing on overflow
};

// Ordered (oldest first), capacity-bounded snapshot history.
//
// Ring is the baseline: after max_samples + k appends exactly the newest
// max_samples remain. Compact trades resolution of old data for coverage:
// on overflow every factor-th entry (from the oldest) survives, the newest
// always survives, and the minimum spacing between stored entries grows by
// the same factor. Entries older than the retention horizon go first.
class HistoryStore {
public:
  using Container = std::deque<memfo::model::SnapshotPtr>;
  using const_iterator = Container::const_iterator;

  static constexpr size_t kDefaultMaxSamples = 600;
  static constexpr double kRetentionSec = 24.0 * 60.0 * 60.0;

  // Restartable view over [first, last). Valid until the store is next mutated.
  class Range {
  public:
    Range(const_iterator first, const_iterator last) : first_(first), last_(last) {}
    const_iterator begin() const { return first_; }
    const_iterator end() const { return last_; }
    bool empty() const { return first_ == last_; }
    size_t size() const { return static_cast<size_t>(last_ - first_); }
  private:
    const_iterator first_;
    const_iterator last_;
  };

  explicit HistoryStore(size_t max_samples = kDefaultMaxSamples,
                        RetentionPolicy policy = RetentionPolicy::Ring,
                        double base_spacing_s = 1.0);

  // Throws OutOfOrderError unless s->mono_s > latest()->mono_s, and
  // std::invalid_argument for a null pointer.
  void append(memfo::model::SnapshotPtr s);

  [[nodiscard]] Range range(double from_s, double to_s) const;
  [[nodiscard]] Range all() const { return Range(items_.begin(), items_.end()); }

  // Newest snapshot with mono_s in [from_s, to_s), or null.
  [[nodiscard]] memfo::model::SnapshotPtr last_in(double from_s, double to_s) const;

  // Throw EmptyHistoryError when empty.
  [[nodiscard]] const memfo::model::SnapshotPtr& earliest() const;
  [[nodiscard]] const memfo::model::SnapshotPtr& latest() const;

  [[nodiscard]] std::vector<memfo::model::SnapshotPtr> dump_all() const;

  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  size_t max_samples() const { return max_samples_; }
  RetentionPolicy policy() const { return policy_; }
  // Compact only: stored entries are at least this far apart (fuzzily)
  double min_spacing_s() const { return base_spacing_s_ * static_cast<double>(spacing_mult_); }
  int compactions() const { return comp_idx_; }
  void clear();

private:
  void evict_ring();
  void compact(double newest_mono_s);

  Container items_;
  size_t max_samples_;
  RetentionPolicy policy_;
  double base_spacing_s_;
  long long spacing_mult_{1};
  int comp_idx_{0};
};

} // namespace memfo::app
