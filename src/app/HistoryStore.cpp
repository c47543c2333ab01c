#include "app/HistoryStore.hpp"
#include "app/Errors.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace memfo::app {

namespace {

// 5s, 15s, 30s, 1m, 5m, 15m, 30m, 1h, 4h, 12h, 1d, 2d, 4d, 8d at 1s base spacing
constexpr int kCompressionMultipliers[] = {5, 3, 2, 2, 5, 3, 2, 2, 4, 3, 2, 2, 2, 2};
constexpr size_t kMultiplierCount = sizeof(kCompressionMultipliers) / sizeof(kCompressionMultipliers[0]);

// Allow the sampler a little jitter before refusing to close a slot
constexpr double kSpacingFloor = 0.95;

struct MonoLess {
  bool operator()(const memfo::model::SnapshotPtr& s, double t) const { return s->mono_s < t; }
};

} // namespace

HistoryStore::HistoryStore(size_t max_samples, RetentionPolicy policy, double base_spacing_s)
    : max_samples_(std::max<size_t>(2, max_samples)),
      policy_(policy),
      base_spacing_s_(base_spacing_s > 0.0 ? base_spacing_s : 1.0) {}

void HistoryStore::append(memfo::model::SnapshotPtr s) {
  if (!s) throw std::invalid_argument("HistoryStore: null snapshot");
  if (!items_.empty() && !(s->mono_s > items_.back()->mono_s)) {
    char msg[128];
    std::snprintf(msg, sizeof(msg), "snapshot at %.3fs does not follow %.3fs",
                  s->mono_s, items_.back()->mono_s);
    throw OutOfOrderError(msg);
  }

  if (policy_ == RetentionPolicy::Compact && items_.size() >= 2) {
    // Newest slot stays open (overwritten) until enough time passed since the
    // previous stored entry
    double since_prev = s->mono_s - items_[items_.size() - 2]->mono_s;
    if (since_prev < min_spacing_s() * kSpacingFloor) {
      items_.back() = std::move(s);
      return;
    }
  }

  double newest = s->mono_s;
  items_.push_back(std::move(s));
  if (items_.size() <= max_samples_) return;
  if (policy_ == RetentionPolicy::Ring) evict_ring();
  else compact(newest);
}

void HistoryStore::evict_ring() {
  while (items_.size() > max_samples_) items_.pop_front();
}

void HistoryStore::compact(double newest_mono_s) {
  double cutoff = newest_mono_s - kRetentionSec;
  while (items_.size() > max_samples_ && items_.front()->mono_s < cutoff) items_.pop_front();
  if (items_.size() <= max_samples_) return;

  // A single pass may not be enough when max_samples is tiny
  while (items_.size() > max_samples_) {
    int factor = kCompressionMultipliers[static_cast<size_t>(comp_idx_) % kMultiplierCount];
    Container kept;
    const size_t last = items_.size() - 1;
    for (size_t i = 0; i < last; i += static_cast<size_t>(factor)) kept.push_back(items_[i]);
    kept.push_back(items_[last]);
    items_.swap(kept);
    spacing_mult_ *= factor;
    ++comp_idx_;
  }
}

auto HistoryStore::range(double from_s, double to_s) const -> Range {
  if (!(from_s < to_s)) return Range(items_.end(), items_.end());
  auto first = std::lower_bound(items_.begin(), items_.end(), from_s, MonoLess{});
  auto last = std::lower_bound(first, items_.end(), to_s, MonoLess{});
  return Range(first, last);
}

memfo::model::SnapshotPtr HistoryStore::last_in(double from_s, double to_s) const {
  auto r = range(from_s, to_s);
  if (r.empty()) return nullptr;
  return *(r.end() - 1);
}

const memfo::model::SnapshotPtr& HistoryStore::earliest() const {
  if (items_.empty()) throw EmptyHistoryError("no snapshots recorded yet");
  return items_.front();
}

const memfo::model::SnapshotPtr& HistoryStore::latest() const {
  if (items_.empty()) throw EmptyHistoryError("no snapshots recorded yet");
  return items_.back();
}

std::vector<memfo::model::SnapshotPtr> HistoryStore::dump_all() const {
  return std::vector<memfo::model::SnapshotPtr>(items_.begin(), items_.end());
}

void HistoryStore::clear() {
  items_.clear();
  spacing_mult_ = 1;
  comp_idx_ = 0;
}

} // namespace memfo::app
