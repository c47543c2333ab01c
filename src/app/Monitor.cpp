#include "app/Monitor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>
#include "app/Errors.hpp"
#include "ui/Formatting.hpp"

namespace memfo::app {

std::optional<ScrollCommand> scroll_command_from_key(char c) {
  switch (c) {
    case '<': return ScrollCommand::StepBack;
    case '>': return ScrollCommand::StepForward;
    case '{': return ScrollCommand::PageBack;
    case '}': return ScrollCommand::PageForward;
    case '[': return ScrollCommand::Oldest;
    case ']': return ScrollCommand::Live;
    default: return std::nullopt;
  }
}

Monitor::Monitor(MonitorOptions opts)
  : run_start_s_(opts.run_start_s),
    history_(opts.max_samples, opts.policy, opts.sample_interval_s),
    intervals_(opts.run_start_s, opts.mode, opts.column_count),
    view_(opts.column_count),
    delta_(opts.delta) {}

bool Monitor::ingest(const memfo::model::RawReading& r) {
  std::lock_guard<std::mutex> lk(mu_);
  auto snap = std::make_shared<memfo::model::Snapshot>();
  snap->seq = seq_ + 1;
  snap->mono_s = r.mono_s;
  snap->wall = r.wall;
  snap->values = registry_.normalize(r);
  try {
    history_.append(std::move(snap));
  } catch (const OutOfOrderError& e) {
    ++discarded_;
    std::fprintf(stderr, "memfo: Monitor: discarding reading: %s\n", e.what());
    return false;
  }
  ++seq_;
  return true;
}

std::vector<memfo::model::Bucket> Monitor::buckets_locked(double now_s) const {
  return BucketAggregator::reduce(intervals_.compute_bounds(history_, now_s), history_, now_s);
}

std::vector<memfo::model::Bucket> Monitor::buckets(double now_s) const {
  std::lock_guard<std::mutex> lk(mu_);
  return buckets_locked(now_s);
}

void Monitor::set_anchor_locked(const std::vector<memfo::model::Bucket>& all) {
  anchor_start_s_.reset();
  if (view_.is_live() || intervals_.mode().adaptive || all.empty()) return;
  auto slice = view_.visible(all.size());
  if (slice.last == 0) return;
  anchor_start_s_ = all[slice.last - 1].start_s;
}

void Monitor::follow_anchor_locked(const std::vector<memfo::model::Bucket>& all) {
  if (!anchor_start_s_ || view_.is_live() || intervals_.mode().adaptive) {
    anchor_start_s_.reset();
    return;
  }
  // Fixed bounds are reproducible: while the anchor bucket is retained it is
  // found exactly. Anything else means it was evicted.
  auto it = std::lower_bound(all.begin(), all.end(), *anchor_start_s_ - 1e-9,
                             [](const memfo::model::Bucket& b, double t) { return b.start_s < t; });
  if (it == all.end() || std::fabs(it->start_s - *anchor_start_s_) > 1e-9) {
    view_.go_live();
    anchor_start_s_.reset();
    return;
  }
  size_t idx = static_cast<size_t>(it - all.begin());
  int offset = static_cast<int>(all.size() - 1 - idx);
  view_.set_offset(offset, all.size());
  if (view_.is_live()) anchor_start_s_.reset();
}

memfo::model::DisplayFrame Monitor::display_frame(double now_s) {
  std::lock_guard<std::mutex> lk(mu_);
  memfo::model::DisplayFrame frame;
  frame.field_names = registry_.names();
  frame.field_kb.reserve(registry_.size());
  for (size_t i = 0; i < registry_.size(); ++i) frame.field_kb.push_back(registry_.is_kb(i));
  frame.delta_mode = delta_;

  auto all = buckets_locked(now_s);
  follow_anchor_locked(all);
  view_.clamp(all.size());
  frame.total_buckets = all.size();
  frame.scroll_offset = view_.scroll_offset();
  frame.is_scrolled = !view_.is_live();

  auto slice = view_.visible(all.size());
  frame.columns.reserve(slice.last - slice.first);
  for (size_t i = slice.first; i < slice.last; ++i) {
    const auto& b = all[i];
    // the baseline is the bucket before, even when it is scrolled out of view
    const memfo::model::Bucket* prev = i > 0 ? &all[i - 1] : nullptr;
    memfo::model::DisplayColumn col;
    col.start_s = b.start_s;
    col.end_s = b.end_s;
    col.partial = !b.complete;
    col.empty = b.empty();
    double t = b.rep ? b.rep->mono_s : b.start_s;
    col.label = memfo::ui::format_elapsed(t - run_start_s_);
    if (b.rep) col.wall_label = memfo::ui::format_wall_local(b.rep->wall);
    col.cells.reserve(registry_.size());
    for (size_t f = 0; f < registry_.size(); ++f)
      col.cells.push_back(ViewWindow::column_value(b, prev, f, delta_));
    frame.columns.push_back(std::move(col));
  }
  return frame;
}

std::vector<memfo::model::SnapshotPtr> Monitor::dump_all() const {
  std::lock_guard<std::mutex> lk(mu_);
  return history_.dump_all();
}

void Monitor::set_interval_mode(IntervalMode mode) {
  std::lock_guard<std::mutex> lk(mu_);
  intervals_.set_mode(mode);
  // bucket identities change with the mode; offsets from the live edge do not
  anchor_start_s_.reset();
}

void Monitor::set_delta_mode(bool on) {
  std::lock_guard<std::mutex> lk(mu_);
  delta_ = on;
}

void Monitor::set_column_count(int n) {
  std::lock_guard<std::mutex> lk(mu_);
  intervals_.set_column_count(n);
  view_.set_column_count(n);
}

int Monitor::scroll(ScrollCommand cmd, double now_s) {
  std::lock_guard<std::mutex> lk(mu_);
  auto all = buckets_locked(now_s);
  follow_anchor_locked(all);
  size_t total = all.size();
  int page = std::max(1, static_cast<int>(std::lround(static_cast<double>(total) / 8.0)));
  switch (cmd) {
    case ScrollCommand::StepBack: view_.scroll(1, total); break;
    case ScrollCommand::StepForward: view_.scroll(-1, total); break;
    case ScrollCommand::PageBack: view_.scroll(page, total); break;
    case ScrollCommand::PageForward: view_.scroll(-page, total); break;
    case ScrollCommand::Oldest: view_.set_offset(view_.max_scroll(total), total); break;
    case ScrollCommand::Live: view_.go_live(); break;
  }
  set_anchor_locked(all);
  return view_.scroll_offset();
}

IntervalMode Monitor::interval_mode() const {
  std::lock_guard<std::mutex> lk(mu_);
  return intervals_.mode();
}

bool Monitor::delta_mode() const {
  std::lock_guard<std::mutex> lk(mu_);
  return delta_;
}

int Monitor::column_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return view_.column_count();
}

bool Monitor::is_live() const {
  std::lock_guard<std::mutex> lk(mu_);
  return view_.is_live();
}

size_t Monitor::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return history_.size();
}

uint64_t Monitor::seq() const {
  std::lock_guard<std::mutex> lk(mu_);
  return seq_;
}

uint64_t Monitor::discarded() const {
  std::lock_guard<std::mutex> lk(mu_);
  return discarded_;
}

std::vector<std::string> Monitor::field_names() const {
  std::lock_guard<std::mutex> lk(mu_);
  return registry_.names();
}

std::vector<bool> Monitor::field_kb() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<bool> out;
  out.reserve(registry_.size());
  for (size_t i = 0; i < registry_.size(); ++i) out.push_back(registry_.is_kb(i));
  return out;
}

} // namespace memfo::app
