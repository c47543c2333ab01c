#include "app/IntervalModel.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace memfo::app {

const std::vector<std::pair<std::string, IntervalMode>>& interval_presets() {
  static const std::vector<std::pair<std::string, IntervalMode>> presets = {
    {"Var", IntervalMode::Adaptive()},
    {"5s",  IntervalMode::Fixed(5)},
    {"15s", IntervalMode::Fixed(15)},
    {"30s", IntervalMode::Fixed(30)},
    {"1m",  IntervalMode::Fixed(60)},
    {"5m",  IntervalMode::Fixed(300)},
    {"15m", IntervalMode::Fixed(900)},
    {"1h",  IntervalMode::Fixed(3600)},
  };
  return presets;
}

std::optional<IntervalMode> parse_interval_preset(std::string_view name) {
  for (const auto& [n, m] : interval_presets()) {
    if (n == name) return m;
  }
  // Accept the older spellings too
  if (name == "var" || name == "adaptive") return IntervalMode::Adaptive();
  if (name == "1hr") return IntervalMode::Fixed(3600);
  return std::nullopt;
}

std::string interval_preset_name(const IntervalMode& mode) {
  for (const auto& [n, m] : interval_presets()) {
    if (m == mode) return n;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%gs", mode.width_s);
  return buf;
}

IntervalMode next_interval_preset(const IntervalMode& mode) {
  const auto& p = interval_presets();
  for (size_t i = 0; i < p.size(); ++i) {
    if (p[i].second == mode) return p[(i + 1) % p.size()].second;
  }
  return p.front().second;
}

IntervalModel::IntervalModel(double run_start_s, IntervalMode mode, int column_count)
    : run_start_s_(run_start_s), mode_(IntervalMode::Adaptive()), column_count_(1) {
  set_mode(mode);
  set_column_count(column_count);
}

void IntervalModel::set_mode(IntervalMode mode) {
  // A non-positive width cannot tile time
  if (!mode.adaptive && !(mode.width_s > 0.0)) mode = IntervalMode::Adaptive();
  if (mode.adaptive) mode.width_s = 0.0;
  mode_ = mode;
}

long long IntervalModel::fixed_index(double run_start_s, double width_s, double t_s) {
  auto k = static_cast<long long>(std::floor((t_s - run_start_s) / width_s));
  // Settle rounding so that fixed_bounds(k) really contains t
  while (fixed_bounds(run_start_s, width_s, k + 1).start_s <= t_s) ++k;
  while (fixed_bounds(run_start_s, width_s, k).start_s > t_s) --k;
  return k;
}

memfo::model::BucketBounds IntervalModel::fixed_bounds(double run_start_s, double width_s, long long k) {
  return memfo::model::BucketBounds{
    run_start_s + static_cast<double>(k) * width_s,
    run_start_s + static_cast<double>(k + 1) * width_s,
  };
}

std::vector<memfo::model::BucketBounds> IntervalModel::compute_bounds(const HistoryStore& history, double now_s) const {
  if (history.empty()) return {};
  double earliest = history.earliest()->mono_s;
  double span_end = std::max(now_s, history.latest()->mono_s);
  return mode_.adaptive ? adaptive(earliest, span_end) : fixed(earliest, span_end);
}

std::vector<memfo::model::BucketBounds> IntervalModel::fixed(double earliest_s, double span_end_s) const {
  std::vector<memfo::model::BucketBounds> out;
  long long k0 = fixed_index(run_start_s_, mode_.width_s, earliest_s);
  long long k1 = fixed_index(run_start_s_, mode_.width_s, span_end_s);
  out.reserve(static_cast<size_t>(k1 - k0 + 1));
  for (long long k = k0; k <= k1; ++k) out.push_back(fixed_bounds(run_start_s_, mode_.width_s, k));
  return out;
}

std::vector<memfo::model::BucketBounds> IntervalModel::adaptive(double earliest_s, double span_end_s) const {
  std::vector<memfo::model::BucketBounds> out;
  // End is exclusive; nudge it so a snapshot taken exactly at span_end is covered
  const double end_excl = std::nextafter(span_end_s, std::numeric_limits<double>::infinity());
  if (!(span_end_s > earliest_s)) {
    out.push_back({earliest_s, end_excl});
    return out;
  }
  const double width = (span_end_s - earliest_s) / static_cast<double>(column_count_);
  out.reserve(static_cast<size_t>(column_count_));
  for (int k = 0; k < column_count_; ++k) {
    double start = earliest_s + static_cast<double>(k) * width;
    double end = (k + 1 == column_count_) ? end_excl : earliest_s + static_cast<double>(k + 1) * width;
    out.push_back({start, end});
  }
  return out;
}

} // namespace memfo::app
