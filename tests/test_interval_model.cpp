#include "minitest.hpp"
#include "test_support.hpp"
#include "app/IntervalModel.hpp"

using memfo::app::HistoryStore;
using memfo::app::IntervalMode;
using memfo::app::IntervalModel;
using memfo_test::snap;

static HistoryStore history_at(std::initializer_list<double> ts) {
  HistoryStore h;
  for (double t : ts) h.append(snap(t));
  return h;
}

TEST(interval_empty_history_has_no_buckets) {
  HistoryStore h;
  IntervalModel m(0.0, IntervalMode::Fixed(10));
  ASSERT_TRUE(m.compute_bounds(h, 100.0).empty());
  IntervalModel a(0.0, IntervalMode::Adaptive(), 4);
  ASSERT_TRUE(a.compute_bounds(h, 100.0).empty());
}

TEST(interval_fixed_aligned_to_run_start) {
  auto h = history_at({0.0, 5.0, 10.0, 15.0, 20.0});
  IntervalModel m(0.0, IntervalMode::Fixed(10), 2);
  auto b = m.compute_bounds(h, 20.0);
  ASSERT_EQ(b.size(), 3u);
  ASSERT_EQ(b[0].start_s, 0.0);
  ASSERT_EQ(b[0].end_s, 10.0);
  ASSERT_EQ(b[1].start_s, 10.0);
  ASSERT_EQ(b[2].start_s, 20.0);
  ASSERT_EQ(b[2].end_s, 30.0);
}

TEST(interval_fixed_boundaries_stable_as_time_passes) {
  auto h = history_at({0.0, 3.0, 7.0});
  IntervalModel m(0.0, IntervalMode::Fixed(5));
  auto early = m.compute_bounds(h, 7.0);
  auto later = m.compute_bounds(h, 42.0);
  ASSERT_TRUE(later.size() > early.size());
  for (size_t i = 0; i < early.size(); ++i) {
    ASSERT_EQ(early[i].start_s, later[i].start_s);
    ASSERT_EQ(early[i].end_s, later[i].end_s);
  }
}

TEST(interval_fixed_with_offset_run_start) {
  auto h = history_at({103.0, 109.0});
  IntervalModel m(100.0, IntervalMode::Fixed(5));
  auto b = m.compute_bounds(h, 112.0);
  ASSERT_EQ(b.size(), 3u);
  ASSERT_EQ(b.front().start_s, 100.0);
  ASSERT_EQ(b.back().start_s, 110.0);
}

TEST(interval_fixed_index_is_floor) {
  ASSERT_EQ(IntervalModel::fixed_index(0.0, 10.0, 0.0), 0);
  ASSERT_EQ(IntervalModel::fixed_index(0.0, 10.0, 9.999), 0);
  ASSERT_EQ(IntervalModel::fixed_index(0.0, 10.0, 10.0), 1);
  ASSERT_EQ(IntervalModel::fixed_index(0.0, 10.0, -0.5), -1);
  // whatever floating point does, the chosen bucket contains t
  for (double t : {0.3, 0.7, 1.1, 2.9}) {
    auto bb = IntervalModel::fixed_bounds(0.0, 0.1, IntervalModel::fixed_index(0.0, 0.1, t));
    ASSERT_TRUE(bb.start_s <= t && t < bb.end_s);
  }
}

TEST(interval_adaptive_spans_all_history) {
  auto h = history_at({2.0, 3.0, 50.0});
  for (int c : {1, 3, 8}) {
    IntervalModel m(0.0, IntervalMode::Adaptive(), c);
    auto b = m.compute_bounds(h, 60.0);
    ASSERT_EQ(b.size(), static_cast<size_t>(c));
    ASSERT_EQ(b.front().start_s, 2.0);
    ASSERT_TRUE(b.back().end_s > 60.0);
    for (size_t i = 1; i < b.size(); ++i) ASSERT_EQ(b[i].start_s, b[i - 1].end_s);
  }
}

TEST(interval_adaptive_covers_latest_snapshot) {
  auto h = history_at({0.0, 10.0});
  IntervalModel m(0.0, IntervalMode::Adaptive(), 4);
  // now earlier than the newest snapshot: span still reaches it
  auto b = m.compute_bounds(h, 5.0);
  ASSERT_TRUE(b.back().start_s <= 10.0 && 10.0 < b.back().end_s);
}

TEST(interval_adaptive_single_snapshot) {
  auto h = history_at({4.0});
  IntervalModel m(0.0, IntervalMode::Adaptive(), 8);
  auto b = m.compute_bounds(h, 4.0);
  ASSERT_EQ(b.size(), 1u);
  ASSERT_TRUE(b[0].start_s <= 4.0 && 4.0 < b[0].end_s);
}

TEST(interval_nonpositive_width_falls_back_to_adaptive) {
  IntervalModel m(0.0, IntervalMode::Fixed(0.0));
  ASSERT_TRUE(m.mode().adaptive);
  m.set_mode(IntervalMode::Fixed(-5.0));
  ASSERT_TRUE(m.mode().adaptive);
  m.set_mode(IntervalMode::Fixed(15.0));
  ASSERT_TRUE(!m.mode().adaptive);
  ASSERT_EQ(m.mode().width_s, 15.0);
}

TEST(interval_presets_parse_and_cycle) {
  auto m = memfo::app::parse_interval_preset("1m");
  ASSERT_TRUE(m.has_value());
  ASSERT_EQ(m->width_s, 60.0);
  ASSERT_TRUE(memfo::app::parse_interval_preset("Var")->adaptive);
  ASSERT_EQ(memfo::app::parse_interval_preset("1hr")->width_s, 3600.0);
  ASSERT_TRUE(!memfo::app::parse_interval_preset("2m").has_value());
  ASSERT_EQ(memfo::app::interval_preset_name(IntervalMode::Fixed(15)), "15s");
  ASSERT_EQ(memfo::app::interval_preset_name(IntervalMode::Adaptive()), "Var");
  ASSERT_EQ(memfo::app::interval_preset_name(memfo::app::next_interval_preset(IntervalMode::Fixed(3600))), "Var");
  ASSERT_EQ(memfo::app::interval_preset_name(memfo::app::next_interval_preset(IntervalMode::Adaptive())), "5s");
}
