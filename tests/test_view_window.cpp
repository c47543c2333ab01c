#include "minitest.hpp"
#include "test_support.hpp"
#include "app/ViewWindow.hpp"

using memfo::app::ViewWindow;
using memfo::model::Bucket;
using memfo::model::CellState;
using memfo_test::snap;

static Bucket bucket_with(double start, std::vector<std::optional<int64_t>> vals, bool complete = true) {
  Bucket b;
  b.start_s = start;
  b.end_s = start + 10.0;
  b.rep = snap(start + 1.0, std::move(vals));
  b.complete = complete;
  return b;
}

TEST(view_live_shows_most_recent) {
  ViewWindow v(3);
  auto s = v.visible(10);
  ASSERT_EQ(s.first, 7u);
  ASSERT_EQ(s.last, 10u);
  ASSERT_TRUE(v.is_live());
}

TEST(view_fewer_buckets_than_columns) {
  ViewWindow v(8);
  auto s = v.visible(3);
  ASSERT_EQ(s.first, 0u);
  ASSERT_EQ(s.last, 3u);
  ASSERT_EQ(v.max_scroll(3), 0);
}

TEST(view_scroll_clamps_when_no_extra_history) {
  ViewWindow v(4);
  for (int n : {1, 5, 100}) {
    ASSERT_EQ(v.scroll(n, 4), 0);
    ASSERT_TRUE(v.is_live());
  }
}

TEST(view_scroll_back_and_forward) {
  ViewWindow v(4);
  ASSERT_EQ(v.scroll(2, 10), 2);
  auto s = v.visible(10);
  ASSERT_EQ(s.first, 4u);
  ASSERT_EQ(s.last, 8u);
  ASSERT_EQ(v.scroll(100, 10), 6);
  s = v.visible(10);
  ASSERT_EQ(s.first, 0u);
  ASSERT_EQ(v.scroll(-100, 10), 0);
  ASSERT_TRUE(v.is_live());
}

TEST(view_clamp_after_history_shrinks) {
  ViewWindow v(4);
  (void)v.scroll(6, 10);
  v.clamp(6);
  ASSERT_EQ(v.scroll_offset(), 2);
  v.clamp(3);
  ASSERT_EQ(v.scroll_offset(), 0);
}

TEST(view_visible_buckets_slice) {
  std::vector<Bucket> all;
  for (int i = 0; i < 5; ++i) all.push_back(bucket_with(i * 10.0, {i}));
  ViewWindow v(2);
  (void)v.scroll(1, all.size());
  auto vis = v.visible_buckets(all);
  ASSERT_EQ(vis.size(), 2u);
  ASSERT_EQ(vis[0].start_s, 20.0);
  ASSERT_EQ(vis[1].start_s, 30.0);
}

TEST(view_delta_between_adjacent_buckets) {
  auto prev = bucket_with(0.0, {100});
  auto cur = bucket_with(10.0, {137});
  auto c = ViewWindow::column_value(cur, &prev, 0, true);
  ASSERT_TRUE(c.has_value());
  ASSERT_TRUE(c.is_delta);
  ASSERT_EQ(c.value, 37);
  auto neg = ViewWindow::column_value(prev, &cur, 0, true);
  ASSERT_EQ(neg.value, -37);
}

TEST(view_delta_without_baseline_is_not_zero) {
  auto first = bucket_with(0.0, {100});
  auto c = ViewWindow::column_value(first, nullptr, 0, true);
  ASSERT_TRUE(c.state == CellState::NoBaseline);
  ASSERT_TRUE(!c.has_value());

  Bucket empty_prev;
  auto c2 = ViewWindow::column_value(first, &empty_prev, 0, true);
  ASSERT_TRUE(c2.state == CellState::NoBaseline);

  auto missing_prev = bucket_with(0.0, {std::nullopt});
  auto c3 = ViewWindow::column_value(first, &missing_prev, 0, true);
  ASSERT_TRUE(c3.state == CellState::NoBaseline);
}

TEST(view_absolute_empty_and_absent_cells) {
  Bucket empty;
  auto c = ViewWindow::column_value(empty, nullptr, 0, false);
  ASSERT_TRUE(c.state == CellState::EmptyBucket);

  auto b = bucket_with(0.0, {std::nullopt, 0});
  ASSERT_TRUE(ViewWindow::column_value(b, nullptr, 0, false).state == CellState::Absent);
  auto zero = ViewWindow::column_value(b, nullptr, 1, false);
  ASSERT_TRUE(zero.state == CellState::Value);
  ASSERT_EQ(zero.value, 0);
  // index past the snapshot's values reads as absent
  ASSERT_TRUE(ViewWindow::column_value(b, nullptr, 5, false).state == CellState::Absent);
}

TEST(view_partial_flag_follows_open_bucket) {
  auto open = bucket_with(0.0, {5}, false);
  auto c = ViewWindow::column_value(open, nullptr, 0, false);
  ASSERT_TRUE(c.partial);
  auto closed = bucket_with(0.0, {5}, true);
  ASSERT_TRUE(!ViewWindow::column_value(closed, nullptr, 0, false).partial);
}
