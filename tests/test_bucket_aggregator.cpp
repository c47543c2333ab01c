#include "minitest.hpp"
#include "test_support.hpp"
#include "app/BucketAggregator.hpp"
#include "app/IntervalModel.hpp"

using memfo::app::BucketAggregator;
using memfo::app::HistoryStore;
using memfo::app::IntervalMode;
using memfo::app::IntervalModel;
using memfo_test::snap;

TEST(aggregator_picks_latest_in_bucket) {
  HistoryStore h;
  int64_t vals[] = {400, 390, 410, 405, 402};
  for (int i = 0; i < 5; ++i) h.append(snap(i * 5.0, {vals[i]}));
  IntervalModel m(0.0, IntervalMode::Fixed(10), 2);
  auto buckets = BucketAggregator::reduce(m.compute_bounds(h, 20.0), h, 20.0);
  ASSERT_EQ(buckets.size(), 3u);
  ASSERT_EQ(*buckets[0].rep->value(0), 390);
  ASSERT_EQ(*buckets[1].rep->value(0), 405);
  ASSERT_EQ(*buckets[2].rep->value(0), 402);
  ASSERT_TRUE(buckets[0].complete);
  ASSERT_TRUE(buckets[1].complete);
  ASSERT_TRUE(!buckets[2].complete);
}

TEST(aggregator_marks_empty_buckets) {
  HistoryStore h;
  h.append(snap(1.0, {1}));
  h.append(snap(31.0, {2}));
  IntervalModel m(0.0, IntervalMode::Fixed(10));
  auto buckets = BucketAggregator::reduce(m.compute_bounds(h, 35.0), h, 35.0);
  ASSERT_EQ(buckets.size(), 4u);
  ASSERT_TRUE(!buckets[0].empty());
  ASSERT_TRUE(buckets[1].empty());
  ASSERT_TRUE(buckets[2].empty());
  ASSERT_TRUE(!buckets[3].empty());
}

TEST(aggregator_open_bucket_tracks_newest) {
  HistoryStore h;
  h.append(snap(0.0, {10}));
  h.append(snap(11.0, {20}));
  IntervalModel m(0.0, IntervalMode::Fixed(10));
  auto b1 = BucketAggregator::reduce(m.compute_bounds(h, 12.0), h, 12.0);
  ASSERT_EQ(*b1.back().rep->value(0), 20);
  h.append(snap(13.0, {30}));
  auto b2 = BucketAggregator::reduce(m.compute_bounds(h, 14.0), h, 14.0);
  ASSERT_EQ(b1.size(), b2.size());
  ASSERT_EQ(*b2.back().rep->value(0), 30);
  // the closed bucket did not move
  ASSERT_EQ(b2.front().rep, b1.front().rep);
}

TEST(aggregator_exact_boundary_belongs_to_later_bucket) {
  HistoryStore h;
  h.append(snap(0.0, {1}));
  h.append(snap(10.0, {2}));
  IntervalModel m(0.0, IntervalMode::Fixed(10));
  auto buckets = BucketAggregator::reduce(m.compute_bounds(h, 10.0), h, 10.0);
  ASSERT_EQ(buckets.size(), 2u);
  ASSERT_EQ(*buckets[0].rep->value(0), 1);
  ASSERT_EQ(*buckets[1].rep->value(0), 2);
}
