#include "app/BucketAggregator.hpp"

namespace memfo::app {

std::vector<memfo::model::Bucket> BucketAggregator::reduce(const std::vector<memfo::model::BucketBounds>& bounds,
                                                         const HistoryStore& history, double now_s) {
  std::vector<memfo::model::Bucket> out;
  out.reserve(bounds.size());
  for (const auto& b : bounds) {
    memfo::model::Bucket bucket{};
    bucket.start_s = b.start_s;
    bucket.end_s = b.end_s;
    bucket.rep = history.last_in(b.start_s, b.end_s);
    bucket.complete = b.end_s <= now_s;
    out.push_back(std::move(bucket));
  }
  return out;
}

} // namespace memfo::app
