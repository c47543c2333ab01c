#pragma once
#include <vector>
#include "app/HistoryStore.hpp"
#include "model/Bucket.hpp"

namespace memfo::app {

// Reduces each bucket span to its latest-in-bucket snapshot
class BucketAggregator {
public:
  [[nodiscard]] static std::vector<memfo::model::Bucket> reduce(const std::vector<memfo::model::BucketBounds>& bounds,
                                                              const HistoryStore& history, double now_s);
};

} // namespace memfo::app
