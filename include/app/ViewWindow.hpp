#pragma once
#include <cstddef>
#include <vector>
#include "model/Bucket.hpp"

namespace memfo::app {

// Horizontal scroll cursor over the bucket sequence.
// Live: scroll_offset == 0, the rightmost column is the open bucket.
// Scrolled: scroll_offset > 0, columns are frozen history.
class ViewWindow {
public:
  explicit ViewWindow(int column_count = 8) { set_column_count(column_count); }

  // Index range [first, last) of the visible buckets within a sequence of 'total'
  struct Slice { size_t first{0}; size_t last{0}; };

  [[nodiscard]] Slice visible(size_t total) const;
  [[nodiscard]] std::vector<memfo::model::Bucket> visible_buckets(const std::vector<memfo::model::Bucket>& all) const;

  // Adjusts the offset by delta (positive = further back) and clamps it to
  // [0, max_scroll(total)]. Returns the new offset.
  int scroll(int delta, size_t total);
  // Re-clamp after history shrank or the bucket count changed
  void clamp(size_t total);
  void go_live() { scroll_offset_ = 0; }
  void set_offset(int offset, size_t total) { scroll_offset_ = 0; scroll(offset, total); }

  [[nodiscard]] int max_scroll(size_t total) const;

  void set_column_count(int n) { column_count_ = n < 1 ? 1 : n; }
  int column_count() const { return column_count_; }
  int scroll_offset() const { return scroll_offset_; }
  bool is_live() const { return scroll_offset_ == 0; }

  // Absolute: representative's value. Delta: cur - prev, or NoBaseline when
  // there is no previous bucket or it cannot provide a value.
  [[nodiscard]] static memfo::model::Cell column_value(const memfo::model::Bucket& bucket,
                                                       const memfo::model::Bucket* previous,
                                                       size_t field_idx, bool delta_mode);

private:
  int column_count_{8};
  int scroll_offset_{0};
};

} // namespace memfo::app
