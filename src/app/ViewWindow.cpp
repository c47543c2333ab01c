#include "app/ViewWindow.hpp"

#include <algorithm>

namespace memfo::app {

int ViewWindow::max_scroll(size_t total) const {
  long long extra = static_cast<long long>(total) - column_count_;
  return extra > 0 ? static_cast<int>(extra) : 0;
}

ViewWindow::Slice ViewWindow::visible(size_t total) const {
  size_t off = static_cast<size_t>(std::clamp(scroll_offset_, 0, max_scroll(total)));
  Slice s{};
  s.last = total - off;
  s.first = s.last > static_cast<size_t>(column_count_) ? s.last - static_cast<size_t>(column_count_) : 0;
  return s;
}

std::vector<memfo::model::Bucket> ViewWindow::visible_buckets(const std::vector<memfo::model::Bucket>& all) const {
  auto s = visible(all.size());
  return std::vector<memfo::model::Bucket>(all.begin() + static_cast<std::ptrdiff_t>(s.first),
                                           all.begin() + static_cast<std::ptrdiff_t>(s.last));
}

int ViewWindow::scroll(int delta, size_t total) {
  long long next = static_cast<long long>(scroll_offset_) + delta;
  scroll_offset_ = static_cast<int>(std::clamp<long long>(next, 0, max_scroll(total)));
  return scroll_offset_;
}

void ViewWindow::clamp(size_t total) {
  scroll_offset_ = std::clamp(scroll_offset_, 0, max_scroll(total));
}

memfo::model::Cell ViewWindow::column_value(const memfo::model::Bucket& bucket,
                                            const memfo::model::Bucket* previous,
                                            size_t field_idx, bool delta_mode) {
  using memfo::model::CellState;
  memfo::model::Cell cell{};
  cell.is_delta = delta_mode;
  cell.partial = !bucket.complete;
  if (bucket.empty()) { cell.state = CellState::EmptyBucket; return cell; }
  auto cur = bucket.rep->value(field_idx);
  if (!cur) { cell.state = CellState::Absent; return cell; }
  if (!delta_mode) {
    cell.state = CellState::Value;
    cell.value = *cur;
    return cell;
  }
  if (!previous || previous->empty()) { cell.state = CellState::NoBaseline; return cell; }
  auto prev = previous->rep->value(field_idx);
  if (!prev) { cell.state = CellState::NoBaseline; return cell; }
  cell.state = CellState::Value;
  cell.value = *cur - *prev;
  return cell;
}

} // namespace memfo::app
