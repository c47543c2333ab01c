#pragma once
#include <string>
#include <vector>
#include "model/Snapshot.hpp"

namespace memfo::model {

// [start_s, end_s) span of one bucket
struct BucketBounds {
  double start_s{};
  double end_s{};
};

struct Bucket {
  double start_s{};
  double end_s{};
  SnapshotPtr rep;       // latest snapshot inside the span; null when empty
  bool complete{false};  // end_s <= now

  bool empty() const { return rep == nullptr; }
};

enum class CellState {
  Value,       // value is meaningful
  EmptyBucket, // no snapshot fell inside the bucket
  Absent,      // field missing from the representative snapshot
  NoBaseline   // delta requested but there is no usable previous bucket
};

struct Cell {
  CellState state{CellState::EmptyBucket};
  int64_t value{};
  bool is_delta{false};
  bool partial{false};

  bool has_value() const { return state == CellState::Value; }
};

struct DisplayColumn {
  std::string label;     // compact elapsed time since run start, e.g. "1m5s"
  std::string wall_label; // local wall time of the representative
  double start_s{};
  double end_s{};
  bool partial{false};   // open bucket that still tracks new samples
  bool empty{false};
  std::vector<Cell> cells; // one per registry field
};

struct DisplayFrame {
  std::vector<DisplayColumn> columns; // oldest first
  std::vector<std::string> field_names;
  std::vector<bool> field_kb; // per field: kilobytes (true) or plain count
  bool is_scrolled{false};
  bool delta_mode{false};
  size_t total_buckets{0};
  int scroll_offset{0};
};

} // namespace memfo::model
