#include "ui/Report.hpp"
#include <algorithm>
#include <cstdio>

namespace memfo::ui {

std::string Report::cell_text(const memfo::model::Cell& c, bool kb, Units u) {
  using memfo::model::CellState;
  switch (c.state) {
    case CellState::Value: return render_value(c.value, kb, u, c.is_delta);
    case CellState::EmptyBucket: return std::string();
    case CellState::Absent: return "n/a";
    case CellState::NoBaseline: return "-";
  }
  return std::string();
}

std::string Report::render(const memfo::model::DisplayFrame& frame,
                           const memfo::app::FieldSelector& fields,
                           const ReportOptions& opts) {
  for (const auto& col : frame.columns) {
    for (size_t f = 0; f < col.cells.size() && f < frame.field_names.size(); ++f) {
      if (col.cells[f].has_value() && col.cells[f].value != 0) ever_nonzero_.insert(frame.field_names[f]);
    }
  }

  auto layout = fields.layout(frame.field_names);
  if (!opts.zeros) {
    auto drop = [&](std::vector<std::string>& v) {
      v.erase(std::remove_if(v.begin(), v.end(),
                             [&](const std::string& n) { return ever_nonzero_.count(n) == 0; }),
              v.end());
    };
    drop(layout.normal); // pinned rows always show
  }

  int key_w = 8;
  for (const auto& n : frame.field_names) key_w = std::max(key_w, static_cast<int>(n.size()));
  int val_w = value_width(opts.units);
  for (const auto& col : frame.columns) val_w = std::max(val_w, static_cast<int>(col.label.size()) + 1);

  std::string out;
  char buf[160];
  std::snprintf(buf, sizeof(buf), "units=%s interval=%s delta=%s buckets=%zu",
                units_name(opts.units), opts.interval_name.c_str(), frame.delta_mode ? "on" : "off",
                frame.total_buckets);
  out += buf;
  if (frame.is_scrolled) {
    std::snprintf(buf, sizeof(buf), " scrolled=-%d", frame.scroll_offset);
    out += buf;
  } else if (!frame.columns.empty() && !frame.columns.back().wall_label.empty()) {
    out += " at ";
    out += frame.columns.back().wall_label;
  }
  out += '\n';

  out += trunc_pad("", key_w);
  for (const auto& col : frame.columns) {
    out += ' ';
    out += rpad_trunc(col.partial ? col.label + "*" : col.label, val_w);
  }
  out += '\n';

  auto index_of = [&](const std::string& n) -> size_t {
    auto it = std::find(frame.field_names.begin(), frame.field_names.end(), n);
    return static_cast<size_t>(it - frame.field_names.begin());
  };
  auto emit_row = [&](const std::string& n) {
    size_t f = index_of(n);
    if (f >= frame.field_names.size()) return;
    bool kb = f < frame.field_kb.size() ? static_cast<bool>(frame.field_kb[f]) : true;
    out += trunc_pad(n, key_w);
    for (const auto& col : frame.columns) {
      out += ' ';
      out += rpad_trunc(f < col.cells.size() ? cell_text(col.cells[f], kb, opts.units) : std::string(), val_w);
    }
    out += '\n';
  };

  for (const auto& n : layout.pinned) emit_row(n);
  if (!layout.pinned.empty() && !layout.normal.empty()) {
    out += std::string(static_cast<size_t>(key_w) + frame.columns.size() * static_cast<size_t>(val_w + 1), '-');
    out += '\n';
  }
  for (const auto& n : layout.normal) emit_row(n);
  return out;
}

} // namespace memfo::ui
