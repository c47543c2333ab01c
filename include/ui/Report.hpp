#pragma once
#include <string>
#include <unordered_set>
#include "app/FieldSelector.hpp"
#include "model/Bucket.hpp"
#include "ui/Formatting.hpp"

namespace memfo::ui {

struct ReportOptions {
  Units units{Units::MiB};
  bool zeros{false};           // keep rows that have never been non-zero
  std::string interval_name{"Var"};
};

// Plain-text table of a DisplayFrame: one header row of column labels, then
// pinned rows, a rule, and the remaining visible rows. Cell markers:
// blank = empty bucket, "n/a" = field absent, "-" = no delta baseline.
// The open (partial) column is flagged with a trailing '*' on its label.
class Report {
public:
  [[nodiscard]] std::string render(const memfo::model::DisplayFrame& frame,
                                   const memfo::app::FieldSelector& fields,
                                   const ReportOptions& opts);

  // Fields seen non-zero in any rendered frame so far
  const std::unordered_set<std::string>& ever_nonzero() const { return ever_nonzero_; }

  static std::string cell_text(const memfo::model::Cell& c, bool kb, Units u);

private:
  std::unordered_set<std::string> ever_nonzero_;
};

} // namespace memfo::ui
