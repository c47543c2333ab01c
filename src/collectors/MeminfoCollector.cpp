#include "collectors/MeminfoCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>
#include <utility>

namespace memfo::collectors {

static inline std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

// "Name:   1234 kB" -> {Name, 1234, kb=true}; "HugePages_Free: 0" -> kb=false
static bool parse_line(std::string_view line, memfo::model::RawField& out) {
  size_t colon = line.find(':');
  if (colon == std::string_view::npos || colon == 0) return false;
  std::string_view key = line.substr(0, colon);
  std::string_view rest = trim(line.substr(colon + 1));
  if (rest.empty() || rest.front() < '0' || rest.front() > '9') return false;

  int64_t v = 0;
  auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), v);
  if (ec != std::errc()) return false;
  std::string_view suffix = trim(rest.substr(static_cast<size_t>(ptr - rest.data())));
  if (!suffix.empty() && suffix != "kB") return false;

  out.name.assign(key.data(), key.size());
  out.value = v;
  out.kb = (suffix == "kB");
  return true;
}

std::vector<memfo::model::RawField> MeminfoCollector::parse(std::string_view text, bool include_vmalloc_total) {
  std::vector<memfo::model::RawField> fields;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    memfo::model::RawField f;
    if (parse_line(text.substr(start, end - start), f)) {
      if (include_vmalloc_total || f.name != "VmallocTotal") fields.push_back(std::move(f));
    }
    start = end + 1;
  }
  return fields;
}

MeminfoCollector::MeminfoCollector(MonoClock::time_point run_start, bool include_vmalloc_total, std::string path)
  : run_start_(run_start), include_vmalloc_total_(include_vmalloc_total), path_(std::move(path)) {}

std::optional<memfo::model::RawReading> MeminfoCollector::sample() {
  auto txt_opt = memfo::util::read_file_string(path_);
  if (!txt_opt) return std::nullopt;
  memfo::model::RawReading r;
  r.mono_s = std::chrono::duration<double>(MonoClock::now() - run_start_).count();
  r.wall = memfo::model::WallClock::now();
  r.fields = parse(*txt_opt, include_vmalloc_total_);
  if (r.fields.empty()) return std::nullopt;
  return r;
}

} // namespace memfo::collectors
