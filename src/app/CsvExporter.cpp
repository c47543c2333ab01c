#include "app/CsvExporter.hpp"
#include "ui/Formatting.hpp"
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace memfo::app {

// Field names come from /proc/meminfo ("Active(anon)") and never need it,
// but quote anything that would break the row
static std::string csv_field(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::string CsvExporter::render(const std::vector<std::string>& names,
                                const std::vector<memfo::model::SnapshotPtr>& snapshots) {
  std::string out = "wall_time,mono_s";
  for (const auto& n : names) { out += ','; out += csv_field(n); }
  out += '\n';

  char buf[32];
  for (const auto& s : snapshots) {
    if (!s) continue;
    out += memfo::ui::format_wall_iso_utc(s->wall);
    std::snprintf(buf, sizeof(buf), ",%.3f", s->mono_s);
    out += buf;
    for (size_t i = 0; i < names.size(); ++i) {
      out += ',';
      if (auto v = s->value(i)) {
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), *v);
        out.append(buf, ptr);
      }
    }
    out += '\n';
  }
  return out;
}

bool CsvExporter::write(const std::filesystem::path& path,
                        const std::vector<std::string>& names,
                        const std::vector<memfo::model::SnapshotPtr>& snapshots) {
  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    std::fprintf(stderr, "memfo: CsvExporter: failed to open %s: %s\n",
                 path.c_str(), std::strerror(errno));
    return false;
  }
  std::string body = render(names, snapshots);
  file.write(body.data(), static_cast<std::streamsize>(body.size()));
  file.flush();
  if (!file) {
    std::fprintf(stderr, "memfo: CsvExporter: write to %s failed\n", path.c_str());
    return false;
  }
  std::fprintf(stderr, "memfo: CsvExporter: wrote %zu samples to %s\n", snapshots.size(), path.c_str());
  return true;
}

} // namespace memfo::app
