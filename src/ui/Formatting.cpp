#include "ui/Formatting.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace memfo::ui {

// Largest byte count the columns are sized for
static constexpr double kMaxRenderBytes = 999.0 * 1000 * 1000 * 1000;

std::optional<Units> parse_units(std::string_view s) {
  if (s == "KiB") return Units::KiB;
  if (s == "MB") return Units::MB;
  if (s == "MiB") return Units::MiB;
  if (s == "GB") return Units::GB;
  if (s == "GiB") return Units::GiB;
  if (s == "human") return Units::Human;
  return std::nullopt;
}

const char* units_name(Units u) {
  switch (u) {
    case Units::KiB: return "KiB";
    case Units::MB: return "MB";
    case Units::MiB: return "MiB";
    case Units::GB: return "GB";
    case Units::GiB: return "GiB";
    case Units::Human: return "human";
  }
  return "MiB";
}

std::string format_elapsed(double secs, bool show_sign) {
  long long ago = std::llround(std::fabs(secs));
  static constexpr long long divs[] = {60, 60, 24, 7, 52};
  static constexpr char units[] = {'s', 'm', 'h', 'd', 'w', 'y'};
  // (low, high) pair; step up until the high part fits its unit
  long long lo = ago % 60, hi = ago / 60;
  int uidx = 1;
  for (int i = 1; i < 5; ++i) {
    if (hi < divs[i]) break;
    lo = hi % divs[i];
    hi = hi / divs[i];
    ++uidx;
  }
  std::string out = (show_sign && secs < 0) ? "-" : "";
  if (hi) out += std::to_string(hi) + units[uidx];
  out += std::to_string(lo) + units[uidx - 1];
  return out;
}

std::string human_bytes(double bytes) {
  if (bytes < 0) return "-" + human_bytes(-bytes);
  static constexpr char suffixes[] = {'K', 'M', 'G', 'T'};
  double n = bytes;
  char buf[32];
  for (int i = 0; i < 4; ++i) {
    n /= 1024.0;
    if (n < 999.95 || i == 3) {
      std::snprintf(buf, sizeof(buf), "%.1f%c", n, suffixes[i]);
      return buf;
    }
  }
  return std::string();
}

std::string group_thousands(long long v) {
  std::string digits = std::to_string(v < 0 ? -(unsigned long long)v : (unsigned long long)v);
  std::string out;
  int n = 0;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    if (n && n % 3 == 0) out.insert(out.begin(), ',');
    out.insert(out.begin(), *it);
    ++n;
  }
  return v < 0 ? "-" + out : out;
}

static std::string render_raw(double bytes, Units u, bool show_sign) {
  std::string s;
  if (u == Units::Human) {
    s = human_bytes(bytes);
  } else if (u == Units::KiB) {
    s = group_thousands(std::llround(bytes / 1024.0));
  } else {
    double div = (u == Units::MB) ? 1e6 : (u == Units::MiB) ? 1048576.0
               : (u == Units::GB) ? 1e9 : 1073741824.0;
    double scaled = std::round(bytes / div * 10.0) / 10.0;
    long long whole = static_cast<long long>(std::fabs(scaled));
    int tenth = static_cast<int>(std::llround(std::fabs(scaled) * 10.0) % 10);
    s = (scaled < 0 ? "-" : "") + group_thousands(whole) + "." + std::to_string(tenth);
  }
  if (show_sign && !s.empty() && s[0] != '-') s = "+" + s;
  return s;
}

int value_width(Units u) {
  return static_cast<int>(render_raw(-kMaxRenderBytes, u, false).size());
}

std::string render_value(int64_t v, bool kb, Units u, bool show_sign) {
  std::string s;
  if (kb) {
    s = render_raw(static_cast<double>(v) * 1024.0, u, show_sign);
  } else {
    s = group_thousands(v);
    if (show_sign && v >= 0) s = "+" + s;
  }
  return rpad_trunc(s, std::max<int>(value_width(u), static_cast<int>(s.size())));
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = static_cast<int>(s.size());
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return s.substr(0, w);
  return s.substr(0, w - 1) + ".";
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = static_cast<int>(s.size());
  if (cols == w) return s;
  if (cols < w) return std::string(w - cols, ' ') + s;
  return s.substr(0, w);
}

std::string format_wall_local(memfo::model::WallClock::time_point t) {
  std::time_t tt = memfo::model::WallClock::to_time_t(t);
  std::tm lt{};
  ::localtime_r(&tt, &lt);
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%m/%d %H:%M:%S", &lt) == 0) return std::string();
  return std::string(buf);
}

std::string format_wall_iso_utc(memfo::model::WallClock::time_point t) {
  std::time_t tt = memfo::model::WallClock::to_time_t(t);
  std::tm ut{};
  ::gmtime_r(&tt, &ut);
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &ut) == 0) return std::string();
  return std::string(buf);
}

} // namespace memfo::ui
