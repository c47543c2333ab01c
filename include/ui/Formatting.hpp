#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "model/Snapshot.hpp"

namespace memfo::ui {

enum class Units { KiB, MB, MiB, GB, GiB, Human };

std::optional<Units> parse_units(std::string_view s);
const char* units_name(Units u);

// Compact elapsed time: 5s, 1m5s, 18h39m, 2d3h
std::string format_elapsed(double secs, bool show_sign = false);

// 1.0K / 12.3M / 4.0G from a byte count
std::string human_bytes(double bytes);

// Render one field value. kb=true values are kilobytes and scale with the
// unit; plain counts are printed as integers. Right-aligned to value_width(u).
std::string render_value(int64_t v, bool kb, Units u, bool show_sign = false);
int value_width(Units u);

// Thousands separators: 1234567 -> "1,234,567"
std::string group_thousands(long long v);

// Text alignment (ASCII)
std::string trunc_pad(const std::string& s, int w);
std::string rpad_trunc(const std::string& s, int w);

// Date/time formatting
std::string format_wall_local(memfo::model::WallClock::time_point t);   // 10/19 14:03:07
std::string format_wall_iso_utc(memfo::model::WallClock::time_point t); // 2026-10-19T12:03:07

} // namespace memfo::ui
