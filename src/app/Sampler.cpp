#include "app/Sampler.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

using namespace std::chrono;

namespace memfo::app {

milliseconds Sampler::clamp_interval(milliseconds ms) {
  return std::clamp(ms, kMinInterval, kMaxInterval);
}

milliseconds Sampler::interval_from_seconds(double s) {
  const double lo = duration<double>(kMinInterval).count();
  const double hi = duration<double>(kMaxInterval).count();
  if (std::isnan(s)) s = lo;
  s = std::clamp(s, lo, hi);
  return milliseconds(std::llround(s * 1000.0));
}

Sampler::Sampler(Monitor& monitor, memfo::collectors::ISnapshotSource& source, milliseconds interval)
  : monitor_(monitor), source_(source), interval_(clamp_interval(interval)) {}

Sampler::~Sampler() { stop(); }

void Sampler::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Sampler::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

bool Sampler::tick() {
  auto reading = source_.sample();
  bool ok = false;
  if (!reading) {
    uint64_t n = ++consecutive_failures_;
    ++failures_;
    if (n == 1 || n % 60 == 0) {
      std::fprintf(stderr, "memfo: Sampler: source '%s' unavailable (%llu consecutive failures)\n",
                   source_.name(), static_cast<unsigned long long>(n));
    }
  } else {
    uint64_t prev = consecutive_failures_.exchange(0);
    if (prev > 0) {
      std::fprintf(stderr, "memfo: Sampler: source '%s' recovered after %llu failures\n",
                   source_.name(), static_cast<unsigned long long>(prev));
    }
    ok = monitor_.ingest(*reading);
  }
  uint64_t t = ++ticks_;
  if (on_tick_) on_tick_(t, ok);
  return ok;
}

void Sampler::run(std::stop_token st) {
  auto next_due = steady_clock::now();
  while (!st.stop_requested()) {
    auto now = steady_clock::now();
    if (now >= next_due) {
      (void)tick();
      next_due += interval_;
      // fell behind (suspend, slow source): resync instead of bursting
      if (next_due <= steady_clock::now()) next_due = steady_clock::now() + interval_;
    }
    // sleep in short slices so stop requests are honored promptly
    auto sleep_for = duration_cast<milliseconds>(next_due - steady_clock::now());
    if (sleep_for < 1ms) sleep_for = 1ms;
    if (sleep_for > 100ms) sleep_for = 100ms;
    std::this_thread::sleep_for(sleep_for);
  }
}

} // namespace memfo::app
