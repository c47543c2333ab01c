#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <thread>
#include <utility>
#include "app/Monitor.hpp"
#include "collectors/ISnapshotSource.hpp"

namespace memfo::app {

// Polls a snapshot source on a fixed cadence and feeds the Monitor.
// Source failures are transient: the loop keeps going and logs the first
// failure, every 60th consecutive one, and the recovery.
class Sampler {
public:
  using TickCallback = std::function<void(uint64_t tick, bool ok)>;

  static constexpr std::chrono::milliseconds kMinInterval{500};
  static constexpr std::chrono::milliseconds kMaxInterval{3600 * 1000};

  Sampler(Monitor& monitor, memfo::collectors::ISnapshotSource& source,
          std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;
  ~Sampler();

  // Invoked on the sampling thread after every tick; set before start()
  void set_on_tick(TickCallback cb) { on_tick_ = std::move(cb); }

  void start();
  void stop();

  // One sample + ingest. Returns true when a snapshot was stored.
  bool tick();

  std::chrono::milliseconds interval() const { return interval_; }
  uint64_t ticks() const { return ticks_.load(); }
  uint64_t failures() const { return failures_.load(); }
  uint64_t consecutive_failures() const { return consecutive_failures_.load(); }

  [[nodiscard]] static std::chrono::milliseconds clamp_interval(std::chrono::milliseconds ms);
  // Seconds from the command line; clamped before conversion so huge or
  // non-finite values cannot overflow. NaN maps to the minimum.
  [[nodiscard]] static std::chrono::milliseconds interval_from_seconds(double s);

private:
  void run(std::stop_token st);

  Monitor& monitor_;
  memfo::collectors::ISnapshotSource& source_;
  std::chrono::milliseconds interval_;
  TickCallback on_tick_;
  std::atomic<uint64_t> ticks_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<uint64_t> consecutive_failures_{0};
  std::jthread thread_{};
};

} // namespace memfo::app
