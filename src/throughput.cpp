// -----------------------------------------------------------------------------
// throughput.cpp: windowed rate estimate and byte formatting
// API: include/chunkwire/throughput.hpp
// -----------------------------------------------------------------------------
#include "chunkwire/throughput.hpp"

#include <stdio.h>

namespace chunkwire {

ThroughputMeter::ThroughputMeter(uint32_t window_ms)
: window_ms_(window_ms ? window_ms : DEFAULT_WINDOW_MS) {}

// -----------------------------------------------------------------------------
// record()
// POLICY:
//   - Same-millisecond samples collapse into one (keep the larger total).
//   - Evict from the front while the second-oldest sample is already outside
//     the window: the oldest then stays as the anchor.
//   - Ring full: drop the oldest regardless. Fast senders lose a little
//     window length, never correctness.
// -----------------------------------------------------------------------------
void ThroughputMeter::record(uint64_t now_ms, uint64_t total_bytes) {
  if (!samples_.empty() && samples_.back().t_ms == now_ms) {
    samples_.back().bytes = total_bytes;
    return;
  }

  if (samples_.full()) samples_.pop_front();
  samples_.push_back(Sample{now_ms, total_bytes});

  while (samples_.size() > 2 && now_ms - samples_[1].t_ms >= window_ms_) {
    samples_.pop_front();
  }
}

double ThroughputMeter::bytes_per_second() const {
  if (samples_.size() < 2) return 0.0;

  const Sample& first = samples_.front();
  const Sample& last  = samples_.back();
  if (last.t_ms <= first.t_ms || last.bytes < first.bytes) return 0.0;

  return static_cast<double>(last.bytes - first.bytes) * 1000.0
       / static_cast<double>(last.t_ms - first.t_ms);
}

void ThroughputMeter::reset() { samples_.clear(); }

std::string format_bytes(uint64_t n) {
  static const char* UNITS[] = { "KB", "MB", "GB", "TB" };
  if (n < 1024) return std::to_string(n) + " B";

  double v = static_cast<double>(n) / 1024.0;
  size_t u = 0;
  while (v >= 1024.0 && u + 1 < sizeof(UNITS) / sizeof(UNITS[0])) {
    v /= 1024.0;
    ++u;
  }
  char buf[32];
  snprintf(buf, sizeof(buf), "%.2f %s", v, UNITS[u]);
  return buf;
}

} // namespace chunkwire
