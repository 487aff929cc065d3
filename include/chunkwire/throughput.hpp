/**
 * @file throughput.hpp
 * @brief Sliding-window bytes-per-second estimate for progress reporting.
 *
 * @details
 * Samples are (time, cumulative bytes) pairs kept in a fixed ETL ring. The
 * rate is the slope between the newest sample and the oldest one still
 * inside the window (plus one anchor just before it, so a steady stream
 * measures a full window rather than a shrinking one). No heap.
 */
#ifndef CHUNKWIRE_THROUGHPUT_HPP
#define CHUNKWIRE_THROUGHPUT_HPP

#include <stddef.h>
#include <stdint.h>
#include <string>
#include "etl/deque.h"

namespace chunkwire {

class ThroughputMeter {
public:
  static constexpr size_t   SAMPLE_CAP        = 16;
  static constexpr uint32_t DEFAULT_WINDOW_MS = 1000;

  explicit ThroughputMeter(uint32_t window_ms = DEFAULT_WINDOW_MS);

  /// Record that the running total reached @p total_bytes at @p now_ms.
  void record(uint64_t now_ms, uint64_t total_bytes);

  /// Bytes per second over the window ending at the newest sample; 0 until two samples exist.
  double bytes_per_second() const;

  void reset();

  uint32_t window_ms() const { return window_ms_; }

private:
  struct Sample {
    uint64_t t_ms;
    uint64_t bytes;
  };

  uint32_t window_ms_;
  etl::deque<Sample, SAMPLE_CAP> samples_;
};

/// Human-readable size: "512 B", "1.50 KB", "2.00 MB", "1.25 GB".
std::string format_bytes(uint64_t n);

} // namespace chunkwire

#endif // CHUNKWIRE_THROUGHPUT_HPP
