/**
 * @file flow_control.hpp
 * @brief Back-pressure: wait for channel buffer space, pace between chunks.
 *
 * @details
 * ## Capacity wait
 * A sender that wants to transmit first waits until the channel's
 * `buffered_amount()` drops below a threshold. The threshold is a quarter
 * of the configured budget, not the budget itself: once the queue drains
 * that far there is room for several chunks before congestion returns, so
 * the sender does not flap between waiting and sending.
 *
 * The wait is a polled, non-blocking object. Each poll that finds the
 * buffer still full counts one attempt and schedules the next poll after
 * an interval that grows with the backlog:
 *
 * | buffered       | next poll |
 * |----------------|-----------|
 * | > 32 KiB       | 200 ms    |
 * | > 16 KiB       | 100 ms    |
 * | otherwise      | 50 ms     |
 *
 * The wait ends with:
 * - `Ready`          buffered < threshold;
 * - `ChannelClosed`  the channel was not open at a poll (checked first, every call);
 * - `Timeout`        `max_attempts` polls found no room.
 *
 * ## Pacing
 * After each successful send the sender sleeps for
 * `send_delay_ms * size_factor * occupancy_factor`, where large files and a
 * busy buffer both stretch the gap. A zero base delay disables pacing.
 */
#ifndef CHUNKWIRE_FLOW_CONTROL_HPP
#define CHUNKWIRE_FLOW_CONTROL_HPP

#include <stddef.h>
#include <stdint.h>
#include "chunkwire/config.hpp"
#include "chunkwire/transport/channel.hpp"

namespace chunkwire {

enum class WaitStatus : uint8_t { Ready = 0, Waiting, ChannelClosed, Timeout };

/// Longest interval poll_interval_ms() ever returns.
static constexpr uint32_t POLL_INTERVAL_MAX_MS = 200;

/// Largest size_factor * occupancy_factor pacing_delay_ms() applies.
static constexpr uint32_t PACING_FACTOR_MAX = 4 * 5;

/// Hysteresis threshold for a buffered-bytes budget: budget / 4, at least 1.
size_t capacity_threshold(size_t budget);

/// Adaptive poll interval for the current backlog (see table above).
uint32_t poll_interval_ms(size_t buffered);

/**
 * @brief Inter-chunk delay after a successful send.
 * @param total_size Declared size of the file being sent.
 * @param buffered   Channel backlog right after the send.
 */
uint32_t pacing_delay_ms(const TransferConfig& cfg, uint64_t total_size, size_t buffered);

class CapacityWait {
public:
  /// Arm a new wait. The first poll happens at @p now_ms.
  void begin(size_t threshold, uint32_t max_attempts, uint64_t now_ms);

  /**
   * @brief Check the channel once.
   *
   * Calls before next_poll_ms() only re-check liveness and return `Waiting`
   * without spending an attempt.
   */
  WaitStatus poll(const transport::IChannel& channel, uint64_t now_ms);

  uint64_t next_poll_ms() const { return next_poll_ms_; }
  uint32_t attempts() const     { return attempts_; }
  uint32_t max_attempts() const { return max_attempts_; }
  size_t   threshold() const    { return threshold_; }

private:
  size_t   threshold_{1};
  uint32_t max_attempts_{1};
  uint32_t attempts_{0};
  uint64_t next_poll_ms_{0};
};

} // namespace chunkwire

#endif // CHUNKWIRE_FLOW_CONTROL_HPP
