// -----------------------------------------------------------------------------
// flow_control.cpp: capacity wait and pacing arithmetic
// API & tables: include/chunkwire/flow_control.hpp
// -----------------------------------------------------------------------------
#include "chunkwire/flow_control.hpp"

namespace chunkwire {

static constexpr size_t KIB = 1024;
static constexpr uint64_t MIB = 1024ull * 1024ull;

size_t capacity_threshold(size_t budget) {
  const size_t t = budget / 4;
  return t ? t : 1;                  // budget < 4 would otherwise never be "ready"
}

uint32_t poll_interval_ms(size_t buffered) {
  if (buffered > 32 * KIB) return POLL_INTERVAL_MAX_MS;
  if (buffered > 16 * KIB) return 100;
  return 50;
}

uint32_t pacing_delay_ms(const TransferConfig& cfg, uint64_t total_size, size_t buffered) {
  if (cfg.send_delay_ms == 0) return 0;

  uint32_t size_factor = 1;
  if (total_size >= 100 * MIB)     size_factor = 4;
  else if (total_size >= 10 * MIB) size_factor = 2;

  uint32_t occupancy_factor = 1;
  if (buffered > 32 * KIB)      occupancy_factor = 5;
  else if (buffered > 16 * KIB) occupancy_factor = 2;

  return cfg.send_delay_ms * size_factor * occupancy_factor;
}

void CapacityWait::begin(size_t threshold, uint32_t max_attempts, uint64_t now_ms) {
  threshold_    = threshold ? threshold : 1;
  max_attempts_ = max_attempts ? max_attempts : 1;
  attempts_     = 0;
  next_poll_ms_ = now_ms;
}

// -----------------------------------------------------------------------------
// poll()
// PRE:   begin() was called for this wait.
// POLICY:
//   - Liveness first, on every call, so a closed channel fails fast even
//     between scheduled polls.
//   - An attempt is only spent when the poll is due.
// -----------------------------------------------------------------------------
WaitStatus CapacityWait::poll(const transport::IChannel& channel, uint64_t now_ms) {
  if (!channel.is_open()) return WaitStatus::ChannelClosed;
  if (now_ms < next_poll_ms_) return WaitStatus::Waiting;

  const size_t buffered = channel.buffered_amount();
  if (buffered < threshold_) return WaitStatus::Ready;

  ++attempts_;
  if (attempts_ >= max_attempts_) return WaitStatus::Timeout;

  next_poll_ms_ = now_ms + poll_interval_ms(buffered);
  return WaitStatus::Waiting;
}

} // namespace chunkwire
