/**
 * @file sender.hpp
 * @brief Sending half of one transfer: source -> DATA_CHUNK packets -> channel.
 *
 * @details
 * ## States
 * ```
 *   Idle ──start()──► Streaming ──► Completed
 *                        │    └───► Failed     (on_error once)
 *                        └────────► Cancelled  (silent)
 * ```
 * Terminal states are final.
 *
 * ## Drive loop (one step at a time, from tick())
 * ```
 *   NeedChunk ─► AwaitCapacity ─► Transmit ─► Pace ─┐
 *       ▲              ▲              │              │
 *       │              └── Backoff ◄──┘ (transient)  │
 *       └────────────────────────────────────────────┘
 * ```
 * - **NeedChunk**: take the next slice (<= chunk_size) of the current source
 *   block, pulling a new block when it is used up. Source `Pending` waits.
 * - **AwaitCapacity**: CapacityWait against budget/4.
 * - **Transmit**: re-check the channel is open, frame, send.
 * - **Backoff**: after a transient failure, min(base * 2^(n-1), cap) ms,
 *   then the same chunk goes back to AwaitCapacity.
 * - **Pace**: governed delay from pacing_delay_ms().
 *
 * At most one chunk is transmitted per tick. Several phases may advance in
 * one tick when nothing has to wait.
 *
 * ## Failure policy
 * | event                               | result                       |
 * |-------------------------------------|------------------------------|
 * | channel not open at start           | start() fails ChannelNotReady |
 * | channel closed (wait or send)       | Failed / ChannelClosed        |
 * | capacity wait timed out             | retry (BufferTimeout)         |
 * | send refused, channel still open    | retry (Transmit)              |
 * | retries reach max_retries           | Failed / RetriesExhausted     |
 * | no progress for stall_timeout_ms    | Failed / StalledTransfer      |
 * | source error / overshoot / short    | Failed / Source               |
 *
 * The retry counter is per chunk; it resets on every successful send.
 */
#ifndef CHUNKWIRE_SENDER_HPP
#define CHUNKWIRE_SENDER_HPP

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <vector>

#include "chunkwire/callbacks.hpp"
#include "chunkwire/config.hpp"
#include "chunkwire/errors.hpp"
#include "chunkwire/flow_control.hpp"
#include "chunkwire/obfuscator.hpp"
#include "chunkwire/packet.hpp"
#include "chunkwire/source.hpp"
#include "chunkwire/throughput.hpp"
#include "chunkwire/transport/channel.hpp"

namespace chunkwire {

class Sender {
public:
  enum class State : uint8_t { Idle = 0, Streaming, Completed, Cancelled, Failed };

  Sender(const TransferConfig& cfg, const ObfuscationKey& key);
  Sender(const Sender&) = delete;
  Sender& operator=(const Sender&) = delete;

  /**
   * @brief Probe the channel and enter Streaming.
   *
   * Sends one HEARTBEAT packet (sequence 0, empty payload). Only a send that
   * reports `TxResult::Error`, or a channel that is not open, counts as
   * not ready; a `Busy` probe still proves the link is up.
   *
   * @retval false @p err is ChannelNotReady or Config; state stays Idle and
   *               no callback fires.
   */
  bool start(std::unique_ptr<ISource> source,
             const TransferId& transfer_id,
             transport::IChannel& channel,
             TransferCallbacks callbacks,
             uint64_t now_ms,
             Error& err);

  /// Advance the drive loop. No-op unless Streaming.
  void tick(uint64_t now_ms);

  /// Clear the active flag; the next tick() moves to Cancelled without callbacks.
  void cancel();

  State state() const { return state_; }
  bool  is_terminal() const {
    return state_ == State::Completed || state_ == State::Cancelled || state_ == State::Failed;
  }
  bool active() const { return active_; }

  const TransferId& transfer_id() const { return id_; }
  uint64_t total_size() const     { return total_; }
  uint64_t bytes_sent() const     { return bytes_sent_; }
  uint32_t next_sequence() const  { return sequence_; }
  uint32_t retry_count() const    { return retries_; }
  uint64_t started_ms() const     { return started_ms_; }
  uint64_t last_progress_ms() const { return last_progress_ms_; }
  const Error& last_error() const { return error_; }

  /// Earliest time tick() can make progress; UINT64_MAX when terminal or idle.
  uint64_t next_wakeup_ms() const;

private:
  enum class Phase : uint8_t { NeedChunk = 0, AwaitCapacity, Transmit, Backoff, Pace };

  bool step(uint64_t now_ms, bool& sent);     // one phase; false = wait
  bool take_chunk(uint64_t now_ms);
  bool await_capacity(uint64_t now_ms);
  bool transmit(uint64_t now_ms, bool& sent);
  void on_sent(uint64_t now_ms);
  void transient_failure(const Error& cause, uint64_t now_ms);

  void complete();
  void fail(const Error& err);

  TransferConfig                cfg_;
  ObfuscationKey                key_;
  TransferId                    id_;
  std::unique_ptr<ISource>      source_;
  transport::IChannel*          channel_{nullptr};
  TransferCallbacks             cb_;

  State    state_{State::Idle};
  Phase    phase_{Phase::NeedChunk};
  bool     active_{false};

  uint64_t total_{0};
  uint64_t bytes_sent_{0};
  uint32_t sequence_{0};
  uint32_t retries_{0};
  uint64_t started_ms_{0};
  uint64_t last_progress_ms_{0};
  uint64_t wake_ms_{0};
  uint64_t now_ms_{0};

  std::vector<uint8_t> block_;                // last block from the source
  size_t               block_off_{0};         // next unsent byte in block_
  std::vector<uint8_t> chunk_;                // payload being transmitted/retried
  CapacityWait         wait_;
  ThroughputMeter      meter_;
  Error                error_;
};

const char* to_string(Sender::State s);

} // namespace chunkwire

#endif // CHUNKWIRE_SENDER_HPP
