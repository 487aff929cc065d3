/**
 * @file receiver.hpp
 * @brief Receiving half of one transfer: DATA_CHUNK payloads -> ordered sink writes.
 *
 * @details
 * ## States
 * ```
 *   AwaitingSink ──sink ready──► Active ──► Completed
 *        │                         │   └──► Failed     (on_error once)
 *        └─────────────────────────┴──────► Cancelled  (silent)
 * ```
 *
 * ## Why AwaitingSink accepts chunks
 * Opening the destination can take a while (a prompt, a slow mount), and
 * the sender does not wait for it. Chunks that arrive before the sink is
 * ready are staged in arrival order. When the sink becomes ready they are
 * replayed through on_chunk() before any live chunk, so the ordered drain
 * below sees exactly what it would have seen with an instant sink.
 *
 * ## Ordered drain
 * ```
 *   on_chunk(seq, bytes)
 *     ├─ seq < cursor or already pending ─► ignore (duplicate)
 *     ├─ received + len > declared        ─► Failed / Sink (overshoot)
 *     ├─ pending[seq] = bytes ; received += len
 *     ├─ while pending has cursor: write, erase, ++cursor
 *     ├─ on_progress
 *     └─ received == declared             ─► close sink, Completed
 * ```
 * Invariant: every sequence below the cursor has been written and is no
 * longer pending.
 *
 * A sink failure (open, write, close) is never retried. The writer is
 * aborted and the transfer fails.
 */
#ifndef CHUNKWIRE_RECEIVER_HPP
#define CHUNKWIRE_RECEIVER_HPP

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "chunkwire/callbacks.hpp"
#include "chunkwire/errors.hpp"
#include "chunkwire/packet.hpp"
#include "chunkwire/sink.hpp"
#include "chunkwire/throughput.hpp"

namespace chunkwire {

class Receiver {
public:
  enum class State : uint8_t { AwaitingSink = 0, Active, Completed, Cancelled, Failed };

  Receiver(const TransferId& transfer_id, std::string file_name, uint64_t declared_size);
  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  /**
   * @brief Begin sink acquisition and poll the chain once.
   *
   * The sink may become ready inside this call (and a zero-byte transfer
   * may complete inside it). Fails only when called twice.
   */
  bool start(SinkChain sinks, TransferCallbacks callbacks, uint64_t now_ms, Error& err);

  /// Re-poll a pending sink provider. No-op once the sink is ready.
  void tick(uint64_t now_ms);

  /// Hand over one de-obfuscated payload.
  void on_chunk(uint32_t sequence, std::vector<uint8_t> payload, uint64_t now_ms);

  /// Abort the writer (best effort, logged) and stop. No callbacks.
  void cancel();

  State state() const { return state_; }
  bool  is_terminal() const {
    return state_ == State::Completed || state_ == State::Cancelled || state_ == State::Failed;
  }
  bool  ready() const { return ready_; }

  const TransferId&  transfer_id() const   { return id_; }
  const std::string& file_name() const     { return file_name_; }
  uint64_t declared_size() const           { return declared_; }
  uint64_t bytes_received() const         { return received_; }
  uint64_t bytes_written() const          { return written_; }
  uint32_t next_expected() const          { return cursor_; }
  size_t   pending_count() const          { return pending_.size(); }
  size_t   early_count() const            { return early_.size(); }
  const char* sink_kind() const           { return sink_kind_; }
  const Error& last_error() const         { return error_; }

  uint64_t next_wakeup_ms() const;

private:
  void poll_sink(uint64_t now_ms);
  void accept(uint32_t sequence, std::vector<uint8_t> payload, uint64_t now_ms);
  bool write_chunk(const std::vector<uint8_t>& bytes, std::string& why);
  void finish();
  void fail(const Error& err);
  void abort_writer(const char* why);

  TransferId  id_;
  std::string file_name_;
  uint64_t    declared_;

  State     state_{State::AwaitingSink};
  bool      started_{false};
  bool      ready_{false};
  uint64_t  received_{0};
  uint64_t  written_{0};
  uint32_t  cursor_{0};
  uint64_t  now_ms_{0};

  std::map<uint32_t, std::vector<uint8_t>>               pending_;
  std::vector<std::pair<uint32_t, std::vector<uint8_t>>> early_;

  SinkChain                sinks_;
  std::unique_ptr<IWriter> writer_;
  const char*              sink_kind_{"none"};
  TransferCallbacks        cb_;
  ThroughputMeter          meter_;
  Error                    error_;
};

const char* to_string(Receiver::State s);

} // namespace chunkwire

#endif // CHUNKWIRE_RECEIVER_HPP
