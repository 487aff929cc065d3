// -----------------------------------------------------------------------------
// sender.cpp: Implementation of the chunkwire Sender
//
// API, state diagram and failure table:
//   see include/chunkwire/sender.hpp
//
// NOTE: This file is about *how* each phase decides to advance, wait or
// fail. Every phase function returns true when the next phase can run in
// the same tick and false when the loop must wait (or has terminated).
// -----------------------------------------------------------------------------
#include "chunkwire/sender.hpp"

#include <cstddef>
#include <string>
#include <utility>

#include "chunkwire/log.hpp"

namespace chunkwire {

static constexpr uint64_t SOURCE_RETRY_MS = 50;   // re-ask a Pending source after this

const char* to_string(Sender::State s) {
  switch (s) {
    case Sender::State::Idle:      return "idle";
    case Sender::State::Streaming: return "streaming";
    case Sender::State::Completed: return "completed";
    case Sender::State::Cancelled: return "cancelled";
    case Sender::State::Failed:    return "failed";
  }
  return "unknown";
}

Sender::Sender(const TransferConfig& cfg, const ObfuscationKey& key)
: cfg_(cfg), key_(key) {}

// ---------- public ----------

// -----------------------------------------------------------------------------
// start(): validate, probe the channel, enter Streaming.
// PRE:   state_ == Idle.
// POLICY:
//   - Nothing is mutated until every check has passed, so a refused start
//     leaves the object reusable.
//   - The probe is a HEARTBEAT; receivers ignore it.
// -----------------------------------------------------------------------------
bool Sender::start(std::unique_ptr<ISource> source,
                   const TransferId& transfer_id,
                   transport::IChannel& channel,
                   TransferCallbacks callbacks,
                   uint64_t now_ms,
                   Error& err) {
  if (state_ != State::Idle) { err = Error(ErrorKind::Config, "sender already started"); return false; }
  if (!cfg_.validate(err)) return false;
  if (!source)               { err = Error(ErrorKind::Config, "no source"); return false; }
  if (transfer_id.empty())   { err = Error(ErrorKind::Config, "empty transfer id"); return false; }
  if (encoded_size(transfer_id.size(), cfg_.chunk_size) > channel.max_message_size()) {
    err = Error(ErrorKind::Config, "chunk_size too large for channel " + std::string(channel.name()));
    return false;
  }

  if (!channel.is_open()) {
    err = Error(ErrorKind::ChannelNotReady,
                std::string("channel is ") + transport::to_string(channel.ready_state()));
    return false;
  }
  const std::vector<uint8_t> probe = encode_packet(HEARTBEAT, transfer_id, 0, nullptr, 0, key_);
  if (channel.send(probe.data(), probe.size()) == transport::TxResult::Error) {
    err = Error(ErrorKind::ChannelNotReady, "heartbeat probe failed");
    return false;
  }

  source_           = std::move(source);
  id_               = transfer_id;
  channel_          = &channel;
  cb_               = std::move(callbacks);
  total_            = source_->total_size();
  state_            = State::Streaming;
  phase_            = Phase::NeedChunk;
  active_           = true;
  started_ms_       = now_ms;
  last_progress_ms_ = now_ms;
  now_ms_           = now_ms;
  wake_ms_          = now_ms;
  meter_.record(now_ms, 0);

  log_line(LogLevel::Info, "sender",
           "event=start id=" + id_text(id_) + " size=" + std::to_string(total_) +
           " source=" + source_->kind());
  err.clear();
  return true;
}

// -----------------------------------------------------------------------------
// tick(): cancel check, stall check, then phases until one has to wait.
// POLICY:
//   - Cancellation wins over everything; it is silent.
//   - Stall is measured from the last successful send (or start).
//   - At most one chunk leaves per tick.
// -----------------------------------------------------------------------------
void Sender::tick(uint64_t now_ms) {
  now_ms_ = now_ms;
  if (state_ != State::Streaming) return;

  if (!active_) {
    state_ = State::Cancelled;
    log_line(LogLevel::Info, "sender", "event=cancelled id=" + id_text(id_));
    source_.reset();
    return;
  }

  if (now_ms >= last_progress_ms_ && now_ms - last_progress_ms_ >= cfg_.stall_timeout_ms) {
    fail(Error(ErrorKind::StalledTransfer,
               "no progress for " + std::to_string(now_ms - last_progress_ms_) + " ms"));
    return;
  }

  bool sent = false;
  while (state_ == State::Streaming && !sent && step(now_ms, sent)) {
  }
}

void Sender::cancel() {
  active_ = false;
}

uint64_t Sender::next_wakeup_ms() const {
  if (state_ != State::Streaming) return UINT64_MAX;
  if (!active_) return now_ms_;

  uint64_t t = now_ms_;
  switch (phase_) {
    case Phase::NeedChunk:     t = wake_ms_ > now_ms_ ? wake_ms_ : now_ms_; break;
    case Phase::Transmit:      t = now_ms_; break;
    case Phase::AwaitCapacity: t = wait_.next_poll_ms(); break;
    case Phase::Backoff:
    case Phase::Pace:          t = wake_ms_; break;
  }
  const uint64_t stall_at = last_progress_ms_ + cfg_.stall_timeout_ms;
  return stall_at < t ? stall_at : t;
}

// ---------- private: phases ----------

bool Sender::step(uint64_t now_ms, bool& sent) {
  switch (phase_) {
    case Phase::NeedChunk:     return take_chunk(now_ms);
    case Phase::AwaitCapacity: return await_capacity(now_ms);
    case Phase::Transmit:      return transmit(now_ms, sent);
    case Phase::Backoff:
      if (now_ms < wake_ms_) return false;
      phase_ = Phase::AwaitCapacity;                 // same chunk, fresh wait
      wait_.begin(capacity_threshold(cfg_.buffer_threshold), cfg_.max_poll_attempts, now_ms);
      return true;
    case Phase::Pace:
      if (now_ms < wake_ms_) return false;
      phase_ = Phase::NeedChunk;
      return true;
  }
  return false;
}

// -----------------------------------------------------------------------------
// take_chunk(): slice the next payload out of the current source block.
// POLICY:
//   - Completion is decided here by byte count, before asking the source
//     again, so an exact-size source never needs a trailing End.
//   - End before the declared size, or a slice that would pass it, is a
//     Source failure: the receiver would never complete on its byte count.
// -----------------------------------------------------------------------------
bool Sender::take_chunk(uint64_t now_ms) {
  if (bytes_sent_ >= total_) {
    complete();
    return false;
  }

  if (block_off_ >= block_.size()) {
    std::string why;
    const ReadStatus st = source_->next(block_, why);
    block_off_ = 0;

    if (st == ReadStatus::Pending || (st == ReadStatus::Chunk && block_.empty())) {
      block_.clear();
      wake_ms_ = now_ms + SOURCE_RETRY_MS;
      return false;
    }
    if (st == ReadStatus::End) {
      fail(Error(ErrorKind::Source, "source ended at " + std::to_string(bytes_sent_) +
                                    " of " + std::to_string(total_) + " bytes"));
      return false;
    }
    if (st == ReadStatus::Error) {
      fail(Error(ErrorKind::Source, why.empty() ? "source read failed" : why));
      return false;
    }
  }

  const size_t left = block_.size() - block_off_;
  const size_t n = left < cfg_.chunk_size ? left : cfg_.chunk_size;
  if (bytes_sent_ + n > total_) {
    fail(Error(ErrorKind::Source, "source exceeds declared size " + std::to_string(total_)));
    return false;
  }

  chunk_.assign(block_.begin() + static_cast<std::ptrdiff_t>(block_off_),
                block_.begin() + static_cast<std::ptrdiff_t>(block_off_ + n));
  block_off_ += n;

  phase_ = Phase::AwaitCapacity;
  wait_.begin(capacity_threshold(cfg_.buffer_threshold), cfg_.max_poll_attempts, now_ms);
  return true;
}

bool Sender::await_capacity(uint64_t now_ms) {
  switch (wait_.poll(*channel_, now_ms)) {
    case WaitStatus::Ready:
      phase_ = Phase::Transmit;
      return true;
    case WaitStatus::Waiting:
      return false;
    case WaitStatus::ChannelClosed:
      fail(Error(ErrorKind::ChannelClosed, "channel closed while waiting for buffer space"));
      return false;
    case WaitStatus::Timeout:
      transient_failure(Error(ErrorKind::BufferTimeout,
                              "capacity wait gave up after " + std::to_string(wait_.attempts()) +
                              " polls"), now_ms);
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// transmit(): liveness re-check, frame, send.
// POLICY:
//   - The capacity wait may have spanned seconds; check the channel again.
//   - A failed send on a channel that has since closed is fatal; on an open
//     channel it is transient and retried with backoff.
// -----------------------------------------------------------------------------
bool Sender::transmit(uint64_t now_ms, bool& sent) {
  if (!channel_->is_open()) {
    fail(Error(ErrorKind::ChannelClosed, "channel closed before send"));
    return false;
  }

  const std::vector<uint8_t> pkt =
      encode_packet(DATA_CHUNK, id_, sequence_, chunk_.data(), chunk_.size(), key_);
  const transport::TxResult r = channel_->send(pkt.data(), pkt.size());

  if (r == transport::TxResult::Ok) {
    sent = true;
    on_sent(now_ms);
    return true;
  }
  if (!channel_->is_open()) {
    fail(Error(ErrorKind::ChannelClosed, "channel closed during send"));
    return false;
  }
  transient_failure(Error(ErrorKind::Transmit,
                          r == transport::TxResult::Busy ? "channel busy" : "send failed"), now_ms);
  return false;
}

void Sender::on_sent(uint64_t now_ms) {
  bytes_sent_ += chunk_.size();
  ++sequence_;
  retries_          = 0;
  last_progress_ms_ = now_ms;
  chunk_.clear();

  meter_.record(now_ms, bytes_sent_);
  if (cb_.on_progress) {
    const double pct = total_ ? (static_cast<double>(bytes_sent_) * 100.0 / static_cast<double>(total_)) : 100.0;
    cb_.on_progress(pct, meter_.bytes_per_second());
  }
  if (state_ != State::Streaming || !active_) return;   // cancelled from the callback

  if (bytes_sent_ >= total_) {
    complete();
    return;
  }

  const uint32_t delay = pacing_delay_ms(cfg_, total_, channel_->buffered_amount());
  if (delay == 0) {
    phase_ = Phase::NeedChunk;
  } else {
    phase_   = Phase::Pace;
    wake_ms_ = now_ms + delay;
  }
}

// -----------------------------------------------------------------------------
// transient_failure(): spend one retry on the current chunk.
// OUT:   Backoff phase, or Failed/RetriesExhausted carrying cause.kind.
// -----------------------------------------------------------------------------
void Sender::transient_failure(const Error& cause, uint64_t now_ms) {
  ++retries_;
  if (retries_ >= cfg_.max_retries) {
    fail(Error(ErrorKind::RetriesExhausted, cause.kind,
               "chunk " + std::to_string(sequence_) + " failed " + std::to_string(retries_) +
               " times, last: " + cause.message));
    return;
  }

  uint64_t delay = cfg_.backoff_base_ms;
  for (uint32_t i = 1; i < retries_ && delay < cfg_.backoff_cap_ms; ++i) delay *= 2;
  if (delay > cfg_.backoff_cap_ms) delay = cfg_.backoff_cap_ms;

  log_line(LogLevel::Warn, "sender",
           "event=retry id=" + id_text(id_) + " seq=" + std::to_string(sequence_) +
           " attempt=" + std::to_string(retries_) + " backoff_ms=" + std::to_string(delay) +
           " reason=" + to_string(cause.kind));

  phase_   = Phase::Backoff;
  wake_ms_ = now_ms + delay;
}

// ---------- private: terminal transitions ----------

void Sender::complete() {
  state_  = State::Completed;
  active_ = false;
  source_.reset();
  block_.clear();
  log_line(LogLevel::Info, "sender",
           "event=complete id=" + id_text(id_) + " bytes=" + std::to_string(bytes_sent_) +
           " packets=" + std::to_string(sequence_));
  if (cb_.on_complete) cb_.on_complete();
}

void Sender::fail(const Error& err) {
  state_  = State::Failed;
  active_ = false;
  error_  = err;
  source_.reset();
  block_.clear();
  chunk_.clear();
  log_line(LogLevel::Error, "sender", "event=failed id=" + id_text(id_) + " reason=\"" + err.describe() + "\"");
  if (cb_.on_error) cb_.on_error(err);
}

} // namespace chunkwire
