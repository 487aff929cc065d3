// -----------------------------------------------------------------------------
// receiver.cpp: Implementation of the chunkwire Receiver
//
// API, states and the drain diagram:
//   see include/chunkwire/receiver.hpp
//
// NOTE: Writes are synchronous inside on_chunk(). A writer that needs to
// suspend belongs behind a provider that returns Pending until it is ready.
// -----------------------------------------------------------------------------
#include "chunkwire/receiver.hpp"

#include "chunkwire/log.hpp"

namespace chunkwire {

static constexpr uint64_t SINK_POLL_MS = 50;     // re-poll a Pending sink provider

const char* to_string(Receiver::State s) {
  switch (s) {
    case Receiver::State::AwaitingSink: return "awaiting_sink";
    case Receiver::State::Active:       return "active";
    case Receiver::State::Completed:    return "completed";
    case Receiver::State::Cancelled:    return "cancelled";
    case Receiver::State::Failed:       return "failed";
  }
  return "unknown";
}

Receiver::Receiver(const TransferId& transfer_id, std::string file_name, uint64_t declared_size)
: id_(transfer_id), file_name_(std::move(file_name)), declared_(declared_size) {}

// ---------- public ----------

bool Receiver::start(SinkChain sinks, TransferCallbacks callbacks, uint64_t now_ms, Error& err) {
  if (started_) { err = Error(ErrorKind::Config, "receiver already started"); return false; }
  started_ = true;
  sinks_   = std::move(sinks);
  cb_      = std::move(callbacks);
  now_ms_  = now_ms;
  meter_.record(now_ms, 0);

  log_line(LogLevel::Info, "receiver",
           "event=start id=" + id_text(id_) + " name=\"" + file_name_ + "\" size=" + std::to_string(declared_));
  poll_sink(now_ms);
  err.clear();
  return true;
}

void Receiver::tick(uint64_t now_ms) {
  now_ms_ = now_ms;
  if (state_ == State::AwaitingSink && started_) poll_sink(now_ms);
}

// -----------------------------------------------------------------------------
// on_chunk()
// POLICY:
//   - Terminal: drop quietly; late packets after cancel/complete are normal.
//   - Sink not ready: stage in arrival order, no error.
// -----------------------------------------------------------------------------
void Receiver::on_chunk(uint32_t sequence, std::vector<uint8_t> payload, uint64_t now_ms) {
  now_ms_ = now_ms;
  if (is_terminal()) return;
  if (!ready_) {
    early_.emplace_back(sequence, std::move(payload));
    return;
  }
  accept(sequence, std::move(payload), now_ms);
}

void Receiver::cancel() {
  if (is_terminal()) return;
  state_ = State::Cancelled;
  abort_writer("cancelled");
  pending_.clear();
  early_.clear();
  log_line(LogLevel::Info, "receiver", "event=cancelled id=" + id_text(id_));
}

uint64_t Receiver::next_wakeup_ms() const {
  if (state_ == State::AwaitingSink && started_) return now_ms_ + SINK_POLL_MS;
  return UINT64_MAX;                               // otherwise driven by inbound chunks
}

// ---------- private ----------

// -----------------------------------------------------------------------------
// poll_sink(): ask the chain once; on Ready replay staged chunks.
// POLICY:
//   - Replay happens before this call returns, so no live chunk can slip in
//     between readiness and the staged ones.
//   - Replay stops as soon as the transfer goes terminal.
// -----------------------------------------------------------------------------
void Receiver::poll_sink(uint64_t now_ms) {
  std::string why;
  const OpenStatus st = sinks_.poll(file_name_, declared_, writer_, why);
  if (st == OpenStatus::Pending) return;
  if (st != OpenStatus::Ready || !writer_) {
    fail(Error(ErrorKind::Sink, "no sink available: " + why));
    return;
  }

  ready_     = true;
  state_     = State::Active;
  sink_kind_ = writer_->kind();
  log_line(LogLevel::Info, "receiver",
           "event=sink_ready id=" + id_text(id_) + " sink=" + sink_kind_ +
           " staged=" + std::to_string(early_.size()));

  std::vector<std::pair<uint32_t, std::vector<uint8_t>>> staged;
  staged.swap(early_);
  for (auto& e : staged) {
    if (state_ != State::Active) break;
    accept(e.first, std::move(e.second), now_ms);
  }

  if (state_ == State::Active && received_ == declared_) finish();   // zero-byte file
}

void Receiver::accept(uint32_t sequence, std::vector<uint8_t> payload, uint64_t now_ms) {
  if (sequence < cursor_ || pending_.count(sequence) != 0) {
    log_line(LogLevel::Debug, "receiver",
             "event=duplicate id=" + id_text(id_) + " seq=" + std::to_string(sequence));
    return;
  }
  if (payload.size() > declared_ - received_) {
    fail(Error(ErrorKind::Sink, "chunk " + std::to_string(sequence) + " overruns declared size " +
                                std::to_string(declared_)));
    return;
  }

  received_ += payload.size();
  pending_.emplace(sequence, std::move(payload));

  // Drain every now-contiguous chunk at the cursor.
  for (auto it = pending_.find(cursor_); it != pending_.end(); it = pending_.find(cursor_)) {
    std::string why;
    if (!write_chunk(it->second, why)) {
      fail(Error(ErrorKind::Sink, "write failed at chunk " + std::to_string(cursor_) + ": " + why));
      return;
    }
    pending_.erase(it);
    ++cursor_;
  }

  meter_.record(now_ms, received_);
  if (cb_.on_progress) {
    const double pct = declared_ ? (static_cast<double>(received_) * 100.0 / static_cast<double>(declared_)) : 100.0;
    cb_.on_progress(pct, meter_.bytes_per_second());
  }

  if (state_ == State::Active && received_ == declared_) finish();
}

bool Receiver::write_chunk(const std::vector<uint8_t>& bytes, std::string& why) {
  if (!writer_->write(bytes.data(), bytes.size(), why)) return false;
  written_ += bytes.size();
  return true;
}

// -----------------------------------------------------------------------------
// finish(): byte count reached: flush stragglers, close, complete.
// POLICY:
//   - Chunks still pending here sit behind a sequence gap whose bytes were
//     never counted. They are written in sequence order and the gap is
//     logged.
//   - close() failure is a Sink error like any other.
// -----------------------------------------------------------------------------
void Receiver::finish() {
  if (!pending_.empty()) {
    log_line(LogLevel::Warn, "receiver",
             "event=gap_flush id=" + id_text(id_) + " cursor=" + std::to_string(cursor_) +
             " pending=" + std::to_string(pending_.size()));
    for (const auto& kv : pending_) {
      std::string why;
      if (!write_chunk(kv.second, why)) {
        fail(Error(ErrorKind::Sink, "write failed at chunk " + std::to_string(kv.first) + ": " + why));
        return;
      }
      cursor_ = kv.first + 1;
    }
    pending_.clear();
  }

  std::string why;
  if (!writer_->close(why)) {
    fail(Error(ErrorKind::Sink, "close failed: " + why));
    return;
  }
  writer_.reset();
  state_ = State::Completed;
  log_line(LogLevel::Info, "receiver",
           "event=complete id=" + id_text(id_) + " bytes=" + std::to_string(written_) + " sink=" + sink_kind_);
  if (cb_.on_complete) cb_.on_complete();
}

void Receiver::fail(const Error& err) {
  state_ = State::Failed;
  error_ = err;
  abort_writer("failed");
  pending_.clear();
  early_.clear();
  log_line(LogLevel::Error, "receiver", "event=failed id=" + id_text(id_) + " reason=\"" + err.describe() + "\"");
  if (cb_.on_error) cb_.on_error(err);
}

void Receiver::abort_writer(const char* why) {
  if (!writer_) return;
  std::string reason;
  if (!writer_->abort(reason)) {
    log_line(LogLevel::Warn, "receiver",
             "event=abort_failed id=" + id_text(id_) + " after=" + why + " reason=\"" + reason + "\"");
  }
  writer_.reset();
}

} // namespace chunkwire
