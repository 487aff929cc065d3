// -----------------------------------------------------------------------------
// core.cpp: Implementation of chunkwire Core
//
// This file contains the *implementation details* for the Core class
// declared in `core.hpp`.
//
// API & operational model:
//   see include/chunkwire/core.hpp
//
// Runnable end-to-end flows:
//   see tests/test_core_flows.cpp and cli/main.cpp
// -----------------------------------------------------------------------------
#include "chunkwire/core.hpp"

#include <utility>

#include "chunkwire/log.hpp"

namespace chunkwire {

// ---------- public ----------

Core::Core(transport::IChannel& channel, const TransferConfig& cfg, const ObfuscationKey& key)
: channel_(channel), cfg_(cfg), key_(key) {
  channel_.set_message_handler([this](const uint8_t* data, size_t len) {
    on_message(data, len);                     // return value only matters to direct callers
  });
}

Core::~Core() {
  channel_.set_message_handler(nullptr);       // no calls into a dead Core
  registry_.clear();
}

// -----------------------------------------------------------------------------
// send(): probe, announce, register.
// PRE:   source declares its total size.
// POLICY:
//   - Duplicate ids are refused before anything touches the channel.
//   - The offer goes out before the first chunk can (chunks wait for tick()).
//   - Terminal callbacks are wrapped: registry entry first, host second.
// -----------------------------------------------------------------------------
bool Core::send(std::unique_ptr<ISource> source,
                const TransferId& transfer_id,
                const std::string& file_name,
                TransferCallbacks callbacks,
                uint64_t now_ms,
                Error& err) {
  if (registry_.find_sender(transfer_id)) {
    err = Error(ErrorKind::Config, "transfer id already sending: " + id_text(transfer_id));
    return false;
  }

  const uint64_t size = source ? source->total_size() : 0;
  auto sender = std::make_shared<Sender>(cfg_, key_);
  const Sender* self = sender.get();

  TransferCallbacks wrapped;
  wrapped.on_progress = std::move(callbacks.on_progress);
  wrapped.on_complete = [this, transfer_id, self, user = std::move(callbacks.on_complete)]() {
    drop_sender(transfer_id, self);
    if (user) user();
  };
  wrapped.on_error = [this, transfer_id, self, user = std::move(callbacks.on_error)](const Error& e) {
    drop_sender(transfer_id, self);
    if (user) user(e);
  };

  if (!sender->start(std::move(source), transfer_id, channel_, std::move(wrapped), now_ms, err)) {
    return false;
  }

  Offer offer;
  offer.transfer_id  = transfer_id;
  offer.file_name    = file_name;
  offer.file_size    = size;
  offer.chunk_size   = static_cast<uint32_t>(cfg_.chunk_size);
  offer.total_chunks = chunk_count(size, cfg_.chunk_size);
  if (!send_offer(offer)) {
    sender->cancel();
    err = Error(ErrorKind::ChannelNotReady, "offer could not be sent");
    return false;
  }

  registry_.add_sender(transfer_id, std::move(sender));
  now_ms_ = now_ms;
  return true;
}

bool Core::accept(const Offer& offer,
                  SinkChain sinks,
                  TransferCallbacks callbacks,
                  uint64_t now_ms,
                  Error& err,
                  std::shared_ptr<Receiver>* session) {
  const TransferId& id = offer.transfer_id;
  if (registry_.find_receiver(id)) {
    err = Error(ErrorKind::Config, "transfer id already receiving: " + id_text(id));
    return false;
  }

  auto receiver = std::make_shared<Receiver>(id, offer.file_name, offer.file_size);
  const Receiver* self = receiver.get();
  registry_.add_receiver(id, receiver);        // before the sink: nothing arrives "unknown"
  if (session) *session = receiver;

  TransferCallbacks wrapped;
  wrapped.on_progress = std::move(callbacks.on_progress);
  wrapped.on_complete = [this, id, self, user = std::move(callbacks.on_complete)]() {
    drop_receiver(id, self);
    if (user) user();
  };
  wrapped.on_error = [this, id, self, user = std::move(callbacks.on_error)](const Error& e) {
    drop_receiver(id, self);
    if (user) user(e);
  };

  if (!receiver->start(std::move(sinks), std::move(wrapped), now_ms, err)) {
    drop_receiver(id, self);
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// on_message(): classify one inbound message.
// POLICY:
//   - Binary packet first: it is the hot path.
//   - Then JSON control. Anything else is foreign traffic, logged at debug.
//   - HEARTBEAT and reserved packet types are accepted and ignored.
// -----------------------------------------------------------------------------
bool Core::on_message(const uint8_t* data, size_t len) {
  Packet pkt;
  Error perr;
  if (decode_packet(data, len, key_, pkt, perr)) {
    ++stats_.packets_in;
    if (pkt.type == DATA_CHUNK) route_chunk(pkt);
    return true;
  }

  ControlMessage msg;
  std::string why;
  if (decode_control(data, len, msg, why)) {
    ++stats_.control_in;
    const std::string id = id_text(msg.offer.transfer_id);

    if (msg.type == ControlType::Cancel) {
      log_line(LogLevel::Info, "core", "event=peer_cancel id=" + id);
      cancel(msg.offer.transfer_id);
      return true;
    }

    log_line(LogLevel::Info, "core",
             "event=offer id=" + id + " name=\"" + msg.offer.file_name + "\" size=" +
             std::to_string(msg.offer.file_size) + " chunks=" + std::to_string(msg.offer.total_chunks));
    if (offer_handler_) {
      offer_handler_(msg.offer);
    } else {
      log_line(LogLevel::Warn, "core", "event=offer_ignored id=" + id + " reason=no_handler");
    }
    return true;
  }

  ++stats_.foreign_in;
  if (log_enabled(LogLevel::Debug)) {
    log_line(LogLevel::Debug, "core",
             "event=foreign len=" + std::to_string(len) + " packet=" + perr.message + " control=" + why);
  }
  return false;
}

// tick(): advance sessions on snapshots; callbacks may edit the registry.
void Core::tick(uint64_t now_ms) {
  now_ms_ = now_ms;
  ++stats_.ticks;

  for (const auto& s : registry_.senders())   s->tick(now_ms);
  for (const auto& r : registry_.receivers()) r->tick(now_ms);

  registry_.sweep();
}

bool Core::cancel(const TransferId& transfer_id) {
  const bool s = registry_.cancel_sender(transfer_id);
  const bool r = registry_.cancel_receiver(transfer_id);
  return s || r;
}

bool Core::send_offer(const Offer& offer) {
  return send_text(encode_offer(offer));
}

bool Core::send_cancel(const TransferId& transfer_id) {
  return send_text(encode_cancel(transfer_id));
}

uint64_t Core::next_wakeup_ms() const {
  uint64_t t = UINT64_MAX;
  for (const auto& s : registry_.senders()) {
    const uint64_t w = s->next_wakeup_ms();
    if (w < t) t = w;
  }
  for (const auto& r : registry_.receivers()) {
    const uint64_t w = r->next_wakeup_ms();
    if (w < t) t = w;
  }
  return t;
}

// ---------- private ----------

bool Core::send_text(const std::string& text) {
  if (!channel_.is_open()) return false;
  return channel_.send(reinterpret_cast<const uint8_t*>(text.data()), text.size())
         == transport::TxResult::Ok;
}

void Core::route_chunk(Packet& pkt) {
  auto receiver = registry_.find_receiver(pkt.transfer_id);   // copy keeps it alive through callbacks
  if (!receiver) {
    ++stats_.unknown_transfer;
    log_line(LogLevel::Info, "core",
             "event=unknown_transfer id=" + id_text(pkt.transfer_id) + " seq=" + std::to_string(pkt.sequence));
    return;
  }
  receiver->on_chunk(pkt.sequence, std::move(pkt.payload), now_ms_);
}

void Core::drop_sender(const TransferId& id, const Sender* which) {
  auto cur = registry_.find_sender(id);
  if (cur && cur.get() == which) registry_.remove_sender(id);
}

void Core::drop_receiver(const TransferId& id, const Receiver* which) {
  auto cur = registry_.find_receiver(id);
  if (cur && cur.get() == which) registry_.remove_receiver(id);
}

} // namespace chunkwire
