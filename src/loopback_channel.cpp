// -----------------------------------------------------------------------------
// loopback_channel.cpp: in-process channel pair
// API: include/chunkwire/transport/loopback_channel.hpp
// -----------------------------------------------------------------------------
#include "chunkwire/transport/loopback_channel.hpp"

#include <utility>

namespace chunkwire::transport {

// ---------- endpoint ----------

TxResult LoopbackEndpoint::send(const uint8_t* data, std::size_t len) {
  if (link_.state() != ReadyState::Open) return TxResult::Error;   // nothing leaves a dead link
  if (len > link_.options().max_message_size) return TxResult::Error;

  const std::size_t cap = link_.options().buffer_capacity;
  if (cap != 0 && buffered_ + len > cap) return TxResult::Busy;

  outbound_.emplace_back(data, data + len);
  buffered_ += len;
  ++messages_sent_;
  return TxResult::Ok;
}

ReadyState LoopbackEndpoint::ready_state() const { return link_.state(); }

std::size_t LoopbackEndpoint::max_message_size() const { return link_.options().max_message_size; }

// ---------- link ----------

LoopbackLink::LoopbackLink() : LoopbackLink(Options()) {}

LoopbackLink::LoopbackLink(const Options& opts)
: opts_(opts), a_(*this, "loopback-a"), b_(*this, "loopback-b") {}

std::size_t LoopbackLink::pump(std::size_t max_bytes) {
  return drain(a_, b_, max_bytes) + drain(b_, a_, max_bytes);
}

// -----------------------------------------------------------------------------
// drain()
// POLICY:
//   - Pop before delivering: the handler may send on either endpoint.
//   - Stop if the link closes mid-drain (a handler can close it).
// -----------------------------------------------------------------------------
std::size_t LoopbackLink::drain(LoopbackEndpoint& from, LoopbackEndpoint& to, std::size_t max_bytes) {
  std::size_t moved = 0;
  while (moved < max_bytes && !from.outbound_.empty() && state_ == ReadyState::Open) {
    std::vector<uint8_t> msg = std::move(from.outbound_.front());
    from.outbound_.pop_front();
    from.buffered_ -= msg.size();
    moved += msg.size();
    if (to.handler_) to.handler_(msg.data(), msg.size());
  }
  return moved;
}

void LoopbackLink::close() {
  state_ = ReadyState::Closed;
  a_.outbound_.clear();
  a_.buffered_ = 0;
  b_.outbound_.clear();
  b_.buffered_ = 0;
}

} // namespace chunkwire::transport
