#pragma once
/**
 * @file loopback_channel.hpp
 * @brief In-process channel pair with finite buffering and explicit delivery.
 *
 * Two LoopbackEndpoint objects joined by a LoopbackLink. Sends queue on the
 * sending endpoint and count toward its buffered_amount(); nothing reaches
 * the peer until pump() is called. That makes back-pressure visible and
 * lets a test or the CLI decide exactly how fast the "wire" drains.
 *
 * Not thread-safe. Pump from the same loop that ticks the Cores.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <utility>
#include <vector>

#include "chunkwire/transport/channel.hpp"

namespace chunkwire::transport {

class LoopbackLink;

class LoopbackEndpoint : public IChannel {
public:
  TxResult    send(const uint8_t* data, std::size_t len) override;
  std::size_t buffered_amount() const override { return buffered_; }
  ReadyState  ready_state() const override;
  std::size_t max_message_size() const override;
  const char* name() const override { return name_; }
  void        set_message_handler(MessageHandler handler) override { handler_ = std::move(handler); }

  std::size_t messages_sent() const { return messages_sent_; }   ///< Accepted by send().
  std::size_t queued() const { return outbound_.size(); }

private:
  friend class LoopbackLink;
  LoopbackEndpoint(LoopbackLink& link, const char* name) : link_(link), name_(name) {}

  LoopbackLink&                    link_;
  const char*                      name_;
  MessageHandler                   handler_;
  std::deque<std::vector<uint8_t>> outbound_;
  std::size_t                      buffered_{0};
  std::size_t                      messages_sent_{0};
};

class LoopbackLink {
public:
  struct Options {
    std::size_t max_message_size{256 * 1024};
    std::size_t buffer_capacity{0};           ///< Per endpoint; 0 = unbounded. Full -> Busy.
  };

  LoopbackLink();
  explicit LoopbackLink(const Options& opts);
  LoopbackLink(const LoopbackLink&) = delete;
  LoopbackLink& operator=(const LoopbackLink&) = delete;

  LoopbackEndpoint& a() { return a_; }
  LoopbackEndpoint& b() { return b_; }

  /**
   * @brief Deliver queued messages to the opposite endpoint, in order.
   *
   * Each direction delivers whole messages until at least @p max_bytes have
   * gone through (the last one may overshoot). Messages to an endpoint with
   * no handler are dropped.
   *
   * @return Bytes delivered, both directions together.
   */
  std::size_t pump(std::size_t max_bytes = std::numeric_limits<std::size_t>::max());

  /// Close both ends; queued messages are discarded.
  void close();

  void       set_state(ReadyState s) { state_ = s; }
  ReadyState state() const { return state_; }
  const Options& options() const { return opts_; }

private:
  std::size_t drain(LoopbackEndpoint& from, LoopbackEndpoint& to, std::size_t max_bytes);

  Options          opts_;
  ReadyState       state_{ReadyState::Open};
  LoopbackEndpoint a_;
  LoopbackEndpoint b_;
};

} // namespace chunkwire::transport
