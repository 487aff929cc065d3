#pragma once
/**
 * @file channel.hpp
 * @brief Message-oriented duplex channel every chunkwire Core runs on.
 *
 * Header-only. Wrappers for real links (data channels, sockets, radios)
 * implement IChannel; Core never sees anything more specific.
 */

#include <cstddef>
#include <cstdint>
#include <functional>

namespace chunkwire::transport {

enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class ReadyState : uint8_t { Connecting=0, Open=1, Closing=2, Closed=3 };

/// Inbound delivery: one call per received message.
using MessageHandler = std::function<void(const uint8_t* data, std::size_t len)>;

/**
 * @brief Channel trait the transfer engine relies on.
 *
 * Contract:
 *  - send(buf,len) queues one whole message; never blocks. Busy means the
 *    message was refused for now, Error that it can never be sent as is.
 *  - buffered_amount() counts bytes queued but not yet on the wire.
 *  - ready_state() reflects the link; only Open accepts sends.
 *  - max_message_size() is the largest len send() accepts.
 *  - The handler is invoked in send order, once per message, from whatever
 *    loop pumps the link. Set to nullptr to detach.
 */
class IChannel {
public:
  virtual ~IChannel() = default;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual std::size_t buffered_amount() const = 0;
  virtual ReadyState  ready_state() const = 0;
  virtual std::size_t max_message_size() const = 0;
  virtual const char* name() const = 0;
  virtual void        set_message_handler(MessageHandler handler) = 0;

  bool is_open() const { return ready_state() == ReadyState::Open; }
};

inline const char* to_string(ReadyState s) {
  switch (s) {
    case ReadyState::Connecting: return "connecting";
    case ReadyState::Open:       return "open";
    case ReadyState::Closing:    return "closing";
    case ReadyState::Closed:     return "closed";
  }
  return "unknown";
}

} // namespace chunkwire::transport
