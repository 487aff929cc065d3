/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the codec, flow control and both state machines.
 *
 * @details
 * Nothing in chunkwire throws across a module boundary. Fallible calls
 * return `bool` and fill an `Error` out-parameter; terminal callbacks hand
 * the same `Error` to the host. `kind` says what went wrong, `cause` says
 * what was underneath it when the error wraps another one (only
 * `RetriesExhausted` does that today).
 *
 * Severity by kind:
 * - `ChannelNotReady`  refused start; nothing was registered.
 * - `ChannelClosed`    fatal to a sender, skips the retry budget.
 * - `BufferTimeout`    retryable; counts against the per-chunk budget.
 * - `MalformedPacket`  never fatal; the datagram is treated as foreign.
 * - `StalledTransfer`  fatal to a sender.
 * - `Sink`             fatal to a receiver, never retried.
 * - `RetriesExhausted` fatal to a sender; `cause` holds the last failure.
 * - `Source`           fatal to a sender; sources cannot be rewound.
 * - `Config`           rejected configuration or a duplicate transfer id.
 * - `Transmit`         send refused on a channel that is still open;
 *                      retryable like BufferTimeout.
 */
#ifndef CHUNKWIRE_ERRORS_HPP
#define CHUNKWIRE_ERRORS_HPP

#include <stdint.h>
#include <string>
#include <utility>

namespace chunkwire {

enum class ErrorKind : uint8_t {
  None = 0,
  ChannelNotReady,
  ChannelClosed,
  BufferTimeout,
  MalformedPacket,
  StalledTransfer,
  Sink,
  RetriesExhausted,
  Source,
  Config,
  Transmit
};

/// Stable snake_case name, used in log lines and CLI output.
const char* to_string(ErrorKind kind);

struct Error {
  ErrorKind   kind{ErrorKind::None};   ///< What failed.
  ErrorKind   cause{ErrorKind::None};  ///< Wrapped kind (RetriesExhausted only).
  std::string message;                 ///< Human readable detail.

  Error() = default;
  Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
  Error(ErrorKind k, ErrorKind c, std::string msg)
  : kind(k), cause(c), message(std::move(msg)) {}

  bool ok() const { return kind == ErrorKind::None; }

  /// Whether the sender may retry the current chunk after this error.
  bool retryable() const { return kind == ErrorKind::BufferTimeout || kind == ErrorKind::Transmit; }

  /**
   * @brief One-line description, e.g.
   *        "retries_exhausted (buffer_timeout): capacity wait gave up after 200 polls".
   */
  std::string describe() const;

  void clear() { kind = ErrorKind::None; cause = ErrorKind::None; message.clear(); }
};

} // namespace chunkwire

#endif // CHUNKWIRE_ERRORS_HPP
