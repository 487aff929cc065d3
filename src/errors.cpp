// -----------------------------------------------------------------------------
// errors.cpp: names and one-line rendering for chunkwire::Error
// API lives in include/chunkwire/errors.hpp.
// -----------------------------------------------------------------------------
#include "chunkwire/errors.hpp"

namespace chunkwire {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:             return "none";
    case ErrorKind::ChannelNotReady:  return "channel_not_ready";
    case ErrorKind::ChannelClosed:    return "channel_closed";
    case ErrorKind::BufferTimeout:    return "buffer_timeout";
    case ErrorKind::MalformedPacket:  return "malformed_packet";
    case ErrorKind::StalledTransfer:  return "stalled_transfer";
    case ErrorKind::Sink:             return "sink_error";
    case ErrorKind::RetriesExhausted: return "retries_exhausted";
    case ErrorKind::Source:           return "source_error";
    case ErrorKind::Config:           return "config_error";
    case ErrorKind::Transmit:         return "transmit_error";
  }
  return "unknown";
}

std::string Error::describe() const {
  std::string out = to_string(kind);
  if (cause != ErrorKind::None) {           // wrapped failure: show what was underneath
    out += " (";
    out += to_string(cause);
    out += ")";
  }
  if (!message.empty()) {
    out += ": ";
    out += message;
  }
  return out;
}

} // namespace chunkwire
