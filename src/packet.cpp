// ============================================================================
// packet.cpp: implementation for packet.hpp
// For the wire layout see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "chunkwire/packet.hpp"

namespace chunkwire {

// ============================================================================
// Low-level helpers
// ============================================================================

// ---------------------------------------------------------------------------
// Append a u32 as four little-endian bytes.
// ---------------------------------------------------------------------------
static inline void put_u32(std::vector<uint8_t>& b, uint32_t v) {
  b.push_back(static_cast<uint8_t>(v & 0xFF));          // low byte first
  b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

// ---------------------------------------------------------------------------
// Read a little-endian u32 at p[0..3]. Caller has bounds-checked.
// ---------------------------------------------------------------------------
static inline uint32_t get_u32(const uint8_t* p) {
  return  static_cast<uint32_t>(p[0])
       | (static_cast<uint32_t>(p[1]) << 8)
       | (static_cast<uint32_t>(p[2]) << 16)
       | (static_cast<uint32_t>(p[3]) << 24);
}

static inline bool fail(Error& err, const char* why) {
  err = Error(ErrorKind::MalformedPacket, why);
  return false;
}

// ============================================================================
// Public API
// ============================================================================

bool make_transfer_id(const std::string& text, TransferId& out, std::string& err) {
  if (text.empty())                  { err = "empty_transfer_id";    return false; }
  if (text.size() > TRANSFER_ID_MAX) { err = "transfer_id_too_long"; return false; }
  out.assign(text.data(), text.size());
  return true;
}

std::vector<uint8_t> encode_packet(uint8_t type,
                                   const TransferId& transfer_id,
                                   uint32_t sequence,
                                   const uint8_t* payload,
                                   size_t n,
                                   const ObfuscationKey& key) {
  std::vector<uint8_t> b;
  b.reserve(encoded_size(transfer_id.size(), n));      // one allocation per packet

  // Phase: header
  b.insert(b.end(), PACKET_MAGIC, PACKET_MAGIC + 4);
  b.push_back(type);
  b.push_back(static_cast<uint8_t>(transfer_id.size())); // TransferId caps this at 255
  b.insert(b.end(), transfer_id.begin(), transfer_id.end());
  put_u32(b, sequence);
  put_u32(b, static_cast<uint32_t>(n));

  // Phase: payload, obfuscated straight into the tail of the frame
  const size_t at = b.size();
  b.resize(at + n);
  if (n) obfuscate(payload, n, key, b.data() + at);
  return b;
}

std::vector<uint8_t> encode_packet(uint8_t type,
                                   const TransferId& transfer_id,
                                   uint32_t sequence,
                                   const std::vector<uint8_t>& payload,
                                   const ObfuscationKey& key) {
  return encode_packet(type, transfer_id, sequence, payload.data(), payload.size(), key);
}

// -----------------------------------------------------------------------------
// decode_packet(): parse one datagram without trusting any length field.
// PRE:   data may be anything, including other protocols' frames.
// POLICY:
//   - Every read is preceded by a bounds check against len.
//   - Length arithmetic is done in size_t; a u32 payload length cannot
//     overflow it on the 64-bit hosts we target, and the comparison is
//     written as "remaining < needed" so it cannot wrap either way.
// OUT:   true + filled packet, or false + MalformedPacket reason.
// -----------------------------------------------------------------------------
bool decode_packet(const uint8_t* data,
                   size_t len,
                   const ObfuscationKey& key,
                   Packet& out,
                   Error& err) {
  if (data == nullptr || len < PACKET_HEADER_MIN) return fail(err, "short_buffer");

  for (size_t i = 0; i < 4; ++i) {
    if (data[i] != PACKET_MAGIC[i]) return fail(err, "bad_magic");
  }

  size_t off = 4;
  const uint8_t type   = data[off++];
  const size_t  id_len = data[off++];

  // id + sequence + payload_len must all be inside the buffer
  if (len - off < id_len + 8) return fail(err, "id_past_end");

  out.type = type;
  out.transfer_id.assign(reinterpret_cast<const char*>(data + off), id_len);
  off += id_len;

  out.sequence = get_u32(data + off);
  off += 4;
  const size_t payload_len = get_u32(data + off);
  off += 4;

  if (len - off < payload_len) return fail(err, "payload_past_end");

  out.payload.resize(payload_len);
  if (payload_len) obfuscate(data + off, payload_len, key, out.payload.data());

  err.clear();
  return true;
}

bool decode_packet(const std::vector<uint8_t>& data,
                   const ObfuscationKey& key,
                   Packet& out,
                   Error& err) {
  return decode_packet(data.data(), data.size(), key, out, err);
}

} // namespace chunkwire
