/**
 * @page cw-packet chunkwire Packet Codec
 * @file packet.hpp
 * @brief Binary framing for one chunk (or control beat) on the data channel.
 *
 * @details
 * WIRE LAYOUT
 * -----------
 * All multi-byte integers are little-endian.
 *
 * ```
 *  offset  size     field
 *  0       4        magic        AA BB CC DD
 *  4       1        type         PacketType
 *  5       1        id_len       0..255
 *  6       id_len   transfer id  raw bytes, no terminator
 *  6+L     4        sequence     u32, 0-based chunk index
 *  10+L    4        payload_len  u32, bytes that follow
 *  14+L    n        payload      obfuscated under the session key
 * ```
 *
 * The fixed part is 14 bytes; the worst case header (255-byte id) is 269.
 * Senders pick `chunk_size` so that header + payload stays under the
 * channel's maximum message size (see TransferConfig::validate()).
 *
 * DECODING POLICY
 * ---------------
 * decode_packet() never reads outside the buffer. A short buffer, a wrong
 * magic, or a length field pointing past the end all produce
 * `ErrorKind::MalformedPacket`. Callers treat that as "not ours": other
 * binary traffic may share the channel, so a foreign datagram is expected,
 * not an attack on the transfer. Unknown `type` values decode fine; the
 * dispatcher decides what to do with them. Bytes after the payload are
 * ignored.
 */
#ifndef CHUNKWIRE_PACKET_HPP
#define CHUNKWIRE_PACKET_HPP

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include "etl/string.h"
#include "chunkwire/errors.hpp"
#include "chunkwire/obfuscator.hpp"

namespace chunkwire {

/// Longest transfer identifier the one-byte length field can carry.
static constexpr size_t TRANSFER_ID_MAX = 255;

/**
 * @brief Transfer identifier, bounded exactly like the wire field.
 *
 * Fixed capacity; assignments longer than 255 bytes truncate, so build
 * from user input with make_transfer_id(), which rejects instead.
 */
using TransferId = etl::string<TRANSFER_ID_MAX>;

/// Frame magic, first four bytes of every packet.
static constexpr uint8_t PACKET_MAGIC[4] = { 0xAA, 0xBB, 0xCC, 0xDD };

static constexpr size_t PACKET_HEADER_MIN = 14;                              ///< Header with empty id.
static constexpr size_t PACKET_HEADER_MAX = PACKET_HEADER_MIN + TRANSFER_ID_MAX; ///< Header with 255-byte id.

/**
 * @brief Packet type byte.
 *
 * Values 0x00 and 0x03..0xFF are reserved for future control beats and
 * decode without error.
 */
enum PacketType : uint8_t {
  DATA_CHUNK = 0x01,  /**< File bytes for one sequence number. */
  HEARTBEAT  = 0x02   /**< Connectivity probe; empty payload, ignored by receivers. */
};

/// One decoded packet; payload is already de-obfuscated.
struct Packet {
  uint8_t              type{DATA_CHUNK};
  TransferId           transfer_id;
  uint32_t             sequence{0};
  std::vector<uint8_t> payload;
};

/**
 * @brief Build a TransferId from arbitrary text.
 * @return false with @p err = "empty_transfer_id" / "transfer_id_too_long".
 */
bool make_transfer_id(const std::string& text, TransferId& out, std::string& err);

/// Copy a TransferId out as std::string (for logs, JSON, map lookups by text).
inline std::string id_text(const TransferId& id) { return std::string(id.c_str(), id.size()); }

/// Total encoded size for an id of @p id_len bytes and @p payload_len bytes of payload.
inline size_t encoded_size(size_t id_len, size_t payload_len) {
  return PACKET_HEADER_MIN + id_len + payload_len;
}

/**
 * @brief Frame one packet.
 *
 * Obfuscates @p payload under @p key and lays out the header described in
 * the file comment. Pure; no I/O.
 *
 * PRE: @p n fits in u32. Callers keep encoded_size() under the channel's
 *      maximum message size.
 *
 * @return The complete datagram, ready for IChannel::send().
 */
std::vector<uint8_t> encode_packet(uint8_t type,
                                   const TransferId& transfer_id,
                                   uint32_t sequence,
                                   const uint8_t* payload,
                                   size_t n,
                                   const ObfuscationKey& key);

/// Vector overload of encode_packet().
std::vector<uint8_t> encode_packet(uint8_t type,
                                   const TransferId& transfer_id,
                                   uint32_t sequence,
                                   const std::vector<uint8_t>& payload,
                                   const ObfuscationKey& key);

/**
 * @brief Parse and de-obfuscate one datagram.
 *
 * @retval true  @p out holds the packet.
 * @retval false @p err.kind == MalformedPacket; @p out is unspecified.
 */
bool decode_packet(const uint8_t* data,
                   size_t len,
                   const ObfuscationKey& key,
                   Packet& out,
                   Error& err);

/// Vector overload of decode_packet().
bool decode_packet(const std::vector<uint8_t>& data,
                   const ObfuscationKey& key,
                   Packet& out,
                   Error& err);

} // namespace chunkwire

#endif // CHUNKWIRE_PACKET_HPP
