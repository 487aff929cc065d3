/**
 * @file control.hpp
 * @brief JSON control messages that share the data channel with packets.
 *
 * @details
 * Before streaming, a sender announces the file with an offer; either side
 * may later withdraw with a cancel. Both travel as UTF-8 JSON text:
 *
 * @code{.json}
 * {"type":"file-metadata","fileId":"f-1","fileName":"a.bin",
 *  "fileSize":100000,"totalChunks":7,"chunkSize":16384}
 * {"type":"file-cancel","fileId":"f-1"}
 * @endcode
 *
 * A JSON document starts with `{`, never with the packet magic byte 0xAA,
 * so the two never decode as each other.
 */
#ifndef CHUNKWIRE_CONTROL_HPP
#define CHUNKWIRE_CONTROL_HPP

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include "chunkwire/packet.hpp"

namespace chunkwire {

enum class ControlType : uint8_t { Offer = 0, Cancel = 1 };

/// File announcement.
struct Offer {
  TransferId  transfer_id;
  std::string file_name;
  uint64_t    file_size{0};
  uint32_t    total_chunks{0};
  uint32_t    chunk_size{0};
};

struct ControlMessage {
  ControlType type{ControlType::Offer};
  Offer       offer;        ///< Only transfer_id is meaningful for Cancel.
};

/// ceil(file_size / chunk_size); 0 for an empty file.
uint32_t chunk_count(uint64_t file_size, size_t chunk_size);

std::string encode_offer(const Offer& offer);
std::string encode_cancel(const TransferId& transfer_id);

/**
 * @brief Try to read @p len bytes as a control message.
 * @return false with @p reason set when the bytes are not one of ours.
 */
bool decode_control(const uint8_t* data, size_t len, ControlMessage& out, std::string& reason);

} // namespace chunkwire

#endif // CHUNKWIRE_CONTROL_HPP
