// -----------------------------------------------------------------------------
// control.cpp: file-metadata / file-cancel JSON codec
// API: include/chunkwire/control.hpp
// -----------------------------------------------------------------------------
#include "chunkwire/control.hpp"

#include <cstdint>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace chunkwire {

uint32_t chunk_count(uint64_t file_size, size_t chunk_size) {
  if (chunk_size == 0 || file_size == 0) return 0;
  return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

std::string encode_offer(const Offer& offer) {
  json j;
  j["type"]        = "file-metadata";
  j["fileId"]      = id_text(offer.transfer_id);
  j["fileName"]    = offer.file_name;
  j["fileSize"]    = offer.file_size;
  j["totalChunks"] = offer.total_chunks;
  j["chunkSize"]   = offer.chunk_size;
  return j.dump();
}

std::string encode_cancel(const TransferId& transfer_id) {
  json j;
  j["type"]   = "file-cancel";
  j["fileId"] = id_text(transfer_id);
  return j.dump();
}

// Optional u32 field: absent keeps @p field, present must be an unsigned
// integer that fits.
static bool take_u32(const json& j, const char* key, uint32_t& field) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_unsigned()) return false;
  const uint64_t v = it->get<uint64_t>();
  if (v > UINT32_MAX) return false;
  field = static_cast<uint32_t>(v);
  return true;
}

// -----------------------------------------------------------------------------
// decode_control()
// PRE:   bytes came off the channel and failed packet decode.
// POLICY:
//   - Cheap reject first: anything not starting with '{' is not JSON text we send.
//   - allow_exceptions=false keeps parse failures off the exception path.
//   - Field type errors from get<>() are caught and reported as a reason.
// -----------------------------------------------------------------------------
bool decode_control(const uint8_t* data, size_t len, ControlMessage& out, std::string& reason) {
  if (data == nullptr || len == 0 || data[0] != '{') { reason = "not_json"; return false; }

  const json j = json::parse(data, data + len, nullptr, false);
  if (j.is_discarded() || !j.is_object()) { reason = "not_json"; return false; }

  auto type = j.find("type");
  auto id   = j.find("fileId");
  if (type == j.end() || !type->is_string()) { reason = "missing_type"; return false; }
  if (id == j.end() || !id->is_string())     { reason = "missing_file_id"; return false; }

  ControlMessage msg;
  std::string id_err;
  if (!make_transfer_id(id->get<std::string>(), msg.offer.transfer_id, id_err)) {
    reason = id_err;
    return false;
  }

  const std::string t = type->get<std::string>();
  if (t == "file-cancel") {
    msg.type = ControlType::Cancel;
    out = msg;
    return true;
  }
  if (t != "file-metadata") { reason = "unknown_type"; return false; }

  msg.type = ControlType::Offer;
  try {
    const json& size = j.at("fileSize");
    if (!size.is_number_unsigned()) { reason = "bad_file_size"; return false; }
    msg.offer.file_name = j.value("fileName", std::string());
    msg.offer.file_size = size.get<uint64_t>();
    if (!take_u32(j, "chunkSize", msg.offer.chunk_size)) { reason = "bad_chunk_size"; return false; }
    msg.offer.total_chunks = chunk_count(msg.offer.file_size, msg.offer.chunk_size);
    if (!take_u32(j, "totalChunks", msg.offer.total_chunks)) { reason = "bad_total_chunks"; return false; }
  } catch (const json::exception& e) {
    reason = std::string("bad_offer: ") + e.what();
    return false;
  }
  out = msg;
  return true;
}

} // namespace chunkwire
