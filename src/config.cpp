// -----------------------------------------------------------------------------
// config.cpp: profiles, validation and JSON loading for TransferConfig
// API: include/chunkwire/config.hpp
// -----------------------------------------------------------------------------
#include "chunkwire/config.hpp"

#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "chunkwire/flow_control.hpp"
#include "chunkwire/packet.hpp"

using json = nlohmann::json;

namespace chunkwire {

// ---------- validation ----------

bool TransferConfig::validate(Error& err) const {
  auto bad = [&err](const char* why) {
    err = Error(ErrorKind::Config, why);
    return false;
  };

  if (chunk_size == 0)        return bad("chunk_size must be > 0");
  if (buffer_threshold == 0)  return bad("buffer_threshold must be > 0");
  if (max_poll_attempts == 0) return bad("max_poll_attempts must be > 0");
  if (stall_timeout_ms == 0)  return bad("stall_timeout_ms must be > 0");
  if (max_message_size == 0)  return bad("max_message_size must be > 0");
  if (backoff_base_ms > backoff_cap_ms) return bad("backoff_base_ms exceeds backoff_cap_ms");

  // POLICY: assume the worst-case id so any TransferId fits the same chunk size
  if (chunk_size > max_message_size || max_message_size - chunk_size < PACKET_HEADER_MAX) {
    return bad("chunk_size + packet header exceeds max_message_size");
  }

  // POLICY: a jammed channel must exhaust the retry budget before the stall
  // window closes, so BufferTimeout stays a retryable failure.
  if (retry_budget_ms() >= stall_timeout_ms) {
    return bad("retry budget outlasts stall_timeout_ms");
  }

  err.clear();
  return true;
}

uint64_t TransferConfig::retry_budget_ms() const {
  const uint64_t attempts = max_retries ? max_retries : 1;
  const uint64_t one_wait = static_cast<uint64_t>(max_poll_attempts) * POLL_INTERVAL_MAX_MS;
  const uint64_t pacing   = static_cast<uint64_t>(send_delay_ms) * PACING_FACTOR_MAX;
  return pacing + attempts * (one_wait + backoff_cap_ms);
}

// ---------- presets ----------

TransferConfig default_config() { return TransferConfig{}; }

static TransferConfig make_profile(size_t chunk, size_t budget, uint32_t delay, uint32_t retries) {
  TransferConfig c;
  c.chunk_size       = chunk;
  c.buffer_threshold = budget;
  c.send_delay_ms    = delay;
  c.max_retries      = retries;
  return c;
}

// Every profile keeps retry_budget_ms() under its stall window.
bool preset(const std::string& name, TransferConfig& out) {
  if (name == "unified") { out = default_config();                          return true; }
  if (name == "lan")     { out = make_profile(64 * 1024, 128 * 1024, 20, 3); return true; }
  if (name == "wan")     { out = make_profile(8 * 1024,  64 * 1024,  50, 3); return true; }
  if (name == "slow") {
    out = make_profile(4 * 1024, 32 * 1024, 100, 5);
    out.stall_timeout_ms = 90000;
    return true;
  }
  if (name == "robust") {
    // many short tries inside a 30 s window
    out = make_profile(1024, 16 * 1024, 100, 10);
    out.max_poll_attempts = 10;
    out.backoff_cap_ms    = 500;
    out.stall_timeout_ms  = 30000;
    return true;
  }
  return false;
}

const std::vector<std::string>& preset_names() {
  static const std::vector<std::string> names = { "unified", "lan", "wan", "slow", "robust" };
  return names;
}

// ---------- JSON ----------

// Assign an unsigned JSON number to a field of any unsigned width.
template <typename T>
static bool take_unsigned(const json& v, const std::string& key, T& field, Error& err) {
  if (!v.is_number_unsigned()) {
    err = Error(ErrorKind::Config, key + " must be a non-negative integer");
    return false;
  }
  const uint64_t raw = v.get<uint64_t>();
  if (raw > static_cast<uint64_t>(static_cast<T>(-1))) {
    err = Error(ErrorKind::Config, key + " is out of range");
    return false;
  }
  field = static_cast<T>(raw);
  return true;
}

// -----------------------------------------------------------------------------
// load_config_json()
// PRE:   text is untrusted.
// POLICY:
//   - Work on a copy; cfg is untouched unless everything parses and validates.
//   - nlohmann throws on bad syntax; caught here, reported as Config.
// -----------------------------------------------------------------------------
bool load_config_json(const std::string& text, TransferConfig& cfg, Error& err) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::exception& e) {
    err = Error(ErrorKind::Config, std::string("invalid json: ") + e.what());
    return false;
  }
  if (!doc.is_object()) {
    err = Error(ErrorKind::Config, "config must be a json object");
    return false;
  }

  TransferConfig work = cfg;

  auto prof = doc.find("profile");
  if (prof != doc.end()) {
    if (!prof->is_string() || !preset(prof->get<std::string>(), work)) {
      err = Error(ErrorKind::Config, "unknown profile");
      return false;
    }
  }

  for (auto it = doc.begin(); it != doc.end(); ++it) {
    const std::string& key = it.key();
    const json& v = it.value();
    bool ok = true;

    if      (key == "profile")           continue;
    else if (key == "chunk_size")        ok = take_unsigned(v, key, work.chunk_size, err);
    else if (key == "buffer_threshold")  ok = take_unsigned(v, key, work.buffer_threshold, err);
    else if (key == "send_delay_ms")     ok = take_unsigned(v, key, work.send_delay_ms, err);
    else if (key == "max_retries")       ok = take_unsigned(v, key, work.max_retries, err);
    else if (key == "max_poll_attempts") ok = take_unsigned(v, key, work.max_poll_attempts, err);
    else if (key == "stall_timeout_ms")  ok = take_unsigned(v, key, work.stall_timeout_ms, err);
    else if (key == "backoff_base_ms")   ok = take_unsigned(v, key, work.backoff_base_ms, err);
    else if (key == "backoff_cap_ms")    ok = take_unsigned(v, key, work.backoff_cap_ms, err);
    else if (key == "max_message_size")  ok = take_unsigned(v, key, work.max_message_size, err);
    else {
      err = Error(ErrorKind::Config, "unknown key: " + key);
      return false;
    }
    if (!ok) return false;
  }

  if (!work.validate(err)) return false;
  cfg = work;
  return true;
}

bool load_config_file(const std::string& path, TransferConfig& cfg, Error& err) {
  std::ifstream in(path);
  if (!in) {
    err = Error(ErrorKind::Config, "cannot open config file: " + path);
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_config_json(ss.str(), cfg, err);
}

} // namespace chunkwire
