// -----------------------------------------------------------------------------
// obfuscator.cpp: repeating-key XOR and key helpers
// API & caveats: include/chunkwire/obfuscator.hpp
// -----------------------------------------------------------------------------
#include "chunkwire/obfuscator.hpp"

#include <random>

namespace chunkwire {

void obfuscate(const uint8_t* in, size_t n, const ObfuscationKey& key, uint8_t* out) {
  const size_t klen = key.size();
  if (klen == 0) {                                  // identity: nothing to mix in
    if (in != out) {
      for (size_t i = 0; i < n; ++i) out[i] = in[i];
    }
    return;
  }
  for (size_t i = 0; i < n; ++i) {
    out[i] = static_cast<uint8_t>(in[i] ^ key[i % klen]);
  }
}

std::vector<uint8_t> transform(const std::vector<uint8_t>& bytes, const ObfuscationKey& key) {
  std::vector<uint8_t> out(bytes.size());
  obfuscate(bytes.data(), bytes.size(), key, out.data());
  return out;
}

// -----------------------------------------------------------------------------
// generate_key(): one key per Core instance.
// POLICY:
//   - random_device is the OS entropy source on Linux (/dev/urandom).
//   - Unpredictable is all we need; this never protects secrets.
// -----------------------------------------------------------------------------
ObfuscationKey generate_key(size_t length) {
  if (length == 0) length = 1;
  if (length > OBFUSCATION_KEY_MAX) length = OBFUSCATION_KEY_MAX;

  std::random_device rd;
  std::uniform_int_distribution<unsigned int> byte(0, 255);

  ObfuscationKey key;
  for (size_t i = 0; i < length; ++i) {
    key.push_back(static_cast<uint8_t>(byte(rd)));
  }
  return key;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parse_key_hex(const std::string& hex, ObfuscationKey& out, std::string& err) {
  out.clear();
  if (hex.empty())                          { err = "empty_key"; return false; }
  if (hex.size() % 2 != 0)                  { err = "odd_length_key"; return false; }
  if (hex.size() / 2 > OBFUSCATION_KEY_MAX) { err = "key_too_long"; return false; }

  for (size_t i = 0; i < hex.size(); i += 2) {
    const int hi = hex_value(hex[i]);
    const int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) { out.clear(); err = "bad_hex_digit"; return false; }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

std::string key_to_hex(const ObfuscationKey& key) {
  static const char* DIGITS = "0123456789abcdef";
  std::string s;
  s.reserve(key.size() * 2);
  for (uint8_t b : key) {
    s.push_back(DIGITS[b >> 4]);
    s.push_back(DIGITS[b & 0x0F]);
  }
  return s;
}

} // namespace chunkwire
