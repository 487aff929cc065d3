/**
 * @file obfuscator.hpp
 * @brief Repeating-key XOR applied to chunk payloads on the wire.
 *
 * @details
 * `out[i] = in[i] ^ key[i % key.size()]`. Applying it twice with the same key
 * restores the input.
 *
 * @warning This is obfuscation, not encryption. It keeps payload bytes from
 *          reading as plain file content and lowers the odds of unrelated
 *          binary traffic on a shared channel decoding as ours. It provides
 *          no confidentiality or integrity. Anyone who sees two packets can
 *          recover the key.
 *
 * Keys are generated once per `Core` from the OS random source and are not
 * exchanged with the peer; both ends must be handed the same key by the
 * host (the CLI runs both ends in one process, or takes `--key`).
 */
#ifndef CHUNKWIRE_OBFUSCATOR_HPP
#define CHUNKWIRE_OBFUSCATOR_HPP

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include "etl/vector.h"

namespace chunkwire {

static constexpr size_t OBFUSCATION_KEY_MAX     = 32;  ///< Longest accepted key.
static constexpr size_t OBFUSCATION_KEY_DEFAULT = 16;  ///< Length of generated keys.

/// Fixed-capacity key storage; no heap.
using ObfuscationKey = etl::vector<uint8_t, OBFUSCATION_KEY_MAX>;

/**
 * @brief XOR @p n bytes from @p in into @p out under @p key.
 *
 * @p in and @p out may alias (in-place). An empty key copies the input
 * through unchanged.
 */
void obfuscate(const uint8_t* in, size_t n, const ObfuscationKey& key, uint8_t* out);

/// Vector convenience over obfuscate().
std::vector<uint8_t> transform(const std::vector<uint8_t>& bytes, const ObfuscationKey& key);

/**
 * @brief Fill a fresh key of @p length bytes from std::random_device.
 * @param length Clamped to 1..OBFUSCATION_KEY_MAX.
 */
ObfuscationKey generate_key(size_t length = OBFUSCATION_KEY_DEFAULT);

/**
 * @brief Parse a hex string ("a1b2...") into a key.
 * @return false with @p err set on odd length, bad digit, empty or oversized input.
 */
bool parse_key_hex(const std::string& hex, ObfuscationKey& out, std::string& err);

/// Lowercase hex rendering of @p key.
std::string key_to_hex(const ObfuscationKey& key);

} // namespace chunkwire

#endif // CHUNKWIRE_OBFUSCATOR_HPP
