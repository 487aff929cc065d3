/**
 * @file config.hpp
 * @brief Transfer tuning knobs, named network profiles, JSON loading.
 *
 * @details
 * One struct drives every sender and receiver on a Core. Construct it from a
 * preset, tweak fields, and call validate() before use; Core and Sender
 * refuse an invalid config with `ErrorKind::Config`.
 *
 * PROFILES
 * --------
 * | name      | chunk  | budget  | delay  | retries | polls | backoff cap | stall  |
 * |-----------|--------|---------|--------|---------|-------|-------------|--------|
 * | unified   | 16 KiB | 64 KiB  | 0 ms   | 3       | 50    | 1000 ms     | 60 s   |
 * | lan       | 64 KiB | 128 KiB | 20 ms  | 3       | 50    | 1000 ms     | 60 s   |
 * | wan       | 8 KiB  | 64 KiB  | 50 ms  | 3       | 50    | 1000 ms     | 60 s   |
 * | slow      | 4 KiB  | 32 KiB  | 100 ms | 5       | 50    | 1000 ms     | 90 s   |
 * | robust    | 1 KiB  | 16 KiB  | 100 ms | 10      | 10    | 500 ms      | 30 s   |
 *
 * JSON FORM
 * ---------
 * @code{.json}
 * { "profile": "wan", "chunk_size": 4096, "max_retries": 6 }
 * @endcode
 * "profile" is applied first, then every other key overrides one field.
 * Unknown keys and wrongly-typed values are rejected, not ignored.
 */
#ifndef CHUNKWIRE_CONFIG_HPP
#define CHUNKWIRE_CONFIG_HPP

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include "chunkwire/errors.hpp"

namespace chunkwire {

struct TransferConfig {
  size_t   chunk_size{16 * 1024};         ///< Raw payload bytes per DATA_CHUNK.
  size_t   buffer_threshold{64 * 1024};   ///< Buffered-bytes budget; sends wait below budget/4.
  uint32_t send_delay_ms{0};              ///< Base inter-chunk pacing delay.
  uint32_t max_retries{3};                ///< Failed attempts per chunk before giving up.
  uint32_t max_poll_attempts{50};         ///< Capacity polls before BufferTimeout.
  uint32_t stall_timeout_ms{60000};       ///< No-progress window before StalledTransfer.
  uint32_t backoff_base_ms{100};          ///< First retry delay; doubles per attempt.
  uint32_t backoff_cap_ms{1000};          ///< Upper bound for one retry delay.
  size_t   max_message_size{256 * 1024};  ///< Largest datagram the channel accepts.

  /**
   * @brief Check bounds, that a worst-case packet fits one message, and that
   *        retry_budget_ms() is shorter than stall_timeout_ms.
   * @return false with @p err.kind == Config and a reason message.
   */
  bool validate(Error& err) const;

  /**
   * @brief Upper bound on the time from one successful send until a jammed
   *        channel ends the chunk in RetriesExhausted.
   *
   * pacing + max(max_retries, 1) * (max_poll_attempts * longest poll + backoff cap)
   */
  uint64_t retry_budget_ms() const;
};

/// Default profile ("unified").
TransferConfig default_config();

/**
 * @brief Look up a named profile.
 * @return false if @p name is not one of preset_names().
 */
bool preset(const std::string& name, TransferConfig& out);

/// Names accepted by preset(), in documentation order.
const std::vector<std::string>& preset_names();

/**
 * @brief Parse a JSON document into @p cfg (see file comment for the shape).
 *
 * @p cfg is only modified on success. The result is validated.
 */
bool load_config_json(const std::string& text, TransferConfig& cfg, Error& err);

/// Read @p path and hand it to load_config_json().
bool load_config_file(const std::string& path, TransferConfig& cfg, Error& err);

} // namespace chunkwire

#endif // CHUNKWIRE_CONFIG_HPP
