/**
 * @file core.hpp
 * @brief chunkwire Core: one channel, many transfers, one tick loop.
 *
 * @details
 * ## Field Brief
 * **Core** is the orchestrator for a single message channel. It does not
 * know sockets, data channels or disks. It knows **offers and chunks in**,
 * **sessions advanced on tick**, **packets out**. Wrappers own the channel
 * and the clock; Core owns the transfer state.
 *
 * ---
 *
 * @par What This File Provides
 * - `chunkwire::Core`, which:
 *   - Owns the `TransferRegistry`, the obfuscation key and the config.
 *   - Starts outbound transfers with `send()` (probe, offer, then chunks).
 *   - Accepts inbound offers with `accept()` and a `SinkChain`.
 *   - Routes every inbound message from the channel: packets to receivers,
 *     JSON control messages to the offer handler or to cancellation.
 *   - On each `tick(now_ms)`, advances every session and sweeps the
 *     terminal ones out of the registry.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [Host loop]                        [Core]                      [IChannel]
 *      │  send(source,id,...) ───────► Sender::start ── HEARTBEAT ──►│
 *      │                               send_offer ─── file-metadata ─►│
 *      │  tick(now_ms) ──────────────► Sender::tick ── DATA_CHUNK ───►│
 *      │                                                              │
 *      │                 on_message ◄──────────── inbound message ────│
 *      │                     ├─ packet DATA_CHUNK ─► Receiver::on_chunk
 *      │                     ├─ file-metadata ─────► offer handler ─► accept()
 *      │                     ├─ file-cancel ───────► cancel(id)
 *      │                     └─ anything else ─────► "not mine" (false)
 * ```
 *
 * ---
 *
 * @par Failure Model
 * - **Start refused:** `send()` / `accept()` return false with an `Error`;
 *   nothing is registered and no callback fires.
 * - **Fatal during transfer:** the session's `on_error` fires once. The
 *   registry entry is removed *before* the host callback runs, so the host
 *   may immediately retry with the same transfer id.
 * - **Unknown transfer id** on a chunk: logged and dropped.
 * - **Foreign bytes:** `on_message()` returns false; nothing else happens.
 *
 * ---
 *
 * @par Threading
 * None. Call `tick()`, `on_message()` (usually via the channel handler) and
 * the API from one loop. Time is whatever the host passes in.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * chunkwire::transport::LoopbackLink link;
 * chunkwire::ObfuscationKey key = chunkwire::generate_key();
 * chunkwire::Core tx(link.a(), chunkwire::default_config(), key);
 * chunkwire::Core rx(link.b(), chunkwire::default_config(), key);
 *
 * rx.set_offer_handler([&](const chunkwire::Offer& o) {
 *   chunkwire::SinkChain sinks;
 *   sinks.add(std::make_unique<chunkwire::FileSinkProvider>("/tmp"));
 *   chunkwire::Error err;
 *   rx.accept(o, std::move(sinks), {}, now_ms(), err);
 * });
 *
 * tx.send(std::move(source), id, "photo.jpg", callbacks, now_ms(), err);
 * while (!tx.idle() || !rx.idle()) {
 *   tx.tick(now_ms());
 *   link.pump();
 *   rx.tick(now_ms());
 * }
 * @endcode
 */
#ifndef CHUNKWIRE_CORE_HPP
#define CHUNKWIRE_CORE_HPP

#include <stddef.h>
#include <stdint.h>
#include <functional>
#include <memory>
#include <string>

#include "chunkwire/callbacks.hpp"
#include "chunkwire/config.hpp"
#include "chunkwire/control.hpp"
#include "chunkwire/errors.hpp"
#include "chunkwire/obfuscator.hpp"
#include "chunkwire/packet.hpp"
#include "chunkwire/registry.hpp"
#include "chunkwire/sink.hpp"
#include "chunkwire/source.hpp"
#include "chunkwire/transport/channel.hpp"

namespace chunkwire {

class Core {
public:
  using OfferHandler = std::function<void(const Offer& offer)>;

  /// Counters for diagnostics; never reset.
  struct Stats {
    uint64_t ticks{0};
    uint64_t packets_in{0};        ///< Decoded binary packets.
    uint64_t control_in{0};        ///< Decoded JSON control messages.
    uint64_t foreign_in{0};        ///< Messages that were neither.
    uint64_t unknown_transfer{0};  ///< DATA_CHUNK for an id with no receiver.
  };

  /**
   * @brief Attach to @p channel and install the inbound handler.
   * @param key Obfuscation key; both ends of a transfer must use the same one.
   */
  Core(transport::IChannel& channel, const TransferConfig& cfg, const ObfuscationKey& key);

  /// Detaches from the channel and cancels every session.
  ~Core();

  Core(const Core&) = delete;
  Core& operator=(const Core&) = delete;

  /**
   * @brief Start sending @p source under @p transfer_id.
   *
   * Probes the channel, announces the file with an offer, registers the
   * sender. Chunks start flowing on the next tick().
   *
   * @retval false @p err: Config (bad config, duplicate id), ChannelNotReady.
   */
  bool send(std::unique_ptr<ISource> source,
            const TransferId& transfer_id,
            const std::string& file_name,
            TransferCallbacks callbacks,
            uint64_t now_ms,
            Error& err);

  /**
   * @brief Start receiving the transfer described by @p offer into @p sinks.
   *
   * The receiver is registered before sink acquisition begins, so chunks
   * arriving while a provider is Pending are staged, not dropped.
   *
   * @param session If set, receives the Receiver before it starts. It stays
   *                valid after the transfer deregisters (a zero-byte file
   *                completes inside this call), so the host can still read
   *                sink_kind() or byte counts.
   * @retval false @p err: Config (duplicate id).
   */
  bool accept(const Offer& offer,
              SinkChain sinks,
              TransferCallbacks callbacks,
              uint64_t now_ms,
              Error& err,
              std::shared_ptr<Receiver>* session = nullptr);

  /**
   * @brief Handle one inbound message. Installed as the channel handler.
   * @return false when the message is not ours (neither packet nor control).
   */
  bool on_message(const uint8_t* data, size_t len);

  /// Advance every session, then drop terminal ones from the registry.
  void tick(uint64_t now_ms);

  /// Silently cancel the local sender and/or receiver for @p transfer_id.
  bool cancel(const TransferId& transfer_id);

  bool send_offer(const Offer& offer);
  bool send_cancel(const TransferId& transfer_id);

  void set_offer_handler(OfferHandler handler) { offer_handler_ = std::move(handler); }

  /// Earliest deadline across all sessions; UINT64_MAX when idle.
  uint64_t next_wakeup_ms() const;

  bool idle() const { return registry_.empty(); }

  TransferRegistry&       registry()       { return registry_; }
  const TransferRegistry& registry() const { return registry_; }
  const TransferConfig&   config() const   { return cfg_; }
  const ObfuscationKey&   key() const      { return key_; }
  const Stats&            stats() const    { return stats_; }
  uint64_t                now_ms() const   { return now_ms_; }

private:
  bool send_text(const std::string& text);
  void route_chunk(Packet& pkt);
  void drop_sender(const TransferId& id, const Sender* which);
  void drop_receiver(const TransferId& id, const Receiver* which);

  transport::IChannel& channel_;
  TransferConfig       cfg_;
  ObfuscationKey       key_;
  TransferRegistry     registry_;
  OfferHandler         offer_handler_;
  Stats                stats_;
  uint64_t             now_ms_{0};   // last tick; used for inbound timestamps
};

} // namespace chunkwire

#endif // CHUNKWIRE_CORE_HPP
