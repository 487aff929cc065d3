/**
 * @file callbacks.hpp
 * @brief Host-facing notifications shared by senders and receivers.
 *
 * - `on_progress(percent, bytes_per_second)` at most once per processed chunk;
 *   percent is 0..100, speed is the windowed estimate.
 * - `on_complete()` exactly once on success.
 * - `on_error(err)` exactly once on fatal failure.
 *
 * Cancellation fires none of them. Any member may be left empty.
 */
#ifndef CHUNKWIRE_CALLBACKS_HPP
#define CHUNKWIRE_CALLBACKS_HPP

#include <functional>
#include "chunkwire/errors.hpp"

namespace chunkwire {

using ProgressFn = std::function<void(double percent, double bytes_per_second)>;
using CompleteFn = std::function<void()>;
using ErrorFn    = std::function<void(const Error& err)>;

struct TransferCallbacks {
  ProgressFn on_progress;
  CompleteFn on_complete;
  ErrorFn    on_error;
};

} // namespace chunkwire

#endif // CHUNKWIRE_CALLBACKS_HPP
