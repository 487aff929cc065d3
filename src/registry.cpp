// -----------------------------------------------------------------------------
// registry.cpp: TransferRegistry bookkeeping
// API: include/chunkwire/registry.hpp
// -----------------------------------------------------------------------------
#include "chunkwire/registry.hpp"

#include <utility>

namespace chunkwire {

bool TransferRegistry::add_sender(const TransferId& id, std::shared_ptr<Sender> sender) {
  if (!sender) return false;
  return senders_.emplace(id_text(id), std::move(sender)).second;   // no overwrite
}

bool TransferRegistry::add_receiver(const TransferId& id, std::shared_ptr<Receiver> receiver) {
  if (!receiver) return false;
  return receivers_.emplace(id_text(id), std::move(receiver)).second;
}

std::shared_ptr<Sender> TransferRegistry::find_sender(const TransferId& id) const {
  auto it = senders_.find(id_text(id));
  return it == senders_.end() ? nullptr : it->second;
}

std::shared_ptr<Receiver> TransferRegistry::find_receiver(const TransferId& id) const {
  auto it = receivers_.find(id_text(id));
  return it == receivers_.end() ? nullptr : it->second;
}

bool TransferRegistry::remove_sender(const TransferId& id) {
  return senders_.erase(id_text(id)) != 0;
}

bool TransferRegistry::remove_receiver(const TransferId& id) {
  return receivers_.erase(id_text(id)) != 0;
}

// The entry goes now so the id is free at once; a sender still held by a
// tick snapshot sees the cleared flag and winds down on its own.
bool TransferRegistry::cancel_sender(const TransferId& id) {
  auto s = find_sender(id);
  if (!s) return false;
  s->cancel();
  remove_sender(id);
  return true;
}

bool TransferRegistry::cancel_receiver(const TransferId& id) {
  auto r = find_receiver(id);
  if (!r) return false;
  r->cancel();
  remove_receiver(id);
  return true;
}

std::vector<std::shared_ptr<Sender>> TransferRegistry::senders() const {
  std::vector<std::shared_ptr<Sender>> out;
  out.reserve(senders_.size());
  for (const auto& kv : senders_) out.push_back(kv.second);
  return out;
}

std::vector<std::shared_ptr<Receiver>> TransferRegistry::receivers() const {
  std::vector<std::shared_ptr<Receiver>> out;
  out.reserve(receivers_.size());
  for (const auto& kv : receivers_) out.push_back(kv.second);
  return out;
}

size_t TransferRegistry::sweep() {
  size_t n = 0;
  for (auto it = senders_.begin(); it != senders_.end();) {
    if (it->second->is_terminal()) { it = senders_.erase(it); ++n; } else { ++it; }
  }
  for (auto it = receivers_.begin(); it != receivers_.end();) {
    if (it->second->is_terminal()) { it = receivers_.erase(it); ++n; } else { ++it; }
  }
  return n;
}

void TransferRegistry::clear() {
  for (auto& kv : senders_)   kv.second->cancel();
  for (auto& kv : receivers_) kv.second->cancel();
  senders_.clear();
  receivers_.clear();
}

} // namespace chunkwire
