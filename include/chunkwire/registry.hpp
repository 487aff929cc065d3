/**
 * @file registry.hpp
 * @brief Active senders and receivers on one Core, keyed by transfer id.
 *
 * @details
 * One instance per Core; no globals, so tests get a fresh registry each
 * time. An id may be registered at most once as a sender and at most once
 * as a receiver. Entries are `shared_ptr` so a caller iterating a snapshot
 * keeps a session alive even if its terminal callback removes the entry.
 */
#ifndef CHUNKWIRE_REGISTRY_HPP
#define CHUNKWIRE_REGISTRY_HPP

#include <stddef.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "chunkwire/packet.hpp"
#include "chunkwire/receiver.hpp"
#include "chunkwire/sender.hpp"

namespace chunkwire {

class TransferRegistry {
public:
  /// @return false if @p id already has a sender.
  bool add_sender(const TransferId& id, std::shared_ptr<Sender> sender);
  /// @return false if @p id already has a receiver.
  bool add_receiver(const TransferId& id, std::shared_ptr<Receiver> receiver);

  std::shared_ptr<Sender>   find_sender(const TransferId& id) const;
  std::shared_ptr<Receiver> find_receiver(const TransferId& id) const;

  bool remove_sender(const TransferId& id);
  bool remove_receiver(const TransferId& id);

  /// Flag the sender to stop and remove it at once.
  bool cancel_sender(const TransferId& id);
  /// Cancel and remove at once.
  bool cancel_receiver(const TransferId& id);

  /// Copies, safe to iterate while sessions deregister themselves.
  std::vector<std::shared_ptr<Sender>>   senders() const;
  std::vector<std::shared_ptr<Receiver>> receivers() const;

  /// Drop every terminal entry. @return number removed.
  size_t sweep();

  size_t sender_count() const   { return senders_.size(); }
  size_t receiver_count() const { return receivers_.size(); }
  bool   empty() const          { return senders_.empty() && receivers_.empty(); }

  /// Cancel everything and forget it.
  void clear();

private:
  std::map<std::string, std::shared_ptr<Sender>>   senders_;
  std::map<std::string, std::shared_ptr<Receiver>> receivers_;
};

} // namespace chunkwire

#endif // CHUNKWIRE_REGISTRY_HPP
