/**
 * @file message_registry.hpp
 * @brief Explicit static table of `{type_code -> MessageDescriptor}`.
 *
 * @details
 * Protocols that multiplex several message types over one channel resolve the
 * body of a frame through this table. It is built once at startup from a
 * literal list; nothing scans types at runtime.
 *
 * Registering a second descriptor under a type code that is already taken is
 * a startup error (RegistryError). Letting the later entry silently win would
 * decode one device's reply with another message's layout.
 *
 * Request/response pairing follows the fixture convention: a non-negative even
 * code `t` is a request whose response is `t + 1`, when `t + 1` is registered.
 */
#ifndef FIXTURELINK_MESSAGE_REGISTRY_HPP
#define FIXTURELINK_MESSAGE_REGISTRY_HPP

#include <cstdint>
#include <initializer_list>
#include <vector>

#include "etl/map.h"
#include "fixturelink/message_codec.hpp"

namespace fixturelink {

#ifndef FIXTURELINK_MAX_MESSAGE_TYPES
#define FIXTURELINK_MAX_MESSAGE_TYPES 32
#endif

class MessageRegistry {
public:
  MessageRegistry() = default;

  /// Build from a literal list; throws RegistryError on a duplicate code or overflow.
  MessageRegistry(std::initializer_list<MessageDescriptor> descriptors);

  /// Add one descriptor; throws RegistryError if its type code is already taken.
  void add(const MessageDescriptor& d);

  /// nullptr when the code is unknown.
  const MessageDescriptor* find(int32_t type_code) const;

  /// Response descriptor paired with @p request, or nullptr.
  const MessageDescriptor* response_for(const MessageDescriptor& request) const;

  size_t size() const { return table_.size(); }

  /// Registered codes in ascending order.
  std::vector<int32_t> type_codes() const;

private:
  etl::map<int32_t, MessageDescriptor, FIXTURELINK_MAX_MESSAGE_TYPES> table_;
};

} // namespace fixturelink

#endif // FIXTURELINK_MESSAGE_REGISTRY_HPP
