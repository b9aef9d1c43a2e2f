// ============================================================================
// message_registry.cpp — implementation for message_registry.hpp
// ============================================================================

#include "fixturelink/message_registry.hpp"
#include "fixturelink/errors.hpp"

#include <string>

namespace fixturelink {

MessageRegistry::MessageRegistry(std::initializer_list<MessageDescriptor> descriptors) {
  for (const auto& d : descriptors) add(d);
}

void MessageRegistry::add(const MessageDescriptor& d) {
  auto it = table_.find(d.type_id);
  if (it != table_.end()) {
    throw RegistryError("type code " + std::to_string(d.type_id) + " claimed by both " +
                        it->second.name.c_str() + " and " + d.name.c_str());
  }
  if (table_.full()) {
    throw RegistryError("more than " + std::to_string(FIXTURELINK_MAX_MESSAGE_TYPES) +
                        " message types; raise FIXTURELINK_MAX_MESSAGE_TYPES");
  }
  table_.insert(std::make_pair(d.type_id, d));
}

const MessageDescriptor* MessageRegistry::find(int32_t type_code) const {
  auto it = table_.find(type_code);
  return it == table_.end() ? nullptr : &it->second;
}

const MessageDescriptor* MessageRegistry::response_for(const MessageDescriptor& request) const {
  if (request.type_id < 0 || (request.type_id % 2) != 0) return nullptr;
  return find(request.type_id + 1);
}

std::vector<int32_t> MessageRegistry::type_codes() const {
  std::vector<int32_t> codes;
  codes.reserve(table_.size());
  for (const auto& kv : table_) codes.push_back(kv.first);
  return codes;
}

} // namespace fixturelink
