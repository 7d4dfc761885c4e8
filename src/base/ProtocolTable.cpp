#include "ProtocolTable.hpp"

#include "Headers.hpp"

namespace apt {
namespace {
const ProtocolEntry& requireEntry(uint16_t identity) {
  const ProtocolEntry* entry = ProtocolTable::find(identity);
  if (entry == nullptr) {
    throw std::out_of_range("Message identity " + identityToString(identity) +
                            " is not in the protocol table");
  }
  return *entry;
}
}  // namespace

WireLength ProtocolTable::wireLength(uint16_t identity) {
  const ProtocolEntry& entry = requireEntry(identity);
  return WireLength(entry.policy, entry.length);
}

size_t ProtocolTable::channelSlot(uint16_t identity) {
  return requireEntry(identity).slot;
}

const char* ProtocolTable::channelName(size_t slot) {
  if (slot >= channelCount()) {
    throw std::out_of_range("Channel slot " + to_string(slot) +
                            " is out of range");
  }
  return generated::CHANNEL_NAMES[slot];
}

const char* ProtocolTable::messageName(uint16_t identity) {
  const ProtocolEntry* entry = find(identity);
  return entry ? entry->name : "UNKNOWN";
}
}  // namespace apt
