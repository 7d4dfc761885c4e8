#ifndef __APT_PROTOCOL_TABLE__
#define __APT_PROTOCOL_TABLE__

#include <stddef.h>
#include <stdint.h>

namespace apt {
/** @brief How the total frame length of a message type is known. */
enum class LengthPolicy : uint8_t {
  /** @brief The table carries the total frame length. */
  FIXED = 0,
  /** @brief The frame length is read from the message header. */
  VARIABLE = 1
};

/**
 * @brief Compile-time record for one message identity.
 */
struct ProtocolEntry {
  uint16_t identity;
  LengthPolicy policy;
  /** @brief Total frame length including the header; 0 when variable. */
  uint16_t length;
  /** @brief Index of the channel slot that receives this identity. */
  uint16_t slot;
  const char* name;
};

/**
 * @brief Wire length of a message identity: a fixed byte count or the marker
 * that the length is carried in the header.
 */
class WireLength {
 public:
  constexpr WireLength(LengthPolicy _policy, uint16_t _length)
      : policy(_policy), length(_length) {}

  constexpr bool isVariable() const { return policy == LengthPolicy::VARIABLE; }
  /** @brief Fixed total length; only meaningful when not variable. */
  constexpr uint16_t fixedLength() const { return length; }

 protected:
  LengthPolicy policy;
  uint16_t length;
};
}  // namespace apt

#include "AptProtocolTable.hpp"

namespace apt {
namespace detail {
constexpr size_t PROTOCOL_HEADER_SIZE = 6;

constexpr size_t entryCount() {
  return sizeof(generated::PROTOCOL_ENTRIES) /
         sizeof(generated::PROTOCOL_ENTRIES[0]);
}

constexpr size_t channelCount() {
  return sizeof(generated::CHANNEL_NAMES) /
         sizeof(generated::CHANNEL_NAMES[0]);
}

constexpr bool entriesStrictlySorted() {
  for (size_t i = 1; i < entryCount(); ++i) {
    if (generated::PROTOCOL_ENTRIES[i - 1].identity >=
        generated::PROTOCOL_ENTRIES[i].identity) {
      return false;
    }
  }
  return true;
}

constexpr bool fixedLengthsValid() {
  for (size_t i = 0; i < entryCount(); ++i) {
    const ProtocolEntry& e = generated::PROTOCOL_ENTRIES[i];
    if (e.policy == LengthPolicy::FIXED && e.length < PROTOCOL_HEADER_SIZE) {
      return false;
    }
  }
  return true;
}

constexpr bool slotsInRange() {
  for (size_t i = 0; i < entryCount(); ++i) {
    if (generated::PROTOCOL_ENTRIES[i].slot >= channelCount()) {
      return false;
    }
  }
  return true;
}

static_assert(entriesStrictlySorted(),
              "protocol table must list each identity once, in order");
static_assert(fixedLengthsValid(),
              "fixed message lengths must cover the 6 byte header");
static_assert(slotsInRange(), "protocol table references an unknown channel");

constexpr const ProtocolEntry* findEntry(uint16_t identity) {
  size_t lo = 0;
  size_t hi = entryCount();
  while (lo < hi) {
    size_t mid = lo + (hi - lo) / 2;
    const ProtocolEntry& e = generated::PROTOCOL_ENTRIES[mid];
    if (e.identity == identity) {
      return &e;
    }
    if (e.identity < identity) {
      lo = mid + 1;
    } else {
      hi = mid;
    }
  }
  return nullptr;
}
}  // namespace detail

/**
 * @brief Read-only lookups over the generated protocol table.  All lookups
 * are binary searches over static storage and never allocate.
 */
class ProtocolTable {
 public:
  /** @brief Returns the entry for the identity or nullptr if unknown. */
  static constexpr const ProtocolEntry* find(uint16_t identity) {
    return detail::findEntry(identity);
  }

  static constexpr bool contains(uint16_t identity) {
    return find(identity) != nullptr;
  }

  static constexpr size_t size() { return detail::entryCount(); }

  static constexpr size_t channelCount() { return detail::channelCount(); }

  static constexpr const ProtocolEntry& entryAt(size_t index) {
    return generated::PROTOCOL_ENTRIES[index];
  }

  /**
   * @brief Wire length of a known identity.
   * @throws std::out_of_range if the identity is not in the table.
   */
  static WireLength wireLength(uint16_t identity);

  /**
   * @brief Channel slot of a known identity.
   * @throws std::out_of_range if the identity is not in the table.
   */
  static size_t channelSlot(uint16_t identity);

  static const char* channelName(size_t slot);

  /** @brief Message name, or "UNKNOWN" for identities not in the table. */
  static const char* messageName(uint16_t identity);
};
}  // namespace apt

#endif  // __APT_PROTOCOL_TABLE__
