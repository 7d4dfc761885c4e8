#ifndef __APT_LINK_CONFIG__
#define __APT_LINK_CONFIG__

#include "Headers.hpp"

namespace apt {
/**
 * @brief Link settings loaded from an INI file.
 *
 * Sections and keys:
 *   [Device] path, baud_rate, rts_cts, serial_number
 *   [Link]   default_timeout_ms, decode_error_policy (fail_fast or
 *            scan_forward), reclaim_empty_slots, log_unmatched,
 *            read_chunk_size
 *   [Debug]  verbose, silent, logsize
 *
 * Missing keys keep their defaults.
 */
class LinkConfig {
 public:
  LinkConfig();

  /**
   * @throws std::runtime_error if the file is missing or a value is invalid.
   */
  static LinkConfig loadFile(const string& filename);

  /** @throws std::runtime_error if a value is invalid. */
  static LinkConfig loadString(const string& text);

  DeviceEndpoint endpoint;
  LinkOptions options;
  int verbose;
  bool silent;
  string maxLogSize;

  static DecodeErrorPolicy parsePolicy(const string& value);
  static bool parseBool(const string& key, const string& value);
  static int parseInt(const string& key, const string& value, int minimum);
};
}  // namespace apt

#endif  // __APT_LINK_CONFIG__
