#ifndef __APT_TABLE_COMPILER__
#define __APT_TABLE_COMPILER__

#include <stdint.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace apt {
/**
 * @brief Raised when the protocol table is malformed.  The generator turns
 * this into a non-zero exit status so the build stops.
 */
class TableError : public std::runtime_error {
 public:
  explicit TableError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief One validated row of the protocol table.
 */
struct TableRow {
  std::string name;
  uint16_t identity;
  /** @brief True when the frame length is carried in the message header. */
  bool variable;
  /** @brief Total frame length in bytes; 0 when variable. */
  int length;
  std::string channel;
  int lineNumber;
};

/**
 * @brief Reads the human-maintained protocol table (csv) and emits the
 * generated C++ lookup header consumed by ProtocolTable.hpp.
 */
class TableCompiler {
 public:
  /** @brief Frame header size every fixed length must cover. */
  static const int HEADER_SIZE = 6;

  /**
   * @brief Parses table rows from a stream.
   * @param sourceName Used to prefix error messages.
   * @throws TableError on the first malformed row.
   */
  static std::vector<TableRow> parse(std::istream& in,
                                     const std::string& sourceName);

  static std::vector<TableRow> parseFile(const std::string& path);

  /**
   * @brief Rejects tables with a repeated identity or message name.
   */
  static void validate(const std::vector<TableRow>& rows);

  /**
   * @brief Returns the distinct channel names in slot order.  Slots are
   * numbered by first appearance when the rows are sorted by identity.
   */
  static std::vector<std::string> channelNames(std::vector<TableRow> rows);

  /**
   * @brief Renders the generated header.  Rows must already be validated.
   */
  static std::string emitHeader(std::vector<TableRow> rows,
                                const std::string& sourceName);

  /**
   * @brief Writes the generated header.  Identical content is kept as is
   * but its modification time is refreshed so the build sees it as current.
   * @return true if the content changed.
   * @throws TableError if the file cannot be written.
   */
  static bool writeHeader(const std::string& path, const std::string& header);

 protected:
  static TableRow parseRow(const std::vector<std::string>& fields,
                           const std::string& sourceName, int lineNumber);
  static std::vector<std::string> splitFields(const std::string& line);
  static std::string trim(const std::string& s);
};
}  // namespace apt

#endif  // __APT_TABLE_COMPILER__
