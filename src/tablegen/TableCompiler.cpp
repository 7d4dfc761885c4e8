#include "TableCompiler.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace apt {
namespace {
const char* EXPECTED_HEADER = "name,id,length,channel";

std::string lineError(const std::string& sourceName, int lineNumber,
                      const std::string& message) {
  std::ostringstream ss;
  ss << sourceName << ":" << lineNumber << ": " << message;
  return ss.str();
}

bool sortByIdentity(const TableRow& a, const TableRow& b) {
  return a.identity < b.identity;
}
}  // namespace

std::string TableCompiler::trim(const std::string& s) {
  const char* whitespace = " \t\r\n";
  auto start = s.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

std::vector<std::string> TableCompiler::splitFields(const std::string& line) {
  // Keeps empty fields, including a trailing one ("A,0x1,6," has 4 fields).
  std::vector<std::string> fields;
  std::string::size_type start = 0;
  while (true) {
    auto comma = line.find(',', start);
    if (comma == std::string::npos) {
      fields.push_back(trim(line.substr(start)));
      break;
    }
    fields.push_back(trim(line.substr(start, comma - start)));
    start = comma + 1;
  }
  return fields;
}

TableRow TableCompiler::parseRow(const std::vector<std::string>& fields,
                                 const std::string& sourceName,
                                 int lineNumber) {
  if (fields.size() != 4) {
    throw TableError(lineError(sourceName, lineNumber,
                               "expected 4 columns, found " +
                                   std::to_string(fields.size())));
  }
  TableRow row;
  row.lineNumber = lineNumber;
  row.name = fields[0];
  if (row.name.empty()) {
    throw TableError(lineError(sourceName, lineNumber, "empty message name"));
  }
  if (row.name.find_first_of("\"\\") != std::string::npos) {
    throw TableError(
        lineError(sourceName, lineNumber, "invalid message name " + row.name));
  }

  const std::string& idText = fields[1];
  unsigned long identity = 0;
  size_t consumed = 0;
  try {
    if (idText.size() > 2 && idText[0] == '0' &&
        (idText[1] == 'x' || idText[1] == 'X')) {
      identity = std::stoul(idText.substr(2), &consumed, 16);
      consumed += 2;
    } else {
      identity = std::stoul(idText, &consumed, 10);
    }
  } catch (const std::logic_error&) {
    throw TableError(
        lineError(sourceName, lineNumber, "malformed identity '" + idText + "'"));
  }
  if (consumed != idText.size()) {
    throw TableError(
        lineError(sourceName, lineNumber, "malformed identity '" + idText + "'"));
  }
  if (identity > 0xFFFF) {
    throw TableError(lineError(sourceName, lineNumber,
                               "identity " + idText + " exceeds two bytes"));
  }
  row.identity = uint16_t(identity);

  std::string lengthText = fields[2];
  std::string lowered = lengthText;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return char(std::tolower(c)); });
  if (lowered == "variable") {
    row.variable = true;
    row.length = 0;
  } else {
    long length = 0;
    try {
      length = std::stol(lengthText, &consumed, 10);
    } catch (const std::logic_error&) {
      throw TableError(lineError(sourceName, lineNumber,
                                 "malformed length '" + lengthText + "'"));
    }
    if (consumed != lengthText.size()) {
      throw TableError(lineError(sourceName, lineNumber,
                                 "malformed length '" + lengthText + "'"));
    }
    if (length <= 0) {
      throw TableError(lineError(sourceName, lineNumber,
                                 "non-positive length for " + row.name));
    }
    if (length < HEADER_SIZE) {
      throw TableError(lineError(
          sourceName, lineNumber,
          "length of " + row.name + " is shorter than the message header"));
    }
    if (length > 0xFFFF + HEADER_SIZE) {
      throw TableError(
          lineError(sourceName, lineNumber, "length of " + row.name +
                                                " exceeds the protocol limit"));
    }
    row.variable = false;
    row.length = int(length);
  }

  row.channel = fields[3].empty() ? row.name : fields[3];
  return row;
}

std::vector<TableRow> TableCompiler::parse(std::istream& in,
                                           const std::string& sourceName) {
  std::vector<TableRow> rows;
  std::string line;
  int lineNumber = 0;
  bool sawHeader = false;
  while (std::getline(in, line)) {
    ++lineNumber;
    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    if (!sawHeader) {
      if (trimmed != EXPECTED_HEADER) {
        throw TableError(lineError(sourceName, lineNumber,
                                   std::string("expected header '") +
                                       EXPECTED_HEADER + "'"));
      }
      sawHeader = true;
      continue;
    }
    rows.push_back(parseRow(splitFields(trimmed), sourceName, lineNumber));
  }
  if (!sawHeader) {
    throw TableError(sourceName + ": missing header row");
  }
  if (rows.empty()) {
    throw TableError(sourceName + ": table has no messages");
  }
  return rows;
}

std::vector<TableRow> TableCompiler::parseFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.good()) {
    throw TableError("Cannot open protocol table " + path);
  }
  return parse(in, path);
}

bool TableCompiler::writeHeader(const std::string& path,
                                const std::string& header) {
  {
    std::ifstream existing(path);
    if (existing.good()) {
      std::stringstream ss;
      ss << existing.rdbuf();
      if (ss.str() == header) {
        std::error_code ec;
        std::filesystem::last_write_time(
            path, std::filesystem::file_time_type::clock::now(), ec);
        if (ec) {
          throw TableError("Cannot touch " + path + ": " + ec.message());
        }
        return false;
      }
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out.good()) {
    throw TableError("Cannot write " + path);
  }
  out << header;
  out.close();
  if (out.fail()) {
    throw TableError("Cannot write " + path);
  }
  return true;
}

void TableCompiler::validate(const std::vector<TableRow>& rows) {
  std::map<uint16_t, const TableRow*> byIdentity;
  std::map<std::string, const TableRow*> byName;
  for (const auto& row : rows) {
    auto it = byIdentity.find(row.identity);
    if (it != byIdentity.end()) {
      std::ostringstream ss;
      ss << "duplicate identity 0x" << std::hex << std::uppercase
         << std::setfill('0') << std::setw(4) << row.identity << " ("
         << it->second->name << " on line " << std::dec
         << it->second->lineNumber << ", " << row.name << " on line "
         << row.lineNumber << ")";
      throw TableError(ss.str());
    }
    byIdentity[row.identity] = &row;

    auto nameIt = byName.find(row.name);
    if (nameIt != byName.end()) {
      throw TableError("duplicate message name " + row.name + " (lines " +
                       std::to_string(nameIt->second->lineNumber) + " and " +
                       std::to_string(row.lineNumber) + ")");
    }
    byName[row.name] = &row;
  }
}

std::vector<std::string> TableCompiler::channelNames(
    std::vector<TableRow> rows) {
  std::stable_sort(rows.begin(), rows.end(), sortByIdentity);
  std::vector<std::string> names;
  std::set<std::string> seen;
  for (const auto& row : rows) {
    if (seen.insert(row.channel).second) {
      names.push_back(row.channel);
    }
  }
  return names;
}

std::string TableCompiler::emitHeader(std::vector<TableRow> rows,
                                      const std::string& sourceName) {
  std::stable_sort(rows.begin(), rows.end(), sortByIdentity);
  std::vector<std::string> channels = channelNames(rows);
  std::map<std::string, size_t> slotOf;
  for (size_t i = 0; i < channels.size(); ++i) {
    slotOf[channels[i]] = i;
  }

  std::ostringstream out;
  out << "// Generated by apt-tablegen from " << sourceName
      << ". Do not edit.\n";
  out << "#ifndef __APT_PROTOCOL_TABLE_GENERATED__\n";
  out << "#define __APT_PROTOCOL_TABLE_GENERATED__\n\n";
  out << "namespace apt {\nnamespace generated {\n";
  out << "constexpr ProtocolEntry PROTOCOL_ENTRIES[] = {\n";
  for (const auto& row : rows) {
    out << "    {0x" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(4) << row.identity << std::dec << ", "
        << (row.variable ? "LengthPolicy::VARIABLE" : "LengthPolicy::FIXED")
        << ", " << row.length << ", " << slotOf[row.channel] << ", \""
        << row.name << "\"},\n";
  }
  out << "};\n\n";
  out << "constexpr const char* CHANNEL_NAMES[] = {\n";
  for (const auto& channel : channels) {
    out << "    \"" << channel << "\",\n";
  }
  out << "};\n";
  out << "}  // namespace generated\n}  // namespace apt\n\n";
  out << "#endif  // __APT_PROTOCOL_TABLE_GENERATED__\n";
  return out.str();
}
}  // namespace apt
