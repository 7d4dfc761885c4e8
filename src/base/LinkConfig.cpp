#include "LinkConfig.hpp"

#include "SimpleIni.h"

namespace apt {
namespace {
void applyIni(const CSimpleIniA& ini, LinkConfig* config) {
  const char* value;

  if ((value = ini.GetValue("Device", "path", NULL))) {
    config->endpoint.set_path(value);
  }
  if ((value = ini.GetValue("Device", "baud_rate", NULL))) {
    config->endpoint.set_baud_rate(
        LinkConfig::parseInt("baud_rate", value, 1));
  }
  if ((value = ini.GetValue("Device", "rts_cts", NULL))) {
    config->endpoint.set_rts_cts(LinkConfig::parseBool("rts_cts", value));
  }
  if ((value = ini.GetValue("Device", "serial_number", NULL))) {
    config->endpoint.set_serial_number(value);
  }

  if ((value = ini.GetValue("Link", "default_timeout_ms", NULL))) {
    config->options.set_default_timeout_ms(
        LinkConfig::parseInt("default_timeout_ms", value, 1));
  }
  if ((value = ini.GetValue("Link", "decode_error_policy", NULL))) {
    config->options.set_decode_error_policy(LinkConfig::parsePolicy(value));
  }
  if ((value = ini.GetValue("Link", "reclaim_empty_slots", NULL))) {
    config->options.set_reclaim_empty_slots(
        LinkConfig::parseBool("reclaim_empty_slots", value));
  }
  if ((value = ini.GetValue("Link", "log_unmatched", NULL))) {
    config->options.set_log_unmatched(
        LinkConfig::parseBool("log_unmatched", value));
  }
  if ((value = ini.GetValue("Link", "read_chunk_size", NULL))) {
    config->options.set_read_chunk_size(
        LinkConfig::parseInt("read_chunk_size", value, 1));
  }

  if ((value = ini.GetValue("Debug", "verbose", NULL))) {
    config->verbose = LinkConfig::parseInt("verbose", value, 0);
  }
  if ((value = ini.GetValue("Debug", "silent", NULL))) {
    config->silent = LinkConfig::parseBool("silent", value);
  }
  if ((value = ini.GetValue("Debug", "logsize", NULL))) {
    config->maxLogSize = to_string(LinkConfig::parseInt("logsize", value, 1));
  }
}
}  // namespace

LinkConfig::LinkConfig() : verbose(0), silent(false), maxLogSize("20971520") {}

LinkConfig LinkConfig::loadFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  LinkConfig config;
  applyIni(ini, &config);
  LOG(INFO) << "Loaded config from " << filename << ": " << config.endpoint;
  return config;
}

LinkConfig LinkConfig::loadString(const string& text) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(text.c_str(), text.size());
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  LinkConfig config;
  applyIni(ini, &config);
  return config;
}

namespace {
string lowerCase(string value) {
  transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return char(::tolower(c)); });
  return value;
}
}  // namespace

DecodeErrorPolicy LinkConfig::parsePolicy(const string& value) {
  string lower = lowerCase(value);
  if (lower == "fail_fast") {
    return FAIL_FAST;
  }
  if (lower == "scan_forward") {
    return SCAN_FORWARD;
  }
  throw std::runtime_error("Invalid decode_error_policy: " + value);
}

bool LinkConfig::parseBool(const string& key, const string& value) {
  string lower = lowerCase(value);
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

int LinkConfig::parseInt(const string& key, const string& value,
                         int minimum) {
  size_t pos = 0;
  int result;
  try {
    result = stoi(value, &pos, 0);
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid integer for " + key + ": " + value);
  }
  if (pos != value.size()) {
    throw std::runtime_error("Invalid integer for " + key + ": " + value);
  }
  if (result < minimum) {
    throw std::runtime_error(key + " must be at least " + to_string(minimum));
  }
  return result;
}
}  // namespace apt
