#include <cxxopts.hpp>

#include "DeviceConnection.hpp"
#include "LinkConfig.hpp"
#include "LogHandler.hpp"
#include "Session.hpp"
#include "TtySerialHandler.hpp"

using namespace apt;

namespace {
const uint16_t MOD_IDENTIFY = 0x0223;
const uint16_t HW_REQ_INFO = 0x0005;
const uint16_t HW_GET_INFO = 0x0006;
const uint16_t HW_START_UPDATEMSGS = 0x0011;
const uint16_t HW_STOP_UPDATEMSGS = 0x0012;
const uint16_t MOT_MOVE_HOME = 0x0443;
const uint16_t MOT_MOVE_HOMED = 0x0444;

uint32_t readLe(const string& data, size_t offset, size_t width) {
  uint32_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    value |= uint32_t(uint8_t(data[offset + i])) << (8 * i);
  }
  return value;
}

string readText(const string& data, size_t offset, size_t width) {
  string s = data.substr(offset, width);
  size_t end = s.find('\0');
  return end == string::npos ? s : s.substr(0, end);
}

void printHardwareInfo(const Message& message) {
  const string& data = message.getData();
  if (data.size() < 84) {
    CLOG(INFO, "stdout") << "Short HW_GET_INFO payload: " << toHex(data)
                         << endl;
    return;
  }
  CLOG(INFO, "stdout") << "Serial number:    " << readLe(data, 0, 4) << endl
                       << "Model:            " << readText(data, 4, 8) << endl
                       << "Hardware type:    " << readLe(data, 12, 2) << endl
                       << "Firmware version: " << int(uint8_t(data[16]))
                       << "." << int(uint8_t(data[15])) << "."
                       << int(uint8_t(data[14])) << endl
                       << "Notes:            " << readText(data, 18, 48)
                       << endl
                       << "Hardware version: " << readLe(data, 78, 2) << endl
                       << "Mod state:        " << readLe(data, 80, 2) << endl
                       << "Channels:         " << readLe(data, 82, 2) << endl;
}

void printStats(const LinkStats& stats) {
  CLOG(INFO, "stdout") << "bytes read:         " << stats.bytes_read() << endl
                       << "messages decoded:   " << stats.messages_decoded()
                       << endl
                       << "messages delivered: " << stats.messages_delivered()
                       << endl
                       << "messages unmatched: " << stats.messages_unmatched()
                       << endl
                       << "bytes skipped:      " << stats.bytes_skipped()
                       << endl
                       << "decode errors:      " << stats.decode_errors()
                       << endl;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  apt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, apt::InterruptSignalHandler);

  cxxopts::Options options("aptmon",
                           "Talks to a Thorlabs APT controller over USB");
  int exitCode = 0;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("device", "Serial device of the controller",
         cxxopts::value<std::string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("identify", "Flash the controller's front panel LED")  //
        ("hwinfo", "Request and print the hardware information")  //
        ("home", "Home the given channel",
         cxxopts::value<int>(), "CHANNEL")  //
        ("monitor", "Print device traffic for the given number of seconds",
         cxxopts::value<int>(), "SECONDS")  //
        ("timeout", "Response timeout in milliseconds",
         cxxopts::value<int>(), "MS")  //
        ("logtostdout", "log to stdout")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "aptmon version " << APT_VERSION << endl;
      exit(0);
    }

    LinkConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      config = LinkConfig::loadFile(cfgfilename);
    }
    if (result.count("device")) {
      config.endpoint.set_path(result["device"].as<string>());
    }
    if (result.count("timeout")) {
      if (result["timeout"].as<int>() <= 0) {
        throw std::runtime_error("--timeout must be positive");
      }
      config.options.set_default_timeout_ms(result["timeout"].as<int>());
    }

    // read verbose level (prioritize command line option over cfgfile)
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else {
      el::Loggers::setVerboseLevel(config.verbose);
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    LogHandler::setupLogFiles(&defaultConf, GetTempDirectory() + "aptlink",
                              "aptmon", result.count("logtostdout") > 0,
                              false, config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("aptmon-main");

    if (!config.endpoint.has_path()) {
      CLOG(INFO, "stdout") << "No device given (use --device or --cfgfile)"
                           << endl
                           << options.help({}) << endl;
      exit(1);
    }

    shared_ptr<SerialHandler> serialHandler(new TtySerialHandler());
    shared_ptr<DeviceConnection> connection(
        new DeviceConnection(serialHandler, config.endpoint, config.options));
    connection->connect();
    Session session(connection);

    if (result.count("identify")) {
      session.send(Message::headerOnly(MOD_IDENTIFY, 0, 0));
      CLOG(INFO, "stdout") << "Sent identify" << endl;
    }

    if (result.count("hwinfo")) {
      Response response =
          session.request(Message::headerOnly(HW_REQ_INFO, 0, 0), HW_GET_INFO);
      if (response.ok()) {
        printHardwareInfo(*response.message);
      } else {
        CLOG(INFO, "stdout") << "Hardware info request: " << response << endl;
        exitCode = 1;
      }
    }

    if (result.count("home")) {
      int channel = result["home"].as<int>();
      if (channel < 1 || channel > 255) {
        throw std::runtime_error("--home channel must be in 1..255");
      }
      Response response = session.request(
          Message::headerOnly(MOT_MOVE_HOME, uint8_t(channel), 0),
          MOT_MOVE_HOMED, session.getDefaultTimeout(), nullptr,
          RequestMode::JOIN_PENDING);
      CLOG(INFO, "stdout") << "Home channel " << channel << ": " << response
                           << endl;
      if (!response.ok()) {
        exitCode = 1;
      }
    }

    if (result.count("monitor")) {
      int seconds = result["monitor"].as<int>();
      connection->getDispatcher()->setUnmatchedHandler(
          [](const shared_ptr<const Message>& message) {
            CLOG(INFO, "stdout") << *message << " " << toHex(message->getData())
                                 << endl;
          });
      session.send(Message::headerOnly(HW_START_UPDATEMSGS, 0, 0));
      auto deadline =
          std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
      while (std::chrono::steady_clock::now() < deadline &&
             !connection->isFailed()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      if (!connection->isFailed()) {
        session.send(Message::headerOnly(HW_STOP_UPDATEMSGS, 0, 0));
      }
    }

    if (connection->isFailed()) {
      CLOG(INFO, "stdout") << "Connection failed: "
                           << connection->getFailureReason() << endl;
      exitCode = 1;
    }
    connection->shutdown();
    printStats(connection->getStats());
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
