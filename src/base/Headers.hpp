#ifndef __APT_HEADERS__
#define __APT_HEADERS__

#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <paths.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "AptLink.pb.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef APT_VERSION
#define APT_VERSION "unknown"
#endif

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

namespace apt {
inline std::ostream &operator<<(std::ostream &os,
                                const apt::DeviceEndpoint &endpoint) {
  if (endpoint.has_path()) {
    os << endpoint.path();
  }
  os << "@" << endpoint.baud_rate();
  if (endpoint.has_serial_number()) {
    os << " (sn " << endpoint.serial_number() << ")";
  }
  return os;
}

/**
 * @brief Renders a byte string as space separated hex for log output.
 */
inline string toHex(const string &bytes) {
  std::ostringstream ss;
  ss << std::hex << std::uppercase << std::setfill('0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i) ss << ' ';
    ss << std::setw(2) << int(uint8_t(bytes[i]));
  }
  return ss.str();
}

inline string identityToString(uint16_t identity) {
  std::ostringstream ss;
  ss << "0x" << std::hex << std::uppercase << std::setfill('0')
     << std::setw(4) << identity;
  return ss.str();
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace apt

#endif
