#ifndef __ST_HEADERS__
#define __ST_HEADERS__

#define CPPHTTPLIB_OPENSSL_SUPPORT (1)
#include "httplib.h"

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#endif

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <netdb.h>
#include <paths.h>
#include <pthread.h>
#include <pwd.h>
#include <signal.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "easylogging++.h"
#include "sshx.pb.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Stream id namespaces for the segment cipher
static const uint64_t SHELL_OUTPUT_STREAM_BASE = 0x100000000ULL;
static const uint64_t CLIENT_INPUT_STREAM_ID = 0x200000000ULL;

// Length of generated encryption keys and write passwords (~83 bits)
const int SESSION_KEY_LENGTH = 14;

// Controller timing, in seconds
const int HEARTBEAT_INTERVAL = 2;
const int RECONNECT_INTERVAL = 60;
const int CLOSE_TIMEOUT = 5;

// Queue capacities
const size_t OUTPUT_QUEUE_CAPACITY = 64;
const size_t SHELL_QUEUE_CAPACITY = 16;
const size_t TRANSPORT_QUEUE_CAPACITY = 256;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef ST_VERSION
#define ST_VERSION "unknown"
#endif

namespace st {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline bool startsWith(const std::string &str, const std::string &prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline string genRandomAlphaNum(int len) {
  static const char alphanum[] =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";
  string s(len, '\0');

  for (int i = 0; i < len; ++i) {
    s[i] = alphanum[randombytes_uniform(sizeof(alphanum) - 1)];
  }

  return s;
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

inline string GetOsUserName() {
  passwd *pwd = getpwuid(getuid());
  if (pwd == NULL || pwd->pw_name == NULL) {
    return to_string(getuid());
  }
  return string(pwd->pw_name);
}

inline string GetShortHostName() {
  char buf[256];
  FATAL_FAIL(::gethostname(buf, sizeof(buf)));
  buf[sizeof(buf) - 1] = '\0';
  string host(buf);
  auto dot = host.find('.');
  if (dot != string::npos) {
    host = host.substr(0, dot);
  }
  return host;
}
}  // namespace st

#endif  // __ST_HEADERS__
