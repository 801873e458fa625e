#ifndef __LGNC_HEADERS__
#define __LGNC_HEADERS__

// httplib has to come before windows.h
#include "httplib.h"

#if defined(_MSC_VER)
#include <WinSock2.h>
#include <Ws2tcpip.h>
#include <signal.h>
#include <windows.h>
#else
#include <paths.h>
#include <signal.h>
#include <unistd.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <string>
#include <unordered_map>
#include <vector>

#include <pugixml.hpp>

#include "easylogging++.h"
#include "sago/platform_folders.h"

using namespace std;
namespace fs = std::filesystem;

// Port the NetCast ROAP/HDCP service listens on
static const int DEFAULT_NETCAST_PORT = 8080;

// Connect/read/write timeout used when nothing else is configured
static const int DEFAULT_TIMEOUT_MS = 3000;

// NetCast 4 (2013) serves /roap/api, NetCast 3 (2012) serves /hdcp/api
const string PROTOCOL_ROAP = "roap";
const string PROTOCOL_HDCP = "hdcp";

#define STFATAL LOG(FATAL) << "Fatal: "

#define STERROR LOG(ERROR) << "Error: "

#ifndef LGNC_VERSION
#define LGNC_VERSION "unknown"
#endif

namespace lgnc {
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

inline string trim(const string &s) {
  const char *whitespace = " \t\r\n";
  size_t first = s.find_first_not_of(whitespace);
  if (first == string::npos) {
    return "";
  }
  size_t last = s.find_last_not_of(whitespace);
  return s.substr(first, last - first + 1);
}

inline string toLower(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

inline bool isAllDigits(const string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c);
  });
}

inline string GetTempDirectory() {
#ifdef WIN32
  string tmpDir = fs::temp_directory_path().string();
#else
  string tmpDir = _PATH_TMP;
#endif
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
}  // namespace lgnc

#endif
