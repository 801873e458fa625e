#include "ClientConfig.hpp"

#include "SimpleIni.h"

namespace lgnc {
namespace {
int parseIntValue(const char* section, const char* key, const char* value) {
  string s(value);
  bool negative = !s.empty() && s[0] == '-';
  if (!isAllDigits(negative ? s.substr(1) : s) || s.length() > 9) {
    throw ConfigException(string("Invalid number for ") + section + "." + key +
                          ": " + s);
  }
  return stoi(s);
}
}  // namespace

void ClientConfig::loadFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw ConfigException("Invalid config file: " + path);
  }

  const char* hostString = ini.GetValue("Networking", "host", NULL);
  if (hostString) {
    host = string(hostString);
  }
  const char* portString = ini.GetValue("Networking", "port", NULL);
  if (portString) {
    port = parseIntValue("Networking", "port", portString);
  }
  const char* protocolString = ini.GetValue("Networking", "protocol", NULL);
  if (protocolString) {
    protocol = toLower(protocolString);
  }
  const char* timeoutString = ini.GetValue("Networking", "timeout_ms", NULL);
  if (timeoutString) {
    timeoutMs = parseIntValue("Networking", "timeout_ms", timeoutString);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = parseIntValue("Debug", "verbose", vlevel);
  }
  const char* logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir) {
    logDirectory = string(logdir);
  }
  VLOG(1) << "Loaded config file " << path;
}

void ClientConfig::validate() const {
  if (host.empty()) {
    throw ConfigException("Missing TV host");
  }
  if (port <= 0 || port > 65535) {
    throw ConfigException("Invalid port: " + to_string(port));
  }
  if (protocol != PROTOCOL_ROAP && protocol != PROTOCOL_HDCP) {
    throw ConfigException("Invalid protocol (must be " + PROTOCOL_ROAP +
                          " or " + PROTOCOL_HDCP + "): " + protocol);
  }
  if (timeoutMs <= 0) {
    throw ConfigException("Timeout must be positive: " + to_string(timeoutMs));
  }
}

string ClientConfig::defaultConfigPath() {
  return sago::getConfigHome() + "/lgnetcast/lgnetcast.ini";
}
}  // namespace lgnc
