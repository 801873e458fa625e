#ifndef __LGNC_HTTP_ENDPOINT__
#define __LGNC_HTTP_ENDPOINT__

#include "Headers.hpp"

namespace lgnc {
/**
 * @brief Address of a NetCast TV: host, port and API path prefix.
 */
class HttpEndpoint {
 public:
  HttpEndpoint()
      : name(""), port(DEFAULT_NETCAST_PORT), protocol(PROTOCOL_ROAP) {}

  explicit HttpEndpoint(const string &_name)
      : name(_name), port(DEFAULT_NETCAST_PORT), protocol(PROTOCOL_ROAP) {}

  HttpEndpoint(const string &_name, int _port)
      : name(_name), port(_port), protocol(PROTOCOL_ROAP) {}

  HttpEndpoint(const string &_name, int _port, const string &_protocol)
      : name(_name), port(_port), protocol(_protocol) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

  const string &getProtocol() const { return protocol; }

  /** @brief Absolute request path for an API call, e.g. /roap/api/auth. */
  string apiPath(const string &messageType) const {
    return string("/") + protocol + "/api/" + messageType;
  }

 protected:
  string name;
  int port;
  string protocol;
};

inline ostream &operator<<(ostream &os, const HttpEndpoint &self) {
  os << self.getName() << ":" << self.getPort() << "/" << self.getProtocol();
  return os;
}
}  // namespace lgnc

#endif  // __LGNC_HTTP_ENDPOINT__
