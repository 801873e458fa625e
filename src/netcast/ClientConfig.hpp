#ifndef __LGNC_CLIENT_CONFIG__
#define __LGNC_CLIENT_CONFIG__

#include "Headers.hpp"
#include "HttpEndpoint.hpp"

namespace lgnc {
/**
 * @brief Thrown when a config file or option value is unusable.
 */
class ConfigException : public std::exception {
 public:
  explicit ConfigException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};

/**
 * @brief Networking and logging settings for the command line tool.
 *
 * The pairing key is never stored here.
 */
struct ClientConfig {
  string host;
  int port = DEFAULT_NETCAST_PORT;
  string protocol = PROTOCOL_ROAP;
  int timeoutMs = DEFAULT_TIMEOUT_MS;
  int verbose = 0;
  string logDirectory;

  /**
   * @brief Overlays the values found in an ini file.
   *
   * [Networking] host, port, protocol, timeout_ms and [Debug] verbose,
   * logdir. Keys that are absent leave the current value alone.
   *
   * @throws ConfigException if the file cannot be read or a number is bad.
   */
  void loadFile(const string& path);

  /** @throws ConfigException describing the first invalid setting. */
  void validate() const;

  HttpEndpoint endpoint() const { return HttpEndpoint(host, port, protocol); }

  /** @brief Per-user config location, $XDG_CONFIG_HOME/lgnetcast/... */
  static string defaultConfigPath();
};
}  // namespace lgnc

#endif  // __LGNC_CLIENT_CONFIG__
