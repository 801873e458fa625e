#ifndef __LGNC_HTTPLIB_TRANSPORT__
#define __LGNC_HTTPLIB_TRANSPORT__

#include "HttpTransport.hpp"

namespace lgnc {
/**
 * @brief Talks to the TV over plain HTTP using cpp-httplib.
 *
 * Connect, read and write waits are all bounded by the same timeout. A failed
 * or timed out exchange surfaces as ConnectionError.
 */
class HttplibTransport : public HttpTransport {
 public:
  explicit HttplibTransport(const HttpEndpoint& _endpoint,
                            int _timeoutMs = DEFAULT_TIMEOUT_MS);
  virtual ~HttplibTransport();

  virtual HttpResponse send(const HttpRequest& request);
  virtual void close();
  virtual bool isClosed() const { return httpClient.get() == NULL; }

  int getTimeoutMs() const { return timeoutMs; }

 protected:
  HttpEndpoint endpoint;
  int timeoutMs;
  unique_ptr<httplib::Client> httpClient;
};
}  // namespace lgnc

#endif  // __LGNC_HTTPLIB_TRANSPORT__
