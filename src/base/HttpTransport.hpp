#ifndef __LGNC_HTTP_TRANSPORT__
#define __LGNC_HTTP_TRANSPORT__

#include "Headers.hpp"
#include "HttpEndpoint.hpp"
#include "NetCastErrors.hpp"

namespace lgnc {
typedef map<string, string> HttpFields;

/** @brief Content type the TV expects on every ROAP request. */
extern const char* NETCAST_CONTENT_TYPE;

/**
 * @brief One HTTP exchange as seen by the transport.
 */
struct HttpRequest {
  string method;
  string path;
  string body;
  string contentType;
  HttpFields headers;
  HttpFields params;
};

struct HttpResponse {
  int status = 0;
  string body;
  string contentType;

  bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @brief Provides an abstract API for HTTP request/response exchanges with a
 * single TV and the lifecycle of the underlying connection.
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() {}

  /**
   * @brief Performs one blocking request and returns the raw response.
   * @throws ConnectionError when the TV cannot be reached or the bounded wait
   * elapses.
   */
  virtual HttpResponse send(const HttpRequest& request) = 0;

  /**
   * @brief Releases the connection. Safe to call more than once.
   */
  virtual void close() = 0;

  /** @brief True once close() has run. */
  virtual bool isClosed() const = 0;

  /**
   * @brief Posts an XML body to an API path using the NetCast content type.
   */
  HttpResponse postXml(const string& path, const string& xml,
                       const HttpFields& headers = HttpFields());

  /**
   * @brief Issues a GET against an API path with query parameters.
   */
  HttpResponse get(const string& path, const HttpFields& params,
                   const HttpFields& headers = HttpFields());
};
}  // namespace lgnc

#endif  // __LGNC_HTTP_TRANSPORT__
