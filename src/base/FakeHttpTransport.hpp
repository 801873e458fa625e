#ifndef __LGNC_FAKE_HTTP_TRANSPORT__
#define __LGNC_FAKE_HTTP_TRANSPORT__

#include "HttpTransport.hpp"

namespace lgnc {
/**
 * @brief In-memory transport that stands in for a TV.
 *
 * Requests are recorded and answered either from a queue of canned responses
 * or by a handler function that plays the TV.
 */
class FakeHttpTransport : public HttpTransport {
 public:
  typedef std::function<HttpResponse(const HttpRequest&)> Handler;

  FakeHttpTransport();

  explicit FakeHttpTransport(Handler _handler);

  inline void setHandler(Handler _handler) { handler = _handler; }

  virtual HttpResponse send(const HttpRequest& request);
  virtual void close();
  virtual bool isClosed() const { return closed; }

  /** @brief Queues a response, consumed before the handler is consulted. */
  void push(int status, const string& body);
  /** @brief Makes the next request fail at the network level. */
  void failNext(const string& message, bool timeout = false);

  const vector<HttpRequest>& getRequests() const { return requests; }
  const HttpRequest& lastRequest() const;
  int getCallCount() const { return int(requests.size()); }
  int getCloseCount() const { return closeCount; }

  static HttpResponse makeResponse(int status, const string& body);

 protected:
  Handler handler;
  std::deque<HttpResponse> cannedResponses;
  optional<pair<string, bool>> pendingFailure;
  vector<HttpRequest> requests;
  bool closed;
  int closeCount;
};
}  // namespace lgnc

#endif  // __LGNC_FAKE_HTTP_TRANSPORT__
