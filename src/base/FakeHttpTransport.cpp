#include "FakeHttpTransport.hpp"

namespace lgnc {
FakeHttpTransport::FakeHttpTransport() : closed(false), closeCount(0) {}

FakeHttpTransport::FakeHttpTransport(Handler _handler)
    : handler(_handler), closed(false), closeCount(0) {}

HttpResponse FakeHttpTransport::send(const HttpRequest& request) {
  if (closed) {
    throw ConnectionError("Fake transport is closed");
  }
  requests.push_back(request);
  VLOG(1) << "FAKE: " << request.method << " " << request.path;
  if (pendingFailure) {
    auto failure = *pendingFailure;
    pendingFailure.reset();
    throw ConnectionError(failure.first, failure.second);
  }
  if (!cannedResponses.empty()) {
    HttpResponse response = cannedResponses.front();
    cannedResponses.pop_front();
    return response;
  }
  if (handler) {
    return handler(request);
  }
  return makeResponse(404, "");
}

void FakeHttpTransport::close() {
  closeCount++;
  closed = true;
}

void FakeHttpTransport::push(int status, const string& body) {
  cannedResponses.push_back(makeResponse(status, body));
}

void FakeHttpTransport::failNext(const string& message, bool timeout) {
  pendingFailure = make_pair(message, timeout);
}

const HttpRequest& FakeHttpTransport::lastRequest() const {
  if (requests.empty()) {
    throw std::runtime_error("No request was sent");
  }
  return requests.back();
}

HttpResponse FakeHttpTransport::makeResponse(int status, const string& body) {
  HttpResponse response;
  response.status = status;
  response.body = body;
  response.contentType = NETCAST_CONTENT_TYPE;
  return response;
}
}  // namespace lgnc
