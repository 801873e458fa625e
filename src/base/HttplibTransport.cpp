#include "HttplibTransport.hpp"

namespace lgnc {
HttplibTransport::HttplibTransport(const HttpEndpoint& _endpoint,
                                   int _timeoutMs)
    : endpoint(_endpoint),
      timeoutMs(_timeoutMs),
      httpClient(new httplib::Client(_endpoint.getName(), _endpoint.getPort())) {
  if (timeoutMs <= 0) {
    STFATAL << "Invalid timeout: " << timeoutMs;
  }
  time_t sec = timeoutMs / 1000;
  time_t usec = (timeoutMs % 1000) * 1000;
  httpClient->set_connection_timeout(sec, usec);
  httpClient->set_read_timeout(sec, usec);
  httpClient->set_write_timeout(sec, usec);
  httpClient->set_keep_alive(true);
  VLOG(1) << "Created http transport to " << endpoint << " with timeout "
          << timeoutMs << "ms";
}

HttplibTransport::~HttplibTransport() { close(); }

HttpResponse HttplibTransport::send(const HttpRequest& request) {
  if (isClosed()) {
    throw ConnectionError("Transport to " + endpoint.getName() +
                          " is already closed");
  }

  httplib::Headers headers;
  for (auto& it : request.headers) {
    headers.emplace(it.first, it.second);
  }

  if (request.method != "POST" && request.method != "GET") {
    STFATAL << "Unsupported http method: " << request.method;
  }
  httplib::Params params;
  for (auto& it : request.params) {
    params.emplace(it.first, it.second);
  }
  if (request.method == "GET") {
    headers.emplace("Content-Type", request.contentType);
  }

  auto startTime = std::chrono::steady_clock::now();
  auto result = (request.method == "POST")
                    ? httpClient->Post(request.path, headers, request.body,
                                       request.contentType)
                    : httpClient->Get(request.path, params, headers);

  if (!result) {
    auto error = result.error();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - startTime)
                       .count();
    // An expired read wait is reported as a plain read failure. Socket waits
    // can wake a few ms early, hence the slack.
    bool timedOut =
        error == httplib::Error::ConnectionTimeout ||
        (error == httplib::Error::Read && elapsed + 20 >= timeoutMs);
    LOG(INFO) << "Error talking to " << endpoint << " ("
              << request.method << " " << request.path
              << "): " << httplib::to_string(error) << " after " << elapsed
              << "ms";
    string s = string("Could not reach TV at ") + endpoint.getName() + ":" +
               to_string(endpoint.getPort()) + ": " +
               (timedOut ? string("timed out after ") + to_string(timeoutMs) +
                               "ms"
                         : httplib::to_string(error));
    throw ConnectionError(s, timedOut);
  }

  HttpResponse response;
  response.status = result->status;
  response.body = result->body;
  response.contentType = result->get_header_value("Content-Type");
  return response;
}

void HttplibTransport::close() {
  if (httpClient) {
    VLOG(1) << "Closing http transport to " << endpoint;
    httpClient->stop();
    httpClient.reset();
  }
}
}  // namespace lgnc
