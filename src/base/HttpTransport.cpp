#include "HttpTransport.hpp"

namespace lgnc {
const char* NETCAST_CONTENT_TYPE = "application/atom+xml";

HttpResponse HttpTransport::postXml(const string& path, const string& xml,
                                    const HttpFields& headers) {
  HttpRequest request;
  request.method = "POST";
  request.path = path;
  request.body = xml;
  request.contentType = NETCAST_CONTENT_TYPE;
  request.headers = headers;
  VLOG(1) << "POST " << path << ": " << xml;
  HttpResponse response = send(request);
  VLOG(1) << "Response " << response.status << " (" << response.body.length()
          << " bytes)";
  VLOG(2) << response.body;
  return response;
}

HttpResponse HttpTransport::get(const string& path, const HttpFields& params,
                                const HttpFields& headers) {
  HttpRequest request;
  request.method = "GET";
  request.path = path;
  request.contentType = NETCAST_CONTENT_TYPE;
  request.headers = headers;
  request.params = params;
  VLOG(1) << "GET " << path;
  HttpResponse response = send(request);
  VLOG(1) << "Response " << response.status << " (" << response.body.length()
          << " bytes)";
  return response;
}
}  // namespace lgnc
