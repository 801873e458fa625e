#include "NetCastClient.hpp"

namespace lgnc {
namespace {
const string XML_DECLARATION = "<?xml version=\"1.0\" encoding=\"utf-8\"?>";
const string SESSION_HEADER = "Session";
// The TV hands out 8 digit session ids, anything shorter is a refusal
const size_t MIN_SESSION_ID_LENGTH = 8;
const int ROAP_OK = 200;

// Returns the ROAPError code of an envelope if it carries one
optional<int> roapErrorCode(const XmlElement& envelope) {
  XmlElement error = envelope.child("ROAPError");
  if (error.empty()) {
    return std::nullopt;
  }
  string code = trim(error.text());
  if (!isAllDigits(code) || code.length() > 6) {
    return -1;
  }
  return stoi(code);
}

string roapErrorDetail(const XmlElement& envelope) {
  string detail = envelope.childText("ROAPErrorDetail");
  return detail.empty() ? "no detail" : detail;
}
}  // namespace

NetCastClient::NetCastClient(shared_ptr<HttpTransport> _transport,
                             const HttpEndpoint& _endpoint,
                             const optional<string>& _pairingKey)
    : transport(_transport),
      endpoint(_endpoint),
      pairingKey(_pairingKey),
      state(SessionState::UNPAIRED) {
  if (!transport) {
    STFATAL << "NetCastClient needs a transport";
  }
}

NetCastClient::~NetCastClient() { close(); }

bool NetCastClient::open() {
  if (state == SessionState::CLOSED) {
    throw SessionError("Client for " + endpoint.getName() +
                       " was closed and cannot be reopened");
  }
  if (!pairingKey) {
    requestPairingKey();
    return false;
  }

  VLOG(1) << "Requesting session from " << endpoint;
  string message = XML_DECLARATION + "<auth><type>AuthReq</type><value>" +
                   xmlEscape(*pairingKey) + "</value></auth>";
  HttpResponse response = transport->postXml(endpoint.apiPath("auth"), message);
  if (response.status != 200) {
    LOG(INFO) << "Pairing rejected by " << endpoint << " with HTTP status "
              << response.status;
    throw AuthenticationError("TV rejected the pairing key (HTTP " +
                              to_string(response.status) + ")");
  }

  XmlElement envelope = parseEnvelope(response);
  auto errorCode = roapErrorCode(envelope);
  if (errorCode && *errorCode != ROAP_OK) {
    LOG(INFO) << "Pairing rejected by " << endpoint << " with ROAP error "
              << *errorCode;
    throw AuthenticationError("TV rejected the pairing key: " +
                              roapErrorDetail(envelope));
  }
  string newSessionId = envelope.childText("session");
  if (newSessionId.length() < MIN_SESSION_ID_LENGTH) {
    LOG(INFO) << "Got invalid session id '" << newSessionId << "' from "
              << endpoint;
    throw AuthenticationError("TV did not accept the session");
  }

  sessionId = newSessionId;
  state = SessionState::PAIRED;
  LOG(INFO) << "Paired with " << endpoint << ", session " << sessionId;
  return true;
}

void NetCastClient::requestPairingKey() {
  if (state == SessionState::CLOSED) {
    throw SessionError("Client for " + endpoint.getName() + " was closed");
  }
  VLOG(1) << "Asking " << endpoint << " to display the pairing key";
  string message = XML_DECLARATION + "<auth><type>AuthKeyReq</type></auth>";
  HttpResponse response = transport->postXml(endpoint.apiPath("auth"), message);
  if (!response.isSuccess()) {
    throw ProtocolError("TV refused to display the pairing key (HTTP " +
                            to_string(response.status) + ")",
                        response.status);
  }
}

void NetCastClient::sendCommand(int command) {
  requireSession("send a command");
  postCommand(HANDLE_KEY_INPUT, "<value>" + to_string(command) + "</value>");
  VLOG(1) << "Sent key " << command << " (" << remoteCommandName(command)
          << ")";
}

void NetCastClient::changeChannel(const XmlElement& channel) {
  requireSession("change the channel");
  if (channel.empty()) {
    throw std::invalid_argument("Cannot change to an empty channel element");
  }
  postCommand(HANDLE_CHANNEL_CHANGE, channel.str());
}

optional<XmlElement> NetCastClient::findChannel(int major, int minor) {
  auto channels = queryData(QUERY_CHANNEL_LIST);
  VLOG(1) << "Searching " << channels.size() << " channels for " << major
          << "-" << minor;
  for (const auto& channel : channels) {
    if (channel.childText("major") != to_string(major)) {
      continue;
    }
    if (minor >= 0 && channel.childText("minor") != to_string(minor)) {
      continue;
    }
    return channel;
  }
  return std::nullopt;
}

void NetCastClient::moveCursor(int x, int y) {
  requireSession("move the cursor");
  postCommand(HANDLE_TOUCH_MOVE,
              "<x>" + to_string(x) + "</x><y>" + to_string(y) + "</y>");
}

void NetCastClient::clickCursor() {
  requireSession("click");
  postCommand(HANDLE_TOUCH_CLICK, "");
}

void NetCastClient::scroll(const string& direction) {
  requireSession("scroll");
  if (direction != SCROLL_UP && direction != SCROLL_DOWN) {
    throw std::invalid_argument("Invalid scroll direction: " + direction);
  }
  postCommand(HANDLE_TOUCH_WHEEL, "<value>" + direction + "</value>");
}

vector<XmlElement> NetCastClient::queryData(const string& query) {
  requireSession("query " + query);
  HttpResponse response = transport->get(
      endpoint.apiPath("data"), HttpFields{{"target", query}}, sessionHeaders());
  if (response.status != 200) {
    throw ProtocolError("Query " + query + " failed with HTTP status " +
                            to_string(response.status),
                        response.status);
  }
  XmlElement envelope = parseEnvelope(response);
  auto errorCode = roapErrorCode(envelope);
  if (errorCode && *errorCode != ROAP_OK) {
    throw ProtocolError("Query " + query + " failed with ROAP error " +
                        to_string(*errorCode) + ": " +
                        roapErrorDetail(envelope));
  }
  auto retval = findOutermost(envelope, "data");
  VLOG(1) << "Query " << query << " returned " << retval.size()
          << " elements";
  return retval;
}

string NetCastClient::captureScreen() {
  requireSession("capture the screen");
  HttpResponse response =
      transport->get(endpoint.apiPath("data"),
                     HttpFields{{"target", QUERY_SCREEN_IMAGE}},
                     sessionHeaders());
  if (response.status != 200) {
    throw ProtocolError("Screen capture failed with HTTP status " +
                            to_string(response.status),
                        response.status);
  }
  if (response.body.empty()) {
    throw ProtocolError("TV returned an empty screen capture",
                        response.status);
  }
  return response.body;
}

void NetCastClient::close() {
  if (state == SessionState::CLOSED) {
    return;
  }
  LOG(INFO) << "Closing session with " << endpoint;
  transport->close();
  sessionId.clear();
  state = SessionState::CLOSED;
}

void NetCastClient::requireSession(const string& operation) const {
  if (state != SessionState::PAIRED) {
    throw SessionError("Cannot " + operation + ": no session with " +
                       endpoint.getName() + " (client is " +
                       (state == SessionState::CLOSED ? "closed" : "unpaired") +
                       ")");
  }
}

void NetCastClient::postCommand(const string& handlerType,
                                const string& payload) {
  string message = XML_DECLARATION + "<command><session>" +
                   xmlEscape(sessionId) + "</session><type>" + handlerType +
                   "</type>" + payload + "</command>";
  HttpResponse response = transport->postXml(endpoint.apiPath("command"),
                                             message, sessionHeaders());
  if (!response.isSuccess()) {
    LOG(INFO) << handlerType << " rejected by " << endpoint
              << " with HTTP status " << response.status;
    throw ProtocolError(handlerType + " failed with HTTP status " +
                            to_string(response.status),
                        response.status);
  }
  // Some firmwares answer commands with an empty body
  if (trim(response.body).empty()) {
    return;
  }

  XmlElement envelope;
  try {
    envelope = parseEnvelope(response);
  } catch (const ParseError& pe) {
    throw ProtocolError(handlerType + " got a malformed response: " +
                            pe.what(),
                        response.status);
  }
  auto errorCode = roapErrorCode(envelope);
  if (errorCode && *errorCode != ROAP_OK) {
    LOG(INFO) << handlerType << " rejected by " << endpoint
              << " with ROAP error " << *errorCode;
    throw ProtocolError(handlerType + " failed with ROAP error " +
                            to_string(*errorCode) + ": " +
                            roapErrorDetail(envelope),
                        response.status);
  }
}

XmlElement NetCastClient::parseEnvelope(const HttpResponse& response) {
  XmlElement root = parseXmlDocument(response.body);
  if (root.name() != "envelope") {
    throw ProtocolError("Expected an <envelope> response but got <" +
                            root.name() + ">",
                        response.status);
  }
  return root;
}

HttpFields NetCastClient::sessionHeaders() const {
  return HttpFields{{SESSION_HEADER, sessionId}};
}

ostream& operator<<(ostream& os, SessionState state) {
  switch (state) {
    case SessionState::UNPAIRED:
      return os << "UNPAIRED";
    case SessionState::PAIRED:
      return os << "PAIRED";
    case SessionState::CLOSED:
      return os << "CLOSED";
  }
  return os << "UNKNOWN";
}
}  // namespace lgnc
