#include "FakeHttpTransport.hpp"
#include "NetCastClient.hpp"
#include "TestHeaders.hpp"

using namespace lgnc;
using Catch::Matchers::ContainsSubstring;

namespace {
const string TV_HOST = "10.0.0.5";
const string TV_SESSION = "1234567890";

/**
 * @brief Plays a NetCast TV behind a FakeHttpTransport.
 *
 * Accepts a single pairing key, hands out a fixed session id and answers data
 * queries from a table of canned bodies.
 */
class FakeNetCastTv {
 public:
  explicit FakeNetCastTv(const string& _acceptedKey)
      : acceptedKey(_acceptedKey), displayKeyRequests(0) {}

  HttpResponse handle(const HttpRequest& request) {
    if (request.method == "POST" && request.path == "/roap/api/auth") {
      return handleAuth(request);
    }
    if (request.method == "POST" && request.path == "/roap/api/command") {
      return handleCommand(request);
    }
    if (request.method == "GET" && request.path == "/roap/api/data") {
      auto it = request.params.find("target");
      if (it == request.params.end() || !dataBodies.count(it->second)) {
        return FakeHttpTransport::makeResponse(404, "");
      }
      return FakeHttpTransport::makeResponse(200, dataBodies[it->second]);
    }
    return FakeHttpTransport::makeResponse(404, "");
  }

  shared_ptr<FakeHttpTransport> makeTransport() {
    return make_shared<FakeHttpTransport>(
        [this](const HttpRequest& request) { return handle(request); });
  }

  string acceptedKey;
  int displayKeyRequests;
  vector<string> commandTypes;
  vector<string> commandValues;
  map<string, string> dataBodies;

 protected:
  HttpResponse handleAuth(const HttpRequest& request) {
    XmlElement auth = parseXmlDocument(request.body);
    string type = auth.childText("type");
    if (type == "AuthKeyReq") {
      displayKeyRequests++;
      return FakeHttpTransport::makeResponse(
          200,
          "<envelope><ROAPError>200</ROAPError>"
          "<ROAPErrorDetail>OK</ROAPErrorDetail></envelope>");
    }
    if (type == "AuthReq" && auth.childText("value") == acceptedKey) {
      return FakeHttpTransport::makeResponse(
          200, "<?xml version=\"1.0\" encoding=\"utf-8\"?><envelope>"
               "<ROAPError>200</ROAPError><ROAPErrorDetail>OK</ROAPErrorDetail>"
               "<session>" +
                   TV_SESSION + "</session></envelope>");
    }
    return FakeHttpTransport::makeResponse(
        401,
        "<envelope><ROAPError>401</ROAPError>"
        "<ROAPErrorDetail>Unauthorized</ROAPErrorDetail></envelope>");
  }

  HttpResponse handleCommand(const HttpRequest& request) {
    XmlElement command = parseXmlDocument(request.body);
    if (command.childText("session") != TV_SESSION) {
      return FakeHttpTransport::makeResponse(401, "");
    }
    commandTypes.push_back(command.childText("type"));
    commandValues.push_back(command.childText("value"));
    return FakeHttpTransport::makeResponse(200, "");
  }
};

void pairClient(NetCastClient* client, FakeHttpTransport* transport) {
  transport->push(200,
                  "<envelope><ROAPError>200</ROAPError><session>" +
                      TV_SESSION + "</session></envelope>");
  REQUIRE(client->open());
}
}  // namespace

TEST_CASE("Commands without a session fail before any network traffic",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));

  for (const auto& it : allRemoteCommands()) {
    REQUIRE_THROWS_AS(client.sendCommand(it.code), SessionError);
  }
  REQUIRE_THROWS_AS(client.queryData(QUERY_VOLUME_INFO), SessionError);
  REQUIRE_THROWS_AS(client.moveCursor(1, 1), SessionError);
  REQUIRE_THROWS_AS(client.clickCursor(), SessionError);
  REQUIRE_THROWS_AS(client.scroll(SCROLL_UP), SessionError);
  REQUIRE_THROWS_AS(client.captureScreen(), SessionError);
  REQUIRE(transport->getCallCount() == 0);
  REQUIRE(client.getState() == SessionState::UNPAIRED);
}

TEST_CASE("Accepted pairing key establishes a session", "[NetCastClient]") {
  FakeNetCastTv tv("1234");
  auto transport = tv.makeTransport();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));

  REQUIRE(client.getState() == SessionState::UNPAIRED);
  REQUIRE(client.open());
  REQUIRE(client.getState() == SessionState::PAIRED);
  REQUIRE(client.isPaired());
  REQUIRE(client.getSessionId() == TV_SESSION);

  const HttpRequest& request = transport->lastRequest();
  REQUIRE(request.method == "POST");
  REQUIRE(request.path == "/roap/api/auth");
  REQUIRE(request.contentType == "application/atom+xml");
  REQUIRE_THAT(request.body,
               ContainsSubstring("<type>AuthReq</type><value>1234</value>"));
}

TEST_CASE("Rejected pairing key leaves the client unpaired",
          "[NetCastClient]") {
  FakeNetCastTv tv("1234");
  auto transport = tv.makeTransport();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("9999"));

  REQUIRE_THROWS_AS(client.open(), AuthenticationError);
  REQUIRE(client.getState() == SessionState::UNPAIRED);
  REQUIRE(client.getSessionId().empty());
  REQUIRE_THROWS_AS(client.sendCommand(CMD_MUTE_TOGGLE), SessionError);
  REQUIRE(transport->getCallCount() == 1);
}

TEST_CASE("ROAP level refusal and short session ids are authentication errors",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));

  transport->push(200,
                  "<envelope><ROAPError>401</ROAPError>"
                  "<ROAPErrorDetail>Unauthorized</ROAPErrorDetail></envelope>");
  REQUIRE_THROWS_AS(client.open(), AuthenticationError);

  transport->push(200, "<envelope><session>123</session></envelope>");
  REQUIRE_THROWS_AS(client.open(), AuthenticationError);

  transport->push(200, "<envelope></envelope>");
  REQUIRE_THROWS_AS(client.open(), AuthenticationError);
  REQUIRE(client.getState() == SessionState::UNPAIRED);
}

TEST_CASE("Broken pairing responses are parse or protocol errors",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));

  transport->push(200, "<envelope><session>12345678</envelope>");
  REQUIRE_THROWS_AS(client.open(), ParseError);

  transport->push(200, "<html><body>12345678</body></html>");
  REQUIRE_THROWS_AS(client.open(), ProtocolError);
  REQUIRE(client.getState() == SessionState::UNPAIRED);
}

TEST_CASE("Pairing key is escaped in the request body", "[NetCastClient]") {
  FakeNetCastTv tv("<1&2>\"'");
  auto transport = tv.makeTransport();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("<1&2>\"'"));

  REQUIRE(client.open());
  REQUIRE_THAT(transport->lastRequest().body,
               ContainsSubstring("<value>&lt;1&amp;2&gt;&quot;&apos;</value>"));
}

TEST_CASE("Opening without a key asks the TV to display one",
          "[NetCastClient]") {
  FakeNetCastTv tv("1234");
  auto transport = tv.makeTransport();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), std::nullopt);

  REQUIRE_FALSE(client.open());
  REQUIRE(tv.displayKeyRequests == 1);
  REQUIRE(client.getState() == SessionState::UNPAIRED);
  REQUIRE(client.getSessionId().empty());
  REQUIRE_THAT(transport->lastRequest().body,
               ContainsSubstring("<auth><type>AuthKeyReq</type></auth>"));

  REQUIRE_THROWS_AS(client.sendCommand(CMD_MUTE_TOGGLE), SessionError);
  REQUIRE(transport->getCallCount() == 1);
}

TEST_CASE("Display key failures surface immediately", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), std::nullopt);

  transport->failNext("connection refused");
  REQUIRE_THROWS_AS(client.open(), ConnectionError);
  REQUIRE(transport->getCallCount() == 1);

  transport->push(500, "");
  REQUIRE_THROWS_AS(client.open(), ProtocolError);
  REQUIRE(transport->getCallCount() == 2);
}

TEST_CASE("Mute toggle reaches the TV", "[NetCastClient]") {
  FakeNetCastTv tv("1234");
  auto transport = tv.makeTransport();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));

  REQUIRE(client.open());
  client.sendCommand(CMD_MUTE_TOGGLE);

  REQUIRE(tv.commandTypes == vector<string>{"HandleKeyInput"});
  REQUIRE(tv.commandValues == vector<string>{"26"});

  const HttpRequest& request = transport->lastRequest();
  REQUIRE(request.path == "/roap/api/command");
  REQUIRE(request.headers.at("Session") == TV_SESSION);
}

TEST_CASE("Codes outside the vocabulary are sent as is", "[NetCastClient]") {
  FakeNetCastTv tv("1234");
  auto transport = tv.makeTransport();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));

  REQUIRE(client.open());
  client.sendCommand(999);
  REQUIRE(tv.commandValues == vector<string>{"999"});
}

TEST_CASE("Command failures keep the session", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(500, "");
  try {
    client.sendCommand(CMD_VOLUME_UP);
    FAIL("Expected a protocol error");
  } catch (const ProtocolError& pe) {
    REQUIRE(pe.getStatus() == 500);
  }
  REQUIRE(client.isPaired());

  transport->failNext("timed out", true);
  try {
    client.sendCommand(CMD_VOLUME_UP);
    FAIL("Expected a connection error");
  } catch (const ConnectionError& ce) {
    REQUIRE(ce.isTimeout());
  }
  REQUIRE(client.isPaired());

  transport->push(200, "");
  client.sendCommand(CMD_VOLUME_UP);
}

TEST_CASE("Volume query returns the data element", "[NetCastClient]") {
  FakeNetCastTv tv("1234");
  tv.dataBodies[QUERY_VOLUME_INFO] =
      "<envelope><data><level>17</level><mute>false</mute></data></envelope>";
  auto transport = tv.makeTransport();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  REQUIRE(client.open());

  auto data = client.queryData(QUERY_VOLUME_INFO);
  REQUIRE(data.size() == 1);
  REQUIRE_THAT(data[0].str(), ContainsSubstring("17"));
  REQUIRE_THAT(data[0].str(), ContainsSubstring("false"));
  REQUIRE(data[0].childText("level") == "17");

  const HttpRequest& request = transport->lastRequest();
  REQUIRE(request.method == "GET");
  REQUIRE(request.path == "/roap/api/data");
  REQUIRE(request.params.at("target") == "volume_info");
  REQUIRE(request.headers.at("Session") == TV_SESSION);
}

TEST_CASE("Query results outlive the client", "[NetCastClient]") {
  vector<XmlElement> data;
  {
    FakeNetCastTv tv("1234");
    tv.dataBodies[QUERY_3D] = "<envelope><data><is3D>true</is3D></data></envelope>";
    NetCastClient client(tv.makeTransport(), HttpEndpoint(TV_HOST),
                         string("1234"));
    REQUIRE(client.open());
    data = client.queryData(QUERY_3D);
  }
  REQUIRE(data.size() == 1);
  REQUIRE(data[0].childText("is3D") == "true");
}

TEST_CASE("Query collects data elements under dataList", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(200,
                  "<?xml version=\"1.0\" encoding=\"utf-8\"?><envelope>"
                  "<ROAPError>200</ROAPError><ROAPErrorDetail>OK"
                  "</ROAPErrorDetail><dataList name=\"channel_list\">"
                  "<data><major>7</major><minor>1</minor></data>"
                  "<data><major>9</major><minor>2</minor></data>"
                  "</dataList></envelope>");
  auto data = client.queryData(QUERY_CHANNEL_LIST);
  REQUIRE(data.size() == 2);
  REQUIRE(data[0].childText("major") == "7");
  REQUIRE(data[1].childText("major") == "9");
}

TEST_CASE("Query without matching elements is empty, not an error",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(200,
                  "<envelope><ROAPError>200</ROAPError>"
                  "<ROAPErrorDetail>OK</ROAPErrorDetail></envelope>");
  REQUIRE(client.queryData(QUERY_CONTEXT_UI).empty());
}

TEST_CASE("Malformed query response is a parse error and keeps the session",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(200, "<envelope><data><level>17</data>");
  REQUIRE_THROWS_AS(client.queryData(QUERY_VOLUME_INFO), ParseError);
  REQUIRE(client.getState() == SessionState::PAIRED);
  REQUIRE(client.getSessionId() == TV_SESSION);

  transport->push(200, "");
  REQUIRE_THROWS_AS(client.queryData(QUERY_VOLUME_INFO), ParseError);
  REQUIRE(client.isPaired());
}

TEST_CASE("Query envelope violations are protocol errors", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(404, "");
  REQUIRE_THROWS_AS(client.queryData(QUERY_VOLUME_INFO), ProtocolError);

  transport->push(200, "<result><data/></result>");
  REQUIRE_THROWS_AS(client.queryData(QUERY_VOLUME_INFO), ProtocolError);

  transport->push(200,
                  "<envelope><ROAPError>406</ROAPError>"
                  "<ROAPErrorDetail>Not Acceptable</ROAPErrorDetail>"
                  "</envelope>");
  REQUIRE_THROWS_WITH(client.queryData(QUERY_VOLUME_INFO),
                      ContainsSubstring("Not Acceptable"));
  REQUIRE(client.isPaired());
}

TEST_CASE("Close is idempotent and releases the transport",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  client.close();
  REQUIRE(client.getState() == SessionState::CLOSED);
  REQUIRE(client.getSessionId().empty());
  REQUIRE(transport->isClosed());
  REQUIRE_NOTHROW(client.close());
  REQUIRE(transport->getCloseCount() == 1);

  REQUIRE_THROWS_AS(client.sendCommand(CMD_POWER), SessionError);
  REQUIRE_THROWS_AS(client.open(), SessionError);
}

TEST_CASE("Scope exit closes the transport even when a call throws",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  try {
    NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
    pairClient(&client, transport.get());
    transport->push(200, "not xml at all");
    client.queryData(QUERY_VOLUME_INFO);
    FAIL("Expected a parse error");
  } catch (const ParseError&) {
  }
  REQUIRE(transport->isClosed());
  REQUIRE(transport->getCloseCount() == 1);
}

TEST_CASE("Unpaired clients are closed on scope exit too", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  {
    NetCastClient client(transport, HttpEndpoint(TV_HOST), std::nullopt);
  }
  REQUIRE(transport->isClosed());
}

TEST_CASE("Channel change embeds the channel element", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(200,
                  "<envelope><dataList name=\"channel_list\">"
                  "<data><major>7</major><minor>1</minor>"
                  "<chname>Seven</chname></data>"
                  "<data><major>9</major><minor>2</minor>"
                  "<chname>Nine</chname></data>"
                  "</dataList></envelope>");
  auto channel = client.findChannel(9, 2);
  REQUIRE(channel);
  REQUIRE(channel->childText("chname") == "Nine");

  transport->push(200, "");
  client.changeChannel(*channel);
  const HttpRequest& request = transport->lastRequest();
  REQUIRE(request.path == "/roap/api/command");
  REQUIRE_THAT(request.body,
               ContainsSubstring("<type>HandleChannelChange</type><data>"
                                 "<major>9</major><minor>2</minor>"
                                 "<chname>Nine</chname></data></command>"));

  REQUIRE_THROWS_AS(client.changeChannel(XmlElement()), std::invalid_argument);
}

TEST_CASE("Missing channels are reported as not found", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(200,
                  "<envelope><data><major>7</major><minor>1</minor></data>"
                  "</envelope>");
  REQUIRE_FALSE(client.findChannel(8));

  transport->push(200,
                  "<envelope><data><major>7</major><minor>1</minor></data>"
                  "</envelope>");
  REQUIRE(client.findChannel(7));
}

TEST_CASE("Touch commands have the expected shape", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(200, "");
  client.moveCursor(10, -5);
  REQUIRE_THAT(transport->lastRequest().body,
               ContainsSubstring("<type>HandleTouchMove</type>"
                                 "<x>10</x><y>-5</y></command>"));

  transport->push(200, "");
  client.clickCursor();
  REQUIRE_THAT(transport->lastRequest().body,
               ContainsSubstring("<type>HandleTouchClick</type></command>"));

  transport->push(200, "");
  client.scroll(SCROLL_DOWN);
  REQUIRE_THAT(transport->lastRequest().body,
               ContainsSubstring("<type>HandleTouchWheel</type>"
                                 "<value>down</value></command>"));

  int calls = transport->getCallCount();
  REQUIRE_THROWS_AS(client.scroll("sideways"), std::invalid_argument);
  REQUIRE(transport->getCallCount() == calls);
}

TEST_CASE("Screen capture returns the raw image", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  string jpeg("\xff\xd8\xff\xe0\x00\x10JFIF", 10);
  transport->push(200, jpeg);
  REQUIRE(client.captureScreen() == jpeg);
  REQUIRE(transport->lastRequest().params.at("target") == "screen_image");

  transport->push(200, "");
  REQUIRE_THROWS_AS(client.captureScreen(), ProtocolError);
}

TEST_CASE("hdcp endpoints use their own path prefix", "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport,
                       HttpEndpoint(TV_HOST, DEFAULT_NETCAST_PORT,
                                    PROTOCOL_HDCP),
                       string("1234"));
  pairClient(&client, transport.get());
  REQUIRE(transport->lastRequest().path == "/hdcp/api/auth");

  transport->push(200, "");
  client.sendCommand(CMD_CHANNEL_UP);
  REQUIRE(transport->lastRequest().path == "/hdcp/api/command");
}

TEST_CASE("Displaying the key again never touches the session",
          "[NetCastClient]") {
  FakeNetCastTv tv("1234");
  auto transport = tv.makeTransport();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));

  client.requestPairingKey();
  REQUIRE(tv.displayKeyRequests == 1);
  REQUIRE(client.getState() == SessionState::UNPAIRED);

  REQUIRE(client.open());
  client.requestPairingKey();
  REQUIRE(tv.displayKeyRequests == 2);
  REQUIRE(client.isPaired());
  REQUIRE(client.getSessionId() == TV_SESSION);

  client.close();
  REQUIRE_THROWS_AS(client.requestPairingKey(), SessionError);
  REQUIRE(tv.displayKeyRequests == 2);
}

TEST_CASE("Pairing again replaces the session, a failed attempt keeps it",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(200,
                  "<envelope><ROAPError>200</ROAPError>"
                  "<session>9876543210</session></envelope>");
  REQUIRE(client.open());
  REQUIRE(client.getSessionId() == "9876543210");

  transport->push(401, "");
  REQUIRE_THROWS_AS(client.open(), AuthenticationError);
  REQUIRE(client.isPaired());
  REQUIRE(client.getSessionId() == "9876543210");

  transport->failNext("unreachable");
  REQUIRE_THROWS_AS(client.open(), ConnectionError);
  REQUIRE(client.isPaired());
}

TEST_CASE("Malformed command responses are protocol errors",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(200, "<envelope><ROAP");
  REQUIRE_THROWS_AS(client.sendCommand(CMD_MUTE_TOGGLE), ProtocolError);
  REQUIRE(client.isPaired());

  transport->push(200, "<html><body>OK</body></html>");
  REQUIRE_THROWS_AS(client.moveCursor(1, 2), ProtocolError);
  REQUIRE(client.isPaired());
}

TEST_CASE("ROAP errors in command responses are protocol errors",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));
  pairClient(&client, transport.get());

  transport->push(200,
                  "<envelope><ROAPError>401</ROAPError>"
                  "<ROAPErrorDetail>Unauthorized</ROAPErrorDetail>"
                  "</envelope>");
  try {
    client.sendCommand(CMD_MUTE_TOGGLE);
    FAIL("Expected a protocol error");
  } catch (const ProtocolError& pe) {
    REQUIRE_THAT(pe.what(), ContainsSubstring("401"));
    REQUIRE_THAT(pe.what(), ContainsSubstring("Unauthorized"));
  }
  REQUIRE(client.isPaired());

  transport->push(200,
                  "<envelope><ROAPError>200</ROAPError>"
                  "<ROAPErrorDetail>OK</ROAPErrorDetail></envelope>");
  REQUIRE_NOTHROW(client.sendCommand(CMD_MUTE_TOGGLE));

  transport->push(200, " \r\n");
  REQUIRE_NOTHROW(client.sendCommand(CMD_MUTE_TOGGLE));
}

TEST_CASE("ROAP codes surrounded by whitespace are accepted",
          "[NetCastClient]") {
  auto transport = make_shared<FakeHttpTransport>();
  NetCastClient client(transport, HttpEndpoint(TV_HOST), string("1234"));

  transport->push(200,
                  "<envelope>\n  <ROAPError> 200 </ROAPError>\n  <session>" +
                      TV_SESSION + "</session>\n</envelope>");
  REQUIRE(client.open());
  REQUIRE(client.getSessionId() == TV_SESSION);

  transport->push(200, "<envelope><ROAPError>\n200\n</ROAPError></envelope>");
  REQUIRE_NOTHROW(client.clickCursor());
}

TEST_CASE("Clients cannot be copied", "[NetCastClient]") {
  STATIC_REQUIRE_FALSE(std::is_copy_constructible<NetCastClient>::value);
  STATIC_REQUIRE_FALSE(std::is_copy_assignable<NetCastClient>::value);
}
