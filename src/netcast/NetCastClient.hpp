#ifndef __LGNC_NETCAST_CLIENT__
#define __LGNC_NETCAST_CLIENT__

#include "Headers.hpp"
#include "HttpTransport.hpp"
#include "NetCastErrors.hpp"
#include "RemoteCommands.hpp"
#include "XmlUtils.hpp"

namespace lgnc {
/**
 * @brief Where a client is in its pairing lifecycle.
 */
enum class SessionState {
  /** @brief No session id yet (initial state). */
  UNPAIRED = 0,
  /** @brief The TV accepted the pairing key and handed out a session id. */
  PAIRED = 1,
  /** @brief close() ran. Terminal. */
  CLOSED = 2
};

/**
 * @brief Remote control session with a single LG NetCast TV.
 *
 * Every call is a blocking request/response exchange over the transport.
 * The client never reconnects or retries on its own, and a network failure
 * leaves the session state untouched. Destroying the client closes the
 * transport, so scoping a client guarantees the connection is released.
 *
 * Not thread safe: use one client per TV and per thread.
 */
class NetCastClient {
 public:
  NetCastClient(shared_ptr<HttpTransport> _transport,
                const HttpEndpoint& _endpoint,
                const optional<string>& _pairingKey);

  virtual ~NetCastClient();

  // Not copyable, the destructor closes the shared transport
  NetCastClient(const NetCastClient&) = delete;
  NetCastClient& operator=(const NetCastClient&) = delete;

  /**
   * @brief Pairs with the TV, or asks it to show the pairing key.
   *
   * With a pairing key this sends AuthReq and stores the returned session id.
   * Without one it sends AuthKeyReq so the TV displays a key on screen, and
   * no session is created.
   *
   * @return true when a session was established.
   * @throws AuthenticationError when the key or session is rejected.
   */
  bool open();

  /** @brief Asks the TV to show a one-time pairing key on screen. */
  void requestPairingKey();

  /**
   * @brief Simulates a remote control button press.
   * @param command Key code, usually one of RemoteCommand.
   * @throws ProtocolError on a non-2xx status or a malformed or refusing
   * response body.
   */
  void sendCommand(int command);

  /**
   * @brief Tunes to a channel element as returned by the channel_list query.
   */
  void changeChannel(const XmlElement& channel);

  /**
   * @brief Looks a channel up in channel_list by major and, when minor is not
   * negative, minor number.
   */
  optional<XmlElement> findChannel(int major, int minor = -1);

  /** @brief Moves the on-screen pointer by (x, y). */
  void moveCursor(int x, int y);

  /** @brief Clicks at the on-screen pointer position. */
  void clickCursor();

  /** @brief Turns the pointer wheel, direction is SCROLL_UP or SCROLL_DOWN. */
  void scroll(const string& direction);

  /**
   * @brief Reads a status category.
   * @return The <data> elements of the response, empty if the TV has none.
   * @throws ParseError when the response is not well-formed XML.
   */
  vector<XmlElement> queryData(const string& query);

  /** @brief Returns the raw JPEG bytes of the current screen. */
  string captureScreen();

  /**
   * @brief Releases the transport and forgets the session. Never throws and
   * can be called any number of times.
   */
  void close();

  SessionState getState() const { return state; }

  bool isPaired() const { return state == SessionState::PAIRED; }

  const string& getSessionId() const { return sessionId; }

  const HttpEndpoint& getEndpoint() const { return endpoint; }

 protected:
  void requireSession(const string& operation) const;

  void postCommand(const string& handlerType, const string& payload);

  /**
   * @brief Parses a response body and checks it is a ROAP envelope.
   * @throws ParseError, ProtocolError
   */
  XmlElement parseEnvelope(const HttpResponse& response);

  HttpFields sessionHeaders() const;

  shared_ptr<HttpTransport> transport;
  HttpEndpoint endpoint;
  optional<string> pairingKey;
  string sessionId;
  SessionState state;
};

ostream& operator<<(ostream& os, SessionState state);
}  // namespace lgnc

#endif  // __LGNC_NETCAST_CLIENT__
