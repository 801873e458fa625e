#ifndef __LGNC_NETCAST_ERRORS__
#define __LGNC_NETCAST_ERRORS__

#include "Headers.hpp"

namespace lgnc {
/**
 * @brief Base class for every failure surfaced by the NetCast client.
 *
 * Callers that only care about "something went wrong" can catch this, the
 * subclasses let them tell a bad pairing key from an unreachable TV.
 */
class NetCastException : public std::exception {
 public:
  explicit NetCastException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};

/**
 * @brief The TV could not be reached: refused, unreachable or timed out.
 */
class ConnectionError : public NetCastException {
 public:
  explicit ConnectionError(const string& msg, bool _timeout = false)
      : NetCastException(msg), timeout(_timeout) {}

  /** @brief True when the bounded wait for the TV elapsed. */
  bool isTimeout() const { return timeout; }

 private:
  bool timeout;
};

/**
 * @brief The TV rejected the pairing key or did not accept the session.
 */
class AuthenticationError : public NetCastException {
 public:
  explicit AuthenticationError(const string& msg) : NetCastException(msg) {}
};

/**
 * @brief An operation needed a paired session and there was none.
 *
 * Raised before any network traffic happens.
 */
class SessionError : public NetCastException {
 public:
  explicit SessionError(const string& msg) : NetCastException(msg) {}
};

/**
 * @brief The TV answered with a non-success status or a response that does
 * not follow the expected envelope.
 */
class ProtocolError : public NetCastException {
 public:
  explicit ProtocolError(const string& msg, int _status = 0)
      : NetCastException(msg), status(_status) {}

  /** @brief HTTP status of the offending response, 0 if not status related. */
  int getStatus() const { return status; }

 private:
  int status;
};

/**
 * @brief The response body was not well-formed XML.
 */
class ParseError : public NetCastException {
 public:
  explicit ParseError(const string& msg, int64_t _offset = -1)
      : NetCastException(msg), offset(_offset) {}

  int64_t getOffset() const { return offset; }

 private:
  int64_t offset;
};
}  // namespace lgnc

#endif  // __LGNC_NETCAST_ERRORS__
