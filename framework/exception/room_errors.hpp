#ifndef WSROOMS_FRAMEWORK_EXCEPTION_ROOM_ERRORS_HPP_
#define WSROOMS_FRAMEWORK_EXCEPTION_ROOM_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace wsrooms::framework
{
  /**
   * @brief Operation attempted on a connection in the wrong state,
   * or the WebSocket accept/handshake failed.
   */
  class ProtocolError : public std::runtime_error
  {
  public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what)
    {
    }
  };

  /**
   * @brief The stream ended (peer close, reset, cancelled I/O).
   * Drives teardown; never reported to the application as a failure.
   */
  class ConnectionClosed : public std::runtime_error
  {
  public:
    explicit ConnectionClosed(const std::string& what) : std::runtime_error(what)
    {
    }
  };

  // Payload routed to a JSON handler is not valid JSON (or not valid UTF-8).
  class DecodeError : public std::runtime_error
  {
  public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what)
    {
    }
  };
}

#endif // WSROOMS_FRAMEWORK_EXCEPTION_ROOM_ERRORS_HPP_
